#include "smartuuid/core/uuid128.h"

#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <algorithm>
#include <stdexcept>

namespace smartuuid::core {

namespace {

constexpr std::uint8_t kVersion8 = 0x80u;
constexpr std::uint8_t kVersionMask = 0xF0u;
constexpr std::uint8_t kVariantRfc4122 = 0x80u;
constexpr std::uint8_t kVariantMask = 0xC0u;

// Offsets of the four '-' separators in the 36-character form.
constexpr std::array<std::size_t, 4> kHyphenPositions = {8, 13, 18, 23};

bool is_hex_digit(const char ch) {
  return (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'f') || (ch >= 'A' && ch <= 'F');
}

bool is_hyphen_position(const std::size_t pos) {
  return std::find(kHyphenPositions.begin(), kHyphenPositions.end(), pos) !=
         kHyphenPositions.end();
}

}  // namespace

Uuid128 make_v8(const UuidBytes& bytes) noexcept {
  Uuid128 uuid{};
  std::copy(bytes.begin(), bytes.end(), uuid.begin());
  uuid.begin()[6] = static_cast<std::uint8_t>((uuid.begin()[6] & 0x0Fu) | kVersion8);
  uuid.begin()[8] = static_cast<std::uint8_t>((uuid.begin()[8] & 0x3Fu) | kVariantRfc4122);
  return uuid;
}

bool is_version8(const Uuid128& uuid) noexcept {
  return (uuid.begin()[6] & kVersionMask) == kVersion8 &&
         (uuid.begin()[8] & kVariantMask) == kVariantRfc4122;
}

UuidBytes to_bytes(const Uuid128& uuid) noexcept {
  UuidBytes bytes{};
  std::copy(uuid.begin(), uuid.end(), bytes.begin());
  return bytes;
}

Result<Uuid128, std::string> parse_uuid(const std::string_view text) {
  using R = Result<Uuid128, std::string>;

  if (text.size() != kUuidTextLength) {
    return R::err("invalid length: expected 36 characters, found " + std::to_string(text.size()));
  }

  for (std::size_t i = 0; i < text.size(); ++i) {
    const char ch = text[i];
    if (is_hyphen_position(i)) {
      if (ch != '-') {
        return R::err("invalid group separator at position " + std::to_string(i));
      }
    } else if (!is_hex_digit(ch)) {
      return R::err("invalid character at position " + std::to_string(i));
    }
  }

  // Layout is verified above; string_generator only decodes the hex digits.
  try {
    boost::uuids::string_generator gen;
    return R::ok(gen(text.begin(), text.end()));
  } catch (const std::runtime_error& e) {
    return R::err(e.what());
  }
}

std::string to_string(const Uuid128& uuid) {
  return boost::uuids::to_string(uuid);
}

}  // namespace smartuuid::core
