#pragma once

#include "smartuuid/core/result.h"

#include <boost/uuid/uuid.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace smartuuid::core {

// Uuid128 is the raw 128-bit value every identifier is stored as.
// Boost.Uuid owns formatting, parsing and comparison of the bytes.
using Uuid128 = boost::uuids::uuid;

inline constexpr std::size_t kUuidSize = 16;
inline constexpr std::size_t kUuidTextLength = 36;

using UuidBytes = std::array<std::uint8_t, kUuidSize>;

// make_v8 builds a version-8 (custom) UUID from 16 bytes.
// Byte 6 gets version nibble 0x8; byte 8 gets variant bits 10 (RFC 4122).
// All other bits are taken from the input unchanged.
[[nodiscard]] Uuid128 make_v8(const UuidBytes& bytes) noexcept;

// is_version8 reports whether both the version nibble and the variant bits
// match a version-8 UUID.
[[nodiscard]] bool is_version8(const Uuid128& uuid) noexcept;

[[nodiscard]] UuidBytes to_bytes(const Uuid128& uuid) noexcept;

// parse_uuid decodes the canonical hyphenated form
// xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx (hex digits in either case).
// Braced, URN and unhyphenated forms are rejected.
// Error string describes the first problem found.
[[nodiscard]] Result<Uuid128, std::string> parse_uuid(std::string_view text);

// to_string renders the lowercase hyphenated form (36 characters).
[[nodiscard]] std::string to_string(const Uuid128& uuid);

}  // namespace smartuuid::core
