#pragma once

#include "smartuuid/category/category_traits.h"
#include "smartuuid/core/random_source.h"
#include "smartuuid/core/result.h"
#include "smartuuid/core/uuid128.h"
#include "smartuuid/typed/typed_uuid_error.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace smartuuid {

// TypedUuid<T> is a version-8 UUID whose byte 0 holds the discriminant of a category in T.
//
// Layout (16 bytes, big-endian text order):
//   byte 0      category discriminant (category_traits<T>::discriminant)
//   byte 6      high nibble 0x8 (version 8)
//   byte 8      top bits 10 (RFC 4122 variant)
//   the rest    random
//
// Values are immutable. Equality, ordering and hashing use the 16 bytes only.
// Both construction routes (generate, from_uuid/parse) guarantee byte 0 is a valid discriminant;
// from_uuid does not re-check the version/variant bits of foreign UUIDs.
template <UuidCategory T>
class TypedUuid {
 public:
  using Category = T;
  using ParseResult = core::Result<TypedUuid, TypedUuidError>;

  // Draw 16 random bytes, tag byte 0 with the category and normalize to version 8.
  // Throws boost::uuids::entropy_error if the platform RNG is unavailable.
  [[nodiscard]] static TypedUuid generate(const T category) {
    return generate(category, core::default_random_source());
  }

  [[nodiscard]] static TypedUuid generate(const T category, core::IRandomSource& random) {
    core::UuidBytes bytes = random.next_bytes();
    bytes[0] = category_traits<T>::discriminant(category);
    return TypedUuid(core::make_v8(bytes));
  }

  // Adopt an existing UUID after checking that byte 0 is a discriminant of T.
  [[nodiscard]] static ParseResult from_uuid(const core::Uuid128& uuid) {
    const std::uint8_t tag = *uuid.begin();
    if (!category_traits<T>::from_discriminant(tag).has_value()) {
      return ParseResult::err(
          TypedUuidError::invalid_discriminant(tag, category_traits<T>::kTypeName));
    }
    return ParseResult::ok(TypedUuid(uuid));
  }

  // Parse the 36-character hyphenated form, then validate the discriminant.
  [[nodiscard]] static ParseResult parse(const std::string_view text) {
    auto parsed = core::parse_uuid(text);
    if (!parsed.has_value()) {
      return ParseResult::err(TypedUuidError::parse_error(parsed.error()));
    }
    return from_uuid(parsed.value());
  }

  // Category encoded in byte 0.
  // Throws std::logic_error only if the invariant was broken, which no public path allows.
  [[nodiscard]] T category() const {
    const auto value = category_traits<T>::from_discriminant(discriminant());
    if (!value.has_value()) {
      throw std::logic_error("TypedUuid holds unmapped discriminant " +
                             std::to_string(discriminant()) + " for type " +
                             std::string{category_traits<T>::kTypeName});
    }
    return value.value();
  }

  [[nodiscard]] std::uint8_t discriminant() const noexcept { return *uuid_.begin(); }

  [[nodiscard]] std::string_view prefix() const { return category_traits<T>::prefix(category()); }

  [[nodiscard]] const core::Uuid128& as_uuid() const noexcept { return uuid_; }

  [[nodiscard]] std::span<const std::uint8_t, core::kUuidSize> as_bytes() const noexcept {
    return std::span<const std::uint8_t, core::kUuidSize>{uuid_.begin(), core::kUuidSize};
  }

  explicit operator core::Uuid128() const noexcept { return uuid_; }

  // Canonical lowercase 36-character form.
  [[nodiscard]] std::string to_string() const { return core::to_string(uuid_); }

  // "TypedUuid<UserType>(uuid=..., category=retail)"
  [[nodiscard]] std::string debug_string() const {
    return "TypedUuid<" + std::string{category_traits<T>::kTypeName} + ">(uuid=" + to_string() +
           ", category=" + std::string{prefix()} + ")";
  }

  bool operator==(const TypedUuid&) const = default;

  friend bool operator<(const TypedUuid& lhs, const TypedUuid& rhs) noexcept {
    return lhs.uuid_ < rhs.uuid_;
  }

  friend std::ostream& operator<<(std::ostream& os, const TypedUuid& id) {
    return os << id.to_string();
  }

 private:
  explicit TypedUuid(const core::Uuid128& uuid) : uuid_(uuid) {}

  core::Uuid128 uuid_;
};

}  // namespace smartuuid

namespace std {

template <smartuuid::UuidCategory T>
struct hash<smartuuid::TypedUuid<T>> {
  std::size_t operator()(const smartuuid::TypedUuid<T>& id) const noexcept {
    return boost::uuids::hash_value(id.as_uuid());
  }
};

}  // namespace std
