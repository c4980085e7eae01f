#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <type_traits>

namespace smartuuid {

// Maximum number of categories one set can hold: the tag is a single byte.
inline constexpr std::size_t kMaxCategories = 256;

// category_traits<T> describes a closed set of categories T.
//
// The primary template is intentionally undefined. A specialization is normally
// emitted by smartuuid_gen from a JSON manifest; it may also be written by hand.
// Every specialization provides:
//
//   static constexpr std::string_view kTypeName;   // used in error messages
//   static constexpr std::size_t kCount;           // 1..256
//   static std::uint8_t discriminant(T);           // total
//   static std::optional<T> from_discriminant(std::uint8_t);  // partial inverse
//   static std::string_view prefix(T);             // static storage, no '-' or whitespace
//
// Invariants (checked at runtime by check_category_traits<T>()):
//   from_discriminant(discriminant(t)) == t for every t in T
//   from_discriminant(b) == nullopt for every byte b not assigned to a category
template <typename T>
struct category_traits;

// UuidCategory is satisfied by enumerations with a usable category_traits specialization.
template <typename T>
concept UuidCategory = std::is_enum_v<T> && requires(T value, std::uint8_t byte) {
  { category_traits<T>::kTypeName } -> std::convertible_to<std::string_view>;
  { category_traits<T>::kCount } -> std::convertible_to<std::size_t>;
  { category_traits<T>::discriminant(value) } -> std::same_as<std::uint8_t>;
  { category_traits<T>::from_discriminant(byte) } -> std::same_as<std::optional<T>>;
  { category_traits<T>::prefix(value) } -> std::same_as<std::string_view>;
};

template <UuidCategory T>
[[nodiscard]] constexpr std::uint8_t discriminant(const T value) {
  return category_traits<T>::discriminant(value);
}

template <UuidCategory T>
[[nodiscard]] constexpr std::optional<T> from_discriminant(const std::uint8_t value) {
  return category_traits<T>::from_discriminant(value);
}

template <UuidCategory T>
[[nodiscard]] constexpr std::string_view prefix(const T value) {
  return category_traits<T>::prefix(value);
}

template <UuidCategory T>
[[nodiscard]] constexpr std::string_view type_name() {
  return category_traits<T>::kTypeName;
}

}  // namespace smartuuid
