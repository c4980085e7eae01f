#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace smartuuid {

// Error enumerations following E.14 (use purpose-designed types as error indicators).
enum class TypedUuidErrorKind : std::uint8_t {
  kInvalidDiscriminant,  // byte 0 does not map to a category of the set
  kParseError,           // the 36-character UUID text is malformed
  kUnknownPrefix,        // textual prefix differs from the category's prefix
  kInvalidFormat,        // prefix_uuid text has no separator
};

// TypedUuidError is the single error type of TypedUuid and PrefixedUuid.
// Only the fields relevant to `kind` are populated:
//   kInvalidDiscriminant: found, type_name
//   kParseError:          detail (the UUID parser's message)
//   kUnknownPrefix:       prefix, type_name
//   kInvalidFormat:       detail
struct TypedUuidError {
  TypedUuidErrorKind kind{TypedUuidErrorKind::kInvalidFormat};  // NOLINT(readability-identifier-naming)
  std::uint8_t found{0};                                         // NOLINT(readability-identifier-naming)
  std::string type_name;                                         // NOLINT(readability-identifier-naming)
  std::string prefix;                                            // NOLINT(readability-identifier-naming)
  std::string detail;                                            // NOLINT(readability-identifier-naming)

  [[nodiscard]] static TypedUuidError invalid_discriminant(std::uint8_t found,
                                                           std::string_view type_name);
  [[nodiscard]] static TypedUuidError parse_error(std::string detail);
  [[nodiscard]] static TypedUuidError unknown_prefix(std::string_view prefix,
                                                     std::string_view type_name);
  [[nodiscard]] static TypedUuidError invalid_format(std::string detail);

  // Stable user-facing message, e.g.
  //   "invalid discriminant 255 for type UserType"
  //   "failed to parse UUID: invalid length: expected 36 characters, found 35"
  //   "unknown prefix 'wrong' for type UserType"
  //   "invalid format: expected format 'prefix_uuid', no underscore found"
  [[nodiscard]] std::string message() const;

  bool operator==(const TypedUuidError&) const = default;
};

[[nodiscard]] std::string_view to_string(TypedUuidErrorKind kind);

std::ostream& operator<<(std::ostream& os, const TypedUuidError& error);

}  // namespace smartuuid
