#include "smartuuid/typed/typed_uuid_error.h"

namespace smartuuid {

TypedUuidError TypedUuidError::invalid_discriminant(const std::uint8_t found,
                                                    const std::string_view type_name) {
  TypedUuidError error;
  error.kind = TypedUuidErrorKind::kInvalidDiscriminant;
  error.found = found;
  error.type_name = std::string{type_name};
  return error;
}

TypedUuidError TypedUuidError::parse_error(std::string detail) {
  TypedUuidError error;
  error.kind = TypedUuidErrorKind::kParseError;
  error.detail = std::move(detail);
  return error;
}

TypedUuidError TypedUuidError::unknown_prefix(const std::string_view prefix,
                                              const std::string_view type_name) {
  TypedUuidError error;
  error.kind = TypedUuidErrorKind::kUnknownPrefix;
  error.prefix = std::string{prefix};
  error.type_name = std::string{type_name};
  return error;
}

TypedUuidError TypedUuidError::invalid_format(std::string detail) {
  TypedUuidError error;
  error.kind = TypedUuidErrorKind::kInvalidFormat;
  error.detail = std::move(detail);
  return error;
}

std::string TypedUuidError::message() const {
  switch (kind) {
    case TypedUuidErrorKind::kInvalidDiscriminant:
      return "invalid discriminant " + std::to_string(found) + " for type " + type_name;
    case TypedUuidErrorKind::kParseError:
      return "failed to parse UUID: " + detail;
    case TypedUuidErrorKind::kUnknownPrefix:
      return "unknown prefix '" + prefix + "' for type " + type_name;
    case TypedUuidErrorKind::kInvalidFormat:
      return "invalid format: " + detail;
  }
  return "unknown error";
}

std::string_view to_string(const TypedUuidErrorKind kind) {
  switch (kind) {
    case TypedUuidErrorKind::kInvalidDiscriminant:
      return "InvalidDiscriminant";
    case TypedUuidErrorKind::kParseError:
      return "ParseError";
    case TypedUuidErrorKind::kUnknownPrefix:
      return "UnknownPrefix";
    case TypedUuidErrorKind::kInvalidFormat:
      return "InvalidFormat";
  }
  return "Unknown";
}

std::ostream& operator<<(std::ostream& os, const TypedUuidError& error) {
  return os << error.message();
}

}  // namespace smartuuid
