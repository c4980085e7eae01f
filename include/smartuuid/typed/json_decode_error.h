#pragma once

#include "smartuuid/typed/typed_uuid_error.h"

#include <stdexcept>
#include <utility>

namespace smartuuid {

// JsonDecodeError is thrown from nlohmann::json conversions when a JSON string
// holds text that is not a valid identifier of the requested category set.
// what() is TypedUuidError::message(); error() keeps the structured fields.
class JsonDecodeError : public std::invalid_argument {
 public:
  explicit JsonDecodeError(TypedUuidError error)
      : std::invalid_argument(error.message()), error_(std::move(error)) {}

  [[nodiscard]] const TypedUuidError& error() const noexcept { return error_; }

 private:
  TypedUuidError error_;
};

}  // namespace smartuuid
