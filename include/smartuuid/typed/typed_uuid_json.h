#pragma once

#include "smartuuid/typed/json_decode_error.h"
#include "smartuuid/typed/typed_uuid.h"

#include <nlohmann/json.hpp>

#include <string>

// TypedUuid<T> <-> JSON string "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx".
//
// Decoding re-validates the discriminant: invalid text throws smartuuid::JsonDecodeError,
// a non-string JSON value throws nlohmann::json::type_error.
// JsonDecodeError derives from std::invalid_argument, not nlohmann::json::exception, so a
// catch (const nlohmann::json::exception&) handler does not see it; catch JsonDecodeError
// or std::exception around get<T>().
namespace nlohmann {

template <smartuuid::UuidCategory T>
struct adl_serializer<smartuuid::TypedUuid<T>> {
  template <typename BasicJsonType>
  static void to_json(BasicJsonType& j, const smartuuid::TypedUuid<T>& id) {
    j = id.to_string();
  }

  template <typename BasicJsonType>
  static smartuuid::TypedUuid<T> from_json(const BasicJsonType& j) {
    const auto text = j.template get<std::string>();
    auto parsed = smartuuid::TypedUuid<T>::parse(text);
    if (!parsed.has_value()) {
      throw smartuuid::JsonDecodeError(parsed.error());
    }
    return parsed.value();
  }
};

}  // namespace nlohmann
