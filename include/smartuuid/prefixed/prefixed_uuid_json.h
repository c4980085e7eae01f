#pragma once

#include "smartuuid/prefixed/prefixed_uuid.h"
#include "smartuuid/typed/json_decode_error.h"

#include <nlohmann/json.hpp>

#include <string>

// PrefixedUuid<T> <-> JSON string "<prefix>_<uuid>".
// This is the wire-level difference from TypedUuid<T>, which serializes the bare UUID.
//
// Decoding runs PrefixedUuid<T>::parse: invalid text throws smartuuid::JsonDecodeError,
// a non-string JSON value throws nlohmann::json::type_error.
// JsonDecodeError derives from std::invalid_argument, not nlohmann::json::exception, so a
// catch (const nlohmann::json::exception&) handler does not see it; catch JsonDecodeError
// or std::exception around get<T>().
namespace nlohmann {

template <smartuuid::UuidCategory T>
struct adl_serializer<smartuuid::PrefixedUuid<T>> {
  template <typename BasicJsonType>
  static void to_json(BasicJsonType& j, const smartuuid::PrefixedUuid<T>& id) {
    j = id.to_string();
  }

  template <typename BasicJsonType>
  static smartuuid::PrefixedUuid<T> from_json(const BasicJsonType& j) {
    const auto text = j.template get<std::string>();
    auto parsed = smartuuid::PrefixedUuid<T>::parse(text);
    if (!parsed.has_value()) {
      throw smartuuid::JsonDecodeError(parsed.error());
    }
    return parsed.value();
  }
};

}  // namespace nlohmann
