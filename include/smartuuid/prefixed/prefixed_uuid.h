#pragma once

#include "smartuuid/category/category_traits.h"
#include "smartuuid/core/random_source.h"
#include "smartuuid/core/result.h"
#include "smartuuid/prefixed/prefixed_format.h"
#include "smartuuid/typed/typed_uuid.h"
#include "smartuuid/typed/typed_uuid_error.h"

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace smartuuid {

// PrefixedUuid<T> is a TypedUuid<T> rendered as "<prefix>_<uuid>", e.g.
//   retail_550e8400-e29b-81d4-a716-446655440000
//   org_f47ac10b-58cc-8372-a567-0e02b2c3d479
//   purchase_order_0311c5f2-1b2e-8c4d-9a0f-5d6e7f809a1b
//
// Holds nothing besides the TypedUuid; conversions in both directions are total.
template <UuidCategory T>
class PrefixedUuid {
 public:
  using Category = T;
  using ParseResult = core::Result<PrefixedUuid, TypedUuidError>;

  // Implicit: wrapping never fails and changes only the text form.
  PrefixedUuid(const TypedUuid<T>& typed) : typed_(typed) {}  // NOLINT(google-explicit-constructor)

  [[nodiscard]] static PrefixedUuid generate(const T category) {
    return PrefixedUuid(TypedUuid<T>::generate(category));
  }

  [[nodiscard]] static PrefixedUuid generate(const T category, core::IRandomSource& random) {
    return PrefixedUuid(TypedUuid<T>::generate(category, random));
  }

  [[nodiscard]] static PrefixedUuid from_typed(const TypedUuid<T>& typed) {
    return PrefixedUuid(typed);
  }

  // Parse "<prefix>_<uuid>":
  //   1. split at the last '_'             (kInvalidFormat if absent)
  //   2. parse the UUID text               (kParseError)
  //   3. validate byte 0                   (kInvalidDiscriminant)
  //   4. compare prefix with the category  (kUnknownPrefix)
  [[nodiscard]] static ParseResult parse(const std::string_view text) {
    const auto parts = split_prefixed(text);
    if (!parts.has_value()) {
      return ParseResult::err(parts.error());
    }

    const auto typed = TypedUuid<T>::parse(parts.value().uuid_text);
    if (!typed.has_value()) {
      return ParseResult::err(typed.error());
    }

    const std::string_view expected = typed.value().prefix();
    if (parts.value().prefix != expected) {
      return ParseResult::err(
          TypedUuidError::unknown_prefix(parts.value().prefix, category_traits<T>::kTypeName));
    }
    return ParseResult::ok(PrefixedUuid(typed.value()));
  }

  [[nodiscard]] T category() const { return typed_.category(); }
  [[nodiscard]] std::string_view prefix() const { return typed_.prefix(); }

  [[nodiscard]] const TypedUuid<T>& as_typed() const noexcept { return typed_; }
  [[nodiscard]] TypedUuid<T> to_typed() const noexcept { return typed_; }
  operator TypedUuid<T>() const noexcept { return typed_; }  // NOLINT(google-explicit-constructor)

  [[nodiscard]] const core::Uuid128& as_uuid() const noexcept { return typed_.as_uuid(); }

  [[nodiscard]] std::string to_string() const {
    return compose_prefixed(prefix(), typed_.as_uuid());
  }

  bool operator==(const PrefixedUuid&) const = default;

  friend bool operator<(const PrefixedUuid& lhs, const PrefixedUuid& rhs) noexcept {
    return lhs.typed_ < rhs.typed_;
  }

  friend std::ostream& operator<<(std::ostream& os, const PrefixedUuid& id) {
    return os << id.to_string();
  }

 private:
  TypedUuid<T> typed_;
};

}  // namespace smartuuid

namespace std {

template <smartuuid::UuidCategory T>
struct hash<smartuuid::PrefixedUuid<T>> {
  std::size_t operator()(const smartuuid::PrefixedUuid<T>& id) const noexcept {
    return std::hash<smartuuid::TypedUuid<T>>{}(id.as_typed());
  }
};

}  // namespace std
