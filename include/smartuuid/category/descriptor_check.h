#pragma once

#include "smartuuid/category/category_traits.h"
#include "smartuuid/category/prefix_policy.h"
#include "smartuuid/core/result.h"

#include <cstddef>
#include <cstdint>
#include <string>

namespace smartuuid::category {

// check_category_traits certifies a category_traits<T> specialization by
// walking every byte 0..255:
// - each byte that maps to a category must map back to the same byte
// - the number of mapped bytes must equal kCount (1..256)
// - every mapped category must have a prefix that passes is_valid_prefix()
//
// Generated descriptors satisfy this by construction. Hand-written descriptors
// should be checked once at program start.
// Returns ok(true) on success, err(message) describing the first violation.
template <UuidCategory T>
[[nodiscard]] core::Result<bool, std::string> check_category_traits() {
  using Traits = category_traits<T>;
  using R = core::Result<bool, std::string>;
  const std::string type{Traits::kTypeName};

  if (Traits::kCount == 0 || Traits::kCount > kMaxCategories) {
    return R::err(type + ": category count " + std::to_string(Traits::kCount) +
                  " outside 1..256");
  }

  std::size_t mapped = 0;
  for (unsigned b = 0; b < kMaxCategories; ++b) {
    const auto byte = static_cast<std::uint8_t>(b);
    const auto value = Traits::from_discriminant(byte);
    if (!value.has_value()) {
      continue;
    }
    ++mapped;

    const std::uint8_t back = Traits::discriminant(value.value());
    if (back != byte) {
      return R::err(type + ": from_discriminant(" + std::to_string(b) +
                    ") yields a category whose discriminant is " + std::to_string(back));
    }
    if (!is_valid_prefix(Traits::prefix(value.value()))) {
      return R::err(type + ": category with discriminant " + std::to_string(b) +
                    " has invalid prefix '" + std::string{Traits::prefix(value.value())} + "'");
    }
  }

  if (mapped != Traits::kCount) {
    return R::err(type + ": " + std::to_string(mapped) + " discriminants map to a category, " +
                  "kCount is " + std::to_string(Traits::kCount));
  }
  return R::ok(true);
}

}  // namespace smartuuid::category
