#pragma once

#include "smartuuid/category/category_traits.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace smartuuid::demo {

// DocumentType uses a hand-written descriptor instead of a generated one.
// Prefixes are chosen freely; main() certifies the table with check_category_traits.
enum class DocumentType : std::uint8_t {
  kInvoice = 0,
  kReceipt = 1,
  kContract = 2,
};

}  // namespace smartuuid::demo

namespace smartuuid {

template <>
struct category_traits<demo::DocumentType> {
  static constexpr std::string_view kTypeName = "smartuuid::demo::DocumentType";
  static constexpr std::size_t kCount = 3;

  static constexpr std::uint8_t discriminant(const demo::DocumentType value) noexcept {
    return static_cast<std::uint8_t>(value);
  }

  static constexpr std::optional<demo::DocumentType> from_discriminant(
      const std::uint8_t value) noexcept {
    if (value >= kCount) {
      return std::nullopt;
    }
    return static_cast<demo::DocumentType>(value);
  }

  static constexpr std::string_view prefix(const demo::DocumentType value) noexcept {
    switch (value) {
      case demo::DocumentType::kInvoice:
        return "inv";
      case demo::DocumentType::kReceipt:
        return "rcpt";
      case demo::DocumentType::kContract:
        return "contract";
    }
    return {};
  }
};

}  // namespace smartuuid
