#pragma once

#include <string_view>

namespace smartuuid::category {

// is_valid_prefix checks the character policy for textual prefixes:
// non-empty, no ASCII whitespace, no '-' (reserved by the UUID text form).
// Underscores are allowed; parsing splits on the last underscore.
[[nodiscard]] bool is_valid_prefix(std::string_view prefix);

}  // namespace smartuuid::category
