#pragma once

#include <string>
#include <string_view>

namespace smartuuid::category {

// to_snake_case converts a PascalCase identifier to snake_case, keeping
// acronyms together. ASCII only; digits and lowercase letters pass through.
//
// An uppercase letter at position i > 0 is preceded by '_' when the previous
// character is lowercase, or the next character exists and is lowercase:
//   Retail      -> retail
//   HTTPServer  -> http_server
//   HTTPSProxy  -> https_proxy
//   TheOnlyOne  -> the_only_one
//   V000        -> v000
[[nodiscard]] std::string to_snake_case(std::string_view name);

}  // namespace smartuuid::category
