#include "smartuuid/category/snake_case.h"

namespace smartuuid::category {

namespace {

constexpr char kCaseOffset = 'a' - 'A';

bool is_upper(const char ch) { return ch >= 'A' && ch <= 'Z'; }
bool is_lower(const char ch) { return ch >= 'a' && ch <= 'z'; }

}  // namespace

std::string to_snake_case(const std::string_view name) {
  std::string result;
  result.reserve(name.size() + name.size() / 2);

  for (std::size_t i = 0; i < name.size(); ++i) {
    const char ch = name[i];
    if (!is_upper(ch)) {
      result.push_back(ch);
      continue;
    }

    // Word boundary: end of a lowercase run, or last capital of an acronym
    // followed by a lowercase letter ("HTTPServer" splits before 'S').
    if (i > 0) {
      const bool prev_lower = is_lower(name[i - 1]);
      const bool next_lower = i + 1 < name.size() && is_lower(name[i + 1]);
      if (prev_lower || next_lower) {
        result.push_back('_');
      }
    }
    result.push_back(static_cast<char>(ch + kCaseOffset));
  }

  return result;
}

}  // namespace smartuuid::category
