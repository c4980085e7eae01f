#include "smartuuid/category/prefix_policy.h"

#include <algorithm>

namespace smartuuid::category {

bool is_valid_prefix(const std::string_view prefix) {
  if (prefix.empty()) {
    return false;
  }
  return std::none_of(prefix.begin(), prefix.end(), [](const char ch) {
    return ch == '-' || ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\v' ||
           ch == '\f';
  });
}

}  // namespace smartuuid::category
