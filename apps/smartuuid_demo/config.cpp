#include "config.h"

#include <charconv>
#include <iostream>

namespace smartuuid::demo {

namespace {

bool handle_count(DemoConfig& config, const std::string& value) {
  int parsed = 0;
  const auto* first = value.data();
  const auto* last = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc{} || ptr != last) {
    std::cerr << "error: invalid --count: " << value << " (expected an integer)\n";
    return false;
  }
  config.count = parsed;
  return true;
}

}  // namespace

std::vector<apps::Option<DemoConfig>> demo_options() {
  return {
      {"--count", true, "Identifiers generated per category (1..1000, default 1)", handle_count},
      {"--parse", true, "Decode a prefixed UserType identifier and print it as JSON",
       [](DemoConfig& c, const std::string& v) {
         c.parse_text = v;
         return true;
       }},
      {"--deterministic", false, "Use a fixed byte sequence instead of OS entropy",
       [](DemoConfig& c, const std::string& /*v*/) {
         c.deterministic = true;
         return true;
       }},
  };
}

std::string validate_demo_config(const DemoConfig& config) {
  if (config.count < 1 || config.count > kMaxCount) {
    return "error: --count must be between 1 and " + std::to_string(kMaxCount);
  }
  return "";
}

}  // namespace smartuuid::demo
