#pragma once

#include "shared/arg_parser.h"

#include <optional>
#include <string>
#include <vector>

namespace smartuuid::demo {

// DemoConfig holds all parsed flags for smartuuid_demo.
struct DemoConfig {
  int count{1};                           // NOLINT(readability-identifier-naming)
  std::optional<std::string> parse_text;  // NOLINT(readability-identifier-naming)
  bool deterministic{false};              // NOLINT(readability-identifier-naming)
};

inline constexpr int kMaxCount = 1000;

[[nodiscard]] std::vector<apps::Option<DemoConfig>> demo_options();

// validate_demo_config checks flag ranges.
// Returns: "" on success, non-empty error message on failure.
[[nodiscard]] std::string validate_demo_config(const DemoConfig& config);

}  // namespace smartuuid::demo
