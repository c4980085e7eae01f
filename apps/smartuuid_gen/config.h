#pragma once

#include "shared/arg_parser.h"

#include <optional>
#include <string>
#include <vector>

namespace smartuuid::gen {

// GenConfig holds all parsed flags for smartuuid_gen.
// Every field has an explicit default; optional fields mean "not configured".
struct GenConfig {
  std::optional<std::string> manifest_path;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> output_path;    // NOLINT(readability-identifier-naming)
  bool warnings_as_errors{false};            // NOLINT(readability-identifier-naming)
  bool quiet{false};                         // NOLINT(readability-identifier-naming)
};

[[nodiscard]] std::vector<apps::Option<GenConfig>> gen_options();

// validate_gen_config checks that both paths are configured.
// Returns: "" on success, non-empty error message on failure.
[[nodiscard]] std::string validate_gen_config(const GenConfig& config);

}  // namespace smartuuid::gen
