#include "config.h"

namespace smartuuid::gen {

std::vector<apps::Option<GenConfig>> gen_options() {
  return {
      {"--manifest", true, "Category manifest (JSON) to read",
       [](GenConfig& c, const std::string& v) {
         c.manifest_path = v;
         return true;
       }},
      {"--output", true, "Header file to write",
       [](GenConfig& c, const std::string& v) {
         c.output_path = v;
         return true;
       }},
      {"--warnings-as-errors", false, "Fail when any warning is reported",
       [](GenConfig& c, const std::string& /*v*/) {
         c.warnings_as_errors = true;
         return true;
       }},
      {"--quiet", false, "Do not print the summary line",
       [](GenConfig& c, const std::string& /*v*/) {
         c.quiet = true;
         return true;
       }},
  };
}

std::string validate_gen_config(const GenConfig& config) {
  if (!config.manifest_path.has_value() || config.manifest_path->empty()) {
    return "error: --manifest <path> is required";
  }
  if (!config.output_path.has_value() || config.output_path->empty()) {
    return "error: --output <path> is required";
  }
  return "";
}

}  // namespace smartuuid::gen
