#include "smartuuid/codegen/diagnostic.h"
#include "smartuuid/codegen/generator.h"
#include "smartuuid/core/version.h"

#include "config.h"
#include "shared/arg_parser.h"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

namespace {

std::optional<std::string> read_file(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

// Rewrite only when the content changed so dependent objects are not rebuilt.
bool write_if_changed(const std::filesystem::path& path, const std::string& content) {
  const auto existing = read_file(path);
  if (existing.has_value() && existing.value() == content) {
    return true;
  }

  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      std::cerr << "error: cannot create directory " << path.parent_path() << ": "
                << ec.message() << "\n";
      return false;
    }
  }

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    std::cerr << "error: cannot open " << path << " for writing\n";
    return false;
  }
  out << content;
  out.close();
  if (!out) {
    std::cerr << "error: failed writing " << path << "\n";
    return false;
  }
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {  // NOLINT(bugprone-exception-escape)
  const auto options = smartuuid::gen::gen_options();
  const auto parsed = smartuuid::apps::parse_options(argc, argv, options);

  if (parsed.help_requested) {
    smartuuid::apps::print_usage(std::cout, "smartuuid_gen --manifest <in.json> --output <out.h>",
                                 options);
    return 0;
  }
  if (parsed.error_count > 0) {
    return 1;
  }

  const auto& config = parsed.config;
  const std::string config_error = smartuuid::gen::validate_gen_config(config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return 1;
  }

  const std::filesystem::path manifest_path{config.manifest_path.value()};
  const std::filesystem::path output_path{config.output_path.value()};
  const std::string source_name = manifest_path.filename().string();

  const auto text = read_file(manifest_path);
  if (!text.has_value()) {
    std::cerr << "error: cannot read manifest " << manifest_path << "\n";
    return 1;
  }

  const auto result = smartuuid::codegen::generate_header(text.value(), source_name);
  if (!result.has_value()) {
    for (const auto& diagnostic : result.error()) {
      std::cerr << smartuuid::codegen::format_diagnostic(diagnostic, manifest_path.string())
                << "\n";
    }
    return 1;
  }

  for (const auto& warning : result.value().warnings) {
    std::cerr << smartuuid::codegen::format_diagnostic(warning, manifest_path.string()) << "\n";
  }
  if (config.warnings_as_errors && !result.value().warnings.empty()) {
    std::cerr << "error: " << result.value().warnings.size()
              << " warning(s) treated as errors\n";
    return 1;
  }

  if (!write_if_changed(output_path, result.value().text)) {
    return 1;
  }

  if (!config.quiet) {
    std::cerr << "smartuuid_gen " << smartuuid::core::kBuildVersion << ": " << source_name
              << " -> " << output_path.string() << "\n";
  }
  return 0;
}
