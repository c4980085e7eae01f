#pragma once

#include <functional>
#include <iostream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace smartuuid::apps {

// Option describes a single command-line flag accepted by an app.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns true on success, false on validation failure (the parser
// reports the failure, counts it, and continues with the remaining flags).
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

// ParsedOptions is the outcome of parse_options.
// error_count > 0 means at least one flag was unknown, missing its value, or rejected.
template <typename Config>
struct ParsedOptions {
  Config config;                         // NOLINT(readability-identifier-naming)
  std::vector<std::string> positionals;  // NOLINT(readability-identifier-naming)
  int error_count{0};                    // NOLINT(readability-identifier-naming)
  bool help_requested{false};            // NOLINT(readability-identifier-naming)
};

// parse_options iterates argv[start..argc-1], dispatches each recognised flag
// to its handler, and collects non-flag tokens as positionals.
// "--help" / "-h" are always recognised and set help_requested.
// Problems are reported to stderr as "error: ..." lines.
template <typename Config>
ParsedOptions<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                    const std::vector<Option<Config>>& options, int start = 1,
                                    Config default_config = {}) {
  ParsedOptions<Config> parsed{std::move(default_config), {}, 0, false};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    if (arg == "--help" || arg == "-h") {
      parsed.help_requested = true;
      continue;
    }

    auto it = option_map.find(arg);
    if (it == option_map.end()) {
      if (!arg.empty() && arg[0] == '-') {
        std::cerr << "error: unknown option: " << arg << "\n";
        ++parsed.error_count;
      } else {
        parsed.positionals.push_back(arg);
      }
      continue;
    }

    const Option<Config>* opt = it->second;
    std::string value;
    if (opt->requires_value) {
      if (i + 1 >= argc) {
        std::cerr << "error: option " << arg << " requires a value\n";
        ++parsed.error_count;
        continue;
      }
      value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }
    if (!opt->handler(parsed.config, value)) {
      ++parsed.error_count;
    }
  }

  return parsed;
}

// print_usage writes one line per option: "  --name <value>  description".
template <typename Config>
void print_usage(std::ostream& os, const std::string& synopsis,
                 const std::vector<Option<Config>>& options) {
  os << "usage: " << synopsis << "\n\noptions:\n";
  for (const auto& opt : options) {
    os << "  " << opt.name << (opt.requires_value ? " <value>" : "") << "\n      "
       << opt.description << "\n";
  }
  os << "  --help\n      Show this message\n";
}

}  // namespace smartuuid::apps
