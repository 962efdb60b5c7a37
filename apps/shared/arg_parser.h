#pragma once

#include <functional>
#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace txdedup::apps {

// Option describes a single command-line flag accepted by a subcommand.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns true on success, false on validation failure.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

template <typename Config>
struct ParsedOptions {
  Config config;                       // NOLINT(readability-identifier-naming)
  bool ok{true};                       // NOLINT(readability-identifier-naming)
  std::vector<std::string> positional;  // NOLINT(readability-identifier-naming)
};

// parse_options iterates argv[start..argc-1] and dispatches each recognised flag
// to its handler. Unknown flags, missing values and rejected values are reported to
// stderr and clear `ok`; parsing continues so every problem is reported at once.
// Non-flag tokens are collected as positional arguments.
template <typename Config>
ParsedOptions<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                    const std::vector<Option<Config>>& options, int start = 1,
                                    Config default_config = {}) {
  ParsedOptions<Config> parsed{std::move(default_config), true, {}};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    auto it = option_map.find(arg);
    if (it != option_map.end()) {
      const Option<Config>* opt = it->second;
      if (opt->requires_value) {
        if (i + 1 < argc) {
          if (!opt->handler(parsed.config,
                            argv[++i])) {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            parsed.ok = false;
          }
        } else {
          std::cerr << "Option " << arg << " requires a value\n";
          parsed.ok = false;
        }
      } else if (!opt->handler(parsed.config, "")) {
        parsed.ok = false;
      }
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "Unknown option: " << arg << "\n";
      parsed.ok = false;
    } else {
      parsed.positional.push_back(arg);
    }
  }

  return parsed;
}

// print_usage lists the options of a subcommand.
template <typename Config>
void print_usage(std::ostream& out, const std::string& usage_line,
                 const std::vector<Option<Config>>& options) {
  out << "Usage: " << usage_line << "\n";
  for (const auto& opt : options) {
    out << "  " << opt.name << (opt.requires_value ? " <value>" : "") << "\n      "
        << opt.description << "\n";
  }
}

}  // namespace txdedup::apps
