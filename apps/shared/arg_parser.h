#pragma once

#include <cstddef>
#include <functional>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace fitscore::apps {

// Option describes one "--flag <value>" accepted by a subcommand.
// handler stores the value into the caller's Config and returns false when the value
// is invalid (it reports the reason to stderr itself).
template <typename Config>
struct Option {
  std::string name;         // NOLINT(readability-identifier-naming)
  std::string placeholder;  // NOLINT(readability-identifier-naming)
  std::string description;  // NOLINT(readability-identifier-naming)
  bool required{false};     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

template <typename Config>
struct ParsedOptions {
  Config config;
  bool ok{true};
};

// parse_options reads argv[start..argc-1] as flag/value pairs.
// Parsing fails (ok == false) on an unknown flag, a flag without a value, a stray
// positional token, a handler that rejects its value, or a missing required flag.
// Every problem is reported to stderr; parsing continues so all of them are listed.
template <typename Config>
ParsedOptions<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                    const std::vector<Option<Config>>& options, int start = 1) {
  ParsedOptions<Config> parsed;

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  std::unordered_map<std::string, bool> seen;
  for (int i = start; i < argc; ++i) {
    const std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    const auto it = option_map.find(arg);
    if (it == option_map.end()) {
      std::cerr << (arg.rfind("--", 0) == 0 ? "Unknown option: " : "Unexpected argument: ")
                << arg << "\n";
      parsed.ok = false;
      continue;
    }
    if (i + 1 >= argc) {
      std::cerr << "Option " << arg << " requires a value\n";
      parsed.ok = false;
      continue;
    }

    const std::string value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    if (!it->second->handler(parsed.config, value)) {
      parsed.ok = false;
    }
    seen[arg] = true;
  }

  for (const auto& opt : options) {
    if (opt.required && !seen[opt.name]) {
      std::cerr << "Missing required option: " << opt.name << "\n";
      parsed.ok = false;
    }
  }

  return parsed;
}

// format_usage renders "Usage: fitscore_cli <command> ..." followed by one line per option.
template <typename Config>
std::string format_usage(const std::string& command, const std::vector<Option<Config>>& options) {
  std::ostringstream out;
  out << "Usage: fitscore_cli " << command;
  for (const auto& opt : options) {
    const std::string flag = opt.name + " <" + opt.placeholder + ">";
    out << " " << (opt.required ? flag : "[" + flag + "]");
  }
  out << "\n";
  for (const auto& opt : options) {
    out << "  " << opt.name << "  " << opt.description << "\n";
  }
  return out.str();
}

// parse_count accepts a non-negative decimal integer.
inline std::optional<std::size_t> parse_count(const std::string& value) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    return std::nullopt;
  }
  try {
    return static_cast<std::size_t>(std::stoull(value));
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

}  // namespace fitscore::apps
