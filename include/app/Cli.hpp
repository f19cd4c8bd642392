#pragma once

#include <optional>
#include <string>
#include <vector>

namespace zenmon::app {

// Command-line overrides; unset fields fall back to the config file.
struct CliOptions {
  std::optional<std::string> lib_path;
  std::optional<int> interval_ms;
  std::optional<int> max_cores;
  std::optional<std::string> log_dir;
  int iterations{0};        // <= 0: run until quit
  bool once{false};
  bool help{false};
};

// Returns false with `err` set on an unknown flag, missing value or bad number.
[[nodiscard]] bool parse_cli(const std::vector<std::string>& args, CliOptions& out, std::string& err);

const char* usage_text();

} // namespace zenmon::app
