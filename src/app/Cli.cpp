#include "app/Cli.hpp"
#include <charconv>

namespace zenmon::app {

static bool parse_int(const std::string& s, int& out) {
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc{} && ptr == s.data() + s.size() && !s.empty();
}

bool parse_cli(const std::vector<std::string>& args, CliOptions& out, std::string& err) {
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& a = args[i];
    auto value = [&](std::string& v) -> bool {
      if (i + 1 >= args.size()) { err = a + " requires a value"; return false; }
      v = args[++i];
      return true;
    };
    auto int_value = [&](int& v) -> bool {
      std::string s;
      if (!value(s)) return false;
      if (!parse_int(s, v)) { err = "invalid number for " + a + ": " + s; return false; }
      return true;
    };
    if (a == "-h" || a == "--help") { out.help = true; }
    else if (a == "--once") { out.once = true; }
    else if (a == "--lib") { std::string v; if (!value(v)) return false; out.lib_path = v; }
    else if (a == "--log-dir") { std::string v; if (!value(v)) return false; out.log_dir = v; }
    else if (a == "--interval-ms") { int v = 0; if (!int_value(v)) return false; out.interval_ms = v; }
    else if (a == "--max-cores") { int v = 0; if (!int_value(v)) return false; out.max_cores = v; }
    else if (a == "--iterations") { if (!int_value(out.iterations)) return false; }
    else { err = "unknown option: " + a; return false; }
  }
  return true;
}

const char* usage_text() {
  return
    "Usage: zenmon [options]\n"
    "  --lib PATH          libryzen_monitor.so to load\n"
    "  --interval-ms N     poll interval (250..60000, default 2000)\n"
    "  --max-cores N       core buffer size (1..256, default 32)\n"
    "  --iterations N      render N frames then exit\n"
    "  --once              poll once, print a report and exit\n"
    "  --log-dir DIR       append Prometheus snapshots to DIR\n"
    "  -h, --help          show this help\n"
    "Config: $XDG_CONFIG_HOME/zenmon/config.toml (or ~/.config/zenmon/config.toml)\n"
    "Needs root to read the SMU.\n";
}

} // namespace zenmon::app
