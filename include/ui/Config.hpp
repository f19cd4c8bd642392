#pragma once

#include <string>
#include <unordered_map>

namespace zenmon::ui {

// Resolved settings. Each key resolves TOML -> environment -> compiled default;
// command-line flags are applied on top by the caller.
struct Config {
  struct Library {
    std::string path;          // explicit libryzen_monitor.so location
    int max_cores{32};
  } library;

  struct Poll {
    int interval_ms{2000};
  } poll;

  struct UI {
    bool alt_screen{true};
    int caution_pct{60};
    int warning_pct{80};
  } ui;

  // Pre-rendered SGR sequences (empty when stdout is not a terminal)
  struct Colors {
    std::string accent;
    std::string caution;
    std::string warning;
    std::string normal;
    std::string muted;
    std::string border;
  } colors;

  struct Log {
    std::string dir;           // empty: telemetry log disabled
  } log;

  enum class Action {
    QUIT, HELP, TOGGLE_CORES, TOGGLE_GRAPHICS, TOGGLE_POWER, TOGGLE_MEMORY,
    RESET_UI, INTERVAL_UP, INTERVAL_DOWN,
  };
  std::unordered_map<char, Action> keybinds;
};

struct UIState {
  int scroll{0};
  bool show_help{false};
  bool show_cores{true};
  bool show_graphics{true};
  bool show_power_ext{false};
  bool show_mem_volts{true};
  int last_core_page_rows{16};
};

// Global UI state
extern UIState g_ui;

// Build a Config from the TOML file at `path` (missing/empty path: env and defaults only).
[[nodiscard]] Config load_config(const std::string& path);

// Process-wide config, loaded once from config_file_path().
const Config& config();

// $XDG_CONFIG_HOME/zenmon/config.toml, else ~/.config/zenmon/config.toml
[[nodiscard]] std::string config_file_path();

void reset_ui_defaults();

// Environment variable helpers
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);
bool parse_hex_rgb(const std::string& hex, int& r, int& g, int& b);

} // namespace zenmon::ui
