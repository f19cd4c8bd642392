#include "minitest.hpp"
#include "ui/Config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

using zenmon::ui::Config;
using zenmon::ui::load_config;

namespace {

std::string write_toml(const char* suffix, const std::string& content) {
  auto path = std::filesystem::temp_directory_path() /
              ("zenmon_test_config_" + std::to_string(::getpid()) + "_" + suffix + ".toml");
  std::ofstream(path) << content;
  return path.string();
}

void clear_env() {
  for (const char* n : {"ZENMON_LIB_PATH", "ZENMON_MAX_CORES", "ZENMON_INTERVAL_MS",
                        "ZENMON_ALT_SCREEN", "ZENMON_CAUTION_PCT", "ZENMON_WARNING_PCT",
                        "ZENMON_LOG_DIR", "zenmon_INTERVAL_MS"}) {
    ::unsetenv(n);
  }
}

} // namespace

TEST(config_defaults_without_file) {
  clear_env();
  Config c = load_config("");
  ASSERT_EQ(c.library.path, "");
  ASSERT_EQ(c.library.max_cores, 32);
  ASSERT_EQ(c.poll.interval_ms, 2000);
  ASSERT_TRUE(c.ui.alt_screen);
  ASSERT_EQ(c.ui.caution_pct, 60);
  ASSERT_EQ(c.ui.warning_pct, 80);
  ASSERT_EQ(c.log.dir, "");
  ASSERT_TRUE(c.keybinds.at('q') == Config::Action::QUIT);
  ASSERT_TRUE(c.keybinds.at('Q') == Config::Action::QUIT);
  ASSERT_TRUE(c.keybinds.at('=') == Config::Action::INTERVAL_UP);
  ASSERT_TRUE(c.keybinds.at('-') == Config::Action::INTERVAL_DOWN);
}

TEST(config_env_overrides_defaults) {
  clear_env();
  ::setenv("ZENMON_INTERVAL_MS", "500", 1);
  ::setenv("ZENMON_MAX_CORES", "64", 1);
  ::setenv("ZENMON_ALT_SCREEN", "0", 1);
  ::setenv("ZENMON_LIB_PATH", "/opt/ryzen/libryzen_monitor.so", 1);
  Config c = load_config("/nonexistent/zenmon.toml");
  ASSERT_EQ(c.poll.interval_ms, 500);
  ASSERT_EQ(c.library.max_cores, 64);
  ASSERT_TRUE(!c.ui.alt_screen);
  ASSERT_EQ(c.library.path, "/opt/ryzen/libryzen_monitor.so");
  clear_env();
}

TEST(config_lowercase_env_prefix) {
  clear_env();
  ::setenv("zenmon_INTERVAL_MS", "750", 1);
  Config c = load_config("");
  ASSERT_EQ(c.poll.interval_ms, 750);
  clear_env();
}

TEST(config_bad_env_number_keeps_default) {
  clear_env();
  ::setenv("ZENMON_INTERVAL_MS", "fast", 1);
  Config c = load_config("");
  ASSERT_EQ(c.poll.interval_ms, 2000);
  clear_env();
}

TEST(config_toml_wins_over_env) {
  clear_env();
  ::setenv("ZENMON_INTERVAL_MS", "500", 1);
  ::setenv("ZENMON_LOG_DIR", "/tmp/from-env", 1);
  auto path = write_toml("precedence",
    "[poll]\n"
    "interval_ms = 1000\n"
    "[library]\n"
    "path = \"/usr/lib/libryzen_monitor.so\"\n"
    "max_cores = 12\n"
    "[ui]\n"
    "caution_pct = 70\n"
    "warning_pct = 50\n");
  Config c = load_config(path);
  ASSERT_EQ(c.poll.interval_ms, 1000);
  ASSERT_EQ(c.library.path, "/usr/lib/libryzen_monitor.so");
  ASSERT_EQ(c.library.max_cores, 12);
  ASSERT_EQ(c.log.dir, "/tmp/from-env");
  ASSERT_EQ(c.ui.caution_pct, 70);
  ASSERT_EQ(c.ui.warning_pct, 70);  // never below caution
  std::filesystem::remove(path);
  clear_env();
}

TEST(config_keybind_override) {
  clear_env();
  auto path = write_toml("keys", "[keybinds]\nquit = \"x\"\ntoggle_cores = \"k\"\n");
  Config c = load_config(path);
  ASSERT_TRUE(c.keybinds.at('x') == Config::Action::QUIT);
  ASSERT_TRUE(c.keybinds.at('X') == Config::Action::QUIT);
  ASSERT_TRUE(c.keybinds.at('k') == Config::Action::TOGGLE_CORES);
  ASSERT_TRUE(c.keybinds.find('q') == c.keybinds.end());
  std::filesystem::remove(path);
}

TEST(config_parse_hex_rgb) {
  int r = 0, g = 0, b = 0;
  ASSERT_TRUE(zenmon::ui::parse_hex_rgb("#FF8000", r, g, b));
  ASSERT_EQ(r, 255);
  ASSERT_EQ(g, 128);
  ASSERT_EQ(b, 0);
  ASSERT_TRUE(!zenmon::ui::parse_hex_rgb("FF8000", r, g, b));
  ASSERT_TRUE(!zenmon::ui::parse_hex_rgb("#GG0000", r, g, b));
}
