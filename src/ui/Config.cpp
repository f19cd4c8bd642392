#include "ui/Config.hpp"
#include "ui/Terminal.hpp"
#include "util/TomlReader.hpp"
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <string>

namespace zenmon::ui {

constinit UIState g_ui{};

bool parse_hex_rgb(const std::string& hex, int& r, int& g, int& b) {
  if (hex.size()!=7 || hex[0] != '#') return false;
  auto hexv = [&](char c)->int{
    if (c>='0'&&c<='9') return c-'0';
    if (c>='a'&&c<='f') return c-'a'+10;
    if (c>='A'&&c<='F') return c-'A'+10;
    return -1;
  };
  int v1=hexv(hex[1]), v2=hexv(hex[2]), v3=hexv(hex[3]), v4=hexv(hex[4]), v5=hexv(hex[5]), v6=hexv(hex[6]);
  if (v1<0||v2<0||v3<0||v4<0||v5<0||v6<0) return false;
  r = v1*16+v2; g = v3*16+v4; b = v5*16+v6;
  return true;
}

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("ZENMON_", 0) == 0) {
    alt = std::string("zenmon_") + n.substr(7);
  } else if (n.rfind("zenmon_", 0) == 0) {
    alt = std::string("ZENMON_") + n.substr(7);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  int out = 0;
  const char* end = v + std::strlen(v);
  auto [ptr, ec] = std::from_chars(v, end, out);
  if (ec != std::errc{} || ptr != end) return defv;
  return out;
}

static bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/zenmon/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/zenmon/config.toml";
  return {};
}

// Resolve a color role from TOML -> compiled default.
// TOML value can be integer (palette index) or "#RRGGBB" (hex override).
static std::string resolve_color(const zenmon::util::TomlReader& toml, bool have_toml,
                                  const char* role, int def_palette_idx,
                                  const char* def_hex) {
  if (have_toml && toml.has("roles", role)) {
    std::string val = toml.get_string("roles", role);
    if (!val.empty() && std::isdigit(static_cast<unsigned char>(val[0]))) {
      return sgr_palette_idx(toml.get_int("roles", role, def_palette_idx));
    }
    int r, g, b;
    if (parse_hex_rgb(val, r, g, b)) return sgr_truecolor(r, g, b);
  }
  if (def_hex && def_hex[0] == '#') {
    int r, g, b;
    if (parse_hex_rgb(std::string(def_hex), r, g, b)) return sgr_truecolor(r, g, b);
  }
  return sgr_palette_idx(def_palette_idx);
}

// Resolve an int from TOML -> env -> compiled default
static int resolve_int(const zenmon::util::TomlReader& toml, bool have_toml,
                        const char* section, const char* key,
                        const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

// Resolve a bool from TOML -> env -> compiled default
static bool resolve_bool(const zenmon::util::TomlReader& toml, bool have_toml,
                          const char* section, const char* key,
                          const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

// Resolve a string from TOML -> env -> compiled default
static std::string resolve_string(const zenmon::util::TomlReader& toml, bool have_toml,
                                   const char* section, const char* key,
                                   const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

// Default keybind table
struct KeybindDef { const char* name; char key; Config::Action action; };
static constexpr KeybindDef default_keybinds[] = {
  {"quit",            'q', Config::Action::QUIT},
  {"help",            'h', Config::Action::HELP},
  {"toggle_cores",    'c', Config::Action::TOGGLE_CORES},
  {"toggle_graphics", 'g', Config::Action::TOGGLE_GRAPHICS},
  {"toggle_power",    'p', Config::Action::TOGGLE_POWER},
  {"toggle_memory",   'm', Config::Action::TOGGLE_MEMORY},
  {"reset_ui",        'r', Config::Action::RESET_UI},
  {"interval_up",     '+', Config::Action::INTERVAL_UP},
  {"interval_down",   '-', Config::Action::INTERVAL_DOWN},
};

static void populate_keybinds(Config& c, const zenmon::util::TomlReader& toml, bool have_toml) {
  for (const auto& kb : default_keybinds) {
    char key = kb.key;
    if (have_toml && toml.has("keybinds", kb.name)) {
      std::string val = toml.get_string("keybinds", kb.name);
      if (!val.empty()) key = val[0];
    }
    c.keybinds[key] = kb.action;
    // Letter keys answer in either case unless the other case is taken
    if (std::isalpha(static_cast<unsigned char>(key))) {
      char alt = std::isupper(static_cast<unsigned char>(key))
                   ? static_cast<char>(std::tolower(static_cast<unsigned char>(key)))
                   : static_cast<char>(std::toupper(static_cast<unsigned char>(key)));
      if (c.keybinds.find(alt) == c.keybinds.end()) c.keybinds[alt] = kb.action;
    }
  }
  // '=' shares the '+' key on most layouts
  if (c.keybinds.find('=') == c.keybinds.end()) c.keybinds['='] = Config::Action::INTERVAL_UP;
}

Config load_config(const std::string& path) {
  Config c{};
  zenmon::util::TomlReader toml;
  bool have_toml = !path.empty() && toml.load(path);

  // --- [library] ---
  c.library.path      = resolve_string(toml, have_toml, "library", "path",      "ZENMON_LIB_PATH", "");
  c.library.max_cores = resolve_int(toml, have_toml,    "library", "max_cores", "ZENMON_MAX_CORES", 32);

  // --- [poll] ---
  c.poll.interval_ms = resolve_int(toml, have_toml, "poll", "interval_ms", "ZENMON_INTERVAL_MS", 2000);

  // --- [ui] ---
  c.ui.alt_screen  = resolve_bool(toml, have_toml, "ui", "alt_screen",  "ZENMON_ALT_SCREEN", true);
  c.ui.caution_pct = resolve_int(toml, have_toml,  "ui", "caution_pct", "ZENMON_CAUTION_PCT", 60);
  c.ui.warning_pct = resolve_int(toml, have_toml,  "ui", "warning_pct", "ZENMON_WARNING_PCT", 80);
  if (c.ui.warning_pct < c.ui.caution_pct) c.ui.warning_pct = c.ui.caution_pct;

  // --- [roles] ---
  c.colors.accent  = resolve_color(toml, have_toml, "accent",  11, nullptr);
  c.colors.caution = resolve_color(toml, have_toml, "caution",  9, nullptr);
  c.colors.warning = resolve_color(toml, have_toml, "warning",  1, nullptr);
  c.colors.normal  = resolve_color(toml, have_toml, "normal",   2, nullptr);
  c.colors.muted   = resolve_color(toml, have_toml, "muted",   -1, "#787878");
  c.colors.border  = resolve_color(toml, have_toml, "border",  -1, "#383838");

  // --- [log] ---
  c.log.dir = resolve_string(toml, have_toml, "log", "dir", "ZENMON_LOG_DIR", "");

  // --- [keybinds] ---
  populate_keybinds(c, toml, have_toml);

  return c;
}

const Config& config() {
  static Config cfg = load_config(config_file_path());
  return cfg;
}

void reset_ui_defaults() {
  g_ui.scroll = 0;
  g_ui.show_help = false;
  g_ui.show_cores = true;
  g_ui.show_graphics = true;
  g_ui.show_power_ext = false;
  g_ui.show_mem_volts = true;
  g_ui.last_core_page_rows = 16;
}

} // namespace zenmon::ui
