#include "ui/Input.hpp"
#include "ui/Terminal.hpp"
#include <unistd.h>
#include <poll.h>
#include <algorithm>

namespace zenmon::ui {

bool has_input_available(int timeout_ms) {
  struct pollfd pfd{.fd=STDIN_FILENO,.events=POLLIN,.revents=0};
  int to = timeout_ms;
  if (to < 10) to = 10;
  if (to > 1000) to = 1000;
  int rv = ::poll(&pfd, 1, to);
  return rv > 0 && (pfd.revents & POLLIN);
}

KeyResult apply_keys(std::string_view buf, const Config& cfg) {
  KeyResult res;
  size_t k = 0;
  const size_t n = buf.size();
  while (k < n) {
    unsigned char c = static_cast<unsigned char>(buf[k++]);
    if (c == 0x1B) {
      // ESC sequences: arrows and PgUp/PgDn scroll the core table
      unsigned char a=0,b=0,d=0;
      if (k < n) a = static_cast<unsigned char>(buf[k++]); else break;
      if (a != '[') continue;
      if (k < n) b = static_cast<unsigned char>(buf[k++]); else break;
      if (b == 'A') { if (g_ui.scroll > 0) g_ui.scroll--; }
      else if (b == 'B') { g_ui.scroll++; }
      else if (b == '5' || b == '6') {
        if (k < n) d = static_cast<unsigned char>(buf[k++]);
        if (d == '~') {
          int page = std::max(1, g_ui.last_core_page_rows - 2);
          if (b == '5') g_ui.scroll = std::max(0, g_ui.scroll - page);
          else g_ui.scroll += page;
        }
      }
      // upper bound is clamped by compose_frame on the next frame
      continue;
    }
    auto it = cfg.keybinds.find(static_cast<char>(c));
    if (it == cfg.keybinds.end()) continue;
    switch (it->second) {
      case Config::Action::QUIT:            res.quit = true; return res;
      case Config::Action::HELP:            g_ui.show_help = !g_ui.show_help; break;
      case Config::Action::TOGGLE_CORES:    g_ui.show_cores = !g_ui.show_cores; break;
      case Config::Action::TOGGLE_GRAPHICS: g_ui.show_graphics = !g_ui.show_graphics; break;
      case Config::Action::TOGGLE_POWER:    g_ui.show_power_ext = !g_ui.show_power_ext; break;
      case Config::Action::TOGGLE_MEMORY:   g_ui.show_mem_volts = !g_ui.show_mem_volts; break;
      case Config::Action::RESET_UI:        reset_ui_defaults(); break;
      case Config::Action::INTERVAL_UP:     res.interval_delta_ms += kIntervalStepMs; break;
      case Config::Action::INTERVAL_DOWN:   res.interval_delta_ms -= kIntervalStepMs; break;
    }
  }
  return res;
}

KeyResult handle_keyboard_input(const Config& cfg) {
  char buf[32];
  ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
  if (n <= 0) return {};
  return apply_keys(std::string_view(buf, static_cast<size_t>(n)), cfg);
}

} // namespace zenmon::ui
