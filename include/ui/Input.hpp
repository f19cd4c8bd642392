#pragma once

#include <string_view>
#include "ui/Config.hpp"

namespace zenmon::ui {

inline constexpr int kIntervalStepMs = 250;

struct KeyResult {
  bool quit{false};
  int interval_delta_ms{0};   // applied by the caller to the producer
};

// Apply a chunk of raw terminal input to g_ui using cfg's keybinds.
KeyResult apply_keys(std::string_view bytes, const Config& cfg);

// Read whatever is pending on stdin and apply it.
KeyResult handle_keyboard_input(const Config& cfg);

// Helper to check for available input
bool has_input_available(int timeout_ms);

} // namespace zenmon::ui
