#pragma once

#include "model/Snapshot.hpp"
#include <string>
#include <vector>

namespace zenmon::ui {

// Box drawing
std::vector<std::string> make_box(
    const std::string& title,
    const std::vector<std::string>& lines,
    int width,
    int min_height = 0
);

// Line colorization (no-op when stdout is not a terminal)
std::string colorize_line(const std::string& s);

// Lay out every visible panel into `rows` plain lines of `cols` columns.
std::vector<std::string> compose_frame(const zenmon::model::Snapshot& s, int cols, int rows);

// Frame rendering
void render_screen(const zenmon::model::Snapshot& s);

// Plain-text report used by --once
std::string render_report(const zenmon::model::Snapshot& s);

} // namespace zenmon::ui
