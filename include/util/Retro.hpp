#pragma once
#include <string>

namespace zenmon::util {

// Build a retro-styled progress bar: [████░░░░].
// pct in 0..100 (NaN draws an empty track), width is the number of cells
// inside the brackets. ASCII callers pass "#" / "." for fill / track.
auto retro_bar(double pct, int width = 20, const std::string& fill = "█", const std::string& track = "░") -> std::string;

} // namespace zenmon::util
