#pragma once

#include "model/Snapshot.hpp"
#include <string>
#include <vector>

namespace zenmon::ui {

// One core table row, already formatted.
struct CoreRow {
  std::string label;     // "Core 3"
  std::string freq;      // whole MHz, "Disabled", "Sleeping" or "--"
  std::string power;
  std::string voltage;
  std::string temp;
  std::string c0;
  std::string cc1;
  std::string cc6;
};

// One row per reported core, in library order.
std::vector<CoreRow> build_core_rows(const zenmon::model::Telemetry& t);

std::string core_table_header(int iw);
std::string format_core_row(const CoreRow& r, int iw);

struct ConstraintRow {
  std::string name;      // "PPT"
  int pct{0};            // bar fill, 0..100
  std::string label;     // "45.2 / 142 W"
};

// PPT, TDC, EDC and THM always; SoC/APU/GFX/FIT/VID pairs only when the
// part reports a usable limit for them.
std::vector<ConstraintRow> build_constraint_rows(const zenmon::model::Constraints& c);

// Box renderers; each returns complete box lines of exactly `width` columns.
std::vector<std::string> render_system_panel(const zenmon::model::Snapshot& s, int width);
std::vector<std::string> render_stats_panel(const zenmon::model::Snapshot& s, int width);
// Data rows that fit in a core box of max_rows lines.
int core_page_rows(int max_rows);
int clamp_core_scroll(int scroll, size_t core_count, int max_rows);
// Pure: scroll is clamped locally, UI state is not touched.
std::vector<std::string> render_cores_panel(const zenmon::model::Snapshot& s, int width, int max_rows, int scroll);
std::vector<std::string> render_constraints_panel(const zenmon::model::Snapshot& s, int width);
std::vector<std::string> render_memory_panel(const zenmon::model::Snapshot& s, int width);
std::vector<std::string> render_power_panel(const zenmon::model::Snapshot& s, int width);
std::vector<std::string> render_graphics_panel(const zenmon::model::Snapshot& s, int width);

// Bottom line: sequence, interval, poll counters, last error, clock.
std::string render_status_line(const zenmon::model::Snapshot& s, int width);

std::string help_text();

} // namespace zenmon::ui
