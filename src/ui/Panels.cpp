#include "ui/Panels.hpp"
#include "ui/Config.hpp"
#include "ui/Terminal.hpp"
#include "ui/Formatting.hpp"
#include "ui/Renderer.hpp"
#include "util/Retro.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <sstream>

namespace zenmon::ui {

namespace {

constexpr int kLabelW = 8;
constexpr int kCellW = 9;

// "PPT      [█████░░░░]  31%  45.2 / 142 W"
std::string bar_row(int iw, const std::string& name, int pct, const std::string& right) {
  int rw = std::max(16, display_cols(right));
  int barw = std::max(4, iw - kLabelW - 1 - 2 - 6 - rw);
  const bool uni = use_unicode();
  std::string bar = uni ? zenmon::util::retro_bar(pct, barw)
                        : zenmon::util::retro_bar(pct, barw, "#", ".");
  char pbuf[16];
  std::snprintf(pbuf, sizeof(pbuf), " %3d%% ", pct);
  std::string left = trunc_pad(name, kLabelW) + " " + bar + pbuf;
  return lr_align(iw, left, right);
}

bool usable_limit(double limit) { return !std::isnan(limit) && limit > 0.0; }

} // namespace

std::vector<CoreRow> build_core_rows(const zenmon::model::Telemetry& t) {
  std::vector<CoreRow> rows;
  rows.reserve(t.cores.size());
  for (const auto& c : t.cores) {
    CoreRow r;
    r.label = "Core " + std::to_string(c.index);
    r.freq = core_freq_cell(c);
    r.power = fmt_fixed(c.power_w, 3);
    r.voltage = fmt_fixed(c.voltage_v, 3);
    r.temp = fmt_fixed(c.temp_c, 1);
    r.c0 = fmt_fixed(c.c0_pct, 1);
    r.cc1 = fmt_fixed(c.cc1_pct, 1);
    r.cc6 = fmt_fixed(c.cc6_pct, 1);
    rows.push_back(std::move(r));
  }
  return rows;
}

std::string core_table_header(int iw) {
  std::string h = trunc_pad("CORE", kLabelW);
  for (const char* col : {"MHz", "W", "V", "C", "C0%", "CC1%", "CC6%"}) h += rpad_trunc(col, kCellW);
  return trunc_pad(h, iw);
}

std::string format_core_row(const CoreRow& r, int iw) {
  std::string line = trunc_pad(r.label, kLabelW);
  for (const std::string* cell : {&r.freq, &r.power, &r.voltage, &r.temp, &r.c0, &r.cc1, &r.cc6})
    line += rpad_trunc(*cell, kCellW);
  return trunc_pad(line, iw);
}

std::vector<ConstraintRow> build_constraint_rows(const zenmon::model::Constraints& c) {
  std::vector<ConstraintRow> rows;
  auto add = [&](const char* name, double v, double l, const char* unit) {
    rows.push_back(ConstraintRow{name, constraint_pct(v, l), constraint_label(v, l, unit)});
  };
  add("PPT", c.ppt_value, c.ppt_limit, "W");
  add("TDC", c.tdc_value, c.tdc_limit, "A");
  add("EDC", c.edc_value, c.edc_limit, "A");
  add("THM", c.thm_value, c.thm_limit, "C");
  if (usable_limit(c.ppt_apu_limit)) add("PPT APU", c.ppt_apu_value, c.ppt_apu_limit, "W");
  if (usable_limit(c.tdc_soc_limit)) add("TDC SoC", c.tdc_soc_value, c.tdc_soc_limit, "A");
  if (usable_limit(c.edc_soc_limit)) add("EDC SoC", c.edc_soc_value, c.edc_soc_limit, "A");
  if (usable_limit(c.thm_soc_limit)) add("THM SoC", c.thm_soc_value, c.thm_soc_limit, "C");
  if (usable_limit(c.thm_gfx_limit)) add("THM GFX", c.thm_gfx_value, c.thm_gfx_limit, "C");
  if (usable_limit(c.fit_limit))     add("FIT", c.fit_value, c.fit_limit, "");
  if (usable_limit(c.vid_limit))     add("VID", c.vid_value, c.vid_limit, "V");
  return rows;
}

std::vector<std::string> render_system_panel(const zenmon::model::Snapshot& s, int width) {
  int iw = std::max(3, width - 2);
  const auto& si = s.system;
  std::vector<std::string> lines;
  lines.push_back(lr_align(iw, "CPU", si.cpu_name.empty() ? kNoValue : si.cpu_name));
  lines.push_back(lr_align(iw, "CODENAME", si.codename.empty() ? kNoValue : si.codename));
  {
    std::ostringstream rr;
    rr << si.enabled_cores << " / " << si.cores << "  CCDs: " << si.ccds << "  CCXs: " << si.ccxs;
    lines.push_back(lr_align(iw, "CORES", rr.str()));
  }
  lines.push_back(lr_align(iw, "CORES PER CCX", std::to_string(si.cores_per_ccx)));
  lines.push_back(lr_align(iw, "SMU", si.smu_fw_version.empty() ? std::string(kNoValue) : "v" + si.smu_fw_version));
  if (si.if_version > 0) lines.push_back(lr_align(iw, "SMU IF", "v" + std::to_string(si.if_version)));
  return make_box("SYSTEM", lines, width);
}

std::vector<std::string> render_stats_panel(const zenmon::model::Snapshot& s, int width) {
  int iw = std::max(3, width - 2);
  const auto& st = s.telemetry.stats;
  std::vector<std::string> lines;
  lines.push_back(lr_align(iw, "PEAK FREQ", fmt_unit(st.peak_core_freq_mhz, 0, "MHz")));
  lines.push_back(lr_align(iw, "PEAK TEMP", fmt_unit(st.peak_core_temp_c, 1, "°C")));
  lines.push_back(lr_align(iw, "PEAK VOLTAGE", fmt_unit(st.peak_core_voltage_v, 3, "V")));
  lines.push_back(lr_align(iw, "AVG VOLTAGE", fmt_unit(st.avg_core_voltage_v, 3, "V")));
  lines.push_back(lr_align(iw, "AVG CC6", fmt_unit(st.avg_core_cc6_pct, 1, "%")));
  lines.push_back(lr_align(iw, "CORE POWER", fmt_unit(st.total_core_power_w, 3, "W")));
  lines.push_back(lr_align(iw, "SMU PEAK VOLTAGE", fmt_unit(st.peak_core_voltage_smu_v, 3, "V")));
  lines.push_back(lr_align(iw, "PACKAGE CC6", fmt_unit(st.package_cc6_pct, 1, "%")));
  return make_box("CORE STATISTICS", lines, width);
}

int core_page_rows(int max_rows) {
  return std::max(1, max_rows - 3); // header + two borders
}

int clamp_core_scroll(int scroll, size_t core_count, int max_rows) {
  int max_scroll = std::max(0, static_cast<int>(core_count) - core_page_rows(max_rows));
  return std::clamp(scroll, 0, max_scroll);
}

std::vector<std::string> render_cores_panel(const zenmon::model::Snapshot& s, int width, int max_rows, int scroll) {
  int iw = std::max(3, width - 2);
  auto rows = build_core_rows(s.telemetry);
  int page = core_page_rows(max_rows);
  int first = clamp_core_scroll(scroll, rows.size(), max_rows);

  std::vector<std::string> lines;
  lines.push_back(core_table_header(iw));
  if (rows.empty()) {
    lines.push_back(s.status.has_data ? "no cores reported" : "waiting for first sample...");
  }
  int end = std::min(static_cast<int>(rows.size()), first + page);
  for (int i = first; i < end; ++i) lines.push_back(format_core_row(rows[static_cast<size_t>(i)], iw));
  std::string title = "CORES";
  if (static_cast<int>(rows.size()) > page) {
    title += " " + std::to_string(first + 1) + "-" + std::to_string(end) + "/" + std::to_string(rows.size());
  }
  return make_box(title, lines, width);
}

std::vector<std::string> render_constraints_panel(const zenmon::model::Snapshot& s, int width) {
  int iw = std::max(3, width - 2);
  const auto& c = s.telemetry.constraints;
  std::vector<std::string> lines;
  lines.push_back(lr_align(iw, "PEAK TEMP", fmt_unit(c.peak_temp, 1, "°C")));
  for (const auto& r : build_constraint_rows(c)) lines.push_back(bar_row(iw, r.name, r.pct, r.label));
  return make_box("CONSTRAINTS", lines, width);
}

std::vector<std::string> render_memory_panel(const zenmon::model::Snapshot& s, int width) {
  int iw = std::max(3, width - 2);
  const auto& m = s.telemetry.memory;
  std::vector<std::string> lines;
  lines.push_back(lr_align(iw, "FCLK", fmt_unit(m.fclk_mhz, 0, "MHz")));
  lines.push_back(lr_align(iw, "FCLK (EFF)", fmt_unit(m.fclk_eff_mhz, 0, "MHz")));
  lines.push_back(lr_align(iw, "UCLK", fmt_unit(m.uclk_mhz, 0, "MHz")));
  lines.push_back(lr_align(iw, "MEMCLK", fmt_unit(m.memclk_mhz, 0, "MHz")));
  lines.push_back(lr_align(iw, "COUPLED MODE", m.coupled_mode ? "ON" : "OFF"));
  if (g_ui.show_mem_volts) {
    lines.push_back(lr_align(iw, "VDDM", fmt_unit(m.vddm_v, 4, "V")));
    lines.push_back(lr_align(iw, "VDDP", fmt_unit(m.vddp_v, 4, "V")));
    lines.push_back(lr_align(iw, "VDDG", fmt_unit(m.vddg_v, 4, "V")));
    lines.push_back(lr_align(iw, "VDDG IOD", fmt_unit(m.vddg_iod_v, 4, "V")));
    lines.push_back(lr_align(iw, "VDDG CCD", fmt_unit(m.vddg_ccd_v, 4, "V")));
  }
  return make_box("MEMORY INTERFACE", lines, width);
}

std::vector<std::string> render_power_panel(const zenmon::model::Snapshot& s, int width) {
  int iw = std::max(3, width - 2);
  const auto& p = s.telemetry.power;
  std::vector<std::string> lines;
  auto W = [&](const char* name, double v){ lines.push_back(lr_align(iw, name, fmt_unit(v, 3, "W"))); };
  W("SOCKET", p.socket_w);
  W("CORE TOTAL", p.total_core_w);
  W("SOC", p.vddcr_soc_w);
  W("PACKAGE", p.package_w);
  if (g_ui.show_power_ext) {
    W("VDDCR CPU", p.vddcr_cpu_w);
    W("IO VDDCR SOC", p.io_vddcr_soc_w);
    W("GMI2 VDDG", p.gmi2_vddg_w);
    W("ROC", p.roc_w);
    W("L3 LOGIC", p.l3_logic_w);
    W("L3 VDDM", p.l3_vddm_w);
    W("VDDIO MEM", p.vddio_mem_w);
    W("IOD VDDIO MEM", p.iod_vddio_mem_w);
    W("DDR VDDP", p.ddr_vddp_w);
    W("DDR PHY", p.ddr_phy_w);
    W("VDD18", p.vdd18_w);
    W("IO DISPLAY", p.io_display_w);
    W("IO USB", p.io_usb_w);
    auto vaw = [&](double v, double a, double w){
      return fmt_unit(v, 3, "V") + "  " + fmt_unit(a, 2, "A") + "  " + fmt_unit(w, 3, "W");
    };
    lines.push_back(lr_align(iw, "SVI SOC", vaw(p.soc_telemetry_v, p.soc_telemetry_a, p.soc_telemetry_w)));
    lines.push_back(lr_align(iw, "SVI CPU", vaw(p.cpu_telemetry_v, p.cpu_telemetry_a, p.cpu_telemetry_w)));
  }
  return make_box("POWER", lines, width);
}

std::vector<std::string> render_graphics_panel(const zenmon::model::Snapshot& s, int width) {
  int iw = std::max(3, width - 2);
  const auto& g = s.telemetry.graphics;
  std::vector<std::string> lines;
  lines.push_back(lr_align(iw, "GFX CLOCK", fmt_unit(g.freq_mhz, 0, "MHz")));
  lines.push_back(lr_align(iw, "GFX CLOCK (EFF)", fmt_unit(g.freq_eff_mhz, 0, "MHz")));
  lines.push_back(lr_align(iw, "GFX TEMP", fmt_unit(g.temp_c, 1, "°C")));
  lines.push_back(lr_align(iw, "GFX VOLTAGE", fmt_unit(g.voltage_v, 3, "V")));
  lines.push_back(lr_align(iw, "GFX BUSY", fmt_unit(g.busy_pct, 1, "%")));
  lines.push_back(lr_align(iw, "ROC POWER", fmt_unit(g.roc_power_w, 3, "W")));
  if (!std::isnan(g.edc_limit)) {
    lines.push_back(lr_align(iw, "GFX EDC", fmt_unit(g.edc_limit, 0, "A") + "  " + fmt_unit(g.edc_residency_pct, 1, "%")));
  }
  if (!std::isnan(g.display_count)) lines.push_back(lr_align(iw, "DISPLAYS", fmt_fixed(g.display_count, 0)));
  if (!std::isnan(g.fps)) lines.push_back(lr_align(iw, "FPS", fmt_fixed(g.fps, 0)));
  if (!std::isnan(g.dgpu_power_w)) {
    lines.push_back(lr_align(iw, "DGPU POWER", fmt_unit(g.dgpu_power_w, 3, "W")));
    lines.push_back(lr_align(iw, "DGPU CLOCK", fmt_unit(g.dgpu_freq_target_mhz, 0, "MHz")));
    lines.push_back(lr_align(iw, "DGPU BUSY", fmt_unit(g.dgpu_busy_pct, 1, "%")));
  }
  return make_box("GRAPHICS", lines, width);
}

std::string render_status_line(const zenmon::model::Snapshot& s, int width) {
  std::ostringstream ls;
  ls << "zenmon  #" << s.seq << "  every " << s.status.interval_ms << "ms"
     << "  ok:" << s.status.ok_polls << " failed:" << s.status.failed_polls;
  if (!s.status.last_error.empty()) ls << "  last error: " << s.status.last_error;
  return lr_align(width, ls.str(), format_time_now());
}

std::string help_text() {
  return "q quit  h help  c cores  g graphics  p power rails  m memory volts  r reset  +/- interval  arrows/PgUp/PgDn scroll";
}

} // namespace zenmon::ui
