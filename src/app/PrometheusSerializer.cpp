#include "app/Metrics.hpp"
#include <charconv>
#include <cmath>
#include <cstdint>
#include <string_view>
#include <utility>

namespace {

void append_double(std::string& out, double v) {
  if (std::isnan(v)) { out += "NaN"; return; }
  if (std::isinf(v)) { out += (v > 0) ? "+Inf" : "-Inf"; return; }
  char buf[32];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  if (ec == std::errc{}) {
    out.append(buf, ptr);
  } else {
    out += '0';
  }
}

void append_uint(std::string& out, uint64_t v) {
  char buf[24];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  out.append(buf, ptr);
}

void append_int(std::string& out, int v) {
  char buf[16];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  out.append(buf, ptr);
}

void append_escaped(std::string& out, std::string_view sv) {
  for (char c : sv) {
    if (c == '\\') out += "\\\\";
    else if (c == '"') out += "\\\"";
    else if (c == '\n') out += "\\n";
    else out += c;
  }
}

void emit_header(std::string& out, const char* name, const char* help, const char* type) {
  out += "# HELP ";  out += name;  out += ' ';  out += help;  out += '\n';
  out += "# TYPE ";  out += name;  out += ' ';  out += type;  out += '\n';
}

void emit_gauge_d(std::string& out, const char* name, double value) {
  out += name;  out += ' ';  append_double(out, value);  out += '\n';
}

void emit_gauge_u(std::string& out, const char* name, uint64_t value) {
  out += name;  out += ' ';  append_uint(out, value);  out += '\n';
}

void emit_gauge_i(std::string& out, const char* name, int value) {
  out += name;  out += ' ';  append_int(out, value);  out += '\n';
}

// 1-label variant: name{key="val"} value
void emit_labeled_d(std::string& out, const char* name,
                    const char* lk, std::string_view lv, double value) {
  out += name;  out += '{';  out += lk;  out += "=\"";
  append_escaped(out, lv);
  out += "\"} ";  append_double(out, value);  out += '\n';
}

void emit_labeled_i(std::string& out, const char* name,
                    const char* lk, std::string_view lv, int value) {
  out += name;  out += '{';  out += lk;  out += "=\"";
  append_escaped(out, lv);
  out += "\"} ";  append_int(out, value);  out += '\n';
}

struct Pair { const char* name; double value; double limit; };

} // anonymous namespace

namespace zenmon::app {

std::string snapshot_to_prometheus(const zenmon::model::Snapshot& s) {
  std::string out;
  out.reserve(8192);

  // --- Identity ---
  emit_header(out, "zenmon_cpu_info", "CPU identity reported by the sensing library", "gauge");
  out += "zenmon_cpu_info{name=\"";  append_escaped(out, s.system.cpu_name);
  out += "\",codename=\"";           append_escaped(out, s.system.codename);
  out += "\",smu_fw=\"";             append_escaped(out, s.system.smu_fw_version);
  out += "\"} 1\n";
  emit_header(out, "zenmon_cpu_cores", "Physical cores", "gauge");
  emit_gauge_i(out, "zenmon_cpu_cores", s.system.cores);
  emit_header(out, "zenmon_cpu_enabled_cores", "Enabled cores", "gauge");
  emit_gauge_i(out, "zenmon_cpu_enabled_cores", s.system.enabled_cores);
  emit_header(out, "zenmon_cpu_ccds", "Core complex dies", "gauge");
  emit_gauge_i(out, "zenmon_cpu_ccds", s.system.ccds);
  emit_header(out, "zenmon_smu_if_version", "SMU interface version", "gauge");
  emit_gauge_i(out, "zenmon_smu_if_version", s.system.if_version);

  // --- Cores ---
  const auto& cores = s.telemetry.cores;
  if (!cores.empty()) {
    auto per_core = [&](const char* name, const char* help, auto get) {
      emit_header(out, name, help, "gauge");
      for (const auto& c : cores) emit_labeled_d(out, name, "core", std::to_string(c.index), get(c));
    };
    using C = zenmon::model::CoreReading;
    per_core("zenmon_core_frequency_mhz", "Core effective frequency", [](const C& c){ return c.frequency_mhz; });
    per_core("zenmon_core_power_watts", "Core power", [](const C& c){ return c.power_w; });
    per_core("zenmon_core_voltage_volts", "Core voltage", [](const C& c){ return c.voltage_v; });
    per_core("zenmon_core_temperature_celsius", "Core temperature", [](const C& c){ return c.temp_c; });
    per_core("zenmon_core_c0_percent", "Core C0 residency", [](const C& c){ return c.c0_pct; });
    per_core("zenmon_core_cc1_percent", "Core CC1 residency", [](const C& c){ return c.cc1_pct; });
    per_core("zenmon_core_cc6_percent", "Core CC6 residency", [](const C& c){ return c.cc6_pct; });
    emit_header(out, "zenmon_core_disabled", "1 if the core is fused off or disabled", "gauge");
    for (const auto& c : cores) emit_labeled_i(out, "zenmon_core_disabled", "core", std::to_string(c.index), c.disabled ? 1 : 0);
    emit_header(out, "zenmon_core_sleeping", "1 if the core is in a deep sleep state", "gauge");
    for (const auto& c : cores) emit_labeled_i(out, "zenmon_core_sleeping", "core", std::to_string(c.index), c.sleeping ? 1 : 0);
  }

  // --- Constraints ---
  const auto& k = s.telemetry.constraints;
  const Pair pairs[] = {
    {"vid", k.vid_value, k.vid_limit},
    {"ppt", k.ppt_value, k.ppt_limit},
    {"ppt_apu", k.ppt_apu_value, k.ppt_apu_limit},
    {"tdc", k.tdc_value, k.tdc_limit},
    {"tdc_soc", k.tdc_soc_value, k.tdc_soc_limit},
    {"edc", k.edc_value, k.edc_limit},
    {"edc_soc", k.edc_soc_value, k.edc_soc_limit},
    {"thm", k.thm_value, k.thm_limit},
    {"thm_soc", k.thm_soc_value, k.thm_soc_limit},
    {"thm_gfx", k.thm_gfx_value, k.thm_gfx_limit},
    {"fit", k.fit_value, k.fit_limit},
  };
  emit_header(out, "zenmon_constraint_value", "Current value of a power or thermal budget", "gauge");
  for (const auto& p : pairs) emit_labeled_d(out, "zenmon_constraint_value", "constraint", p.name, p.value);
  emit_header(out, "zenmon_constraint_limit", "Limit of a power or thermal budget", "gauge");
  for (const auto& p : pairs) emit_labeled_d(out, "zenmon_constraint_limit", "constraint", p.name, p.limit);
  emit_header(out, "zenmon_tdc_actual_amperes", "Actual TDC current", "gauge");
  emit_gauge_d(out, "zenmon_tdc_actual_amperes", k.tdc_actual);
  emit_header(out, "zenmon_temperature_celsius", "Package sensor temperatures", "gauge");
  emit_labeled_d(out, "zenmon_temperature_celsius", "sensor", "peak", k.peak_temp);
  emit_labeled_d(out, "zenmon_temperature_celsius", "sensor", "soc", k.soc_temp);
  emit_labeled_d(out, "zenmon_temperature_celsius", "sensor", "gfx", k.gfx_temp);

  // --- Memory interface ---
  const auto& m = s.telemetry.memory;
  emit_header(out, "zenmon_memory_clock_mhz", "Fabric and memory clocks", "gauge");
  emit_labeled_d(out, "zenmon_memory_clock_mhz", "clock", "fclk", m.fclk_mhz);
  emit_labeled_d(out, "zenmon_memory_clock_mhz", "clock", "fclk_eff", m.fclk_eff_mhz);
  emit_labeled_d(out, "zenmon_memory_clock_mhz", "clock", "uclk", m.uclk_mhz);
  emit_labeled_d(out, "zenmon_memory_clock_mhz", "clock", "memclk", m.memclk_mhz);
  emit_header(out, "zenmon_memory_voltage_volts", "Memory interface rail voltages", "gauge");
  emit_labeled_d(out, "zenmon_memory_voltage_volts", "rail", "vddm", m.vddm_v);
  emit_labeled_d(out, "zenmon_memory_voltage_volts", "rail", "vddp", m.vddp_v);
  emit_labeled_d(out, "zenmon_memory_voltage_volts", "rail", "vddg", m.vddg_v);
  emit_labeled_d(out, "zenmon_memory_voltage_volts", "rail", "vddg_iod", m.vddg_iod_v);
  emit_labeled_d(out, "zenmon_memory_voltage_volts", "rail", "vddg_ccd", m.vddg_ccd_v);
  emit_header(out, "zenmon_memory_coupled_mode", "1 if UCLK runs 1:1 with MEMCLK", "gauge");
  emit_gauge_i(out, "zenmon_memory_coupled_mode", m.coupled_mode ? 1 : 0);

  // --- Power rails ---
  const auto& p = s.telemetry.power;
  const std::pair<const char*, double> rails[] = {
    {"total_core", p.total_core_w}, {"vddcr_soc", p.vddcr_soc_w},
    {"io_vddcr_soc", p.io_vddcr_soc_w}, {"gmi2_vddg", p.gmi2_vddg_w},
    {"roc", p.roc_w}, {"l3_logic", p.l3_logic_w}, {"l3_vddm", p.l3_vddm_w},
    {"vddio_mem", p.vddio_mem_w}, {"iod_vddio_mem", p.iod_vddio_mem_w},
    {"ddr_vddp", p.ddr_vddp_w}, {"ddr_phy", p.ddr_phy_w}, {"vdd18", p.vdd18_w},
    {"io_display", p.io_display_w}, {"io_usb", p.io_usb_w},
    {"socket", p.socket_w}, {"package", p.package_w}, {"vddcr_cpu", p.vddcr_cpu_w},
    {"soc_telemetry", p.soc_telemetry_w}, {"cpu_telemetry", p.cpu_telemetry_w},
  };
  emit_header(out, "zenmon_power_rail_watts", "Per-rail power", "gauge");
  for (const auto& [rail, w] : rails) emit_labeled_d(out, "zenmon_power_rail_watts", "rail", rail, w);
  emit_header(out, "zenmon_telemetry_voltage_volts", "SVI telemetry voltage", "gauge");
  emit_labeled_d(out, "zenmon_telemetry_voltage_volts", "plane", "soc", p.soc_telemetry_v);
  emit_labeled_d(out, "zenmon_telemetry_voltage_volts", "plane", "cpu", p.cpu_telemetry_v);
  emit_header(out, "zenmon_telemetry_current_amperes", "SVI telemetry current", "gauge");
  emit_labeled_d(out, "zenmon_telemetry_current_amperes", "plane", "soc", p.soc_telemetry_a);
  emit_labeled_d(out, "zenmon_telemetry_current_amperes", "plane", "cpu", p.cpu_telemetry_a);

  // --- Graphics ---
  const auto& g = s.telemetry.graphics;
  emit_header(out, "zenmon_gfx_voltage_volts", "iGPU voltage", "gauge");
  emit_gauge_d(out, "zenmon_gfx_voltage_volts", g.voltage_v);
  emit_header(out, "zenmon_gfx_temperature_celsius", "iGPU temperature", "gauge");
  emit_gauge_d(out, "zenmon_gfx_temperature_celsius", g.temp_c);
  emit_header(out, "zenmon_gfx_frequency_mhz", "iGPU clock", "gauge");
  emit_labeled_d(out, "zenmon_gfx_frequency_mhz", "kind", "requested", g.freq_mhz);
  emit_labeled_d(out, "zenmon_gfx_frequency_mhz", "kind", "effective", g.freq_eff_mhz);
  emit_header(out, "zenmon_gfx_busy_percent", "iGPU busy", "gauge");
  emit_gauge_d(out, "zenmon_gfx_busy_percent", g.busy_pct);
  emit_header(out, "zenmon_gfx_edc_residency_percent", "iGPU EDC residency", "gauge");
  emit_gauge_d(out, "zenmon_gfx_edc_residency_percent", g.edc_residency_pct);
  emit_header(out, "zenmon_gfx_fps", "Frames per second reported by the SMU", "gauge");
  emit_gauge_d(out, "zenmon_gfx_fps", g.fps);
  emit_header(out, "zenmon_dgpu_power_watts", "Discrete GPU power", "gauge");
  emit_gauge_d(out, "zenmon_dgpu_power_watts", g.dgpu_power_w);
  emit_header(out, "zenmon_dgpu_busy_percent", "Discrete GPU busy", "gauge");
  emit_gauge_d(out, "zenmon_dgpu_busy_percent", g.dgpu_busy_pct);

  // --- Derived stats ---
  const auto& st = s.telemetry.stats;
  emit_header(out, "zenmon_peak_core_frequency_mhz", "Highest core frequency", "gauge");
  emit_gauge_d(out, "zenmon_peak_core_frequency_mhz", st.peak_core_freq_mhz);
  emit_header(out, "zenmon_peak_core_temperature_celsius", "Highest core temperature", "gauge");
  emit_gauge_d(out, "zenmon_peak_core_temperature_celsius", st.peak_core_temp_c);
  emit_header(out, "zenmon_peak_core_voltage_volts", "Highest core voltage", "gauge");
  emit_gauge_d(out, "zenmon_peak_core_voltage_volts", st.peak_core_voltage_v);
  emit_header(out, "zenmon_avg_core_voltage_volts", "Average core voltage", "gauge");
  emit_gauge_d(out, "zenmon_avg_core_voltage_volts", st.avg_core_voltage_v);
  emit_header(out, "zenmon_avg_core_cc6_percent", "Average core CC6 residency", "gauge");
  emit_gauge_d(out, "zenmon_avg_core_cc6_percent", st.avg_core_cc6_pct);
  emit_header(out, "zenmon_total_core_power_watts", "Sum of core power", "gauge");
  emit_gauge_d(out, "zenmon_total_core_power_watts", st.total_core_power_w);
  emit_header(out, "zenmon_package_cc6_percent", "Package CC6 residency", "gauge");
  emit_gauge_d(out, "zenmon_package_cc6_percent", st.package_cc6_pct);

  // --- Poll status ---
  emit_header(out, "zenmon_polls_ok_total", "Successful library reads", "counter");
  emit_gauge_u(out, "zenmon_polls_ok_total", s.status.ok_polls);
  emit_header(out, "zenmon_polls_failed_total", "Failed library reads", "counter");
  emit_gauge_u(out, "zenmon_polls_failed_total", s.status.failed_polls);
  emit_header(out, "zenmon_poll_interval_ms", "Configured poll interval", "gauge");
  emit_gauge_i(out, "zenmon_poll_interval_ms", s.status.interval_ms);
  emit_header(out, "zenmon_snapshot_seq", "Snapshot sequence number", "counter");
  emit_gauge_u(out, "zenmon_snapshot_seq", s.seq);

  return out;
}

} // namespace zenmon::app
