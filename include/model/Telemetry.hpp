#pragma once
#include <limits>
#include <string>
#include <vector>

namespace zenmon::model {

// Unpopulated metrics (unsupported silicon, no iGPU) are NaN, never 0.
inline constexpr double kUnavailable = std::numeric_limits<double>::quiet_NaN();

struct SystemInfo {
  std::string cpu_name;
  std::string codename;
  std::string smu_fw_version;
  int cores{0};
  int ccds{0};
  int ccxs{0};
  int cores_per_ccx{0};
  int if_version{0};       // SMU interface version (9..13, 0 if unknown)
  int enabled_cores{0};
};

struct CoreReading {
  int    index{0};
  double frequency_mhz{kUnavailable};
  double power_w{kUnavailable};
  double voltage_v{kUnavailable};
  double temp_c{kUnavailable};
  double c0_pct{kUnavailable};
  double cc1_pct{kUnavailable};
  double cc6_pct{kUnavailable};
  bool   disabled{false};
  bool   sleeping{false};
};

// Value/limit pairs for the platform power and thermal budgets.
struct Constraints {
  double peak_temp{kUnavailable};
  double soc_temp{kUnavailable};
  double gfx_temp{kUnavailable};
  double vid_value{kUnavailable};
  double vid_limit{kUnavailable};
  double ppt_value{kUnavailable};
  double ppt_limit{kUnavailable};
  double ppt_apu_value{kUnavailable};
  double ppt_apu_limit{kUnavailable};
  double tdc_value{kUnavailable};
  double tdc_limit{kUnavailable};
  double tdc_actual{kUnavailable};
  double tdc_soc_value{kUnavailable};
  double tdc_soc_limit{kUnavailable};
  double edc_value{kUnavailable};
  double edc_limit{kUnavailable};
  double edc_soc_value{kUnavailable};
  double edc_soc_limit{kUnavailable};
  double thm_value{kUnavailable};
  double thm_limit{kUnavailable};
  double thm_soc_value{kUnavailable};
  double thm_soc_limit{kUnavailable};
  double thm_gfx_value{kUnavailable};
  double thm_gfx_limit{kUnavailable};
  double fit_value{kUnavailable};
  double fit_limit{kUnavailable};
};

struct MemoryInterface {
  double fclk_mhz{kUnavailable};
  double fclk_eff_mhz{kUnavailable};
  double uclk_mhz{kUnavailable};
  double memclk_mhz{kUnavailable};
  double vddm_v{kUnavailable};
  double vddp_v{kUnavailable};
  double vddg_v{kUnavailable};
  double vddg_iod_v{kUnavailable};
  double vddg_ccd_v{kUnavailable};
  bool   coupled_mode{false};
};

struct PowerRails {
  double total_core_w{kUnavailable};
  double vddcr_soc_w{kUnavailable};
  double io_vddcr_soc_w{kUnavailable};
  double gmi2_vddg_w{kUnavailable};
  double roc_w{kUnavailable};
  double l3_logic_w{kUnavailable};
  double l3_vddm_w{kUnavailable};
  double vddio_mem_w{kUnavailable};
  double iod_vddio_mem_w{kUnavailable};
  double ddr_vddp_w{kUnavailable};
  double ddr_phy_w{kUnavailable};
  double vdd18_w{kUnavailable};
  double io_display_w{kUnavailable};
  double io_usb_w{kUnavailable};
  double socket_w{kUnavailable};
  double package_w{kUnavailable};
  double vddcr_cpu_w{kUnavailable};
  double soc_telemetry_v{kUnavailable};
  double soc_telemetry_a{kUnavailable};
  double soc_telemetry_w{kUnavailable};
  double cpu_telemetry_v{kUnavailable};
  double cpu_telemetry_a{kUnavailable};
  double cpu_telemetry_w{kUnavailable};
};

struct Graphics {
  double voltage_v{kUnavailable};
  double roc_power_w{kUnavailable};
  double temp_c{kUnavailable};
  double freq_mhz{kUnavailable};
  double freq_eff_mhz{kUnavailable};
  double busy_pct{kUnavailable};
  double edc_limit{kUnavailable};
  double edc_residency_pct{kUnavailable};
  double display_count{kUnavailable};
  double fps{kUnavailable};
  double dgpu_power_w{kUnavailable};
  double dgpu_freq_target_mhz{kUnavailable};
  double dgpu_busy_pct{kUnavailable};
};

// Aggregates the library computes across enabled cores.
struct DerivedStats {
  double peak_core_freq_mhz{kUnavailable};
  double peak_core_temp_c{kUnavailable};
  double peak_core_voltage_v{kUnavailable};
  double avg_core_voltage_v{kUnavailable};
  double avg_core_cc6_pct{kUnavailable};
  double total_core_power_w{kUnavailable};
  double peak_core_voltage_smu_v{kUnavailable};
  double package_cc6_pct{kUnavailable};
};

// One complete read_data result.
struct Telemetry {
  std::vector<CoreReading> cores;
  Constraints constraints;
  MemoryInterface memory;
  PowerRails power;
  Graphics graphics;
  DerivedStats stats;
};

} // namespace zenmon::model
