#pragma once
#include <cstddef>

// Record layouts exchanged with libryzen_monitor.so. Field order, widths and
// sizes are the compatibility contract with the library; never reorder.
// Every member is a 32-bit int, a 32-bit float or a char array, so the
// natural layout has no interior padding.

namespace zenmon::abi {

inline constexpr const char* kLibrarySoname = "libryzen_monitor.so";

struct core_data_t {
  int   core_num;
  float frequency;   // MHz
  float power;       // W
  float voltage;     // V
  float temp;        // degC
  float c0;          // %
  float cc1;         // %
  float cc6;         // %
  int   disabled;
  int   sleeping;
};

struct system_data_t {
  char cpu_name[256];
  char codename[64];
  char smu_fw_ver[32];
  int  cores;
  int  ccds;
  int  ccxs;
  int  cores_per_ccx;
  int  if_ver;
  int  enabled_cores_count;
};

struct constraints_data_t {
  float peak_temp;
  float soc_temp;
  float gfx_temp;
  float vid_value;
  float vid_limit;
  float ppt_value;
  float ppt_limit;
  float ppt_apu_value;
  float ppt_apu_limit;
  float tdc_value;
  float tdc_limit;
  float tdc_actual;
  float tdc_soc_value;
  float tdc_soc_limit;
  float edc_value;
  float edc_limit;
  float edc_soc_value;
  float edc_soc_limit;
  float thm_value;
  float thm_limit;
  float thm_soc_value;
  float thm_soc_limit;
  float thm_gfx_value;
  float thm_gfx_limit;
  float fit_value;
  float fit_limit;
};

struct memory_data_t {
  float fclk_freq;
  float fclk_freq_eff;
  float uclk_freq;
  float memclk_freq;
  float v_vddm;
  float v_vddp;
  float v_vddg;
  float v_vddg_iod;
  float v_vddg_ccd;
  int   coupled_mode;
};

struct power_data_t {
  float total_core_power;
  float vddcr_soc_power;
  float io_vddcr_soc_power;
  float gmi2_vddg_power;
  float roc_power;
  float l3_logic_power;
  float l3_vddm_power;
  float vddio_mem_power;
  float iod_vddio_mem_power;
  float ddr_vddp_power;
  float ddr_phy_power;
  float vdd18_power;
  float io_display_power;
  float io_usb_power;
  float socket_power;
  float package_power;
  float vddcr_cpu_power;
  float soc_telemetry_voltage;
  float soc_telemetry_current;
  float soc_telemetry_power;
  float cpu_telemetry_voltage;
  float cpu_telemetry_current;
  float cpu_telemetry_power;
};

struct graphics_data_t {
  float gfx_voltage;
  float roc_power;
  float gfx_temp;
  float gfx_freq;
  float gfx_freq_eff;
  float gfx_busy;
  float gfx_edc_lim;
  float gfx_edc_residency;
  float display_count;
  float fps;
  float dgpu_power;
  float dgpu_freq_target;
  float dgpu_gfx_busy;
};

struct calculated_stats_t {
  float peak_core_frequency;
  float peak_core_temp;
  float peak_core_voltage;
  float avg_core_voltage;
  float avg_core_cc6;
  float total_core_power;
  float peak_core_voltage_smu;
  float package_cc6;
};

static_assert(sizeof(int) == 4 && sizeof(float) == 4, "library ABI assumes 32-bit int and float");

static_assert(sizeof(core_data_t) == 40);
static_assert(offsetof(core_data_t, frequency) == 4);
static_assert(offsetof(core_data_t, disabled) == 32);
static_assert(offsetof(core_data_t, sleeping) == 36);

static_assert(sizeof(system_data_t) == 376);
static_assert(offsetof(system_data_t, codename) == 256);
static_assert(offsetof(system_data_t, smu_fw_ver) == 320);
static_assert(offsetof(system_data_t, cores) == 352);
static_assert(offsetof(system_data_t, enabled_cores_count) == 372);

static_assert(sizeof(constraints_data_t) == 104);
static_assert(offsetof(constraints_data_t, ppt_value) == 20);
static_assert(offsetof(constraints_data_t, ppt_limit) == 24);
static_assert(offsetof(constraints_data_t, fit_limit) == 100);

static_assert(sizeof(memory_data_t) == 40);
static_assert(offsetof(memory_data_t, coupled_mode) == 36);

static_assert(sizeof(power_data_t) == 92);
static_assert(offsetof(power_data_t, socket_power) == 56);
static_assert(offsetof(power_data_t, cpu_telemetry_power) == 88);

static_assert(sizeof(graphics_data_t) == 52);
static_assert(offsetof(graphics_data_t, gfx_freq) == 12);

static_assert(sizeof(calculated_stats_t) == 32);
static_assert(offsetof(calculated_stats_t, package_cc6) == 28);

// Signatures of the exported entry points.
using ryzen_init_fn            = int (*)();
using ryzen_cleanup_fn         = void (*)();
using ryzen_get_system_info_fn = int (*)(system_data_t*);
using ryzen_read_data_fn       = int (*)(core_data_t*, int,
                                         constraints_data_t*, memory_data_t*,
                                         power_data_t*, graphics_data_t*,
                                         calculated_stats_t*);

} // namespace zenmon::abi
