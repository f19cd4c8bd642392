#include "binding/AbiDecoder.hpp"
#include <cstdint>
#include <cstring>

namespace zenmon::binding {

namespace {

float f32_at(std::span<const std::byte> b, size_t off) {
  float v;
  std::memcpy(&v, b.data() + off, sizeof(v));
  return v;
}

int32_t i32_at(std::span<const std::byte> b, size_t off) {
  int32_t v;
  std::memcpy(&v, b.data() + off, sizeof(v));
  return v;
}

} // namespace

std::string decode_text(std::span<const std::byte> field) {
  std::string s;
  s.reserve(field.size());
  for (std::byte c : field) {
    if (c == std::byte{0}) break;
    s.push_back(static_cast<char>(c));
  }
  return s;
}

bool decode_system_info(std::span<const std::byte> b, model::SystemInfo& out) {
  using R = abi::system_data_t;
  if (b.size() < sizeof(R)) return false;
  out.cpu_name       = decode_text(b.subspan(offsetof(R, cpu_name), sizeof(R::cpu_name)));
  out.codename       = decode_text(b.subspan(offsetof(R, codename), sizeof(R::codename)));
  out.smu_fw_version = decode_text(b.subspan(offsetof(R, smu_fw_ver), sizeof(R::smu_fw_ver)));
  out.cores          = i32_at(b, offsetof(R, cores));
  out.ccds           = i32_at(b, offsetof(R, ccds));
  out.ccxs           = i32_at(b, offsetof(R, ccxs));
  out.cores_per_ccx  = i32_at(b, offsetof(R, cores_per_ccx));
  out.if_version     = i32_at(b, offsetof(R, if_ver));
  out.enabled_cores  = i32_at(b, offsetof(R, enabled_cores_count));
  return true;
}

bool decode_cores(std::span<const std::byte> b, int count, std::vector<model::CoreReading>& out) {
  using R = abi::core_data_t;
  if (count < 0) return false;
  if (b.size() < sizeof(R) * static_cast<size_t>(count)) return false;
  out.clear();
  out.reserve(static_cast<size_t>(count));
  for (int i = 0; i < count; ++i) {
    auto rec = b.subspan(sizeof(R) * static_cast<size_t>(i), sizeof(R));
    model::CoreReading c;
    c.index         = i32_at(rec, offsetof(R, core_num));
    c.frequency_mhz = f32_at(rec, offsetof(R, frequency));
    c.power_w       = f32_at(rec, offsetof(R, power));
    c.voltage_v     = f32_at(rec, offsetof(R, voltage));
    c.temp_c        = f32_at(rec, offsetof(R, temp));
    c.c0_pct        = f32_at(rec, offsetof(R, c0));
    c.cc1_pct       = f32_at(rec, offsetof(R, cc1));
    c.cc6_pct       = f32_at(rec, offsetof(R, cc6));
    c.disabled      = i32_at(rec, offsetof(R, disabled)) != 0;
    c.sleeping      = i32_at(rec, offsetof(R, sleeping)) != 0;
    out.push_back(c);
  }
  return true;
}

bool decode_constraints(std::span<const std::byte> b, model::Constraints& out) {
  using R = abi::constraints_data_t;
  if (b.size() < sizeof(R)) return false;
  auto F = [&](size_t off) -> double { return f32_at(b, off); };
  out.peak_temp     = F(offsetof(R, peak_temp));
  out.soc_temp      = F(offsetof(R, soc_temp));
  out.gfx_temp      = F(offsetof(R, gfx_temp));
  out.vid_value     = F(offsetof(R, vid_value));
  out.vid_limit     = F(offsetof(R, vid_limit));
  out.ppt_value     = F(offsetof(R, ppt_value));
  out.ppt_limit     = F(offsetof(R, ppt_limit));
  out.ppt_apu_value = F(offsetof(R, ppt_apu_value));
  out.ppt_apu_limit = F(offsetof(R, ppt_apu_limit));
  out.tdc_value     = F(offsetof(R, tdc_value));
  out.tdc_limit     = F(offsetof(R, tdc_limit));
  out.tdc_actual    = F(offsetof(R, tdc_actual));
  out.tdc_soc_value = F(offsetof(R, tdc_soc_value));
  out.tdc_soc_limit = F(offsetof(R, tdc_soc_limit));
  out.edc_value     = F(offsetof(R, edc_value));
  out.edc_limit     = F(offsetof(R, edc_limit));
  out.edc_soc_value = F(offsetof(R, edc_soc_value));
  out.edc_soc_limit = F(offsetof(R, edc_soc_limit));
  out.thm_value     = F(offsetof(R, thm_value));
  out.thm_limit     = F(offsetof(R, thm_limit));
  out.thm_soc_value = F(offsetof(R, thm_soc_value));
  out.thm_soc_limit = F(offsetof(R, thm_soc_limit));
  out.thm_gfx_value = F(offsetof(R, thm_gfx_value));
  out.thm_gfx_limit = F(offsetof(R, thm_gfx_limit));
  out.fit_value     = F(offsetof(R, fit_value));
  out.fit_limit     = F(offsetof(R, fit_limit));
  return true;
}

bool decode_memory(std::span<const std::byte> b, model::MemoryInterface& out) {
  using R = abi::memory_data_t;
  if (b.size() < sizeof(R)) return false;
  out.fclk_mhz     = f32_at(b, offsetof(R, fclk_freq));
  out.fclk_eff_mhz = f32_at(b, offsetof(R, fclk_freq_eff));
  out.uclk_mhz     = f32_at(b, offsetof(R, uclk_freq));
  out.memclk_mhz   = f32_at(b, offsetof(R, memclk_freq));
  out.vddm_v       = f32_at(b, offsetof(R, v_vddm));
  out.vddp_v       = f32_at(b, offsetof(R, v_vddp));
  out.vddg_v       = f32_at(b, offsetof(R, v_vddg));
  out.vddg_iod_v   = f32_at(b, offsetof(R, v_vddg_iod));
  out.vddg_ccd_v   = f32_at(b, offsetof(R, v_vddg_ccd));
  out.coupled_mode = i32_at(b, offsetof(R, coupled_mode)) != 0;
  return true;
}

bool decode_power(std::span<const std::byte> b, model::PowerRails& out) {
  using R = abi::power_data_t;
  if (b.size() < sizeof(R)) return false;
  auto F = [&](size_t off) -> double { return f32_at(b, off); };
  out.total_core_w    = F(offsetof(R, total_core_power));
  out.vddcr_soc_w     = F(offsetof(R, vddcr_soc_power));
  out.io_vddcr_soc_w  = F(offsetof(R, io_vddcr_soc_power));
  out.gmi2_vddg_w     = F(offsetof(R, gmi2_vddg_power));
  out.roc_w           = F(offsetof(R, roc_power));
  out.l3_logic_w      = F(offsetof(R, l3_logic_power));
  out.l3_vddm_w       = F(offsetof(R, l3_vddm_power));
  out.vddio_mem_w     = F(offsetof(R, vddio_mem_power));
  out.iod_vddio_mem_w = F(offsetof(R, iod_vddio_mem_power));
  out.ddr_vddp_w      = F(offsetof(R, ddr_vddp_power));
  out.ddr_phy_w       = F(offsetof(R, ddr_phy_power));
  out.vdd18_w         = F(offsetof(R, vdd18_power));
  out.io_display_w    = F(offsetof(R, io_display_power));
  out.io_usb_w        = F(offsetof(R, io_usb_power));
  out.socket_w        = F(offsetof(R, socket_power));
  out.package_w       = F(offsetof(R, package_power));
  out.vddcr_cpu_w     = F(offsetof(R, vddcr_cpu_power));
  out.soc_telemetry_v = F(offsetof(R, soc_telemetry_voltage));
  out.soc_telemetry_a = F(offsetof(R, soc_telemetry_current));
  out.soc_telemetry_w = F(offsetof(R, soc_telemetry_power));
  out.cpu_telemetry_v = F(offsetof(R, cpu_telemetry_voltage));
  out.cpu_telemetry_a = F(offsetof(R, cpu_telemetry_current));
  out.cpu_telemetry_w = F(offsetof(R, cpu_telemetry_power));
  return true;
}

bool decode_graphics(std::span<const std::byte> b, model::Graphics& out) {
  using R = abi::graphics_data_t;
  if (b.size() < sizeof(R)) return false;
  auto F = [&](size_t off) -> double { return f32_at(b, off); };
  out.voltage_v            = F(offsetof(R, gfx_voltage));
  out.roc_power_w          = F(offsetof(R, roc_power));
  out.temp_c               = F(offsetof(R, gfx_temp));
  out.freq_mhz             = F(offsetof(R, gfx_freq));
  out.freq_eff_mhz         = F(offsetof(R, gfx_freq_eff));
  out.busy_pct             = F(offsetof(R, gfx_busy));
  out.edc_limit            = F(offsetof(R, gfx_edc_lim));
  out.edc_residency_pct    = F(offsetof(R, gfx_edc_residency));
  out.display_count        = F(offsetof(R, display_count));
  out.fps                  = F(offsetof(R, fps));
  out.dgpu_power_w         = F(offsetof(R, dgpu_power));
  out.dgpu_freq_target_mhz = F(offsetof(R, dgpu_freq_target));
  out.dgpu_busy_pct        = F(offsetof(R, dgpu_gfx_busy));
  return true;
}

bool decode_stats(std::span<const std::byte> b, model::DerivedStats& out) {
  using R = abi::calculated_stats_t;
  if (b.size() < sizeof(R)) return false;
  out.peak_core_freq_mhz      = f32_at(b, offsetof(R, peak_core_frequency));
  out.peak_core_temp_c        = f32_at(b, offsetof(R, peak_core_temp));
  out.peak_core_voltage_v     = f32_at(b, offsetof(R, peak_core_voltage));
  out.avg_core_voltage_v      = f32_at(b, offsetof(R, avg_core_voltage));
  out.avg_core_cc6_pct        = f32_at(b, offsetof(R, avg_core_cc6));
  out.total_core_power_w      = f32_at(b, offsetof(R, total_core_power));
  out.peak_core_voltage_smu_v = f32_at(b, offsetof(R, peak_core_voltage_smu));
  out.package_cc6_pct         = f32_at(b, offsetof(R, package_cc6));
  return true;
}

} // namespace zenmon::binding
