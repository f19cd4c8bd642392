#include "minitest.hpp"
#include "binding/AbiDecoder.hpp"
#include <cmath>
#include <cstring>
#include <limits>
#include <vector>

using namespace zenmon;
using binding::record_bytes;

TEST(abi_decode_cores_reads_fields_and_flags) {
  std::vector<abi::core_data_t> recs(3);
  for (int i = 0; i < 3; ++i) {
    recs[i] = abi::core_data_t{i, 3600.5f + i, 2.25f, 1.1f, 48.0f, 12.5f, 7.5f, 80.0f, 0, 0};
  }
  recs[1].disabled = 1;
  recs[2].sleeping = 7;  // any non-zero int is true
  std::vector<model::CoreReading> out;
  ASSERT_TRUE(binding::decode_cores(record_bytes(recs), 3, out));
  ASSERT_EQ(out.size(), 3u);
  ASSERT_EQ(out[2].index, 2);
  ASSERT_NEAR(out[0].frequency_mhz, 3600.5, 1e-3);
  ASSERT_NEAR(out[0].power_w, 2.25, 1e-6);
  ASSERT_NEAR(out[0].cc6_pct, 80.0, 1e-6);
  ASSERT_TRUE(!out[0].disabled && !out[0].sleeping);
  ASSERT_TRUE(out[1].disabled);
  ASSERT_TRUE(out[2].sleeping);
}

TEST(abi_decode_cores_rejects_short_buffer) {
  std::vector<abi::core_data_t> recs(2);
  std::vector<model::CoreReading> out(5);
  ASSERT_TRUE(!binding::decode_cores(record_bytes(recs), 3, out));
  ASSERT_EQ(out.size(), 5u);
  ASSERT_TRUE(!binding::decode_cores(record_bytes(recs), -1, out));
}

TEST(abi_decode_records_reject_truncated_bytes) {
  abi::constraints_data_t k{};
  model::Constraints c;
  c.ppt_value = 1.0;
  auto bytes = record_bytes(k);
  ASSERT_TRUE(!binding::decode_constraints(bytes.first(bytes.size() - 1), c));
  ASSERT_NEAR(c.ppt_value, 1.0, 1e-9);

  abi::memory_data_t m{};
  model::MemoryInterface mem;
  ASSERT_TRUE(!binding::decode_memory(record_bytes(m).first(sizeof(m) - 4), mem));
  abi::calculated_stats_t st{};
  model::DerivedStats stats;
  ASSERT_TRUE(!binding::decode_stats(record_bytes(st).first(0), stats));
}

TEST(abi_decode_constraints_keeps_nan) {
  abi::constraints_data_t k{};
  k.ppt_value = 45.2f;
  k.ppt_limit = 0.0f;
  k.fit_limit = std::numeric_limits<float>::quiet_NaN();
  model::Constraints c;
  ASSERT_TRUE(binding::decode_constraints(record_bytes(k), c));
  ASSERT_NEAR(c.ppt_value, 45.2, 1e-4);
  ASSERT_EQ(c.ppt_limit, 0.0);
  ASSERT_TRUE(std::isnan(c.fit_limit));
}

TEST(abi_decode_system_info_text_and_ints) {
  abi::system_data_t sys{};
  std::strcpy(sys.cpu_name, "AMD Ryzen 9 7950X");
  std::strcpy(sys.codename, "Raphael");
  std::memset(sys.smu_fw_ver, 'x', sizeof(sys.smu_fw_ver));  // no terminator
  sys.cores = 16;
  sys.ccds = 2;
  sys.if_ver = 13;
  sys.enabled_cores_count = 16;
  model::SystemInfo info;
  ASSERT_TRUE(binding::decode_system_info(record_bytes(sys), info));
  ASSERT_EQ(info.cpu_name, "AMD Ryzen 9 7950X");
  ASSERT_EQ(info.codename, "Raphael");
  ASSERT_EQ(info.smu_fw_version.size(), sizeof(sys.smu_fw_ver));
  ASSERT_EQ(info.cores, 16);
  ASSERT_EQ(info.ccds, 2);
  ASSERT_EQ(info.if_version, 13);
  ASSERT_EQ(info.enabled_cores, 16);
}

TEST(abi_decode_memory_coupled_flag) {
  abi::memory_data_t m{};
  m.fclk_freq = 2000.0f;
  m.coupled_mode = 1;
  model::MemoryInterface mem;
  ASSERT_TRUE(binding::decode_memory(record_bytes(m), mem));
  ASSERT_NEAR(mem.fclk_mhz, 2000.0, 1e-6);
  ASSERT_TRUE(mem.coupled_mode);
}

TEST(abi_decode_text_stops_at_nul) {
  const char raw[] = {'Z', 'e', 'n', '\0', 'j', 'u', 'n', 'k'};
  auto field = std::as_bytes(std::span<const char>(raw, sizeof(raw)));
  ASSERT_EQ(binding::decode_text(field), "Zen");
  ASSERT_EQ(binding::decode_text(field.first(0)), "");
}
