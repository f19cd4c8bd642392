#include "collectors/RyzenLibSource.hpp"
#include <limits>
#include <utility>
#include "binding/AbiDecoder.hpp"

namespace zenmon::collectors {

using zenmon::binding::record_bytes;

RyzenLibSource::RyzenLibSource(std::vector<std::string> candidates)
  : candidates_(std::move(candidates)) {}

bool RyzenLibSource::open(std::string& err) {
  if (lib_.load(candidates_)) return true;
  err = lib_.error();
  return false;
}

int RyzenLibSource::init() { return lib_.loaded() ? lib_.init() : -1; }

void RyzenLibSource::cleanup() {
  if (lib_.loaded()) lib_.cleanup();
}

int RyzenLibSource::get_system_info(zenmon::model::SystemInfo& out) {
  if (!lib_.loaded()) return -1;
  abi::system_data_t sys{};
  int rc = lib_.get_system_info(&sys);
  if (rc != 0) return rc;
  return zenmon::binding::decode_system_info(record_bytes(sys), out) ? 0 : -1;
}

int RyzenLibSource::read_data(int max_cores, zenmon::model::Telemetry& out) {
  if (!lib_.loaded() || max_cores <= 0) return -1;
  if (core_buf_.size() != static_cast<size_t>(max_cores)) core_buf_.assign(static_cast<size_t>(max_cores), abi::core_data_t{});

  abi::constraints_data_t constraints{};
  abi::memory_data_t memory{};
  abi::power_data_t power{};
  abi::calculated_stats_t stats{};
  // Only written when the part has an iGPU; untouched fields read as unavailable.
  constexpr float nan = std::numeric_limits<float>::quiet_NaN();
  abi::graphics_data_t graphics{nan, nan, nan, nan, nan, nan, nan, nan, nan, nan, nan, nan, nan};

  int n = lib_.read_data(core_buf_.data(), max_cores, &constraints, &memory,
                         &power, &graphics, &stats);
  if (n <= 0) return n;
  if (n > max_cores) n = max_cores;

  zenmon::model::Telemetry t;
  if (!zenmon::binding::decode_cores(record_bytes(core_buf_), n, t.cores)) return -1;
  if (!zenmon::binding::decode_constraints(record_bytes(constraints), t.constraints)) return -1;
  if (!zenmon::binding::decode_memory(record_bytes(memory), t.memory)) return -1;
  if (!zenmon::binding::decode_power(record_bytes(power), t.power)) return -1;
  if (!zenmon::binding::decode_graphics(record_bytes(graphics), t.graphics)) return -1;
  if (!zenmon::binding::decode_stats(record_bytes(stats), t.stats)) return -1;
  out = std::move(t);
  return n;
}

const char* RyzenLibSource::name() const {
  return lib_.loaded() ? lib_.path().c_str() : abi::kLibrarySoname;
}

} // namespace zenmon::collectors
