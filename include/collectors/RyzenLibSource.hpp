#pragma once
#include <string>
#include <vector>
#include "collectors/ITelemetrySource.hpp"
#include "util/RyzenDyn.hpp"

namespace zenmon::collectors {

// Telemetry source backed by libryzen_monitor.so.
class RyzenLibSource final : public ITelemetrySource {
public:
  explicit RyzenLibSource(std::vector<std::string> candidates);

  bool open(std::string& err) override;
  int init() override;
  void cleanup() override;
  int get_system_info(zenmon::model::SystemInfo& out) override;
  int read_data(int max_cores, zenmon::model::Telemetry& out) override;
  const char* name() const override;

private:
  std::vector<std::string> candidates_;
  zenmon::util::RyzenDyn lib_;
  std::vector<abi::core_data_t> core_buf_;
};

} // namespace zenmon::collectors
