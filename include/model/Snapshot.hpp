#pragma once
#include <cstdint>
#include <string>
#include "model/Telemetry.hpp"

namespace zenmon::model {

// Poll bookkeeping shown on the status line.
struct PollStatus {
  bool has_data{false};        // at least one successful poll so far
  uint64_t ok_polls{0};
  uint64_t failed_polls{0};
  std::string last_error;      // empty after a successful poll
  int interval_ms{0};
  int max_cores{0};
  std::string source;          // e.g. "/usr/local/lib/libryzen_monitor.so"
};

struct Snapshot {
  uint64_t seq{};
  SystemInfo system;
  Telemetry telemetry;
  PollStatus status;
};

} // namespace zenmon::model
