#pragma once
#include <string>
#include "model/Telemetry.hpp"

namespace zenmon::collectors {

// Seam between the reader and whatever produces telemetry records: the
// dlopen'ed vendor library in production, a fake in tests.
class ITelemetrySource {
public:
  virtual ~ITelemetrySource() = default;

  // Locate and bind the backend. Return false (with err filled) if unavailable.
  [[nodiscard]] virtual bool open(std::string& err) = 0;

  // Backend init routine; 0 on success, backend-specific code otherwise.
  [[nodiscard]] virtual int init() = 0;

  // Release the hardware channel taken by init().
  virtual void cleanup() = 0;

  // 0 on success.
  [[nodiscard]] virtual int get_system_info(zenmon::model::SystemInfo& out) = 0;

  // Fill up to max_cores core readings plus the aggregate records.
  // Returns the populated core count; <= 0 on failure.
  [[nodiscard]] virtual int read_data(int max_cores, zenmon::model::Telemetry& out) = 0;

  // Human-friendly name for diagnostics (library path for the real source)
  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace zenmon::collectors
