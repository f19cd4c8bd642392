#include "app/TelemetryReader.hpp"
#include <utility>

namespace zenmon::app {

const char* to_string(ReaderState s) {
  switch (s) {
    case ReaderState::Uninitialized: return "uninitialized";
    case ReaderState::Initialized:   return "initialized";
    case ReaderState::TornDown:      return "torn down";
  }
  return "?";
}

const char* to_string(ReaderError e) {
  switch (e) {
    case ReaderError::None:           return "none";
    case ReaderError::LibraryLoad:    return "library load error";
    case ReaderError::Init:           return "init error";
    case ReaderError::Read:           return "read error";
    case ReaderError::NotInitialized: return "not initialized";
  }
  return "?";
}

TelemetryReader::TelemetryReader(std::unique_ptr<zenmon::collectors::ITelemetrySource> source)
  : source_(std::move(source)) {}

TelemetryReader::~TelemetryReader() { teardown(); }

bool TelemetryReader::fail(ReaderError e, std::string msg) {
  last_error_ = e;
  last_msg_ = std::move(msg);
  return false;
}

bool TelemetryReader::initialize() {
  if (state_ == ReaderState::Initialized) return true;
  if (state_ == ReaderState::TornDown) return fail(ReaderError::NotInitialized, "reader already torn down");
  if (!source_) return fail(ReaderError::LibraryLoad, "no telemetry source");

  std::string err;
  if (!source_->open(err)) {
    return fail(ReaderError::LibraryLoad, "cannot load " + std::string(source_->name()) + ": " + err);
  }
  int rc = source_->init();
  if (rc != 0) {
    switch (rc) {
      case -1: return fail(ReaderError::Init, "failed to initialize SMU (are you running as root?)");
      case -2: return fail(ReaderError::Init, "PM tables not supported on this CPU");
      default: return fail(ReaderError::Init, "library init failed (code " + std::to_string(rc) + ")");
    }
  }
  state_ = ReaderState::Initialized;
  last_error_ = ReaderError::None;
  last_msg_.clear();
  return true;
}

bool TelemetryReader::get_system_info(zenmon::model::SystemInfo& out) {
  if (state_ != ReaderState::Initialized) return fail(ReaderError::NotInitialized, "system info requested before initialize");
  zenmon::model::SystemInfo info;
  int rc = source_->get_system_info(info);
  if (rc != 0) return fail(ReaderError::Read, "get_system_info failed (code " + std::to_string(rc) + ")");
  out = std::move(info);
  return true;
}

bool TelemetryReader::poll_snapshot(int max_cores, zenmon::model::Telemetry& out) {
  if (state_ != ReaderState::Initialized) return fail(ReaderError::NotInitialized, "poll before initialize");
  if (max_cores <= 0) return fail(ReaderError::Read, "core buffer size must be positive");
  zenmon::model::Telemetry t;
  int n = source_->read_data(max_cores, t);
  if (n <= 0) return fail(ReaderError::Read, "read_data returned " + std::to_string(n));
  if (t.cores.size() > static_cast<size_t>(n)) t.cores.resize(static_cast<size_t>(n));
  out = std::move(t);
  last_error_ = ReaderError::None;
  last_msg_.clear();
  return true;
}

void TelemetryReader::teardown() {
  if (state_ == ReaderState::Initialized && source_) source_->cleanup();
  state_ = ReaderState::TornDown;
}

} // namespace zenmon::app
