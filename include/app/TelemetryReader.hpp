#pragma once
#include <memory>
#include <string>
#include "collectors/ITelemetrySource.hpp"
#include "model/Telemetry.hpp"

namespace zenmon::app {

enum class ReaderState { Uninitialized, Initialized, TornDown };

enum class ReaderError {
  None,
  LibraryLoad,     // shared object missing, unloadable or lacking a symbol (fatal)
  Init,            // library init routine refused (fatal)
  Read,            // one poll failed; skip this refresh
  NotInitialized,  // call outside the Initialized state
};

const char* to_string(ReaderState s);
const char* to_string(ReaderError e);

// Owns the telemetry source and the hardware channel it opens.
// Uninitialized -> Initialized -> TornDown; teardown is terminal.
class TelemetryReader {
public:
  explicit TelemetryReader(std::unique_ptr<zenmon::collectors::ITelemetrySource> source);
  ~TelemetryReader();
  TelemetryReader(const TelemetryReader&) = delete;
  TelemetryReader& operator=(const TelemetryReader&) = delete;

  [[nodiscard]] bool initialize();
  [[nodiscard]] bool get_system_info(zenmon::model::SystemInfo& out);

  // On failure `out` is left untouched so the caller keeps its last snapshot.
  [[nodiscard]] bool poll_snapshot(int max_cores, zenmon::model::Telemetry& out);

  // Releases the hardware channel; library cleanup runs at most once.
  void teardown();

  ReaderState state() const { return state_; }
  ReaderError last_error() const { return last_error_; }
  const std::string& last_error_message() const { return last_msg_; }
  const char* source_name() const { return source_ ? source_->name() : ""; }

private:
  bool fail(ReaderError e, std::string msg);

  std::unique_ptr<zenmon::collectors::ITelemetrySource> source_;
  ReaderState state_{ReaderState::Uninitialized};
  ReaderError last_error_{ReaderError::None};
  std::string last_msg_;
};

} // namespace zenmon::app
