#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>
#include <stop_token>
#include "app/SnapshotBuffers.hpp"
#include "app/TelemetryReader.hpp"

namespace zenmon::app {

inline constexpr int kDefaultIntervalMs = 2000;
inline constexpr int kMinIntervalMs = 250;
inline constexpr int kMaxIntervalMs = 60000;
inline constexpr int kDefaultMaxCores = 32;
inline constexpr int kMinMaxCores = 1;
inline constexpr int kMaxMaxCores = 256;

int clamp_interval_ms(int ms);
int clamp_max_cores(int n);

// Result of one read. On failure `telemetry` is a copy of the previous value.
struct PollOutcome {
  bool ok{false};
  zenmon::model::Telemetry telemetry;
  ReaderError error{ReaderError::None};
  std::string message;
};

// One synchronous poll; no scheduling.
PollOutcome poll_once(TelemetryReader& reader, int max_cores,
                      const zenmon::model::Telemetry& previous);

struct ProducerOptions {
  int interval_ms{kDefaultIntervalMs};
  int max_cores{kDefaultMaxCores};
};

// Polls the reader on a background thread and publishes into SnapshotBuffers.
// The producer is the only caller of the reader while running.
class Producer {
public:
  Producer(TelemetryReader& reader, SnapshotBuffers& buffers,
           zenmon::model::SystemInfo system, ProducerOptions opts);
  void start();
  void stop();
  ~Producer();

  // Poll once and publish. Returns the poll result. Safe to call directly
  // when the thread is not running (tests, --once).
  bool run_cycle();

  void set_interval_ms(int ms) { interval_ms_.store(clamp_interval_ms(ms), std::memory_order_relaxed); }
  int interval_ms() const { return interval_ms_.load(std::memory_order_relaxed); }

private:
  void run(std::stop_token st);

  TelemetryReader& reader_;
  SnapshotBuffers& buffers_;
  zenmon::model::SystemInfo system_;
  int max_cores_;
  std::atomic<int> interval_ms_;
  zenmon::model::Telemetry last_good_{};
  uint64_t ok_polls_{0};
  uint64_t failed_polls_{0};
  std::jthread thread_{};
};

} // namespace zenmon::app
