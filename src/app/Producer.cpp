#include "app/Producer.hpp"
#include <algorithm>
#include <utility>

using namespace std::chrono;

namespace zenmon::app {

int clamp_interval_ms(int ms) { return std::clamp(ms, kMinIntervalMs, kMaxIntervalMs); }
int clamp_max_cores(int n) { return std::clamp(n, kMinMaxCores, kMaxMaxCores); }

PollOutcome poll_once(TelemetryReader& reader, int max_cores,
                      const zenmon::model::Telemetry& previous) {
  PollOutcome out;
  out.telemetry = previous;
  if (reader.poll_snapshot(max_cores, out.telemetry)) {
    out.ok = true;
    return out;
  }
  out.error = reader.last_error();
  out.message = reader.last_error_message();
  return out;
}

Producer::Producer(TelemetryReader& reader, SnapshotBuffers& buffers,
                   zenmon::model::SystemInfo system, ProducerOptions opts)
  : reader_(reader), buffers_(buffers), system_(std::move(system)),
    max_cores_(clamp_max_cores(opts.max_cores)),
    interval_ms_(clamp_interval_ms(opts.interval_ms)) {}

void Producer::start() {
  if (thread_.joinable()) return;
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void Producer::stop() {
  if (!thread_.joinable()) return;
  thread_.request_stop();
  thread_.join();
}

Producer::~Producer() { stop(); }

bool Producer::run_cycle() {
  auto outcome = poll_once(reader_, max_cores_, last_good_);
  auto& s = buffers_.back();
  if (outcome.ok) {
    last_good_ = std::move(outcome.telemetry);
    ++ok_polls_;
    s.status.has_data = true;
    s.status.last_error.clear();
  } else {
    ++failed_polls_;
    s.status.last_error = outcome.message;
  }
  // Failed polls republish the retained telemetry with updated counters.
  s.system = system_;
  s.telemetry = last_good_;
  s.status.ok_polls = ok_polls_;
  s.status.failed_polls = failed_polls_;
  s.status.interval_ms = interval_ms();
  s.status.max_cores = max_cores_;
  s.status.source = reader_.source_name();
  buffers_.publish();
  return outcome.ok;
}

void Producer::run(std::stop_token st) {
  auto next_poll = steady_clock::now();
  while (!st.stop_requested()) {
    auto now = steady_clock::now();
    if (now >= next_poll) {
      (void)run_cycle();
      next_poll = steady_clock::now() + milliseconds(interval_ms());
    }
    // sleep until next_poll, bounded so stop and interval changes are noticed
    auto sleep_for = duration_cast<milliseconds>(next_poll - steady_clock::now());
    if (sleep_for < 20ms) {
      sleep_for = 20ms;
    }
    if (sleep_for > 100ms) {
      sleep_for = 100ms;
    }
    std::this_thread::sleep_for(sleep_for);
  }
}

} // namespace zenmon::app
