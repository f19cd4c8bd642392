#pragma once
#include <deque>
#include <memory>
#include <string>
#include <utility>
#include "collectors/ITelemetrySource.hpp"

namespace zenmon::test {

// Shared with the test body; the reader owns the source itself.
struct FakeState {
  bool open_ok{true};
  int init_rc{0};
  int sysinfo_rc{0};
  std::deque<int> read_results;   // per-call core counts; empty: cores.size()
  model::Telemetry next;          // copied out on each successful read
  int init_calls{0};
  int cleanup_calls{0};
  int read_calls{0};
};

class FakeTelemetrySource final : public zenmon::collectors::ITelemetrySource {
public:
  explicit FakeTelemetrySource(std::shared_ptr<FakeState> st) : st_(std::move(st)) {}

  bool open(std::string& err) override {
    if (!st_->open_ok) err = "fake: not available";
    return st_->open_ok;
  }
  int init() override { ++st_->init_calls; return st_->init_rc; }
  void cleanup() override { ++st_->cleanup_calls; }
  int get_system_info(model::SystemInfo& out) override {
    if (st_->sysinfo_rc != 0) return st_->sysinfo_rc;
    out.cpu_name = "Fake CPU";
    out.codename = "Fake";
    out.cores = static_cast<int>(st_->next.cores.size());
    return 0;
  }
  int read_data(int max_cores, model::Telemetry& out) override {
    ++st_->read_calls;
    int n = static_cast<int>(st_->next.cores.size());
    if (!st_->read_results.empty()) {
      n = st_->read_results.front();
      st_->read_results.pop_front();
    }
    if (n <= 0) return n;
    if (n > max_cores) n = max_cores;
    out = st_->next;
    return n;
  }
  const char* name() const override { return "fake"; }

private:
  std::shared_ptr<FakeState> st_;
};

// Telemetry with `n` enabled cores at 4000 + 100*i MHz.
inline model::Telemetry make_telemetry(int n) {
  model::Telemetry t;
  for (int i = 0; i < n; ++i) {
    model::CoreReading c;
    c.index = i;
    c.frequency_mhz = 4000.0 + 100.0 * i;
    c.power_w = 2.0;
    c.voltage_v = 1.2;
    c.temp_c = 50.0;
    c.c0_pct = 30.0;
    c.cc1_pct = 20.0;
    c.cc6_pct = 50.0;
    t.cores.push_back(c);
  }
  t.constraints.ppt_value = 60.0;
  t.constraints.ppt_limit = 120.0;
  return t;
}

} // namespace zenmon::test
