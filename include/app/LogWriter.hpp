#pragma once

#include <filesystem>
#include <fstream>
#include <thread>
#include <stop_token>
#include <chrono>
#include "app/SnapshotBuffers.hpp"

namespace zenmon::app {

// Appends one Prometheus text block per published snapshot to hourly
// zenmon_YYYY-MM-DD_HH.prom files under log_dir.
class LogWriter {
public:
  LogWriter(const SnapshotBuffers& buffers, std::filesystem::path log_dir,
            std::chrono::milliseconds check_interval = std::chrono::milliseconds(100));
  ~LogWriter();
  LogWriter(const LogWriter&) = delete;
  LogWriter& operator=(const LogWriter&) = delete;

  void start();
  void stop();

  [[nodiscard]] bool ok() const { return ok_; }

private:
  void run(std::stop_token st);
  [[nodiscard]] std::filesystem::path chunk_path() const;

  const SnapshotBuffers& buffers_;
  std::filesystem::path log_dir_;
  std::chrono::milliseconds check_interval_;
  bool ok_{true};
  std::jthread thread_;
};

} // namespace zenmon::app
