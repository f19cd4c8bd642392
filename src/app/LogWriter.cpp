#include "app/LogWriter.hpp"
#include "app/Metrics.hpp"
#include <cstdio>
#include <cstring>
#include <ctime>
#include <charconv>
#include <cerrno>

namespace zenmon::app {

LogWriter::LogWriter(const SnapshotBuffers& buffers, std::filesystem::path log_dir,
                     std::chrono::milliseconds check_interval)
    : buffers_(buffers), log_dir_(std::move(log_dir)), check_interval_(check_interval) {
  std::error_code ec;
  std::filesystem::create_directories(log_dir_, ec);
  if (ec) {
    ok_ = false;
    std::fprintf(stderr, "zenmon: LogWriter: failed to create %s: %s\n",
                 log_dir_.c_str(), ec.message().c_str());
  }
}

LogWriter::~LogWriter() { stop(); }

void LogWriter::start() {
  if (thread_.joinable()) return;
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void LogWriter::stop() {
  if (thread_.joinable()) {
    thread_.request_stop();
    thread_.join();
  }
}

void LogWriter::run(std::stop_token st) {
  std::ofstream file;
  std::filesystem::path current_path;
  uint64_t last_seq = 0;

  while (!st.stop_requested()) {
    // Nothing published since the last block (or nothing at all yet)
    uint64_t seq = buffers_.seq();
    if (seq == last_seq) {
      std::this_thread::sleep_for(check_interval_);
      continue;
    }

    auto now = std::chrono::system_clock::now();
    auto required_path = chunk_path();

    // Rotate on hour boundary
    if (required_path != current_path) {
      if (file.is_open()) {
        file.flush();
        file.close();
      }
      file.open(required_path, std::ios::app);
      if (!file) {
        std::fprintf(stderr, "zenmon: LogWriter: failed to open %s: %s\n",
                     required_path.c_str(), std::strerror(errno));
        current_path.clear();
        std::this_thread::sleep_for(std::chrono::seconds(1));
        continue;
      }
      current_path = required_path;
    }

    auto snap = buffers_.front();
    last_seq = snap->seq;

    auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count();
    char ts_buf[32];
    auto [ptr, ec] = std::to_chars(ts_buf, ts_buf + sizeof(ts_buf), epoch_ms);

    static constexpr char kTsPrefix[] = "# zenmon_scrape_timestamp_ms ";
    file.write(kTsPrefix, sizeof(kTsPrefix) - 1);
    file.write(ts_buf, ptr - ts_buf);
    file.put('\n');

    std::string body = snapshot_to_prometheus(*snap);
    file.write(body.data(), static_cast<std::streamsize>(body.size()));

    file.flush();
  }

  if (file.is_open()) {
    file.flush();
    file.close();
  }
}

std::filesystem::path LogWriter::chunk_path() const {
  auto now = std::chrono::system_clock::now();
  auto now_t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  ::localtime_r(&now_t, &tm);

  char buf[64];
  std::snprintf(buf, sizeof(buf), "zenmon_%04d-%02d-%02d_%02d.prom",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour);

  return log_dir_ / buf;
}

} // namespace zenmon::app
