#include "minitest.hpp"
#include "app/LogWriter.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <thread>
#include <chrono>
#include <string>
#include <unistd.h>

static std::filesystem::path test_dir(const char* suffix) {
  return std::filesystem::temp_directory_path() /
         ("zenmon_logwriter_test_" + std::to_string(::getpid()) + "_" + suffix);
}

static int count_prom_files(const std::filesystem::path& dir) {
  int n = 0;
  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    if (entry.path().extension() == ".prom") ++n;
  }
  return n;
}

static int count_timestamps(const std::filesystem::path& dir) {
  int n = 0;
  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    std::ifstream f(entry.path());
    std::string line;
    while (std::getline(f, line)) {
      if (line.rfind("# zenmon_scrape_timestamp_ms ", 0) == 0) ++n;
    }
  }
  return n;
}

TEST(logwriter_creates_directory) {
  auto dir = test_dir("mkdir");
  std::filesystem::remove_all(dir);
  ASSERT_TRUE(!std::filesystem::exists(dir));

  zenmon::app::SnapshotBuffers buffers;
  zenmon::app::LogWriter writer(buffers, dir);
  ASSERT_TRUE(writer.ok());
  ASSERT_TRUE(std::filesystem::is_directory(dir));

  std::filesystem::remove_all(dir);
}

TEST(logwriter_waits_for_first_publish) {
  auto dir = test_dir("idle");
  std::filesystem::remove_all(dir);
  zenmon::app::SnapshotBuffers buffers;
  zenmon::app::LogWriter writer(buffers, dir, std::chrono::milliseconds(10));
  writer.start();
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  writer.stop();
  ASSERT_EQ(count_prom_files(dir), 0);
  std::filesystem::remove_all(dir);
}

TEST(logwriter_writes_one_block_per_publish) {
  auto dir = test_dir("write");
  std::filesystem::remove_all(dir);

  zenmon::app::SnapshotBuffers buffers;
  zenmon::app::LogWriter writer(buffers, dir, std::chrono::milliseconds(10));
  writer.start();

  buffers.back().system.cpu_name = "Fake CPU";
  buffers.publish();
  std::this_thread::sleep_for(std::chrono::milliseconds(150));
  buffers.publish();
  std::this_thread::sleep_for(std::chrono::milliseconds(150));
  writer.stop();

  ASSERT_EQ(count_prom_files(dir), 1);
  ASSERT_EQ(count_timestamps(dir), 2);

  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    auto name = entry.path().filename().string();
    ASSERT_TRUE(name.rfind("zenmon_", 0) == 0);
    ASSERT_EQ(name.size(), std::string("zenmon_YYYY-MM-DD_HH.prom").size());
    std::ifstream f(entry.path());
    std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    ASSERT_TRUE(content.find("zenmon_snapshot_seq 2") != std::string::npos);
    ASSERT_TRUE(content.find("name=\"Fake CPU\"") != std::string::npos);
  }
  std::filesystem::remove_all(dir);
}
