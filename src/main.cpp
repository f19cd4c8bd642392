#include "app/Cli.hpp"
#include "app/LogWriter.hpp"
#include "app/Privilege.hpp"
#include "app/Producer.hpp"
#include "app/SnapshotBuffers.hpp"
#include "app/TelemetryReader.hpp"
#include "collectors/RyzenLibSource.hpp"
#include "ui/Config.hpp"
#include "ui/Input.hpp"
#include "ui/Renderer.hpp"
#include "ui/Terminal.hpp"
#include "util/RyzenDyn.hpp"

#include <chrono>
#include <climits>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

using namespace zenmon;

int main(int argc, char** argv) {
  std::signal(SIGINT, ui::on_sigint);
  std::signal(SIGTERM, ui::on_sigint);

  app::CliOptions cli;
  {
    std::vector<std::string> args(argv + 1, argv + argc);
    std::string err;
    if (!app::parse_cli(args, cli, err)) {
      std::fprintf(stderr, "zenmon: %s\n%s", err.c_str(), app::usage_text());
      return 2;
    }
  }
  if (cli.help) {
    std::fputs(app::usage_text(), stdout);
    return 0;
  }

  // CLI > TOML > env > default
  ui::Config cfg = ui::config();
  if (cli.lib_path) cfg.library.path = *cli.lib_path;
  if (cli.interval_ms) cfg.poll.interval_ms = *cli.interval_ms;
  if (cli.max_cores) cfg.library.max_cores = *cli.max_cores;
  if (cli.log_dir) cfg.log.dir = *cli.log_dir;
  cfg.poll.interval_ms = app::clamp_interval_ms(cfg.poll.interval_ms);
  cfg.library.max_cores = app::clamp_max_cores(cfg.library.max_cores);

  if (!app::running_as_root()) {
    std::fprintf(stderr, "zenmon: %s\n", app::privilege_warning());
  }

  auto candidates = util::library_candidates(cfg.library.path, util::executable_dir());
  app::TelemetryReader reader(std::make_unique<collectors::RyzenLibSource>(std::move(candidates)));
  if (!reader.initialize()) {
    std::fprintf(stderr, "zenmon: %s: %s\n", app::to_string(reader.last_error()),
                 reader.last_error_message().c_str());
    return 1;
  }

  model::SystemInfo sys;
  if (!reader.get_system_info(sys)) {
    std::fprintf(stderr, "zenmon: %s\n", reader.last_error_message().c_str());
  }

  app::SnapshotBuffers buffers;
  app::Producer producer(reader, buffers, sys,
                         app::ProducerOptions{cfg.poll.interval_ms, cfg.library.max_cores});

  if (cli.once) {
    bool ok = producer.run_cycle();
    auto snap = buffers.front();
    if (!ok) {
      std::fprintf(stderr, "zenmon: %s\n", snap->status.last_error.c_str());
      reader.teardown();
      return 1;
    }
    std::fputs(ui::render_report(*snap).c_str(), stdout);
    reader.teardown();
    return 0;
  }

  std::unique_ptr<app::LogWriter> log;
  if (!cfg.log.dir.empty()) {
    log = std::make_unique<app::LogWriter>(buffers, cfg.log.dir);
    if (log->ok()) {
      std::fprintf(stderr, "zenmon: logging snapshots to %s/\n", cfg.log.dir.c_str());
      log->start();
    } else {
      log.reset();
    }
  }

  producer.start();

  // Wait briefly for the first publish to avoid an empty first frame
  {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(500);
    while (buffers.seq() == 0 && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
  }

  {
    bool use_alt = cfg.ui.alt_screen && ui::tty_stdout();
    ui::RawTermGuard raw{}; ui::CursorGuard curs{}; ui::AltScreenGuard alt{use_alt};
    std::atexit(&ui::on_atexit_restore);
    if (use_alt) ui::best_effort_write(STDOUT_FILENO, "\x1B[2J\x1B[H", 7);

    int iterations = cli.iterations > 0 ? cli.iterations : INT_MAX;
    for (int i = 0; i < iterations && !ui::g_stop.load(); ++i) {
      if (ui::has_input_available(100)) {
        auto keys = ui::handle_keyboard_input(cfg);
        if (keys.quit) break;
        if (keys.interval_delta_ms != 0) producer.set_interval_ms(producer.interval_ms() + keys.interval_delta_ms);
      }
      auto snap = buffers.front();
      ui::render_screen(*snap);
    }
  }

  producer.stop();
  if (log) log->stop();
  reader.teardown();
  return 0;
}
