/**
 * @file main.cpp
 * @brief Entry point for the clip_mix application
 *
 * @details Main entry point that handles:
 *
 *          - Command-line argument parsing (paths only)
 *
 *          - Settings from environment variables
 *
 *          - SIGINT/SIGTERM cancellation
 *
 *          - Exit codes: 0 at least one output, 1 no output, 2 run-fatal
 */

#include <atomic>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <string>
#include <vector>

#include "clip_mix/command_runner.hpp"
#include "clip_mix/config.hpp"
#include "clip_mix/errors.hpp"
#include "clip_mix/logging.hpp"
#include "clip_mix/media_probe.hpp"
#include "clip_mix/mix_run.hpp"
#include "clip_mix/run_events.hpp"

using namespace clip_mix;

namespace {

std::atomic<bool> cancel_requested{false};

void handle_stop_signal(int) { cancel_requested.store(true); }

void print_usage() {
  LOG_WARN("Usage: ./clip_mix <bgm_file_or_dir> <output> <video_dir> "
           "[video_dir...]");
  LOG_WARN("  <output>: directory, or name.mp4 for name_1.mp4, name_2.mp4, ...");
  LOG_WARN("            '-' uses <first video_dir>_longvideo (_combined for "
           "several)");
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  if (argc < 4) {
    print_usage();
    return 2;
  }

  std::string bgm_arg = argv[1];
  std::string output_arg = argv[2];
  if (output_arg == "-")
    output_arg.clear();
  std::vector<std::string> video_dirs(argv + 3, argv + argc);

  std::signal(SIGINT, handle_stop_signal);
  std::signal(SIGTERM, handle_stop_signal);

  try {
    RunSettings settings =
        RunSettings::from_env(video_dirs, bgm_arg, output_arg);

    LOG_INFO("clip_mix: {} outputs x {} clips", settings.outputs,
             settings.clips_per_output);

    ConsoleReporter console;
    EventLogWriter event_log(
        (std::filesystem::path(settings.output_dir()) / RUN_LOG_NAME).string());
    ObserverList observers;
    observers.add(console);
    observers.add(event_log);

    ProcessCommandRunner runner;
    LibavMediaProber prober;
    MixRun run(settings, runner, prober, observers, &cancel_requested);

    RunSummary summary = run.execute();
    TimingCollector::print_summary();

    if (cancel_requested.load()) {
      LOG_WARN("Run interrupted: {} jobs cancelled", summary.cancelled());
    }
    return summary.exit_code();

  } catch (const Error &e) {
    LOG_ERROR("{}", e.what());
    return 2;
  } catch (const std::exception &e) {
    /// Malformed numeric environment values land here (std::stoi)
    LOG_ERROR("Fatal: {}", e.what());
    return 2;
  }
}
