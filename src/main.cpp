/**
 * @file main.cpp
 * @brief Entry point for the term_reel command-line tool
 *
 * @details Main entry point that handles:
 *
 *          - Command-line argument parsing
 *
 *          - Single recording commands: info, trim, resize, retime,
 *            compress, export, play
 *
 *          - finalize, with a batch directory mode backed by BatchFinalizer
 *
 * @note Logs go to stderr. `play` writes the recording's content to stdout.
 *       Set PARALLEL_JOBS to control batch parallelism.
 */

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

#include "term_reel/batch_finalizer.hpp"
#include "term_reel/config.hpp"
#include "term_reel/dead_time.hpp"
#include "term_reel/logging.hpp"
#include "term_reel/memory_io.hpp"
#include "term_reel/playback.hpp"
#include "term_reel/post_processor.hpp"
#include "term_reel/session.hpp"
#include "term_reel/session_io.hpp"
#include "term_reel/timeline_editor.hpp"

using namespace term_reel;

namespace {

namespace fs = std::filesystem;

void print_usage() {
  LOG_WARN("Usage: term_reel <command> ...");
  LOG_WARN("  info <file>");
  LOG_WARN("  finalize <raw.json|dir> <out.pcr|dir>");
  LOG_WARN("  trim <in> <out> <startMs> [endMs]");
  LOG_WARN("  resize <in> <out> <width> <height>");
  LOG_WARN("  retime <in> <out> <factor>");
  LOG_WARN("  compress <in> <out>");
  LOG_WARN("  export <in> <out>");
  LOG_WARN("  play <file> [speed] [--compress]");
}

int save_or_fail(const std::string &path, const Session &session) {
  if (!save_session_file(path, session)) {
    LOG_ERROR("Failed to write {}", path);
    return 1;
  }
  LOG_SUCCESS("Saved {} ({} frames)", path, session.frames.size());
  return 0;
}

/**
 * @class StdoutRenderer
 * @brief Writes emitted frames straight to the terminal.
 */
class StdoutRenderer : public Renderer {
public:
  void on_frame(const std::string &content, FrameKind) override {
    std::fwrite(content.data(), 1, content.size(), stdout);
    std::fflush(stdout);
  }

  void on_reset() override {
    /// Clear screen, cursor home
    std::fputs("\x1b[2J\x1b[H", stdout);
    std::fflush(stdout);
  }

  void on_rebuild(const std::string &accumulated) override {
    on_reset();
    on_frame(accumulated, FrameKind::Output);
  }
};

// **---- COMMANDS ----**

int cmd_info(const std::string &path) {
  Session session = load_session_file(path);
  SessionSummary summary = summarize(session);

  fmt::print(fg(fmt::color::cyan), "================ RECORDING ================\n");
  fmt::print("{:<20} {:>22}\n", "File:", fs::path(path).filename().string());
  fmt::print("{:<20} {:>22}\n", "Format version:", session.format_version);
  fmt::print("{:<20} {:>20.3f}s\n", "Duration:",
             summary.duration_ms / 1000.0);
  fmt::print("{:<20} {:>22}\n", "Frames:", summary.frame_count);
  fmt::print("{:<20} {:>22}\n", "  input:", summary.input_frames);
  fmt::print("{:<20} {:>22}\n", "  output:", summary.output_frames);
  fmt::print("{:<20} {:>22}\n", "Commands:", summary.command_count);
  fmt::print("{:<20} {:>22}\n", "Dimensions:",
             fmt::format("{}x{}", summary.dimensions.width,
                         summary.dimensions.height));
  if (session.terminal_info.name)
    fmt::print("{:<20} {:>22}\n", "Terminal:", *session.terminal_info.name);
  if (session.terminal_info.cwd)
    fmt::print("{:<20} {:>22}\n", "Directory:", *session.terminal_info.cwd);
  fmt::print(fg(fmt::color::cyan), "===========================================\n");
  return 0;
}

int cmd_finalize(const std::string &input_arg, const std::string &output_arg) {
  if (fs::is_directory(input_arg)) {
    // **---- BATCH MODE - Parallel finalization ----**

    if (!fs::exists(output_arg)) {
      fs::create_directories(output_arg);
    }

    LOG_INFO("term_reel finalize - Batch Mode");
    LOG_INFO("Input directory: {}", input_arg);
    LOG_INFO("Output directory: {}", output_arg);

    /// Collect raw captures
    std::vector<std::string> files;
    for (const auto &entry : fs::directory_iterator(input_arg)) {
      if (entry.is_regular_file() && entry.path().extension() == ".json") {
        files.push_back(entry.path().string());
      }
    }
    std::sort(files.begin(), files.end());

    if (files.empty()) {
      LOG_WARN("No raw captures found in directory");
      return 0;
    }

    LOG_INFO("Found {} raw captures", files.size());

    BatchFinalizer finalizer(Config::parallel_jobs()); // 0 = auto-detect
    return finalizer.process(files, output_arg) == 0 ? 0 : 1;
  }

  // **---- SINGLE FILE MODE ----**

  LOG_INFO("term_reel finalize - Single File Mode");
  LOG_INFO("Input: {}", input_arg);
  LOG_INFO("Output: {}", output_arg);

  RawCapture capture = load_raw_capture_file(input_arg);
  FinalizeResult result = finalize(capture);
  LOG_INFO("Kept {} keystrokes, retracted {}", result.stats.keystrokes_kept,
           result.stats.keystrokes_retracted);
  return save_or_fail(output_arg, result.session);
}

int cmd_compress(const std::string &in, const std::string &out) {
  Session session = load_session_file(in);
  DeadTimePolicy policy = DeadTimePolicy::defaults();

  TIMER_START(compress);
  int64_t removed = dead_time_removed(session.frames, policy);
  Session compressed = compress_dead_time(session, policy);
  TIMER_END(compress);

  LOG_INFO("Removed {:.3f}s of dead time (threshold {} ms, cap {} ms)",
           removed / 1000.0, policy.threshold_ms, policy.cap_ms);
  return save_or_fail(out, compressed);
}

int cmd_export(const std::string &in, const std::string &out) {
  Session session = load_session_file(in);
  std::string document =
      export_session(session, std::chrono::system_clock::now());
  if (!MemoryLoader::write_file(out, document)) {
    LOG_ERROR("Failed to write {}", out);
    return 1;
  }
  LOG_SUCCESS("Exported {}", out);
  return 0;
}

int cmd_play(const std::string &path, double speed, bool compress) {
  Session session = load_session_file(path);

  PlaybackOptions options = PlaybackOptions::defaults();
  options.compress_dead_time = compress;

  StdoutRenderer renderer;
  PlaybackScheduler scheduler(std::move(session), renderer, options);
  scheduler.set_speed(speed);

  LOG_INFO("Playing {} ({} frames, {:.1f}x{})", path, scheduler.frame_count(),
           scheduler.speed(), compress ? ", dead time compressed" : "");

  SteadyWaiter waiter;
  scheduler.play();
  scheduler.run(waiter);

  std::fputs("\n", stdout);
  LOG_SUCCESS("Playback {}", to_string(scheduler.state()));
  return 0;
}

int dispatch(const std::vector<std::string> &args) {
  const std::string &command = args[0];
  size_t argc = args.size();

  if (command == "info" && argc == 2) {
    return cmd_info(args[1]);
  }
  if (command == "finalize" && argc == 3) {
    return cmd_finalize(args[1], args[2]);
  }
  if (command == "trim" && (argc == 4 || argc == 5)) {
    TrimRequest request;
    request.start_ms = std::stoll(args[3]);
    if (argc == 5)
      request.end_ms = std::stoll(args[4]);
    return save_or_fail(args[2], trim(load_session_file(args[1]), request));
  }
  if (command == "resize" && argc == 5) {
    return save_or_fail(args[2], resize(load_session_file(args[1]),
                                        ResizeRequest{args[3], args[4]}));
  }
  if (command == "retime" && argc == 4) {
    return save_or_fail(args[2],
                        retime(load_session_file(args[1]), std::stod(args[3])));
  }
  if (command == "compress" && argc == 3) {
    return cmd_compress(args[1], args[2]);
  }
  if (command == "export" && argc == 3) {
    return cmd_export(args[1], args[2]);
  }
  if (command == "play" && argc >= 2 && argc <= 4) {
    double speed = Config::playback_speed();
    bool compress = false;
    for (size_t i = 2; i < argc; ++i) {
      if (args[i] == "--compress")
        compress = true;
      else
        speed = std::stod(args[i]);
    }
    return cmd_play(args[1], speed, compress);
  }

  print_usage();
  return 1;
}

} // namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  std::vector<std::string> args(argv + 1, argv + argc);
  int rc = 1;
  try {
    rc = dispatch(args);
  } catch (const std::exception &e) {
    LOG_ERROR("{}", e.what());
    return 1;
  }

  TimingCollector::print_summary();
  return rc;
}
