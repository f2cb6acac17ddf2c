/**
 * @file test_helpers.hpp
 * @brief Shared fixtures for the term_reel test suite
 */

#ifndef TERM_REEL_TEST_HELPERS_HPP
#define TERM_REEL_TEST_HELPERS_HPP

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "term_reel/session.hpp"
#include "term_reel/types.hpp"

namespace term_reel {
namespace testing {

/// A small finalized session: prompt, "ls" + Enter, listing.
inline Session sample_session() {
  Session s;
  s.start_time = 1700000000000;
  s.end_time = 1700000009000;
  s.terminal_info.name = "bash";
  s.terminal_info.cwd = "/home/user";
  s.terminal_info.shell_path = "/bin/bash";
  s.dimensions = Dimensions{100, 30};
  s.frames = {
      make_output(0, "\x1b[32muser@host\x1b[0m$ "),
      make_input(400, "l"),
      make_input(550, "s"),
      make_input(900, "\r\n"),
      make_output(950, "README.md  src\r\n"),
      make_output(8000, "$ "),
  };
  return s;
}

/**
 * @class TempDir
 * @brief Unique scratch directory removed on destruction.
 */
class TempDir {
public:
  TempDir() {
    static std::atomic<int> counter{0};
    auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = std::filesystem::temp_directory_path() /
            ("term_reel_test_" + std::to_string(ticks) + "_" +
             std::to_string(counter++));
    std::filesystem::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const std::filesystem::path &path() const { return path_; }

  std::string file(const std::string &name) const {
    return (path_ / name).string();
  }

  std::string write(const std::string &name, const std::string &text) const {
    std::string p = file(name);
    std::ofstream out(p, std::ios::binary);
    out << text;
    return p;
  }

private:
  std::filesystem::path path_;
};

} // namespace testing
} // namespace term_reel

#endif // TERM_REEL_TEST_HELPERS_HPP
