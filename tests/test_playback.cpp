#include <catch2/catch.hpp>

#include <chrono>
#include <functional>
#include <limits>
#include <string>
#include <thread>
#include <vector>

#include "term_reel/playback.hpp"
#include "term_reel/session.hpp"

#include "test_helpers.hpp"

using namespace term_reel;
using std::chrono::milliseconds;

namespace {

/**
 * @brief Renderer that remembers every call.
 */
class RecordingRenderer : public Renderer {
public:
  std::vector<std::string> frames;
  std::string screen;
  int resets = 0;
  int rebuilds = 0;
  std::function<void()> on_frame_hook;

  void on_frame(const std::string &content, FrameKind) override {
    frames.push_back(content);
    screen += content;
    if (on_frame_hook)
      on_frame_hook();
  }

  void on_reset() override {
    ++resets;
    screen.clear();
  }

  void on_rebuild(const std::string &accumulated) override {
    ++rebuilds;
    screen = accumulated;
  }
};

/**
 * @brief Waiter that never sleeps; records delays and runs a script hook.
 */
class ScriptedWaiter : public Waiter {
public:
  std::vector<milliseconds> delays;
  std::function<void(size_t)> hook;

  bool wait(milliseconds delay, const CancellationToken &token) override {
    delays.push_back(delay);
    if (hook)
      hook(delays.size());
    return !token.cancelled();
  }
};

Session letters(const std::vector<int64_t> &ts) {
  Session s;
  char c = 'a';
  for (int64_t t : ts)
    s.frames.push_back(make_output(t, std::string(1, c++)));
  return s;
}

PlaybackOptions fixed_options() {
  PlaybackOptions options;
  options.speed = 1.0;
  options.min_delay_ms = 50;
  options.dead_time = DeadTimePolicy{3000, 1000};
  return options;
}

} // namespace

TEST_CASE("a fresh scheduler is idle at frame zero", "[playback]") {
  RecordingRenderer renderer;
  PlaybackScheduler player(testing::sample_session(), renderer,
                           fixed_options());

  REQUIRE(player.state() == PlaybackState::Idle);
  REQUIRE(player.cursor() == 0);
  REQUIRE(player.accumulated().empty());
  REQUIRE(player.progress() == 0.0);
  REQUIRE(player.total_time_ms() == 8000);
  REQUIRE(renderer.frames.empty());
}

TEST_CASE("delays honour the floor and the speed", "[playback]") {
  RecordingRenderer renderer;
  PlaybackScheduler player(letters({0, 10, 1000, 1000}), renderer,
                           fixed_options());

  REQUIRE(player.delay_after(0) == milliseconds(50));
  REQUIRE(player.delay_after(1) == milliseconds(990));
  REQUIRE(player.delay_after(2) == milliseconds(50));
  REQUIRE(player.delay_after(3) == milliseconds(0));

  player.set_speed(2.0);
  REQUIRE(player.delay_after(0) == milliseconds(25));
  REQUIRE(player.delay_after(1) == milliseconds(495));

  SECTION("invalid speeds are ignored") {
    player.set_speed(0.0);
    player.set_speed(-1.0);
    player.set_speed(std::numeric_limits<double>::quiet_NaN());
    REQUIRE(player.speed() == 2.0);
  }
}

TEST_CASE("accumulated content is the concatenation of emitted frames",
          "[playback]") {
  const Session session = testing::sample_session();
  RecordingRenderer renderer;
  PlaybackScheduler player(session, renderer, fixed_options());

  std::string expected;
  for (size_t k = 0; k < session.frames.size(); ++k) {
    player.step();
    expected += session.frames[k].content;
    REQUIRE(player.accumulated() == expected);
    REQUIRE(player.cursor() == k + 1);
    REQUIRE(player.current_time_ms() == session.frames[k].timestamp);
  }
  REQUIRE(player.state() == PlaybackState::Finished);
  REQUIRE(player.progress() == 1.0);
  REQUIRE_FALSE(player.step().has_value());
  REQUIRE(renderer.screen == expected);
}

TEST_CASE("run plays to the end with the recorded rhythm", "[playback]") {
  RecordingRenderer renderer;
  PlaybackScheduler player(letters({0, 100, 5000}), renderer,
                           fixed_options());
  ScriptedWaiter waiter;

  player.play();
  REQUIRE(player.state() == PlaybackState::Playing);
  player.run(waiter);

  REQUIRE(player.state() == PlaybackState::Finished);
  REQUIRE(renderer.frames == std::vector<std::string>{"a", "b", "c"});
  REQUIRE(waiter.delays ==
          std::vector<milliseconds>{milliseconds(100), milliseconds(4900)});

  SECTION("play from Finished is a no-op until reset") {
    player.play();
    REQUIRE(player.state() == PlaybackState::Finished);
    player.reset();
    REQUIRE(player.state() == PlaybackState::Idle);
    REQUIRE(renderer.screen.empty());
  }
}

TEST_CASE("pause during a wait stops further emission", "[playback]") {
  RecordingRenderer renderer;
  PlaybackScheduler player(letters({0, 100, 200, 300}), renderer,
                           fixed_options());
  ScriptedWaiter waiter;
  waiter.hook = [&player](size_t call) {
    if (call == 2)
      player.pause();
  };

  player.play();
  player.run(waiter);

  REQUIRE(player.state() == PlaybackState::Paused);
  REQUIRE(player.cursor() == 2);
  REQUIRE(renderer.frames == std::vector<std::string>{"a", "b"});

  SECTION("resuming continues from the cursor") {
    waiter.hook = nullptr;
    player.play();
    player.run(waiter);
    REQUIRE(player.state() == PlaybackState::Finished);
    REQUIRE(player.accumulated() == "abcd");
  }
}

TEST_CASE("reset from a renderer callback cancels the pending emission",
          "[playback]") {
  RecordingRenderer renderer;
  PlaybackScheduler player(letters({0, 100, 200}), renderer, fixed_options());
  ScriptedWaiter waiter;
  renderer.on_frame_hook = [&player, &renderer] {
    if (renderer.frames.size() == 2)
      player.reset();
  };

  player.play();
  player.run(waiter);

  REQUIRE(player.state() == PlaybackState::Idle);
  REQUIRE(player.cursor() == 0);
  REQUIRE(player.accumulated().empty());
  REQUIRE(renderer.frames.size() == 2);
  REQUIRE(waiter.delays.size() == 1);
}

TEST_CASE("cancelling the token from outside ends run", "[playback]") {
  RecordingRenderer renderer;
  PlaybackScheduler player(letters({0, 100, 200}), renderer, fixed_options());
  ScriptedWaiter waiter;
  waiter.hook = [&player](size_t) {
    CancellationToken token = player.token();
    token.cancel();
  };

  player.play();
  player.run(waiter);

  REQUIRE(player.state() == PlaybackState::Paused);
  REQUIRE(renderer.frames.size() == 1);

  SECTION("play issues a fresh token") {
    waiter.hook = nullptr;
    player.play();
    REQUIRE_FALSE(player.token().cancelled());
    player.run(waiter);
    REQUIRE(player.state() == PlaybackState::Finished);
  }
}

TEST_CASE("seek rebuilds the accumulator from frame zero", "[playback]") {
  RecordingRenderer renderer;
  PlaybackScheduler player(letters({0, 100, 200, 300}), renderer,
                           fixed_options());

  player.seek_fraction(0.5);
  REQUIRE(player.cursor() == 2);
  REQUIRE(player.accumulated() == "ab");
  REQUIRE(player.state() == PlaybackState::Paused);
  REQUIRE(renderer.screen == "ab");
  REQUIRE(renderer.rebuilds == 1);

  player.seek_fraction(0.25);
  REQUIRE(player.accumulated() == "a");

  player.seek_time(250);
  REQUIRE(player.cursor() == 3);
  REQUIRE(player.accumulated() == "abc");

  player.seek_time(-1);
  REQUIRE(player.cursor() == 0);

  SECTION("past the end clamps to Finished") {
    player.seek_fraction(7.0);
    REQUIRE(player.state() == PlaybackState::Finished);
    REQUIRE(player.accumulated() == "abcd");

    player.seek_time(100000);
    REQUIRE(player.state() == PlaybackState::Finished);
  }

  SECTION("seeking back from Finished pauses") {
    player.seek_fraction(1.0);
    player.seek_fraction(0.5);
    REQUIRE(player.state() == PlaybackState::Paused);
  }

  SECTION("NaN and negative fractions seek to the start") {
    player.seek_fraction(std::numeric_limits<double>::quiet_NaN());
    REQUIRE(player.cursor() == 0);
    player.seek_fraction(-3.0);
    REQUIRE(player.cursor() == 0);
  }
}

TEST_CASE("seek to half then zero matches a fresh reset", "[playback]") {
  const Session session = testing::sample_session();

  RecordingRenderer seeked_renderer;
  PlaybackScheduler seeked(session, seeked_renderer, fixed_options());
  seeked.seek_fraction(0.5);
  seeked.seek_fraction(0.0);

  RecordingRenderer reset_renderer;
  PlaybackScheduler reset(session, reset_renderer, fixed_options());
  reset.step();
  reset.reset();

  REQUIRE(seeked.accumulated() == reset.accumulated());
  REQUIRE(seeked.cursor() == reset.cursor());
  REQUIRE(seeked_renderer.screen == reset_renderer.screen);
}

TEST_CASE("seeking while playing keeps playing from the new cursor",
          "[playback]") {
  RecordingRenderer renderer;
  PlaybackScheduler player(letters({0, 100, 200, 300}), renderer,
                           fixed_options());
  ScriptedWaiter waiter;
  waiter.hook = [&player](size_t call) {
    if (call == 1)
      player.seek_fraction(0.75);
  };

  player.play();
  player.run(waiter);

  REQUIRE(player.state() == PlaybackState::Finished);
  REQUIRE(renderer.frames == std::vector<std::string>{"a", "d"});
  REQUIRE(player.accumulated() == "abcd");
}

TEST_CASE("toggling dead-time compression resets playback", "[playback]") {
  RecordingRenderer renderer;
  PlaybackScheduler player(letters({0, 500, 5500}), renderer,
                           fixed_options());
  player.seek_fraction(0.5);
  REQUIRE(player.cursor() == 1);

  player.set_compress_dead_time(true);
  REQUIRE(player.compress_dead_time());
  REQUIRE(player.state() == PlaybackState::Idle);
  REQUIRE(player.cursor() == 0);
  REQUIRE(player.total_time_ms() == 1500);
  REQUIRE(player.delay_after(1) == milliseconds(1000));

  int resets = renderer.resets;
  player.set_compress_dead_time(true);
  REQUIRE(renderer.resets == resets);

  player.set_compress_dead_time(false);
  REQUIRE(player.total_time_ms() == 5500);
  REQUIRE(player.state() == PlaybackState::Idle);
}

TEST_CASE("an empty session finishes immediately", "[playback]") {
  RecordingRenderer renderer;
  PlaybackScheduler player(Session{}, renderer, fixed_options());
  ScriptedWaiter waiter;

  player.play();
  REQUIRE(player.state() == PlaybackState::Finished);
  player.run(waiter);
  REQUIRE(renderer.frames.empty());
  REQUIRE(player.progress() == 0.0);
  REQUIRE(player.total_time_ms() == 0);
}

TEST_CASE("cancellation interrupts a real wait", "[playback]") {
  CancellationToken token;
  SteadyWaiter waiter;

  std::thread canceller([token]() mutable {
    std::this_thread::sleep_for(milliseconds(20));
    token.cancel();
  });

  auto start = std::chrono::steady_clock::now();
  bool elapsed = waiter.wait(milliseconds(10000), token);
  auto waited = std::chrono::steady_clock::now() - start;
  canceller.join();

  REQUIRE_FALSE(elapsed);
  REQUIRE(token.cancelled());
  REQUIRE(waited < std::chrono::seconds(5));

  SECTION("an uncancelled wait runs to completion") {
    CancellationToken fresh;
    REQUIRE(fresh.wait_for(milliseconds(1)));
  }
}

TEST_CASE("destroying the scheduler cancels its token", "[playback]") {
  RecordingRenderer renderer;
  CancellationToken token;
  {
    PlaybackScheduler player(letters({0, 100}), renderer, fixed_options());
    token = player.token();
    REQUIRE_FALSE(token.cancelled());
  }
  REQUIRE(token.cancelled());
}
