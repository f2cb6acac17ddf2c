/**
 * @file playback.hpp
 * @brief Cooperative playback scheduler
 *
 * @details Replays a Session's frames against an external Renderer with the
 *          recorded relative timing:
 *
 *          - State machine Idle -> Playing <-> Paused -> Finished, with
 *            reset() returning to Idle from anywhere
 *
 *          - Delay after frame i is max(min_delay, t[i+1] - t[i]) / speed
 *
 *          - Seeking rebuilds the accumulated content from frame 0
 *
 *          - Toggling dead-time compression resets to Idle against the other
 *            frame list
 *
 * @attention CANCELLATION:
 *
 * run() suspends between emissions through a Waiter, passing the current
 * CancellationToken. pause(), reset(), seek, compression toggles and the
 * destructor cancel that token, so no emission scheduled before them fires
 * after them.
 *
 * @note Single-threaded: control calls come from the thread running the
 *       scheduler (renderer callbacks or the Waiter). Only the token itself
 *       may be cancelled from another thread.
 */

#ifndef TERM_REEL_PLAYBACK_HPP
#define TERM_REEL_PLAYBACK_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "dead_time.hpp"
#include "types.hpp"

namespace term_reel {

// **----- CANCELLATION -----**

/**
 * @class CancellationToken
 * @brief Shared, one-way cancellable flag with an interruptible sleep.
 * @note Copies share state. A cancelled token stays cancelled.
 */
class CancellationToken {
public:
  CancellationToken();

  void cancel();
  bool cancelled() const;

  /**
   * @brief Sleep for delay unless cancelled first.
   * @return true if the full delay elapsed, false if cancelled
   */
  bool wait_for(std::chrono::milliseconds delay) const;

private:
  struct State {
    std::mutex mutex;
    std::condition_variable cv;
    bool cancelled = false;
  };
  std::shared_ptr<State> state_;
};

// **----- COLLABORATORS -----**

/**
 * @class Renderer
 * @brief Receives what playback emits.
 */
class Renderer {
public:
  virtual ~Renderer() = default;

  /// One frame was emitted.
  virtual void on_frame(const std::string &content, FrameKind kind) = 0;

  /// Everything emitted so far was cleared.
  virtual void on_reset() = 0;

  /// Replace everything shown with the accumulated content (after a seek).
  virtual void on_rebuild(const std::string &accumulated) = 0;
};

/**
 * @class Waiter
 * @brief The scheduler's suspend point.
 */
class Waiter {
public:
  virtual ~Waiter() = default;

  /**
   * @return true when the delay elapsed, false when token was cancelled
   */
  virtual bool wait(std::chrono::milliseconds delay,
                    const CancellationToken &token) = 0;
};

/**
 * @class SteadyWaiter
 * @brief Real-time Waiter sleeping on the token's condition variable.
 */
class SteadyWaiter : public Waiter {
public:
  bool wait(std::chrono::milliseconds delay,
            const CancellationToken &token) override;
};

// **----- SCHEDULER -----**

enum class PlaybackState { Idle, Playing, Paused, Finished };

const char *to_string(PlaybackState state);

/**
 * @struct PlaybackOptions
 * @brief Rate and timing knobs.
 */
struct PlaybackOptions {
  double speed = 1.0;        //< Positive rate multiplier, 1.0 = real time
  int64_t min_delay_ms = 50; //< Floor between two emissions
  bool compress_dead_time = false;
  DeadTimePolicy dead_time{3000, 1000};

  /// Values from Config (environment overridable)
  static PlaybackOptions defaults();
};

/**
 * @class PlaybackScheduler
 * @brief Deterministic, controllable replay of one Session.
 */
class PlaybackScheduler {
public:
  PlaybackScheduler(Session session, Renderer &renderer,
                    PlaybackOptions options = PlaybackOptions::defaults());
  ~PlaybackScheduler();

  PlaybackScheduler(const PlaybackScheduler &) = delete;
  PlaybackScheduler &operator=(const PlaybackScheduler &) = delete;

  /// Idle/Paused -> Playing. Finished stays Finished until reset().
  void play();

  /// Playing -> Paused; the cursor is kept.
  void pause();

  /// Any state -> Idle, cursor 0, accumulated content cleared.
  void reset();

  /**
   * @brief Jump to floor(fraction * frame_count).
   * @note Clamped to [0, 1]; the end clamps to Finished.
   */
  void seek_fraction(double fraction);

  /**
   * @brief Jump past every frame whose timestamp is <= time_ms.
   */
  void seek_time(int64_t time_ms);

  /// Non-positive or non-finite speeds are ignored.
  void set_speed(double speed);

  /// Switch frame lists; always resets to Idle when the value changes.
  void set_compress_dead_time(bool enabled);

  /**
   * @brief Emit the frame under the cursor.
   * @return Delay before the next frame, or nullopt once Finished
   */
  std::optional<std::chrono::milliseconds> step();

  /**
   * @brief Emit frames while Playing, suspending through waiter.
   * @note Returns when paused, reset, finished or cancelled.
   */
  void run(Waiter &waiter);

  /// Delay between frame index and index + 1 at the current speed.
  std::chrono::milliseconds delay_after(size_t index) const;

  PlaybackState state() const { return state_; }
  size_t cursor() const { return cursor_; }
  size_t frame_count() const { return frames().size(); }
  const std::string &accumulated() const { return accumulated_; }
  double speed() const { return options_.speed; }
  bool compress_dead_time() const { return options_.compress_dead_time; }
  const CancellationToken &token() const { return token_; }

  /// Fraction of frames emitted, 0 for an empty session.
  double progress() const;

  /// Timestamp of the last emitted frame.
  int64_t current_time_ms() const;

  /// Timestamp of the last frame.
  int64_t total_time_ms() const;

  /// The frame list currently being replayed.
  const std::vector<Frame> &frames() const;

private:
  void seek_index(size_t index);
  void renew_token();

  Session session_;
  std::vector<Frame> compressed_;
  Renderer &renderer_;
  PlaybackOptions options_;

  PlaybackState state_ = PlaybackState::Idle;
  size_t cursor_ = 0;
  std::string accumulated_;
  CancellationToken token_;
};

} // namespace term_reel

#endif // TERM_REEL_PLAYBACK_HPP
