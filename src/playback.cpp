/**
 * @file playback.cpp
 * @brief Cooperative playback scheduler implementation
 */

#include "term_reel/playback.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include "term_reel/config.hpp"
#include "term_reel/logging.hpp"

namespace term_reel {

// **---- CancellationToken ----**

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

void CancellationToken::cancel() {
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->cancelled = true;
  }
  state_->cv.notify_all();
}

bool CancellationToken::cancelled() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->cancelled;
}

bool CancellationToken::wait_for(std::chrono::milliseconds delay) const {
  std::unique_lock<std::mutex> lock(state_->mutex);
  return !state_->cv.wait_for(lock, delay,
                              [this] { return state_->cancelled; });
}

bool SteadyWaiter::wait(std::chrono::milliseconds delay,
                        const CancellationToken &token) {
  return token.wait_for(delay);
}

// **---- Options ----**

const char *to_string(PlaybackState state) {
  switch (state) {
  case PlaybackState::Idle:
    return "idle";
  case PlaybackState::Playing:
    return "playing";
  case PlaybackState::Paused:
    return "paused";
  case PlaybackState::Finished:
    return "finished";
  }
  return "unknown";
}

PlaybackOptions PlaybackOptions::defaults() {
  PlaybackOptions options;
  options.speed = Config::playback_speed();
  options.min_delay_ms = Config::min_frame_delay_ms();
  options.dead_time = DeadTimePolicy::defaults();
  return options;
}

// **---- Construction ----**

PlaybackScheduler::PlaybackScheduler(Session session, Renderer &renderer,
                                     PlaybackOptions options)
    : session_(std::move(session)), renderer_(renderer),
      options_(std::move(options)) {
  if (!(options_.speed > 0.0) || !std::isfinite(options_.speed)) {
    LOG_WARN("Invalid playback speed {}, using 1.0", options_.speed);
    options_.speed = 1.0;
  }
  options_.min_delay_ms = std::max<int64_t>(0, options_.min_delay_ms);
  if (options_.compress_dead_time) {
    compressed_ = term_reel::compress_dead_time(session_.frames,
                                                options_.dead_time);
  }
}

PlaybackScheduler::~PlaybackScheduler() { token_.cancel(); }

const std::vector<Frame> &PlaybackScheduler::frames() const {
  return options_.compress_dead_time ? compressed_ : session_.frames;
}

void PlaybackScheduler::renew_token() {
  token_.cancel();
  token_ = CancellationToken();
}

// **---- Transport Controls ----**

void PlaybackScheduler::play() {
  switch (state_) {
  case PlaybackState::Idle:
  case PlaybackState::Paused:
    if (cursor_ >= frames().size()) {
      state_ = PlaybackState::Finished;
      return;
    }
    if (token_.cancelled())
      token_ = CancellationToken();
    state_ = PlaybackState::Playing;
    break;
  case PlaybackState::Playing:
  case PlaybackState::Finished:
    break;
  }
}

void PlaybackScheduler::pause() {
  if (state_ != PlaybackState::Playing)
    return;
  renew_token();
  state_ = PlaybackState::Paused;
}

void PlaybackScheduler::reset() {
  renew_token();
  state_ = PlaybackState::Idle;
  cursor_ = 0;
  accumulated_.clear();
  renderer_.on_reset();
}

void PlaybackScheduler::set_speed(double speed) {
  if (!(speed > 0.0) || !std::isfinite(speed)) {
    LOG_WARN("Ignoring playback speed {}", speed);
    return;
  }
  options_.speed = speed;
}

void PlaybackScheduler::set_compress_dead_time(bool enabled) {
  if (enabled == options_.compress_dead_time)
    return;
  options_.compress_dead_time = enabled;
  if (enabled) {
    compressed_ = term_reel::compress_dead_time(session_.frames,
                                                options_.dead_time);
  } else {
    compressed_.clear();
    compressed_.shrink_to_fit();
  }
  /// Indices are not comparable across the two frame lists
  reset();
}

// **---- Seeking ----**

void PlaybackScheduler::seek_fraction(double fraction) {
  if (std::isnan(fraction))
    fraction = 0.0;
  fraction = std::clamp(fraction, 0.0, 1.0);
  const size_t n = frames().size();
  size_t index = static_cast<size_t>(std::floor(fraction * n));
  seek_index(std::min(index, n));
}

void PlaybackScheduler::seek_time(int64_t time_ms) {
  const auto &list = frames();
  auto it = std::find_if(list.begin(), list.end(), [time_ms](const Frame &f) {
    return f.timestamp > time_ms;
  });
  seek_index(static_cast<size_t>(it - list.begin()));
}

void PlaybackScheduler::seek_index(size_t index) {
  const auto &list = frames();
  index = std::min(index, list.size());

  renew_token();

  accumulated_.clear();
  for (size_t i = 0; i < index; ++i) {
    accumulated_ += list[i].content;
  }
  cursor_ = index;

  if (cursor_ >= list.size()) {
    state_ = PlaybackState::Finished;
  } else if (state_ == PlaybackState::Finished ||
             (state_ == PlaybackState::Idle && cursor_ > 0)) {
    state_ = PlaybackState::Paused;
  }

  renderer_.on_rebuild(accumulated_);
}

// **---- Emission ----**

std::chrono::milliseconds PlaybackScheduler::delay_after(size_t index) const {
  const auto &list = frames();
  if (index + 1 >= list.size())
    return std::chrono::milliseconds(0);
  int64_t gap = list[index + 1].timestamp - list[index].timestamp;
  double delay =
      static_cast<double>(std::max(options_.min_delay_ms, gap)) /
      options_.speed;
  return std::chrono::milliseconds(std::llround(delay));
}

std::optional<std::chrono::milliseconds> PlaybackScheduler::step() {
  const auto &list = frames();
  if (cursor_ >= list.size()) {
    state_ = PlaybackState::Finished;
    return std::nullopt;
  }

  const size_t index = cursor_++;
  const Frame frame = list[index];
  accumulated_ += frame.content;

  std::optional<std::chrono::milliseconds> next;
  if (cursor_ >= list.size()) {
    state_ = PlaybackState::Finished;
  } else {
    if (state_ == PlaybackState::Idle)
      state_ = PlaybackState::Paused;
    next = delay_after(index);
  }

  /// The renderer may pause/reset/seek from here; callers re-check state
  renderer_.on_frame(frame.content, frame.kind);
  return next;
}

void PlaybackScheduler::run(Waiter &waiter) {
  while (state_ == PlaybackState::Playing) {
    if (token_.cancelled()) {
      /// Cancelled from outside the scheduler (another thread)
      state_ = PlaybackState::Paused;
      break;
    }
    CancellationToken token = token_;
    auto delay = step();
    if (!delay)
      break;
    if (state_ != PlaybackState::Playing || token.cancelled())
      continue;
    /// A false return means cancelled; the loop head sorts out by whom
    (void)waiter.wait(*delay, token);
  }
}

// **---- Progress ----**

double PlaybackScheduler::progress() const {
  const size_t n = frames().size();
  return n == 0 ? 0.0 : static_cast<double>(cursor_) / static_cast<double>(n);
}

int64_t PlaybackScheduler::current_time_ms() const {
  return cursor_ > 0 ? frames()[cursor_ - 1].timestamp : 0;
}

int64_t PlaybackScheduler::total_time_ms() const {
  const auto &list = frames();
  return list.empty() ? 0 : list.back().timestamp;
}

} // namespace term_reel
