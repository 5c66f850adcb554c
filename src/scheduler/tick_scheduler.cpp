/**
 * @file tick_scheduler.cpp
 * @brief Реализация gsnake::TickScheduler
 */

#include "tick_scheduler.hpp"

#include <utility>

namespace gsnake {

TickScheduler::TickScheduler(Callback callback)
    : callback_(std::move(callback)) {}

bool TickScheduler::start(std::chrono::milliseconds period,
                          Clock::time_point now) noexcept {
  if (period.count() <= 0) return false;

  period_ = period;
  deadline_ = now + period;
  active_ = true;
  ++generation_;
  return true;
}

void TickScheduler::cancel() noexcept {
  active_ = false;
  ++generation_;
}

bool TickScheduler::reschedule(std::chrono::milliseconds period,
                               Clock::time_point now) noexcept {
  if (period.count() <= 0) return false;
  cancel();
  return start(period, now);
}

bool TickScheduler::poll(Clock::time_point now) {
  if (!active_ || running_ || !callback_) return false;
  if (now < deadline_) return false;

  const std::uint64_t generation = generation_;

  running_ = true;
  callback_();
  running_ = false;

  // Колбэк переустановил или остановил задачу: срок уже выставлен.
  if (generation != generation_ || !active_) return true;

  deadline_ += period_;
  if (deadline_ <= now) {
    deadline_ = now + period_;
  }
  return true;
}

}  // namespace gsnake
