/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <utility>

namespace remux
{

/// Keeps a set of one-shot deadlines and the callbacks associated with them.
/// The owner of the queue (usually the event loop) is responsible for calling
/// \p fireExpired() once the time returned by \p untilNextDeadline() passed.
///
/// The clock of the queue is injectable, which allows driving time manually.
///
/// \note This object is \b NOT thread-safe!
class TimerQueue
{
public:
  using Clock = std::chrono::steady_clock;
  using TimePoint = Clock::time_point;
  using Duration = std::chrono::milliseconds;
  using ClockFunction = std::function<TimePoint()>;
  using Callback = std::function<void()>;
  using TimerID = std::uint64_t;

  /// Creates a queue that reads the current time from \p Now.
  explicit TimerQueue(ClockFunction Now = &Clock::now);

  [[nodiscard]] TimePoint now() const { return Now(); }

  /// Registers \p CB to be called once \p After time elapsed from \p now().
  TimerID schedule(Duration After, Callback CB);

  /// Removes the pending timer \p ID from the queue.
  ///
  /// \returns whether a pending timer was removed. Cancelling an already fired
  /// or already cancelled timer is a no-op.
  bool cancel(TimerID ID) noexcept;

  [[nodiscard]] bool isScheduled(TimerID ID) const noexcept;

  /// \returns the absolute deadline of the pending timer \p ID.
  [[nodiscard]] std::optional<TimePoint> deadlineOf(TimerID ID) const noexcept;

  /// Calls the callbacks of all timers whose deadline is not in the future,
  /// in the order of their deadlines. A callback that throws is logged.
  ///
  /// \returns the number of timers fired.
  std::size_t fireExpired();

  /// \returns the time remaining until the earliest pending deadline, or
  /// \p nullopt if there are no pending timers.
  [[nodiscard]] std::optional<Duration> untilNextDeadline() const;

  [[nodiscard]] std::size_t size() const noexcept { return Deadlines.size(); }
  [[nodiscard]] bool empty() const noexcept { return Deadlines.empty(); }

private:
  ClockFunction Now;
  TimerID NextID = 1;
  /// Ordered by deadline, and by registration order for equal deadlines.
  std::map<std::pair<TimePoint, TimerID>, Callback> Queue;
  std::map<TimerID, TimePoint> Deadlines;
};

/// A single, re-armable one-shot timer registered into a \p TimerQueue.
/// Destroying the \p Timer cancels the pending deadline, if any.
class Timer
{
public:
  explicit Timer(TimerQueue& Queue) noexcept : Queue(&Queue) {}
  ~Timer() { cancel(); }

  Timer(const Timer&) = delete;
  Timer& operator=(const Timer&) = delete;
  Timer(Timer&&) = delete;
  Timer& operator=(Timer&&) = delete;

  /// Schedules \p CB to fire after \p After elapsed. An already armed
  /// deadline of this timer is cancelled first.
  void arm(TimerQueue::Duration After, TimerQueue::Callback CB);

  /// Cancels the pending deadline. Idempotent.
  void cancel() noexcept;

  /// \returns whether the timer is pending to fire.
  [[nodiscard]] bool isArmed() const noexcept;

  [[nodiscard]] std::optional<TimerQueue::TimePoint> deadline() const noexcept;

private:
  TimerQueue* Queue;
  std::optional<TimerQueue::TimerID> ID;
};

} // namespace remux
