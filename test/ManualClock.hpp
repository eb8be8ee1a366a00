/* SPDX-License-Identifier: GPL-3.0-only */
#pragma once
#include <chrono>

#include "remux/Timer.hpp"

namespace remux::test
{

/// A clock for \p TimerQueue that only moves when the test says so.
struct ManualClock
{
  TimerQueue::TimePoint Now{std::chrono::hours(1)};

  [[nodiscard]] TimerQueue::ClockFunction function()
  {
    return [this] { return Now; };
  }

  /// Moves the clock forward by \p D and fires the timers of \p Queue that
  /// became due.
  std::size_t advance(TimerQueue& Queue, TimerQueue::Duration D)
  {
    Now += D;
    return Queue.fireExpired();
  }
};

} // namespace remux::test
