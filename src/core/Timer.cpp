/* SPDX-License-Identifier: LGPL-3.0-only */
#include <exception>

#include "remux/Timer.hpp"

#include "remux/Log.hpp"
#define LOG(SEVERITY) remux::log::SEVERITY("Timer")

namespace remux
{

TimerQueue::TimerQueue(ClockFunction Now) : Now(std::move(Now)) {}

TimerQueue::TimerID TimerQueue::schedule(Duration After, Callback CB)
{
  TimerID ID = NextID++;
  TimePoint Deadline = now() + After;
  Queue.emplace(std::make_pair(Deadline, ID), std::move(CB));
  Deadlines.emplace(ID, Deadline);
  REMUX_TRACE_LOG(LOG(data) << "Timer #" << ID << " scheduled in "
                            << After.count() << " ms");
  return ID;
}

bool TimerQueue::cancel(TimerID ID) noexcept
{
  auto It = Deadlines.find(ID);
  if (It == Deadlines.end())
    return false;

  Queue.erase(std::make_pair(It->second, ID));
  Deadlines.erase(It);
  REMUX_TRACE_LOG(LOG(data) << "Timer #" << ID << " cancelled");
  return true;
}

bool TimerQueue::isScheduled(TimerID ID) const noexcept
{
  return Deadlines.find(ID) != Deadlines.end();
}

std::optional<TimerQueue::TimePoint>
TimerQueue::deadlineOf(TimerID ID) const noexcept
{
  auto It = Deadlines.find(ID);
  if (It == Deadlines.end())
    return std::nullopt;
  return It->second;
}

std::size_t TimerQueue::fireExpired()
{
  std::size_t Fired = 0;
  const TimePoint Current = now();
  while (!Queue.empty())
  {
    auto It = Queue.begin();
    if (It->first.first > Current)
      break;

    TimerID ID = It->first.second;
    Callback CB = std::move(It->second);
    Queue.erase(It);
    Deadlines.erase(ID);
    ++Fired;

    REMUX_TRACE_LOG(LOG(trace) << "Timer #" << ID << " fired");
    try
    {
      if (CB)
        CB();
    }
    catch (const std::exception& E)
    {
      LOG(error) << "Timer #" << ID << " callback threw: " << E.what();
    }
  }
  return Fired;
}

std::optional<TimerQueue::Duration> TimerQueue::untilNextDeadline() const
{
  if (Queue.empty())
    return std::nullopt;

  TimePoint Earliest = Queue.begin()->first.first;
  TimePoint Current = now();
  if (Earliest <= Current)
    return Duration::zero();

  // Round up, so that the loop does not wake up a fraction too early.
  auto Remaining = std::chrono::ceil<Duration>(Earliest - Current);
  return Remaining;
}

void Timer::arm(TimerQueue::Duration After, TimerQueue::Callback CB)
{
  cancel();
  ID = Queue->schedule(After, std::move(CB));
}

void Timer::cancel() noexcept
{
  if (!ID)
    return;
  Queue->cancel(*ID);
  ID.reset();
}

bool Timer::isArmed() const noexcept { return ID && Queue->isScheduled(*ID); }

std::optional<TimerQueue::TimePoint> Timer::deadline() const noexcept
{
  if (!ID)
    return std::nullopt;
  return Queue->deadlineOf(*ID);
}

} // namespace remux

#undef LOG
