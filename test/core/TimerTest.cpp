/* SPDX-License-Identifier: GPL-3.0-only */
#include <chrono>
#include <stdexcept>
#include <vector>

#include <gtest/gtest.h>

#include "remux/Timer.hpp"

#include "ManualClock.hpp"

/* NOLINTBEGIN(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */

using namespace remux;
using namespace std::chrono_literals;

TEST(TimerQueue, FiresInDeadlineOrder)
{
  test::ManualClock Clock;
  TimerQueue Q{Clock.function()};
  std::vector<int> Order;

  Q.schedule(300ms, [&Order] { Order.push_back(3); });
  Q.schedule(100ms, [&Order] { Order.push_back(1); });
  Q.schedule(200ms, [&Order] { Order.push_back(2); });

  EXPECT_EQ(Clock.advance(Q, 150ms), 1);
  EXPECT_EQ(Clock.advance(Q, 1s), 2);
  EXPECT_EQ(Order, (std::vector<int>{1, 2, 3}));
  EXPECT_TRUE(Q.empty());
}

TEST(TimerQueue, UntilNextDeadline)
{
  test::ManualClock Clock;
  TimerQueue Q{Clock.function()};
  EXPECT_FALSE(Q.untilNextDeadline().has_value());

  Q.schedule(500ms, [] {});
  EXPECT_EQ(Q.untilNextDeadline(), TimerQueue::Duration{500});
  Clock.Now += 600ms;
  EXPECT_EQ(Q.untilNextDeadline(), TimerQueue::Duration::zero());
}

TEST(TimerQueue, CancelledTimerDoesNotFire)
{
  test::ManualClock Clock;
  TimerQueue Q{Clock.function()};
  bool Fired = false;

  auto ID = Q.schedule(10ms, [&Fired] { Fired = true; });
  EXPECT_TRUE(Q.cancel(ID));
  EXPECT_FALSE(Q.cancel(ID));
  Clock.advance(Q, 1s);
  EXPECT_FALSE(Fired);
}

TEST(TimerQueue, CancelFromAnotherCallback)
{
  test::ManualClock Clock;
  TimerQueue Q{Clock.function()};
  bool SecondFired = false;

  TimerQueue::TimerID Second = 0;
  Q.schedule(10ms, [&Q, &Second] { Q.cancel(Second); });
  Second = Q.schedule(20ms, [&SecondFired] { SecondFired = true; });

  Clock.advance(Q, 1s);
  EXPECT_FALSE(SecondFired);
}

TEST(TimerQueue, ThrowingCallbackIsIsolated)
{
  test::ManualClock Clock;
  TimerQueue Q{Clock.function()};
  bool Fired = false;

  Q.schedule(10ms, [] { throw std::runtime_error{"callback failure"}; });
  Q.schedule(20ms, [&Fired] { Fired = true; });

  EXPECT_NO_THROW(Clock.advance(Q, 1s));
  EXPECT_TRUE(Fired);
}

TEST(Timer, ArmCancelAndExpire)
{
  test::ManualClock Clock;
  TimerQueue Q{Clock.function()};
  int Fired = 0;

  Timer T{Q};
  EXPECT_FALSE(T.isArmed());
  T.arm(100ms, [&Fired] { ++Fired; });
  EXPECT_TRUE(T.isArmed());
  EXPECT_EQ(T.deadline(), Clock.Now + 100ms);

  // Rearming replaces the previous deadline.
  T.arm(200ms, [&Fired] { Fired += 10; });
  Clock.advance(Q, 150ms);
  EXPECT_EQ(Fired, 0);
  Clock.advance(Q, 100ms);
  EXPECT_EQ(Fired, 10);
  EXPECT_FALSE(T.isArmed());

  T.arm(100ms, [&Fired] { ++Fired; });
  T.cancel();
  Clock.advance(Q, 1s);
  EXPECT_EQ(Fired, 10);
}

TEST(Timer, DestructionCancels)
{
  test::ManualClock Clock;
  TimerQueue Q{Clock.function()};
  bool Fired = false;
  {
    Timer T{Q};
    T.arm(10ms, [&Fired] { Fired = true; });
  }
  EXPECT_TRUE(Q.empty());
  Clock.advance(Q, 1s);
  EXPECT_FALSE(Fired);
}

/* NOLINTEND(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */
