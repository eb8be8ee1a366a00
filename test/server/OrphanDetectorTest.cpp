/* SPDX-License-Identifier: GPL-3.0-only */
#include <optional>

#include <gtest/gtest.h>

#include "remux/server/OrphanDetector.hpp"

#include "ManualClock.hpp"

/* NOLINTBEGIN(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */

using namespace remux;
using namespace remux::server;
using namespace std::chrono_literals;

TEST(OrphanDetector, PromptReplyIsNotOrphan)
{
  test::ManualClock Clock;
  TimerQueue Q{Clock.function()};
  OrphanDetector D{Q};
  std::optional<bool> Answer;

  EXPECT_TRUE(D.probe([&Answer](bool IsOrphan) { Answer = IsOrphan; }));
  EXPECT_TRUE(D.isProbing());
  Clock.advance(Q, 100ms);
  D.reply();

  ASSERT_TRUE(Answer.has_value());
  EXPECT_FALSE(*Answer);
  EXPECT_FALSE(D.isProbing());
}

TEST(OrphanDetector, SilenceIsOrphan)
{
  test::ManualClock Clock;
  TimerQueue Q{Clock.function()};
  OrphanDetector D{Q};
  std::optional<bool> Answer;

  D.probe([&Answer](bool IsOrphan) { Answer = IsOrphan; });
  Clock.advance(Q, OrphanDetector::AutoOpen - 1ms);
  EXPECT_FALSE(Answer.has_value());
  Clock.advance(Q, 1ms);

  ASSERT_TRUE(Answer.has_value());
  EXPECT_TRUE(*Answer);
}

TEST(OrphanDetector, ConcurrentProbesShareTheAnswer)
{
  test::ManualClock Clock;
  TimerQueue Q{Clock.function()};
  OrphanDetector D{Q};
  int Answers = 0;

  EXPECT_TRUE(D.probe([&Answers](bool IsOrphan) {
    EXPECT_FALSE(IsOrphan);
    ++Answers;
  }));
  EXPECT_FALSE(D.probe([&Answers](bool IsOrphan) {
    EXPECT_FALSE(IsOrphan);
    ++Answers;
  }));
  D.reply();
  EXPECT_EQ(Answers, 2);
}

TEST(OrphanDetector, ReplyBeforeProbeDoesNotCount)
{
  test::ManualClock Clock;
  TimerQueue Q{Clock.function()};
  OrphanDetector D{Q};
  std::optional<bool> Answer;

  D.reply();
  D.probe([&Answer](bool IsOrphan) { Answer = IsOrphan; });
  Clock.advance(Q, OrphanDetector::AutoOpen);
  ASSERT_TRUE(Answer.has_value());
  EXPECT_TRUE(*Answer);
}

TEST(OrphanDetector, CancelAnswersOrphan)
{
  test::ManualClock Clock;
  TimerQueue Q{Clock.function()};
  OrphanDetector D{Q};
  std::optional<bool> Answer;

  D.probe([&Answer](bool IsOrphan) { Answer = IsOrphan; });
  D.cancel();
  ASSERT_TRUE(Answer.has_value());
  EXPECT_TRUE(*Answer);
  EXPECT_TRUE(Q.empty());
}

/* NOLINTEND(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */
