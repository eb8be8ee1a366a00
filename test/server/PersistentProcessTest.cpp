/* SPDX-License-Identifier: GPL-3.0-only */
#include <memory>
#include <optional>

#include <gtest/gtest.h>

#include "remux/server/PersistentProcess.hpp"

#include "FakeTerminalProcess.hpp"
#include "ManualClock.hpp"

/* NOLINTBEGIN(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */

using namespace remux;
using namespace remux::server;
using namespace std::chrono_literals;

namespace
{

struct PersistentProcessTest : public ::testing::Test
{
  test::ManualClock Clock;
  TimerQueue Timers{Clock.function()};
  test::FakeTerminalProcess* Fake = nullptr;
  std::unique_ptr<PersistentProcess> Process;

  void make(bool ShouldPersist = true)
  {
    TerminalProcess::Options Opts;
    Opts.Program = "/bin/sh";
    Opts.Cwd = "/home";
    auto Terminal = std::make_unique<test::FakeTerminalProcess>(Opts);
    Fake = Terminal.get();

    PersistentProcess::Configuration Config;
    Config.WorkspaceID = "w";
    Config.ShouldPersist = ShouldPersist;
    Config.Grace.Long = 10s;
    Config.Grace.Short = 2s;
    Process = std::make_unique<PersistentProcess>(
      1, std::move(Terminal), Timers, Config);
  }

  void SetUp() override { make(); }
};

} // namespace

TEST_F(PersistentProcessTest, FirstStartLaunches)
{
  std::optional<std::int64_t> ReadyPID;
  Process->onReady().connect(
    [&ReadyPID](const std::int64_t& PID, const std::string& /* Cwd */) {
      ReadyPID = PID;
    });

  EXPECT_FALSE(Process->start().has_value());
  EXPECT_TRUE(Process->isStarted());
  EXPECT_EQ(Fake->StartCount, 1);
  EXPECT_EQ(ReadyPID, Fake->PID);
}

TEST_F(PersistentProcessTest, LaunchErrorIsReported)
{
  Fake->FailLaunch = LaunchError{"No such file or directory", 2};
  std::optional<LaunchError> Err = Process->start();
  ASSERT_TRUE(Err.has_value());
  EXPECT_EQ(Err->Code, 2);
  EXPECT_FALSE(Process->isStarted());
}

TEST_F(PersistentProcessTest, RestartReplaysOutput)
{
  (void)Process->start();
  Fake->emit("$ ");
  Process->resize(100, 40);
  Fake->emit("ls\n");

  int Ready = 0;
  std::string Title;
  std::optional<ReplayEvent> Replay;
  Process->onReady().connect(
    [&Ready](const std::int64_t&, const std::string&) { ++Ready; });
  Process->onTitleChanged().connect(
    [&Title](const std::string& T) { Title = T; });
  Process->onReplay().connect([this, &Replay](const ReplayEvent& R) {
    EXPECT_TRUE(Process->isInReplay());
    // Input arriving while the client redraws is dropped.
    Process->input("ignored");
    Replay = R;
  });

  EXPECT_FALSE(Process->start().has_value());
  EXPECT_EQ(Fake->StartCount, 1);
  EXPECT_EQ(Ready, 1);
  EXPECT_EQ(Title, "fake");
  ASSERT_TRUE(Replay.has_value());
  EXPECT_EQ(Replay->Events.size(), 3);
  EXPECT_EQ(Replay->DataSize, 5);
  EXPECT_FALSE(Process->isInReplay());
  EXPECT_TRUE(Fake->Inputs.empty());
  EXPECT_EQ(Fake->Clears, 1);
}

TEST_F(PersistentProcessTest, DataIsRecordedAndForwarded)
{
  (void)Process->start();
  std::string Seen;
  Process->onData().connect([&Seen](const std::string& D) { Seen += D; });
  Fake->emit("abc");

  EXPECT_EQ(Seen, "abc");
  EXPECT_EQ(Process->recorder().size(), 3);

  Process->input("x");
  Process->acknowledgeDataEvent(3);
  ASSERT_EQ(Fake->Inputs.size(), 1);
  EXPECT_EQ(Fake->Acknowledged, 3);
}

TEST_F(PersistentProcessTest, LongGraceExpiryShutsDown)
{
  (void)Process->start();
  Process->detach();
  EXPECT_TRUE(Process->isLongGraceArmed());

  Clock.advance(Timers, 9s);
  EXPECT_TRUE(Fake->ShutdownRequests.empty());
  Clock.advance(Timers, 1s);
  ASSERT_EQ(Fake->ShutdownRequests.size(), 1);
  EXPECT_TRUE(Fake->ShutdownRequests.front());
  EXPECT_TRUE(Process->isExited());
}

TEST_F(PersistentProcessTest, AttachCancelsGrace)
{
  (void)Process->start();
  Process->detach();
  Process->reduceGraceTime();
  EXPECT_TRUE(Process->isShortGraceArmed());

  Process->attach();
  EXPECT_FALSE(Process->isLongGraceArmed());
  EXPECT_FALSE(Process->isShortGraceArmed());
  Clock.advance(Timers, 1h);
  EXPECT_TRUE(Fake->ShutdownRequests.empty());
}

TEST_F(PersistentProcessTest, ReduceGraceTime)
{
  (void)Process->start();

  // Without a detach, there is no grace period to cut short.
  Process->reduceGraceTime();
  EXPECT_FALSE(Process->isShortGraceArmed());

  Process->detach();
  Process->reduceGraceTime();
  EXPECT_TRUE(Process->isShortGraceArmed());
  Clock.advance(Timers, 2s);
  EXPECT_EQ(Fake->ShutdownRequests.size(), 1);
}

TEST_F(PersistentProcessTest, NonPersistentDiesOnDetach)
{
  make(/* ShouldPersist =*/false);
  (void)Process->start();
  Process->detach();
  ASSERT_EQ(Fake->ShutdownRequests.size(), 1);
  EXPECT_FALSE(Process->isLongGraceArmed());
}

TEST_F(PersistentProcessTest, UnstartedProcessExitsOnGraceExpiry)
{
  std::optional<std::optional<int>> Exit;
  Process->onExit().connect(
    [&Exit](const std::optional<int>& Code) { Exit = Code; });

  Process->detach();
  Clock.advance(Timers, 10s);
  EXPECT_TRUE(Process->isExited());
  EXPECT_TRUE(Fake->ShutdownRequests.empty());
  ASSERT_TRUE(Exit.has_value());
  EXPECT_FALSE(Exit->has_value());
  EXPECT_TRUE(Timers.empty());
}

TEST_F(PersistentProcessTest, FailedLaunchExitsOnDetach)
{
  make(/* ShouldPersist =*/false);
  Fake->FailLaunch = LaunchError{"No such file or directory", 2};
  ASSERT_TRUE(Process->start().has_value());

  int Exits = 0;
  Process->onExit().connect([&Exits](const std::optional<int>&) { ++Exits; });
  Process->detach();
  EXPECT_TRUE(Process->isExited());
  EXPECT_EQ(Exits, 1);

  // Shutting down an exited process again is a no-op.
  Process->shutdown(/* Immediate =*/true);
  EXPECT_EQ(Exits, 1);
}

TEST_F(PersistentProcessTest, DestructionAnswersPendingOrphanCheck)
{
  (void)Process->start();
  std::optional<bool> Answer;
  Process->isOrphaned([&Answer](bool O) { Answer = O; });
  EXPECT_FALSE(Answer.has_value());
  EXPECT_FALSE(Timers.empty());

  Process.reset();
  EXPECT_EQ(Answer, true);
  EXPECT_TRUE(Timers.empty());
  EXPECT_EQ(Clock.advance(Timers, OrphanDetector::AutoOpen), 0U);
}

TEST_F(PersistentProcessTest, ExitCancelsTimersAndIsReported)
{
  (void)Process->start();
  std::optional<std::optional<int>> Exit;
  Process->onExit().connect(
    [&Exit](const std::optional<int>& Code) { Exit = Code; });

  Process->detach();
  Fake->exit(7);
  EXPECT_TRUE(Process->isExited());
  EXPECT_FALSE(Process->isLongGraceArmed());
  ASSERT_TRUE(Exit.has_value());
  EXPECT_EQ(*Exit, 7);
}

TEST_F(PersistentProcessTest, OrphanQuestion)
{
  (void)Process->start();
  int Questions = 0;
  Process->onOrphanQuestion().connect([&Questions] { ++Questions; });

  std::optional<bool> Answer;
  Process->isOrphaned([&Answer](bool O) { Answer = O; });
  EXPECT_EQ(Questions, 1);
  EXPECT_FALSE(Answer.has_value());
  Process->orphanQuestionReply();
  ASSERT_TRUE(Answer.has_value());
  EXPECT_FALSE(*Answer);

  // A detached process is an orphan without asking.
  Process->detach();
  Answer.reset();
  Process->isOrphaned([&Answer](bool O) { Answer = O; });
  EXPECT_EQ(Questions, 1);
  EXPECT_EQ(Answer, true);
}

/* NOLINTEND(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */
