/* SPDX-License-Identifier: GPL-3.0-only */
#include <map>
#include <memory>
#include <optional>

#include <sys/wait.h>

#include <gtest/gtest.h>

#include "remux/server/Errors.hpp"
#include "remux/server/ProcessRegistry.hpp"
#include "remux/server/PtyTerminalProcess.hpp"

#include "FakeTerminalProcess.hpp"
#include "ManualClock.hpp"

/* NOLINTBEGIN(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */

using namespace remux;
using namespace remux::server;
using namespace std::chrono_literals;

namespace
{

struct ProcessRegistryTest : public ::testing::Test
{
  test::ManualClock Clock;
  TimerQueue Timers{Clock.function()};
  std::map<message::ProcessID, test::FakeTerminalProcess*> Fakes;
  std::vector<test::FakeTerminalProcess*> Created;
  ProcessRegistry Registry{Timers, [this](TerminalProcess::Options Opts) {
                             auto T = std::make_unique<test::FakeTerminalProcess>(
                               std::move(Opts));
                             Created.push_back(T.get());
                             return std::unique_ptr<TerminalProcess>{
                               std::move(T)};
                           }};

  message::ProcessID create(const std::string& Workspace = "w")
  {
    message::LaunchConfig Config;
    Config.Program = "/bin/sh";
    message::ProcessID ID = Registry.create(
      Config, "/tmp", 80, 24, {{"FOO", "bar"}}, true, Workspace, "Workspace");
    Fakes[ID] = Created.back();
    return ID;
  }
};

} // namespace

TEST_F(ProcessRegistryTest, IdentifiersAreNeverReused)
{
  message::ProcessID First = create();
  message::ProcessID Second = create();
  EXPECT_EQ(First, 1);
  EXPECT_EQ(Second, 2);

  Fakes[Second]->exit(0);
  Clock.advance(Timers, 0ms);
  EXPECT_EQ(Registry.size(), 1);
  EXPECT_EQ(create(), 3);
}

TEST_F(ProcessRegistryTest, CreatePassesOptions)
{
  message::ProcessID ID = create();
  const TerminalProcess::Options& Opts = Fakes[ID]->Opts;
  EXPECT_EQ(Opts.Program, "/bin/sh");
  EXPECT_EQ(Opts.Cwd, "/tmp");
  EXPECT_EQ(Opts.Environment.at("FOO"), "bar");
  EXPECT_EQ(Registry.get(ID).workspaceID(), "w");
}

TEST_F(ProcessRegistryTest, CreateRejectsAttach)
{
  message::LaunchConfig Config;
  Config.AttachPersistentProcess = 1;
  EXPECT_THROW((void)Registry.create(Config, "/", 80, 24, {}, true, "w", "w"),
               AttachNotAllowed);
  EXPECT_EQ(Registry.size(), 0);
}

TEST_F(ProcessRegistryTest, UnknownIdentifierThrows)
{
  EXPECT_THROW(Registry.attach(99), UnknownProcess);
  EXPECT_THROW((void)Registry.start(99), UnknownProcess);
  EXPECT_THROW(Registry.input(99, "x"), UnknownProcess);
  EXPECT_THROW((void)Registry.getCwd(99), UnknownProcess);
  EXPECT_EQ(Registry.tryGet(99), nullptr);
}

TEST_F(ProcessRegistryTest, SignalsCarryIdentifier)
{
  message::ProcessID ID = create();
  std::optional<message::ProcessID> ReadyID, DataID, ExitID;
  Registry.onProcessReady().connect(
    [&ReadyID](const message::ProcessID& I,
               const std::int64_t& /* PID */,
               const std::string& /* Cwd */) { ReadyID = I; });
  Registry.onProcessData().connect(
    [&DataID](const message::ProcessID& I, const std::string&) {
      DataID = I;
    });
  Registry.onProcessExit().connect(
    [&ExitID](const message::ProcessID& I, const std::optional<int>&) {
      ExitID = I;
    });

  EXPECT_FALSE(Registry.start(ID).has_value());
  Fakes[ID]->emit("x");
  Fakes[ID]->exit(0);

  EXPECT_EQ(ReadyID, ID);
  EXPECT_EQ(DataID, ID);
  EXPECT_EQ(ExitID, ID);
  EXPECT_EQ(Registry.tryGet(ID), nullptr);
}

TEST_F(ProcessRegistryTest, ReduceGraceTimeAll)
{
  message::ProcessID A = create();
  message::ProcessID B = create();
  (void)Registry.start(A);
  (void)Registry.start(B);
  Registry.detach(A);

  Registry.reduceGraceTimeAll();
  EXPECT_TRUE(Registry.get(A).isShortGraceArmed());
  EXPECT_FALSE(Registry.get(B).isShortGraceArmed());
}

TEST_F(ProcessRegistryTest, ShutdownAll)
{
  message::ProcessID Started = create();
  message::ProcessID Unstarted = create();
  (void)Registry.start(Started);

  std::vector<message::ProcessID> ExitIDs;
  Registry.onProcessExit().connect(
    [&ExitIDs](const message::ProcessID& I, const std::optional<int>&) {
      ExitIDs.push_back(I);
    });

  Registry.shutdownAll();
  EXPECT_EQ(Registry.size(), 0);
  ASSERT_EQ(ExitIDs.size(), 2);
  EXPECT_EQ(ExitIDs.at(0), Started);
  EXPECT_EQ(ExitIDs.at(1), Unstarted);
}

TEST_F(ProcessRegistryTest, ShutdownAllLeavesNoTimers)
{
  message::ProcessID A = create();
  message::ProcessID B = create();
  message::ProcessID C = create();
  message::ProcessID D = create();
  for (message::ProcessID ID : {A, B, C, D})
    (void)Registry.start(ID);

  Registry.detach(A);
  Registry.detach(B);
  Registry.reduceGraceTime(B);
  Registry.detach(create());

  std::optional<bool> Orphan;
  Registry.isOrphaned(C, [&Orphan](bool O) { Orphan = O; });
  EXPECT_FALSE(Orphan.has_value());
  // Exited processes are freed by a timer too.
  Fakes[D]->exit(0);
  EXPECT_FALSE(Timers.empty());

  Registry.shutdownAll();
  EXPECT_EQ(Registry.size(), 0);
  EXPECT_TRUE(Timers.empty());
  EXPECT_EQ(Orphan, true);
  EXPECT_EQ(Clock.advance(Timers, 1h), 0U);
}

TEST_F(ProcessRegistryTest, UnstartedProcessRemovedAfterGrace)
{
  message::ProcessID ID = create();
  Registry.detach(ID);
  Clock.advance(Timers, PersistentProcess::GraceTimes{}.Long);
  EXPECT_EQ(Registry.tryGet(ID), nullptr);
  EXPECT_THROW(Registry.attach(ID), UnknownProcess);
}

TEST_F(ProcessRegistryTest, LayoutOfUnknownWorkspace)
{
  bool Called = false;
  Registry.getLayout("nope",
                     [&Called](std::optional<ProcessRegistry::ExpandedLayout> L) {
                       Called = true;
                       EXPECT_FALSE(L.has_value());
                     });
  EXPECT_TRUE(Called);
}

TEST_F(ProcessRegistryTest, LayoutExpansion)
{
  message::ProcessID Live = create();
  message::ProcessID Gone = create();
  (void)Registry.start(Live);
  (void)Registry.start(Gone);

  message::LayoutTab Tab1;
  Tab1.IsActive = true;
  Tab1.Terminals = {{Live, 0.5}, {Gone, 0.5}};
  message::LayoutTab Tab2;
  Tab2.Terminals = {{Gone, 1.0}};
  Registry.setLayout("w", {Tab1, Tab2});

  Fakes[Gone]->exit(0);

  std::vector<message::ProcessID> Asked;
  Registry.onProcessOrphanQuestion().connect(
    [&Asked](const message::ProcessID& I) { Asked.push_back(I); });

  std::optional<ProcessRegistry::ExpandedLayout> Result;
  Registry.getLayout(
    "w", [&Result](std::optional<ProcessRegistry::ExpandedLayout> L) {
      Result = std::move(L);
    });

  // The answer waits for the owner of the live process.
  EXPECT_FALSE(Result.has_value());
  ASSERT_EQ(Asked.size(), 1);
  EXPECT_EQ(Asked.front(), Live);
  Registry.orphanQuestionReply(Live);

  ASSERT_TRUE(Result.has_value());
  // The tab with only exited processes is dropped.
  ASSERT_EQ(Result->size(), 1);
  const message::ExpandedTab& Tab = Result->front();
  EXPECT_TRUE(Tab.IsActive);
  ASSERT_EQ(Tab.Terminals.size(), 2);
  ASSERT_TRUE(Tab.Terminals.at(0).Terminal.has_value());
  EXPECT_EQ(Tab.Terminals.at(0).Terminal->ID, Live);
  EXPECT_EQ(Tab.Terminals.at(0).Terminal->Cwd, "/tmp");
  EXPECT_FALSE(Tab.Terminals.at(0).Terminal->IsOrphan);
  EXPECT_FALSE(Tab.Terminals.at(1).Terminal.has_value());
}

TEST_F(ProcessRegistryTest, LayoutOrphanAfterTimeout)
{
  message::ProcessID ID = create();
  (void)Registry.start(ID);
  message::LayoutTab Tab;
  Tab.Terminals = {{ID, 1.0}};
  Registry.setLayout("w", {Tab});

  std::optional<ProcessRegistry::ExpandedLayout> Result;
  Registry.getLayout(
    "w", [&Result](std::optional<ProcessRegistry::ExpandedLayout> L) {
      Result = std::move(L);
    });
  Clock.advance(Timers, OrphanDetector::AutoOpen);

  ASSERT_TRUE(Result.has_value());
  EXPECT_TRUE(Result->front().Terminals.front().Terminal->IsOrphan);
}

TEST(ProcessRegistryWithPty, DetachedNonPersistentCanNotBeReattached)
{
  test::ManualClock Clock;
  TimerQueue Timers{Clock.function()};
  ProcessRegistry Registry{Timers, [](TerminalProcess::Options Opts) {
                             return std::unique_ptr<TerminalProcess>{
                               std::make_unique<PtyTerminalProcess>(
                                 std::move(Opts))};
                           }};

  message::LaunchConfig Config;
  Config.Program = "/bin/sh";
  Config.Arguments = {"-c", "sleep 60"};
  message::ProcessID ID =
    Registry.create(Config, "/", 80, 24, {}, false, "w", "Workspace");

  std::optional<std::optional<int>> Exit;
  Registry.onProcessExit().connect(
    [&Exit](const message::ProcessID&, const std::optional<int>& Code) {
      Exit = Code;
    });

  ASSERT_FALSE(Registry.start(ID).has_value());
  auto PID = static_cast<::pid_t>(Registry.get(ID).pid());
  ASSERT_GT(PID, 0);

  // Detach and attach arriving together: the process is already gone.
  Registry.detach(ID);
  EXPECT_THROW(Registry.attach(ID), UnknownProcess);
  EXPECT_EQ(Registry.tryGet(ID), nullptr);
  ASSERT_TRUE(Exit.has_value());
  EXPECT_FALSE(Exit->has_value());

  Clock.advance(Timers, 0ms);
  EXPECT_EQ(::waitpid(PID, nullptr, 0), PID);
}

/* NOLINTEND(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */
