/* SPDX-License-Identifier: GPL-3.0-only */
#include <chrono>
#include <optional>
#include <string>
#include <thread>

#include <sys/wait.h>

#include <gtest/gtest.h>

#include "remux/server/PtyTerminalProcess.hpp"

/* NOLINTBEGIN(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */

using namespace remux::server;

TEST(PtyTerminalProcess, MissingProgramIsLaunchError)
{
  TerminalProcess::Options Opts;
  Opts.Program = "/nonexistent/remux-test-shell";
  PtyTerminalProcess P{Opts};

  std::optional<LaunchError> Err = P.start();
  ASSERT_TRUE(Err.has_value());
  EXPECT_NE(Err->Message.find("does not exist"), std::string::npos);
  EXPECT_EQ(Err->Code, static_cast<int>(std::errc::no_such_file_or_directory));
  EXPECT_EQ(P.pid(), 0);
}

TEST(PtyTerminalProcess, MissingCwdIsLaunchError)
{
  TerminalProcess::Options Opts;
  Opts.Program = "/bin/sh";
  Opts.Cwd = "/nonexistent/remux-test-dir";
  PtyTerminalProcess P{Opts};

  std::optional<LaunchError> Err = P.start();
  ASSERT_TRUE(Err.has_value());
  EXPECT_NE(Err->Message.find("cwd"), std::string::npos);
}

TEST(PtyTerminalProcess, TitleDefaultsToProgramName)
{
  TerminalProcess::Options Opts;
  Opts.Program = "/bin/sh";
  EXPECT_EQ(PtyTerminalProcess{Opts}.title(), "sh");

  Opts.Name = "Build";
  EXPECT_EQ(PtyTerminalProcess{Opts}.title(), "Build");
}

TEST(PtyTerminalProcess, RunsProgramToCompletion)
{
  TerminalProcess::Options Opts;
  Opts.Program = "/bin/sh";
  Opts.Arguments = {"-c", "echo remux-says-hello; exit 3"};
  Opts.Cwd = "/";
  PtyTerminalProcess P{Opts};

  std::string Output;
  std::optional<std::int64_t> ReadyPID;
  std::optional<std::optional<int>> Exit;
  bool Spawned = false, Closing = false;
  P.onData().connect([&Output](const std::string& D) { Output += D; });
  P.onReady().connect(
    [&ReadyPID](const std::int64_t& PID, const std::string& /* Cwd */) {
      ReadyPID = PID;
    });
  P.onExit().connect(
    [&Exit](const std::optional<int>& Code) { Exit = Code; });
  P.onSpawned().connect(
    [&Spawned](const remux::system::Handle::Raw&,
               const remux::system::Process::Raw&) { Spawned = true; });
  P.onClosing().connect(
    [&Closing](const remux::system::Handle::Raw&,
               const remux::system::Process::Raw&) { Closing = true; });

  ASSERT_FALSE(P.start().has_value());
  EXPECT_TRUE(Spawned);
  ASSERT_TRUE(ReadyPID.has_value());
  EXPECT_GT(*ReadyPID, 0);
  EXPECT_EQ(P.initialCwd(), "/");

  for (int I = 0; I < 500 && !Exit; ++I)
  {
    P.readOutput();
    if (!P.reap())
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  ASSERT_TRUE(Exit.has_value());
  EXPECT_EQ(*Exit, 3);
  EXPECT_TRUE(Closing);
  EXPECT_NE(Output.find("remux-says-hello"), std::string::npos);
  EXPECT_GE(P.unacknowledgedChars(), Output.size());

  P.acknowledgeDataEvent(Output.size());
  EXPECT_EQ(P.unacknowledgedChars(), 0);
}

TEST(PtyTerminalProcess, ImmediateShutdownReportsExit)
{
  TerminalProcess::Options Opts;
  Opts.Program = "/bin/sh";
  Opts.Arguments = {"-c", "sleep 60"};
  PtyTerminalProcess P{Opts};
  std::optional<std::optional<int>> Exit;
  bool Closing = false;
  P.onExit().connect(
    [&Exit](const std::optional<int>& Code) { Exit = Code; });
  P.onClosing().connect(
    [&Closing](const remux::system::Handle::Raw&,
               const remux::system::Process::Raw&) { Closing = true; });

  ASSERT_FALSE(P.start().has_value());
  auto PID = static_cast<::pid_t>(P.pid());
  P.shutdown(/* Immediate =*/true);
  ASSERT_TRUE(Exit.has_value());
  EXPECT_FALSE(Exit->has_value());
  EXPECT_TRUE(Closing);

  // Reaping is left to the owner, and does not report the exit again.
  Exit.reset();
  EXPECT_TRUE(P.reap());
  EXPECT_FALSE(Exit.has_value());
  EXPECT_EQ(::waitpid(PID, nullptr, 0), PID);
}

TEST(PtyTerminalProcess, HangupEndsProgramOnReap)
{
  TerminalProcess::Options Opts;
  Opts.Program = "/bin/sh";
  Opts.Arguments = {"-c", "sleep 60"};
  PtyTerminalProcess P{Opts};
  std::optional<std::optional<int>> Exit;
  P.onExit().connect(
    [&Exit](const std::optional<int>& Code) { Exit = Code; });

  ASSERT_FALSE(P.start().has_value());
  P.shutdown(/* Immediate =*/false);
  EXPECT_FALSE(Exit.has_value());
  for (int I = 0; I < 500 && !Exit; ++I)
  {
    P.readOutput();
    if (!P.reap())
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  EXPECT_TRUE(Exit.has_value());
}

/* NOLINTEND(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */
