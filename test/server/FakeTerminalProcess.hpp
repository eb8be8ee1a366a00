/* SPDX-License-Identifier: GPL-3.0-only */
#pragma once
#include <optional>
#include <string>
#include <vector>

#include "remux/server/TerminalProcess.hpp"

namespace remux::test
{

/// A \p TerminalProcess that runs nothing, records what it was asked to do,
/// and lets the test emit output and exits.
class FakeTerminalProcess : public server::TerminalProcess
{
public:
  explicit FakeTerminalProcess(Options Opts) : Opts(std::move(Opts)) {}

  std::optional<server::LaunchError> start() override
  {
    ++StartCount;
    if (FailLaunch)
      return FailLaunch;
    Running = true;
    ReadySignal.fire(PID, Opts.Cwd);
    return std::nullopt;
  }

  void input(std::string_view Data) override { Inputs.emplace_back(Data); }
  void resize(std::uint16_t Columns, std::uint16_t Rows) override
  {
    Opts.Columns = Columns;
    Opts.Rows = Rows;
  }
  void acknowledgeDataEvent(std::uint64_t CharCount) override
  {
    Acknowledged += CharCount;
  }
  void clearUnacknowledgedChars() override { ++Clears; }

  void shutdown(bool Immediate) override
  {
    ShutdownRequests.push_back(Immediate);
    if (ExitOnShutdown && Running)
      exit(Immediate ? std::optional<int>{} : std::optional<int>{0});
  }

  const std::string& initialCwd() const override { return Opts.Cwd; }
  std::string currentCwd() const override { return Opts.Cwd; }
  std::string title() const override { return Title; }
  std::int64_t pid() const override { return Running ? PID : 0; }

  void emit(const std::string& Data) { DataSignal.fire(Data); }
  void exit(std::optional<int> Code)
  {
    Running = false;
    ExitSignal.fire(Code);
  }
  void retitle(std::string NewTitle)
  {
    Title = std::move(NewTitle);
    TitleSignal.fire(Title);
  }

  Options Opts;
  std::optional<server::LaunchError> FailLaunch;
  bool ExitOnShutdown = true;
  bool Running = false;
  std::int64_t PID = 4242;
  std::string Title = "fake";
  int StartCount = 0;
  int Clears = 0;
  std::uint64_t Acknowledged = 0;
  std::vector<std::string> Inputs;
  std::vector<bool> ShutdownRequests;
};

} // namespace remux::test
