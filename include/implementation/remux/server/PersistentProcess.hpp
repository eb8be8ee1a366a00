/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "remux/Timer.hpp"
#include "remux/adt/Signal.hpp"
#include "remux/message/Message.hpp"
#include "remux/server/Errors.hpp"
#include "remux/server/OrphanDetector.hpp"
#include "remux/server/Recorder.hpp"
#include "remux/server/TerminalProcess.hpp"

namespace remux::server
{

/// A terminal session that outlives the client connection that created it.
///
/// The output of the program is recorded at all times, so a reattaching
/// client can be sent a replay. Once the client detaches, a long grace timer
/// starts, after which the program is shut down. A client can ask for the
/// grace period to be cut short, which arms a second, shorter timer.
class PersistentProcess
{
public:
  struct GraceTimes
  {
    std::chrono::milliseconds Long = std::chrono::hours(3);
    std::chrono::milliseconds Short = std::chrono::minutes(6);
  };

  struct Configuration
  {
    std::string WorkspaceID;
    std::string WorkspaceName;
    bool ShouldPersist = true;
    std::uint16_t Columns = 80;
    std::uint16_t Rows = 24;
    GraceTimes Grace;
  };

  PersistentProcess(message::ProcessID ID,
                    std::unique_ptr<TerminalProcess> Terminal,
                    TimerQueue& Timers,
                    Configuration Config);
  ~PersistentProcess();

  PersistentProcess(const PersistentProcess&) = delete;
  PersistentProcess& operator=(const PersistentProcess&) = delete;
  PersistentProcess(PersistentProcess&&) = delete;
  PersistentProcess& operator=(PersistentProcess&&) = delete;

  [[nodiscard]] message::ProcessID id() const noexcept { return ID; }
  [[nodiscard]] const std::string& workspaceID() const noexcept
  {
    return Config.WorkspaceID;
  }
  [[nodiscard]] const std::string& workspaceName() const noexcept
  {
    return Config.WorkspaceName;
  }
  [[nodiscard]] bool shouldPersist() const noexcept
  {
    return Config.ShouldPersist;
  }
  [[nodiscard]] bool isStarted() const noexcept { return Started; }
  [[nodiscard]] bool isExited() const noexcept { return Exited; }
  [[nodiscard]] bool isInReplay() const noexcept { return InReplay; }
  [[nodiscard]] bool isLongGraceArmed() const noexcept
  {
    return LongGrace.isArmed();
  }
  [[nodiscard]] bool isShortGraceArmed() const noexcept
  {
    return ShortGrace.isArmed();
  }
  [[nodiscard]] const Recorder& recorder() const noexcept { return Output; }

  /// The first call launches the program. Later calls re-announce the state
  /// of the process and trigger a replay.
  [[nodiscard]] std::optional<LaunchError> start();

  void attach();
  void detach();

  void input(std::string_view Data);
  void resize(std::uint16_t Columns, std::uint16_t Rows);
  void acknowledgeDataEvent(std::uint64_t CharCount);

  /// Arms the short grace timer, if the long one is running.
  void reduceGraceTime();

  /// Sends the recorded output of the process through \p onReplay().
  void triggerReplay();

  /// Delivers to \p CB whether the process lost its owner.
  void isOrphaned(OrphanDetector::Callback CB);
  void orphanQuestionReply();

  void shutdown(bool Immediate);

  [[nodiscard]] const std::string& getInitialCwd() const;
  [[nodiscard]] std::string getCwd() const;
  [[nodiscard]] std::uint64_t getLatency() const noexcept { return 0; }
  [[nodiscard]] std::string title() const;
  [[nodiscard]] std::int64_t pid() const;

  Signal<std::string>& onData() noexcept { return DataSignal; }
  Signal<ReplayEvent>& onReplay() noexcept { return ReplaySignal; }
  Signal<std::optional<int>>& onExit() noexcept { return ExitSignal; }
  Signal<std::int64_t, std::string>& onReady() noexcept
  {
    return ReadySignal;
  }
  Signal<std::string>& onTitleChanged() noexcept { return TitleSignal; }
  Signal<>& onOrphanQuestion() noexcept { return OrphanQuestionSignal; }

private:
  message::ProcessID ID;
  Configuration Config;
  std::unique_ptr<TerminalProcess> Terminal;
  Recorder Output;
  Timer LongGrace;
  Timer ShortGrace;
  OrphanDetector Orphans;
  bool Started = false;
  bool Exited = false;
  bool InReplay = false;

  Signal<std::string> DataSignal;
  Signal<ReplayEvent> ReplaySignal;
  Signal<std::optional<int>> ExitSignal;
  Signal<std::int64_t, std::string> ReadySignal;
  Signal<std::string> TitleSignal;
  Signal<> OrphanQuestionSignal;

  void graceExpired(std::chrono::milliseconds Window);
  void exited(std::optional<int> ExitCode);
};

} // namespace remux::server
