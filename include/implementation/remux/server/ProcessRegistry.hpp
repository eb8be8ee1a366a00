/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "remux/Timer.hpp"
#include "remux/adt/Signal.hpp"
#include "remux/message/Message.hpp"
#include "remux/server/PersistentProcess.hpp"
#include "remux/server/TerminalProcess.hpp"

namespace remux::server
{

/// Owns every \p PersistentProcess of the server, and hands out monotonically
/// increasing identifiers for them. All other parts of the server refer to
/// the processes through their identifier.
///
/// Operations on an identifier not naming a live process throw
/// \p UnknownProcess.
class ProcessRegistry
{
public:
  /// Creates the backend for a new persistent process.
  using TerminalFactory =
    std::function<std::unique_ptr<TerminalProcess>(TerminalProcess::Options)>;
  using Layout = std::vector<message::LayoutTab>;
  using ExpandedLayout = std::vector<message::ExpandedTab>;
  using LayoutCallback = std::function<void(std::optional<ExpandedLayout>)>;

  ProcessRegistry(TimerQueue& Timers,
                  TerminalFactory Factory,
                  PersistentProcess::GraceTimes Grace = {});
  ~ProcessRegistry();

  ProcessRegistry(const ProcessRegistry&) = delete;
  ProcessRegistry& operator=(const ProcessRegistry&) = delete;

  /// Registers a new persistent process, without starting it.
  ///
  /// \throws AttachNotAllowed if \p Config requests attaching to an already
  /// existing process.
  message::ProcessID
  create(const message::LaunchConfig& Config,
         std::string Cwd,
         std::uint16_t Columns,
         std::uint16_t Rows,
         const std::vector<std::pair<std::string, std::string>>& Environment,
         bool ShouldPersist,
         std::string WorkspaceID,
         std::string WorkspaceName);

  void attach(message::ProcessID ID);
  void detach(message::ProcessID ID);
  [[nodiscard]] std::optional<LaunchError> start(message::ProcessID ID);
  void shutdown(message::ProcessID ID, bool Immediate);
  void input(message::ProcessID ID, std::string_view Data);
  void resize(message::ProcessID ID, std::uint16_t Columns, std::uint16_t Rows);
  void acknowledgeDataEvent(message::ProcessID ID, std::uint64_t CharCount);
  [[nodiscard]] std::string getInitialCwd(message::ProcessID ID) const;
  [[nodiscard]] std::string getCwd(message::ProcessID ID) const;
  [[nodiscard]] std::uint64_t getLatency(message::ProcessID ID) const;
  void orphanQuestionReply(message::ProcessID ID);
  void reduceGraceTime(message::ProcessID ID);
  void isOrphaned(message::ProcessID ID, OrphanDetector::Callback CB);

  /// Replaces the stored layout of \p WorkspaceID.
  void setLayout(const std::string& WorkspaceID, Layout Tabs);
  /// Expands the stored layout of \p WorkspaceID into descriptors of the live
  /// processes, and delivers it to \p CB once every orphan check concluded.
  void getLayout(const std::string& WorkspaceID, LayoutCallback CB);

  /// Immediately shuts down and forgets every process.
  void shutdownAll();
  void reduceGraceTimeAll();

  [[nodiscard]] PersistentProcess& get(message::ProcessID ID);
  [[nodiscard]] const PersistentProcess& get(message::ProcessID ID) const;
  [[nodiscard]] PersistentProcess* tryGet(message::ProcessID ID) noexcept;
  [[nodiscard]] std::size_t size() const noexcept { return Processes.size(); }
  [[nodiscard]] std::vector<message::ProcessID> ids() const;

  Signal<message::ProcessID, std::string>& onProcessData() noexcept
  {
    return ProcessDataSignal;
  }
  Signal<message::ProcessID, ReplayEvent>& onProcessReplay() noexcept
  {
    return ProcessReplaySignal;
  }
  Signal<message::ProcessID, std::optional<int>>& onProcessExit() noexcept
  {
    return ProcessExitSignal;
  }
  Signal<message::ProcessID, std::int64_t, std::string>&
  onProcessReady() noexcept
  {
    return ProcessReadySignal;
  }
  Signal<message::ProcessID, std::string>& onProcessTitleChanged() noexcept
  {
    return ProcessTitleSignal;
  }
  Signal<message::ProcessID>& onProcessOrphanQuestion() noexcept
  {
    return ProcessOrphanQuestionSignal;
  }

private:
  TimerQueue& Timers;
  TerminalFactory Factory;
  PersistentProcess::GraceTimes Grace;
  message::ProcessID LastID = 0;

  /// \note \p unique_ptr is used so changing the map's balancing does not
  /// invalidate other references to the data.
  std::map<message::ProcessID, std::unique_ptr<PersistentProcess>> Processes;
  std::map<std::string, Layout> Layouts;

  /// Exited processes are destroyed outside of the handling of their own
  /// exit signal.
  std::vector<std::unique_ptr<PersistentProcess>> Exited;
  Timer ExitedCleanup;

  Signal<message::ProcessID, std::string> ProcessDataSignal;
  Signal<message::ProcessID, ReplayEvent> ProcessReplaySignal;
  Signal<message::ProcessID, std::optional<int>> ProcessExitSignal;
  Signal<message::ProcessID, std::int64_t, std::string> ProcessReadySignal;
  Signal<message::ProcessID, std::string> ProcessTitleSignal;
  Signal<message::ProcessID> ProcessOrphanQuestionSignal;

  void wire(PersistentProcess& P);
  void processExited(message::ProcessID ID, const std::optional<int>& Code);
};

} // namespace remux::server
