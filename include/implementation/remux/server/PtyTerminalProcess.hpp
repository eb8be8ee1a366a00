/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <memory>

#include "remux/system/Handle.hpp"
#include "remux/system/Process.hpp"
#include "remux/server/TerminalProcess.hpp"

namespace remux::server
{

/// Executes the program of a terminal in a new session, connected to a
/// freshly allocated pseudoterminal.
///
/// Reading the output is driven by the owner's event loop: \p readOutput()
/// must be called when the handle announced via \p onSpawned() is readable.
/// Reading is paused by flow control once \p HighWatermarkChars characters
/// of output were not acknowledged by the client, and it is resumed when
/// the unacknowledged amount falls below \p LowWatermarkChars.
class PtyTerminalProcess : public TerminalProcess
{
public:
  static constexpr std::uint64_t HighWatermarkChars = 100000;
  static constexpr std::uint64_t LowWatermarkChars = 5000;

  explicit PtyTerminalProcess(Options Opts);
  ~PtyTerminalProcess() override;

  [[nodiscard]] std::optional<LaunchError> start() override;
  void input(std::string_view Data) override;
  void resize(std::uint16_t Columns, std::uint16_t Rows) override;
  void acknowledgeDataEvent(std::uint64_t CharCount) override;
  void clearUnacknowledgedChars() override;
  /// Sends \p SIGHUP to the program, or \p SIGKILL if \p Immediate. A killed
  /// program is reported as exited without waiting for it to be reaped.
  void shutdown(bool Immediate) override;

  [[nodiscard]] const std::string& initialCwd() const override
  {
    return InitialCwd;
  }
  [[nodiscard]] std::string currentCwd() const override;
  [[nodiscard]] std::string title() const override { return Title; }
  [[nodiscard]] std::int64_t pid() const override;

  /// Reads the available output of the program, unless flow control paused
  /// the reading.
  void readOutput();

  /// Checks whether the program had died, and if so, fires \p onExit() after
  /// the remaining output was read.
  ///
  /// \returns whether the program is dead.
  bool reap();

  [[nodiscard]] bool isPaused() const noexcept { return Paused; }
  [[nodiscard]] bool hungUp() const noexcept;
  [[nodiscard]] std::uint64_t unacknowledgedChars() const noexcept
  {
    return Unacknowledged;
  }

  /// Fired after the program was spawned with the handle of the terminal and
  /// the identifier of the process.
  Signal<system::Handle::Raw, system::Process::Raw>& onSpawned() noexcept
  {
    return SpawnedSignal;
  }
  /// Fired with \p true when reading is paused, and \p false on resume.
  Signal<bool>& onFlowControl() noexcept { return FlowControlSignal; }
  /// Fired once the handle and the process should not be watched anymore.
  Signal<system::Handle::Raw, system::Process::Raw>& onClosing() noexcept
  {
    return ClosingSignal;
  }

private:
  Options Opts;
  std::string InitialCwd;
  std::string Title;
  std::unique_ptr<system::Process> Child;
  std::uint64_t Unacknowledged = 0;
  bool Paused = false;
  bool Closed = false;

  Signal<system::Handle::Raw, system::Process::Raw> SpawnedSignal;
  Signal<bool> FlowControlSignal;
  Signal<system::Handle::Raw, system::Process::Raw> ClosingSignal;

  [[nodiscard]] std::optional<LaunchError> checkLaunchable() const;
  /// Reads output while there is any, ignoring flow control if \p Force.
  void drain(bool Force);
  void setPaused(bool Paused);
  void close();
};

} // namespace remux::server
