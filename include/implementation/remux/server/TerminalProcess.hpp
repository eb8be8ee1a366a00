/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "remux/adt/Signal.hpp"
#include "remux/server/Errors.hpp"

namespace remux::server
{

/// The backend of a persistent process: a program executing behind a
/// terminal. The persistent layer drives it through this interface, and
/// learns about its state through the exposed signals.
class TerminalProcess
{
public:
  struct Options
  {
    std::string Program;
    std::vector<std::string> Arguments;
    /// A user-facing name for the terminal. The basename of \p Program is
    /// used if empty.
    std::string Name;
    /// Variables to set (or unset, if mapped to \p nullopt) in the child.
    std::map<std::string, std::optional<std::string>> Environment;
    std::string Cwd;
    std::uint16_t Columns = 80;
    std::uint16_t Rows = 24;
  };

  virtual ~TerminalProcess() = default;

  /// Launches the program.
  ///
  /// \returns the reason of the failure, if the program could not be started.
  [[nodiscard]] virtual std::optional<LaunchError> start() = 0;

  virtual void input(std::string_view Data) = 0;
  virtual void resize(std::uint16_t Columns, std::uint16_t Rows) = 0;

  /// Marks \p CharCount characters of output as processed by the client.
  virtual void acknowledgeDataEvent(std::uint64_t CharCount) = 0;
  /// Forgets about all output not acknowledged by the client.
  virtual void clearUnacknowledgedChars() = 0;

  /// Asks the program to terminate.
  virtual void shutdown(bool Immediate) = 0;

  [[nodiscard]] virtual const std::string& initialCwd() const = 0;
  /// \returns the current working directory of the running program.
  [[nodiscard]] virtual std::string currentCwd() const = 0;
  [[nodiscard]] virtual std::string title() const = 0;
  /// \returns the OS-level identifier of the program, or 0 if not running.
  [[nodiscard]] virtual std::int64_t pid() const = 0;

  /// Fired for every chunk of output produced by the program.
  Signal<std::string>& onData() noexcept { return DataSignal; }
  /// Fired once the program exited, with the exit code, if any.
  Signal<std::optional<int>>& onExit() noexcept { return ExitSignal; }
  /// Fired once the program had been started, with its PID and directory.
  Signal<std::int64_t, std::string>& onReady() noexcept
  {
    return ReadySignal;
  }
  Signal<std::string>& onTitleChanged() noexcept { return TitleSignal; }

protected:
  TerminalProcess() = default;

  Signal<std::string> DataSignal;
  Signal<std::optional<int>> ExitSignal;
  Signal<std::int64_t, std::string> ReadySignal;
  Signal<std::string> TitleSignal;
};

} // namespace remux::server
