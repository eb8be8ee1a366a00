/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "remux/system/CurrentPlatform.hpp"
#include "remux/system/Handle.hpp"
#include "remux/system/ProcessTraits.hpp"
#include "remux/system/Pty.hpp"

namespace remux::system
{

using PlatformSpecificProcessTraits = ProcessTraits<CurrentPlatform>;

/// Responsible for creating, executing, and handling processes on the
/// system.
class Process
{
public:
  /// Type alias for the raw process handle type on the platform.
  using Raw = PlatformSpecificProcessTraits::RawTy;

  struct SpawnOptions
  {
    std::string Program;
    std::vector<std::string> Arguments;
    /// Variables to set (or unset, if mapped to \p nullopt) in the child.
    std::map<std::string, std::optional<std::string>> Environment;
    /// The directory the child starts in. Inherited if empty.
    std::string WorkingDirectory;

    /// Whether to create a pseudoterminal device when creating the process.
    bool CreatePTY = false;
    /// Override the standard streams of the spawned process to the
    /// handles specified. If the invalid handle is given, the potentially
    /// inherited standard stream is closed.
    ///
    /// This option has no effect if \p CreatePTY is \p true.
    std::optional<Handle::Raw> StandardInput, StandardOutput, StandardError;
  };

  virtual ~Process() = default;

  [[nodiscard]] Raw raw() const noexcept { return Handle; }
  [[nodiscard]] bool hasPty() const noexcept { return static_cast<bool>(PTY); }
  [[nodiscard]] Pty* getPty() noexcept { return PTY.get(); }

  /// Checks, without blocking, whether the process had died.
  ///
  /// \note If the process died, the operating system \b MAY remove associated
  /// information at the invocation of this call.
  virtual bool reapIfDead() = 0;

  /// Blocks until the current process instance has terminated.
  virtual void wait() = 0;

  /// \returns whether the child process has been \b OBSERVED to be dead.
  [[nodiscard]] bool dead() const noexcept { return Dead; }

  /// \returns the exit code of the process, if it has already terminated.
  /// A process killed by a signal reports the negated signal number.
  [[nodiscard]] std::optional<int> exitCode() const noexcept
  {
    if (!Dead)
      return std::nullopt;
    return ExitCode;
  }

  /// Send the \p Signal to the process group of the underlying process.
  virtual void signal(int Signal) = 0;

protected:
  Raw Handle = PlatformSpecificProcessTraits::Invalid;
  bool Dead = false;
  int ExitCode = 0;
  /// The \p Pty associated with the process, if \p SpawnOptions::CreatePTY
  /// was true.
  std::unique_ptr<Pty> PTY;

public:
  /// \returns the PID handle of the currently executing process.
  [[nodiscard]] static Raw thisProcess();

  /// \returns the path of the currently executing binary.
  [[nodiscard]] static std::string thisProcessPath();

  /// \returns the current working directory of the process \p Handle, as
  /// reported by the kernel.
  [[nodiscard]] static std::optional<std::string>
  workingDirectoryOf(Raw Handle);

  /// Sends the \p Signal to the process group identified by \p Handle.
  static void signal(Raw Handle, int Signal);

  /// Replaces the current process image with the one described by \p Opts.
  ///
  /// \warning This command does \b NOT \p fork()!
  [[noreturn]] static void exec(const SpawnOptions& Opts);

  /// Spawns a new process based on the specified \p Opts, in a new session.
  /// Execution resumes normally in the parent, and the call does \b NOT
  /// return in the child.
  [[nodiscard]] static std::unique_ptr<Process> spawn(const SpawnOptions& Opts);
};

} // namespace remux::system
