/* SPDX-License-Identifier: LGPL-3.0-only */
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iomanip>

#include <linux/limits.h>
#include <sys/wait.h>
#include <unistd.h>

#include "remux/CheckedErrno.hpp"
#include "remux/adt/POD.hpp"
#include "remux/system/UnixPty.hpp"
#include "remux/system/fd.hpp"
#include "remux/unreachable.hpp"

#include "remux/system/UnixProcess.hpp"

#include "remux/Log.hpp"
#define LOG(SEVERITY) remux::log::SEVERITY("system/Process")

namespace remux::system
{

Process::Raw Process::thisProcess()
{
  return CheckedErrnoThrow([] { return ::getpid(); }, "getpid()", -1);
}

std::string Process::thisProcessPath()
{
  POD<char[PATH_MAX]> Binary;
  CheckedErrnoThrow(
    [&Binary] { return ::readlink("/proc/self/exe", *Binary, PATH_MAX - 1); },
    "readlink(\"/proc/self/exe\")",
    -1);
  return {*Binary};
}

std::optional<std::string> Process::workingDirectoryOf(Raw Handle)
{
  if (Handle == PlatformSpecificProcessTraits::Invalid)
    return std::nullopt;

  std::string Link = "/proc/" + std::to_string(Handle) + "/cwd";
  POD<char[PATH_MAX]> Directory;
  auto ReadLink = CheckedErrno(
    [&Link, &Directory] {
      return ::readlink(Link.c_str(), *Directory, PATH_MAX - 1);
    },
    -1);
  if (!ReadLink)
  {
    LOG(debug) << "readlink(" << Link
               << "): " << ReadLink.getError().message();
    return std::nullopt;
  }
  return std::string{*Directory};
}

[[noreturn]] void Process::exec(const SpawnOptions& Opts)
{
  using namespace remux::system::unix;

  LOG(debug) << "----- Process::exec() was called -----";
  LOG(debug) << "        Program: " << Opts.Program;

  std::vector<std::string> Argv;
  Argv.emplace_back(Opts.Program);
  for (std::size_t I = 0; I < Opts.Arguments.size(); ++I)
  {
    Argv.emplace_back(Opts.Arguments[I]);
    LOG(debug) << "        Arg " << std::setw(2) << I << ": "
               << Opts.Arguments[I];
  }
  std::vector<char*> RawArgv;
  for (std::string& Arg : Argv)
    RawArgv.emplace_back(Arg.data());
  RawArgv.emplace_back(nullptr);

  for (const auto& E : Opts.Environment)
  {
    if (!E.second.has_value())
    {
      LOG(debug) << "        Env unset: " << E.first;
      auto Unset =
        CheckedErrno([&K = E.first] { return ::unsetenv(K.c_str()); }, -1);
      if (!Unset)
        LOG(warn) << "unsetenv(" << E.first
                  << "): " << Unset.getError().message();
    }
    else
    {
      LOG(debug) << "        Env   set: " << E.first << " = " << *E.second;
      auto Set = CheckedErrno(
        [&K = E.first, &V = E.second] {
          return ::setenv(K.c_str(), V->c_str(), 1);
        },
        -1);
      if (!Set)
        LOG(warn) << "setenv(" << E.first << "): " << Set.getError().message();
    }
  }

  if (!Opts.WorkingDirectory.empty())
  {
    LOG(debug) << "          cwd: " << Opts.WorkingDirectory;
    CheckedErrnoThrow(
      [&Opts] { return ::chdir(Opts.WorkingDirectory.c_str()); },
      "chdir('" + Opts.WorkingDirectory + "')",
      -1);
  }

  if (!Opts.CreatePTY)
  {
    // Replaces the "Original" file descriptor with the new "With" one.
    auto ReplaceFD = [](fd::raw_fd Original, fd::raw_fd With) {
      if (With == fd::Traits::Invalid)
      {
        fd::Traits::close(Original);
        return;
      }
      CheckedErrnoThrow([=] { return ::dup2(With, Original); }, "dup2()", -1);
      if (With != Original)
        fd::Traits::close(With);
    };
    if (Opts.StandardInput)
      ReplaceFD(fd::fileno(stdin), *Opts.StandardInput);
    if (Opts.StandardOutput)
      ReplaceFD(fd::fileno(stdout), *Opts.StandardOutput);
    if (Opts.StandardError)
      ReplaceFD(fd::fileno(stderr), *Opts.StandardError);
  }

  LOG(debug) << "----- Process::exec() firing... -----";
  auto ExecSuccessful = CheckedErrno(
    [&RawArgv] { return ::execvp(RawArgv.front(), RawArgv.data()); }, -1);
  if (!ExecSuccessful)
  {
    LOG(fatal) << "'exec()' failed: " << ExecSuccessful.getError() << ' '
               << ExecSuccessful.getError().message();
    std::_Exit(-SIGCHLD);
  }
  unreachable("::exec() should've started a new process");
}

std::unique_ptr<Process> Process::spawn(const SpawnOptions& Opts)
{
  std::unique_ptr<Pty> PTY;
  if (Opts.CreatePTY)
    PTY = std::make_unique<unix::Pty>();

  Raw ForkResult =
    CheckedErrnoThrow([] { return ::fork(); }, "fork() failed in spawn()", -1);
  if (ForkResult != 0)
  {
    // We are in the parent.
    std::unique_ptr<Process> P = std::make_unique<unix::Process>();
    P->Handle = ForkResult;
    REMUX_TRACE_LOG(LOG(debug) << "PID " << P->Handle << " spawned.");

    if (PTY)
    {
      PTY->setupParentSide();
      P->PTY = std::move(PTY);
    }
    return P;
  }

  // We are in the child. Nothing may unwind back into the caller's stack.
  try
  {
    CheckedErrnoThrow([] { return ::setsid(); }, "setsid()", -1);
    if (PTY)
      PTY->setupChildrenSide();
    Process::exec(Opts);
  }
  catch (const std::system_error& Err)
  {
    LOG(fatal) << "Setting up the child process failed: " << Err.what();
  }
  std::_Exit(-SIGCHLD);
}

namespace
{

/// \returns whether the process \p PID is dead, and its exit code.
std::pair<bool, int> reapAndGetExitCode(Process::Raw PID, bool Block)
{
  if (PID == PlatformSpecificProcessTraits::Invalid)
    return {true, -1};

  int WaitStatus = 0;
  auto ChangedPID = CheckedErrno(
    [&WaitStatus, PID, Block] {
      return ::waitpid(PID, &WaitStatus, !Block ? WNOHANG : 0);
    },
    -1);
  if (!ChangedPID)
  {
    std::error_code EC = ChangedPID.getError();
    if (EC == std::errc::no_child_process /* ECHILD */)
      // Somebody else reaped the child already.
      return {true, -1};
    throw std::system_error{EC,
                            "waitpid(" + std::to_string(PID) + ", " +
                              std::to_string(Block) + ")"};
  }
  if (ChangedPID.get() != PID)
    return {false, 0};

  REMUX_TRACE_LOG(LOG(trace) << "Successfully reaped child PID " << PID);
  if (WIFEXITED(WaitStatus))
    return {true, WEXITSTATUS(WaitStatus)};
  if (WIFSIGNALED(WaitStatus))
    return {true, -(WTERMSIG(WaitStatus))};

  return {false, 0};
}

} // namespace

namespace unix
{

bool Process::reapIfDead()
{
  if (Dead)
    return true;

  std::pair<bool, int> DeadAndExit = reapAndGetExitCode(Handle, false);
  if (!DeadAndExit.first)
    return false;

  Dead = true;
  ExitCode = DeadAndExit.second;
  return true;
}

void Process::wait()
{
  if (Dead || Handle == PlatformSpecificProcessTraits::Invalid)
    return;

  REMUX_TRACE_LOG(LOG(debug)
                  << "Waiting on child PID " << Handle << " to exit...");
  std::pair<bool, int> DeadAndExit = reapAndGetExitCode(Handle, true);
  Dead = true;
  ExitCode = DeadAndExit.second;
}

// NOLINTNEXTLINE(readability-make-member-function-const)
void Process::signal(int Signal)
{
  if (Dead)
    return;
  system::Process::signal(Handle, Signal);
}

} // namespace unix

void Process::signal(Raw Handle, int Signal)
{
  if (Handle == PlatformSpecificProcessTraits::Invalid)
    return;

  REMUX_TRACE_LOG(LOG(trace)
                  << "Sending signal " << Signal << " to PID " << Handle);
  auto Kill = CheckedErrno(
    [PGroup = -Handle, Signal] { return ::kill(PGroup, Signal); }, -1);
  if (!Kill)
    LOG(debug) << "kill(" << -Handle << ", " << Signal
               << "): " << Kill.getError().message();
}

} // namespace remux::system

#undef LOG
