/* SPDX-License-Identifier: LGPL-3.0-only */
#include <algorithm>
#include <csignal>
#include <filesystem>
#include <system_error>

#include "remux/system/Environment.hpp"
#include "remux/system/Pty.hpp"

#include "remux/server/PtyTerminalProcess.hpp"

#include "remux/Log.hpp"
#define LOG(SEVERITY) remux::log::SEVERITY("server/PtyTerminalProcess")
#define LOG_WITH_IDENTIFIER(SEVERITY) LOG(SEVERITY) << Title << ": "

namespace fs = std::filesystem;

namespace remux::server
{

namespace
{

constexpr std::size_t ReadChunkSize = 1ULL << 14; // 16 KiB

bool isExecutableFile(const fs::path& P)
{
  std::error_code EC;
  fs::file_status S = fs::status(P, EC);
  if (EC || !fs::is_regular_file(S))
    return false;
  return (S.permissions() & (fs::perms::owner_exec | fs::perms::group_exec |
                             fs::perms::others_exec)) != fs::perms::none;
}

/// \returns whether \p Program names an executable, either directly or by
/// looking it up in \p PATH.
bool resolvesToExecutable(const std::string& Program)
{
  if (Program.find('/') != std::string::npos)
    return isExecutableFile(Program);

  std::string Path = system::getEnv("PATH");
  std::size_t Begin = 0;
  while (Begin <= Path.size())
  {
    std::size_t End = Path.find(':', Begin);
    if (End == std::string::npos)
      End = Path.size();
    std::string Directory = Path.substr(Begin, End - Begin);
    if (Directory.empty())
      Directory = ".";
    if (isExecutableFile(fs::path{Directory} / Program))
      return true;
    Begin = End + 1;
  }
  return false;
}

} // namespace

PtyTerminalProcess::PtyTerminalProcess(Options Opts) : Opts(std::move(Opts))
{
  InitialCwd = this->Opts.Cwd;
  if (InitialCwd.empty())
  {
    std::error_code EC;
    InitialCwd = fs::current_path(EC).string();
  }

  Title = this->Opts.Name;
  if (Title.empty())
    Title = fs::path{this->Opts.Program}.filename().string();
}

PtyTerminalProcess::~PtyTerminalProcess()
{
  if (Child && !Child->dead() && !Closed)
  {
    LOG_WITH_IDENTIFIER(debug) << "Hanging up PID " << Child->raw();
    Child->signal(SIGHUP);
  }
  close();
}

std::optional<LaunchError> PtyTerminalProcess::checkLaunchable() const
{
  if (!Opts.Cwd.empty())
  {
    std::error_code EC;
    if (!fs::exists(Opts.Cwd, EC))
      return LaunchError{"Starting directory (cwd) \"" + Opts.Cwd +
                           "\" does not exist",
                         static_cast<int>(std::errc::no_such_file_or_directory)};
    if (!fs::is_directory(Opts.Cwd, EC))
      return LaunchError{"Starting directory (cwd) \"" + Opts.Cwd +
                           "\" is not a directory",
                         static_cast<int>(std::errc::not_a_directory)};
  }

  if (Opts.Program.empty())
    return LaunchError{"No program to execute was specified",
                       static_cast<int>(std::errc::invalid_argument)};
  if (!resolvesToExecutable(Opts.Program))
    return LaunchError{"Path to shell executable \"" + Opts.Program +
                         "\" does not exist",
                       static_cast<int>(std::errc::no_such_file_or_directory)};

  return std::nullopt;
}

std::optional<LaunchError> PtyTerminalProcess::start()
{
  if (Child)
    return std::nullopt;

  if (std::optional<LaunchError> Err = checkLaunchable())
  {
    LOG_WITH_IDENTIFIER(error) << "Can not launch: " << Err->Message;
    return Err;
  }

  system::Process::SpawnOptions SO;
  SO.Program = Opts.Program;
  SO.Arguments = Opts.Arguments;
  SO.Environment = Opts.Environment;
  SO.WorkingDirectory = Opts.Cwd;
  SO.CreatePTY = true;

  try
  {
    Child = system::Process::spawn(SO);
  }
  catch (const std::system_error& Err)
  {
    LOG_WITH_IDENTIFIER(error) << "Spawning failed: " << Err.what();
    return LaunchError{Err.what(), Err.code().value()};
  }

  try
  {
    Child->getPty()->setSize(Opts.Rows, Opts.Columns);
  }
  catch (const std::system_error& Err)
  {
    LOG_WITH_IDENTIFIER(warn) << "Setting initial size failed: " << Err.what();
  }

  LOG_WITH_IDENTIFIER(info) << "Started PID " << Child->raw() << " on "
                            << Child->getPty()->name();
  SpawnedSignal.fire(Child->getPty()->raw(), Child->raw());
  ReadySignal.fire(pid(), InitialCwd);
  TitleSignal.fire(Title);
  return std::nullopt;
}

void PtyTerminalProcess::input(std::string_view Data)
{
  if (!Child || Child->dead() || !Child->hasPty())
    return;
  Child->getPty()->write(Data);
}

void PtyTerminalProcess::resize(std::uint16_t Columns, std::uint16_t Rows)
{
  Opts.Columns = Columns;
  Opts.Rows = Rows;
  if (!Child || Child->dead() || !Child->hasPty())
    return;

  try
  {
    Child->getPty()->setSize(Rows, Columns);
  }
  catch (const std::system_error& Err)
  {
    LOG_WITH_IDENTIFIER(warn) << "Resize failed: " << Err.what();
  }
}

void PtyTerminalProcess::acknowledgeDataEvent(std::uint64_t CharCount)
{
  Unacknowledged -= std::min(CharCount, Unacknowledged);
  if (Paused && Unacknowledged < LowWatermarkChars)
    setPaused(false);
}

void PtyTerminalProcess::clearUnacknowledgedChars()
{
  Unacknowledged = 0;
  if (Paused)
    setPaused(false);
}

void PtyTerminalProcess::shutdown(bool Immediate)
{
  if (!Child || Child->dead())
    return;

  if (Closed)
    return;

  LOG_WITH_IDENTIFIER(debug) << "Shutting down PID " << Child->raw()
                             << (Immediate ? " immediately" : "");
  Child->signal(Immediate ? SIGKILL : SIGHUP);
  if (!Immediate)
    return;

  // A killed program is gone for the clients at once. The zombie is left
  // for the owner's event loop to collect, as an unowned child.
  LOG_WITH_IDENTIFIER(info) << "PID " << Child->raw() << " killed";
  close();
  ExitSignal.fire(std::nullopt);
}

std::string PtyTerminalProcess::currentCwd() const
{
  if (!Child || Child->dead())
    return InitialCwd;
  return system::Process::workingDirectoryOf(Child->raw()).value_or(InitialCwd);
}

std::int64_t PtyTerminalProcess::pid() const
{
  if (!Child)
    return 0;
  return static_cast<std::int64_t>(Child->raw());
}

bool PtyTerminalProcess::hungUp() const noexcept
{
  return Child && Child->hasPty() && Child->getPty()->hungUp();
}

void PtyTerminalProcess::readOutput() { drain(/* Force =*/false); }

void PtyTerminalProcess::drain(bool Force)
{
  if (!Child || !Child->hasPty())
    return;

  system::Pty& Terminal = *Child->getPty();
  while (Force || !Paused)
  {
    std::string Chunk;
    try
    {
      Chunk = Terminal.read(ReadChunkSize);
    }
    catch (const std::system_error& Err)
    {
      LOG_WITH_IDENTIFIER(error) << "Reading output failed: " << Err.what();
      break;
    }
    if (Chunk.empty())
      break;

    Unacknowledged += Chunk.size();
    DataSignal.fire(Chunk);
    if (!Paused && Unacknowledged >= HighWatermarkChars)
      setPaused(true);
  }
}

void PtyTerminalProcess::setPaused(bool Paused)
{
  this->Paused = Paused;
  REMUX_TRACE_LOG(LOG_WITH_IDENTIFIER(trace)
                  << (Paused ? "Pausing" : "Resuming") << " output with "
                  << Unacknowledged << " unacknowledged characters");
  FlowControlSignal.fire(Paused);
}

bool PtyTerminalProcess::reap()
{
  if (!Child)
    return false;
  if (Closed)
    return true;
  if (!Child->reapIfDead())
    return false;

  drain(/* Force =*/true);
  LOG_WITH_IDENTIFIER(info) << "PID " << Child->raw() << " exited with "
                            << Child->exitCode().value_or(0);
  close();
  ExitSignal.fire(Child->exitCode());
  return true;
}

void PtyTerminalProcess::close()
{
  if (Closed || !Child || !Child->hasPty())
    return;
  Closed = true;
  ClosingSignal.fire(Child->getPty()->raw(), Child->raw());
}

} // namespace remux::server

#undef LOG_WITH_IDENTIFIER
#undef LOG
