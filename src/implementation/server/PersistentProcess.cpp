/* SPDX-License-Identifier: LGPL-3.0-only */
#include "remux/Time.hpp"
#include "remux/adt/scope_guard.hpp"

#include "remux/server/PersistentProcess.hpp"

#include "remux/Log.hpp"
#define LOG(SEVERITY) remux::log::SEVERITY("server/PersistentProcess")
#define LOG_WITH_IDENTIFIER(SEVERITY)                                          \
  LOG(SEVERITY) << "Persistent process #" << ID << ": "

namespace remux::server
{

PersistentProcess::PersistentProcess(message::ProcessID ID,
                                     std::unique_ptr<TerminalProcess> Terminal,
                                     TimerQueue& Timers,
                                     Configuration Config)
  : ID(ID), Config(std::move(Config)), Terminal(std::move(Terminal)),
    Output(this->Config.Columns, this->Config.Rows), LongGrace(Timers),
    ShortGrace(Timers), Orphans(Timers)
{
  this->Terminal->onData().connect([this](const std::string& Data) {
    Output.recordData(Data);
    DataSignal.fire(Data);
  });
  this->Terminal->onExit().connect(
    [this](const std::optional<int>& ExitCode) { exited(ExitCode); });
  this->Terminal->onReady().connect(
    [this](const std::int64_t& PID, const std::string& Cwd) {
      ReadySignal.fire(PID, Cwd);
    });
  this->Terminal->onTitleChanged().connect(
    [this](const std::string& Title) { TitleSignal.fire(Title); });
}

PersistentProcess::~PersistentProcess()
{
  LongGrace.cancel();
  ShortGrace.cancel();
  // Release the remaining askers, the process is gone for them.
  Orphans.cancel();
}

std::optional<LaunchError> PersistentProcess::start()
{
  if (!Started)
  {
    std::optional<LaunchError> Err = Terminal->start();
    if (Err)
    {
      LOG_WITH_IDENTIFIER(error)
        << "Launch failed (" << Err->Code << "): " << Err->Message;
      return Err;
    }
    Started = true;
    return std::nullopt;
  }

  // Reattaching to an already running process.
  ReadySignal.fire(Terminal->pid(), Terminal->initialCwd());
  TitleSignal.fire(Terminal->title());
  triggerReplay();
  return std::nullopt;
}

void PersistentProcess::attach()
{
  if (LongGrace.isArmed() || ShortGrace.isArmed())
    LOG_WITH_IDENTIFIER(debug) << "Reconnected within the grace period";
  LongGrace.cancel();
  ShortGrace.cancel();
}

void PersistentProcess::detach()
{
  if (!Config.ShouldPersist)
  {
    LOG_WITH_IDENTIFIER(debug) << "Detached, and not persistent";
    shutdown(/* Immediate =*/true);
    return;
  }

  LongGrace.arm(Config.Grace.Long,
                [this] { graceExpired(Config.Grace.Long); });
}

void PersistentProcess::input(std::string_view Data)
{
  if (InReplay)
    return;
  Terminal->input(Data);
}

void PersistentProcess::resize(std::uint16_t Columns, std::uint16_t Rows)
{
  if (InReplay)
    return;
  Output.recordResize(Columns, Rows);
  Terminal->resize(Columns, Rows);
}

void PersistentProcess::acknowledgeDataEvent(std::uint64_t CharCount)
{
  if (InReplay)
    return;
  Terminal->acknowledgeDataEvent(CharCount);
}

void PersistentProcess::reduceGraceTime()
{
  if (ShortGrace.isArmed())
    return;
  if (LongGrace.isArmed())
    ShortGrace.arm(Config.Grace.Short,
                   [this] { graceExpired(Config.Grace.Short); });
}

void PersistentProcess::triggerReplay()
{
  ReplayEvent Replay = Output.generateReplay();
  LOG_WITH_IDENTIFIER(debug) << "Replaying " << Replay.DataSize
                             << " bytes of output in " << Replay.Events.size()
                             << " events";
  {
    restore_guard InReplayGuard{InReplay};
    InReplay = true;
    ReplaySignal.fire(Replay);
  }
  Terminal->clearUnacknowledgedChars();
}

void PersistentProcess::isOrphaned(OrphanDetector::Callback CB)
{
  if (LongGrace.isArmed() || ShortGrace.isArmed())
  {
    CB(true);
    return;
  }

  if (Orphans.probe(std::move(CB)))
    OrphanQuestionSignal.fire();
}

void PersistentProcess::orphanQuestionReply() { Orphans.reply(); }

void PersistentProcess::shutdown(bool Immediate)
{
  if (Exited)
    return;
  if (!Started)
  {
    LOG_WITH_IDENTIFIER(debug) << "Shut down before the program was started";
    exited(std::nullopt);
    return;
  }
  Terminal->shutdown(Immediate);
}

const std::string& PersistentProcess::getInitialCwd() const
{
  return Terminal->initialCwd();
}

std::string PersistentProcess::getCwd() const { return Terminal->currentCwd(); }

std::string PersistentProcess::title() const { return Terminal->title(); }

std::int64_t PersistentProcess::pid() const { return Terminal->pid(); }

void PersistentProcess::graceExpired(std::chrono::milliseconds Window)
{
  if (Started)
    LOG_WITH_IDENTIFIER(info)
      << "The reconnection grace time of " << formatDuration(Window)
      << " has expired, shutting down PID " << pid();
  else
    LOG_WITH_IDENTIFIER(info)
      << "The reconnection grace time of " << formatDuration(Window)
      << " has expired before the program was started";
  shutdown(/* Immediate =*/true);
}

void PersistentProcess::exited(std::optional<int> ExitCode)
{
  if (Exited)
    return;
  LOG_WITH_IDENTIFIER(debug) << "Exited with code " << ExitCode.value_or(0);
  Exited = true;
  LongGrace.cancel();
  ShortGrace.cancel();
  Orphans.cancel();
  ExitSignal.fire(ExitCode);
}

} // namespace remux::server

#undef LOG_WITH_IDENTIFIER
#undef LOG
