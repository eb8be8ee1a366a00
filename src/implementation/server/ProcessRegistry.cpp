/* SPDX-License-Identifier: LGPL-3.0-only */
#include <algorithm>

#include "remux/system/Platform.hpp"

#include "remux/server/ProcessRegistry.hpp"

#include "remux/Log.hpp"
#define LOG(SEVERITY) remux::log::SEVERITY("server/ProcessRegistry")

namespace remux::server
{

ProcessRegistry::ProcessRegistry(TimerQueue& Timers,
                                 TerminalFactory Factory,
                                 PersistentProcess::GraceTimes Grace)
  : Timers(Timers), Factory(std::move(Factory)), Grace(Grace),
    ExitedCleanup(Timers)
{}

ProcessRegistry::~ProcessRegistry() = default;

message::ProcessID ProcessRegistry::create(
  const message::LaunchConfig& Config,
  std::string Cwd,
  std::uint16_t Columns,
  std::uint16_t Rows,
  const std::vector<std::pair<std::string, std::string>>& Environment,
  bool ShouldPersist,
  std::string WorkspaceID,
  std::string WorkspaceName)
{
  if (Config.AttachPersistentProcess)
    throw AttachNotAllowed{*Config.AttachPersistentProcess};

  TerminalProcess::Options Opts;
  Opts.Program =
    Config.Program.empty() ? system::Platform::defaultShell() : Config.Program;
  Opts.Arguments = Config.Arguments;
  Opts.Name = Config.Name;
  Opts.Cwd = std::move(Cwd);
  Opts.Columns = Columns;
  Opts.Rows = Rows;
  for (const auto& KV : Environment)
    Opts.Environment[KV.first] = KV.second;

  std::unique_ptr<TerminalProcess> Terminal = Factory(std::move(Opts));

  PersistentProcess::Configuration PC;
  PC.WorkspaceID = std::move(WorkspaceID);
  PC.WorkspaceName = std::move(WorkspaceName);
  PC.ShouldPersist = ShouldPersist;
  PC.Columns = Columns;
  PC.Rows = Rows;
  PC.Grace = Grace;

  message::ProcessID ID = ++LastID;
  auto P = std::make_unique<PersistentProcess>(
    ID, std::move(Terminal), Timers, std::move(PC));
  wire(*P);
  Processes.try_emplace(ID, std::move(P));

  LOG(info) << "Created persistent process #" << ID << " (workspace \""
            << get(ID).workspaceID() << "\")";
  return ID;
}

void ProcessRegistry::wire(PersistentProcess& P)
{
  message::ProcessID ID = P.id();
  P.onData().connect(
    [this, ID](const std::string& Data) { ProcessDataSignal.fire(ID, Data); });
  P.onReplay().connect([this, ID](const ReplayEvent& Replay) {
    ProcessReplaySignal.fire(ID, Replay);
  });
  P.onExit().connect([this, ID](const std::optional<int>& Code) {
    processExited(ID, Code);
  });
  P.onReady().connect(
    [this, ID](const std::int64_t& PID, const std::string& Cwd) {
      ProcessReadySignal.fire(ID, PID, Cwd);
    });
  P.onTitleChanged().connect([this, ID](const std::string& Title) {
    ProcessTitleSignal.fire(ID, Title);
  });
  P.onOrphanQuestion().connect(
    [this, ID]() { ProcessOrphanQuestionSignal.fire(ID); });
}

void ProcessRegistry::processExited(message::ProcessID ID,
                                    const std::optional<int>& Code)
{
  ProcessExitSignal.fire(ID, Code);

  auto It = Processes.find(ID);
  if (It == Processes.end())
    return;
  LOG(debug) << "Persistent process #" << ID << " removed";
  Exited.emplace_back(std::move(It->second));
  Processes.erase(It);
  ExitedCleanup.arm(TimerQueue::Duration::zero(), [this] { Exited.clear(); });
}

PersistentProcess* ProcessRegistry::tryGet(message::ProcessID ID) noexcept
{
  auto It = Processes.find(ID);
  return It != Processes.end() ? It->second.get() : nullptr;
}

PersistentProcess& ProcessRegistry::get(message::ProcessID ID)
{
  if (PersistentProcess* P = tryGet(ID))
    return *P;
  throw UnknownProcess{ID};
}

const PersistentProcess& ProcessRegistry::get(message::ProcessID ID) const
{
  auto It = Processes.find(ID);
  if (It == Processes.end())
    throw UnknownProcess{ID};
  return *It->second;
}

std::vector<message::ProcessID> ProcessRegistry::ids() const
{
  std::vector<message::ProcessID> R;
  R.reserve(Processes.size());
  for (const auto& E : Processes)
    R.emplace_back(E.first);
  return R;
}

void ProcessRegistry::attach(message::ProcessID ID) { get(ID).attach(); }

void ProcessRegistry::detach(message::ProcessID ID) { get(ID).detach(); }

std::optional<LaunchError> ProcessRegistry::start(message::ProcessID ID)
{
  return get(ID).start();
}

void ProcessRegistry::shutdown(message::ProcessID ID, bool Immediate)
{
  get(ID).shutdown(Immediate);
}

void ProcessRegistry::input(message::ProcessID ID, std::string_view Data)
{
  get(ID).input(Data);
}

void ProcessRegistry::resize(message::ProcessID ID,
                             std::uint16_t Columns,
                             std::uint16_t Rows)
{
  get(ID).resize(Columns, Rows);
}

void ProcessRegistry::acknowledgeDataEvent(message::ProcessID ID,
                                           std::uint64_t CharCount)
{
  get(ID).acknowledgeDataEvent(CharCount);
}

std::string ProcessRegistry::getInitialCwd(message::ProcessID ID) const
{
  return get(ID).getInitialCwd();
}

std::string ProcessRegistry::getCwd(message::ProcessID ID) const
{
  return get(ID).getCwd();
}

std::uint64_t ProcessRegistry::getLatency(message::ProcessID ID) const
{
  return get(ID).getLatency();
}

void ProcessRegistry::orphanQuestionReply(message::ProcessID ID)
{
  get(ID).orphanQuestionReply();
}

void ProcessRegistry::reduceGraceTime(message::ProcessID ID)
{
  get(ID).reduceGraceTime();
}

void ProcessRegistry::isOrphaned(message::ProcessID ID,
                                 OrphanDetector::Callback CB)
{
  get(ID).isOrphaned(std::move(CB));
}

void ProcessRegistry::setLayout(const std::string& WorkspaceID, Layout Tabs)
{
  REMUX_TRACE_LOG(LOG(trace) << "Layout of \"" << WorkspaceID << "\" set to "
                             << Tabs.size() << " tabs");
  Layouts[WorkspaceID] = std::move(Tabs);
}

namespace
{

/// The state of an in-flight layout expansion, shared by the orphan check
/// callbacks of every terminal in the layout.
struct LayoutExpansion
{
  ProcessRegistry::ExpandedLayout Tabs;
  ProcessRegistry::LayoutCallback Done;
  std::size_t Pending = 0;
  bool Collecting = true;

  void finishIfReady()
  {
    if (Collecting || Pending != 0 || !Done)
      return;

    Tabs.erase(std::remove_if(Tabs.begin(),
                              Tabs.end(),
                              [](const message::ExpandedTab& Tab) {
                                return std::none_of(
                                  Tab.Terminals.begin(),
                                  Tab.Terminals.end(),
                                  [](const message::ExpandedTerminal& T) {
                                    return T.Terminal.has_value();
                                  });
                              }),
               Tabs.end());

    ProcessRegistry::LayoutCallback CB = std::move(Done);
    Done = nullptr;
    CB(std::move(Tabs));
  }
};

} // namespace

void ProcessRegistry::getLayout(const std::string& WorkspaceID,
                                LayoutCallback CB)
{
  auto LIt = Layouts.find(WorkspaceID);
  if (LIt == Layouts.end())
  {
    CB(std::nullopt);
    return;
  }

  auto State = std::make_shared<LayoutExpansion>();
  State->Done = std::move(CB);
  State->Tabs.reserve(LIt->second.size());

  // Build the skeleton first, so the callbacks can index into it.
  for (const message::LayoutTab& Tab : LIt->second)
  {
    message::ExpandedTab ET;
    ET.IsActive = Tab.IsActive;
    ET.ActivePersistentTerminal = Tab.ActivePersistentTerminal;
    for (const message::LayoutTerminal& T : Tab.Terminals)
    {
      message::ExpandedTerminal E;
      E.RelativeSize = T.RelativeSize;
      if (PersistentProcess* P = tryGet(T.Terminal))
      {
        message::ProcessDescriptor D;
        D.ID = P->id();
        D.Title = P->title();
        D.PID = P->pid();
        D.WorkspaceID = P->workspaceID();
        D.WorkspaceName = P->workspaceName();
        D.Cwd = P->getCwd();
        E.Terminal = std::move(D);
      }
      ET.Terminals.emplace_back(std::move(E));
    }
    State->Tabs.emplace_back(std::move(ET));
  }

  for (std::size_t TI = 0; TI < State->Tabs.size(); ++TI)
    for (std::size_t I = 0; I < State->Tabs.at(TI).Terminals.size(); ++I)
    {
      const std::optional<message::ProcessDescriptor>& D =
        State->Tabs.at(TI).Terminals.at(I).Terminal;
      if (!D)
        continue;

      ++State->Pending;
      get(D->ID).isOrphaned([State, TI, I](bool IsOrphan) {
        State->Tabs.at(TI).Terminals.at(I).Terminal->IsOrphan = IsOrphan;
        --State->Pending;
        State->finishIfReady();
      });
    }

  State->Collecting = false;
  State->finishIfReady();
}

void ProcessRegistry::shutdownAll()
{
  LOG(info) << "Shutting down " << Processes.size() << " processes...";
  auto Dying = std::move(Processes);
  Processes.clear();
  for (auto& E : Dying)
    E.second->shutdown(/* Immediate =*/true);
  Dying.clear();
  Exited.clear();
  ExitedCleanup.cancel();
}

void ProcessRegistry::reduceGraceTimeAll()
{
  for (auto& E : Processes)
    E.second->reduceGraceTime();
}

} // namespace remux::server

#undef LOG
