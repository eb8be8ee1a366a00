/* SPDX-License-Identifier: LGPL-3.0-only */
#include <chrono>
#include <iomanip>
#include <thread>
#include <vector>

#include "remux/CheckedErrno.hpp"
#include "remux/Config.h"
#include "remux/message/PascalString.hpp"
#include "remux/system/BufferedChannel.hpp"
#include "remux/system/Handle.hpp"
#include "remux/system/IOEvent.hpp"
#include "remux/system/Process.hpp"

#ifdef REMUX_PLATFORM_UNIX
#include <sys/wait.h>

#include "remux/system/EPoll.hpp"
#include "remux/system/fd.hpp"
#endif /* REMUX_PLATFORM_UNIX */

#include "remux/server/Server.hpp"

#include "remux/Log.hpp"
#define LOG(SEVERITY) remux::log::SEVERITY("server/Server")

namespace remux::server
{

namespace
{

constexpr std::size_t ListenQueue = 16;
constexpr std::size_t EventQueue = 1 << 13;

} // namespace

Server::Server(std::unique_ptr<system::Socket>&& Sock,
               EnvironmentService Environment,
               Options Opts)
  : Sock(std::move(Sock)), Environment(std::move(Environment)),
    Registry(
      Timers,
      [this](TerminalProcess::Options TO) {
        return makeTerminal(std::move(TO));
      },
      Opts.Grace),
    Dispatcher(this->Environment, std::move(Opts.Dispatch)),
    TerminateLoop(false)
{
  for (auto& PID : DeadChildren)
    PID.store(system::PlatformSpecificProcessTraits::Invalid);

#ifdef REMUX_PLATFORM_UNIX
  Poll = std::make_unique<system::unix::EPoll>(EventQueue);
#endif /* REMUX_PLATFORM_UNIX */

  setUpMainDispatch();
  wireRegistry();
  Dispatcher.onClientConnected().connect(
    [this](Connection* Conn) { connectionCreated(*Conn); });
}

Server::~Server()
{
  // Processes and connections report their closing handles to the poll.
  shutdown();
}

/// Reschedules the overflown buffer identified by \p BO to the next iteration
/// of \p Poll.
static void rescheduleOverflow(system::IOEvent& Poll,
                               const system::BufferedChannel::OverflowError& BO)
{
  Poll.schedule(BO.fd(), BO.readOverflow(), BO.writeOverflow());
}

void Server::loop()
{
  using namespace remux::system;

  WhenStarted = std::chrono::system_clock::now();

  if (!Poll)
  {
    LOG(fatal) << "No I/O Event poll was created, but this is a critical "
                  "needed functionality.";
    return;
  }

#ifdef REMUX_PLATFORM_UNIX
  unix::fd::addStatusFlag(Sock->raw(), O_NONBLOCK);
#endif /* REMUX_PLATFORM_UNIX */
  Poll->listen(Sock->raw(), /* Incoming =*/true, /* Outgoing =*/false);
  Sock->listen(ListenQueue);
  LOG(info) << "Listening on " << Sock->identifier();

  while (!TerminateLoop.load())
  {
    const std::size_t NumTriggeredFDs = Poll->wait(Timers.untilNextDeadline());
    REMUX_TRACE_LOG(LOG(data) << NumTriggeredFDs << " events received!");
    for (std::size_t I = 0; I < NumTriggeredFDs; ++I)
    {
      IOEvent::EventWithMode Event = Poll->eventAt(I);
      if (!Handle::isValid(Event.FD))
      {
        LOG(error) << '#' << I
                   << " event received but there was no associated file";
        continue;
      }

      if (Event.FD == Sock->raw())
      {
        acceptClients();
        continue;
      }

      REMUX_TRACE_LOG(LOG(trace)
                      << "Event on file descriptor " << Event.FD
                      << " (incoming: " << std::boolalpha << Event.Incoming
                      << ", outgoing: " << Event.Outgoing << std::noboolalpha
                      << ')');

      auto Entity = FDLookup.find(Event.FD);
      if (Entity == FDLookup.end())
      {
        // The entity could have been closed while handling an earlier event
        // of the same iteration.
        REMUX_TRACE_LOG(LOG(trace) << "\tEntity for file descriptor "
                                   << Event.FD << " missing from lookup table");
        continue;
      }

      try
      {
        if (auto* Terminal = std::get_if<TerminalOutput>(&Entity->second))
        {
          // Data coming from a persistent process is the most populous in
          // terms of bandwidth.
          terminalReadable(Event.FD, *Terminal->Terminal);
          continue;
        }
        if (auto* Channel = std::get_if<ConnectionChannel>(&Entity->second))
        {
          ConnectionChannel C = *Channel;
          if (Event.Outgoing && !C.Channel->failed())
            C.Channel->flushWrites();
          if (Event.Incoming)
            C.Conn->readable(*C.Channel);
          continue;
        }
        if (auto* Pending = std::get_if<PendingHandshake>(&Entity->second))
        {
          handshakeReceived(Event.FD, *Pending);
          continue;
        }
      }
      catch (const BufferedChannel::OverflowError& BO)
      {
        LOG(error) << "Generic handling error:\n\t" << BO.what();
        rescheduleOverflow(*Poll, BO);
      }
      catch (const std::system_error& Err)
      {
        // Do not tear the server down just because of an error on one of
        // the sockets.
        LOG(error) << "Generic handling error:\n\t" << Err.what();
      }
    }

    reapDeadChildren();
    Timers.fireExpired();
    syncWriteInterest();
    Dispatcher.collectDisposed();
  }

  LOG(debug) << "Event loop stopped";
}

void Server::interrupt() const noexcept { TerminateLoop.store(true); }

void Server::shutdown()
{
  if (Registry.size() == 0 && Dispatcher.size() == 0 && FDLookup.empty())
    return;

  LOG(info) << "Shutting down all persistent processes...";
  Registry.shutdownAll();

  LOG(info) << "Disposing all connections...";
  Dispatcher.disposeAll();

  Dispatcher.collectDisposed();

  if (Poll)
    for (const auto& E : FDLookup)
      Poll->stop(E.first);
  FDLookup.clear();
}

void Server::registerDeadChild(system::Process::Raw PID) const noexcept
{
  for (std::atomic<system::Process::Raw>& Slot : DeadChildren)
  {
    system::Process::Raw Expected =
      system::PlatformSpecificProcessTraits::Invalid;
    if (Slot.compare_exchange_strong(Expected, PID))
      return;
  }
}

void Server::acceptClients()
{
  while (true)
  {
    std::error_code Error;
    bool Recoverable;
    std::unique_ptr<system::Socket> ClientSock =
      Sock->accept(&Error, &Recoverable);
    if (!ClientSock)
    {
      if (Error == std::errc::operation_would_block ||
          Error == std::errc::resource_unavailable_try_again)
        return;

      if (Recoverable)
      {
        LOG(warn) << "accept() did not succeed: " << Error;
        std::this_thread::sleep_for(std::chrono::seconds(1));
        continue;
      }
      LOG(error) << "accept() did not succeed: " << Error
                 << " (not recoverable)";
      return;
    }

    system::Handle::Raw FD = ClientSock->raw();
    LOG(debug) << "Accepted " << ClientSock->identifier();
    if (FDLookup.find(FD) != FDLookup.end())
    {
      LOG(debug) << "Stale entity of file descriptor " << FD
                 << " left behind?";
      unwatch(FD);
    }

#ifdef REMUX_PLATFORM_UNIX
    system::unix::fd::setNonBlockingCloseOnExec(FD);
#endif /* REMUX_PLATFORM_UNIX */
    Poll->listen(FD, /* Incoming =*/true, /* Outgoing =*/false);
    FDLookup[FD] = std::move(ClientSock);
  }
}

void Server::handshakeReceived(system::Handle::Raw FD,
                               PendingHandshake& Pending)
{
  system::Socket& S = *Pending;
  std::optional<std::string> Payload;
  try
  {
    S.load(S.optimalReadSize());
    Payload = message::extractPascalString(S);
  }
  catch (const message::MalformedStream& MS)
  {
    LOG(warn) << S.identifier() << ": " << MS.what();
    unwatch(FD);
    return;
  }
  catch (const std::system_error& Err)
  {
    LOG(debug) << S.identifier() << ": " << Err.what();
  }

  if (!Payload)
  {
    if (S.failed())
    {
      LOG(debug) << S.identifier() << " closed before the handshake";
      unwatch(FD);
    }
    return;
  }

  // The socket is handed over to the dispatcher, the connection that takes
  // it over announces it again.
  PendingHandshake Socket = std::move(Pending);
  Poll->stop(FD);
  FDLookup.erase(FD);
  (void)Dispatcher.handleHandshake(std::move(Socket), *Payload);
}

void Server::terminalReadable(system::Handle::Raw FD,
                              PtyTerminalProcess& Terminal)
{
  Terminal.readOutput();
  if (!Terminal.hungUp())
    return;

  // The terminal keeps reporting the hangup, so it is not watched anymore.
  // If the process is not yet dead, SIGCHLD will tell.
  LOG(debug) << "Terminal " << FD << " hung up";
  Poll->stop(FD);
  (void)Terminal.reap();
}

void Server::reapDeadChildren()
{
  bool AnyDied = false;
  for (std::atomic<system::Process::Raw>& Slot : DeadChildren)
  {
    system::Process::Raw PID =
      Slot.exchange(system::PlatformSpecificProcessTraits::Invalid);
    if (PID == system::PlatformSpecificProcessTraits::Invalid)
      continue;
    AnyDied = true;

    if (TerminalChildren.find(PID) != TerminalChildren.end() ||
        ConnectionChildren.find(PID) != ConnectionChildren.end())
      continue;

#ifdef REMUX_PLATFORM_UNIX
    // A child that is not owned by anything anymore, e.g. an extension host
    // of a disposed connection.
    auto Wait = CheckedErrno([PID] { return ::waitpid(PID, nullptr, WNOHANG); },
                             -1);
    if (!Wait)
      LOG(trace) << "waitpid(" << PID << "): " << Wait.getError().message();
    else if (Wait.get() == PID)
      LOG(debug) << "Reaped unowned child PID " << PID;
#endif /* REMUX_PLATFORM_UNIX */
  }
  if (!AnyDied)
    return;

  // Signals of multiple children might have been merged into one, so every
  // known child is checked.
  std::vector<std::pair<system::Process::Raw, PtyTerminalProcess*>> Terminals{
    TerminalChildren.begin(), TerminalChildren.end()};
  for (const auto& E : Terminals)
    if (TerminalChildren.count(E.first))
      (void)E.second->reap();

  std::vector<std::pair<system::Process::Raw, Connection*>> Helpers{
    ConnectionChildren.begin(), ConnectionChildren.end()};
  for (const auto& E : Helpers)
    if (ConnectionChildren.count(E.first))
      E.second->childExited(E.first);
}

void Server::watchChannel(Connection& Conn, system::BufferedChannel& Channel)
{
  system::Handle::Raw FD = Channel.raw();
  REMUX_TRACE_LOG(LOG(trace) << "Watching " << Channel.identifier() << " of "
                             << message::connectionTypeName(Conn.type())
                             << " \"" << Conn.token() << '"');
#ifdef REMUX_PLATFORM_UNIX
  system::unix::fd::setNonBlockingCloseOnExec(FD);
#endif /* REMUX_PLATFORM_UNIX */

  bool WantsWrite = Channel.hasBufferedWrite();
  if (Poll->isListening(FD))
    Poll->modify(FD, /* Incoming =*/true, WantsWrite);
  else
    Poll->listen(FD, /* Incoming =*/true, WantsWrite);
  FDLookup[FD] = ConnectionChannel{&Conn, &Channel, WantsWrite};

  if (Channel.readInBuffer() > 0)
    // Data that arrived before the channel was watched.
    Poll->schedule(FD, /* Incoming =*/true, /* Outgoing =*/false);
}

void Server::unwatch(system::Handle::Raw FD)
{
  Poll->stop(FD);
  FDLookup.erase(FD);
}

void Server::syncWriteInterest()
{
  for (auto& E : FDLookup)
  {
    auto* C = std::get_if<ConnectionChannel>(&E.second);
    if (!C)
      continue;

    bool WantsWrite = !C->Channel->failed() && C->Channel->hasBufferedWrite();
    if (WantsWrite == C->WantsWrite)
      continue;
    Poll->modify(E.first, /* Incoming =*/true, WantsWrite);
    C->WantsWrite = WantsWrite;
  }
}

std::unique_ptr<TerminalProcess>
Server::makeTerminal(TerminalProcess::Options Opts)
{
  auto Terminal = std::make_unique<PtyTerminalProcess>(std::move(Opts));
  PtyTerminalProcess* T = Terminal.get();

  T->onSpawned().connect(
    [this, T](system::Handle::Raw FD, system::Process::Raw PID) {
      Poll->listen(FD, /* Incoming =*/true, /* Outgoing =*/false);
      FDLookup[FD] = TerminalOutput{T};
      TerminalHandles[T] = FD;
      TerminalChildren[PID] = T;
    });
  T->onFlowControl().connect([this, T](bool Paused) {
    auto It = TerminalHandles.find(T);
    if (It == TerminalHandles.end())
      return;
    if (Paused)
      Poll->stop(It->second);
    else if (!T->hungUp())
      Poll->listen(It->second, /* Incoming =*/true, /* Outgoing =*/false);
  });
  T->onClosing().connect(
    [this, T](system::Handle::Raw FD, system::Process::Raw PID) {
      unwatch(FD);
      TerminalHandles.erase(T);
      TerminalChildren.erase(PID);
    });

  return Terminal;
}

ManagementConnection* Server::ownerOf(message::ProcessID ID) noexcept
{
  auto It = ProcessOwners.find(ID);
  if (It == ProcessOwners.end())
    return nullptr;

  Connection* Conn =
    Dispatcher.tryGetConnection(message::ConnectionType::Management, It->second);
  if (!Conn || Conn->isDisposed() || !Conn->isOnline())
    return nullptr;
  return static_cast<ManagementConnection*>(Conn);
}

template <typename T>
void Server::notifyOwner(message::ProcessID ID, const T& Msg)
{
  ManagementConnection* Owner = ownerOf(ID);
  if (!Owner)
  {
    REMUX_TRACE_LOG(LOG(trace) << "Process #" << ID
                               << " has no online owner, notification dropped");
    return;
  }

  try
  {
    (void)Owner->send(Msg);
  }
  catch (const system::BufferedChannel::OverflowError& BO)
  {
    LOG(warn) << "Process #" << ID << ": owner \"" << Owner->token()
              << "\" is not reading its socket: " << BO.what();
    Owner->goOffline();
  }
  catch (const std::system_error& Err)
  {
    LOG(debug) << "Process #" << ID << ": sending to owner \""
               << Owner->token() << "\" failed: " << Err.what();
    Owner->goOffline();
  }
}

void Server::wireRegistry()
{
  using namespace remux::message::notification;

  Registry.onProcessData().connect(
    [this](message::ProcessID ID, const std::string& Data) {
      ProcessData Msg;
      Msg.ID = ID;
      Msg.Data = Data;
      notifyOwner(ID, Msg);
    });
  Registry.onProcessReplay().connect(
    [this](message::ProcessID ID, const ReplayEvent& Replay) {
      ProcessReplay Msg;
      Msg.ID = ID;
      Msg.Events = Replay.Events;
      Msg.StartColumns = Replay.StartColumns;
      Msg.StartRows = Replay.StartRows;
      notifyOwner(ID, Msg);
    });
  Registry.onProcessExit().connect(
    [this](message::ProcessID ID, const std::optional<int>& Code) {
      ProcessExit Msg;
      Msg.ID = ID;
      Msg.ExitCode = Code;
      notifyOwner(ID, Msg);
      ProcessOwners.erase(ID);
    });
  Registry.onProcessReady().connect(
    [this](message::ProcessID ID, std::int64_t PID, const std::string& Cwd) {
      ProcessReady Msg;
      Msg.ID = ID;
      Msg.PID = PID;
      Msg.Cwd = Cwd;
      notifyOwner(ID, Msg);
    });
  Registry.onProcessTitleChanged().connect(
    [this](message::ProcessID ID, const std::string& Title) {
      ProcessTitle Msg;
      Msg.ID = ID;
      Msg.Title = Title;
      notifyOwner(ID, Msg);
    });
  Registry.onProcessOrphanQuestion().connect([this](message::ProcessID ID) {
    ProcessOrphanQuestion Msg;
    Msg.ID = ID;
    notifyOwner(ID, Msg);
  });
}

void Server::connectionCreated(Connection& Conn)
{
  LOG(info) << message::connectionTypeName(Conn.type()) << " \""
            << Conn.token() << "\" connected";

  Conn.onChannelOpened().connect([this, &Conn](system::BufferedChannel* Ch) {
    watchChannel(Conn, *Ch);
  });
  Conn.onChannelClosing().connect(
    [this](system::Handle::Raw FD) { unwatch(FD); });
  Conn.onChildSpawned().connect([this, &Conn](system::Process::Raw PID) {
    ConnectionChildren[PID] = &Conn;
  });
  Conn.onClose().connect(
    [this, &Conn](const std::string& /* Reason */) { connectionClosed(Conn); });

  if (Conn.type() == message::ConnectionType::Management)
  {
    auto& MC = static_cast<ManagementConnection&>(Conn);
    MC.onMessage().connect([this, &MC](const std::string& RawMessage) {
      dispatchManagement(MC, RawMessage);
    });
  }
}

void Server::connectionClosed(Connection& Conn)
{
  for (auto It = FDLookup.begin(); It != FDLookup.end();)
  {
    auto* C = std::get_if<ConnectionChannel>(&It->second);
    if (C && C->Conn == &Conn)
    {
      Poll->stop(It->first);
      It = FDLookup.erase(It);
    }
    else
      ++It;
  }
  for (auto It = ConnectionChildren.begin(); It != ConnectionChildren.end();)
    if (It->second == &Conn)
      It = ConnectionChildren.erase(It);
    else
      ++It;

  if (Conn.type() == message::ConnectionType::Management)
  {
    LOG(debug) << "Management connection \"" << Conn.token()
               << "\" closed, reducing grace times";
    Registry.reduceGraceTimeAll();
  }
}

void Server::dispatchManagement(ManagementConnection& Conn,
                                std::string_view RawMessage)
{
  using namespace remux::message;
  Message MB = Message::unpack(RawMessage);
  REMUX_TRACE_LOG(LOG(data) << "Management \"" << Conn.token() << "\"\n"
                            << MB.RawData);

  using Kind = decltype(MainDispatch)::key_type;
  auto Action = MainDispatch.find(static_cast<Kind>(MB.Kind));
  if (Action == MainDispatch.end())
  {
    LOG(warn) << "Management \"" << Conn.token() << "\": unknown message type "
              << static_cast<int>(MB.Kind) << " received";
    return;
  }

  try
  {
    Action->second(*this, Conn, MB.RawData);
  }
  catch (const system::BufferedChannel::OverflowError& BO)
  {
    LOG(trace) << "Management \"" << Conn.token()
               << "\": error when handling message\n\t" << BO.what();
    rescheduleOverflow(*Poll, BO);
  }
  catch (const std::system_error& Err)
  {
    LOG(error) << "Management \"" << Conn.token()
               << "\": error when handling message: " << Err.what();
    if (Conn.socket() && Conn.socket()->failed())
      Conn.goOffline();
  }
}

} // namespace remux::server

#undef LOG
