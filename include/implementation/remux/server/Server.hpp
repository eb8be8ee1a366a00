/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "remux/Timer.hpp"
#include "remux/system/BufferedChannel.hpp"
#include "remux/system/Handle.hpp"
#include "remux/system/IOEvent.hpp"
#include "remux/system/Process.hpp"
#include "remux/system/Socket.hpp"

#include "remux/server/Connection.hpp"
#include "remux/server/EnvironmentService.hpp"
#include "remux/server/ManagementConnection.hpp"
#include "remux/server/PersistentProcess.hpp"
#include "remux/server/ProcessRegistry.hpp"
#include "remux/server/PtyTerminalProcess.hpp"
#include "remux/server/SessionDispatcher.hpp"

namespace remux::server
{

/// The remux server accepts clients on a listening socket, classifies them
/// through the \p SessionDispatcher, and serves the requests of management
/// connections from the \p ProcessRegistry.
///
/// Everything happens on a single thread: \p loop() waits for I/O events and
/// the deadlines of the server's \p TimerQueue, and runs every handler to
/// completion.
///
/// \note Some functionality of the server process (e.g. reaping
/// subprocesses) requires proper signal handling, which the \p Server does
/// \b NOT implement internally! It is up to the program embedding the server to
/// construct and set up appropriate handlers!
class Server
{
public:
  /// The type of message handler functions.
  ///
  /// \param Server The \p Server that received the message.
  /// \param Conn The connection that sent the message.
  /// \param RawMessage A view into the buffer of the message, before any
  /// structural parsing had been applied.
  using HandlerFunction = void(Server& Server,
                               ManagementConnection& Conn,
                               std::string_view RawMessage);

#define REMUX_SERVER_HANDLER_SIGNATURE(NAME)                                   \
  void NAME(Server& Server, ManagementConnection& Conn, std::string_view Message)

/// When used inside a handler function, decodes the message identified by
/// \p MESSAGE_TYPE and makes it automatically available in the local \p Msg
/// variable.
#define REMUX_SERVER_HANDLER_DECODE(MESSAGE_TYPE)                              \
  using namespace remux::message;                                              \
  std::optional<MESSAGE_TYPE> Msg = MESSAGE_TYPE::decode(Message);             \
  if (!Msg)                                                                    \
  {                                                                            \
    LOG(warn) << '"' << Conn.token() << "\": malformed " #MESSAGE_TYPE;        \
    return;                                                                    \
  }                                                                            \
  REMUX_TRACE_LOG(LOG(trace) << __PRETTY_FUNCTION__);

  struct Options
  {
    SessionDispatcher::Options Dispatch;
    PersistentProcess::GraceTimes Grace;
  };

  /// Create a new server that will listen on the associated socket.
  Server(std::unique_ptr<system::Socket>&& Sock,
         EnvironmentService Environment,
         Options Opts);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  [[nodiscard]] std::chrono::time_point<std::chrono::system_clock>
  whenStarted() const noexcept
  {
    return WhenStarted;
  }

  /// Start actively listening and handling connections.
  ///
  /// \note This is a blocking call!
  void loop();

  /// Atomically request the server's \p loop() to die.
  void interrupt() const noexcept;

  /// After the server's \p loop() has terminated, shuts down every persistent
  /// process and disposes every connection.
  void shutdown();

  /// Adds the specified \p PID to the list of subprocesses of the server that
  /// had died. This function is meaningful to be called from a signal handler.
  /// The server's \p loop() will take care of the cleanup in its normal
  /// iteration.
  void registerDeadChild(system::Process::Raw PID) const noexcept;

  [[nodiscard]] TimerQueue& getTimers() noexcept { return Timers; }
  [[nodiscard]] ProcessRegistry& getRegistry() noexcept { return Registry; }
  [[nodiscard]] SessionDispatcher& getDispatcher() noexcept
  {
    return Dispatcher;
  }
  [[nodiscard]] const EnvironmentService& getEnvironment() const noexcept
  {
    return Environment;
  }

private:
  /// A socket accepted but not yet classified by its handshake.
  using PendingHandshake = std::unique_ptr<system::Socket>;
  /// A channel (the client socket, or a helper's channel) of a connection.
  struct ConnectionChannel
  {
    Connection* Conn;
    system::BufferedChannel* Channel;
    bool WantsWrite;
  };
  /// The terminal device of a persistent process.
  struct TerminalOutput
  {
    PtyTerminalProcess* Terminal;
  };
  using LookupVariant =
    std::variant<PendingHandshake, ConnectionChannel, TerminalOutput>;

  std::unique_ptr<system::Socket> Sock;
  EnvironmentService Environment;
  std::chrono::time_point<std::chrono::system_clock> WhenStarted;

  TimerQueue Timers;
  ProcessRegistry Registry;
  SessionDispatcher Dispatcher;
  std::unique_ptr<system::IOEvent> Poll;

  /// Associates a file descriptor to the entity behind it.
  std::map<system::Handle::Raw, LookupVariant> FDLookup;

  /// The owners of child processes the server must reap.
  std::map<system::Process::Raw, PtyTerminalProcess*> TerminalChildren;
  std::map<system::Process::Raw, Connection*> ConnectionChildren;
  /// The terminal device handles of the persistent processes.
  std::map<const PtyTerminalProcess*, system::Handle::Raw> TerminalHandles;

  /// The token of the management connection to notify about the events of
  /// a persistent process.
  std::map<message::ProcessID, std::string> ProcessOwners;

  static constexpr std::size_t DeadChildrenVecSize = 8;
  /// A list of process handles that were signalled to be dead.
  mutable std::array<std::atomic<system::Process::Raw>, DeadChildrenVecSize>
    DeadChildren;
  mutable std::atomic<bool> TerminateLoop;

  void acceptClients();
  void handshakeReceived(system::Handle::Raw FD, PendingHandshake& Pending);
  void terminalReadable(system::Handle::Raw FD, PtyTerminalProcess& Terminal);
  void reapDeadChildren();

  void watchChannel(Connection& Conn, system::BufferedChannel& Channel);
  void unwatch(system::Handle::Raw FD);
  /// Updates the interest of the poll in the writability of the channels,
  /// based on whether they have data pending to be sent.
  void syncWriteInterest();

  std::unique_ptr<TerminalProcess> makeTerminal(TerminalProcess::Options Opts);
  void wireRegistry();
  void connectionCreated(Connection& Conn);
  void connectionClosed(Connection& Conn);

  /// \returns the management connection owning the process \p ID, if it is
  /// online.
  [[nodiscard]] ManagementConnection* ownerOf(message::ProcessID ID) noexcept;
  template <typename T> void notifyOwner(message::ProcessID ID, const T& Msg);

  /// Maps \p MessageKind to handler functions.
  std::map<std::uint16_t, std::function<HandlerFunction>> MainDispatch;

  void setUpMainDispatch();

#define DISPATCH(KIND, FUNCTION_NAME)                                          \
  static REMUX_SERVER_HANDLER_SIGNATURE(FUNCTION_NAME);
#include "remux/server/Dispatch.ipp"

  /// The function responsible for understanding the messages of a
  /// management connection. This method parses the kind of \p RawMessage, and
  /// fires the message-specific handler.
  void dispatchManagement(ManagementConnection& Conn,
                          std::string_view RawMessage);
};

} // namespace remux::server
