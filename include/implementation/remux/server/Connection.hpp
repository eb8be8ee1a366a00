/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "remux/adt/Signal.hpp"
#include "remux/message/Message.hpp"
#include "remux/system/BufferedChannel.hpp"
#include "remux/system/Handle.hpp"
#include "remux/system/Process.hpp"
#include "remux/system/Socket.hpp"

namespace remux::server
{

/// A logical, token-identified connection of a client. The physical socket
/// of the connection might come and go: when it closes, the connection goes
/// offline, and a reconnecting client with the same token rebinds it.
///
/// The event loop owning the connection learns about the handles it needs
/// to watch through the \p onChannelOpened(), \p onChannelClosing() and
/// \p onChildSpawned() signals.
class Connection
{
public:
  using Clock = std::chrono::system_clock;
  using TimePoint = Clock::time_point;

  virtual ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;
  Connection(Connection&&) = delete;
  Connection& operator=(Connection&&) = delete;

  [[nodiscard]] const std::string& token() const noexcept { return Token; }
  [[nodiscard]] message::ConnectionType type() const noexcept { return Type; }

  /// \returns the time the connection went offline, if it is offline.
  [[nodiscard]] std::optional<TimePoint> offline() const noexcept
  {
    return OfflineSince;
  }
  [[nodiscard]] bool isOnline() const noexcept
  {
    return static_cast<bool>(BoundSocket);
  }
  [[nodiscard]] bool isDisposed() const noexcept { return Disposed; }
  /// \returns the socket currently bound to the connection, or \p nullptr if
  /// the connection is offline.
  [[nodiscard]] system::Socket* socket() noexcept { return BoundSocket.get(); }

  /// Binds the first socket of the connection. \p Buffer contains the bytes
  /// that arrived on the socket together with the handshake.
  void open(std::unique_ptr<system::Socket> Socket, std::string Buffer);

  /// Rebinds the connection to the \p Socket of a reconnecting client. The
  /// previous socket, if any, is closed. \p Buffer is processed as if it had
  /// just arrived on the new socket.
  void reconnect(std::unique_ptr<system::Socket> Socket, std::string Buffer);

  /// Unbinds the socket and stamps the time the connection went offline.
  /// Going offline again keeps the original timestamp.
  void goOffline(TimePoint When = Clock::now());

  /// Tears down the connection and its resources, and fires \p onClose().
  /// Subsequent calls do nothing.
  void dispose(const std::string& Reason);

  /// Called by the event loop when \p Channel, which is either the bound
  /// socket or another channel announced by the connection, is readable.
  virtual void readable(system::BufferedChannel& Channel) = 0;

  /// Called by the event loop when the child process \p PID announced by the
  /// connection had died.
  virtual void childExited(system::Process::Raw PID);

  /// Fired exactly once, when the connection is disposed, with the reason.
  Signal<std::string>& onClose() noexcept { return CloseSignal; }
  Signal<system::BufferedChannel*>& onChannelOpened() noexcept
  {
    return ChannelOpenedSignal;
  }
  /// Fired before the channel identified by the handle is closed.
  Signal<system::Handle::Raw>& onChannelClosing() noexcept
  {
    return ChannelClosingSignal;
  }
  Signal<system::Process::Raw>& onChildSpawned() noexcept
  {
    return ChildSpawnedSignal;
  }

protected:
  Connection(message::ConnectionType Type, std::string Token);

  /// Called after the first socket was bound.
  virtual void opened(std::string Buffer) = 0;
  /// Called after a new socket was bound to an existing connection.
  virtual void reconnected(std::string Buffer) = 0;
  /// Called during \p dispose() to release flavour-specific resources.
  virtual void disposing() {}

  Signal<system::BufferedChannel*> ChannelOpenedSignal;
  Signal<system::Handle::Raw> ChannelClosingSignal;
  Signal<system::Process::Raw> ChildSpawnedSignal;

private:
  const message::ConnectionType Type;
  const std::string Token;
  std::unique_ptr<system::Socket> BoundSocket;
  std::optional<TimePoint> OfflineSince;
  bool Disposed = false;

  Signal<std::string> CloseSignal;

  void bind(std::unique_ptr<system::Socket> Socket);
  void closeSocket();
};

} // namespace remux::server
