/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "remux/adt/Signal.hpp"
#include "remux/message/Message.hpp"
#include "remux/server/Connection.hpp"
#include "remux/server/EnvironmentService.hpp"
#include "remux/system/Socket.hpp"

namespace remux::server
{

/// Classifies freshly accepted sockets by their handshake, and binds them to
/// a new or an existing logical \p Connection.
///
/// At most one connection exists for every (type, token) pair. Connections
/// that went offline are kept so their clients can reconnect, but only the
/// newest \p Options::MaxExtraOfflineConnections of them are retained per
/// connection type.
class SessionDispatcher
{
public:
  /// Takes over a socket that requested a tunnel. \p Buffer contains the
  /// bytes received after the handshake.
  using TunnelHandler =
    std::function<void(std::unique_ptr<system::Socket> Socket,
                       std::string Buffer)>;
  /// Supplies the debugging port announced to extension host clients.
  using DebugPortProvider = std::function<std::optional<std::uint16_t>()>;

  struct Options
  {
    /// The commit the server was built from. Clients reporting a different
    /// commit are warned about.
    std::string Commit;
    std::size_t MaxExtraOfflineConnections = 0;
  };

  SessionDispatcher(const EnvironmentService& Environment, Options Opts);
  ~SessionDispatcher();

  SessionDispatcher(const SessionDispatcher&) = delete;
  SessionDispatcher& operator=(const SessionDispatcher&) = delete;

  void setTunnelHandler(TunnelHandler Handler);
  void setDebugPortProvider(DebugPortProvider Provider);

  /// Handles the first message \p RawMessage received on \p Socket.
  ///
  /// If the handshake fails, the client is sent the reason and the socket is
  /// closed.
  ///
  /// \returns the connection the socket was bound to, or \p nullptr if the
  /// handshake failed or the socket was handed to the tunnel handler.
  Connection* handleHandshake(std::unique_ptr<system::Socket> Socket,
                              std::string_view RawMessage);

  /// \throws UnknownConnection if no connection is registered for \p Token.
  [[nodiscard]] Connection& getConnection(message::ConnectionType Type,
                                          const std::string& Token);
  [[nodiscard]] Connection* tryGetConnection(message::ConnectionType Type,
                                             const std::string& Token) noexcept;
  [[nodiscard]] std::vector<Connection*>
  connections(message::ConnectionType Type);
  [[nodiscard]] std::size_t size() const noexcept;

  /// Disposes every connection of every type.
  void disposeAll();

  /// Destroys the connections disposed since the previous call. This must
  /// not be called while a connection is being handled.
  void collectDisposed() noexcept;

  /// Fired after a new connection was registered, before its socket is
  /// bound.
  Signal<Connection*>& onClientConnected() noexcept
  {
    return ConnectedSignal;
  }

private:
  const EnvironmentService& Environment;
  Options Opts;
  TunnelHandler Tunnel;
  DebugPortProvider DebugPort;

  using TokenMap = std::map<std::string, std::unique_ptr<Connection>>;
  std::map<message::ConnectionType, TokenMap> Connections;
  std::vector<std::unique_ptr<Connection>> Disposed;

  Signal<Connection*> ConnectedSignal;

  /// \throws ProtocolError
  Connection* handshake(std::unique_ptr<system::Socket>& Socket,
                        const message::request::Handshake& Request);
  void acknowledge(system::Socket& Socket, message::ConnectionType Type);
  static void reject(system::Socket& Socket, const std::string& Reason);
  std::unique_ptr<Connection>
  makeConnection(message::ConnectionType Type,
                 const message::request::Handshake& Request);
  void removeConnection(message::ConnectionType Type, const std::string& Token);
  void applyRetentionPolicy(message::ConnectionType Type);
};

} // namespace remux::server
