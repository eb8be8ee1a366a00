/* SPDX-License-Identifier: LGPL-3.0-only */
#include <algorithm>
#include <system_error>

#include "remux/message/PascalString.hpp"
#include "remux/server/Errors.hpp"
#include "remux/server/ExtensionHostConnection.hpp"
#include "remux/server/ManagementConnection.hpp"

#include "remux/server/SessionDispatcher.hpp"

#include "remux/Log.hpp"
#define LOG(SEVERITY) remux::log::SEVERITY("server/SessionDispatcher")

namespace remux::server
{

SessionDispatcher::SessionDispatcher(const EnvironmentService& Environment,
                                     Options Opts)
  : Environment(Environment), Opts(std::move(Opts))
{}

SessionDispatcher::~SessionDispatcher()
{
  // Disposal callbacks must not observe a half-destroyed table.
  for (auto& Table : Connections)
    for (auto& E : Table.second)
      E.second->onClose().disconnectAll();
}

void SessionDispatcher::setTunnelHandler(TunnelHandler Handler)
{
  Tunnel = std::move(Handler);
}

void SessionDispatcher::setDebugPortProvider(DebugPortProvider Provider)
{
  DebugPort = std::move(Provider);
}

Connection*
SessionDispatcher::handleHandshake(std::unique_ptr<system::Socket> Socket,
                                   std::string_view RawMessage)
{
  std::string Identifier = Socket->identifier();
  try
  {
    std::optional<message::request::Handshake> Request =
      message::decode<message::request::Handshake>(RawMessage);
    if (!Request)
      throw ProtocolError{ProtocolError::Malformed,
                          "The first message must be a connection request"};
    return handshake(Socket, *Request);
  }
  catch (const ProtocolError& PE)
  {
    LOG(warn) << Identifier << ": Handshake failed. " << PE.what();
    if (Socket)
      reject(*Socket, PE.what());
    return nullptr;
  }
  catch (const std::system_error& Err)
  {
    LOG(error) << Identifier << ": Handshake failed. " << Err.what();
    return nullptr;
  }
}

Connection*
SessionDispatcher::handshake(std::unique_ptr<system::Socket>& Socket,
                             const message::request::Handshake& Request)
{
  using message::ConnectionType;

  if (Request.ReconnectionToken.empty())
    throw ProtocolError{ProtocolError::MissingToken,
                        "A reconnection token is required"};

  auto Type = static_cast<ConnectionType>(Request.DesiredType);
  if (Type != ConnectionType::Management &&
      Type != ConnectionType::ExtensionHost && Type != ConnectionType::Tunnel)
    throw ProtocolError{ProtocolError::UnknownType,
                        "Connection type " +
                          std::to_string(Request.DesiredType) +
                          " is not supported"};

  if (Request.Commit && !Opts.Commit.empty() && *Request.Commit != Opts.Commit)
    LOG(warn) << "VersionMismatch: Client \"" << Request.ReconnectionToken
              << "\" is built from commit " << *Request.Commit
              << " but the server is built from " << Opts.Commit;

  if (Type == ConnectionType::Tunnel)
  {
    if (!Tunnel)
      throw ProtocolError{ProtocolError::UnknownType,
                          "Tunnelling is not available on this server"};
    acknowledge(*Socket, Type);
    std::string Buffer = Socket->readEntireBuffer();
    LOG(info) << Socket->identifier() << ": Handing over to tunnel \""
              << Request.ReconnectionToken << '"';
    Tunnel(std::move(Socket), std::move(Buffer));
    return nullptr;
  }

  TokenMap& Table = Connections[Type];
  auto It = Table.find(Request.ReconnectionToken);

  if (Request.Reconnection)
  {
    if (It == Table.end())
      throw ProtocolError{ProtocolError::UnrecognizedToken,
                          std::string{"Unknown "} +
                            message::connectionTypeName(Type) + " token \"" +
                            Request.ReconnectionToken + '"'};

    // Between the lookup and the rebind nothing may give the event loop a
    // chance to dispose the connection.
    Connection& Existing = *It->second;
    acknowledge(*Socket, Type);
    std::string Buffer = Socket->readEntireBuffer();
    if (system::Socket* Old = Existing.socket())
    {
      std::string Unsent = Old->takeUnsentWrites();
      if (!Unsent.empty())
      {
        REMUX_TRACE_LOG(LOG(trace) << "Moving " << Unsent.size()
                                   << " unsent bytes to the new socket");
        Socket->write(Unsent);
      }
    }
    Existing.reconnect(std::move(Socket), std::move(Buffer));
    return &Existing;
  }

  if (It != Table.end())
    throw ProtocolError{ProtocolError::DuplicateToken,
                        std::string{"A "} + message::connectionTypeName(Type) +
                          " connection with token \"" +
                          Request.ReconnectionToken + "\" already exists"};

  acknowledge(*Socket, Type);
  std::string Buffer = Socket->readEntireBuffer();

  std::unique_ptr<Connection> Conn = makeConnection(Type, Request);
  Connection* New = Conn.get();
  New->onClose().connect(
    [this, Type, Token = Request.ReconnectionToken](const std::string&) {
      removeConnection(Type, Token);
    });
  Table.try_emplace(Request.ReconnectionToken, std::move(Conn));

  ConnectedSignal.fire(New);
  New->open(std::move(Socket), std::move(Buffer));
  applyRetentionPolicy(Type);
  return New->isDisposed() ? nullptr : New;
}

void SessionDispatcher::acknowledge(system::Socket& Socket,
                                    message::ConnectionType Type)
{
  message::response::HandshakeOk Ok;
  if (Type == message::ConnectionType::ExtensionHost && DebugPort)
    Ok.DebugPort = DebugPort();
  message::sendMessage(Socket, Ok);
}

void SessionDispatcher::reject(system::Socket& Socket,
                               const std::string& Reason)
{
  try
  {
    message::response::HandshakeError Err;
    Err.Reason = Reason;
    message::sendMessage(Socket, Err);
  }
  catch (const std::system_error& Err)
  {
    LOG(debug) << Socket.identifier()
               << ": Could not send rejection: " << Err.what();
  }
}

std::unique_ptr<Connection>
SessionDispatcher::makeConnection(message::ConnectionType Type,
                                  const message::request::Handshake& Request)
{
  if (Type == message::ConnectionType::ExtensionHost)
    return std::make_unique<ExtensionHostConnection>(
      Request.ReconnectionToken,
      Environment,
      Request.Language.value_or(ExtensionHostConnection::DefaultLanguage));
  return std::make_unique<ManagementConnection>(Request.ReconnectionToken);
}

void SessionDispatcher::removeConnection(message::ConnectionType Type,
                                         const std::string& Token)
{
  auto TIt = Connections.find(Type);
  if (TIt == Connections.end())
    return;
  auto It = TIt->second.find(Token);
  if (It == TIt->second.end())
    return;

  LOG(debug) << message::connectionTypeName(Type) << " \"" << Token
             << "\" removed";
  Disposed.emplace_back(std::move(It->second));
  TIt->second.erase(It);
}

void SessionDispatcher::applyRetentionPolicy(message::ConnectionType Type)
{
  std::vector<Connection*> Offline;
  for (auto& E : Connections[Type])
    if (E.second->offline())
      Offline.emplace_back(E.second.get());
  if (Offline.size() <= Opts.MaxExtraOfflineConnections)
    return;

  std::stable_sort(
    Offline.begin(), Offline.end(), [](Connection* LHS, Connection* RHS) {
      return *LHS->offline() < *RHS->offline();
    });

  std::size_t Excess = Offline.size() - Opts.MaxExtraOfflineConnections;
  LOG(info) << "Disposing " << Excess << " of " << Offline.size()
            << " offline " << message::connectionTypeName(Type)
            << " connections";
  for (std::size_t I = 0; I < Excess; ++I)
    Offline.at(I)->dispose("Too many offline connections");
}

Connection&
SessionDispatcher::getConnection(message::ConnectionType Type,
                                 const std::string& Token)
{
  if (Connection* C = tryGetConnection(Type, Token))
    return *C;
  throw UnknownConnection{Type, Token};
}

Connection*
SessionDispatcher::tryGetConnection(message::ConnectionType Type,
                                    const std::string& Token) noexcept
{
  auto TIt = Connections.find(Type);
  if (TIt == Connections.end())
    return nullptr;
  auto It = TIt->second.find(Token);
  return It != TIt->second.end() ? It->second.get() : nullptr;
}

std::vector<Connection*>
SessionDispatcher::connections(message::ConnectionType Type)
{
  std::vector<Connection*> R;
  auto TIt = Connections.find(Type);
  if (TIt == Connections.end())
    return R;
  for (auto& E : TIt->second)
    R.emplace_back(E.second.get());
  return R;
}

std::size_t SessionDispatcher::size() const noexcept
{
  std::size_t N = 0;
  for (const auto& Table : Connections)
    N += Table.second.size();
  return N;
}

void SessionDispatcher::disposeAll()
{
  std::vector<Connection*> All;
  for (auto& Table : Connections)
    for (auto& E : Table.second)
      All.emplace_back(E.second.get());

  LOG(info) << "Disposing all " << All.size() << " connections...";
  for (Connection* C : All)
    C->dispose("Server shutting down");
  collectDisposed();
}

void SessionDispatcher::collectDisposed() noexcept { Disposed.clear(); }

} // namespace remux::server

#undef LOG
