/* SPDX-License-Identifier: LGPL-3.0-only */
#include <system_error>

#include "remux/server/Connection.hpp"

#include "remux/Log.hpp"
#define LOG(SEVERITY) remux::log::SEVERITY("server/Connection")
#define LOG_WITH_IDENTIFIER(SEVERITY)                                          \
  LOG(SEVERITY) << message::connectionTypeName(Type) << " \"" << Token         \
                << "\": "

namespace remux::server
{

Connection::Connection(message::ConnectionType Type, std::string Token)
  : Type(Type), Token(std::move(Token))
{}

Connection::~Connection() = default;

void Connection::bind(std::unique_ptr<system::Socket> Socket)
{
  BoundSocket = std::move(Socket);
  OfflineSince.reset();
  if (BoundSocket)
    ChannelOpenedSignal.fire(BoundSocket.get());
}

void Connection::closeSocket()
{
  if (!BoundSocket)
    return;

  ChannelClosingSignal.fire(BoundSocket->raw());
  if (!BoundSocket->failed())
  {
    try
    {
      BoundSocket->flushWrites();
    }
    catch (const std::system_error& Err)
    {
      LOG_WITH_IDENTIFIER(debug) << "Flushing before close: " << Err.what();
    }
  }
  BoundSocket.reset();
}

void Connection::open(std::unique_ptr<system::Socket> Socket,
                      std::string Buffer)
{
  LOG_WITH_IDENTIFIER(info) << "Opened on " << Socket->identifier();
  bind(std::move(Socket));
  opened(std::move(Buffer));
}

void Connection::reconnect(std::unique_ptr<system::Socket> Socket,
                           std::string Buffer)
{
  if (OfflineSince)
    LOG_WITH_IDENTIFIER(info)
      << "Reconnected on " << Socket->identifier() << " after "
      << std::chrono::duration_cast<std::chrono::seconds>(Clock::now() -
                                                          *OfflineSince)
           .count()
      << "s offline";
  else
    LOG_WITH_IDENTIFIER(info)
      << "Reconnected on " << Socket->identifier() << ", replacing the socket";

  closeSocket();
  bind(std::move(Socket));
  reconnected(std::move(Buffer));
}

void Connection::goOffline(TimePoint When)
{
  closeSocket();
  if (OfflineSince)
    return;

  OfflineSince = When;
  LOG_WITH_IDENTIFIER(info) << "Went offline";
}

void Connection::dispose(const std::string& Reason)
{
  if (Disposed)
    return;
  Disposed = true;

  LOG_WITH_IDENTIFIER(info) << "Disposing: " << Reason;
  closeSocket();
  disposing();
  CloseSignal.fire(Reason);
}

void Connection::childExited(system::Process::Raw /* PID */) {}

} // namespace remux::server

#undef LOG_WITH_IDENTIFIER
#undef LOG
