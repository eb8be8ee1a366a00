/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <string>

#include "remux/message/PascalString.hpp"
#include "remux/server/Connection.hpp"

namespace remux::server
{

/// A connection that carries the request-response protocol driving the
/// persistent processes of the server.
class ManagementConnection : public Connection
{
public:
  explicit ManagementConnection(std::string Token);

  void readable(system::BufferedChannel& Channel) override;

  /// Sends \p Msg to the client if the connection is online.
  ///
  /// \returns whether the message was written to a socket.
  template <typename T> bool send(const T& Msg)
  {
    system::Socket* S = socket();
    if (!S || S->failed())
      return false;
    message::sendMessage(*S, Msg);
    return true;
  }

  /// Fired for every complete message received from the client.
  Signal<std::string>& onMessage() noexcept { return MessageSignal; }

protected:
  void opened(std::string Buffer) override;
  void reconnected(std::string Buffer) override;

private:
  /// Received bytes not yet forming a complete message.
  std::string Inbox;

  Signal<std::string> MessageSignal;

  void processInbox();
};

} // namespace remux::server
