/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <memory>
#include <string>
#include <system_error>

#include "remux/adt/UniqueScalar.hpp"
#include "remux/system/BufferedChannel.hpp"

namespace remux::system
{

/// A socket is a two-way, stream-based communication channel between a
/// "client" and a "server". Clients connect to the server socket, and the
/// accepted connection towards the new client becomes its own \p Socket.
///
/// \note This object does \b NOT manage the set of connected clients, only
/// exposes the low-level system calls facilitating socket behaviour.
class Socket : public BufferedChannel
{
public:
  /// Starts listening for incoming connections on the current socket.
  /// This is only valid if the current socket was created in owning mode.
  void listen(std::size_t QueueSize);

  /// Accepts a new connection on the current, listening socket.
  ///
  /// \param Error If non-null and the accepting of the client fails, the error
  /// code is returned in this parameter.
  /// \param Recoverable If non-null and the accepting of the client fails, but
  /// the low-level error indicates that trying again might work, it is set to
  /// \p true.
  std::unique_ptr<Socket> accept(std::error_code* Error = nullptr,
                                 bool* Recoverable = nullptr);

  [[nodiscard]] bool isListening() const noexcept { return Listening; }

  ~Socket() noexcept override = default;
  Socket(Socket&&) noexcept = default;
  Socket& operator=(Socket&&) noexcept = default;

protected:
  Socket(Handle FD, std::string Identifier, bool NeedsCleanup, bool Owning);

  virtual void listenImpl(std::size_t QueueSize) = 0;
  [[nodiscard]] virtual std::unique_ptr<Socket>
  acceptImpl(std::error_code* Error, bool* Recoverable) = 0;

  /// Whether the current instance is \e owning a socket, i.e. controlling it
  /// as a server.
  UniqueScalar<bool, false> Owning;
  /// Whether the current instance is \e listening for incoming connections.
  UniqueScalar<bool, false> Listening;
};

} // namespace remux::system
