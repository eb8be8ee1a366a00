/* SPDX-License-Identifier: LGPL-3.0-only */
#include <utility>

#include "remux/system/Socket.hpp"

namespace remux::system
{

Socket::Socket(Handle FD, std::string Identifier, bool NeedsCleanup, bool Owning)
  : BufferedChannel(std::move(FD), std::move(Identifier), NeedsCleanup),
    Owning(Owning)
{}

void Socket::listen(std::size_t QueueSize)
{
  if (!Owning)
    throw std::system_error{
      std::make_error_code(std::errc::operation_not_permitted),
      "Can't start listening on a non-controlled socket!"};
  if (Listening)
    throw std::system_error{
      std::make_error_code(std::errc::operation_in_progress),
      "The socket is already listening!"};

  listenImpl(QueueSize);
  Listening = true;
}

std::unique_ptr<Socket> Socket::accept(std::error_code* Error,
                                       bool* Recoverable)
{
  if (!Listening)
    throw std::system_error{
      std::make_error_code(std::errc::operation_not_permitted),
      "The socket is not listening!"};

  return acceptImpl(Error, Recoverable);
}

} // namespace remux::system
