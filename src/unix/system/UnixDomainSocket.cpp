/* SPDX-License-Identifier: LGPL-3.0-only */
#include <cstring>

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include "remux/CheckedErrno.hpp"
#include "remux/adt/POD.hpp"

#include "remux/system/UnixDomainSocket.hpp"

#include "remux/Log.hpp"
#define LOG(SEVERITY) remux::log::SEVERITY("system/DomainSocket")
#define LOG_WITH_IDENTIFIER(SEVERITY) LOG(SEVERITY) << identifier() << ": "

namespace remux::system::unix
{

namespace
{

POD<struct ::sockaddr_un> makeAddress(const std::string& Path)
{
  POD<struct ::sockaddr_un> SocketAddr;
  if (Path.size() >= sizeof(SocketAddr->sun_path))
    throw std::system_error{
      std::make_error_code(std::errc::filename_too_long),
      "Socket path '" + Path + "' is too long"};

  SocketAddr->sun_family = AF_UNIX;
  std::strncpy(
    SocketAddr->sun_path, Path.c_str(), sizeof(SocketAddr->sun_path) - 1);
  return SocketAddr;
}

fd makeSocket(bool InheritInChild)
{
  fd::flag_t ExtraFlags = InheritInChild ? 0 : SOCK_CLOEXEC;
  return CheckedErrnoThrow(
    [ExtraFlags] { return ::socket(AF_UNIX, SOCK_STREAM | ExtraFlags, 0); },
    "socket()",
    -1);
}

/// \returns whether \p EC means that the peer is gone.
bool isDisconnect(std::errc EC) noexcept
{
  return EC == std::errc::broken_pipe /* EPIPE */ ||
         EC == std::errc::connection_reset /* ECONNRESET */;
}

} // namespace

DomainSocket::DomainSocket(Handle FD,
                           std::string Identifier,
                           bool NeedsCleanup,
                           bool Owning)
  : system::Socket(std::move(FD), std::move(Identifier), NeedsCleanup, Owning)
{}

DomainSocket DomainSocket::create(std::string Path, bool InheritInChild)
{
  fd Handle = makeSocket(InheritInChild);
  POD<struct ::sockaddr_un> SocketAddr = makeAddress(Path);
  CheckedErrnoThrow(
    [&Handle, &SocketAddr] {
      return ::bind(Handle,
                    reinterpret_cast<struct ::sockaddr*>(&SocketAddr),
                    sizeof(struct ::sockaddr_un));
    },
    "bind('" + Path + "')",
    -1);
  fd::setNonBlocking(Handle);

  LOG(debug) << "Created at '" << Path << '\'';
  return DomainSocket{std::move(Handle), std::move(Path), true, true};
}

DomainSocket DomainSocket::connect(std::string Path, bool InheritInChild)
{
  fd Handle = makeSocket(InheritInChild);
  POD<struct ::sockaddr_un> SocketAddr = makeAddress(Path);
  CheckedErrnoThrow(
    [&Handle, &SocketAddr] {
      return ::connect(Handle,
                       reinterpret_cast<struct ::sockaddr*>(&SocketAddr),
                       sizeof(struct ::sockaddr_un));
    },
    "connect('" + Path + "')",
    -1);

  LOG(debug) << "Connected to '" << Path << '\'';
  return DomainSocket{std::move(Handle), std::move(Path), false, false};
}

DomainSocket DomainSocket::wrap(fd&& FD, std::string Identifier)
{
  if (Identifier.empty())
    Identifier = "<sock-fd:" + FD.to_string() + '>';

  REMUX_TRACE_LOG(LOG(trace) << "Socketified FD " << Identifier);
  return DomainSocket{std::move(FD), std::move(Identifier), false, false};
}

std::pair<DomainSocket, DomainSocket> DomainSocket::pair(bool InheritInChild)
{
  fd::flag_t ExtraFlags = InheritInChild ? 0 : SOCK_CLOEXEC;
  int Pair[2];
  CheckedErrnoThrow(
    [ExtraFlags, &Pair] {
      return ::socketpair(AF_UNIX, SOCK_STREAM | ExtraFlags, 0, Pair);
    },
    "socketpair()",
    -1);

  fd First{Pair[0]};
  fd Second{Pair[1]};
  fd::setNonBlocking(First);
  fd::setNonBlocking(Second);
  std::string FirstName = "<sockpair:" + First.to_string() + '>';
  std::string SecondName = "<sockpair:" + Second.to_string() + '>';
  return {wrap(std::move(First), std::move(FirstName)),
          wrap(std::move(Second), std::move(SecondName))};
}

DomainSocket::~DomainSocket() noexcept
{
  if (!needsCleanup())
    return;

  auto RemoveResult =
    CheckedErrno([this] { return ::unlink(identifier().c_str()); }, -1);
  if (!RemoveResult)
    LOG(error) << "Failed to remove file \"" << identifier()
               << "\" when closing the socket.\n\t" << RemoveResult.getError()
               << ' ' << RemoveResult.getError().message();
}

void DomainSocket::listenImpl(std::size_t QueueSize)
{
  CheckedErrnoThrow(
    [this, QueueSize] { return ::listen(raw(), static_cast<int>(QueueSize)); },
    "listen()",
    -1);
  REMUX_TRACE_LOG(LOG_WITH_IDENTIFIER(trace) << "Listening...");
}

std::unique_ptr<system::Socket> DomainSocket::acceptImpl(std::error_code* Error,
                                                         bool* Recoverable)
{
  POD<struct ::sockaddr_un> SocketAddr;
  ::socklen_t SocketAddrLen = sizeof(struct ::sockaddr_un);

  auto MaybeClient = CheckedErrno(
    [this, &SocketAddr, &SocketAddrLen] {
      return ::accept4(raw(),
                       reinterpret_cast<struct ::sockaddr*>(&SocketAddr),
                       &SocketAddrLen,
                       SOCK_CLOEXEC);
    },
    -1);
  if (!MaybeClient)
  {
    if (Error)
      *Error = MaybeClient.getError();

    bool ConsiderRecoverable = false;
    std::errc EC = static_cast<std::errc>(MaybeClient.getError().value());
    if (EC == std::errc::too_many_files_open /* EMFILE */ ||
        EC == std::errc::too_many_files_open_in_system /* ENFILE */ ||
        EC == std::errc::resource_unavailable_try_again /* EAGAIN */ ||
        EC == std::errc::interrupted /* EINTR */ ||
        EC == std::errc::connection_aborted /* ECONNABORTED */)
    {
      LOG_WITH_IDENTIFIER(warn)
        << "Failed to accept client: " << MaybeClient.getError() << ' '
        << MaybeClient.getError().message();
      ConsiderRecoverable = true;
    }
    else
      LOG_WITH_IDENTIFIER(error)
        << "Failed to accept client: " << MaybeClient.getError() << ' '
        << MaybeClient.getError().message();

    if (Recoverable)
      *Recoverable = ConsiderRecoverable;
    return {};
  }

  fd Client{MaybeClient.get()};
  fd::setNonBlocking(Client);
  std::string ClientName = "<client:" + Client.to_string() + '>';
  LOG_WITH_IDENTIFIER(debug) << "Client " << ClientName << " connected";
  return std::make_unique<DomainSocket>(
    DomainSocket::wrap(std::move(Client), std::move(ClientName)));
}

std::string DomainSocket::readImpl(std::size_t Bytes, bool& Continue)
{
  static constexpr std::size_t ChunkSize = BufferSize;
  if (Bytes > ChunkSize)
    Bytes = ChunkSize;

  std::string Return(Bytes, '\0');
  auto ReadBytes = CheckedErrno(
    [FD = raw(), Bytes, &Return] {
      return ::recv(FD, Return.data(), Bytes, 0);
    },
    -1);
  if (!ReadBytes)
  {
    std::errc EC = static_cast<std::errc>(ReadBytes.getError().value());
    Return.clear();
    if (EC == std::errc::interrupted /* EINTR */)
    {
      Continue = true;
      return Return;
    }
    if (EC == std::errc::operation_would_block /* EWOULDBLOCK */ ||
        EC == std::errc::resource_unavailable_try_again /* EAGAIN */)
    {
      // No more data left in the stream.
      Continue = false;
      return Return;
    }

    Continue = false;
    setFailed();
    if (isDisconnect(EC))
    {
      LOG_WITH_IDENTIFIER(debug) << "Disconnected";
      return Return;
    }
    LOG_WITH_IDENTIFIER(error) << "Read error";
    throw std::system_error{std::make_error_code(EC), "recv()"};
  }

  Return.resize(static_cast<std::size_t>(ReadBytes.get()));
  Continue = true;
  if (ReadBytes.get() == 0)
  {
    LOG_WITH_IDENTIFIER(debug) << "Disconnected";
    setFailed();
    Continue = false;
  }
  return Return;
}

std::size_t DomainSocket::writeImpl(std::string_view Buffer, bool& Continue)
{
  auto SentBytes = CheckedErrno(
    [FD = raw(), Buffer] {
      return ::send(FD, Buffer.data(), Buffer.size(), MSG_NOSIGNAL);
    },
    -1);
  if (!SentBytes)
  {
    std::errc EC = static_cast<std::errc>(SentBytes.getError().value());
    if (EC == std::errc::interrupted /* EINTR */)
    {
      Continue = true;
      return 0;
    }
    if (EC == std::errc::operation_would_block /* EWOULDBLOCK */ ||
        EC == std::errc::resource_unavailable_try_again /* EAGAIN */)
    {
      // Soft error. The higher level API should buffer.
      Continue = false;
      return 0;
    }

    Continue = false;
    setFailed();
    if (isDisconnect(EC))
    {
      LOG_WITH_IDENTIFIER(debug) << "Disconnected";
      return 0;
    }
    LOG_WITH_IDENTIFIER(error) << "Write error";
    throw std::system_error{std::make_error_code(EC), "send()"};
  }

  Continue = true;
  return static_cast<std::size_t>(SentBytes.get());
}

} // namespace remux::system::unix

#undef LOG_WITH_IDENTIFIER
#undef LOG
