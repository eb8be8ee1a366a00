/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <string>
#include <utility>

#include "remux/system/Socket.hpp"
#include "remux/system/fd.hpp"

namespace remux::system::unix
{

/// Wraps a Unix domain socket (appearing to applications as a named file in
/// the filesystem) of type \p SOCK_STREAM.
///
/// \see unix(7)
class DomainSocket : public system::Socket
{
public:
  /// Creates a new \p DomainSocket at \p Path which is owned by the current
  /// instance, and removed from the filesystem on destruction. Such sockets
  /// can be used to await connections.
  ///
  /// \see bind(2)
  [[nodiscard]] static DomainSocket create(std::string Path,
                                           bool InheritInChild = false);

  /// Opens a connection to the socket existing in the file system at \p Path.
  ///
  /// \see connect(2)
  [[nodiscard]] static DomainSocket connect(std::string Path,
                                            bool InheritInChild = false);

  /// Wraps an already existing, connected file descriptor \p FD as a socket.
  ///
  /// \param Identifier If empty, a default value is created.
  [[nodiscard]] static DomainSocket wrap(fd&& FD, std::string Identifier);

  /// Creates a pair of connected, anonymous, non-blocking sockets.
  ///
  /// \see socketpair(2)
  [[nodiscard]] static std::pair<DomainSocket, DomainSocket>
  pair(bool InheritInChild = false);

  ~DomainSocket() noexcept override;
  DomainSocket(DomainSocket&&) noexcept = default;
  DomainSocket& operator=(DomainSocket&&) noexcept = default;

protected:
  DomainSocket(Handle FD, std::string Identifier, bool NeedsCleanup, bool Owning);

  /// \see listen(2)
  void listenImpl(std::size_t QueueSize) override;
  /// \see accept(2)
  [[nodiscard]] std::unique_ptr<system::Socket>
  acceptImpl(std::error_code* Error, bool* Recoverable) override;

  /// \see recv(2)
  [[nodiscard]] std::string readImpl(std::size_t Bytes,
                                     bool& Continue) override;
  /// \see send(2)
  std::size_t writeImpl(std::string_view Buffer, bool& Continue) override;
};

} // namespace remux::system::unix
