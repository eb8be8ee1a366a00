/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <stdexcept>
#include <string>

#include "remux/message/Message.hpp"

namespace remux::server
{

/// Thrown when the first message on a socket violates the handshake
/// protocol. The error is fatal to the offending socket only.
class ProtocolError : public std::runtime_error
{
public:
  enum Kind
  {
    /// A new connection was requested for a token already in use.
    DuplicateToken,
    /// A reconnection was requested for a token that is not known.
    UnrecognizedToken,
    /// The reconnection token was missing or empty.
    MissingToken,
    /// The requested connection type is not understood by the server.
    UnknownType,
    /// The handshake message could not be decoded.
    Malformed
  };

  ProtocolError(Kind K, const std::string& Detail);

  [[nodiscard]] Kind kind() const noexcept { return K; }
  [[nodiscard]] static const char* kindName(Kind K) noexcept;

private:
  Kind K;
};

/// Thrown by lookups into the process registry with an identifier that does
/// not name a live persistent process.
class UnknownProcess : public std::out_of_range
{
public:
  static constexpr char ErrorName[] = "UnknownProcess";

  explicit UnknownProcess(message::ProcessID ID);

  [[nodiscard]] message::ProcessID id() const noexcept { return ID; }

private:
  message::ProcessID ID;
};

/// Thrown by lookups into the session dispatcher with a token that does not
/// name a registered connection.
class UnknownConnection : public std::out_of_range
{
public:
  static constexpr char ErrorName[] = "UnknownConnection";

  UnknownConnection(message::ConnectionType Type, const std::string& Token);
};

/// Thrown by the process registry if a creation request asks to attach to
/// an already existing process instead of creating one.
class AttachNotAllowed : public std::invalid_argument
{
public:
  static constexpr char ErrorName[] = "AttachNotAllowed";

  explicit AttachNotAllowed(message::ProcessID Target);
};

/// Describes why a terminal process could not be launched. This error is
/// returned to the requester, not thrown.
struct LaunchError
{
  static constexpr char ErrorName[] = "LaunchError";

  std::string Message;
  int Code = 0;
};

} // namespace remux::server
