/* SPDX-License-Identifier: LGPL-3.0-only */
#include "remux/server/Errors.hpp"

namespace remux::server
{

ProtocolError::ProtocolError(Kind K, const std::string& Detail)
  : std::runtime_error(std::string{kindName(K)} + ": " + Detail), K(K)
{}

const char* ProtocolError::kindName(Kind K) noexcept
{
  switch (K)
  {
    case DuplicateToken:
      return "DuplicateToken";
    case UnrecognizedToken:
      return "UnrecognizedToken";
    case MissingToken:
      return "MissingToken";
    case UnknownType:
      return "UnknownType";
    case Malformed:
      return "Malformed";
  }
  return "<unknown>";
}

UnknownProcess::UnknownProcess(message::ProcessID ID)
  : std::out_of_range("Could not find persistent process #" +
                      std::to_string(ID)),
    ID(ID)
{}

UnknownConnection::UnknownConnection(message::ConnectionType Type,
                                     const std::string& Token)
  : std::out_of_range(std::string{"No "} + message::connectionTypeName(Type) +
                      " connection with token \"" + Token + '"')
{}

AttachNotAllowed::AttachNotAllowed(message::ProcessID Target)
  : std::invalid_argument("Attaching to process #" + std::to_string(Target) +
                          " is not allowed through creation")
{}

} // namespace remux::server
