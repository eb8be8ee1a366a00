/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <optional>
#include <stdexcept>
#include <string>

#include "remux/message/MessageBase.hpp"
#include "remux/system/BufferedChannel.hpp"

namespace remux::message
{

/// The largest payload that is accepted as a single message.
static constexpr std::size_t MaxMeaningfulMessageSize = 1ULL << 24;

/// Thrown when the size prefix of a message on a stream is nonsensical, and
/// the stream is thus not recoverable.
class MalformedStream : public std::runtime_error
{
public:
  explicit MalformedStream(std::size_t Size);
};

/// Sends a specific message, fully encoded for transportation, on the
/// \p Channel. Parts of the message the channel could not take immediately
/// are kept in its write buffer.
template <typename T>
std::size_t sendMessage(system::BufferedChannel& Channel, const T& Msg)
{
  return Channel.write(encodeWithSize(Msg));
}

/// Consumes the next size-prefixed payload from the already loaded read buffer
/// of \p Channel. If the buffer does not yet contain a complete payload,
/// nothing is consumed and \p std::nullopt is returned.
///
/// \note This operation does \b NOT read from the underlying resource.
///
/// \throws MalformedStream if the size prefix is larger than
/// \p MaxMeaningfulMessageSize.
[[nodiscard]] std::optional<std::string>
extractPascalString(system::BufferedChannel& Channel);

/// Consumes the next size-prefixed payload from the front of \p Buffer, in
/// the same manner as the \p BufferedChannel overload.
[[nodiscard]] std::optional<std::string>
extractPascalString(std::string& Buffer);

} // namespace remux::message
