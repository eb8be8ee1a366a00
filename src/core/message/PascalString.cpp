/* SPDX-License-Identifier: LGPL-3.0-only */
#include "remux/message/PascalString.hpp"

#include "remux/Log.hpp"
#define LOG(SEVERITY) remux::log::SEVERITY("message/PascalString")

namespace remux::message
{

MalformedStream::MalformedStream(std::size_t Size)
  : std::runtime_error("Message size prefix " + std::to_string(Size) +
                       " is larger than the allowed " +
                       std::to_string(MaxMeaningfulMessageSize))
{}

std::optional<std::string> extractPascalString(system::BufferedChannel& Channel)
{
  if (Channel.readInBuffer() < sizeof(std::size_t))
    return std::nullopt;

  std::size_t Size =
    Message::binaryStringToSize(Channel.peekBuffered(sizeof(std::size_t)));
  if (Size > MaxMeaningfulMessageSize)
  {
    LOG(error) << Channel.identifier()
               << ": When reading a Pascal String, got a prefix of " << Size
               << " that was deemed too large (>= " << MaxMeaningfulMessageSize
               << ").";
    throw MalformedStream{Size};
  }
  if (Channel.readInBuffer() < sizeof(std::size_t) + Size)
    return std::nullopt;

  (void)Channel.read(sizeof(std::size_t));
  return Channel.read(Size);
}

std::optional<std::string> extractPascalString(std::string& Buffer)
{
  if (Buffer.size() < sizeof(std::size_t))
    return std::nullopt;

  std::size_t Size = Message::binaryStringToSize(
    std::string_view{Buffer}.substr(0, sizeof(std::size_t)));
  if (Size > MaxMeaningfulMessageSize)
    throw MalformedStream{Size};
  if (Buffer.size() < sizeof(std::size_t) + Size)
    return std::nullopt;

  std::string Payload = Buffer.substr(sizeof(std::size_t), Size);
  Buffer.erase(0, sizeof(std::size_t) + Size);
  return Payload;
}

} // namespace remux::message

#undef LOG
