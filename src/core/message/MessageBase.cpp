/* SPDX-License-Identifier: LGPL-3.0-only */
#include <cstring>
#include <iomanip>
#include <sstream>

#include "remux/message/MessageBase.hpp"

namespace remux::message
{

std::string Message::sizeToBinaryString(std::size_t N)
{
  std::string Str;
  Str.resize(sizeof(std::size_t));
  std::memcpy(Str.data(), &N, sizeof(std::size_t));
  return Str;
}

std::size_t Message::binaryStringToSize(std::string_view Str) noexcept
{
  if (Str.size() < sizeof(std::size_t))
    return 0;

  std::size_t N = 0;
  std::memcpy(&N, Str.data(), sizeof(std::size_t));
  return N;
}

std::string Message::encodeKind() const
{
  std::ostringstream Buf;
  Buf << std::setw(KindWidth) << std::setfill('0')
      << static_cast<std::uint16_t>(Kind);
  return Buf.str();
}

MessageKind Message::decodeKind(std::string_view Str) noexcept
{
  if (Str.size() < KindWidth)
    return MessageKind::Invalid;

  unsigned long Value = 0;
  for (std::size_t I = 0; I < KindWidth; ++I)
  {
    if (Str[I] < '0' || Str[I] > '9')
      return MessageKind::Invalid;
    Value = Value * 10 + static_cast<unsigned long>(Str[I] - '0');
  }

  if (Value <= static_cast<unsigned long>(MessageKind::Base) ||
      Value >= static_cast<unsigned long>(MessageKind::EndOfKinds))
    return MessageKind::Invalid;
  return static_cast<MessageKind>(Value);
}

std::string Message::pack() const
{
  std::string Str;
  Str.reserve(KindWidth + RawData.size() + sizeof('\0'));

  Str.append(encodeKind());
  Str.append(RawData);
  Str.push_back('\0');

  return Str;
}

Message Message::unpack(std::string_view Str) noexcept
{
  Message MB;
  MB.Kind = decodeKind(Str);
  if (MB.Kind == MessageKind::Invalid)
    return MB;

  Str.remove_prefix(KindWidth);
  if (Str.empty() || Str.back() != '\0')
  {
    MB.Kind = MessageKind::Invalid;
    return MB;
  }
  Str.remove_suffix(sizeof('\0'));

  MB.RawData = Str;
  return MB;
}

} // namespace remux::message
