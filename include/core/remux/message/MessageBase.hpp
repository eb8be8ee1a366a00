/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace remux::message
{

/// A global enumeration table of messages that are supported by the protocol.
/// For each entry, an appropriate struct in namespace \p remux::message::request
/// or \p remux::message::response, or \p remux::message::notification defines
/// the data members of the message.
enum class MessageKind : std::uint16_t
{
  /// Indicates a broken message that failed to read as a proper entity.
  Invalid = 0,

  /// Indicates a subobject of a \p Message that cannot be understood
  /// individually.
  Base,

  /// The first message sent by a client on a new socket, selecting the kind of
  /// logical connection the socket should be bound to.
  ConnectionTypeRequest,
  /// The server accepted the handshake.
  HandshakeOk,
  /// The server rejected the handshake. The socket is closed afterwards.
  HandshakeError,

  CreateProcessRequest,
  CreateProcessResponse,
  AttachToProcessRequest,
  AttachToProcessResponse,
  DetachFromProcessRequest,
  DetachFromProcessResponse,
  StartProcessRequest,
  StartProcessResponse,
  ShutdownProcessRequest,
  ShutdownProcessResponse,
  InputRequest,
  InputResponse,
  ResizeRequest,
  ResizeResponse,
  AcknowledgeDataEventRequest,
  AcknowledgeDataEventResponse,
  GetInitialCwdRequest,
  GetInitialCwdResponse,
  GetCwdRequest,
  GetCwdResponse,
  GetLatencyRequest,
  GetLatencyResponse,
  SetLayoutRequest,
  SetLayoutResponse,
  GetLayoutRequest,
  GetLayoutResponse,
  OrphanQuestionReplyRequest,
  OrphanQuestionReplyResponse,
  ReduceGraceTimeRequest,
  ReduceGraceTimeResponse,

  /// Output produced by a persistent process.
  ProcessDataNotification,
  /// The recorded history of a persistent process, sent on (re)start.
  ProcessReplayNotification,
  /// A persistent process had exited.
  ProcessExitNotification,
  /// A persistent process is running and ready for interaction.
  ProcessReadyNotification,
  /// The title of a persistent process changed.
  ProcessTitleNotification,
  /// The server asks whether the owner of a persistent process is still
  /// alive. Expected to be answered with \p OrphanQuestionReplyRequest.
  ProcessOrphanQuestionNotification,

  /// Sentinel, not a real message.
  EndOfKinds
};

/// Helper class that contains the parsed \p MessageKind of a \p Message, and
/// the remaining, not yet parsed \p Buffer.
struct Message
{
  MessageKind Kind;
  std::string_view RawData;

  /// The number of characters the \p Kind is encoded into.
  static constexpr std::size_t KindWidth = 5;

  /// Encodes the given number as a platform-specific binary-string.
  [[nodiscard]] static std::string sizeToBinaryString(std::size_t N);

  /// Decodes a \p std::size_t from the given \p Str.
  [[nodiscard]] static std::size_t
  binaryStringToSize(std::string_view Str) noexcept;

  /// Encodes the \p Kind variable as a fixed width decimal string for
  /// appropriately prefixing a transmissible buffer.
  [[nodiscard]] std::string encodeKind() const;

  /// Decodes the prefix of a message as a \p Kind.
  [[nodiscard]] static MessageKind decodeKind(std::string_view Str) noexcept;

  /// Pack a raw and encoded message into a full transmissible payload.
  [[nodiscard]] std::string pack() const;

  /// Unpack an encoded and fully read payload into its base constitutents.
  [[nodiscard]] static Message unpack(std::string_view Str) noexcept;
};

/// Encodes a message object into its raw data form.
template <typename T> [[nodiscard]] std::string encode(const T& Msg)
{
  std::string RawForm = T::encode(Msg);

  Message MB;
  MB.Kind = T::Kind;
  MB.RawData = RawForm;

  return MB.pack();
}

/// Encodes a message object into its raw data form, prefixed with a payload
/// size.
template <typename T> [[nodiscard]] std::string encodeWithSize(const T& Msg)
{
  std::string Payload = encode(Msg);
  return Message::sizeToBinaryString(Payload.size()) + std::move(Payload);
}

/// Decodes the given received buffer as a specific message object, and returns
/// it if successful.
template <typename T>
[[nodiscard]] std::optional<T> decode(std::string_view Str)
{
  Message MB = Message::unpack(Str);
  if (MB.Kind != T::Kind)
    return std::nullopt;

  return T::decode(MB.RawData);
}

} // namespace remux::message
