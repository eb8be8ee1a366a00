/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "remux/message/MessageBase.hpp"

#define REMUX_MESSAGE(KIND, NAME)                                              \
  static constexpr MessageKind Kind = MessageKind::KIND;                       \
  [[nodiscard]] static std::optional<NAME> decode(std::string_view Buffer);    \
  [[nodiscard]] static std::string encode(const NAME& Object);

#define REMUX_MESSAGE_BASE(NAME)                                               \
  static constexpr MessageKind Kind = MessageKind::Base;                       \
  [[nodiscard]] static std::optional<NAME> decode(std::string_view& Buffer);   \
  [[nodiscard]] static std::string encode(const NAME& Object);

namespace remux::message
{

/// The identity number of a persistent process, as assigned by the server.
using ProcessID = std::uint32_t;

/// The kinds of logical connections a socket may be bound to.
enum class ConnectionType : std::uint16_t
{
  Management = 1,
  ExtensionHost = 2,
  Tunnel = 3
};

/// \returns a human-readable name of \p T.
const char* connectionTypeName(ConnectionType T) noexcept;

/// The outcome of a request, shared by every response.
struct Result
{
  REMUX_MESSAGE_BASE(Result);

  bool Success = true;
  /// The class of the error that happened, if \p Success is \p false.
  /// (e.g. \p UnknownProcess.)
  std::string Error;
  /// Human-readable details of the failure.
  std::string Reason;
};

/// The parameters of the program to be run in a persistent process.
struct LaunchConfig
{
  REMUX_MESSAGE_BASE(LaunchConfig);

  /// The program to execute. If empty, the server's default shell is used.
  std::string Program;
  std::vector<std::string> Arguments;
  /// The title the process starts with.
  std::string Name;
  /// If set, the client wants to attach to an already running process.
  /// This is not supported through \p CreateProcess.
  std::optional<ProcessID> AttachPersistentProcess;
};

/// A terminal entry in a stored workspace layout.
struct LayoutTerminal
{
  REMUX_MESSAGE_BASE(LayoutTerminal);

  ProcessID Terminal{};
  double RelativeSize{};
};

struct LayoutTab
{
  REMUX_MESSAGE_BASE(LayoutTab);

  bool IsActive = false;
  std::optional<ProcessID> ActivePersistentTerminal;
  std::vector<LayoutTerminal> Terminals;
};

/// The live details of a persistent process.
struct ProcessDescriptor
{
  REMUX_MESSAGE_BASE(ProcessDescriptor);

  ProcessID ID{};
  std::string Title;
  std::int64_t PID{};
  std::string WorkspaceID;
  std::string WorkspaceName;
  std::string Cwd;
  bool IsOrphan = false;
};

/// A terminal entry of a layout, expanded with the live process details. A
/// terminal whose process no longer exists is an empty placeholder.
struct ExpandedTerminal
{
  REMUX_MESSAGE_BASE(ExpandedTerminal);

  std::optional<ProcessDescriptor> Terminal;
  double RelativeSize{};
};

struct ExpandedTab
{
  REMUX_MESSAGE_BASE(ExpandedTab);

  bool IsActive = false;
  std::optional<ProcessID> ActivePersistentTerminal;
  std::vector<ExpandedTerminal> Terminals;
};

/// An element of the recorded history of a persistent process.
struct ReplayEntry
{
  REMUX_MESSAGE_BASE(ReplayEntry);

  enum EventType
  {
    DataEvent,
    ResizeEvent
  };
  EventType Type = DataEvent;
  /// Only meaningful for \p Data entries.
  std::string Data;
  /// Only meaningful for \p Resize entries.
  std::uint16_t Columns{}, Rows{};
};

namespace request
{

/// The handshake message. The first message sent on every new socket.
struct Handshake
{
  REMUX_MESSAGE(ConnectionTypeRequest, Handshake);

  /// The raw value of the requested \p message::ConnectionType. Unknown values
  /// are kept so the server may report them.
  std::uint16_t DesiredType{};
  std::string ReconnectionToken;
  bool Reconnection = false;
  std::optional<std::string> Commit;
  std::optional<std::string> Language;
};

struct CreateProcess
{
  REMUX_MESSAGE(CreateProcessRequest, CreateProcess);

  LaunchConfig Config;
  std::string Cwd;
  std::uint16_t Columns{}, Rows{};
  /// Extra environment variables for the process.
  std::vector<std::pair<std::string, std::string>> Environment;
  bool ShouldPersist = true;
  std::string WorkspaceID;
  std::string WorkspaceName;
};

struct AttachToProcess
{
  REMUX_MESSAGE(AttachToProcessRequest, AttachToProcess);
  ProcessID ID{};
};

struct DetachFromProcess
{
  REMUX_MESSAGE(DetachFromProcessRequest, DetachFromProcess);
  ProcessID ID{};
};

struct StartProcess
{
  REMUX_MESSAGE(StartProcessRequest, StartProcess);
  ProcessID ID{};
};

struct ShutdownProcess
{
  REMUX_MESSAGE(ShutdownProcessRequest, ShutdownProcess);
  ProcessID ID{};
  bool Immediate = false;
};

struct Input
{
  REMUX_MESSAGE(InputRequest, Input);
  ProcessID ID{};
  std::string Data;
};

struct Resize
{
  REMUX_MESSAGE(ResizeRequest, Resize);
  ProcessID ID{};
  std::uint16_t Columns{}, Rows{};
};

struct AcknowledgeDataEvent
{
  REMUX_MESSAGE(AcknowledgeDataEventRequest, AcknowledgeDataEvent);
  ProcessID ID{};
  std::uint64_t CharCount{};
};

struct GetInitialCwd
{
  REMUX_MESSAGE(GetInitialCwdRequest, GetInitialCwd);
  ProcessID ID{};
};

struct GetCwd
{
  REMUX_MESSAGE(GetCwdRequest, GetCwd);
  ProcessID ID{};
};

struct GetLatency
{
  REMUX_MESSAGE(GetLatencyRequest, GetLatency);
  ProcessID ID{};
};

struct SetLayout
{
  REMUX_MESSAGE(SetLayoutRequest, SetLayout);
  std::string WorkspaceID;
  std::vector<LayoutTab> Tabs;
};

struct GetLayout
{
  REMUX_MESSAGE(GetLayoutRequest, GetLayout);
  std::string WorkspaceID;
};

struct OrphanQuestionReply
{
  REMUX_MESSAGE(OrphanQuestionReplyRequest, OrphanQuestionReply);
  ProcessID ID{};
};

struct ReduceGraceTime
{
  REMUX_MESSAGE(ReduceGraceTimeRequest, ReduceGraceTime);
  ProcessID ID{};
};

} // namespace request

namespace response
{

/// The acknowledgement of a successful handshake.
struct HandshakeOk
{
  REMUX_MESSAGE(HandshakeOk, HandshakeOk);
  std::optional<std::uint16_t> DebugPort;
};

/// The reason of a failed handshake. The server closes the socket after
/// sending this message.
struct HandshakeError
{
  REMUX_MESSAGE(HandshakeError, HandshakeError);
  std::string Reason;
};

struct CreateProcess
{
  REMUX_MESSAGE(CreateProcessResponse, CreateProcess);
  message::Result Result;
  ProcessID ID{};
};

struct AttachToProcess
{
  REMUX_MESSAGE(AttachToProcessResponse, AttachToProcess);
  message::Result Result;
  ProcessID ID{};
};

struct DetachFromProcess
{
  REMUX_MESSAGE(DetachFromProcessResponse, DetachFromProcess);
  message::Result Result;
  ProcessID ID{};
};

struct StartProcess
{
  REMUX_MESSAGE(StartProcessResponse, StartProcess);
  message::Result Result;
  ProcessID ID{};
  /// The system error code of a failed launch.
  std::optional<std::int32_t> LaunchErrorCode;
};

struct ShutdownProcess
{
  REMUX_MESSAGE(ShutdownProcessResponse, ShutdownProcess);
  message::Result Result;
  ProcessID ID{};
};

struct Input
{
  REMUX_MESSAGE(InputResponse, Input);
  message::Result Result;
  ProcessID ID{};
};

struct Resize
{
  REMUX_MESSAGE(ResizeResponse, Resize);
  message::Result Result;
  ProcessID ID{};
};

struct AcknowledgeDataEvent
{
  REMUX_MESSAGE(AcknowledgeDataEventResponse, AcknowledgeDataEvent);
  message::Result Result;
  ProcessID ID{};
};

struct GetInitialCwd
{
  REMUX_MESSAGE(GetInitialCwdResponse, GetInitialCwd);
  message::Result Result;
  ProcessID ID{};
  std::string Cwd;
};

struct GetCwd
{
  REMUX_MESSAGE(GetCwdResponse, GetCwd);
  message::Result Result;
  ProcessID ID{};
  std::string Cwd;
};

struct GetLatency
{
  REMUX_MESSAGE(GetLatencyResponse, GetLatency);
  message::Result Result;
  ProcessID ID{};
  std::uint64_t Latency{};
};

struct SetLayout
{
  REMUX_MESSAGE(SetLayoutResponse, SetLayout);
  message::Result Result;
  std::string WorkspaceID;
};

struct GetLayout
{
  REMUX_MESSAGE(GetLayoutResponse, GetLayout);
  message::Result Result;
  std::string WorkspaceID;
  /// Empty if the workspace has no stored layout.
  std::optional<std::vector<ExpandedTab>> Tabs;
};

struct OrphanQuestionReply
{
  REMUX_MESSAGE(OrphanQuestionReplyResponse, OrphanQuestionReply);
  message::Result Result;
  ProcessID ID{};
};

struct ReduceGraceTime
{
  REMUX_MESSAGE(ReduceGraceTimeResponse, ReduceGraceTime);
  message::Result Result;
  ProcessID ID{};
};

} // namespace response

namespace notification
{

struct ProcessData
{
  REMUX_MESSAGE(ProcessDataNotification, ProcessData);
  ProcessID ID{};
  std::string Data;
};

struct ProcessReplay
{
  REMUX_MESSAGE(ProcessReplayNotification, ProcessReplay);
  ProcessID ID{};
  std::vector<ReplayEntry> Events;
  std::uint16_t StartColumns{}, StartRows{};
};

struct ProcessExit
{
  REMUX_MESSAGE(ProcessExitNotification, ProcessExit);
  ProcessID ID{};
  std::optional<std::int32_t> ExitCode;
};

struct ProcessReady
{
  REMUX_MESSAGE(ProcessReadyNotification, ProcessReady);
  ProcessID ID{};
  std::int64_t PID{};
  std::string Cwd;
};

struct ProcessTitle
{
  REMUX_MESSAGE(ProcessTitleNotification, ProcessTitle);
  ProcessID ID{};
  std::string Title;
};

struct ProcessOrphanQuestion
{
  REMUX_MESSAGE(ProcessOrphanQuestionNotification, ProcessOrphanQuestion);
  ProcessID ID{};
};

} // namespace notification

} // namespace remux::message

#undef REMUX_MESSAGE
#undef REMUX_MESSAGE_BASE
