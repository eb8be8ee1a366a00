/* SPDX-License-Identifier: LGPL-3.0-only */
#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <sstream>
#include <type_traits>

#include "remux/message/Message.hpp"

#define DECODE(NAME) std::optional<NAME> NAME::decode(std::string_view Buffer)
#define ENCODE(NAME) std::string NAME::encode(const NAME& Object)

#define DECODE_BASE(NAME)                                                      \
  std::optional<NAME> NAME::decode(std::string_view& Buffer)
#define ENCODE_BASE(NAME) std::string NAME::encode(const NAME& Object)

namespace remux::message
{

const char* connectionTypeName(ConnectionType T) noexcept
{
  switch (T)
  {
    case ConnectionType::Management:
      return "Management";
    case ConnectionType::ExtensionHost:
      return "ExtensionHost";
    case ConnectionType::Tunnel:
      return "Tunnel";
  }
  return "<unknown>";
}

namespace
{

/// Consumes \p Literal from the \b beginning of \p Data, if it is there.
bool consume(std::string_view& Data, std::string_view Literal) noexcept
{
  if (Data.substr(0, Literal.size()) != Literal)
    return false;
  Data.remove_prefix(Literal.size());
  return true;
}

/// Returns the data taken until the \p Literal is encountered, and modifies
/// \p Data to point after the \p Literal.
std::optional<std::string_view> takeUntilAndConsume(std::string_view& Data,
                                                    std::string_view Literal)
{
  auto Pos = Data.find(Literal);
  if (Pos == std::string_view::npos)
    return std::nullopt;

  std::string_view Match = Data.substr(0, Pos);
  Data.remove_prefix(Match.size() + Literal.size());
  return Match;
}

template <typename T> std::optional<T> parseNumber(std::string_view Str)
{
  if (Str.empty())
    return std::nullopt;

  if constexpr (std::is_floating_point_v<T>)
  {
    std::string Copy{Str};
    char* End = nullptr;
    errno = 0;
    T Value = static_cast<T>(std::strtod(Copy.c_str(), &End));
    if (errno != 0 || End != Copy.c_str() + Copy.size())
      return std::nullopt;
    return Value;
  }
  else
  {
    T Value{};
    auto [Ptr, EC] = std::from_chars(Str.data(), Str.data() + Str.size(), Value);
    if (EC != std::errc{} || Ptr != Str.data() + Str.size())
      return std::nullopt;
    return Value;
  }
}

std::string openTag(std::string_view Tag)
{
  std::string S = "<";
  S.append(Tag);
  S.push_back('>');
  return S;
}

std::string closeTag(std::string_view Tag)
{
  std::string S = "</";
  S.append(Tag);
  S.push_back('>');
  return S;
}

std::string emptyTag(std::string_view Tag)
{
  std::string S = "<";
  S.append(Tag);
  S.append(" />");
  return S;
}

std::string attributeTag(std::string_view Tag, std::string_view Attribute)
{
  std::string S = "<";
  S.append(Tag);
  S.push_back(' ');
  S.append(Attribute);
  S.append("=\"");
  return S;
}

/// Strings are prefixed with their length so arbitrary (binary) payload can
/// be transmitted.
void putString(std::ostream& OS, std::string_view Tag, std::string_view Value)
{
  OS << attributeTag(Tag, "Size") << Value.size() << "\">" << Value
     << closeTag(Tag);
}

template <typename T>
void putNumber(std::ostream& OS, std::string_view Tag, T Value)
{
  OS << openTag(Tag);
  if constexpr (std::is_floating_point_v<T>)
    OS << std::setprecision(std::numeric_limits<T>::max_digits10) << Value;
  else
    OS << +Value;
  OS << closeTag(Tag);
}

void putBool(std::ostream& OS, std::string_view Tag, bool Value)
{
  OS << openTag(Tag) << (Value ? "TRUE" : "FALSE") << closeTag(Tag);
}

template <typename T>
void putOptionalNumber(std::ostream& OS,
                       std::string_view Tag,
                       const std::optional<T>& Value)
{
  if (!Value)
    OS << emptyTag(Tag);
  else
    putNumber(OS, Tag, *Value);
}

void putOptionalString(std::ostream& OS,
                       std::string_view Tag,
                       const std::optional<std::string>& Value)
{
  if (!Value)
    OS << emptyTag(Tag);
  else
    putString(OS, Tag, *Value);
}

void putListHeader(std::ostream& OS, std::string_view Tag, std::size_t Count)
{
  OS << attributeTag(Tag, "Count") << Count << "\">";
}

std::optional<std::string> takeString(std::string_view& View,
                                      std::string_view Tag)
{
  if (!consume(View, attributeTag(Tag, "Size")))
    return std::nullopt;
  auto SizeStr = takeUntilAndConsume(View, "\">");
  if (!SizeStr)
    return std::nullopt;
  auto Size = parseNumber<std::size_t>(*SizeStr);
  if (!Size || *Size > View.size())
    return std::nullopt;

  std::string Value{View.substr(0, *Size)};
  View.remove_prefix(*Size);
  if (!consume(View, closeTag(Tag)))
    return std::nullopt;
  return Value;
}

template <typename T>
std::optional<T> takeNumber(std::string_view& View, std::string_view Tag)
{
  if (!consume(View, openTag(Tag)))
    return std::nullopt;
  auto Str = takeUntilAndConsume(View, closeTag(Tag));
  if (!Str)
    return std::nullopt;
  return parseNumber<T>(*Str);
}

std::optional<bool> takeBool(std::string_view& View, std::string_view Tag)
{
  if (!consume(View, openTag(Tag)))
    return std::nullopt;
  std::optional<bool> Value;
  if (consume(View, "TRUE"))
    Value = true;
  else if (consume(View, "FALSE"))
    Value = false;
  if (!Value || !consume(View, closeTag(Tag)))
    return std::nullopt;
  return Value;
}

template <typename T>
std::optional<std::optional<T>> takeOptionalNumber(std::string_view& View,
                                                   std::string_view Tag)
{
  if (consume(View, emptyTag(Tag)))
    return std::optional<std::optional<T>>{std::in_place};
  auto N = takeNumber<T>(View, Tag);
  if (!N)
    return std::nullopt;
  return std::optional<std::optional<T>>{std::in_place, *N};
}

std::optional<std::optional<std::string>>
takeOptionalString(std::string_view& View, std::string_view Tag)
{
  if (consume(View, emptyTag(Tag)))
    return std::optional<std::optional<std::string>>{std::in_place};
  auto S = takeString(View, Tag);
  if (!S)
    return std::nullopt;
  return std::optional<std::optional<std::string>>{std::in_place,
                                                   std::move(*S)};
}

std::optional<std::size_t> takeListHeader(std::string_view& View,
                                          std::string_view Tag)
{
  if (!consume(View, attributeTag(Tag, "Count")))
    return std::nullopt;
  auto CountStr = takeUntilAndConsume(View, "\">");
  if (!CountStr)
    return std::nullopt;
  auto Count = parseNumber<std::size_t>(*CountStr);
  // Every element takes at least a few characters, so a count larger than
  // the remaining buffer is certainly corrupt.
  if (!Count || *Count > View.size())
    return std::nullopt;
  return Count;
}

} // namespace

#define CONSUME_OR_NONE(LITERAL)                                               \
  if (!consume(View, LITERAL))                                                 \
    return std::nullopt;

#define TAKE_OR_NONE(TARGET, EXPR)                                             \
  if (auto Taken = (EXPR); !Taken)                                             \
    return std::nullopt;                                                       \
  else                                                                         \
    (TARGET) = std::move(*Taken);

#define HEADER_OR_NONE(LITERAL)                                                \
  std::string_view View = Buffer;                                              \
  CONSUME_OR_NONE(LITERAL)

// Base classes must not check for the end of the buffer, as the decode
// buffer contains the rest of the enclosing message.
#define BASE_FOOTER_OR_NONE(LITERAL)                                           \
  CONSUME_OR_NONE(LITERAL)                                                     \
  Buffer = View;

#define FOOTER_OR_NONE(LITERAL)                                                \
  if (View != (LITERAL))                                                       \
    return std::nullopt;

ENCODE_BASE(Result)
{
  std::ostringstream Buf;
  Buf << "<RESULT>";
  putBool(Buf, "SUCCESS", Object.Success);
  putString(Buf, "ERROR", Object.Error);
  putString(Buf, "REASON", Object.Reason);
  Buf << "</RESULT>";
  return Buf.str();
}
DECODE_BASE(Result)
{
  Result Ret;
  HEADER_OR_NONE("<RESULT>");
  TAKE_OR_NONE(Ret.Success, takeBool(View, "SUCCESS"));
  TAKE_OR_NONE(Ret.Error, takeString(View, "ERROR"));
  TAKE_OR_NONE(Ret.Reason, takeString(View, "REASON"));
  BASE_FOOTER_OR_NONE("</RESULT>");
  return Ret;
}

ENCODE_BASE(LaunchConfig)
{
  std::ostringstream Buf;
  Buf << "<LAUNCH>";
  putString(Buf, "PROGRAM", Object.Program);
  putListHeader(Buf, "ARGUMENTS", Object.Arguments.size());
  for (const std::string& Arg : Object.Arguments)
    putString(Buf, "ARGUMENT", Arg);
  Buf << "</ARGUMENTS>";
  putString(Buf, "NAME", Object.Name);
  putOptionalNumber(Buf, "ATTACH", Object.AttachPersistentProcess);
  Buf << "</LAUNCH>";
  return Buf.str();
}
DECODE_BASE(LaunchConfig)
{
  LaunchConfig Ret;
  HEADER_OR_NONE("<LAUNCH>");
  TAKE_OR_NONE(Ret.Program, takeString(View, "PROGRAM"));
  {
    std::size_t Count = 0;
    TAKE_OR_NONE(Count, takeListHeader(View, "ARGUMENTS"));
    Ret.Arguments.resize(Count);
    for (std::size_t I = 0; I < Count; ++I)
      TAKE_OR_NONE(Ret.Arguments.at(I), takeString(View, "ARGUMENT"));
    CONSUME_OR_NONE("</ARGUMENTS>");
  }
  TAKE_OR_NONE(Ret.Name, takeString(View, "NAME"));
  TAKE_OR_NONE(Ret.AttachPersistentProcess,
               takeOptionalNumber<ProcessID>(View, "ATTACH"));
  BASE_FOOTER_OR_NONE("</LAUNCH>");
  return Ret;
}

ENCODE_BASE(LayoutTerminal)
{
  std::ostringstream Buf;
  Buf << "<TERMINAL>";
  putNumber(Buf, "ID", Object.Terminal);
  putNumber(Buf, "SIZE", Object.RelativeSize);
  Buf << "</TERMINAL>";
  return Buf.str();
}
DECODE_BASE(LayoutTerminal)
{
  LayoutTerminal Ret;
  HEADER_OR_NONE("<TERMINAL>");
  TAKE_OR_NONE(Ret.Terminal, takeNumber<ProcessID>(View, "ID"));
  TAKE_OR_NONE(Ret.RelativeSize, takeNumber<double>(View, "SIZE"));
  BASE_FOOTER_OR_NONE("</TERMINAL>");
  return Ret;
}

ENCODE_BASE(LayoutTab)
{
  std::ostringstream Buf;
  Buf << "<TAB>";
  putBool(Buf, "ACTIVE", Object.IsActive);
  putOptionalNumber(Buf, "ACTIVE-TERMINAL", Object.ActivePersistentTerminal);
  putListHeader(Buf, "TERMINALS", Object.Terminals.size());
  for (const LayoutTerminal& T : Object.Terminals)
    Buf << LayoutTerminal::encode(T);
  Buf << "</TERMINALS>";
  Buf << "</TAB>";
  return Buf.str();
}
DECODE_BASE(LayoutTab)
{
  LayoutTab Ret;
  HEADER_OR_NONE("<TAB>");
  TAKE_OR_NONE(Ret.IsActive, takeBool(View, "ACTIVE"));
  TAKE_OR_NONE(Ret.ActivePersistentTerminal,
               takeOptionalNumber<ProcessID>(View, "ACTIVE-TERMINAL"));
  {
    std::size_t Count = 0;
    TAKE_OR_NONE(Count, takeListHeader(View, "TERMINALS"));
    Ret.Terminals.resize(Count);
    for (std::size_t I = 0; I < Count; ++I)
      TAKE_OR_NONE(Ret.Terminals.at(I), LayoutTerminal::decode(View));
    CONSUME_OR_NONE("</TERMINALS>");
  }
  BASE_FOOTER_OR_NONE("</TAB>");
  return Ret;
}

ENCODE_BASE(ProcessDescriptor)
{
  std::ostringstream Buf;
  Buf << "<PROCESS>";
  putNumber(Buf, "ID", Object.ID);
  putString(Buf, "TITLE", Object.Title);
  putNumber(Buf, "PID", Object.PID);
  putString(Buf, "WORKSPACE-ID", Object.WorkspaceID);
  putString(Buf, "WORKSPACE-NAME", Object.WorkspaceName);
  putString(Buf, "CWD", Object.Cwd);
  putBool(Buf, "ORPHAN", Object.IsOrphan);
  Buf << "</PROCESS>";
  return Buf.str();
}
DECODE_BASE(ProcessDescriptor)
{
  ProcessDescriptor Ret;
  HEADER_OR_NONE("<PROCESS>");
  TAKE_OR_NONE(Ret.ID, takeNumber<ProcessID>(View, "ID"));
  TAKE_OR_NONE(Ret.Title, takeString(View, "TITLE"));
  TAKE_OR_NONE(Ret.PID, takeNumber<std::int64_t>(View, "PID"));
  TAKE_OR_NONE(Ret.WorkspaceID, takeString(View, "WORKSPACE-ID"));
  TAKE_OR_NONE(Ret.WorkspaceName, takeString(View, "WORKSPACE-NAME"));
  TAKE_OR_NONE(Ret.Cwd, takeString(View, "CWD"));
  TAKE_OR_NONE(Ret.IsOrphan, takeBool(View, "ORPHAN"));
  BASE_FOOTER_OR_NONE("</PROCESS>");
  return Ret;
}

ENCODE_BASE(ExpandedTerminal)
{
  std::ostringstream Buf;
  Buf << "<TERMINAL>";
  if (!Object.Terminal)
    Buf << "<PLACEHOLDER />";
  else
    Buf << ProcessDescriptor::encode(*Object.Terminal);
  putNumber(Buf, "SIZE", Object.RelativeSize);
  Buf << "</TERMINAL>";
  return Buf.str();
}
DECODE_BASE(ExpandedTerminal)
{
  ExpandedTerminal Ret;
  HEADER_OR_NONE("<TERMINAL>");
  if (!consume(View, "<PLACEHOLDER />"))
    TAKE_OR_NONE(Ret.Terminal, ProcessDescriptor::decode(View));
  TAKE_OR_NONE(Ret.RelativeSize, takeNumber<double>(View, "SIZE"));
  BASE_FOOTER_OR_NONE("</TERMINAL>");
  return Ret;
}

ENCODE_BASE(ExpandedTab)
{
  std::ostringstream Buf;
  Buf << "<TAB>";
  putBool(Buf, "ACTIVE", Object.IsActive);
  putOptionalNumber(Buf, "ACTIVE-TERMINAL", Object.ActivePersistentTerminal);
  putListHeader(Buf, "TERMINALS", Object.Terminals.size());
  for (const ExpandedTerminal& T : Object.Terminals)
    Buf << ExpandedTerminal::encode(T);
  Buf << "</TERMINALS>";
  Buf << "</TAB>";
  return Buf.str();
}
DECODE_BASE(ExpandedTab)
{
  ExpandedTab Ret;
  HEADER_OR_NONE("<TAB>");
  TAKE_OR_NONE(Ret.IsActive, takeBool(View, "ACTIVE"));
  TAKE_OR_NONE(Ret.ActivePersistentTerminal,
               takeOptionalNumber<ProcessID>(View, "ACTIVE-TERMINAL"));
  {
    std::size_t Count = 0;
    TAKE_OR_NONE(Count, takeListHeader(View, "TERMINALS"));
    Ret.Terminals.resize(Count);
    for (std::size_t I = 0; I < Count; ++I)
      TAKE_OR_NONE(Ret.Terminals.at(I), ExpandedTerminal::decode(View));
    CONSUME_OR_NONE("</TERMINALS>");
  }
  BASE_FOOTER_OR_NONE("</TAB>");
  return Ret;
}

ENCODE_BASE(ReplayEntry)
{
  std::ostringstream Buf;
  if (Object.Type == ReplayEntry::DataEvent)
    putString(Buf, "DATA", Object.Data);
  else
  {
    Buf << "<RESIZE>";
    putNumber(Buf, "COLUMNS", Object.Columns);
    putNumber(Buf, "ROWS", Object.Rows);
    Buf << "</RESIZE>";
  }
  return Buf.str();
}
DECODE_BASE(ReplayEntry)
{
  ReplayEntry Ret;
  std::string_view View = Buffer;
  if (consume(View, "<RESIZE>"))
  {
    Ret.Type = ReplayEntry::ResizeEvent;
    TAKE_OR_NONE(Ret.Columns, takeNumber<std::uint16_t>(View, "COLUMNS"));
    TAKE_OR_NONE(Ret.Rows, takeNumber<std::uint16_t>(View, "ROWS"));
    CONSUME_OR_NONE("</RESIZE>");
  }
  else
  {
    Ret.Type = ReplayEntry::DataEvent;
    TAKE_OR_NONE(Ret.Data, takeString(View, "DATA"));
  }
  Buffer = View;
  return Ret;
}

#undef BASE_FOOTER_OR_NONE

namespace
{

/// Encodes the messages that only identify a process.
std::string encodeProcessOnly(std::string_view Tag, ProcessID ID)
{
  std::ostringstream Buf;
  Buf << openTag(Tag);
  putNumber(Buf, "ID", ID);
  Buf << closeTag(Tag);
  return Buf.str();
}

std::optional<ProcessID> decodeProcessOnly(std::string_view Buffer,
                                           std::string_view Tag)
{
  ProcessID ID{};
  HEADER_OR_NONE(openTag(Tag));
  TAKE_OR_NONE(ID, takeNumber<ProcessID>(View, "ID"));
  FOOTER_OR_NONE(closeTag(Tag));
  return ID;
}

/// Encodes the responses that only carry the result for a process.
std::string
encodeResultOnly(std::string_view Tag, const Result& R, ProcessID ID)
{
  std::ostringstream Buf;
  Buf << openTag(Tag);
  Buf << Result::encode(R);
  putNumber(Buf, "ID", ID);
  Buf << closeTag(Tag);
  return Buf.str();
}

std::optional<std::pair<Result, ProcessID>>
decodeResultOnly(std::string_view Buffer, std::string_view Tag)
{
  std::pair<Result, ProcessID> Ret;
  HEADER_OR_NONE(openTag(Tag));
  TAKE_OR_NONE(Ret.first, Result::decode(View));
  TAKE_OR_NONE(Ret.second, takeNumber<ProcessID>(View, "ID"));
  FOOTER_OR_NONE(closeTag(Tag));
  return Ret;
}

} // namespace

#define PROCESS_ONLY_MESSAGE(NAME, TAG)                                        \
  ENCODE(NAME) { return encodeProcessOnly(TAG, Object.ID); }                   \
  DECODE(NAME)                                                                 \
  {                                                                            \
    auto ID = decodeProcessOnly(Buffer, TAG);                                  \
    if (!ID)                                                                   \
      return std::nullopt;                                                     \
    NAME Ret;                                                                  \
    Ret.ID = *ID;                                                              \
    return Ret;                                                                \
  }

#define RESULT_ONLY_MESSAGE(NAME, TAG)                                         \
  ENCODE(NAME) { return encodeResultOnly(TAG, Object.Result, Object.ID); }     \
  DECODE(NAME)                                                                 \
  {                                                                            \
    auto RAndID = decodeResultOnly(Buffer, TAG);                               \
    if (!RAndID)                                                               \
      return std::nullopt;                                                     \
    NAME Ret;                                                                  \
    Ret.Result = std::move(RAndID->first);                                     \
    Ret.ID = RAndID->second;                                                   \
    return Ret;                                                                \
  }

namespace request
{

ENCODE(Handshake)
{
  std::ostringstream Buf;
  Buf << "<HANDSHAKE>";
  putNumber(Buf, "TYPE", Object.DesiredType);
  putString(Buf, "TOKEN", Object.ReconnectionToken);
  putBool(Buf, "RECONNECTION", Object.Reconnection);
  putOptionalString(Buf, "COMMIT", Object.Commit);
  putOptionalString(Buf, "LANGUAGE", Object.Language);
  Buf << "</HANDSHAKE>";
  return Buf.str();
}
DECODE(Handshake)
{
  Handshake Ret;
  HEADER_OR_NONE("<HANDSHAKE>");
  TAKE_OR_NONE(Ret.DesiredType, takeNumber<std::uint16_t>(View, "TYPE"));
  TAKE_OR_NONE(Ret.ReconnectionToken, takeString(View, "TOKEN"));
  TAKE_OR_NONE(Ret.Reconnection, takeBool(View, "RECONNECTION"));
  TAKE_OR_NONE(Ret.Commit, takeOptionalString(View, "COMMIT"));
  TAKE_OR_NONE(Ret.Language, takeOptionalString(View, "LANGUAGE"));
  FOOTER_OR_NONE("</HANDSHAKE>");
  return Ret;
}

ENCODE(CreateProcess)
{
  std::ostringstream Buf;
  Buf << "<CREATE-PROCESS>";
  Buf << LaunchConfig::encode(Object.Config);
  putString(Buf, "CWD", Object.Cwd);
  putNumber(Buf, "COLUMNS", Object.Columns);
  putNumber(Buf, "ROWS", Object.Rows);
  putListHeader(Buf, "ENVIRONMENT", Object.Environment.size());
  for (const auto& KV : Object.Environment)
  {
    Buf << "<VARVAL>";
    putString(Buf, "VAR", KV.first);
    putString(Buf, "VAL", KV.second);
    Buf << "</VARVAL>";
  }
  Buf << "</ENVIRONMENT>";
  putBool(Buf, "PERSIST", Object.ShouldPersist);
  putString(Buf, "WORKSPACE-ID", Object.WorkspaceID);
  putString(Buf, "WORKSPACE-NAME", Object.WorkspaceName);
  Buf << "</CREATE-PROCESS>";
  return Buf.str();
}
DECODE(CreateProcess)
{
  CreateProcess Ret;
  HEADER_OR_NONE("<CREATE-PROCESS>");
  TAKE_OR_NONE(Ret.Config, LaunchConfig::decode(View));
  TAKE_OR_NONE(Ret.Cwd, takeString(View, "CWD"));
  TAKE_OR_NONE(Ret.Columns, takeNumber<std::uint16_t>(View, "COLUMNS"));
  TAKE_OR_NONE(Ret.Rows, takeNumber<std::uint16_t>(View, "ROWS"));
  {
    std::size_t Count = 0;
    TAKE_OR_NONE(Count, takeListHeader(View, "ENVIRONMENT"));
    Ret.Environment.resize(Count);
    for (std::size_t I = 0; I < Count; ++I)
    {
      CONSUME_OR_NONE("<VARVAL>");
      TAKE_OR_NONE(Ret.Environment.at(I).first, takeString(View, "VAR"));
      TAKE_OR_NONE(Ret.Environment.at(I).second, takeString(View, "VAL"));
      CONSUME_OR_NONE("</VARVAL>");
    }
    CONSUME_OR_NONE("</ENVIRONMENT>");
  }
  TAKE_OR_NONE(Ret.ShouldPersist, takeBool(View, "PERSIST"));
  TAKE_OR_NONE(Ret.WorkspaceID, takeString(View, "WORKSPACE-ID"));
  TAKE_OR_NONE(Ret.WorkspaceName, takeString(View, "WORKSPACE-NAME"));
  FOOTER_OR_NONE("</CREATE-PROCESS>");
  return Ret;
}

PROCESS_ONLY_MESSAGE(AttachToProcess, "ATTACH")
PROCESS_ONLY_MESSAGE(DetachFromProcess, "DETACH")
PROCESS_ONLY_MESSAGE(StartProcess, "START")
PROCESS_ONLY_MESSAGE(GetInitialCwd, "INITIAL-CWD")
PROCESS_ONLY_MESSAGE(GetCwd, "CWD")
PROCESS_ONLY_MESSAGE(GetLatency, "LATENCY")
PROCESS_ONLY_MESSAGE(OrphanQuestionReply, "ORPHAN-REPLY")
PROCESS_ONLY_MESSAGE(ReduceGraceTime, "REDUCE-GRACE")

ENCODE(ShutdownProcess)
{
  std::ostringstream Buf;
  Buf << "<SHUTDOWN>";
  putNumber(Buf, "ID", Object.ID);
  putBool(Buf, "IMMEDIATE", Object.Immediate);
  Buf << "</SHUTDOWN>";
  return Buf.str();
}
DECODE(ShutdownProcess)
{
  ShutdownProcess Ret;
  HEADER_OR_NONE("<SHUTDOWN>");
  TAKE_OR_NONE(Ret.ID, takeNumber<ProcessID>(View, "ID"));
  TAKE_OR_NONE(Ret.Immediate, takeBool(View, "IMMEDIATE"));
  FOOTER_OR_NONE("</SHUTDOWN>");
  return Ret;
}

ENCODE(Input)
{
  std::ostringstream Buf;
  Buf << "<INPUT>";
  putNumber(Buf, "ID", Object.ID);
  putString(Buf, "DATA", Object.Data);
  Buf << "</INPUT>";
  return Buf.str();
}
DECODE(Input)
{
  Input Ret;
  HEADER_OR_NONE("<INPUT>");
  TAKE_OR_NONE(Ret.ID, takeNumber<ProcessID>(View, "ID"));
  TAKE_OR_NONE(Ret.Data, takeString(View, "DATA"));
  FOOTER_OR_NONE("</INPUT>");
  return Ret;
}

ENCODE(Resize)
{
  std::ostringstream Buf;
  Buf << "<RESIZE>";
  putNumber(Buf, "ID", Object.ID);
  putNumber(Buf, "COLUMNS", Object.Columns);
  putNumber(Buf, "ROWS", Object.Rows);
  Buf << "</RESIZE>";
  return Buf.str();
}
DECODE(Resize)
{
  Resize Ret;
  HEADER_OR_NONE("<RESIZE>");
  TAKE_OR_NONE(Ret.ID, takeNumber<ProcessID>(View, "ID"));
  TAKE_OR_NONE(Ret.Columns, takeNumber<std::uint16_t>(View, "COLUMNS"));
  TAKE_OR_NONE(Ret.Rows, takeNumber<std::uint16_t>(View, "ROWS"));
  FOOTER_OR_NONE("</RESIZE>");
  return Ret;
}

ENCODE(AcknowledgeDataEvent)
{
  std::ostringstream Buf;
  Buf << "<ACK>";
  putNumber(Buf, "ID", Object.ID);
  putNumber(Buf, "COUNT", Object.CharCount);
  Buf << "</ACK>";
  return Buf.str();
}
DECODE(AcknowledgeDataEvent)
{
  AcknowledgeDataEvent Ret;
  HEADER_OR_NONE("<ACK>");
  TAKE_OR_NONE(Ret.ID, takeNumber<ProcessID>(View, "ID"));
  TAKE_OR_NONE(Ret.CharCount, takeNumber<std::uint64_t>(View, "COUNT"));
  FOOTER_OR_NONE("</ACK>");
  return Ret;
}

ENCODE(SetLayout)
{
  std::ostringstream Buf;
  Buf << "<SET-LAYOUT>";
  putString(Buf, "WORKSPACE-ID", Object.WorkspaceID);
  putListHeader(Buf, "TABS", Object.Tabs.size());
  for (const LayoutTab& T : Object.Tabs)
    Buf << LayoutTab::encode(T);
  Buf << "</TABS>";
  Buf << "</SET-LAYOUT>";
  return Buf.str();
}
DECODE(SetLayout)
{
  SetLayout Ret;
  HEADER_OR_NONE("<SET-LAYOUT>");
  TAKE_OR_NONE(Ret.WorkspaceID, takeString(View, "WORKSPACE-ID"));
  {
    std::size_t Count = 0;
    TAKE_OR_NONE(Count, takeListHeader(View, "TABS"));
    Ret.Tabs.resize(Count);
    for (std::size_t I = 0; I < Count; ++I)
      TAKE_OR_NONE(Ret.Tabs.at(I), LayoutTab::decode(View));
    CONSUME_OR_NONE("</TABS>");
  }
  FOOTER_OR_NONE("</SET-LAYOUT>");
  return Ret;
}

ENCODE(GetLayout)
{
  std::ostringstream Buf;
  Buf << "<GET-LAYOUT>";
  putString(Buf, "WORKSPACE-ID", Object.WorkspaceID);
  Buf << "</GET-LAYOUT>";
  return Buf.str();
}
DECODE(GetLayout)
{
  GetLayout Ret;
  HEADER_OR_NONE("<GET-LAYOUT>");
  TAKE_OR_NONE(Ret.WorkspaceID, takeString(View, "WORKSPACE-ID"));
  FOOTER_OR_NONE("</GET-LAYOUT>");
  return Ret;
}

} // namespace request

namespace response
{

ENCODE(HandshakeOk)
{
  std::ostringstream Buf;
  Buf << "<HANDSHAKE-OK>";
  putOptionalNumber(Buf, "DEBUG-PORT", Object.DebugPort);
  Buf << "</HANDSHAKE-OK>";
  return Buf.str();
}
DECODE(HandshakeOk)
{
  HandshakeOk Ret;
  HEADER_OR_NONE("<HANDSHAKE-OK>");
  TAKE_OR_NONE(Ret.DebugPort,
               takeOptionalNumber<std::uint16_t>(View, "DEBUG-PORT"));
  FOOTER_OR_NONE("</HANDSHAKE-OK>");
  return Ret;
}

ENCODE(HandshakeError)
{
  std::ostringstream Buf;
  Buf << "<HANDSHAKE-ERROR>";
  putString(Buf, "REASON", Object.Reason);
  Buf << "</HANDSHAKE-ERROR>";
  return Buf.str();
}
DECODE(HandshakeError)
{
  HandshakeError Ret;
  HEADER_OR_NONE("<HANDSHAKE-ERROR>");
  TAKE_OR_NONE(Ret.Reason, takeString(View, "REASON"));
  FOOTER_OR_NONE("</HANDSHAKE-ERROR>");
  return Ret;
}

RESULT_ONLY_MESSAGE(CreateProcess, "CREATE-PROCESS")
RESULT_ONLY_MESSAGE(AttachToProcess, "ATTACH")
RESULT_ONLY_MESSAGE(DetachFromProcess, "DETACH")
RESULT_ONLY_MESSAGE(ShutdownProcess, "SHUTDOWN")
RESULT_ONLY_MESSAGE(Input, "INPUT")
RESULT_ONLY_MESSAGE(Resize, "RESIZE")
RESULT_ONLY_MESSAGE(AcknowledgeDataEvent, "ACK")
RESULT_ONLY_MESSAGE(OrphanQuestionReply, "ORPHAN-REPLY")
RESULT_ONLY_MESSAGE(ReduceGraceTime, "REDUCE-GRACE")

ENCODE(StartProcess)
{
  std::ostringstream Buf;
  Buf << "<START>";
  Buf << message::Result::encode(Object.Result);
  putNumber(Buf, "ID", Object.ID);
  putOptionalNumber(Buf, "ERROR-CODE", Object.LaunchErrorCode);
  Buf << "</START>";
  return Buf.str();
}
DECODE(StartProcess)
{
  StartProcess Ret;
  HEADER_OR_NONE("<START>");
  TAKE_OR_NONE(Ret.Result, message::Result::decode(View));
  TAKE_OR_NONE(Ret.ID, takeNumber<ProcessID>(View, "ID"));
  TAKE_OR_NONE(Ret.LaunchErrorCode,
               takeOptionalNumber<std::int32_t>(View, "ERROR-CODE"));
  FOOTER_OR_NONE("</START>");
  return Ret;
}

#define CWD_MESSAGE(NAME, TAG)                                                 \
  ENCODE(NAME)                                                                 \
  {                                                                            \
    std::ostringstream Buf;                                                    \
    Buf << openTag(TAG);                                                       \
    Buf << message::Result::encode(Object.Result);                             \
    putNumber(Buf, "ID", Object.ID);                                           \
    putString(Buf, "CWD", Object.Cwd);                                         \
    Buf << closeTag(TAG);                                                      \
    return Buf.str();                                                          \
  }                                                                            \
  DECODE(NAME)                                                                 \
  {                                                                            \
    NAME Ret;                                                                  \
    HEADER_OR_NONE(openTag(TAG));                                              \
    TAKE_OR_NONE(Ret.Result, message::Result::decode(View));                   \
    TAKE_OR_NONE(Ret.ID, takeNumber<ProcessID>(View, "ID"));                   \
    TAKE_OR_NONE(Ret.Cwd, takeString(View, "CWD"));                            \
    FOOTER_OR_NONE(closeTag(TAG));                                             \
    return Ret;                                                                \
  }

CWD_MESSAGE(GetInitialCwd, "INITIAL-CWD")
CWD_MESSAGE(GetCwd, "CWD")

#undef CWD_MESSAGE

ENCODE(GetLatency)
{
  std::ostringstream Buf;
  Buf << "<LATENCY>";
  Buf << message::Result::encode(Object.Result);
  putNumber(Buf, "ID", Object.ID);
  putNumber(Buf, "VALUE", Object.Latency);
  Buf << "</LATENCY>";
  return Buf.str();
}
DECODE(GetLatency)
{
  GetLatency Ret;
  HEADER_OR_NONE("<LATENCY>");
  TAKE_OR_NONE(Ret.Result, message::Result::decode(View));
  TAKE_OR_NONE(Ret.ID, takeNumber<ProcessID>(View, "ID"));
  TAKE_OR_NONE(Ret.Latency, takeNumber<std::uint64_t>(View, "VALUE"));
  FOOTER_OR_NONE("</LATENCY>");
  return Ret;
}

ENCODE(SetLayout)
{
  std::ostringstream Buf;
  Buf << "<SET-LAYOUT>";
  Buf << message::Result::encode(Object.Result);
  putString(Buf, "WORKSPACE-ID", Object.WorkspaceID);
  Buf << "</SET-LAYOUT>";
  return Buf.str();
}
DECODE(SetLayout)
{
  SetLayout Ret;
  HEADER_OR_NONE("<SET-LAYOUT>");
  TAKE_OR_NONE(Ret.Result, message::Result::decode(View));
  TAKE_OR_NONE(Ret.WorkspaceID, takeString(View, "WORKSPACE-ID"));
  FOOTER_OR_NONE("</SET-LAYOUT>");
  return Ret;
}

ENCODE(GetLayout)
{
  std::ostringstream Buf;
  Buf << "<GET-LAYOUT>";
  Buf << message::Result::encode(Object.Result);
  putString(Buf, "WORKSPACE-ID", Object.WorkspaceID);
  if (!Object.Tabs)
    Buf << "<TABS />";
  else
  {
    putListHeader(Buf, "TABS", Object.Tabs->size());
    for (const ExpandedTab& T : *Object.Tabs)
      Buf << ExpandedTab::encode(T);
    Buf << "</TABS>";
  }
  Buf << "</GET-LAYOUT>";
  return Buf.str();
}
DECODE(GetLayout)
{
  GetLayout Ret;
  HEADER_OR_NONE("<GET-LAYOUT>");
  TAKE_OR_NONE(Ret.Result, message::Result::decode(View));
  TAKE_OR_NONE(Ret.WorkspaceID, takeString(View, "WORKSPACE-ID"));
  if (!consume(View, "<TABS />"))
  {
    std::size_t Count = 0;
    TAKE_OR_NONE(Count, takeListHeader(View, "TABS"));
    std::vector<ExpandedTab> Tabs(Count);
    for (std::size_t I = 0; I < Count; ++I)
      TAKE_OR_NONE(Tabs.at(I), ExpandedTab::decode(View));
    CONSUME_OR_NONE("</TABS>");
    Ret.Tabs = std::move(Tabs);
  }
  FOOTER_OR_NONE("</GET-LAYOUT>");
  return Ret;
}

} // namespace response

namespace notification
{

ENCODE(ProcessData)
{
  std::ostringstream Buf;
  Buf << "<DATA>";
  putNumber(Buf, "ID", Object.ID);
  putString(Buf, "CONTENTS", Object.Data);
  Buf << "</DATA>";
  return Buf.str();
}
DECODE(ProcessData)
{
  ProcessData Ret;
  HEADER_OR_NONE("<DATA>");
  TAKE_OR_NONE(Ret.ID, takeNumber<ProcessID>(View, "ID"));
  TAKE_OR_NONE(Ret.Data, takeString(View, "CONTENTS"));
  FOOTER_OR_NONE("</DATA>");
  return Ret;
}

ENCODE(ProcessReplay)
{
  std::ostringstream Buf;
  Buf << "<REPLAY>";
  putNumber(Buf, "ID", Object.ID);
  putNumber(Buf, "START-COLUMNS", Object.StartColumns);
  putNumber(Buf, "START-ROWS", Object.StartRows);
  putListHeader(Buf, "EVENTS", Object.Events.size());
  for (const ReplayEntry& E : Object.Events)
    Buf << ReplayEntry::encode(E);
  Buf << "</EVENTS>";
  Buf << "</REPLAY>";
  return Buf.str();
}
DECODE(ProcessReplay)
{
  ProcessReplay Ret;
  HEADER_OR_NONE("<REPLAY>");
  TAKE_OR_NONE(Ret.ID, takeNumber<ProcessID>(View, "ID"));
  TAKE_OR_NONE(Ret.StartColumns,
               takeNumber<std::uint16_t>(View, "START-COLUMNS"));
  TAKE_OR_NONE(Ret.StartRows, takeNumber<std::uint16_t>(View, "START-ROWS"));
  {
    std::size_t Count = 0;
    TAKE_OR_NONE(Count, takeListHeader(View, "EVENTS"));
    Ret.Events.resize(Count);
    for (std::size_t I = 0; I < Count; ++I)
      TAKE_OR_NONE(Ret.Events.at(I), ReplayEntry::decode(View));
    CONSUME_OR_NONE("</EVENTS>");
  }
  FOOTER_OR_NONE("</REPLAY>");
  return Ret;
}

ENCODE(ProcessExit)
{
  std::ostringstream Buf;
  Buf << "<EXIT>";
  putNumber(Buf, "ID", Object.ID);
  putOptionalNumber(Buf, "CODE", Object.ExitCode);
  Buf << "</EXIT>";
  return Buf.str();
}
DECODE(ProcessExit)
{
  ProcessExit Ret;
  HEADER_OR_NONE("<EXIT>");
  TAKE_OR_NONE(Ret.ID, takeNumber<ProcessID>(View, "ID"));
  TAKE_OR_NONE(Ret.ExitCode, takeOptionalNumber<std::int32_t>(View, "CODE"));
  FOOTER_OR_NONE("</EXIT>");
  return Ret;
}

ENCODE(ProcessReady)
{
  std::ostringstream Buf;
  Buf << "<READY>";
  putNumber(Buf, "ID", Object.ID);
  putNumber(Buf, "PID", Object.PID);
  putString(Buf, "CWD", Object.Cwd);
  Buf << "</READY>";
  return Buf.str();
}
DECODE(ProcessReady)
{
  ProcessReady Ret;
  HEADER_OR_NONE("<READY>");
  TAKE_OR_NONE(Ret.ID, takeNumber<ProcessID>(View, "ID"));
  TAKE_OR_NONE(Ret.PID, takeNumber<std::int64_t>(View, "PID"));
  TAKE_OR_NONE(Ret.Cwd, takeString(View, "CWD"));
  FOOTER_OR_NONE("</READY>");
  return Ret;
}

ENCODE(ProcessTitle)
{
  std::ostringstream Buf;
  Buf << "<TITLE>";
  putNumber(Buf, "ID", Object.ID);
  putString(Buf, "VALUE", Object.Title);
  Buf << "</TITLE>";
  return Buf.str();
}
DECODE(ProcessTitle)
{
  ProcessTitle Ret;
  HEADER_OR_NONE("<TITLE>");
  TAKE_OR_NONE(Ret.ID, takeNumber<ProcessID>(View, "ID"));
  TAKE_OR_NONE(Ret.Title, takeString(View, "VALUE"));
  FOOTER_OR_NONE("</TITLE>");
  return Ret;
}

PROCESS_ONLY_MESSAGE(ProcessOrphanQuestion, "ORPHAN-QUESTION")

} // namespace notification

} // namespace remux::message

#undef PROCESS_ONLY_MESSAGE
#undef RESULT_ONLY_MESSAGE
#undef FOOTER_OR_NONE
#undef HEADER_OR_NONE
#undef TAKE_OR_NONE
#undef CONSUME_OR_NONE
#undef DECODE
#undef ENCODE
#undef DECODE_BASE
#undef ENCODE_BASE
