/* SPDX-License-Identifier: GPL-3.0-only */
#include <string>

#include <gtest/gtest.h>

#include "remux/message/Message.hpp"
#include "remux/message/PascalString.hpp"

/* NOLINTBEGIN(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */

/// Helper function for removing the kind prefix and the terminator from the
/// created buffer for ease of testing.
template <typename Msg> static std::string encode(const Msg& M)
{
  using namespace remux::message;

  std::string S = remux::message::encode(M);
  std::string_view Unpacked = Message::unpack(S).RawData;
  return std::string{Unpacked};
}

template <typename Msg> static Msg codec(const Msg& M)
{
  using namespace remux::message;

  std::string Data = remux::message::encode(M);
  std::optional<Msg> Decode = decode<Msg>(Data);
  EXPECT_TRUE(Decode && "Decoding just encoded message should succeed!");
  return *Decode;
}

TEST(MessageSerialisation, KindPrefixAndTerminator)
{
  using namespace remux::message;

  std::string S = remux::message::encode(response::HandshakeOk{});
  EXPECT_EQ(S.substr(0, Message::KindWidth), "00003");
  EXPECT_EQ(S.back(), '\0');

  EXPECT_EQ(Message::unpack("00003").Kind, MessageKind::Invalid);
  EXPECT_EQ(Message::unpack("99999<X>").Kind, MessageKind::Invalid);
  EXPECT_EQ(Message::unpack("abc").Kind, MessageKind::Invalid);
}

TEST(MessageSerialisation, DecodeRejectsOtherKind)
{
  using namespace remux::message;

  std::string S = remux::message::encode(request::StartProcess{});
  EXPECT_FALSE(decode<request::AttachToProcess>(S).has_value());
  EXPECT_TRUE(decode<request::StartProcess>(S).has_value());
}

TEST(MessageSerialisation, Handshake)
{
  remux::message::request::Handshake Obj;
  Obj.DesiredType = 1;
  Obj.ReconnectionToken = "tok";
  EXPECT_EQ(encode(Obj),
            "<HANDSHAKE><TYPE>1</TYPE><TOKEN Size=\"3\">tok</TOKEN>"
            "<RECONNECTION>FALSE</RECONNECTION><COMMIT /><LANGUAGE />"
            "</HANDSHAKE>");

  Obj.Reconnection = true;
  Obj.Commit = "abcdef";
  auto Decoded = codec(Obj);
  EXPECT_EQ(Decoded.DesiredType, 1);
  EXPECT_EQ(Decoded.ReconnectionToken, "tok");
  EXPECT_TRUE(Decoded.Reconnection);
  EXPECT_EQ(Decoded.Commit, "abcdef");
  EXPECT_FALSE(Decoded.Language.has_value());
}

TEST(MessageSerialisation, HandshakeKeepsUnknownType)
{
  remux::message::request::Handshake Obj;
  Obj.DesiredType = 42;
  EXPECT_EQ(codec(Obj).DesiredType, 42);
}

TEST(MessageSerialisation, HandshakeReplies)
{
  remux::message::response::HandshakeOk Ok;
  EXPECT_EQ(encode(Ok), "<HANDSHAKE-OK><DEBUG-PORT /></HANDSHAKE-OK>");
  Ok.DebugPort = 9229;
  EXPECT_EQ(encode(Ok),
            "<HANDSHAKE-OK><DEBUG-PORT>9229</DEBUG-PORT></HANDSHAKE-OK>");

  remux::message::response::HandshakeError Err;
  Err.Reason = "Unknown reconnection token";
  EXPECT_EQ(codec(Err).Reason, "Unknown reconnection token");
}

TEST(MessageSerialisation, InputCarriesBinaryData)
{
  remux::message::request::Input Obj;
  Obj.ID = 7;
  Obj.Data = "ab";
  EXPECT_EQ(encode(Obj),
            "<INPUT><ID>7</ID><DATA Size=\"2\">ab</DATA></INPUT>");

  // Data that looks like markup or contains NULs must survive intact.
  Obj.Data = std::string{"</DATA>\0\n", 9};
  EXPECT_EQ(codec(Obj).Data, Obj.Data);
}

TEST(MessageSerialisation, ResultFailure)
{
  remux::message::response::AttachToProcess Obj;
  Obj.ID = 3;
  Obj.Result.Success = false;
  Obj.Result.Error = "UnknownProcess";
  Obj.Result.Reason = "x";
  EXPECT_EQ(encode(Obj),
            "<ATTACH><RESULT><SUCCESS>FALSE</SUCCESS>"
            "<ERROR Size=\"14\">UnknownProcess</ERROR>"
            "<REASON Size=\"1\">x</REASON></RESULT><ID>3</ID></ATTACH>");

  auto Decoded = codec(Obj);
  EXPECT_FALSE(Decoded.Result.Success);
  EXPECT_EQ(Decoded.Result.Error, "UnknownProcess");
  EXPECT_EQ(Decoded.ID, 3);
}

TEST(MessageSerialisation, StartProcessLaunchError)
{
  remux::message::response::StartProcess Obj;
  Obj.ID = 1;
  EXPECT_FALSE(codec(Obj).LaunchErrorCode.has_value());

  Obj.Result.Success = false;
  Obj.LaunchErrorCode = 2;
  EXPECT_EQ(codec(Obj).LaunchErrorCode, 2);
}

TEST(MessageSerialisation, CreateProcess)
{
  remux::message::request::CreateProcess Obj;
  Obj.Config.Program = "/bin/sh";
  Obj.Config.Arguments = {"-c", "echo hi"};
  Obj.Config.Name = "shell";
  Obj.Cwd = "/tmp";
  Obj.Columns = 80;
  Obj.Rows = 24;
  Obj.Environment = {{"FOO", "bar"}, {"EMPTY", ""}};
  Obj.ShouldPersist = false;
  Obj.WorkspaceID = "w1";
  Obj.WorkspaceName = "Workspace";

  auto Decoded = codec(Obj);
  EXPECT_EQ(Decoded.Config.Program, "/bin/sh");
  ASSERT_EQ(Decoded.Config.Arguments.size(), 2);
  EXPECT_EQ(Decoded.Config.Arguments.at(1), "echo hi");
  EXPECT_EQ(Decoded.Config.Name, "shell");
  EXPECT_FALSE(Decoded.Config.AttachPersistentProcess.has_value());
  EXPECT_EQ(Decoded.Cwd, "/tmp");
  EXPECT_EQ(Decoded.Columns, 80);
  EXPECT_EQ(Decoded.Rows, 24);
  ASSERT_EQ(Decoded.Environment.size(), 2);
  EXPECT_EQ(Decoded.Environment.at(0).second, "bar");
  EXPECT_EQ(Decoded.Environment.at(1).first, "EMPTY");
  EXPECT_FALSE(Decoded.ShouldPersist);
  EXPECT_EQ(Decoded.WorkspaceName, "Workspace");
}

TEST(MessageSerialisation, Layout)
{
  using namespace remux::message;

  request::SetLayout Set;
  Set.WorkspaceID = "w";
  LayoutTab Tab;
  Tab.IsActive = true;
  Tab.ActivePersistentTerminal = 2;
  Tab.Terminals.push_back(LayoutTerminal{1, 0.25});
  Tab.Terminals.push_back(LayoutTerminal{2, 0.75});
  Set.Tabs.push_back(Tab);

  auto DecodedSet = codec(Set);
  ASSERT_EQ(DecodedSet.Tabs.size(), 1);
  EXPECT_TRUE(DecodedSet.Tabs.front().IsActive);
  EXPECT_EQ(DecodedSet.Tabs.front().ActivePersistentTerminal, 2);
  ASSERT_EQ(DecodedSet.Tabs.front().Terminals.size(), 2);
  EXPECT_DOUBLE_EQ(DecodedSet.Tabs.front().Terminals.at(0).RelativeSize, 0.25);

  response::GetLayout Get;
  Get.WorkspaceID = "w";
  EXPECT_FALSE(codec(Get).Tabs.has_value());

  ExpandedTab ETab;
  ExpandedTerminal Live;
  Live.Terminal = ProcessDescriptor{};
  Live.Terminal->ID = 1;
  Live.Terminal->Title = "bash";
  Live.Terminal->IsOrphan = true;
  Live.RelativeSize = 0.5;
  ETab.Terminals.push_back(Live);
  ETab.Terminals.push_back(ExpandedTerminal{std::nullopt, 0.5});
  Get.Tabs.emplace();
  Get.Tabs->push_back(ETab);

  auto DecodedGet = codec(Get);
  ASSERT_TRUE(DecodedGet.Tabs.has_value());
  const auto& Terms = DecodedGet.Tabs->front().Terminals;
  ASSERT_EQ(Terms.size(), 2);
  ASSERT_TRUE(Terms.at(0).Terminal.has_value());
  EXPECT_EQ(Terms.at(0).Terminal->Title, "bash");
  EXPECT_TRUE(Terms.at(0).Terminal->IsOrphan);
  EXPECT_FALSE(Terms.at(1).Terminal.has_value());
}

TEST(MessageSerialisation, Replay)
{
  using namespace remux::message;

  notification::ProcessReplay Obj;
  Obj.ID = 4;
  Obj.StartColumns = 80;
  Obj.StartRows = 24;
  ReplayEntry Data;
  Data.Data = "hello";
  ReplayEntry Resize;
  Resize.Type = ReplayEntry::ResizeEvent;
  Resize.Columns = 100;
  Resize.Rows = 30;
  Obj.Events = {Data, Resize};

  EXPECT_EQ(::encode(Obj),
            "<REPLAY><ID>4</ID><START-COLUMNS>80</START-COLUMNS>"
            "<START-ROWS>24</START-ROWS><EVENTS Count=\"2\">"
            "<DATA Size=\"5\">hello</DATA>"
            "<RESIZE><COLUMNS>100</COLUMNS><ROWS>30</ROWS></RESIZE>"
            "</EVENTS></REPLAY>");

  auto Decoded = codec(Obj);
  ASSERT_EQ(Decoded.Events.size(), 2);
  EXPECT_EQ(Decoded.Events.at(0).Type, ReplayEntry::DataEvent);
  EXPECT_EQ(Decoded.Events.at(0).Data, "hello");
  EXPECT_EQ(Decoded.Events.at(1).Type, ReplayEntry::ResizeEvent);
  EXPECT_EQ(Decoded.Events.at(1).Rows, 30);
}

TEST(MessageSerialisation, ProcessExit)
{
  remux::message::notification::ProcessExit Obj;
  Obj.ID = 9;
  EXPECT_EQ(encode(Obj), "<EXIT><ID>9</ID><CODE /></EXIT>");
  Obj.ExitCode = 0;
  EXPECT_EQ(encode(Obj), "<EXIT><ID>9</ID><CODE>0</CODE></EXIT>");
}

TEST(MessageSerialisation, GetLatency)
{
  remux::message::response::GetLatency Obj;
  Obj.ID = 2;
  EXPECT_EQ(encode(Obj),
            "<LATENCY><RESULT><SUCCESS>TRUE</SUCCESS><ERROR Size=\"0\"></ERROR>"
            "<REASON Size=\"0\"></REASON></RESULT><ID>2</ID><VALUE>0</VALUE>"
            "</LATENCY>");
}

TEST(MessageSerialisation, TrailingGarbageRejected)
{
  using namespace remux::message;

  EXPECT_TRUE(request::GetCwd::decode("<CWD><ID>1</ID></CWD>").has_value());
  EXPECT_FALSE(
    request::GetCwd::decode("<CWD><ID>1</ID></CWD>junk").has_value());
  EXPECT_FALSE(request::GetCwd::decode("<CWD><ID>-1</ID></CWD>").has_value());
  EXPECT_FALSE(request::Input::decode(
                 "<INPUT><ID>1</ID><DATA Size=\"99\">ab</DATA></INPUT>")
                 .has_value());
}

TEST(PascalString, ExtractFromBuffer)
{
  using namespace remux::message;

  std::string Buffer = encodeWithSize(request::GetCwd{});
  Buffer += encodeWithSize(request::GetInitialCwd{});
  std::string Partial = Buffer.substr(0, 3);

  EXPECT_FALSE(extractPascalString(Partial).has_value());
  EXPECT_EQ(Partial.size(), 3);

  auto First = extractPascalString(Buffer);
  ASSERT_TRUE(First.has_value());
  EXPECT_EQ(Message::unpack(*First).Kind, MessageKind::GetCwdRequest);

  auto Second = extractPascalString(Buffer);
  ASSERT_TRUE(Second.has_value());
  EXPECT_EQ(Message::unpack(*Second).Kind, MessageKind::GetInitialCwdRequest);
  EXPECT_TRUE(Buffer.empty());
}

TEST(PascalString, OversizedPrefixIsMalformed)
{
  using namespace remux::message;

  std::string Buffer = Message::sizeToBinaryString(MaxMeaningfulMessageSize + 1);
  EXPECT_THROW((void)extractPascalString(Buffer), MalformedStream);
}

/* NOLINTEND(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */
