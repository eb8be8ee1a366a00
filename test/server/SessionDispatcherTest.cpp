/* SPDX-License-Identifier: GPL-3.0-only */
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "remux/message/Message.hpp"
#include "remux/message/PascalString.hpp"
#include "remux/server/EnvironmentService.hpp"
#include "remux/server/Errors.hpp"
#include "remux/server/ManagementConnection.hpp"
#include "remux/server/SessionDispatcher.hpp"
#include "remux/system/UnixDomainSocket.hpp"

/* NOLINTBEGIN(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */

using namespace remux;
using namespace remux::server;
using remux::message::ConnectionType;
using remux::system::unix::DomainSocket;

namespace
{

/// The client side of a connection, with the server side ready to be handed
/// to the dispatcher.
struct Client
{
  std::unique_ptr<DomainSocket> Local;
  std::unique_ptr<DomainSocket> Remote;

  Client()
  {
    auto Pair = DomainSocket::pair();
    Local = std::make_unique<DomainSocket>(std::move(Pair.first));
    Remote = std::make_unique<DomainSocket>(std::move(Pair.second));
  }

  /// \returns the next complete message the server sent, if any.
  std::optional<std::string> receive()
  {
    if (!Local->failed())
      Local->load(system::BufferedChannel::BufferSize);
    return message::extractPascalString(*Local);
  }
};

std::string handshake(ConnectionType Type,
                      std::string Token,
                      bool Reconnection = false)
{
  message::request::Handshake H;
  H.DesiredType = static_cast<std::uint16_t>(Type);
  H.ReconnectionToken = std::move(Token);
  H.Reconnection = Reconnection;
  return message::encode(H);
}

struct SessionDispatcherTest : public ::testing::Test
{
  EnvironmentService Environment{"/tmp/remux-test.sock", "abc"};
  SessionDispatcher Dispatcher{Environment, {"abc", 1}};

  Connection* connect(Client& C, ConnectionType Type, const std::string& Token)
  {
    return Dispatcher.handleHandshake(std::move(C.Remote),
                                      handshake(Type, Token));
  }

  static std::string rejection(Client& C)
  {
    std::optional<std::string> Reply = C.receive();
    if (!Reply)
      return "<no reply>";
    auto Err = message::decode<message::response::HandshakeError>(*Reply);
    if (!Err)
      return "<not a rejection>";
    return Err->Reason;
  }
};

} // namespace

TEST_F(SessionDispatcherTest, NewManagementConnection)
{
  std::vector<Connection*> Announced;
  Dispatcher.onClientConnected().connect(
    [&Announced](Connection* const& C) { Announced.push_back(C); });

  Client C;
  Connection* Conn = connect(C, ConnectionType::Management, "t1");
  ASSERT_NE(Conn, nullptr);
  EXPECT_EQ(Conn->type(), ConnectionType::Management);
  EXPECT_EQ(Conn->token(), "t1");
  EXPECT_TRUE(Conn->isOnline());
  EXPECT_EQ(&Dispatcher.getConnection(ConnectionType::Management, "t1"), Conn);
  EXPECT_EQ(Dispatcher.size(), 1);
  ASSERT_EQ(Announced.size(), 1);
  EXPECT_EQ(Announced.front(), Conn);

  std::optional<std::string> Reply = C.receive();
  ASSERT_TRUE(Reply.has_value());
  auto Ok = message::decode<message::response::HandshakeOk>(*Reply);
  ASSERT_TRUE(Ok.has_value());
  EXPECT_FALSE(Ok->DebugPort.has_value());
}

TEST_F(SessionDispatcherTest, MessagesAfterHandshakeAreDelivered)
{
  std::vector<std::string> Received;
  Dispatcher.onClientConnected().connect([&Received](Connection* const& C) {
    static_cast<ManagementConnection*>(C)->onMessage().connect(
      [&Received](const std::string& M) { Received.push_back(M); });
  });

  Client C;
  message::sendMessage(*C.Local, message::request::GetCwd{});
  ASSERT_NE(connect(C, ConnectionType::Management, "t"), nullptr);

  ASSERT_EQ(Received.size(), 1);
  EXPECT_EQ(message::Message::unpack(Received.front()).Kind,
            message::MessageKind::GetCwdRequest);
}

TEST_F(SessionDispatcherTest, UnknownConnectionThrows)
{
  EXPECT_THROW((void)Dispatcher.getConnection(ConnectionType::Management, "x"),
               UnknownConnection);
  EXPECT_EQ(Dispatcher.tryGetConnection(ConnectionType::Management, "x"),
            nullptr);
}

TEST_F(SessionDispatcherTest, MissingTokenRejected)
{
  Client C;
  EXPECT_EQ(connect(C, ConnectionType::Management, ""), nullptr);
  EXPECT_NE(rejection(C).find("token"), std::string::npos);
  EXPECT_EQ(Dispatcher.size(), 0);
}

TEST_F(SessionDispatcherTest, UnknownTypeRejected)
{
  Client C;
  EXPECT_EQ(connect(C, static_cast<ConnectionType>(42), "t"), nullptr);
  EXPECT_NE(rejection(C).find("42"), std::string::npos);
}

TEST_F(SessionDispatcherTest, MalformedHandshakeRejected)
{
  Client C;
  EXPECT_EQ(Dispatcher.handleHandshake(
              std::move(C.Remote),
              message::encode(message::request::GetCwd{})),
            nullptr);
  EXPECT_NE(rejection(C), "<no reply>");
}

TEST_F(SessionDispatcherTest, DuplicateTokenRejected)
{
  Client First, Second;
  Connection* Conn = connect(First, ConnectionType::Management, "dup");
  ASSERT_NE(Conn, nullptr);
  EXPECT_EQ(connect(Second, ConnectionType::Management, "dup"), nullptr);
  EXPECT_NE(rejection(Second).find("already exists"), std::string::npos);
  EXPECT_TRUE(Conn->isOnline());
}

TEST_F(SessionDispatcherTest, ReconnectWithUnknownToken)
{
  Client C;
  EXPECT_EQ(
    Dispatcher.handleHandshake(
      std::move(C.Remote), handshake(ConnectionType::Management, "nope", true)),
    nullptr);
  EXPECT_NE(rejection(C).find("Unknown"), std::string::npos);
}

TEST_F(SessionDispatcherTest, ReconnectRebindsConnection)
{
  Client First;
  Connection* Conn = connect(First, ConnectionType::Management, "r");
  ASSERT_NE(Conn, nullptr);
  Conn->goOffline();
  EXPECT_FALSE(Conn->isOnline());
  EXPECT_TRUE(Conn->offline().has_value());

  Client Second;
  Connection* Again = Dispatcher.handleHandshake(
    std::move(Second.Remote), handshake(ConnectionType::Management, "r", true));
  EXPECT_EQ(Again, Conn);
  EXPECT_TRUE(Conn->isOnline());
  EXPECT_FALSE(Conn->offline().has_value());
  EXPECT_EQ(Dispatcher.size(), 1);
}

TEST_F(SessionDispatcherTest, ReconnectWhileOnlineMovesUnsentWrites)
{
  Client First;
  Connection* Conn = connect(First, ConnectionType::Management, "r");
  ASSERT_NE(Conn, nullptr);
  ASSERT_TRUE(First.receive().has_value());

  // Nobody reads the first client, so most of this stays in userspace.
  std::string Payload(1ULL << 21, 'x');
  Payload += "-end-of-payload";
  system::Socket* Old = Conn->socket();
  ASSERT_NE(Old, nullptr);
  Old->write(Payload);
  ASSERT_TRUE(Old->hasBufferedWrite());
  std::size_t Unsent = Old->writeInBuffer();
  system::Handle::Raw OldFD = Old->raw();

  std::vector<system::Handle::Raw> Closed;
  Conn->onChannelClosing().connect(
    [&Closed](const system::Handle::Raw& FD) { Closed.push_back(FD); });

  Client Second;
  system::Handle::Raw NewFD = Second.Remote->raw();
  Connection* Again = Dispatcher.handleHandshake(
    std::move(Second.Remote), handshake(ConnectionType::Management, "r", true));
  ASSERT_EQ(Again, Conn);
  EXPECT_EQ(Dispatcher.size(), 1);
  ASSERT_EQ(Closed.size(), 1);
  EXPECT_EQ(Closed.front(), OldFD);
  ASSERT_NE(Conn->socket(), nullptr);
  EXPECT_EQ(Conn->socket()->raw(), NewFD);

  std::optional<std::string> Reply = Second.receive();
  ASSERT_TRUE(Reply.has_value());
  EXPECT_TRUE(
    message::decode<message::response::HandshakeOk>(*Reply).has_value());

  std::string Moved;
  for (int I = 0; I < 10000 && Moved.size() < Unsent; ++I)
  {
    Conn->socket()->flushWrites();
    Moved += Second.Local->readEntireBuffer();
  }
  ASSERT_EQ(Moved.size(), Unsent);
  EXPECT_EQ(Moved, Payload.substr(Payload.size() - Unsent));
}

TEST_F(SessionDispatcherTest, OfflineRetention)
{
  using namespace std::chrono_literals;

  Client A, B, C;
  Connection* CA = connect(A, ConnectionType::Management, "a");
  Connection* CB = connect(B, ConnectionType::Management, "b");
  ASSERT_NE(CA, nullptr);
  ASSERT_NE(CB, nullptr);
  Connection::TimePoint Now = Connection::Clock::now();
  CA->goOffline(Now - 10s);
  CB->goOffline(Now - 5s);

  ASSERT_NE(connect(C, ConnectionType::Management, "c"), nullptr);
  // Only the newest offline connection is kept.
  EXPECT_TRUE(CA->isDisposed());
  EXPECT_FALSE(CB->isDisposed());
  EXPECT_EQ(Dispatcher.tryGetConnection(ConnectionType::Management, "a"),
            nullptr);
  EXPECT_NE(Dispatcher.tryGetConnection(ConnectionType::Management, "b"),
            nullptr);

  Dispatcher.collectDisposed();
  EXPECT_EQ(Dispatcher.size(), 2);
}

TEST_F(SessionDispatcherTest, TunnelWithoutHandlerRejected)
{
  Client C;
  EXPECT_EQ(connect(C, ConnectionType::Tunnel, "t"), nullptr);
  EXPECT_NE(rejection(C).find("not available"), std::string::npos);
}

TEST_F(SessionDispatcherTest, TunnelHandedOver)
{
  std::unique_ptr<system::Socket> Tunnelled;
  Dispatcher.setTunnelHandler(
    [&Tunnelled](std::unique_ptr<system::Socket> S, std::string /* Buffer */) {
      Tunnelled = std::move(S);
    });

  Client C;
  EXPECT_EQ(connect(C, ConnectionType::Tunnel, "t"), nullptr);
  ASSERT_TRUE(Tunnelled);
  EXPECT_EQ(Dispatcher.size(), 0);

  std::optional<std::string> Reply = C.receive();
  ASSERT_TRUE(Reply.has_value());
  EXPECT_TRUE(message::decode<message::response::HandshakeOk>(*Reply));
}

TEST_F(SessionDispatcherTest, ExtensionHostBuffersWithoutHelper)
{
  Dispatcher.setDebugPortProvider([] { return std::uint16_t{9229}; });

  Client C;
  Connection* Conn = connect(C, ConnectionType::ExtensionHost, "e");
  ASSERT_NE(Conn, nullptr);
  EXPECT_EQ(Conn->type(), ConnectionType::ExtensionHost);

  std::optional<std::string> Reply = C.receive();
  ASSERT_TRUE(Reply.has_value());
  auto Ok = message::decode<message::response::HandshakeOk>(*Reply);
  ASSERT_TRUE(Ok.has_value());
  EXPECT_EQ(Ok->DebugPort, 9229);
}

TEST_F(SessionDispatcherTest, DisposeAll)
{
  Client A, B;
  std::vector<std::string> Reasons;
  Connection* CA = connect(A, ConnectionType::Management, "a");
  ASSERT_NE(CA, nullptr);
  ASSERT_NE(connect(B, ConnectionType::ExtensionHost, "b"), nullptr);
  CA->onClose().connect(
    [&Reasons](const std::string& R) { Reasons.push_back(R); });

  Dispatcher.disposeAll();
  EXPECT_EQ(Dispatcher.size(), 0);
  ASSERT_EQ(Reasons.size(), 1);

  // The client sees the socket closing after the handshake reply.
  while (A.receive())
    ;
  EXPECT_TRUE(A.Local->failed());
}

TEST(ExtensionHostConnection, RelaysThroughHelper)
{
  EnvironmentService Environment{"/tmp/remux-test.sock", "abc"};
  Environment.setExtensionHost("/bin/cat");
  SessionDispatcher Dispatcher{Environment, {}};

  std::vector<system::BufferedChannel*> Channels;
  Dispatcher.onClientConnected().connect([&Channels](Connection* const& C) {
    C->onChannelOpened().connect(
      [&Channels](system::BufferedChannel* const& Ch) {
        Channels.push_back(Ch);
      });
  });

  Client C;
  system::Socket* ServerSide = C.Remote.get();
  Connection* Conn = Dispatcher.handleHandshake(
    std::move(C.Remote), handshake(ConnectionType::ExtensionHost, "e"));
  ASSERT_NE(Conn, nullptr);
  ASSERT_EQ(Channels.size(), 2);
  EXPECT_EQ(Channels.front(), ServerSide);
  system::BufferedChannel* Host = Channels.back();
  ASSERT_TRUE(C.receive().has_value());

  C.Local->write("echo me");
  Conn->readable(*ServerSide);

  std::string Echoed;
  for (int I = 0; I < 200 && Echoed.size() < 7; ++I)
  {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    Conn->readable(*Host);
    Echoed += C.Local->readEntireBuffer();
  }
  EXPECT_EQ(Echoed, "echo me");

  Dispatcher.disposeAll();
}

/* NOLINTEND(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */
