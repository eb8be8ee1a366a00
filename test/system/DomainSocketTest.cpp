/* SPDX-License-Identifier: GPL-3.0-only */
#include <cstdio>
#include <string>

#include <gtest/gtest.h>

#include <unistd.h>

#include "remux/message/Message.hpp"
#include "remux/message/PascalString.hpp"
#include "remux/system/UnixDomainSocket.hpp"

/* NOLINTBEGIN(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */

using namespace remux::system;
using namespace remux::system::unix;

TEST(DomainSocket, PairTransfersData)
{
  auto [Left, Right] = DomainSocket::pair();

  EXPECT_EQ(Left.write("Hello"), 5);
  EXPECT_EQ(Right.read(5), "Hello");
  EXPECT_FALSE(Right.hasBufferedRead());

  EXPECT_EQ(Right.write("World!"), 6);
  EXPECT_EQ(Left.load(64), 6);
  EXPECT_EQ(Left.peekBuffered(5), "World");
  EXPECT_EQ(Left.read(6), "World!");
}

TEST(DomainSocket, EmptyReadDoesNotFail)
{
  auto [Left, Right] = DomainSocket::pair();
  (void)Right;

  EXPECT_EQ(Left.load(64), 0);
  EXPECT_FALSE(Left.failed());
}

TEST(DomainSocket, PeerCloseMarksFailed)
{
  auto Pair = DomainSocket::pair();
  DomainSocket Left = std::move(Pair.first);
  {
    DomainSocket Right = std::move(Pair.second);
    Right.write("bye");
  }

  EXPECT_EQ(Left.read(3), "bye");
  EXPECT_FALSE(Left.failed());
  EXPECT_EQ(Left.load(64), 0);
  EXPECT_TRUE(Left.failed());
  EXPECT_THROW((void)Left.write("x"), std::system_error);
}

TEST(DomainSocket, MessagesFramedOnStream)
{
  using namespace remux::message;

  auto [Left, Right] = DomainSocket::pair();
  request::Input In;
  In.ID = 1;
  In.Data = "ls\n";
  sendMessage(Left, In);
  sendMessage(Left, request::GetCwd{});

  Right.load(BufferedChannel::BufferSize);
  auto First = extractPascalString(Right);
  ASSERT_TRUE(First.has_value());
  auto Decoded = decode<request::Input>(*First);
  ASSERT_TRUE(Decoded.has_value());
  EXPECT_EQ(Decoded->Data, "ls\n");

  auto Second = extractPascalString(Right);
  ASSERT_TRUE(Second.has_value());
  EXPECT_EQ(Message::unpack(*Second).Kind, MessageKind::GetCwdRequest);
  EXPECT_FALSE(extractPascalString(Right).has_value());
}

TEST(DomainSocket, CreateConnectAccept)
{
  std::string Path = "/tmp/remux-test-" + std::to_string(::getpid()) + ".sock";
  {
    DomainSocket Server = DomainSocket::create(Path);
    Server.listen(1);
    EXPECT_TRUE(Server.isListening());
    EXPECT_EQ(::access(Path.c_str(), F_OK), 0);

    DomainSocket Client = DomainSocket::connect(Path);
    std::unique_ptr<Socket> Accepted = Server.accept();
    ASSERT_TRUE(Accepted);

    Client.write("ping");
    EXPECT_EQ(Accepted->read(4), "ping");
  }
  // The owning socket removes its file.
  EXPECT_NE(::access(Path.c_str(), F_OK), 0);
}

/* NOLINTEND(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */
