/* SPDX-License-Identifier: GPL-3.0-only */
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "remux/adt/Signal.hpp"

/* NOLINTBEGIN(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */

using namespace remux;

TEST(Signal, ListenersCalledInConnectionOrder)
{
  Signal<int, std::string> S;
  std::vector<std::string> Log;

  S.connect([&Log](int N, const std::string& Str) {
    Log.push_back("first " + std::to_string(N) + Str);
  });
  S.connect([&Log](int N, const std::string& Str) {
    Log.push_back("second " + std::to_string(N) + Str);
  });
  S.fire(4, "x");

  ASSERT_EQ(Log.size(), 2);
  EXPECT_EQ(Log.at(0), "first 4x");
  EXPECT_EQ(Log.at(1), "second 4x");
}

TEST(Signal, DisconnectedListenerIsNotCalled)
{
  Signal<> S;
  int Calls = 0;
  auto ID = S.connect([&Calls] { ++Calls; });
  S.fire();
  S.disconnect(ID);
  S.fire();

  EXPECT_EQ(Calls, 1);
  EXPECT_TRUE(S.empty());
}

TEST(Signal, DisconnectDuringFire)
{
  Signal<> S;
  int SecondCalls = 0;
  Signal<>::ListenerID Second = 0;

  S.connect([&S, &Second] { S.disconnect(Second); });
  Second = S.connect([&SecondCalls] { ++SecondCalls; });
  S.fire();

  EXPECT_EQ(SecondCalls, 0);
  EXPECT_EQ(S.size(), 1);
}

TEST(Signal, ConnectDuringFireWaitsForNextRound)
{
  Signal<> S;
  int LateCalls = 0;

  S.connect([&S, &LateCalls] {
    if (S.size() == 1)
      S.connect([&LateCalls] { ++LateCalls; });
  });
  S.fire();
  EXPECT_EQ(LateCalls, 0);
  S.fire();
  EXPECT_EQ(LateCalls, 1);
}

TEST(Signal, ThrowingListenerDoesNotStopOthers)
{
  Signal<int> S;
  int Received = 0;
  S.connect([](int) { throw std::runtime_error{"listener failure"}; });
  S.connect([&Received](int N) { Received = N; });

  EXPECT_NO_THROW(S.fire(8));
  EXPECT_EQ(Received, 8);
}

/* NOLINTEND(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */
