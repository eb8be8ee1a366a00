/* SPDX-License-Identifier: GPL-3.0-only */
#include <gtest/gtest.h>

#include "remux/adt/scope_guard.hpp"

/* NOLINTBEGIN(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */

using namespace remux;

TEST(ScopeGuard, EntryAndExitCalled)
{
  int Variable = 2;
  {
    ASSERT_EQ(Variable, 2);

    scope_guard SG{[&Variable] { Variable = 4; },
                   [&Variable] { Variable = 0; }};
    ASSERT_EQ(Variable, 4);
  }
  ASSERT_EQ(Variable, 0);
}

TEST(ScopeGuard, ExitOnlyRunsOnLeave)
{
  int Calls = 0;
  {
    scope_guard SG{[&Calls] { ++Calls; }};
    EXPECT_EQ(Calls, 0);
  }
  EXPECT_EQ(Calls, 1);
}

TEST(ScopeGuard, RestoreGuard)
{
  bool InReplay = false;
  {
    restore_guard RG{InReplay};
    InReplay = true;
    ASSERT_TRUE(InReplay);
  }
  ASSERT_FALSE(InReplay);
}

/* NOLINTEND(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */
