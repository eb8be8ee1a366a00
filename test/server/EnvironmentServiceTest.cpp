/* SPDX-License-Identifier: GPL-3.0-only */
#include <gtest/gtest.h>

#include "remux/server/EnvironmentService.hpp"

/* NOLINTBEGIN(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */

using namespace remux::server;

TEST(EnvironmentService, HostEnvironment)
{
  EnvironmentService Env{"/run/remux.sock", "abc123"};
  Env.setVariable("EDITOR", "vi");
  Env.setExtensionHost("/usr/bin/host", {"--stdio"});

  auto Vars = Env.hostEnvironment("de");
  EXPECT_EQ(Vars.at("EDITOR"), "vi");
  EXPECT_EQ(Vars.at("REMUX_EXTHOST_LANGUAGE"), "de");
  EXPECT_EQ(Vars.at("REMUX_SOCKET"), "/run/remux.sock");
  EXPECT_EQ(Vars.at("REMUX_COMMIT"), "abc123");
  EXPECT_EQ(Env.extensionHostProgram(), "/usr/bin/host");
  ASSERT_EQ(Env.extensionHostArguments().size(), 1);
}

TEST(EnvironmentService, EmptyValuesAreOmitted)
{
  EnvironmentService Env;
  auto Vars = Env.hostEnvironment("en");
  EXPECT_EQ(Vars.count("REMUX_SOCKET"), 0);
  EXPECT_EQ(Vars.count("REMUX_COMMIT"), 0);
  EXPECT_EQ(Vars.size(), 1);
}

/* NOLINTEND(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */
