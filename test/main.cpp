/* SPDX-License-Identifier: GPL-3.0-only */
#include <csignal>
#include <iostream>

#include <gtest/gtest.h>

#include "remux/Version.hpp"

void crashed(int Signal)
{
  // Remove this handler and make the OS handle once we return.
  (void)std::signal(Signal, SIG_DFL);

  std::cerr << "FATAL! Signal " << Signal << " in the test binary of remux "
            << remux::getFullVersion() << std::endl;
}

int main(int argc, char* argv[])
{
  ::testing::InitGoogleTest(&argc, argv);

  (void)std::signal(SIGABRT, crashed);
  (void)std::signal(SIGSEGV, crashed);

  return RUN_ALL_TESTS();
}
