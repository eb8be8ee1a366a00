/* SPDX-License-Identifier: LGPL-3.0-only */
#include <csignal>
#include <cstdio>
#include <cstdlib>

#include "remux/unreachable.hpp"

namespace remux::detail
{

[[noreturn]] void
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
unreachable_impl(const char* Msg, const char* File, std::size_t LineNo)
{
  /* NOLINTBEGIN(cppcoreguidelines-pro-type-vararg) */
  (void)std::fprintf(stderr, "FATAL! UNREACHABLE executed");
  if (File)
    (void)std::fprintf(stderr, " at %s:%zu", File, LineNo);

  if (Msg)
    (void)std::fprintf(stderr, ": %s!\n", Msg);
  else
    (void)std::fprintf(stderr, "!\n");
  /* NOLINTEND(cppcoreguidelines-pro-type-vararg) */

  // std::abort() still lets the crash handler of the test harness run.
  std::abort();
}

} // namespace remux::detail
