/* SPDX-License-Identifier: GPL-3.0-only */
#include <sstream>
#include <string_view>

#include "Config.hpp"

namespace remux
{

namespace
{

void printToggleFeature(std::ostream& OS, std::string_view Name, bool Enabled)
{
  OS << ' ' << (Enabled ? '+' : '-') << ' ' << Name << '\n';
}

} // namespace

std::string getHumanReadableConfiguration()
{
  std::ostringstream Buf;

  Buf << " * " << REMUX_BUILD_TYPE << " build\n";
  Buf << " * Platform: " << REMUX_PLATFORM << '\n';

#ifdef REMUX_BUILD_SHARED_LIBS
  Buf << " * SHARED (dynamic) library\n";
#else  /* !REMUX_BUILD_SHARED_LIBS */
  Buf << " * STATIC library\n";
#endif /* REMUX_BUILD_SHARED_LIBS */

#ifdef REMUX_NON_ESSENTIAL_LOGS
  printToggleFeature(Buf, "Non-essential trace logs", true);
#else  /* !REMUX_NON_ESSENTIAL_LOGS */
  printToggleFeature(Buf, "Non-essential trace logs", false);
#endif /* REMUX_NON_ESSENTIAL_LOGS */

  return Buf.str();
}

} // namespace remux
