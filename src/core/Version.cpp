/* SPDX-License-Identifier: LGPL-3.0-only */
#include <cstring>
#include <sstream>

#include "remux/Version.h"

#include "remux/Version.hpp"

namespace remux
{

Version getVersion()
{
  Version V{};
  V.Major = std::stoull(REMUX_VERSION_MAJOR);
  V.Minor = std::stoull(REMUX_VERSION_MINOR);
  V.Patch = std::stoull(REMUX_VERSION_PATCH);
  V.Build = std::stoull(REMUX_VERSION_TWEAK);
  V.Offset = 0;
  V.IsDirty = false;

#ifdef REMUX_VERSION_HAS_EXTRAS
  V.Offset = std::stoull(REMUX_VERSION_OFFSET);
  V.Commit = REMUX_VERSION_COMMIT;
  V.IsDirty = std::strlen(REMUX_VERSION_DIRTY) > 0;
#endif

  return V;
}

std::string getShortVersion()
{
  std::ostringstream Buf;
  Version V = getVersion();
  Buf << V.Major << '.' << V.Minor;
  if (V.Patch || V.Build)
    Buf << '.' << V.Patch;
  if (V.Build)
    Buf << '.' << V.Build;
  return Buf.str();
}

std::string getFullVersion()
{
  std::ostringstream Buf;
  Version V = getVersion();
  Buf << getShortVersion();
  if (V.Offset || !V.Commit.empty())
    Buf << '+' << V.Offset << '(' << V.Commit << ')';
  if (V.IsDirty)
    Buf << "-dirty!";
  return Buf.str();
}

std::string getCommitIdentifier()
{
  Version V = getVersion();
  if (!V.Commit.empty())
    return V.Commit;
  return getShortVersion();
}

} // namespace remux
