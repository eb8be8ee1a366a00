/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <cstdint>
#include <string>

namespace remux
{

struct Version
{
  std::size_t Major, Minor, Patch, Build;
  std::size_t Offset;
  std::string Commit;
  bool IsDirty;
};

/// \returns the full version information produced by the build system.
[[nodiscard]] Version getVersion();

/// \returns a short version string, e.g. \p 1.0.0
[[nodiscard]] std::string getShortVersion();

/// \returns a full version string, including additional bits, if any.
[[nodiscard]] std::string getFullVersion();

/// \returns the commit identifier the server reports during the handshake.
/// This is the commit hash if the build system found one, or the short
/// version string otherwise.
[[nodiscard]] std::string getCommitIdentifier();

} // namespace remux
