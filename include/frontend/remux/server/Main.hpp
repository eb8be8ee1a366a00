/* SPDX-License-Identifier: GPL-3.0-only */
#pragma once
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "remux/FrontendExitCode.hpp"

namespace remux::server
{

/// Options interested to invocation of a remux server.
struct Options
{
  /// Format the options back into the CLI invocation they were parsed from.
  [[nodiscard]] std::vector<std::string> toArgv() const;

  // (To initialise the bitfields...)
  Options();

  /// Whether the server should run as a background process.
  bool Background : 1;

  /// The path of the server socket to start listening on.
  std::optional<std::string> SocketPath;

  /// The number of offline connections kept for reconnection, per connection
  /// type.
  std::size_t MaxExtraOfflineConnections = 0;

  /// Overrides of the grace periods of persistent processes.
  std::optional<std::chrono::seconds> GraceTime, ShortGraceTime;

  /// The program spawned for extension host connections.
  std::optional<std::string> ExtensionHost;

  /// The commit identifier reported to clients, overriding the built one.
  std::optional<std::string> Commit;
};

/// Executes the "official" remux server frontend logic.
[[nodiscard]] FrontendExitCode main(Options& Opts);

} // namespace remux::server
