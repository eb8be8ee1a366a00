/* SPDX-License-Identifier: GPL-3.0-only */
#pragma once

namespace remux
{

/// Contains the exit codes the remux \p main() functions return with.
enum class FrontendExitCode : int
{
  /// Successful execution (the server stopped gracefully).
  Success = 0,

  /// Indicates a fatal error in setting up the server.
  SystemError = 1,

  /// Values specified on the command-line of remux are erroneous.
  InvocationError = 2,

  /// Nonspecific other failure.
  Failure = 3,
};

} // namespace remux
