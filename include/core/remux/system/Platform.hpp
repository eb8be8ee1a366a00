/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <string>

#include "remux/Config.h"

/// Prints to some \p ostream the prefix of a "platform not supported" message.
#define REMUX_FEED_PLATFORM_NOT_SUPPORTED_MESSAGE                              \
  "ERROR: The current platform " << '(' << REMUX_PLATFORM << ')'               \
                                 << " does not support "

namespace remux::system
{

enum class PlatformTag
{
  Unsupported = REMUX_PLATFORM_ID_Unsupported,

  /// Standard UNIX and POSIX systems, most importantly Linux.
  Unix = REMUX_PLATFORM_ID_Unix
};

/// Implemented by platform-specific details to provide the business logic of
/// \p Handle, keeping it a value-semantics-capable class.
template <PlatformTag> struct HandleTraits
{};

/// Implemented by platform-specific details to provide the business logic of
/// \p Process.
template <PlatformTag> struct ProcessTraits
{};

/// Implemented by platform-specific details to provide the business logic of
/// \p SignalHandling.
template <PlatformTag> struct SignalTraits
{};

/// Queries platform-specific defaults.
class Platform
{
public:
  /// \returns the default shell (command interpreter) for the current user.
  [[nodiscard]] static std::string defaultShell();

  struct SocketPath
  {
    /// \returns the default location where the server socket should be
    /// placed for the current user.
    [[nodiscard]] static SocketPath defaultSocketPath();

    /// Transforms the specified \p Path into a split \p SocketPath object.
    [[nodiscard]] static SocketPath absolutise(const std::string& Path);

    /// \returns the \p Path and \p Filename concatenated appropriately.
    [[nodiscard]] std::string
    to_string() const; // NOLINT(readability-identifier-naming)

    std::string Path;
    std::string Filename;

    /// Whether the \p Path value (without the \p Filename) is likely specific
    /// to the current user.
    bool IsPathLikelyUserSpecific;
  };
};

} // namespace remux::system
