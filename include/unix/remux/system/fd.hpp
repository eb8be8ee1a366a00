/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <cstdio>

#include "remux/system/Handle.hpp"

namespace remux::system::unix
{

/// A file descriptor which is \p close()d at the end of its life.
///
/// \note \p fd is not polymorphic, it is always safe to slice an \p fd into a
/// \p Handle.
class fd : public Handle // NOLINT(readability-identifier-naming)
{
public:
  using Traits = HandleTraits<PlatformTag::Unix>;
  using raw_fd = Traits::raw_fd;
  /// The type used by system calls dealing with flags.
  using flag_t = decltype(O_RDONLY);

  fd() noexcept = default;
  fd(raw_fd Value) noexcept; // NOLINT(google-explicit-constructor)

  /// Duplicates the file descriptor \p Handle.
  ///
  /// \see dup(2)
  [[nodiscard]] static fd dup(const Handle& Handle);

  /// \returns the \b raw file descriptor of the standard C I/O object.
  [[nodiscard]] static raw_fd fileno(std::FILE* File);

  /// Adds \p Flag to the \p F_GETFL status flags of \p FD.
  static void addStatusFlag(raw_fd FD, flag_t Flag) noexcept;
  /// Removes \p Flag from the \p F_GETFL status flags of \p FD.
  static void removeStatusFlag(raw_fd FD, flag_t Flag) noexcept;
  /// Adds \p Flag to the \p F_GETFD descriptor flags of \p FD.
  static void addDescriptorFlag(raw_fd FD, flag_t Flag) noexcept;

  /// Sets \p O_NONBLOCK on a file.
  static void setNonBlocking(raw_fd FD) noexcept;

  /// Sets \p O_NONBLOCK and \p FD_CLOEXEC on a file, so it does not block
  /// reads and is not inherited by children in a \p fork() - \p exec().
  static void setNonBlockingCloseOnExec(raw_fd FD) noexcept;
};

static_assert(sizeof(Handle) == sizeof(fd),
              "Handle implementation MUST be non-polymorphic!");

} // namespace remux::system::unix
