/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <string>

#include <fcntl.h>

#include "remux/system/Platform.hpp"

namespace remux::system
{

template <> struct HandleTraits<PlatformTag::Unix>
{
  /// The file descriptor type on a POSIX system.
  using raw_fd = decltype(::open("", 0));
  using RawTy = raw_fd;

  static constexpr RawTy Invalid = -1;

  /// Closes a \b raw file descriptor.
  static void close(RawTy FD) noexcept;

  // NOLINTNEXTLINE(readability-identifier-naming)
  [[nodiscard]] static std::string to_string(RawTy FD);
};

} // namespace remux::system
