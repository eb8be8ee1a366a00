/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <sys/types.h>

#include "remux/system/Platform.hpp"

namespace remux::system
{

template <> struct ProcessTraits<PlatformTag::Unix>
{
  using raw_handle = ::pid_t;
  using RawTy = raw_handle;

  static constexpr RawTy Invalid = -1;
};

} // namespace remux::system
