/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include "remux/Config.h"
#include "remux/system/Platform.hpp"

namespace remux::system
{

static constexpr PlatformTag CurrentPlatform =
#if REMUX_PLATFORM_ID == REMUX_PLATFORM_ID_Unix
  PlatformTag::Unix
#else
  PlatformTag::Unsupported
#endif /* REMUX_PLATFORM_ID */
  ;

} // namespace remux::system
