/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include "remux/Config.h"

#ifdef REMUX_PLATFORM_UNIX
#include "remux/system/UnixProcessTraits.hpp"
#endif /* REMUX_PLATFORM_UNIX */
