/* SPDX-License-Identifier: GPL-3.0-only */
#pragma once
#include <string>

#include "remux/Config.h"

namespace remux
{

/// \returns details about the configuration of the current remux build in a
/// human-readable format.
std::string getHumanReadableConfiguration();

} // namespace remux
