/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <string>

namespace remux::system
{

/// \returns the value of the environment variable \p Key, or the empty string
/// if it is not set.
///
/// \note This function is a safe alternative to \p getenv() as it immediately
/// allocates a \e new string with the result.
[[nodiscard]] std::string getEnv(const std::string& Key);

} // namespace remux::system
