/* SPDX-License-Identifier: LGPL-3.0-only */
#include <cstdlib>

#include "remux/system/Environment.hpp"

#include "remux/Log.hpp"
#define LOG(SEVERITY) remux::log::SEVERITY("system/Environment")

namespace remux::system
{

std::string getEnv(const std::string& Key)
{
  const char* const Value = std::getenv(Key.c_str());
  if (!Value)
  {
    REMUX_TRACE_LOG(LOG(data) << "getEnv(" << Key << ") -> unset");
    return {};
  }
  REMUX_TRACE_LOG(LOG(data) << "getEnv(" << Key << ") = " << Value);
  return {Value};
}

} // namespace remux::system

#undef LOG
