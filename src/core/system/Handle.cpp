/* SPDX-License-Identifier: LGPL-3.0-only */
#include "remux/system/Handle.hpp"

#include "remux/Log.hpp"
#define LOG(SEVERITY) remux::log::SEVERITY("system/Handle")

namespace remux::system
{

Handle::Handle(Raw Value) noexcept : Value(Value)
{
  REMUX_TRACE_LOG(LOG(data) << "Handle #" << Value << " owned by instance.");
}

Handle Handle::wrap(Raw Value) noexcept { return Handle{Value}; }

} // namespace remux::system

#undef LOG
