/* SPDX-License-Identifier: LGPL-3.0-only */
#include <unistd.h>

#include "remux/CheckedErrno.hpp"

#include "remux/system/fd.hpp"

#include "remux/Log.hpp"
#define LOG(SEVERITY) remux::log::SEVERITY("system/fd")

namespace remux::system
{

void HandleTraits<PlatformTag::Unix>::close(raw_fd FD) noexcept
{
  REMUX_TRACE_LOG(LOG(data) << "Closing FD #" << FD << "...");
  auto Close = CheckedErrno([FD] { return ::close(FD); }, -1);
  if (!Close)
    LOG(debug) << "close(" << FD << "): " << Close.getError().message();
}

std::string HandleTraits<PlatformTag::Unix>::to_string(raw_fd FD)
{
  return std::to_string(FD);
}

namespace unix
{

fd::fd(raw_fd Value) noexcept : Handle(Value) {}

fd fd::dup(const Handle& Handle)
{
  raw_fd DupHandle = CheckedErrnoThrow(
    [Raw = Handle.get()] { return ::dup(Raw); }, "dup()", -1);
  return fd{DupHandle};
}

fd::raw_fd fd::fileno(std::FILE* File)
{
  return CheckedErrnoThrow([File] { return ::fileno(File); }, "fileno()", -1);
}

namespace
{

/// Reads the flags selected by \p Get, applies \p Transform and writes them
/// back with \p Set. Failures are logged, not thrown.
template <typename Fn>
void updateFlags(fd::raw_fd FD, int Get, int Set, Fn&& Transform) noexcept
{
  auto Flags = CheckedErrno([FD, Get] { return ::fcntl(FD, Get); }, -1);
  if (!Flags)
  {
    LOG(error) << "fcntl(" << FD << ", GET): " << Flags.getError().message();
    return;
  }

  fd::flag_t NewFlags = Transform(Flags.get());
  auto Update =
    CheckedErrno([FD, Set, NewFlags] { return ::fcntl(FD, Set, NewFlags); }, -1);
  if (!Update)
    LOG(error) << "fcntl(" << FD << ", SET): " << Update.getError().message();
}

} // namespace

// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
void fd::addStatusFlag(raw_fd FD, flag_t Flag) noexcept
{
  updateFlags(FD, F_GETFL, F_SETFL, [Flag](flag_t F) { return F | Flag; });
}

// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
void fd::removeStatusFlag(raw_fd FD, flag_t Flag) noexcept
{
  updateFlags(FD, F_GETFL, F_SETFL, [Flag](flag_t F) { return F & ~Flag; });
}

// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
void fd::addDescriptorFlag(raw_fd FD, flag_t Flag) noexcept
{
  updateFlags(FD, F_GETFD, F_SETFD, [Flag](flag_t F) { return F | Flag; });
}

void fd::setNonBlocking(raw_fd FD) noexcept { addStatusFlag(FD, O_NONBLOCK); }

void fd::setNonBlockingCloseOnExec(raw_fd FD) noexcept
{
  addStatusFlag(FD, O_NONBLOCK);
  addDescriptorFlag(FD, FD_CLOEXEC);
}

} // namespace unix
} // namespace remux::system

#undef LOG
