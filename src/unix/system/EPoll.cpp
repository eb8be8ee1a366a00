/* SPDX-License-Identifier: LGPL-3.0-only */
#include <cstdint>
#include <iomanip>
#include <limits>
#include <stdexcept>
#include <string>

#include <sys/eventfd.h>
#include <unistd.h>

#include "remux/CheckedErrno.hpp"

#include "remux/system/EPoll.hpp"

#include "remux/Log.hpp"
#define LOG(SEVERITY) remux::log::SEVERITY("system/EventPoll")
#define LOG_WITH_IDENTIFIER(SEVERITY) LOG(SEVERITY) << MasterFD << ": "

namespace remux::system::unix
{

namespace
{

/// \returns the \p epoll_wait(2) compatible timeout value for \p For.
int toEPollTimeout(const IOEvent::Timeout& For) noexcept
{
  if (!For)
    return -1;
  if (For->count() <= 0)
    return 0;
  if (For->count() > std::numeric_limits<int>::max())
    return std::numeric_limits<int>::max();
  return static_cast<int>(For->count());
}

std::uint32_t toEPollEvents(bool Incoming, bool Outgoing) noexcept
{
  std::uint32_t Events = EPOLLHUP | EPOLLRDHUP;
  if (Incoming)
    Events |= EPOLLIN;
  if (Outgoing)
    Events |= EPOLLOUT;
  return Events;
}

} // namespace

EPoll::EPoll(std::size_t EventCount)
{
  Notifications.resize(EventCount);
  ScheduledResult.reserve(EventCount);
  ScheduledWaiting.reserve(EventCount);

  MasterFD = CheckedErrnoThrow(
    [] { return ::epoll_create1(EPOLL_CLOEXEC); }, "epoll_create1()", -1);

  LOG_WITH_IDENTIFIER(debug) << "Created with " << EventCount << " events";

  ScheduleFD = CheckedErrnoThrow(
    [] { return ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK); }, "eventfd()", -1);
  LOG_WITH_IDENTIFIER(debug) << "Created eventfd token at " << ScheduleFD;
  listen(ScheduleFD.get(), /* Incoming =*/true, /* Outgoing =*/false);
}

EPoll::~EPoll()
{
  // The listeners must deregister while the master is still open.
  Listeners.clear();
  LOG_WITH_IDENTIFIER(debug) << "~EPoll";
}

std::size_t EPoll::wait(Timeout For)
{
  ScheduledResult.clear();
  ScheduleFDNotifiedAtIndex.reset();
  NotificationCount = 0;

  const int TimeoutMS = toEPollTimeout(For);
  REMUX_TRACE_LOG(LOG_WITH_IDENTIFIER(trace)
                  << "epoll_wait(" << TimeoutMS << ")...");
  auto MaybeFiredEventCount = CheckedErrno(
    [this, TimeoutMS] {
      return ::epoll_wait(MasterFD,
                          &(*Notifications.data()),
                          static_cast<int>(getMaxEventCount()),
                          TimeoutMS);
    },
    -1);
  if (!MaybeFiredEventCount)
  {
    std::error_code EC = MaybeFiredEventCount.getError();
    if (EC == std::errc::interrupted /* EINTR */)
      // Interrupting epoll_wait() is not an issue, scheduled events stay
      // for the next round.
      return 0;
    throw std::system_error{EC, "epoll_wait()"};
  }
  NotificationCount = static_cast<std::size_t>(MaybeFiredEventCount.get());

  for (std::size_t I = 0; I < NotificationCount; ++I)
  {
    const struct ::epoll_event& E = *Notifications.at(I);
    if (E.data.fd == ScheduleFD)
    {
      // The client should not be allowed to directly see the scheduling
      // token, so the position where it arrived is skipped.
      ScheduleFDNotifiedAtIndex.emplace(I);
      --NotificationCount;

      // Consume the scheduled event token.
      POD<std::uint64_t> ScheduledCount;
      auto Read = CheckedErrno(
        [Token = ScheduleFD.get(), &ScheduledCount] {
          return ::read(Token, &ScheduledCount, sizeof(std::uint64_t));
        },
        -1);
      if (!Read)
        LOG_WITH_IDENTIFIER(debug)
          << "eventfd read failed: " << Read.getError().message();
      break;
    }
  }

  REMUX_TRACE_LOG(LOG_WITH_IDENTIFIER(trace)
                  << "epoll_wait()"
                  << " -> " << NotificationCount << " events");

  // Move the events that were scheduled before wait() into the result set.
  ScheduledWaiting.swap(ScheduledResult);
  ScheduledWaiting.clear();
  ScheduledWaitingIndex.clear();
  REMUX_TRACE_LOG({
    if (!ScheduledResult.empty())
      LOG_WITH_IDENTIFIER(trace)
        << "epoll_wait()"
        << " -> " << ScheduledResult.size() << " scheduled";
  });

  return ScheduledResult.size() + NotificationCount;
}

void EPoll::schedule(Handle::Raw FD, bool Incoming, bool Outgoing)
{
  auto SetupEvent = [=](struct ::epoll_event& E) {
    E.data.fd = FD;
    if (Incoming)
      E.events |= EPOLLIN;
    if (Outgoing)
      E.events |= EPOLLOUT;
  };

  auto It = ScheduledWaitingIndex.find(FD);
  if (It != ScheduledWaitingIndex.end())
  {
    SetupEvent(*ScheduledWaiting.at(It->second));
    return;
  }

  auto Wake = CheckedErrno(
    [Token = ScheduleFD.get()] {
      const std::uint64_t One = 1;
      return ::write(Token, &One, sizeof(One));
    },
    -1);
  if (!Wake)
    LOG_WITH_IDENTIFIER(debug)
      << "eventfd write failed: " << Wake.getError().message();

  ScheduledWaitingIndex.try_emplace(FD, ScheduledWaiting.size());
  SetupEvent(*ScheduledWaiting.emplace_back());
}

bool EPoll::isValidIndex(std::size_t I) const noexcept
{
  return I < ScheduledResult.size() + NotificationCount;
}

const struct ::epoll_event& EPoll::at(std::size_t Index) const
{
  if (!isValidIndex(Index))
    throw std::out_of_range{"EPoll event index " + std::to_string(Index)};

  const std::size_t ScheduledCount = ScheduledResult.size();
  if (Index < ScheduledCount)
    // The first set of events appearing to the client should be the
    // manually scheduled ones.
    return *ScheduledResult.at(Index);

  // The rest of the buffer should be taken from the real system result set.
  Index -= ScheduledCount;
  // Skipping (as if never existed) the position where the eventfd(2) trigger
  // arrived.
  if (!ScheduleFDNotifiedAtIndex.has_value() ||
      Index < *ScheduleFDNotifiedAtIndex)
    return *Notifications.at(Index);
  return *Notifications.at(Index + 1);
}

fd::raw_fd EPoll::fdAt(std::size_t Index) const noexcept
{
  return isValidIndex(Index) ? at(Index).data.fd : fd::Traits::Invalid;
}

EPoll::EventWithMode EPoll::eventAt(std::size_t Index) noexcept
{
  if (!isValidIndex(Index))
    return {fd::Traits::Invalid, false, false};

  const struct ::epoll_event& E = at(Index);
  // Hangups are reported as incoming events, so the reader observes the EOF.
  return {E.data.fd,
          (E.events & (EPOLLIN | EPOLLHUP | EPOLLRDHUP | EPOLLERR)) != 0,
          (E.events & EPOLLOUT) == EPOLLOUT};
}

void EPoll::listen(Handle::Raw FD, bool Incoming, bool Outgoing)
{
  Listeners.try_emplace(FD, *this, FD, Incoming, Outgoing);
}

void EPoll::modify(Handle::Raw FD, bool Incoming, bool Outgoing)
{
  auto It = Listeners.find(FD);
  if (It == Listeners.end())
    return;
  It->second.modify(Incoming, Outgoing);
}

bool EPoll::isListening(Handle::Raw FD) const
{
  return Listeners.find(FD) != Listeners.end();
}

void EPoll::stop(Handle::Raw FD)
{
  auto It = Listeners.find(FD);
  if (It == Listeners.end())
    return;
  Listeners.erase(It);
}

void EPoll::clear()
{
  for (auto It = Listeners.begin(); It != Listeners.end();)
  {
    if (It->first == ScheduleFD)
    {
      ++It;
      continue;
    }
    It = Listeners.erase(It);
  }
}

EPoll::Listener::Listener(EPoll& Master,
                          fd::raw_fd FD,
                          bool Incoming,
                          bool Outgoing)
  : Master(Master), FDToListenFor(FD)
{
  POD<struct ::epoll_event> Control;
  Control->data.fd = FD;
  Control->events = toEPollEvents(Incoming, Outgoing);

  CheckedErrnoThrow(
    [&Master, &Control, FD] {
      return ::epoll_ctl(Master.MasterFD, EPOLL_CTL_ADD, FD, &Control);
    },
    "epoll_ctl registering file",
    -1);
  REMUX_TRACE_LOG(LOG(trace)
                  << Master.MasterFD << ": "
                  << "Listen for FD " << FD << " (incoming: " << std::boolalpha
                  << Incoming << ", outgoing: " << Outgoing << std::noboolalpha
                  << ')');
}

void EPoll::Listener::modify(bool Incoming, bool Outgoing)
{
  POD<struct ::epoll_event> Control;
  Control->data.fd = FDToListenFor;
  Control->events = toEPollEvents(Incoming, Outgoing);

  CheckedErrnoThrow(
    [this, &Control] {
      return ::epoll_ctl(
        Master.MasterFD, EPOLL_CTL_MOD, FDToListenFor, &Control);
    },
    "epoll_ctl modifying file",
    -1);
}

EPoll::Listener::~Listener()
{
  if (FDToListenFor == fd::Traits::Invalid)
    return;

  POD<struct ::epoll_event> Control;
  auto Deregister = CheckedErrno(
    [this, &Control] {
      return ::epoll_ctl(
        Master.MasterFD, EPOLL_CTL_DEL, FDToListenFor, &Control);
    },
    -1);
  if (!Deregister)
    // The file was likely closed before the listener was removed.
    REMUX_TRACE_LOG(LOG(trace)
                    << Master.MasterFD << ": "
                    << "epoll_ctl(DEL, " << FDToListenFor
                    << "): " << Deregister.getError().message());
  REMUX_TRACE_LOG(LOG(trace) << Master.MasterFD << ": "
                             << "Stop listening for FD " << FDToListenFor);
}

} // namespace remux::system::unix

#undef LOG_WITH_IDENTIFIER
#undef LOG
