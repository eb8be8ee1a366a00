/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <chrono>
#include <cstddef>
#include <optional>

#include "remux/system/Handle.hpp"

namespace remux::system
{

/// Implements the wrapping of the OS-primitives for I/O event polling features
/// making clients able to detect read and write operations, availability, or
/// error conditions of a file handle.
class IOEvent
{
public:
  using Timeout = std::optional<std::chrono::milliseconds>;

  virtual ~IOEvent() = default;

  /// Get the number of events that fired in the last successful \p wait().
  [[nodiscard]] std::size_t getEventCount() const noexcept
  {
    return NotificationCount;
  }
  /// Get the number of events that were manually scheduled by the client in
  /// the last successful \p wait().
  [[nodiscard]] virtual std::size_t getScheduledCount() const noexcept = 0;

  [[nodiscard]] virtual std::size_t getMaxEventCount() const noexcept = 0;

  /// Blocks and waits until there is a notification that signalled the event
  /// watcher, or until \p For has elapsed. An empty \p For blocks
  /// indefinitely.
  ///
  /// \return The number of events received, either from the system or by
  /// manual scheduling. \p 0 is returned if the wait timed out or was
  /// interrupted.
  [[nodiscard]] virtual std::size_t wait(Timeout For) = 0;

  struct EventWithMode
  {
    Handle::Raw FD;
    bool Incoming;
    bool Outgoing;
  };
  /// Retrieve the Nth event.
  [[nodiscard]] virtual EventWithMode eventAt(std::size_t Index) noexcept = 0;

  /// Adds the specified file descriptor \p FD to the event queue. Events will
  /// trigger for \p Incoming (the file is available for reading) or \p Outgoing
  /// (the file is available for writing) operations.
  virtual void listen(Handle::Raw FD, bool Incoming, bool Outgoing) = 0;

  /// Changes the set of events \p FD is listened for. Does nothing if \p FD is
  /// not listened to.
  virtual void modify(Handle::Raw FD, bool Incoming, bool Outgoing) = 0;

  /// \returns whether \p FD is currently listened to.
  [[nodiscard]] virtual bool isListening(Handle::Raw FD) const = 0;

  /// Stop listening for changes of \p FD.
  virtual void stop(Handle::Raw FD) = 0;

  /// Stop listening on \b all associated file descriptors.
  virtual void clear() = 0;

  /// Explicitly schedule the file descriptor \p FD to appear in the event queue
  /// even if the system generates no event notification for it.
  ///
  /// Scheduled events are placed \b before system notifications in the
  /// result \b after a call to \p wait().
  virtual void schedule(Handle::Raw FD, bool Incoming, bool Outgoing) = 0;

protected:
  IOEvent() = default;

  std::size_t NotificationCount = 0;
};

} // namespace remux::system
