/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <vector>

#include "remux/Log.hpp"

namespace remux
{

/// A typed publish-subscribe channel. Interested parties \p connect() a
/// listener, and the owner of the \p Signal calls \p fire() to notify every
/// listener, in the order they were connected.
///
/// An exception escaping a listener is logged and swallowed, so the state
/// transition that fired the signal always completes, and the remaining
/// listeners are still notified.
///
/// \note This object is \b NOT thread-safe!
template <typename... Args> class Signal
{
public:
  using Listener = std::function<void(Args...)>;
  using ListenerID = std::uint64_t;

  Signal() = default;
  Signal(const Signal&) = delete;
  Signal& operator=(const Signal&) = delete;
  Signal(Signal&&) = default;
  Signal& operator=(Signal&&) = default;

  /// Registers \p L to be called on every subsequent \p fire().
  ///
  /// \returns an identifier which can be used to \p disconnect() the listener.
  ListenerID connect(Listener L)
  {
    ListenerID ID = NextID++;
    Listeners.emplace(ID, std::move(L));
    return ID;
  }

  /// Removes the listener \p ID. Removing an unknown listener is a no-op.
  void disconnect(ListenerID ID) noexcept { Listeners.erase(ID); }

  void disconnectAll() noexcept { Listeners.clear(); }

  [[nodiscard]] std::size_t size() const noexcept { return Listeners.size(); }
  [[nodiscard]] bool empty() const noexcept { return Listeners.empty(); }

  /// Calls every connected listener with \p Values.
  ///
  /// Listeners connected during the firing are not called in this round.
  /// Listeners disconnected during the firing are not called anymore.
  void fire(const Args&... Values) const
  {
    std::vector<ListenerID> Snapshot;
    Snapshot.reserve(Listeners.size());
    for (const auto& L : Listeners)
      Snapshot.emplace_back(L.first);

    for (ListenerID ID : Snapshot)
    {
      auto It = Listeners.find(ID);
      if (It == Listeners.end())
        continue;

      // Copy the callable, a listener might disconnect itself.
      Listener Callee = It->second;
      try
      {
        Callee(Values...);
      }
      catch (const std::exception& E)
      {
        log::error("adt/Signal")
          << "Listener #" << ID << " threw an exception: " << E.what();
      }
    }
  }

private:
  ListenerID NextID = 1;
  std::map<ListenerID, Listener> Listeners;
};

} // namespace remux
