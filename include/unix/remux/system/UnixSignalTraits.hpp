/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <csignal>
#include <cstddef>
#include <type_traits>

#include "remux/system/Platform.hpp"

namespace remux::system
{

class SignalHandling;

template <> struct SignalTraits<PlatformTag::Unix>
{
  /// Type alias for the raw signal identifier type on the platform.
  using RawTy = int;
  using Signal = RawTy;

  // The true SIGRTMIN is an extern libc call which would make it not constexpr.
  /// Number of signals to consider.
  static constexpr std::size_t Count = __SIGRTMIN;

  /// The type of the user-implemented signal handlers that can be registered
  /// as a callback.
  ///
  /// \param Sig The number of the signal that caused the invocation of the
  /// handler.
  /// \param SignalHandling A pointer to the \b GLOBAL signal handling data
  /// structure, used to access registered objects in the callback.
  /// \param PlatformInfo Extended data structure containing low-level
  /// information about the received signal.
  using HandlerTy = void(Signal Sig,
                         const SignalHandling* SignalHandling,
                         const ::siginfo_t* PlatformInfo);

  /// The type of the signal handler callback required by the low-level
  /// interface.
  using PrimitiveSignalHandler = void(Signal SigNum,
                                      ::siginfo_t* Info,
                                      void* Context);

  /// The signal handler callback required by the low-level interface.
  /// This function dispatches to the user-facing registered handlers.
  ///
  /// \see sigaction(2)
  static void signalDispatch(Signal SigNum, ::siginfo_t* Info, void* Context);

  static_assert(
    std::is_same_v<decltype(signalDispatch), PrimitiveSignalHandler>,
    "Low-level signal handler callback's type invalid.");

  /// Registers in the OS that signal \p SigNum should be handled by
  /// \p signalDispatch.
  static void setSignalHandled(Signal SigNum);
  /// Registers in the OS that signal \p SigNum should use the default
  /// handling.
  static void setSignalDefault(Signal SigNum);
  /// Registers in the OS that signal \p SigNum should be ignored.
  static void setSignalIgnored(Signal SigNum);
};

} // namespace remux::system

#define REMUX_PLATFORM_SIGNAL_HANDLER_SIG(NAME)                                \
  void NAME(remux::system::SignalHandling::Signal Sig,                         \
            const remux::system::SignalHandling* SignalHandling,               \
            const ::siginfo_t* PlatformInfo)
