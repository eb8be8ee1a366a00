/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <any>
#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "remux/system/CurrentPlatform.hpp"
#include "remux/system/SignalTraits.hpp"

namespace remux::system
{

using PlatformSpecificSignalTraits = SignalTraits<CurrentPlatform>;

/// Wrapper object that allows managing signal handling of a process.
///
/// This class allows client code to register specific callbacks to fire when a
/// signal is received by the running program.
///
/// \warning Signal settings of a process is a \b GLOBAL state! Do \b NOT use
/// this class and the low-level APIs together!
class SignalHandling
{
public:
  using Signal = PlatformSpecificSignalTraits::RawTy;

  /// The number of normal (non-realtime) signals available with the current
  /// implementation.
  static constexpr std::size_t SignalCount =
    PlatformSpecificSignalTraits::Count;

  /// The number of callbacks that might be registered \b per \b signal to
  /// the handling structure.
  static constexpr std::size_t CallbackCount = 4;

  /// The number of objects that might be registered into the configuration
  /// for use in signal handlers.
  static constexpr std::size_t ObjectCount = 4;

  /// The type of the signal handler that the clients of this class must
  /// implement.
  using SignalCallback = PlatformSpecificSignalTraits::HandlerTy;

/// Generate the signature for a signal handler function of the given name.
#define REMUX_SIGNAL_HANDLER(NAME) REMUX_PLATFORM_SIGNAL_HANDLER_SIG(NAME)

  /// \returns A human-friendly name for the signal \p SigNum.
  static const char* signalName(Signal SigNum) noexcept;

private:
  SignalHandling();

  friend PlatformSpecificSignalTraits;

  static std::unique_ptr<SignalHandling> Singleton;

  using Callback = std::function<SignalCallback>;
  using CallbackArray = std::array<Callback, CallbackCount>;

  std::array<CallbackArray, SignalCount> Callbacks;
  std::array<std::string, ObjectCount> ObjectNames;
  std::array<std::any, ObjectCount> Objects;

  /// The signal codes that are registered by \p enable().
  std::array<bool, SignalCount> RegisteredSignals;
  /// The signal codes that were masked by \p ignore().
  std::array<bool, SignalCount> MaskedSignals;

  static void checkSignal(Signal SigNum);

public:
  /// Retrieve the \b GLOBAL \p SignalHandling object for the process.
  /// If no such object exists, it will be constructed.
  static SignalHandling& get();

  SignalHandling(const SignalHandling&) = delete;
  SignalHandling(SignalHandling&&) = delete;
  SignalHandling& operator=(const SignalHandling&) = delete;
  SignalHandling& operator=(SignalHandling&&) = delete;
  ~SignalHandling() = default;

  /// Registers the dispatching handler in the kernel for every signal that
  /// has a callback and is not ignored.
  ///
  /// Calling this function multiple times is \b allowed.
  void enable();

  /// \returns whether signal handling (through this object) for \p SigNum had
  /// been enabled.
  [[nodiscard]] bool enabled(Signal SigNum) const noexcept;

  /// Restores the default handling of the signals registered by \p enable().
  void disable();

  /// Reset the signal handling configuration for the current process to its
  /// default state.
  void reset();

  /// Sets \p SigNum to be ignored.
  ///
  /// \see \p SIG_IGN
  void ignore(Signal SigNum);

  /// Removes \p SigNum from the ignore list.
  void unignore(Signal SigNum);

  /// Registers a callback to fire when \p SigNum is received.
  /// The callback is added on \b top of the existing callbacks, and will be
  /// fired \b first from all the callbacks.
  void registerCallback(Signal SigNum, std::function<SignalCallback> Callback);

  /// Remove the callbacks of \p SigNum.
  void clearCallbacks(Signal SigNum);

  /// Remove all callbacks.
  void clearCallbacks() noexcept;

  /// Register the \p Object with \p Name in the global object storage of the
  /// signal handler.
  void registerObject(std::string Name, std::any Object);

  /// Delete the object registered as \p Name, if it is registered.
  void deleteObject(const std::string& Name) noexcept;

  /// Delete all objects that are registered.
  void deleteObjects() noexcept;

  /// Retrieves the object registered with \p Name, if exists.
  [[nodiscard]] const std::any* getObject(const char* Name) const noexcept;

  /// Retrieves the object registered with \p Name, if it exists and is of
  /// type \p T.
  template <typename T>
  [[nodiscard]] const T* getObjectAs(const char* Name) const noexcept
  {
    const std::any* Obj = getObject(Name);
    if (!Obj)
      return nullptr;
    return std::any_cast<T>(Obj);
  }
};

} // namespace remux::system
