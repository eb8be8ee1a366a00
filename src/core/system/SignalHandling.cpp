/* SPDX-License-Identifier: LGPL-3.0-only */
#include <cstring>
#include <stdexcept>
#include <system_error>

#include "remux/system/SignalHandling.hpp"

#include "remux/Log.hpp"
#define LOG(SEVERITY) remux::log::SEVERITY("system/Signal")

namespace remux::system
{

std::unique_ptr<SignalHandling> SignalHandling::Singleton;

SignalHandling& SignalHandling::get()
{
  if (!Singleton)
  {
    Singleton.reset(new SignalHandling());
    REMUX_TRACE_LOG(LOG(debug)
                    << "Initialised at address" << ' ' << Singleton.get());
  }
  return *Singleton;
}

SignalHandling::SignalHandling()
{
  for (auto& CallbackArray : Callbacks)
    CallbackArray.fill(Callback{});
  ObjectNames.fill(std::string{});
  Objects.fill(std::any{});
  RegisteredSignals.fill(false);
  MaskedSignals.fill(false);
}

void SignalHandling::checkSignal(Signal SigNum)
{
  if (SigNum <= 0 || static_cast<std::size_t>(SigNum) >= SignalCount)
    throw std::out_of_range{"Invalid signal " + std::to_string(SigNum)};
}

void SignalHandling::enable()
{
  for (std::size_t S = 1; S < SignalCount; ++S)
  {
    if (!Callbacks.at(S).at(0))
      // If the callback for the signal is empty, no handling is needed.
      continue;
    if (RegisteredSignals.at(S) || MaskedSignals.at(S))
      continue;

    PlatformSpecificSignalTraits::setSignalHandled(static_cast<Signal>(S));
    RegisteredSignals.at(S) = true;
  }
}

void SignalHandling::disable()
{
  for (std::size_t S = 1; S < SignalCount; ++S)
  {
    if (!RegisteredSignals.at(S) || MaskedSignals.at(S))
      continue;

    PlatformSpecificSignalTraits::setSignalDefault(static_cast<Signal>(S));
    RegisteredSignals.at(S) = false;
  }
}

bool SignalHandling::enabled(Signal SigNum) const noexcept
{
  if (SigNum <= 0 || static_cast<std::size_t>(SigNum) >= SignalCount)
    return false;
  return RegisteredSignals.at(SigNum) || MaskedSignals.at(SigNum);
}

void SignalHandling::reset()
{
  clearCallbacks();
  deleteObjects();
  for (std::size_t S = 1; S < SignalCount; ++S)
    unignore(static_cast<Signal>(S));
  disable();
}

void SignalHandling::ignore(Signal SigNum)
{
  checkSignal(SigNum);
  if (MaskedSignals.at(SigNum))
    return;

  PlatformSpecificSignalTraits::setSignalIgnored(SigNum);
  MaskedSignals.at(SigNum) = true;
}

void SignalHandling::unignore(Signal SigNum)
{
  checkSignal(SigNum);
  if (!MaskedSignals.at(SigNum))
    return;

  if (RegisteredSignals.at(SigNum))
    PlatformSpecificSignalTraits::setSignalHandled(SigNum);
  else
    PlatformSpecificSignalTraits::setSignalDefault(SigNum);
  MaskedSignals.at(SigNum) = false;
}

void SignalHandling::registerCallback(Signal SigNum,
                                      std::function<SignalCallback> Callback)
{
  checkSignal(SigNum);

  CallbackArray& SCBs = Callbacks.at(SigNum);
  if (SCBs.at(CallbackCount - 1))
    throw std::out_of_range{
      "Signal " + std::to_string(SigNum) + " already has max " +
      std::to_string(CallbackCount) + " callbacks registered"};

  for (std::size_t I = CallbackCount - 1; I != 0; --I)
    if (SCBs.at(I - 1))
      SCBs.at(I - 1).swap(SCBs.at(I));

  SCBs.at(0) = std::move(Callback);
  REMUX_TRACE_LOG(LOG(trace)
                  << "New callback added for " << signalName(SigNum));
}

void SignalHandling::clearCallbacks(Signal SigNum)
{
  checkSignal(SigNum);
  Callbacks.at(SigNum).fill(Callback{});
  REMUX_TRACE_LOG(LOG(trace)
                  << "Callbacks cleared from " << signalName(SigNum));
}

void SignalHandling::clearCallbacks() noexcept
{
  for (auto& CallbackArray : Callbacks)
    CallbackArray.fill(Callback{});
  REMUX_TRACE_LOG(LOG(trace) << "All callbacks cleared");
}

void SignalHandling::registerObject(std::string Name, std::any Object)
{
  if (Name.empty())
    throw std::invalid_argument{"Name"};

  for (std::size_t I = 0; I < ObjectCount; ++I)
  {
    std::string& IName = ObjectNames.at(I);
    if (IName == Name || IName.empty())
    {
      REMUX_TRACE_LOG(LOG(trace) << "Object " << '"' << Name << '"'
                                 << " registered (ID: " << I << ')');
      if (IName.empty())
        IName = std::move(Name);
      Objects.at(I) = std::move(Object);
      return;
    }
  }

  throw std::out_of_range{"Maximum number of objects (" +
                          std::to_string(ObjectCount) +
                          ") registered already."};
}

void SignalHandling::deleteObject(const std::string& Name) noexcept
{
  if (Name.empty())
    return;

  for (std::size_t I = 0; I < ObjectCount; ++I)
    if (ObjectNames.at(I) == Name)
    {
      ObjectNames.at(I).clear();
      Objects.at(I).reset();
      return;
    }
}

void SignalHandling::deleteObjects() noexcept
{
  for (std::size_t I = 0; I < ObjectCount; ++I)
  {
    ObjectNames.at(I).clear();
    Objects.at(I).reset();
  }
}

const std::any* SignalHandling::getObject(const char* Name) const noexcept
{
  if (!Name)
    return nullptr;

  for (std::size_t I = 0; I < ObjectCount; ++I)
    if (!ObjectNames.at(I).empty() && ObjectNames.at(I) == Name)
      return &Objects.at(I);

  return nullptr;
}

} // namespace remux::system

#undef LOG
