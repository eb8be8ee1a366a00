/* SPDX-License-Identifier: LGPL-3.0-only */
#include <string>

#include "remux/CheckedErrno.hpp"
#include "remux/adt/POD.hpp"

#include "remux/system/SignalHandling.hpp"
#include "remux/system/UnixSignalTraits.hpp"

#include "remux/Log.hpp"
#define LOG(SEVERITY) remux::log::SEVERITY("system/UnixSignal")

namespace remux::system
{

const char* SignalHandling::signalName(Signal S) noexcept
{
  switch (S)
  {
    case SIGINT:
      return "SIGINT (Interrupted)";
    case SIGTERM:
      return "SIGTERM (Termination)";
    case SIGHUP:
      return "SIGHUP (Hung up)";
    case SIGQUIT:
      return "SIGQUIT (Quit)";
    case SIGKILL:
      return "SIGKILL (Killed)";
    case SIGPIPE:
      return "SIGPIPE (Broken pipe)";
    case SIGCHLD:
      return "SIGCHLD (Child process terminated)";
    case SIGABRT:
      return "SIGABRT (Aborted)";
    case SIGSEGV:
      return "SIGSEGV (Segmentation fault)";
    case SIGUSR1:
      return "SIGUSR1";
    case SIGUSR2:
      return "SIGUSR2";
    case SIGWINCH:
      return "SIGWINCH (Window size changed)";
  }
  return "<unknown signal>";
}

void SignalTraits<PlatformTag::Unix>::signalDispatch(Signal SigNum,
                                                     ::siginfo_t* Info,
                                                     void* /*Context*/)
{
  if (SigNum <= 0 ||
      static_cast<std::size_t>(SigNum) >= PlatformSpecificSignalTraits::Count)
    return;

  SignalHandling* volatile Context = &SignalHandling::get();
  SignalHandling::CallbackArray& CbArr = Context->Callbacks.at(SigNum);
  for (std::size_t I = 0; I < SignalHandling::CallbackCount; ++I)
  {
    SignalHandling::Callback& Cb = CbArr.at(I);
    if (!Cb)
      return;

    Cb(SigNum, Context, Info);
  }
}

namespace
{

void installAction(SignalHandling::Signal S,
                   POD<struct ::sigaction>& SigAct,
                   const char* What)
{
  CheckedErrnoThrow([S, &SigAct] { return ::sigaction(S, &SigAct, nullptr); },
                    "sigaction(" + std::to_string(S) + ", " + What + ')',
                    -1);
  REMUX_TRACE_LOG(LOG(trace)
                  << SignalHandling::signalName(S) << " set to " << What);
}

} // namespace

void SignalTraits<PlatformTag::Unix>::setSignalHandled(Signal S)
{
  POD<struct ::sigaction> SigAct;
  SigAct->sa_flags = SA_SIGINFO;
  SigAct->sa_sigaction = signalDispatch;
  installAction(S, SigAct, "handle");
}

void SignalTraits<PlatformTag::Unix>::setSignalDefault(Signal S)
{
  POD<struct ::sigaction> SigAct;
  SigAct->sa_handler = SIG_DFL;
  installAction(S, SigAct, "default");
}

void SignalTraits<PlatformTag::Unix>::setSignalIgnored(Signal S)
{
  POD<struct ::sigaction> SigAct;
  SigAct->sa_handler = SIG_IGN;
  installAction(S, SigAct, "ignore");
}

} // namespace remux::system

#undef LOG
