/* SPDX-License-Identifier: GPL-3.0-only */
#include <memory>

#include "remux/CheckedErrno.hpp"
#include "remux/Config.h"
#include "remux/FrontendExitCode.hpp"
#include "remux/Time.hpp"
#include "remux/Version.hpp"
#include "remux/adt/scope_guard.hpp"
#include "remux/server/EnvironmentService.hpp"
#include "remux/server/Server.hpp"
#include "remux/system/Platform.hpp"
#include "remux/system/Process.hpp"
#include "remux/system/SignalHandling.hpp"

#ifdef REMUX_PLATFORM_UNIX
#include <unistd.h>

#include "remux/system/UnixDomainSocket.hpp"
#endif /* REMUX_PLATFORM_UNIX */

#include "remux/server/Main.hpp"

#include "remux/Log.hpp"
#define LOG(SEVERITY) remux::log::SEVERITY("server/Main")

namespace remux::server
{

Options::Options() : Background(true) {}

std::vector<std::string> Options::toArgv() const
{
  std::vector<std::string> Ret;

  if (SocketPath.has_value())
  {
    Ret.emplace_back("--socket");
    Ret.emplace_back(*SocketPath);
  }
  if (!Background)
    Ret.emplace_back("--foreground");
  if (MaxExtraOfflineConnections)
    Ret.emplace_back("--max-extra-offline-connections=" +
                     std::to_string(MaxExtraOfflineConnections));
  if (GraceTime)
    Ret.emplace_back("--grace-time=" + std::to_string(GraceTime->count()));
  if (ShortGraceTime)
    Ret.emplace_back("--short-grace-time=" +
                     std::to_string(ShortGraceTime->count()));
  if (ExtensionHost)
    Ret.emplace_back("--extension-host=" + *ExtensionHost);
  if (Commit)
    Ret.emplace_back("--commit=" + *Commit);

  return Ret;
}

namespace
{

constexpr char ServerObjName[] = "Server";

REMUX_SIGNAL_HANDLER(serverShutdown);
REMUX_SIGNAL_HANDLER(childExited);

} // namespace

FrontendExitCode main(Options& Opts)
{
  using namespace remux::system;

  std::unique_ptr<system::Socket> ServerSock;
  try
  {
#if REMUX_PLATFORM_ID == REMUX_PLATFORM_ID_Unix
    ServerSock = std::make_unique<unix::DomainSocket>(
      unix::DomainSocket::create(*Opts.SocketPath));
#else  /* Unhandled platform */
    LOG(fatal)
      << REMUX_FEED_PLATFORM_NOT_SUPPORTED_MESSAGE
      << "socket-based communication, but this is required to accept clients."
      << '\n';
    return FrontendExitCode::SystemError;
#endif /* REMUX_PLATFORM_ID */
  }
  catch (const std::system_error& SE)
  {
    LOG(fatal) << "Creating the socket '" << *Opts.SocketPath << "' failed:\n\t"
               << SE.what();
    if (SE.code() == std::errc::address_in_use)
      LOG(info) << "If you are sure another server is not running, delete the "
                   "file and restart the server.";
    return FrontendExitCode::SystemError;
  }

  std::string Commit = Opts.Commit.value_or(getCommitIdentifier());
  EnvironmentService Environment{*Opts.SocketPath, Commit};
  if (Opts.ExtensionHost)
    Environment.setExtensionHost(*Opts.ExtensionHost);

  Server::Options ServerOpts;
  ServerOpts.Dispatch.Commit = Commit;
  ServerOpts.Dispatch.MaxExtraOfflineConnections =
    Opts.MaxExtraOfflineConnections;
  if (Opts.GraceTime)
    ServerOpts.Grace.Long = *Opts.GraceTime;
  if (Opts.ShortGraceTime)
    ServerOpts.Grace.Short = *Opts.ShortGraceTime;

  LOG(debug) << "Grace times: " << formatDuration(ServerOpts.Grace.Long)
             << " and " << formatDuration(ServerOpts.Grace.Short)
             << " after the owner had gone";

  Server S{std::move(ServerSock), std::move(Environment), ServerOpts};
  scope_guard Signal{[&S] {
                       SignalHandling& Sig = SignalHandling::get();
                       Sig.registerObject(ServerObjName, &S);
                       Sig.registerCallback(SIGHUP, &serverShutdown);
                       Sig.registerCallback(SIGINT, &serverShutdown);
                       Sig.registerCallback(SIGTERM, &serverShutdown);
                       Sig.registerCallback(SIGCHLD, &childExited);
                       Sig.ignore(SIGPIPE);
                       Sig.enable();
                     },
                     [] {
                       SignalHandling& Sig = SignalHandling::get();
                       Sig.unignore(SIGPIPE);
                       Sig.clearCallbacks(SIGCHLD);
                       Sig.clearCallbacks(SIGTERM);
                       Sig.clearCallbacks(SIGINT);
                       Sig.clearCallbacks(SIGHUP);
                       Sig.deleteObject(ServerObjName);
                     }};

  LOG(info) << "Starting remux server (commit " << Commit << ')';
  if (Opts.Background)
  {
#ifdef REMUX_PLATFORM_UNIX
    CheckedErrnoThrow(
      [] { return ::daemon(0, 0); }, "Backgrounding ourselves failed", -1);
#endif /* REMUX_PLATFORM_UNIX */
  }

  scope_guard Server{[&S] { S.loop(); }, [&S] { S.shutdown(); }};
  LOG(info) << "remux server stopped";
  return FrontendExitCode::Success;
}

namespace
{

/// Handler for request to terminate the server.
REMUX_SIGNAL_HANDLER(serverShutdown)
{
  (void)Sig;
  (void)PlatformInfo;

  const volatile auto* Srv =
    SignalHandling->getObjectAs<Server*>(ServerObjName);
  if (!Srv)
    return;
  (*Srv)->interrupt();
}

/// Handler for \p SIGCHLD when a process spawned by the server quits.
REMUX_SIGNAL_HANDLER(childExited)
{
  (void)Sig;

  system::Process::Raw CPID = PlatformInfo->si_pid;
  const volatile auto* Srv =
    SignalHandling->getObjectAs<Server*>(ServerObjName);
  if (!Srv)
    return;
  (*Srv)->registerDeadChild(CPID);
}

} // namespace

} // namespace remux::server

#undef LOG
