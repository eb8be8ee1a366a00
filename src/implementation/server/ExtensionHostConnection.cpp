/* SPDX-License-Identifier: LGPL-3.0-only */
#include <csignal>
#include <system_error>

#include "remux/Config.h"
#include "remux/system/Platform.hpp"

#ifdef REMUX_PLATFORM_UNIX
#include "remux/system/UnixDomainSocket.hpp"
#include "remux/system/fd.hpp"
#endif /* REMUX_PLATFORM_UNIX */

#include "remux/server/ExtensionHostConnection.hpp"

#include "remux/Log.hpp"
#define LOG(SEVERITY) remux::log::SEVERITY("server/ExtensionHostConnection")
#define LOG_WITH_IDENTIFIER(SEVERITY) LOG(SEVERITY) << '"' << token() << "\": "

namespace remux::server
{

ExtensionHostConnection::ExtensionHostConnection(
  std::string Token, const EnvironmentService& Environment, std::string Language)
  : Connection(message::ConnectionType::ExtensionHost, std::move(Token)),
    Environment(Environment), Language(std::move(Language))
{
  if (this->Language.empty())
    this->Language = DefaultLanguage;
}

ExtensionHostConnection::~ExtensionHostConnection() { closeHost(); }

void ExtensionHostConnection::opened(std::string Buffer)
{
  StartupBuffer.append(Buffer);
  spawnHost();
}

void ExtensionHostConnection::reconnected(std::string Buffer)
{
  if (!PendingForClient.empty())
  {
    std::string Pending = std::move(PendingForClient);
    PendingForClient.clear();
    toClient(Pending);
  }
  toHost(Buffer);
}

void ExtensionHostConnection::spawnHost()
{
  if (Environment.extensionHostProgram().empty())
  {
    LOG_WITH_IDENTIFIER(debug)
      << "No extension host program, buffering client data";
    return;
  }

#ifdef REMUX_PLATFORM_UNIX
  auto Channels = system::unix::DomainSocket::pair();
  // The helper expects ordinary, blocking standard streams.
  system::unix::fd::removeStatusFlag(Channels.second.raw(), O_NONBLOCK);

  system::Process::SpawnOptions SO;
  SO.Program = Environment.extensionHostProgram();
  SO.Arguments = Environment.extensionHostArguments();
  SO.Environment = Environment.hostEnvironment(Language);
  SO.StandardInput = Channels.second.raw();
  SO.StandardOutput = Channels.second.raw();

  try
  {
    Host = system::Process::spawn(SO);
  }
  catch (const std::system_error& Err)
  {
    LOG_WITH_IDENTIFIER(error)
      << "Failed to spawn extension host \"" << SO.Program
      << "\": " << Err.what();
    return;
  }

  LOG_WITH_IDENTIFIER(info) << "Spawned extension host PID " << Host->raw()
                            << " (language: " << Language << ')';
  HostChannel =
    std::make_unique<system::unix::DomainSocket>(std::move(Channels.first));
  ChildSpawnedSignal.fire(Host->raw());
  ChannelOpenedSignal.fire(HostChannel.get());

  if (!StartupBuffer.empty())
  {
    std::string Startup = std::move(StartupBuffer);
    StartupBuffer.clear();
    toHost(Startup);
  }
#else
  LOG_WITH_IDENTIFIER(error) << REMUX_FEED_PLATFORM_NOT_SUPPORTED_MESSAGE
                             << "spawning extension hosts.";
#endif /* REMUX_PLATFORM_UNIX */
}

void ExtensionHostConnection::toHost(std::string_view Data)
{
  if (Data.empty())
    return;
  if (!HostChannel || HostChannel->failed())
  {
    StartupBuffer.append(Data);
    return;
  }
  HostChannel->write(Data);
}

void ExtensionHostConnection::toClient(std::string_view Data)
{
  if (Data.empty())
    return;
  system::Socket* Client = socket();
  if (!Client || Client->failed())
  {
    PendingForClient.append(Data);
    return;
  }
  Client->write(Data);
}

void ExtensionHostConnection::readable(system::BufferedChannel& Channel)
{
  if (&Channel == HostChannel.get())
  {
    toClient(Channel.readEntireBuffer());
    if (Channel.failed())
      dispose("Extension host closed its channel");
    return;
  }

  toHost(Channel.readEntireBuffer());
  if (Channel.failed())
    goOffline();
}

void ExtensionHostConnection::childExited(system::Process::Raw PID)
{
  if (!Host || Host->raw() != PID || !Host->reapIfDead())
    return;

  LOG_WITH_IDENTIFIER(info) << "Extension host PID " << PID
                            << " exited with " << Host->exitCode().value_or(0);
  if (HostChannel && !HostChannel->failed())
    // Deliver whatever the helper wrote before exiting.
    toClient(HostChannel->readEntireBuffer());
  dispose("Extension host exited");
}

void ExtensionHostConnection::disposing() { closeHost(); }

void ExtensionHostConnection::closeHost()
{
  if (HostChannel)
  {
    ChannelClosingSignal.fire(HostChannel->raw());
    HostChannel.reset();
  }
  if (Host && !Host->dead())
  {
    LOG_WITH_IDENTIFIER(debug) << "Terminating extension host PID "
                               << Host->raw();
    Host->signal(SIGTERM);
  }
  // An unreaped helper is collected by the event loop.
  Host.reset();
}

} // namespace remux::server

#undef LOG_WITH_IDENTIFIER
#undef LOG
