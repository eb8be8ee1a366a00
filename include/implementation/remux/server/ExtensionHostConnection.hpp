/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <memory>
#include <string>

#include "remux/server/Connection.hpp"
#include "remux/server/EnvironmentService.hpp"
#include "remux/system/Process.hpp"

namespace remux::server
{

/// A connection proxied to a helper program (the extension host) spawned by
/// the server for the lifetime of the connection.
///
/// The helper's standard input and output are connected to one end of a
/// socket pair. The bytes that arrived together with the handshake are
/// replayed to the helper, then data is forwarded in both directions. Data
/// of the helper produced while the client is offline is kept until the
/// client reconnects.
class ExtensionHostConnection : public Connection
{
public:
  static constexpr char DefaultLanguage[] = "en";

  ExtensionHostConnection(std::string Token,
                          const EnvironmentService& Environment,
                          std::string Language = DefaultLanguage);
  ~ExtensionHostConnection() override;

  [[nodiscard]] const std::string& language() const noexcept
  {
    return Language;
  }
  /// \returns the bytes received from the client that were not yet
  /// delivered to a helper.
  [[nodiscard]] const std::string& startupBuffer() const noexcept
  {
    return StartupBuffer;
  }
  [[nodiscard]] bool hasHost() const noexcept
  {
    return static_cast<bool>(Host);
  }
  [[nodiscard]] system::Process* host() noexcept { return Host.get(); }
  [[nodiscard]] system::BufferedChannel* hostChannel() noexcept
  {
    return HostChannel.get();
  }

  void readable(system::BufferedChannel& Channel) override;
  void childExited(system::Process::Raw PID) override;

protected:
  void opened(std::string Buffer) override;
  void reconnected(std::string Buffer) override;
  void disposing() override;

private:
  const EnvironmentService& Environment;
  std::string Language;
  std::string StartupBuffer;
  /// Output of the helper produced while the client was offline.
  std::string PendingForClient;
  std::unique_ptr<system::Process> Host;
  std::unique_ptr<system::BufferedChannel> HostChannel;

  void spawnHost();
  void closeHost();
  void toHost(std::string_view Data);
  void toClient(std::string_view Data);
};

} // namespace remux::server
