/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace remux::server
{

/// Process-level configuration of the server that connections and spawned
/// helper programs need to know about.
class EnvironmentService
{
public:
  EnvironmentService() = default;
  EnvironmentService(std::string SocketPath, std::string Commit);

  [[nodiscard]] const std::string& socketPath() const noexcept
  {
    return SocketPath;
  }
  [[nodiscard]] const std::string& commit() const noexcept { return Commit; }

  /// The program executed as the helper of extension host connections. If
  /// empty, no helper is spawned.
  [[nodiscard]] const std::string& extensionHostProgram() const noexcept
  {
    return ExtensionHostProgram;
  }
  [[nodiscard]] const std::vector<std::string>&
  extensionHostArguments() const noexcept
  {
    return ExtensionHostArguments;
  }
  void setExtensionHost(std::string Program,
                        std::vector<std::string> Arguments = {});

  /// Additional variables exported to every spawned helper.
  [[nodiscard]] const std::map<std::string, std::string>&
  variables() const noexcept
  {
    return Variables;
  }
  void setVariable(std::string Key, std::string Value);

  /// \returns the environment changes to apply when spawning an extension
  /// host helper for a client speaking \p Language.
  [[nodiscard]] std::map<std::string, std::optional<std::string>>
  hostEnvironment(const std::string& Language) const;

private:
  std::string SocketPath;
  std::string Commit;
  std::string ExtensionHostProgram;
  std::vector<std::string> ExtensionHostArguments;
  std::map<std::string, std::string> Variables;
};

} // namespace remux::server
