/* SPDX-License-Identifier: LGPL-3.0-only */
#include "remux/server/EnvironmentService.hpp"

namespace remux::server
{

EnvironmentService::EnvironmentService(std::string SocketPath,
                                       std::string Commit)
  : SocketPath(std::move(SocketPath)), Commit(std::move(Commit))
{}

void EnvironmentService::setExtensionHost(std::string Program,
                                          std::vector<std::string> Arguments)
{
  ExtensionHostProgram = std::move(Program);
  ExtensionHostArguments = std::move(Arguments);
}

void EnvironmentService::setVariable(std::string Key, std::string Value)
{
  Variables[std::move(Key)] = std::move(Value);
}

std::map<std::string, std::optional<std::string>>
EnvironmentService::hostEnvironment(const std::string& Language) const
{
  std::map<std::string, std::optional<std::string>> Env;
  for (const auto& KV : Variables)
    Env.emplace(KV.first, KV.second);

  Env["REMUX_EXTHOST_LANGUAGE"] = Language;
  if (!SocketPath.empty())
    Env["REMUX_SOCKET"] = SocketPath;
  if (!Commit.empty())
    Env["REMUX_COMMIT"] = Commit;
  return Env;
}

} // namespace remux::server
