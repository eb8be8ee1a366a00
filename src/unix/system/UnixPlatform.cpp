/* SPDX-License-Identifier: LGPL-3.0-only */
#include <cstring>
#include <sstream>

#include <libgen.h>
#include <linux/limits.h>
#include <sys/stat.h>

#include "remux/CheckedErrno.hpp"
#include "remux/adt/POD.hpp"
#include "remux/system/Environment.hpp"

#include "remux/system/Platform.hpp"

#include "remux/Log.hpp"
#define LOG(SEVERITY) remux::log::SEVERITY("system/UnixPlatform")

namespace remux::system
{

namespace
{

constexpr char SocketName[] = "remux";

} // namespace

std::string Platform::defaultShell()
{
  std::string EnvVar = getEnv("SHELL");
  if (!EnvVar.empty())
    return EnvVar;

  auto Check = [](const std::string& Program) {
    LOG(debug) << "Trying Shell program " << Program;
    return static_cast<bool>(CheckedErrno(
      [Prog = Program.c_str()] {
        POD<struct ::stat> StatResult;
        return ::stat(Prog, &StatResult);
      },
      -1));
  };

  if (Check("/bin/bash"))
    return "/bin/bash";
  if (Check("/bin/sh"))
    return "/bin/sh";

  LOG(debug) << "No Shell found.";
  return {};
}

Platform::SocketPath Platform::SocketPath::defaultSocketPath()
{
  std::string Dir = getEnv("XDG_RUNTIME_DIR");
  if (!Dir.empty())
  {
    LOG(debug) << "Socket path under XDG_RUNTIME_DIR";
    return {std::move(Dir), SocketName, true};
  }

  Dir = getEnv("TMPDIR");
  if (!Dir.empty())
  {
    std::string User = getEnv("USER");
    if (!User.empty())
    {
      LOG(debug) << "Socket path under TMPDIR for $USER";
      return {std::move(Dir), SocketName + ('-' + std::move(User)), false};
    }
    LOG(debug) << "Socket path under TMPDIR";
    return {std::move(Dir), SocketName, false};
  }

  std::string User = getEnv("USER");
  LOG(debug) << "Socket path under hardcoded /tmp";
  if (!User.empty())
    return {"/tmp", SocketName + ('-' + std::move(User)), false};
  return {"/tmp", SocketName, false};
}

Platform::SocketPath Platform::SocketPath::absolutise(const std::string& Path)
{
  if (Path.empty())
    throw std::system_error{
      std::make_error_code(std::errc::invalid_argument), "Empty socket path"};
  REMUX_TRACE_LOG(LOG(trace) << "Absolutising path \"" << Path << "\"...");

  POD<char[PATH_MAX]> Result;
  if (Path.front() == '/')
  {
    if (Path.size() >= PATH_MAX)
      throw std::system_error{
        std::make_error_code(std::errc::filename_too_long), Path};
    std::strncpy(*Result, Path.c_str(), PATH_MAX - 1);
  }
  else
  {
    auto R = CheckedErrno(
      [&Path, &Result] { return ::realpath(Path.c_str(), *Result); }, nullptr);
    if (!R)
    {
      std::error_code EC = R.getError();
      if (EC != std::errc::no_such_file_or_directory /* ENOENT */)
        throw std::system_error{EC, "realpath()"};

      // For files that do not exist, realpath will fail, so the absolute
      // path is assembled from the current directory.
      Result.reset();
      CheckedErrnoThrow([&Result] { return ::realpath(".", *Result); },
                        "realpath(\".\")",
                        nullptr);

      std::size_t CurDirSize = std::strlen(*Result);
      if (CurDirSize + 1 + Path.size() >= PATH_MAX)
        throw std::system_error{
          std::make_error_code(std::errc::filename_too_long), "strncat path"};

      (*Result)[CurDirSize] = '/';
      (*Result)[CurDirSize + 1] = 0;
      std::strncat(*Result + CurDirSize, Path.c_str(), Path.size());
    }
  }

  POD<char[PATH_MAX]> Dir;
  std::strncpy(*Dir, *Result, PATH_MAX - 1);
  char* DirResult =
    CheckedErrnoThrow([&Dir] { return ::dirname(*Dir); }, "dirname()", nullptr);
  char* BaseResult = CheckedErrnoThrow(
    [&Result] { return ::basename(*Result); }, "basename()", nullptr);

  REMUX_TRACE_LOG(LOG(trace) << "Path split: dirname = " << DirResult
                             << "; name = " << BaseResult);

  SocketPath SP;
  SP.Path = DirResult;
  SP.Filename = BaseResult;
  SP.IsPathLikelyUserSpecific = false;
  return SP;
}

std::string Platform::SocketPath::to_string() const
{
  std::ostringstream Buf;
  if (!Path.empty())
    Buf << Path << '/';
  Buf << Filename;
  return Buf.str();
}

} // namespace remux::system

#undef LOG
