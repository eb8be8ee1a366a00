/* SPDX-License-Identifier: GPL-3.0-only */
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <utility>

#include <getopt.h>
#include <unistd.h>

#include "remux/Config.h"
#include "remux/FrontendExitCode.hpp"
#include "remux/Version.hpp"
#include "remux/server/Main.hpp"
#include "remux/system/Platform.hpp"
#include "remux/system/SignalHandling.hpp"

#include "Config.hpp"

#include "remux/Log.hpp"
#define LOG(SEVERITY) remux::log::SEVERITY("main")

namespace
{

constexpr char ModuleObjName[] = "Module";

const char ShortOptions[] = "hvqVs:";

enum LongOnlyOption : int
{
  MaxExtraOfflineConnections = 256,
  GraceTime,
  ShortGraceTime,
  ExtensionHost,
  Commit,
  Foreground,
};

// clang-format off
struct ::option LongOptions[] = {
  {"help",                           no_argument,       nullptr, 'h'},
  {"verbose",                        no_argument,       nullptr, 'v'},
  {"quiet",                          no_argument,       nullptr, 'q'},
  {"version",                        no_argument,       nullptr, 'V'},
  {"socket",                         required_argument, nullptr, 's'},
  {"max-extra-offline-connections",  required_argument, nullptr, MaxExtraOfflineConnections},
  {"grace-time",                     required_argument, nullptr, GraceTime},
  {"short-grace-time",               required_argument, nullptr, ShortGraceTime},
  {"extension-host",                 required_argument, nullptr, ExtensionHost},
  {"commit",                         required_argument, nullptr, Commit},
  {"foreground",                     no_argument,       nullptr, Foreground},
  {nullptr,                          0,                 nullptr, 0}
};
// clang-format on

struct MainOptions
{
  /// \p -h
  bool ShowHelp : 1;

  /// \p -V
  bool ShowVersion : 1;

  /// \p -V a second time
  bool ShowElaborateBuildInformation : 1;

  /// \p -v
  bool AnyVerboseFlag : 1;
  /// \p -q
  bool AnyQuietFlag : 1;

  /// \p -v or \p -q sequences
  std::int8_t VerbosityQuietnessDifferential = 0;

  /// \p -v and \p -q translated to \p Severity choice.
  remux::log::Severity Severity;
};

void printHelp();
void printVersion();
void printFeatures();
std::pair<bool, MainOptions> argParse(int ArgC,
                                      const char* const ArgV[],
                                      remux::server::Options& ServerOpts);
void setUpSignalHandling();
REMUX_SIGNAL_HANDLER(coreDumped);

} // namespace

int main(int ArgC, char* ArgV[])
{
  using namespace remux;
  using namespace remux::system;

  // ------------------------ Parse command-line options -----------------------
  bool ParseErrors = false;
  MainOptions MainOpts{};
  server::Options ServerOpts{};
  std::tie(ParseErrors, MainOpts) = argParse(ArgC, ArgV, ServerOpts);

  // ---------------------- Perform simple tasks and exit ----------------------
  if (MainOpts.ShowHelp)
  {
    printHelp();
    return static_cast<int>(FrontendExitCode::Success);
  }
  if (MainOpts.ShowVersion)
  {
    printVersion();
    if (MainOpts.ShowElaborateBuildInformation)
      printFeatures();
    return static_cast<int>(FrontendExitCode::Success);
  }
  if (ParseErrors)
    return static_cast<int>(FrontendExitCode::InvocationError);

  // ------------------- Initialise the core helper libraries ------------------
  log::Logger::get().setLimit(MainOpts.Severity);
  setUpSignalHandling();

  // --------------------- Set up some internal environment --------------------
  {
    Platform::SocketPath Socket =
      ServerOpts.SocketPath
        ? Platform::SocketPath::absolutise(*ServerOpts.SocketPath)
        : Platform::SocketPath::defaultSocketPath();
    ServerOpts.SocketPath = Socket.to_string();
    LOG(debug) << "Using socket: " << '"' << *ServerOpts.SocketPath << '"';
  }

  // --------------------------- Execute the server ----------------------------
  try
  {
    return static_cast<int>(server::main(ServerOpts));
  }
  catch (const std::system_error& Err)
  {
    LOG(fatal) << Err.what();
    return static_cast<int>(FrontendExitCode::SystemError);
  }
  catch (const std::exception& Ex)
  {
    LOG(fatal) << Ex.what();
    return static_cast<int>(FrontendExitCode::Failure);
  }
}

namespace
{

void printHelp()
{
  std::cout << R"EOF(Usage:
    remux [-vq...] [-s PATH] [SERVER OPTIONS...]
    remux (-V[V])

            remux -- Remote Development Connection Multiplexer

remux is a server that multiplexes the connections of remote development
clients over a single local socket, and keeps the terminal processes of the
clients alive while they are disconnected.

Clients identify themselves with a reconnection token in a handshake. A client
that lost its connection may reconnect with the same token and continue where
it left off. Terminals started as persistent keep running, and their recent
output is replayed to the client when it comes back.

Options:
    -h, --help                  - Show this help text.
    -V[V], --version            - Show version information about the
                                  executable. If repeated, elaborate build
                                  configuration, such as features, too.
    -v, --verbose               - Increase the verbosity of the built-in logging
                                  mechanism. Each '-v' supplied enables one more
                                  level. (Meaningless together with '-q'.)
    -q, --quiet                 - Decrease the verbosity of the built-in logging
                                  mechanism. Each '-q' supplied disables one
                                  more level. (Meaningless together with '-v'.)


Server options:
    -s PATH, --socket PATH      - Path of the server socket to create and await
                                  clients on.
    --foreground                - Do not daemonise (put the running server into
                                  the background).
    --max-extra-offline-connections=N
                                - The number of disconnected connections kept
                                  per connection type for their clients to
                                  reconnect. (Defaults to 0.)
    --grace-time=SECONDS        - How long a persistent terminal is kept alive
                                  after its client detached. (Defaults to 3
                                  hours.)
    --short-grace-time=SECONDS  - The grace time of persistent terminals once
                                  their owner is known to be gone. (Defaults to
                                  6 minutes.)
    --extension-host=PROGRAM    - The program to spawn for every extension host
                                  connection, connected to the client through
                                  its standard input and output.
    --commit=HASH               - The commit identifier reported to clients.
                                  Clients of a different commit are warned
                                  about. (Defaults to the built commit.)
)EOF";
  std::cout << std::endl;
}

void printVersion()
{
  std::cout << "remux version " << remux::getFullVersion() << std::endl;
}

void printFeatures()
{
  std::cout << "Features:\n"
            << remux::getHumanReadableConfiguration() << std::endl;
}

/// Parses \p Str as a whole non-negative decimal number.
std::optional<unsigned long long> parseCount(const char* Str)
{
  if (!Str || *Str == '\0' || *Str == '-')
    return std::nullopt;

  char* End = nullptr;
  errno = 0;
  unsigned long long Value = std::strtoull(Str, &End, 10);
  if (errno != 0 || *End != '\0')
    return std::nullopt;
  return Value;
}

std::pair<bool, MainOptions> argParse(int ArgC,
                                      const char* const ArgV[],
                                      remux::server::Options& ServerOpts)
{
  MainOptions MainOpts{};
  bool HadErrors = false;
  auto ArgError = [&HadErrors, Prog = ArgV[0]]() -> std::ostream& {
    std::cerr << Prog << ": ";
    HadErrors = true;
    return std::cerr;
  };
  auto Count =
    [&ArgError](std::string_view Flag) -> std::optional<unsigned long long> {
    std::optional<unsigned long long> N = parseCount(optarg);
    if (!N)
      ArgError() << "option '--" << Flag << "' expects a number, got \""
                 << optarg << "\"\n";
    return N;
  };

  int Opt;
  int LongOptIndex;
  while ((Opt = ::getopt_long(ArgC,
                              const_cast<char**>(ArgV),
                              ShortOptions,
                              LongOptions,
                              &LongOptIndex)) != -1)
  {
    switch (Opt)
    {
      case '?':
        HadErrors = true;
        break;
      case 'h':
        MainOpts.ShowHelp = true;
        break;
      case 'v':
        if (MainOpts.AnyQuietFlag)
        {
          ArgError() << "option '"
                     << "-v/--verbose"
                     << "' meaningless if '-q/--quiet' was also supplied\n";
          break;
        }
        MainOpts.AnyVerboseFlag = true;
        ++MainOpts.VerbosityQuietnessDifferential;
        break;
      case 'q':
        if (MainOpts.AnyVerboseFlag)
        {
          ArgError() << "option '"
                     << "-q/--quiet"
                     << "' meaningless if '-v/--verbose' was also supplied\n";
          break;
        }
        MainOpts.AnyQuietFlag = true;
        --MainOpts.VerbosityQuietnessDifferential;
        break;
      case 'V':
        if (!MainOpts.ShowVersion)
        {
          MainOpts.ShowVersion = true;
          break;
        }
        if (!MainOpts.ShowElaborateBuildInformation)
        {
          MainOpts.ShowElaborateBuildInformation = true;
          break;
        }
        ArgError() << "option '"
                   << "-V"
                   << "' cannot be repeated this many times\n";
        break;
      case 's':
        ServerOpts.SocketPath.emplace(optarg);
        break;
      case MaxExtraOfflineConnections:
        if (auto N = Count("max-extra-offline-connections"))
          ServerOpts.MaxExtraOfflineConnections = *N;
        break;
      case GraceTime:
        if (auto N = Count("grace-time"))
          ServerOpts.GraceTime.emplace(*N);
        break;
      case ShortGraceTime:
        if (auto N = Count("short-grace-time"))
          ServerOpts.ShortGraceTime.emplace(*N);
        break;
      case ExtensionHost:
        ServerOpts.ExtensionHost.emplace(optarg);
        break;
      case Commit:
        ServerOpts.Commit.emplace(optarg);
        break;
      case Foreground:
        ServerOpts.Background = false;
        break;
      default:
        std::cerr << ArgV[0] << ": "
                  << "option '" << '-' << static_cast<char>(Opt)
                  << "' is registered to be accepted, but the associated "
                     "handler is not found\n\tThe flag will be ignored! Please "
                     "report this as a bug!\n";
        break;
    }
  }

  {
    using namespace remux::log;

#ifdef REMUX_NON_ESSENTIAL_LOGS
    std::size_t VerbosityPositiveSizeT =
      std::abs(MainOpts.VerbosityQuietnessDifferential);
#endif
    if (MainOpts.VerbosityQuietnessDifferential > MaximumVerbosity)
    {
      REMUX_TRACE_LOG(
        std::cerr << "Warning: Requested logging verbosity '-"
                  << (std::string(VerbosityPositiveSizeT, 'v'))
                  << "' larger than possible, clamping to available maximum."
                  << std::endl);
      MainOpts.VerbosityQuietnessDifferential = MaximumVerbosity;
    }
    else if (MainOpts.VerbosityQuietnessDifferential < -MinimumVerbosity)
    {
      REMUX_TRACE_LOG(
        std::cerr << "Warning: Requested logging verbosity '-"
                  << (std::string(VerbosityPositiveSizeT, 'q'))
                  << "' larger than possible, clamping to available maximum."
                  << std::endl);
      MainOpts.VerbosityQuietnessDifferential = -MinimumVerbosity;
    }
    MainOpts.Severity =
      static_cast<Severity>(Default + MainOpts.VerbosityQuietnessDifferential);
  }

  for (; ::optind < ArgC; ++::optind)
    ArgError() << "unexpected positional argument \"" << ArgV[::optind]
               << "\"\n";

  return std::make_pair(HadErrors, std::move(MainOpts));
}

void setUpSignalHandling()
{
  using namespace remux::system;
  SignalHandling& Sig = SignalHandling::get();
  Sig.registerObject(ModuleObjName, "main");

#ifdef REMUX_PLATFORM_UNIX
  Sig.registerCallback(SIGILL, &coreDumped);
  Sig.registerCallback(SIGABRT, &coreDumped);
  Sig.registerCallback(SIGSEGV, &coreDumped);
  Sig.registerCallback(SIGSYS, &coreDumped);
#endif /* REMUX_PLATFORM_UNIX */

  Sig.enable();
}

REMUX_SIGNAL_HANDLER(coreDumped)
{
  (void)PlatformInfo;
  using namespace remux;
  using namespace remux::system;

  // Reset the signal handler for the current signal, so all other processes
  // and logics properly receive the fact that we are ending, anyway...
  SignalHandling::get().clearCallbacks(Sig);
  SignalHandling::get().disable();

  const volatile auto* MaybeModule =
    SignalHandling->getObjectAs<const char*>(ModuleObjName);
  const char* Module = MaybeModule ? *MaybeModule : "<Unknown>";
  LOG(fatal) << "in" << ' ' << '\'' << Module << '\'' << " - FATAL SIGNAL "
             << Sig << ' ' << '\'' << SignalHandling::signalName(Sig) << '\''
             << " RECEIVED!";

  std::cerr << "- * - * - * - * - * - * - * - * - * - * - * - * - * - * - * - "
               "* - * - * - * - * - * - * - * - * - * - * - * -"
            << '\n';
  std::cerr << '\t' << '\t' << "remux" << ' ' << "(v" << getFullVersion()
            << ")" << ' ' << "has crashed!" << '\n';
  std::cerr << "---------------------------------------------------------------"
               "-----------------------------------------------"
            << '\n';
  std::cerr << getHumanReadableConfiguration() << '\n';
  std::cerr << "- * - * - * - * - * - * - * - * - * - * - * - * - * - * - * - "
               "* - * - * - * - * - * - * - * - * - * - * - * -"
            << '\n';
}

} // namespace

#undef LOG
