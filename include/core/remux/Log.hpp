/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <cassert>
#include <cstdint>
#include <memory>
#include <sstream>
#include <string_view>

#include "remux/Config.h"

namespace remux::log
{

/// Severity levels for log messages.
/// Severities linearly increase in "verbosity" level, so a lower severity
/// \e number indicates a more important message.
enum Severity
{
  /// The highest severity level. Will always be printed, no matter what.
  None = 0,
  /// Critical messages that are likely the last printout from the system.
  Fatal,
  /// An operation failed and could not meaningfully continue, but the server
  /// as a whole survives.
  Error,
  /// Something odd happened which could be recovered from fully.
  Warning,
  /// The standard log level.
  Info,
  /// Debug information, only meaningful when diagnosing bogus behaviour.
  Debug,
  /// Verbose debug information that creates a printout at every important
  /// interaction, e.g. every timer firing or message received.
  Trace,
  /// The most verbose level which also prints raw data flowing through the
  /// connections.
  Data,

  /// The default severity level for bare printouts.
  Default = Info,

  /// The largest severity value.
  Max = None,
  /// The lowest severity value.
  Min = Data,
};

/// The largest verbosity the user can request an increase to.
constexpr std::int8_t MaximumVerbosity = log::Min - log::Default;
/// The smallest verbosity (largest quietness) the user can decrease to.
constexpr std::int8_t MinimumVerbosity = log::Default - log::Max - 1;

/// The \p Logger class handles emitting log messages to an output device.
///
/// \note This object is \b NOT thread-safe!
class Logger
{
private:
  class OutputBuffer
  {
    bool Discard;
    std::ostream* OS;
    std::ostringstream Buffer;

  public:
    OutputBuffer(std::ostream& OS, bool Discard, std::string_view Prefix);

    /// Print the contents of the log buffer to the output device.
    ~OutputBuffer() noexcept(false);

    template <typename T> OutputBuffer& operator<<(T&& Value)
    {
      if (!Discard)
        Buffer << std::forward<T>(Value);
      return *this;
    }
  };

  static std::unique_ptr<Logger> Singleton;

public:
  /// Retrieve the logging instance for the current application.
  static Logger& get();

  /// Creates a new \p Logger object that has no connection with the global
  /// logging instance.
  ///
  /// \see get()
  Logger(Severity SeverityLimit, std::ostream& OS);

  Severity getLimit() const noexcept { return SeverityLimit; }
  void setLimit(Severity Limit) noexcept { SeverityLimit = Limit; }

  /// Starts printing a log message with the specified \p S severity.
  /// If \p S is more verbose than the current limit, the message is
  /// discarded.
  OutputBuffer operator()(Severity S, std::string_view Facility);

private:
  Severity SeverityLimit;
  std::ostream* OS;
};

#define REMUX_LOGGER_SHORTCUT(NAME, SEVERITY)                                  \
  inline decltype(auto) NAME(std::string_view Facility)                        \
  {                                                                            \
    return remux::log::Logger::get()(SEVERITY, Facility);                      \
  }

REMUX_LOGGER_SHORTCUT(fatal, Fatal);
REMUX_LOGGER_SHORTCUT(error, Error);
REMUX_LOGGER_SHORTCUT(warn, Warning);
REMUX_LOGGER_SHORTCUT(info, Info);
REMUX_LOGGER_SHORTCUT(debug, Debug);
REMUX_LOGGER_SHORTCUT(trace, Trace);
REMUX_LOGGER_SHORTCUT(data, Data);

#undef REMUX_LOGGER_SHORTCUT

#define REMUX_DETAIL_CONDITIONALLY_TRUE(X)                                     \
  do                                                                           \
  {                                                                            \
    X;                                                                         \
  } while (false)
#define REMUX_DETAIL_CONDITIONALLY_FALSE(X) ((void)0)

#ifdef REMUX_NON_ESSENTIAL_LOGS
/* Wrap logging code into this macro to suppress building it if config option
 * \p REMUX_NON_ESSENTIAL_LOGS is turned off.
 *
 * It has been turned \e ON in this build, and trace logging is compiled.
 */
#define REMUX_TRACE_LOG(X) REMUX_DETAIL_CONDITIONALLY_TRUE(X)
#else
/* Wrap logging code into this macro to suppress building it if config option
 * \p REMUX_NON_ESSENTIAL_LOGS is turned off.
 *
 * It has been turned \b OFF in this build, and trace logging is stripped.
 */
#define REMUX_TRACE_LOG(X) REMUX_DETAIL_CONDITIONALLY_FALSE(X)
#endif

} // namespace remux::log
