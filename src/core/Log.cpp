/* SPDX-License-Identifier: LGPL-3.0-only */
#include <iostream>

#include "remux/Time.hpp"

#include "remux/Log.hpp"

namespace remux::log
{

// clang-format off
static constexpr const char* SeverityName[Min + 1] = {"           ",
                                                      "!!! FATAL  ",
                                                      " !! ERROR  ",
                                                      "  ! Warning",
                                                      "    Info   ",
                                                      "  > Debug  ",
                                                      " >> trace  ",
                                                      ">>> data   "};
static constexpr const char InvalidSeverity[] =       "??? Invalid";
// clang-format on

static const char* levelName(Severity S) noexcept
{
  if (S > log::Min || S < log::Max)
    return InvalidSeverity;
  return SeverityName[S];
}

Logger::OutputBuffer::OutputBuffer(std::ostream& OS,
                                   bool Discard,
                                   std::string_view Prefix)
  : Discard(Discard), OS(&OS)
{
  if (!Discard)
    Buffer << Prefix;
}

Logger::OutputBuffer::~OutputBuffer() noexcept(false)
{
  if (!Discard)
    (*OS) << Buffer.str() << std::endl;
}

std::unique_ptr<Logger> Logger::Singleton;

Logger& Logger::get()
{
  if (!Singleton)
  {
    Singleton = std::make_unique<Logger>(Default, std::clog);
    REMUX_TRACE_LOG(Singleton->operator()(log::Debug, "logger")
                    << "Initialised at address" << ' ' << Singleton.get());
  }

  return *Singleton;
}

Logger::Logger(Severity S, std::ostream& OS) : SeverityLimit(S), OS(&OS) {}

Logger::OutputBuffer Logger::operator()(Severity S, std::string_view Facility)
{
  std::ostringstream LogPrefix;
  bool Discarding = S > getLimit();
  if (!Discarding)
  {
    LogPrefix << '[' << formatTime(std::chrono::system_clock::now()) << ']';
    LogPrefix << '[' << levelName(S) << ']' << ' ';
    if (!Facility.empty())
      LogPrefix << Facility;
    else
      LogPrefix << "<Unknown>";
    LogPrefix << ':' << ' ';
  }
  return OutputBuffer{*OS, Discarding, LogPrefix.str()};
}

} // namespace remux::log
