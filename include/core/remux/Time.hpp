/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace remux
{

/// Formats the given \p Chrono \p Time object to an internationally viable
/// representation.
template <typename T> [[nodiscard]] std::string formatTime(const T& Time)
{
  std::time_t RawTime = T::clock::to_time_t(Time);
  std::tm SplitTime{};
  ::localtime_r(&RawTime, &SplitTime);

  std::ostringstream Buf;
  Buf << std::put_time(&SplitTime, "%a %b %e %H:%M:%S %Y");
  return Buf.str();
}

/// Formats a \p Chrono \p Duration as a human-readable "1h 2m 3s" string.
template <typename Rep, typename Period>
[[nodiscard]] std::string
formatDuration(const std::chrono::duration<Rep, Period>& Duration)
{
  using namespace std::chrono;
  auto Millis = duration_cast<milliseconds>(Duration);
  auto Hours = duration_cast<hours>(Millis);
  Millis -= Hours;
  auto Minutes = duration_cast<minutes>(Millis);
  Millis -= Minutes;
  auto Seconds = duration_cast<seconds>(Millis);
  Millis -= Seconds;

  std::ostringstream Buf;
  bool Printed = false;
  if (Hours.count())
  {
    Buf << Hours.count() << 'h';
    Printed = true;
  }
  if (Minutes.count())
  {
    Buf << (Printed ? " " : "") << Minutes.count() << 'm';
    Printed = true;
  }
  if (Seconds.count() || !Printed)
  {
    Buf << (Printed ? " " : "") << Seconds.count();
    if (Millis.count())
      Buf << '.' << std::setw(3) << std::setfill('0') << Millis.count();
    Buf << 's';
  }
  return Buf.str();
}

} // namespace remux
