/* SPDX-License-Identifier: LGPL-3.0-only */
#include <exception>

#include "remux/server/OrphanDetector.hpp"

#include "remux/Log.hpp"
#define LOG(SEVERITY) remux::log::SEVERITY("server/OrphanDetector")

namespace remux::server
{

OrphanDetector::OrphanDetector(TimerQueue& Timers)
  : Timers(Timers), Barrier(Timers)
{}

bool OrphanDetector::probe(Callback CB)
{
  bool Fresh = Waiting.empty();
  Waiting.emplace_back(std::move(CB));
  if (!Fresh)
    return false;

  LastReply.reset();
  Barrier.arm(AutoOpen, [this] {
    REMUX_TRACE_LOG(LOG(trace) << "Barrier auto-opened without reply");
    open();
  });
  return true;
}

void OrphanDetector::reply()
{
  LastReply = Timers.now();
  if (isProbing())
    open();
}

void OrphanDetector::open()
{
  Barrier.cancel();
  bool IsOrphan = !LastReply || Timers.now() - *LastReply > ReplyThreshold;
  answer(IsOrphan);
}

void OrphanDetector::cancel()
{
  Barrier.cancel();
  answer(true);
}

void OrphanDetector::answer(bool IsOrphan)
{
  // Callbacks might start a new probe, which must not be answered now.
  std::vector<Callback> Answered = std::move(Waiting);
  Waiting.clear();
  for (Callback& CB : Answered)
  {
    if (!CB)
      continue;
    try
    {
      CB(IsOrphan);
    }
    catch (const std::exception& E)
    {
      LOG(error) << "Orphan answer callback threw: " << E.what();
    }
  }
}

} // namespace remux::server

#undef LOG
