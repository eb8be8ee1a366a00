/* SPDX-License-Identifier: LGPL-3.0-only */
#include "remux/server/Recorder.hpp"

#include "remux/Log.hpp"
#define LOG(SEVERITY) remux::log::SEVERITY("server/Recorder")

namespace remux::server
{

Recorder::Recorder(std::uint16_t Columns, std::uint16_t Rows)
  : StartColumns(Columns), StartRows(Rows)
{}

void Recorder::recordData(std::string_view Data)
{
  if (Data.empty())
    return;

  if (!Events.empty() &&
      Events.back().Type == message::ReplayEntry::DataEvent)
    Events.back().Data.append(Data);
  else
  {
    message::ReplayEntry E;
    E.Type = message::ReplayEntry::DataEvent;
    E.Data = std::string{Data};
    Events.emplace_back(std::move(E));
  }

  DataSize += Data.size();
  if (DataSize > MaxRecordedBytes)
    trim();
}

void Recorder::recordResize(std::uint16_t Columns, std::uint16_t Rows)
{
  if (Events.empty())
  {
    // Nothing was printed with the old size, so it is not worth keeping.
    StartColumns = Columns;
    StartRows = Rows;
    return;
  }

  if (Events.back().Type == message::ReplayEntry::ResizeEvent)
  {
    Events.back().Columns = Columns;
    Events.back().Rows = Rows;
    return;
  }

  message::ReplayEntry E;
  E.Type = message::ReplayEntry::ResizeEvent;
  E.Columns = Columns;
  E.Rows = Rows;
  Events.emplace_back(std::move(E));
}

void Recorder::trim()
{
  REMUX_TRACE_LOG(LOG(trace) << "Trimming " << DataSize - MaxRecordedBytes
                             << " bytes of recorded output");
  while (DataSize > MaxRecordedBytes && !Events.empty())
  {
    message::ReplayEntry& Front = Events.front();
    if (Front.Type == message::ReplayEntry::ResizeEvent)
    {
      StartColumns = Front.Columns;
      StartRows = Front.Rows;
      Events.pop_front();
      continue;
    }

    std::size_t Excess = DataSize - MaxRecordedBytes;
    if (Front.Data.size() <= Excess)
    {
      DataSize -= Front.Data.size();
      Events.pop_front();
      continue;
    }

    Front.Data.erase(0, Excess);
    DataSize -= Excess;
  }

  // A resize left at the front applies before any kept output.
  while (!Events.empty() &&
         Events.front().Type == message::ReplayEntry::ResizeEvent)
  {
    StartColumns = Events.front().Columns;
    StartRows = Events.front().Rows;
    Events.pop_front();
  }
}

ReplayEvent Recorder::generateReplay() const
{
  ReplayEvent R;
  R.StartColumns = StartColumns;
  R.StartRows = StartRows;
  R.DataSize = DataSize;
  R.Events.assign(Events.begin(), Events.end());
  return R;
}

} // namespace remux::server

#undef LOG
