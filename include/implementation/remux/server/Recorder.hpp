/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <cstdint>
#include <deque>
#include <string_view>
#include <vector>

#include "remux/message/Message.hpp"

namespace remux::server
{

/// The result of a replay request: everything the \p Recorder kept, in
/// order, together with the terminal geometry the first event applies to.
struct ReplayEvent
{
  std::vector<message::ReplayEntry> Events;
  std::uint16_t StartColumns{};
  std::uint16_t StartRows{};
  /// The number of output bytes in \p Events.
  std::size_t DataSize{};
};

/// Keeps the most recent output of a terminal, interleaved with the resizes
/// that happened in between, so a reattaching client can redraw the screen.
///
/// Recording is bounded by \p MaxRecordedBytes of output data. Once that is
/// exceeded, the oldest events are dropped. A dropped resize is folded into
/// the starting dimensions, and an output chunk straddling the boundary is
/// trimmed from its front.
class Recorder
{
public:
  static constexpr std::size_t MaxRecordedBytes = 1ULL << 20; // 1 MiB

  Recorder(std::uint16_t Columns, std::uint16_t Rows);

  void recordData(std::string_view Data);
  void recordResize(std::uint16_t Columns, std::uint16_t Rows);

  [[nodiscard]] ReplayEvent generateReplay() const;

  /// \returns the number of output bytes currently kept.
  [[nodiscard]] std::size_t size() const noexcept { return DataSize; }
  [[nodiscard]] std::size_t eventCount() const noexcept
  {
    return Events.size();
  }
  [[nodiscard]] std::uint16_t startColumns() const noexcept
  {
    return StartColumns;
  }
  [[nodiscard]] std::uint16_t startRows() const noexcept { return StartRows; }

private:
  std::uint16_t StartColumns;
  std::uint16_t StartRows;
  std::deque<message::ReplayEntry> Events;
  std::size_t DataSize = 0;

  void trim();
};

} // namespace remux::server
