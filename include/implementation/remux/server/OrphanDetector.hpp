/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <chrono>
#include <functional>
#include <optional>
#include <vector>

#include "remux/Timer.hpp"

namespace remux::server
{

/// Decides whether a persistent process is still owned by a live client.
///
/// A probe opens a barrier and asks the owner (through the caller) to reply.
/// The barrier opens either when the reply arrives or after \p AutoOpen
/// elapsed. When the barrier opens, the process is considered orphaned if
/// the most recent reply is older than \p ReplyThreshold.
///
/// Only one probe runs at a time. Callers arriving while a probe is in
/// flight are queued into the same slot and receive the same answer.
class OrphanDetector
{
public:
  static constexpr std::chrono::milliseconds ReplyThreshold{500};
  static constexpr std::chrono::milliseconds AutoOpen{4000};

  using Callback = std::function<void(bool IsOrphan)>;

  explicit OrphanDetector(TimerQueue& Timers);

  /// Queues \p CB to receive the answer of the current or a new probe.
  ///
  /// \returns true if a new probe was started, in which case the caller must
  /// ask the owner to reply.
  bool probe(Callback CB);

  /// Records that the owner replied, and opens the barrier if a probe is in
  /// flight.
  void reply();

  /// Answers every waiting caller with \p true and stops the probe. Used
  /// when the process is gone.
  void cancel();

  [[nodiscard]] bool isProbing() const noexcept { return !Waiting.empty(); }

private:
  TimerQueue& Timers;
  Timer Barrier;
  std::optional<TimerQueue::TimePoint> LastReply;
  std::vector<Callback> Waiting;

  void open();
  void answer(bool IsOrphan);
};

} // namespace remux::server
