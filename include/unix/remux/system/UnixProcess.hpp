/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include "remux/system/Process.hpp"

namespace remux::system::unix
{

/// A child process observed through \p waitpid(2).
class Process : public system::Process
{
public:
  bool reapIfDead() override;
  void wait() override;
  void signal(int Signal) override;
};

} // namespace remux::system::unix
