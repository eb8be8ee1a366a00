/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include "remux/system/Pty.hpp"

namespace remux::system::unix
{

/// \see pty(7)
/// \see openpty(3)
class Pty : public system::Pty
{
public:
  /// Creates a new PTY pair.
  Pty();

  [[nodiscard]] std::string read(std::size_t Bytes) override;
  std::size_t write(std::string_view Data) override;

  void setupParentSide() override;
  void setupChildrenSide() override;
  void setSize(unsigned short Rows, unsigned short Columns) override;
};

} // namespace remux::system::unix
