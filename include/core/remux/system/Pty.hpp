/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <string>
#include <string_view>

#include "remux/adt/UniqueScalar.hpp"
#include "remux/system/Handle.hpp"

namespace remux::system
{

/// Wraps a low-level pseudoterminal (PTY) device pair. The master (control)
/// side is kept by the server, and the slave side becomes the controlling
/// terminal of a spawned process.
class Pty
{
protected:
  UniqueScalar<bool, false> IsMaster;
  UniqueScalar<bool, false> HungUp;
  Handle Master;
  Handle Slave;
  std::string Name;

  Pty() = default;

public:
  virtual ~Pty() = default;

  /// \returns whether the current instance is open on the master side.
  [[nodiscard]] bool isMaster() const noexcept { return IsMaster; }

  /// \returns the raw file descriptor for the side that is currently open.
  [[nodiscard]] Handle::Raw raw() const noexcept
  {
    return isMaster() ? Master.get() : Slave.get();
  }

  /// \returns the name of the PTY interface that was created (e.g. /dev/pts/2).
  [[nodiscard]] const std::string& name() const noexcept { return Name; }

  /// \returns whether the other side of the device closed.
  [[nodiscard]] bool hungUp() const noexcept { return HungUp; }

  /// Reads at most \p Bytes of output that the process on the other side
  /// produced. Does not block, and returns empty if no data is available.
  [[nodiscard]] virtual std::string read(std::size_t Bytes) = 0;

  /// Writes \p Data to the standard input of the process on the other side.
  ///
  /// \returns the number of bytes written.
  virtual std::size_t write(std::string_view Data) = 0;

  /// Configures the device from the owning parent's point of view: the slave
  /// side is closed, and the master is set non-blocking.
  virtual void setupParentSide() = 0;

  /// Configures the device to be the controlling terminal of the calling
  /// (child) process. The master side is closed.
  virtual void setupChildrenSide() = 0;

  /// Sets the size of the pseudoterminal device to the given dimensions.
  virtual void setSize(unsigned short Rows, unsigned short Columns) = 0;
};

} // namespace remux::system
