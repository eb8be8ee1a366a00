/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <string>
#include <string_view>

#include "remux/adt/UniqueScalar.hpp"
#include "remux/system/Handle.hpp"

namespace remux::system
{

/// Wraps a system resource used for communication. This is a very low-level
/// interface encapsulating the necessary system calls and transmission logic.
class Channel
{
public:
  Channel() = delete;

  /// \returns the raw, unmanaged file descriptor for the underlying resource.
  [[nodiscard]] Handle::Raw raw() const noexcept { return FD.get(); }

  /// Steal the \p Handle from the current communication channel, preventing
  /// the cleanup of the resource.
  [[nodiscard]] Handle release() &&;

  /// \returns the user-friendly identifier of the communication channel. This
  /// might be empty, a transient label, or sometimes a path on the filesystem.
  [[nodiscard]] const std::string& identifier() const noexcept
  {
    return Identifier;
  }

  /// \returns whether an operation failed and indicated that the underlying
  /// resource had broken, e.g. the peer disconnected.
  [[nodiscard]] bool failed() const noexcept { return !FD.has() || Failed; }

  /// Read at maximum \p Bytes bytes of data from the communication channel.
  ///
  /// \warning Depending on the state of the OS primitive this \b MAY block,
  /// or return less than \p Bytes of data.
  [[nodiscard]] std::string read(std::size_t Bytes);

  /// Write the contents of \p Buffer into the communication channel.
  ///
  /// \returns the number of bytes written, as reported by the operating system.
  std::size_t write(std::string_view Buffer);

  virtual ~Channel() noexcept = default;

protected:
  Channel(Handle FD, std::string Identifier, bool NeedsCleanup);
  Channel(Channel&&) noexcept = default;
  Channel& operator=(Channel&&) noexcept = default;

  /// Implemented by subclasses to actually perform reading from the system.
  ///
  /// \param Continue Set to whether more data might be immediately available.
  virtual std::string readImpl(std::size_t Bytes, bool& Continue) = 0;
  /// Implemented by subclasses to actually perform writing to the system.
  ///
  /// \param Continue Set to whether more data might be immediately writable.
  virtual std::size_t writeImpl(std::string_view Buffer, bool& Continue) = 0;

  [[nodiscard]] bool needsCleanup() const noexcept { return EntityCleanup; }
  void setFailed() noexcept { Failed = true; }

  Handle FD;
  std::string Identifier;

private:
  UniqueScalar<bool, false> EntityCleanup;
  UniqueScalar<bool, false> Failed;
};

} // namespace remux::system
