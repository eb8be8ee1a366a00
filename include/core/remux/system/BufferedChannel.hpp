/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include "remux/system/Channel.hpp"

namespace remux::system
{

namespace detail
{

/// A ballooning buffer for read/write requests. Data read from the system but
/// not yet consumed, and data written by the client but not yet sent, is
/// stored here.
class BufferedChannelBuffer;

} // namespace detail

/// A special implementation of \p Channel that performs locally (userspace)
/// buffered reads and writes.
///
/// Low-level OS primitives do not guarantee that a read or write of \p N bytes
/// will transmit exactly \p N bytes. The buffers of this class keep the
/// excess read data until it is consumed, and the unsent written data until
/// the resource becomes writable again.
class BufferedChannel : public Channel
{
public:
  /// The size of low-level operations in the default implementation.
  static constexpr std::size_t BufferSize = 1ULL << 14; // 16 KiB
  /// The soft limit on the size of either buffer.
  static constexpr std::size_t BufferSizeMax = 1ULL << 24; // 16 MiB

  /// Thrown if either buffer of a \p BufferedChannel exceeds
  /// \p BufferSizeMax. The data that caused the overflow is \b NOT lost, it
  /// is stored in the buffer.
  class OverflowError : public std::runtime_error
  {
  public:
    OverflowError(const BufferedChannel& Channel,
                  std::size_t Size,
                  bool Read,
                  bool Write);

    [[nodiscard]] const BufferedChannel& channel() const noexcept
    {
      return *Chan;
    }
    [[nodiscard]] Handle::Raw fd() const noexcept { return Chan->raw(); }
    [[nodiscard]] bool readOverflow() const noexcept { return Read; }
    [[nodiscard]] bool writeOverflow() const noexcept { return Write; }

  private:
    const BufferedChannel* Chan;
    bool Read;
    bool Write;
  };

  BufferedChannel() = delete;
  ~BufferedChannel() override;

  /// Reads and consumes at \b maximum \p Bytes bytes of data from the channel.
  /// Data already in the buffer is served first. If the underlying resource
  /// returns more than requested, the tail end is saved to the buffer.
  ///
  /// \throws OverflowError if the read buffer exceeds \p BufferSizeMax.
  [[nodiscard]] std::string read(std::size_t Bytes);

  /// Writes the contents of \p Data into the channel. Previously unsent data
  /// is sent first, in order. Whatever the system did not accept is stored
  /// into the write buffer.
  ///
  /// \returns the number of bytes of \p Data written to the channel.
  ///
  /// \throws OverflowError if the write buffer exceeds \p BufferSizeMax.
  std::size_t write(std::string_view Data);

  /// Reads at \b least \p Bytes bytes (or until the resource has no more data)
  /// and places it unconditionally into the read buffer.
  ///
  /// \returns the number of bytes loaded.
  std::size_t load(std::size_t Bytes);

  /// Loads everything that is available from the resource and consumes the
  /// entire read buffer.
  [[nodiscard]] std::string readEntireBuffer();

  /// \returns at \b maximum \p Bytes of already buffered read data without
  /// consuming it.
  [[nodiscard]] std::string peekBuffered(std::size_t Bytes) const;

  /// Performs \p write() only on the contents of the already established
  /// buffer. Not all data might be actually written out.
  ///
  /// \returns the number of bytes successfully written.
  std::size_t flushWrites();

  /// Removes and returns the written but not yet sent data, without sending
  /// it.
  [[nodiscard]] std::string takeUnsentWrites();

  [[nodiscard]] bool hasBufferedRead() const noexcept;
  [[nodiscard]] bool hasBufferedWrite() const noexcept;
  /// \returns the number of bytes already read, but not yet consumed.
  [[nodiscard]] std::size_t readInBuffer() const noexcept;
  /// \returns the number of bytes already written but not yet flushed.
  [[nodiscard]] std::size_t writeInBuffer() const noexcept;

  /// \returns the size of single low-level read operations that are in some
  /// sense "optimal" for the underlying implementation.
  [[nodiscard]] virtual std::size_t optimalReadSize() const noexcept
  {
    return BufferSize;
  }
  /// \returns the size of single low-level write operations that are in some
  /// sense "optimal" for the underlying implementation.
  [[nodiscard]] virtual std::size_t optimalWriteSize() const noexcept
  {
    return BufferSize;
  }

protected:
  BufferedChannel(Handle FD, std::string Identifier, bool NeedsCleanup);
  BufferedChannel(BufferedChannel&&) noexcept;
  BufferedChannel& operator=(BufferedChannel&&) noexcept;

private:
  std::unique_ptr<detail::BufferedChannelBuffer> Read;
  std::unique_ptr<detail::BufferedChannelBuffer> Write;

  void checkOverflow() const;
};

} // namespace remux::system
