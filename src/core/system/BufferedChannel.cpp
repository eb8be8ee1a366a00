/* SPDX-License-Identifier: LGPL-3.0-only */
#include <algorithm>
#include <sstream>
#include <system_error>

#include "remux/system/BufferedChannel.hpp"

#include "remux/Log.hpp"
#define LOG(SEVERITY) remux::log::SEVERITY("system/BufferedChannel")
#define LOG_WITH_IDENTIFIER(SEVERITY) LOG(SEVERITY) << identifier() << ": "

namespace remux::system
{

namespace detail
{

class BufferedChannelBuffer
{
public:
  [[nodiscard]] std::size_t size() const noexcept { return Data.size(); }
  [[nodiscard]] bool empty() const noexcept { return Data.empty(); }

  void putBack(std::string_view Chunk) { Data.append(Chunk); }

  [[nodiscard]] std::string peekFront(std::size_t N) const
  {
    return Data.substr(0, std::min(N, Data.size()));
  }

  [[nodiscard]] std::string takeFront(std::size_t N)
  {
    std::string Front = peekFront(N);
    dropFront(Front.size());
    return Front;
  }

  void dropFront(std::size_t N) { Data.erase(0, std::min(N, Data.size())); }

  [[nodiscard]] std::string takeAll() noexcept
  {
    std::string All;
    std::swap(All, Data);
    return All;
  }

private:
  std::string Data;
};

} // namespace detail

namespace
{

std::string craftOverflowMessage(const std::string& Identifier,
                                 std::size_t Size)
{
  std::ostringstream B;
  B << "Channel '" << Identifier << "' buffer overflow maximum size of "
    << BufferedChannel::BufferSizeMax << " <= actual size " << Size;
  return B.str();
}

void throwIfFailed(bool Failed)
{
  if (Failed)
    throw std::system_error{std::make_error_code(std::errc::io_error),
                            "Channel has failed."};
}

} // namespace

BufferedChannel::OverflowError::OverflowError(const BufferedChannel& Channel,
                                              std::size_t Size,
                                              bool Read,
                                              bool Write)
  : std::runtime_error(craftOverflowMessage(Channel.identifier(), Size)),
    Chan(&Channel), Read(Read), Write(Write)
{}

BufferedChannel::BufferedChannel(Handle FD,
                                 std::string Identifier,
                                 bool NeedsCleanup)
  : Channel(std::move(FD), std::move(Identifier), NeedsCleanup),
    Read(std::make_unique<detail::BufferedChannelBuffer>()),
    Write(std::make_unique<detail::BufferedChannelBuffer>())
{}

BufferedChannel::BufferedChannel(BufferedChannel&&) noexcept = default;
BufferedChannel&
BufferedChannel::operator=(BufferedChannel&&) noexcept = default;
BufferedChannel::~BufferedChannel() = default;

bool BufferedChannel::hasBufferedRead() const noexcept
{
  return Read && !Read->empty();
}
bool BufferedChannel::hasBufferedWrite() const noexcept
{
  return Write && !Write->empty();
}
std::size_t BufferedChannel::readInBuffer() const noexcept
{
  return Read ? Read->size() : 0;
}
std::size_t BufferedChannel::writeInBuffer() const noexcept
{
  return Write ? Write->size() : 0;
}

void BufferedChannel::checkOverflow() const
{
  if (readInBuffer() > BufferSizeMax)
    throw OverflowError{*this, readInBuffer(), true, false};
  if (writeInBuffer() > BufferSizeMax)
    throw OverflowError{*this, writeInBuffer(), false, true};
}

std::string BufferedChannel::read(std::size_t Bytes)
{
  throwIfFailed(failed() && !hasBufferedRead());

  std::string Return;
  Return.reserve(Bytes);

  REMUX_TRACE_LOG(LOG_WITH_IDENTIFIER(trace) << "read(" << Bytes << ")...");
  if (hasBufferedRead())
  {
    Return = Read->takeFront(Bytes);
    REMUX_TRACE_LOG(LOG_WITH_IDENTIFIER(trace)
                    << "read() <- " << Return.size() << " bytes buffer");
    Bytes -= Return.size();
  }
  if (!Bytes || failed())
    return Return;

  const std::size_t ChunkSize = optimalReadSize();
  bool ContinueReading = true;
  while (ContinueReading && Bytes > 0)
  {
    std::string Chunk = readImpl(ChunkSize, ContinueReading);
    if (Chunk.empty())
      break;

    const std::size_t ReadSize = Chunk.size();
    if (ReadSize < ChunkSize)
      // Assume no more data is immediately available.
      ContinueReading = false;

    const std::size_t BytesFromRead = std::min(Bytes, ReadSize);
    Return.append(Chunk, 0, BytesFromRead);
    if (ReadSize > BytesFromRead)
    {
      // The tail of the chunk is already consumed from the system resource!
      REMUX_TRACE_LOG(LOG_WITH_IDENTIFIER(trace)
                      << "(read) Buffering " << ReadSize - BytesFromRead
                      << " bytes");
      Read->putBack(std::string_view{Chunk}.substr(BytesFromRead));
      ContinueReading = false;
    }

    Bytes -= BytesFromRead;
  }

  REMUX_TRACE_LOG(LOG_WITH_IDENTIFIER(trace) << "read() -> " << Return.size());
  checkOverflow();
  return Return;
}

std::size_t BufferedChannel::write(std::string_view Data)
{
  throwIfFailed(failed());

  REMUX_TRACE_LOG(LOG_WITH_IDENTIFIER(trace)
                  << "write(" << Data.size() << ")...");
  if (const std::size_t InWriteBuffer = writeInBuffer(),
      BufferSent = flushWrites();
      BufferSent < InWriteBuffer)
  {
    // Sending Data now would be an out-of-order send.
    REMUX_TRACE_LOG(LOG_WITH_IDENTIFIER(trace)
                    << "(write) Buffering " << Data.size() << " bytes");
    Write->putBack(Data);
    checkOverflow();
    return 0;
  }

  const std::size_t ChunkSize = optimalWriteSize();
  std::size_t BytesSent = 0;
  bool ContinueWriting = true;
  while (ContinueWriting && !Data.empty())
  {
    std::string_view Chunk = Data.substr(0, std::min(ChunkSize, Data.size()));
    const std::size_t ChunkWrittenSize = writeImpl(Chunk, ContinueWriting);
    if (ChunkWrittenSize < Chunk.size())
      ContinueWriting = false;

    BytesSent += ChunkWrittenSize;
    Data.remove_prefix(ChunkWrittenSize);
  }

  if (!Data.empty())
  {
    REMUX_TRACE_LOG(LOG_WITH_IDENTIFIER(trace)
                    << "(write) Buffering " << Data.size() << " bytes");
    Write->putBack(Data);
  }

  REMUX_TRACE_LOG(LOG_WITH_IDENTIFIER(trace) << "write() -> " << BytesSent);
  checkOverflow();
  return BytesSent;
}

std::size_t BufferedChannel::load(std::size_t Bytes)
{
  throwIfFailed(failed());

  REMUX_TRACE_LOG(LOG_WITH_IDENTIFIER(trace) << "load(" << Bytes << ")...");
  const std::size_t ChunkSize = optimalReadSize();
  bool ContinueReading = true;
  std::size_t ReadBytes = 0;
  while (ContinueReading && Bytes > 0)
  {
    std::string Chunk = readImpl(ChunkSize, ContinueReading);
    if (Chunk.empty())
      break;

    ReadBytes += Chunk.size();
    Bytes -= std::min(Chunk.size(), Bytes);
    if (Chunk.size() < ChunkSize)
      ContinueReading = false;
    Read->putBack(Chunk);
  }

  REMUX_TRACE_LOG(LOG_WITH_IDENTIFIER(trace) << "load() -> " << ReadBytes);
  checkOverflow();
  return ReadBytes;
}

std::string BufferedChannel::readEntireBuffer()
{
  // Load until the resource runs dry.
  std::size_t Loaded = optimalReadSize();
  while (Loaded == optimalReadSize() && !failed())
    Loaded = load(optimalReadSize());

  return Read->takeAll();
}

std::string BufferedChannel::peekBuffered(std::size_t Bytes) const
{
  return Read->peekFront(Bytes);
}

std::size_t BufferedChannel::flushWrites()
{
  throwIfFailed(failed());
  if (!hasBufferedWrite())
    return 0;

  REMUX_TRACE_LOG(LOG_WITH_IDENTIFIER(trace)
                  << "flush(" << writeInBuffer() << ")...");
  const std::size_t ChunkSize = optimalWriteSize();
  std::size_t BytesSent = 0;
  bool ContinueWriting = true;
  while (ContinueWriting && hasBufferedWrite())
  {
    std::string Chunk = Write->peekFront(ChunkSize);
    const std::size_t ChunkBytesSent = writeImpl(Chunk, ContinueWriting);
    BytesSent += ChunkBytesSent;
    if (ChunkBytesSent < Chunk.size())
      ContinueWriting = false;

    // Only the actually sent bytes may be removed from the buffer!
    Write->dropFront(ChunkBytesSent);
  }
  REMUX_TRACE_LOG(LOG_WITH_IDENTIFIER(trace) << "flush() -> " << BytesSent);
  return BytesSent;
}

std::string BufferedChannel::takeUnsentWrites() { return Write->takeAll(); }

} // namespace remux::system

#undef LOG_WITH_IDENTIFIER
#undef LOG
