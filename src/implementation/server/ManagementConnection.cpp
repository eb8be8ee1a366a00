/* SPDX-License-Identifier: LGPL-3.0-only */
#include "remux/server/ManagementConnection.hpp"

#include "remux/Log.hpp"
#define LOG(SEVERITY) remux::log::SEVERITY("server/ManagementConnection")

namespace remux::server
{

ManagementConnection::ManagementConnection(std::string Token)
  : Connection(message::ConnectionType::Management, std::move(Token))
{}

void ManagementConnection::opened(std::string Buffer)
{
  Inbox = std::move(Buffer);
  processInbox();
}

void ManagementConnection::reconnected(std::string Buffer)
{
  // A partial message of the previous socket will never be completed.
  Inbox = std::move(Buffer);
  processInbox();
}

void ManagementConnection::readable(system::BufferedChannel& Channel)
{
  Inbox.append(Channel.readEntireBuffer());
  bool Failed = Channel.failed();
  processInbox();

  if (Failed && !isDisposed())
    goOffline();
}

void ManagementConnection::processInbox()
{
  while (!isDisposed())
  {
    std::optional<std::string> Message;
    try
    {
      Message = message::extractPascalString(Inbox);
    }
    catch (const message::MalformedStream& MS)
    {
      LOG(error) << '"' << token() << "\": " << MS.what();
      Inbox.clear();
      dispose("Malformed message stream");
      return;
    }
    if (!Message)
      return;

    REMUX_TRACE_LOG(LOG(data) << '"' << token() << "\": received "
                              << Message->size() << " bytes");
    MessageSignal.fire(*Message);
  }
}

} // namespace remux::server

#undef LOG
