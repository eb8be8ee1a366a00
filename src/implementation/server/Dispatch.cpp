/* SPDX-License-Identifier: LGPL-3.0-only */
#include <system_error>

#include "remux/message/Message.hpp"
#include "remux/message/PascalString.hpp"
#include "remux/server/Errors.hpp"

#include "remux/server/Server.hpp"

#include "remux/Log.hpp"
#define LOG(SEVERITY) remux::log::SEVERITY("server/Dispatch")

namespace remux::server
{

void Server::setUpMainDispatch()
{
#define KIND(E) static_cast<std::uint16_t>(message::MessageKind::E)
#define DISPATCH(K, FUNCTION)                                                  \
  MainDispatch.try_emplace(KIND(K), &Server::FUNCTION);
#include "remux/server/Dispatch.ipp"
#undef KIND
}

namespace
{

void fail(message::Result& R, const char* Error, std::string Reason)
{
  R.Success = false;
  R.Error = Error;
  R.Reason = std::move(Reason);
}

/// Executes \p F and translates the errors of the process operations into
/// the failure of \p R.
template <typename Fn> void guarded(message::Result& R, Fn&& F)
{
  try
  {
    F();
  }
  catch (const UnknownProcess& UP)
  {
    LOG(debug) << UP.what();
    fail(R, UnknownProcess::ErrorName, UP.what());
  }
  catch (const AttachNotAllowed& ANA)
  {
    LOG(debug) << ANA.what();
    fail(R, AttachNotAllowed::ErrorName, ANA.what());
  }
}

} // namespace

#define HANDLER(NAME) REMUX_SERVER_HANDLER_SIGNATURE(Server::NAME)

HANDLER(requestCreateProcess)
{
  REMUX_SERVER_HANDLER_DECODE(request::CreateProcess);
  response::CreateProcess Resp;

  guarded(Resp.Result, [&] {
    Resp.ID = Server.Registry.create(Msg->Config,
                                     Msg->Cwd,
                                     Msg->Columns,
                                     Msg->Rows,
                                     Msg->Environment,
                                     Msg->ShouldPersist,
                                     Msg->WorkspaceID,
                                     Msg->WorkspaceName);
    Server.ProcessOwners[Resp.ID] = Conn.token();
    LOG(info) << "Management \"" << Conn.token() << "\" created process #"
              << Resp.ID;
  });

  Conn.send(Resp);
}

HANDLER(requestAttachToProcess)
{
  REMUX_SERVER_HANDLER_DECODE(request::AttachToProcess);
  response::AttachToProcess Resp;
  Resp.ID = Msg->ID;

  guarded(Resp.Result, [&] {
    Server.Registry.attach(Msg->ID);
    Server.ProcessOwners[Msg->ID] = Conn.token();
  });

  Conn.send(Resp);
}

HANDLER(requestDetachFromProcess)
{
  REMUX_SERVER_HANDLER_DECODE(request::DetachFromProcess);
  response::DetachFromProcess Resp;
  Resp.ID = Msg->ID;

  guarded(Resp.Result, [&] { Server.Registry.detach(Msg->ID); });

  Conn.send(Resp);
}

HANDLER(requestStartProcess)
{
  REMUX_SERVER_HANDLER_DECODE(request::StartProcess);
  response::StartProcess Resp;
  Resp.ID = Msg->ID;

  guarded(Resp.Result, [&] {
    std::optional<LaunchError> Error = Server.Registry.start(Msg->ID);
    if (!Error)
      return;

    LOG(warn) << "Process #" << Msg->ID
              << " failed to launch: " << Error->Message;
    fail(Resp.Result, LaunchError::ErrorName, Error->Message);
    Resp.LaunchErrorCode = Error->Code;
  });

  Conn.send(Resp);
}

HANDLER(requestShutdownProcess)
{
  REMUX_SERVER_HANDLER_DECODE(request::ShutdownProcess);
  response::ShutdownProcess Resp;
  Resp.ID = Msg->ID;

  guarded(Resp.Result,
          [&] { Server.Registry.shutdown(Msg->ID, Msg->Immediate); });

  Conn.send(Resp);
}

HANDLER(requestInput)
{
  REMUX_SERVER_HANDLER_DECODE(request::Input);
  response::Input Resp;
  Resp.ID = Msg->ID;

  guarded(Resp.Result, [&] { Server.Registry.input(Msg->ID, Msg->Data); });

  Conn.send(Resp);
}

HANDLER(requestResize)
{
  REMUX_SERVER_HANDLER_DECODE(request::Resize);
  response::Resize Resp;
  Resp.ID = Msg->ID;

  guarded(Resp.Result,
          [&] { Server.Registry.resize(Msg->ID, Msg->Columns, Msg->Rows); });

  Conn.send(Resp);
}

HANDLER(requestAcknowledgeDataEvent)
{
  REMUX_SERVER_HANDLER_DECODE(request::AcknowledgeDataEvent);
  response::AcknowledgeDataEvent Resp;
  Resp.ID = Msg->ID;

  guarded(Resp.Result, [&] {
    Server.Registry.acknowledgeDataEvent(Msg->ID, Msg->CharCount);
  });

  Conn.send(Resp);
}

HANDLER(requestGetInitialCwd)
{
  REMUX_SERVER_HANDLER_DECODE(request::GetInitialCwd);
  response::GetInitialCwd Resp;
  Resp.ID = Msg->ID;

  guarded(Resp.Result,
          [&] { Resp.Cwd = Server.Registry.getInitialCwd(Msg->ID); });

  Conn.send(Resp);
}

HANDLER(requestGetCwd)
{
  REMUX_SERVER_HANDLER_DECODE(request::GetCwd);
  response::GetCwd Resp;
  Resp.ID = Msg->ID;

  guarded(Resp.Result, [&] { Resp.Cwd = Server.Registry.getCwd(Msg->ID); });

  Conn.send(Resp);
}

HANDLER(requestGetLatency)
{
  REMUX_SERVER_HANDLER_DECODE(request::GetLatency);
  response::GetLatency Resp;
  Resp.ID = Msg->ID;

  guarded(Resp.Result,
          [&] { Resp.Latency = Server.Registry.getLatency(Msg->ID); });

  Conn.send(Resp);
}

HANDLER(requestSetLayout)
{
  REMUX_SERVER_HANDLER_DECODE(request::SetLayout);
  response::SetLayout Resp;
  Resp.WorkspaceID = Msg->WorkspaceID;

  Server.Registry.setLayout(Msg->WorkspaceID, std::move(Msg->Tabs));

  Conn.send(Resp);
}

HANDLER(requestGetLayout)
{
  REMUX_SERVER_HANDLER_DECODE(request::GetLayout);

  // The layout is only known once the orphan checks of its processes
  // concluded, by which time the requester might have been disposed.
  Server.Registry.getLayout(
    Msg->WorkspaceID,
    [&Server, Token = Conn.token(), WorkspaceID = Msg->WorkspaceID](
      std::optional<ProcessRegistry::ExpandedLayout> Tabs) {
      Connection* Requester = Server.Dispatcher.tryGetConnection(
        ConnectionType::Management, Token);
      if (!Requester || Requester->isDisposed())
      {
        LOG(debug) << "Management \"" << Token
                   << "\" is gone, layout reply dropped";
        return;
      }

      response::GetLayout Resp;
      Resp.WorkspaceID = WorkspaceID;
      Resp.Tabs = std::move(Tabs);
      try
      {
        if (!static_cast<ManagementConnection*>(Requester)->send(Resp))
          LOG(debug) << "Management \"" << Token
                     << "\" is offline, layout reply dropped";
      }
      catch (const system::BufferedChannel::OverflowError& BO)
      {
        LOG(warn) << "Management \"" << Token
                  << "\": sending the layout failed: " << BO.what();
        Requester->goOffline();
      }
      catch (const std::system_error& Err)
      {
        LOG(error) << "Management \"" << Token
                   << "\": sending the layout failed: " << Err.what();
      }
    });
}

HANDLER(requestOrphanQuestionReply)
{
  REMUX_SERVER_HANDLER_DECODE(request::OrphanQuestionReply);
  response::OrphanQuestionReply Resp;
  Resp.ID = Msg->ID;

  guarded(Resp.Result, [&] { Server.Registry.orphanQuestionReply(Msg->ID); });

  Conn.send(Resp);
}

HANDLER(requestReduceGraceTime)
{
  REMUX_SERVER_HANDLER_DECODE(request::ReduceGraceTime);
  response::ReduceGraceTime Resp;
  Resp.ID = Msg->ID;

  guarded(Resp.Result, [&] { Server.Registry.reduceGraceTime(Msg->ID); });

  Conn.send(Resp);
}

#undef HANDLER

} // namespace remux::server

#undef LOG
