/* SPDX-License-Identifier: LGPL-3.0-only */

#ifndef DISPATCH
/// Set for the given \p MessageKind the callback \p FUNCTION_NAME.
#define DISPATCH(KIND, FUNCTION_NAME)
#endif

DISPATCH(CreateProcessRequest, requestCreateProcess)
DISPATCH(AttachToProcessRequest, requestAttachToProcess)
DISPATCH(DetachFromProcessRequest, requestDetachFromProcess)
DISPATCH(StartProcessRequest, requestStartProcess)
DISPATCH(ShutdownProcessRequest, requestShutdownProcess)

DISPATCH(InputRequest, requestInput)
DISPATCH(ResizeRequest, requestResize)
DISPATCH(AcknowledgeDataEventRequest, requestAcknowledgeDataEvent)

DISPATCH(GetInitialCwdRequest, requestGetInitialCwd)
DISPATCH(GetCwdRequest, requestGetCwd)
DISPATCH(GetLatencyRequest, requestGetLatency)

DISPATCH(SetLayoutRequest, requestSetLayout)
DISPATCH(GetLayoutRequest, requestGetLayout)

DISPATCH(OrphanQuestionReplyRequest, requestOrphanQuestionReply)
DISPATCH(ReduceGraceTimeRequest, requestReduceGraceTime)

#undef DISPATCH
