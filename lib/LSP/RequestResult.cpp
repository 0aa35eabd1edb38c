//===----------------------------------------------------------------------===//
//
// Part of the codeintel project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements request outcome naming and error conversion.
///
//===----------------------------------------------------------------------===//

#include "codeintel/LSP/RequestResult.h"

namespace codeintel::lsp
{

llvm::StringRef requestStatusName(const RequestStatus status)
{
    switch (status)
    {
    case RequestStatus::Completed:
        return "completed";
    case RequestStatus::WriteFailed:
        return "write-failed";
    case RequestStatus::MalformedResponse:
        return "malformed-response";
    case RequestStatus::ServerError:
        return "server-error";
    case RequestStatus::TimedOut:
        return "timed-out";
    case RequestStatus::SessionClosed:
        return "session-closed";
    }
    return "unknown";
}

ErrorKind errorKindForStatus(const RequestStatus status)
{
    switch (status)
    {
    case RequestStatus::WriteFailed:
        return ErrorKind::TransportWriteFailure;
    case RequestStatus::MalformedResponse:
        return ErrorKind::MalformedMessage;
    case RequestStatus::ServerError:
        return ErrorKind::ServerError;
    case RequestStatus::TimedOut:
        return ErrorKind::Timeout;
    case RequestStatus::Completed:
    case RequestStatus::SessionClosed:
        break;
    }
    return ErrorKind::SessionClosed;
}

llvm::Error toError(const RequestResult& result, const llvm::StringRef language, const llvm::StringRef method)
{
    return llvm::make_error<LspError>(errorKindForStatus(result.status),
                                      (language + " " + method + " failed: " + result.errorMessage).str(),
                                      result.serverCode);
}

}  // namespace codeintel::lsp
