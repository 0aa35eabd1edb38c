//===----------------------------------------------------------------------===//
//
// Part of the codeintel project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Outcome envelope for one JSON-RPC request sent to a language server.
///
//===----------------------------------------------------------------------===//
#ifndef CODEINTEL_LSP_REQUEST_RESULT_H
#define CODEINTEL_LSP_REQUEST_RESULT_H

#include "codeintel/LSP/Error.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/JSON.h"

#include <cstdint>
#include <optional>
#include <string>

namespace codeintel::lsp
{

/// @brief Status outcome of a request.
enum class RequestStatus
{
    /// @brief The server answered with `result`.
    Completed,

    /// @brief The request could not be written to the server.
    WriteFailed,

    /// @brief The response carried neither `result` nor `error`.
    MalformedResponse,

    /// @brief The server answered with `error`.
    ServerError,

    /// @brief No response arrived before the deadline.
    TimedOut,

    /// @brief The session closed before a response arrived.
    SessionClosed,
};

/// @brief Result envelope for one request.
struct RequestResult final
{
    /// @brief Request outcome status.
    RequestStatus status{RequestStatus::SessionClosed};

    /// @brief `result` payload when completed, `error` payload on server error.
    llvm::json::Value value{nullptr};

    /// @brief Error message when not completed.
    std::string errorMessage;

    /// @brief JSON-RPC error code on server error.
    std::optional<std::int64_t> serverCode;

    [[nodiscard]] bool ok() const
    {
        return status == RequestStatus::Completed;
    }
};

/// @brief Returns a stable status name, e.g. `timed-out`.
[[nodiscard]] llvm::StringRef requestStatusName(RequestStatus status);

/// @brief Maps a failed request onto the session error taxonomy.
/// @param[in] status Non-completed status.
/// @return Matching error kind.
[[nodiscard]] ErrorKind errorKindForStatus(RequestStatus status);

/// @brief Converts a failed result into an `LspError`.
/// @param[in] result Non-completed result.
/// @param[in] language Session language, used in the message.
/// @param[in] method Request method, used in the message.
/// @return Failure value.
[[nodiscard]] llvm::Error toError(const RequestResult& result, llvm::StringRef language, llvm::StringRef method);

}  // namespace codeintel::lsp

#endif  // CODEINTEL_LSP_REQUEST_RESULT_H
