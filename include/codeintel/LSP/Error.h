//===----------------------------------------------------------------------===//
//
// Part of the codeintel project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Error taxonomy for language-server sessions.
///
/// Construction paths (spawn, handshake, manager routing) return
/// `llvm::Expected`/`llvm::Error` carrying an `LspError`; typed client
/// operations convert per-request failures into the same error type.
///
//===----------------------------------------------------------------------===//
#ifndef CODEINTEL_LSP_ERROR_H
#define CODEINTEL_LSP_ERROR_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cstdint>
#include <optional>
#include <string>

namespace codeintel::lsp
{

/// @brief Failure categories surfaced by sessions and the manager.
enum class ErrorKind
{
    /// @brief The server process could not be started.
    SpawnFailure,

    /// @brief The `initialize` exchange failed.
    HandshakeFailure,

    /// @brief Writing to the server's stdin failed.
    TransportWriteFailure,

    /// @brief Unparseable JSON or a response without `result`/`error`.
    MalformedMessage,

    /// @brief The server answered with a JSON-RPC `error` payload.
    ServerError,

    /// @brief No response arrived before the request deadline.
    Timeout,

    /// @brief No server is configured for the file's extension.
    UnsupportedLanguage,

    /// @brief The session reached its terminal state.
    SessionClosed,
};

/// @brief Returns a stable lowercase name for an error kind.
/// @param[in] kind Error kind.
/// @return Kind name, e.g. `session-closed`.
[[nodiscard]] llvm::StringRef errorKindName(ErrorKind kind);

/// @brief LLVM error payload describing a language-server failure.
class LspError final : public llvm::ErrorInfo<LspError>
{
public:
    static char ID;

    LspError(ErrorKind kind, std::string message, std::optional<std::int64_t> serverCode = std::nullopt);

    void            log(llvm::raw_ostream& os) const override;
    std::error_code convertToErrorCode() const override;

    [[nodiscard]] ErrorKind kind() const
    {
        return kind_;
    }

    /// @brief Description without the kind prefix.
    [[nodiscard]] const std::string& text() const
    {
        return message_;
    }

    /// @brief JSON-RPC error code for `ServerError` failures.
    [[nodiscard]] const std::optional<std::int64_t>& serverCode() const
    {
        return serverCode_;
    }

private:
    ErrorKind                   kind_;
    std::string                 message_;
    std::optional<std::int64_t> serverCode_;
};

/// @brief Creates an `llvm::Error` holding an `LspError`.
/// @param[in] kind Error kind.
/// @param[in] message Human-readable description.
/// @return Failure value.
[[nodiscard]] llvm::Error makeLspError(ErrorKind kind, const llvm::Twine& message);

/// @brief Consumes `error` and returns its `LspError` kind.
/// @param[in] error Error to consume.
/// @return Kind when `error` holds an `LspError`, otherwise `std::nullopt`.
[[nodiscard]] std::optional<ErrorKind> takeErrorKind(llvm::Error error);

}  // namespace codeintel::lsp

#endif  // CODEINTEL_LSP_ERROR_H
