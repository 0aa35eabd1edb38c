//===----------------------------------------------------------------------===//
//
// Part of the codeintel project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the language-server error payload.
///
//===----------------------------------------------------------------------===//

#include "codeintel/LSP/Error.h"

#include "llvm/Support/raw_ostream.h"

#include <utility>

namespace codeintel::lsp
{

char LspError::ID = 0;

llvm::StringRef errorKindName(const ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::SpawnFailure:
        return "spawn-failure";
    case ErrorKind::HandshakeFailure:
        return "handshake-failure";
    case ErrorKind::TransportWriteFailure:
        return "transport-write-failure";
    case ErrorKind::MalformedMessage:
        return "malformed-message";
    case ErrorKind::ServerError:
        return "server-error";
    case ErrorKind::Timeout:
        return "timeout";
    case ErrorKind::UnsupportedLanguage:
        return "unsupported-language";
    case ErrorKind::SessionClosed:
        return "session-closed";
    }
    return "unknown";
}

LspError::LspError(const ErrorKind kind, std::string message, std::optional<std::int64_t> serverCode)
    : kind_(kind)
    , message_(std::move(message))
    , serverCode_(serverCode)
{
}

void LspError::log(llvm::raw_ostream& os) const
{
    os << message_;
}

std::error_code LspError::convertToErrorCode() const
{
    return llvm::inconvertibleErrorCode();
}

llvm::Error makeLspError(const ErrorKind kind, const llvm::Twine& message)
{
    return llvm::make_error<LspError>(kind, message.str());
}

std::optional<ErrorKind> takeErrorKind(llvm::Error error)
{
    std::optional<ErrorKind> kind;
    llvm::handleAllErrors(
        std::move(error),
        [&kind](const LspError& lspError) { kind = lspError.kind(); },
        [](const llvm::ErrorInfoBase&) {});
    return kind;
}

}  // namespace codeintel::lsp
