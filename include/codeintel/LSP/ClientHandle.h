//===----------------------------------------------------------------------===//
//
// Part of the codeintel project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Typed request API over a shared language-server session.
///
/// Handles are cheap to copy; every copy refers to the same session. Parse
/// problems in server results degrade to empty results, while transport
/// failures surface as `LspError` values naming the language and cause.
///
//===----------------------------------------------------------------------===//
#ifndef CODEINTEL_LSP_CLIENT_HANDLE_H
#define CODEINTEL_LSP_CLIENT_HANDLE_H

#include "codeintel/LSP/Protocol.h"
#include "codeintel/LSP/ServerSession.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace codeintel::lsp
{

/// @brief Client view of one language-server session.
class ClientHandle final
{
public:
    /// @brief Wraps a session.
    /// @param[in] session Shared session.
    /// @param[in] workspaceRoot Absolute workspace directory used to resolve
    /// relative file paths.
    ClientHandle(std::shared_ptr<ServerSession> session, std::string workspaceRoot);

    /// @brief Requests completions at a position.
    /// @param[in] filePath Document path.
    /// @param[in] position Zero-based cursor position.
    /// @return Completion items; empty when the result has an unexpected shape.
    [[nodiscard]] llvm::Expected<std::vector<CompletionItem>> completion(llvm::StringRef filePath,
                                                                         Position        position) const;

    /// @brief Returns diagnostics for a document.
    ///
    /// Pulls with `textDocument/diagnostic` and falls back to diagnostics the
    /// server pushed when the pull fails or yields no list. Never fails.
    [[nodiscard]] std::vector<Diagnostic> diagnostics(llvm::StringRef filePath) const;

    /// @brief Requests definition locations.
    [[nodiscard]] llvm::Expected<std::vector<Location>> definition(llvm::StringRef filePath, Position position) const;

    /// @brief Requests hover information; `std::nullopt` when there is none.
    [[nodiscard]] llvm::Expected<std::optional<Hover>> hover(llvm::StringRef filePath, Position position) const;

    /// @brief Requests reference locations.
    [[nodiscard]] llvm::Expected<std::vector<Location>> references(llvm::StringRef filePath,
                                                                   Position        position,
                                                                   bool            includeDeclaration) const;

    /// @brief Requests a flattened document outline.
    [[nodiscard]] llvm::Expected<std::vector<SymbolInformation>> documentSymbols(llvm::StringRef filePath) const;

    /// @brief Diagnostics the server last pushed for a document, without a
    /// round trip.
    [[nodiscard]] std::vector<Diagnostic> pushedDiagnostics(llvm::StringRef filePath) const;

    [[nodiscard]] const std::string& language() const
    {
        return language_;
    }

    [[nodiscard]] const std::string& rootUri() const
    {
        return rootUri_;
    }

    /// @brief Returns whether both handles wrap the same session.
    [[nodiscard]] bool sharesSessionWith(const ClientHandle& other) const
    {
        return session_ == other.session_;
    }

    /// @brief Returns whether the session still accepts requests.
    [[nodiscard]] bool isAlive() const;

    /// @brief Converts a document path into the URI sent to the server.
    [[nodiscard]] std::string documentUri(llvm::StringRef filePath) const;

private:
    [[nodiscard]] llvm::Expected<llvm::json::Value> request(llvm::StringRef method, llvm::json::Value params) const;
    [[nodiscard]] llvm::json::Value positionParams(llvm::StringRef filePath, Position position) const;

    std::shared_ptr<ServerSession> session_;
    std::string                    workspaceRoot_;
    std::string                    language_;
    std::string                    rootUri_;
};

}  // namespace codeintel::lsp

#endif  // CODEINTEL_LSP_CLIENT_HANDLE_H
