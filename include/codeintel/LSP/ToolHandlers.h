//===----------------------------------------------------------------------===//
//
// Part of the codeintel project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Agent-facing code-intelligence tools.
///
/// Each handler takes the tool-call argument object, routes the file through
/// the server manager, and renders the result as pretty-printed JSON. Handlers
/// never fail outright: problems are reported as text with `success` unset.
///
//===----------------------------------------------------------------------===//
#ifndef CODEINTEL_LSP_TOOL_HANDLERS_H
#define CODEINTEL_LSP_TOOL_HANDLERS_H

#include "codeintel/LSP/ServerManager.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/JSON.h"

#include <string>

namespace codeintel::lsp
{

/// @brief Rendered tool result.
struct ToolOutput final
{
    /// @brief JSON document on success, human-readable text on failure.
    std::string content;

    /// @brief Whether the tool produced a result.
    bool success{false};
};

/// @brief `code.complete`: `{file_path, line, character, context?}`.
[[nodiscard]] ToolOutput handleCodeComplete(const llvm::json::Value& args, ServerManager& manager);

/// @brief `code.diagnostics`: `{file_path, line_range?: [start, end]}`.
[[nodiscard]] ToolOutput handleCodeDiagnostics(const llvm::json::Value& args, ServerManager& manager);

/// @brief `code.definition`: `{file_path, line, character, symbol?}`.
[[nodiscard]] ToolOutput handleCodeDefinition(const llvm::json::Value& args, ServerManager& manager);

/// @brief `code.references`: `{file_path, line, character, include_declaration?}`.
[[nodiscard]] ToolOutput handleCodeReferences(const llvm::json::Value& args, ServerManager& manager);

/// @brief `code.hover`: `{file_path, line, character}`.
[[nodiscard]] ToolOutput handleCodeHover(const llvm::json::Value& args, ServerManager& manager);

/// @brief `code.symbols`: `{path, scope: "file" | "workspace", query?}`.
[[nodiscard]] ToolOutput handleCodeSymbols(const llvm::json::Value& args, ServerManager& manager);

/// @brief Routes a tool call by name.
/// @param[in] name Tool name, e.g. `code.complete`.
/// @param[in] args Tool-call arguments.
/// @param[in] manager Server manager.
/// @return Tool output; unknown names yield a failure.
[[nodiscard]] ToolOutput dispatchToolCall(llvm::StringRef name, const llvm::json::Value& args, ServerManager& manager);

/// @brief Names accepted by `dispatchToolCall`.
[[nodiscard]] llvm::ArrayRef<llvm::StringRef> toolNames();

}  // namespace codeintel::lsp

#endif  // CODEINTEL_LSP_TOOL_HANDLERS_H
