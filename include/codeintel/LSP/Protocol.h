//===----------------------------------------------------------------------===//
//
// Part of the codeintel project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Language Server Protocol data model used by the client.
///
/// Parsers are lenient in the way code-intelligence results need to be: a
/// value of the wrong shape yields `std::nullopt` instead of an error, and
/// list parsers drop nothing silently (one bad element fails the list).
///
//===----------------------------------------------------------------------===//
#ifndef CODEINTEL_LSP_PROTOCOL_H
#define CODEINTEL_LSP_PROTOCOL_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/JSON.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace codeintel::lsp
{

/// @brief Zero-based document coordinate.
struct Position final
{
    /// @brief Zero-based line.
    std::uint32_t line{0};

    /// @brief Zero-based UTF-16 code unit offset within the line.
    std::uint32_t character{0};
};

/// @brief Half-open document range.
struct Range final
{
    /// @brief Range start.
    Position start;

    /// @brief Range end.
    Position end;
};

/// @brief LSP diagnostic severity.
enum class DiagnosticSeverity : std::uint8_t
{
    Error       = 1,
    Warning     = 2,
    Information = 3,
    Hint        = 4,
};

/// @brief One diagnostic reported by a language server.
struct Diagnostic final
{
    /// @brief Affected range.
    Range range;

    /// @brief Severity; servers may omit it.
    std::optional<DiagnosticSeverity> severity;

    /// @brief Opaque diagnostic code (string or number).
    std::optional<llvm::json::Value> code;

    /// @brief Producer, e.g. `pyflakes`.
    std::optional<std::string> source;

    /// @brief Human-readable message.
    std::string message;
};

/// @brief LSP completion item kind.
enum class CompletionItemKind : std::uint8_t
{
    Text          = 1,
    Method        = 2,
    Function      = 3,
    Constructor   = 4,
    Field         = 5,
    Variable      = 6,
    Class         = 7,
    Interface     = 8,
    Module        = 9,
    Property      = 10,
    Unit          = 11,
    Value         = 12,
    Enum          = 13,
    Keyword       = 14,
    Snippet       = 15,
    Color         = 16,
    File          = 17,
    Reference     = 18,
    Folder        = 19,
    EnumMember    = 20,
    Constant      = 21,
    Struct        = 22,
    Event         = 23,
    Operator      = 24,
    TypeParameter = 25,
};

/// @brief One completion candidate.
struct CompletionItem final
{
    /// @brief Display label.
    std::string label;

    /// @brief Item kind.
    std::optional<CompletionItemKind> kind;

    /// @brief Additional detail such as a signature.
    std::optional<std::string> detail;

    /// @brief Documentation flattened to text.
    std::optional<std::string> documentation;

    /// @brief Text to insert when different from the label.
    std::optional<std::string> insertText;
};

/// @brief File/range reference.
struct Location final
{
    /// @brief Document URI.
    std::string uri;

    /// @brief Range within the document.
    Range range;
};

/// @brief Hover information at a position.
struct Hover final
{
    /// @brief Hover contents flattened to text.
    std::string contents;

    /// @brief Range the hover applies to.
    std::optional<Range> range;
};

/// @brief Flattened document symbol.
struct SymbolInformation final
{
    /// @brief Symbol name.
    std::string name;

    /// @brief LSP `SymbolKind` value.
    std::uint32_t kind{0};

    /// @brief Document URI.
    std::string uri;

    /// @brief Symbol range.
    Range range;

    /// @brief Enclosing symbol name.
    std::optional<std::string> containerName;
};

/// @brief Serializes a position.
[[nodiscard]] llvm::json::Value toJSON(const Position& position);

/// @brief Serializes a range.
[[nodiscard]] llvm::json::Value toJSON(const Range& range);

[[nodiscard]] std::optional<Position>           parsePosition(const llvm::json::Value& value);
[[nodiscard]] std::optional<Range>              parseRange(const llvm::json::Value& value);
[[nodiscard]] std::optional<Diagnostic>         parseDiagnostic(const llvm::json::Value& value);
[[nodiscard]] std::optional<CompletionItem>     parseCompletionItem(const llvm::json::Value& value);
[[nodiscard]] std::optional<Location>           parseLocation(const llvm::json::Value& value);

/// @brief Parses a `LocationLink`, normalized to its target selection range.
[[nodiscard]] std::optional<Location> parseLocationLink(const llvm::json::Value& value);

/// @brief Parses a JSON array into a list, failing when any element fails.
[[nodiscard]] std::optional<std::vector<Diagnostic>>     parseDiagnosticList(const llvm::json::Value& value);
[[nodiscard]] std::optional<std::vector<CompletionItem>> parseCompletionItemList(const llvm::json::Value& value);
[[nodiscard]] std::optional<std::vector<Location>>       parseLocationList(const llvm::json::Value& value);

/// @brief Parses a hover result; `null` and unknown shapes yield `std::nullopt`.
[[nodiscard]] std::optional<Hover> parseHover(const llvm::json::Value& value);

/// @brief Parses `DocumentSymbol[]` or `SymbolInformation[]` into a flat list.
/// @param[in] value Raw `textDocument/documentSymbol` result.
/// @param[in] documentUri URI used for hierarchical symbols, which carry none.
/// @return Flattened symbols in pre-order, or `std::nullopt` on shape mismatch.
[[nodiscard]] std::optional<std::vector<SymbolInformation>> parseDocumentSymbols(const llvm::json::Value& value,
                                                                                 llvm::StringRef documentUri);

/// @brief Flattens `string | MarkupContent | MarkedString | MarkedString[]`.
/// @param[in] value Raw documentation or hover contents.
/// @return Text, or `std::nullopt` for unknown shapes.
[[nodiscard]] std::optional<std::string> flattenMarkup(const llvm::json::Value& value);

/// @brief Converts an absolute file path into a percent-encoded `file://` URI.
/// @param[in] path Absolute path.
/// @return URI text.
[[nodiscard]] std::string pathToUri(llvm::StringRef path);

/// @brief Converts a `file://` URI into a path; other URIs are returned as-is.
/// @param[in] uri URI text.
/// @return Decoded path.
[[nodiscard]] std::string uriToPath(llvm::StringRef uri);

}  // namespace codeintel::lsp

#endif  // CODEINTEL_LSP_PROTOCOL_H
