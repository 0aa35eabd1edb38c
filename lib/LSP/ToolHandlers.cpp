//===----------------------------------------------------------------------===//
//
// Part of the codeintel project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements code-intelligence tool handlers and their JSON rendering.
///
//===----------------------------------------------------------------------===//

#include "codeintel/LSP/ToolHandlers.h"

#include "codeintel/LSP/Protocol.h"
#include "codeintel/Support/Log.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"

#include <array>
#include <limits>
#include <optional>
#include <system_error>
#include <utility>

namespace codeintel::lsp
{
namespace
{

constexpr llvm::StringRef ToolsComponent = "tools";

struct PositionArgs final
{
    std::string filePath;
    Position    position;
};

llvm::Error argumentError(const llvm::Twine& message)
{
    return llvm::createStringError(std::make_error_code(std::errc::invalid_argument), message);
}

llvm::Expected<const llvm::json::Object*> requireObject(const llvm::json::Value& args)
{
    const auto* object = args.getAsObject();
    if (!object)
    {
        return argumentError("arguments must be a JSON object");
    }
    return object;
}

llvm::Expected<std::string> requireString(const llvm::json::Object& args, llvm::StringRef key)
{
    const auto text = args.getString(key);
    if (!text || text->empty())
    {
        return argumentError("missing string field '" + key + "'");
    }
    return text->str();
}

llvm::Expected<std::uint32_t> requireUnsigned(const llvm::json::Object& args, llvm::StringRef key)
{
    const auto value = args.getInteger(key);
    if (!value)
    {
        return argumentError("missing integer field '" + key + "'");
    }
    if (*value < 0 || *value > std::numeric_limits<std::uint32_t>::max())
    {
        return argumentError("field '" + key + "' is out of range");
    }
    return static_cast<std::uint32_t>(*value);
}

llvm::Expected<PositionArgs> parsePositionArgs(const llvm::json::Value& args)
{
    auto object = requireObject(args);
    if (!object)
    {
        return object.takeError();
    }
    auto filePath = requireString(**object, "file_path");
    if (!filePath)
    {
        return filePath.takeError();
    }
    auto line = requireUnsigned(**object, "line");
    if (!line)
    {
        return line.takeError();
    }
    auto character = requireUnsigned(**object, "character");
    if (!character)
    {
        return character.takeError();
    }
    return PositionArgs{std::move(*filePath), Position{*line, *character}};
}

using LineFilter = std::optional<std::pair<std::int64_t, std::int64_t>>;

/// Optional inclusive `[start_line, end_line]` filter.
llvm::Expected<LineFilter> parseLineRange(const llvm::json::Object& args)
{
    const llvm::json::Value* value = args.get("line_range");
    if (!value || value->kind() == llvm::json::Value::Null)
    {
        return LineFilter{};
    }
    const auto* bounds = value->getAsArray();
    if (!bounds || bounds->size() != 2U)
    {
        return argumentError("'line_range' must be [start_line, end_line]");
    }
    const auto start = (*bounds)[0].getAsInteger();
    const auto end   = (*bounds)[1].getAsInteger();
    if (!start || !end || *start < 0 || *end < *start)
    {
        return argumentError("'line_range' must hold two non-negative lines with start <= end");
    }
    return LineFilter{std::make_pair(*start, *end)};
}

ToolOutput succeed(const llvm::json::Value& document)
{
    return ToolOutput{llvm::formatv("{0:2}", document).str(), true};
}

ToolOutput fail(std::string message)
{
    return ToolOutput{std::move(message), false};
}

ToolOutput invalidArguments(llvm::StringRef tool, llvm::Error error)
{
    return fail(("Invalid arguments for " + tool + ": " + llvm::toString(std::move(error))).str());
}

ToolOutput operationFailed(llvm::StringRef operation, llvm::Error error)
{
    std::string cause = llvm::toString(std::move(error));
    logWarning(ToolsComponent, operation + " failed: " + cause);
    return fail((operation + " failed: " + cause).str());
}

/// Resolves a client, or renders the connectivity failure.
std::optional<ClientHandle> connect(ServerManager& manager, llvm::StringRef filePath, ToolOutput& failure)
{
    auto handle = manager.getOrCreate(filePath);
    if (!handle)
    {
        const std::string language = manager.languageForFile(filePath).value_or("unknown");
        failure = fail("No LSP server available for " + language +
                       " files. Error: " + llvm::toString(handle.takeError()));
        return std::nullopt;
    }
    return std::move(*handle);
}

llvm::json::Value optionalText(const std::optional<std::string>& text)
{
    return text ? llvm::json::Value(*text) : llvm::json::Value(nullptr);
}

llvm::json::Value lineRange(const Range& range)
{
    return llvm::json::Object{
        {"start_line", static_cast<std::int64_t>(range.start.line)},
        {"start_character", static_cast<std::int64_t>(range.start.character)},
        {"end_line", static_cast<std::int64_t>(range.end.line)},
        {"end_character", static_cast<std::int64_t>(range.end.character)},
    };
}

llvm::json::Value diagnosticCode(const std::optional<llvm::json::Value>& code)
{
    if (!code)
    {
        return nullptr;
    }
    if (const auto text = code->getAsString())
    {
        return text->str();
    }
    if (const auto number = code->getAsInteger())
    {
        return std::to_string(*number);
    }
    return nullptr;
}

std::string absolutePath(const ServerManager& manager, llvm::StringRef path)
{
    if (llvm::sys::path::is_absolute(path))
    {
        return path.str();
    }
    llvm::SmallString<256> absolute(manager.workspaceRoot());
    llvm::sys::path::append(absolute, path);
    llvm::sys::path::remove_dots(absolute, /*remove_dot_dot=*/true);
    return absolute.str().str();
}

/// Trimmed text of a zero-based line, when the file is readable.
llvm::json::Value sourcePreview(llvm::StringRef filePath, const std::uint32_t line)
{
    auto buffer = llvm::MemoryBuffer::getFile(filePath);
    if (!buffer)
    {
        return nullptr;
    }
    llvm::StringRef rest = (*buffer)->getBuffer();
    for (std::uint32_t current = 0; current < line; ++current)
    {
        const std::size_t newline = rest.find('\n');
        if (newline == llvm::StringRef::npos)
        {
            return nullptr;
        }
        rest = rest.drop_front(newline + 1U);
    }
    return rest.take_until([](const char ch) { return ch == '\n'; }).trim().str();
}

llvm::json::Value locationItem(const Location& location, const bool withPreview)
{
    const std::string path = uriToPath(location.uri);
    return llvm::json::Object{
        {"file_path", path},
        {"range", lineRange(location.range)},
        {"preview", withPreview ? sourcePreview(path, location.range.start.line) : llvm::json::Value(nullptr)},
    };
}

}  // namespace

ToolOutput handleCodeComplete(const llvm::json::Value& args, ServerManager& manager)
{
    auto parsed = parsePositionArgs(args);
    if (!parsed)
    {
        return invalidArguments("code.complete", parsed.takeError());
    }

    ToolOutput failure;
    auto       client = connect(manager, parsed->filePath, failure);
    if (!client)
    {
        return failure;
    }

    auto items = client->completion(parsed->filePath, parsed->position);
    if (!items)
    {
        return operationFailed("Code completion", items.takeError());
    }

    llvm::json::Array completions;
    for (const CompletionItem& item : *items)
    {
        completions.push_back(llvm::json::Object{
            {"label", item.label},
            {"kind", item.kind ? llvm::json::Value(static_cast<std::int64_t>(*item.kind)) : llvm::json::Value(nullptr)},
            {"detail", optionalText(item.detail)},
            {"documentation", optionalText(item.documentation)},
            {"insert_text", optionalText(item.insertText)},
        });
    }
    return succeed(llvm::json::Object{{"completions", std::move(completions)}, {"is_incomplete", false}});
}

ToolOutput handleCodeDiagnostics(const llvm::json::Value& args, ServerManager& manager)
{
    auto object = requireObject(args);
    if (!object)
    {
        return invalidArguments("code.diagnostics", object.takeError());
    }
    auto filePath = requireString(**object, "file_path");
    if (!filePath)
    {
        return invalidArguments("code.diagnostics", filePath.takeError());
    }

    auto lineFilter = parseLineRange(**object);
    if (!lineFilter)
    {
        return invalidArguments("code.diagnostics", lineFilter.takeError());
    }

    ToolOutput failure;
    auto       client = connect(manager, *filePath, failure);
    if (!client)
    {
        return failure;
    }

    std::int64_t      errors   = 0;
    std::int64_t      warnings = 0;
    std::int64_t      info     = 0;
    std::int64_t      hints    = 0;
    llvm::json::Array items;
    for (const Diagnostic& diagnostic : client->diagnostics(*filePath))
    {
        const auto line = static_cast<std::int64_t>(diagnostic.range.start.line);
        if (*lineFilter && (line < (*lineFilter)->first || line > (*lineFilter)->second))
        {
            continue;
        }

        const DiagnosticSeverity severity = diagnostic.severity ? *diagnostic.severity : DiagnosticSeverity::Error;
        switch (severity)
        {
        case DiagnosticSeverity::Error:
            ++errors;
            break;
        case DiagnosticSeverity::Warning:
            ++warnings;
            break;
        case DiagnosticSeverity::Information:
            ++info;
            break;
        case DiagnosticSeverity::Hint:
            ++hints;
            break;
        }

        items.push_back(llvm::json::Object{
            {"range", lineRange(diagnostic.range)},
            {"severity", static_cast<std::int64_t>(severity)},
            {"message", diagnostic.message},
            {"source", optionalText(diagnostic.source)},
            {"code", diagnosticCode(diagnostic.code)},
        });
    }

    return succeed(llvm::json::Object{
        {"diagnostics", std::move(items)},
        {"summary", llvm::json::Object{{"errors", errors}, {"warnings", warnings}, {"info", info}, {"hints", hints}}},
    });
}

ToolOutput handleCodeDefinition(const llvm::json::Value& args, ServerManager& manager)
{
    auto parsed = parsePositionArgs(args);
    if (!parsed)
    {
        return invalidArguments("code.definition", parsed.takeError());
    }

    ToolOutput failure;
    auto       client = connect(manager, parsed->filePath, failure);
    if (!client)
    {
        return failure;
    }

    auto locations = client->definition(parsed->filePath, parsed->position);
    if (!locations)
    {
        return operationFailed("Go-to-definition", locations.takeError());
    }

    llvm::json::Array definitions;
    for (const Location& location : *locations)
    {
        definitions.push_back(locationItem(location, /*withPreview=*/true));
    }
    return succeed(llvm::json::Object{{"definitions", std::move(definitions)}});
}

ToolOutput handleCodeReferences(const llvm::json::Value& args, ServerManager& manager)
{
    auto parsed = parsePositionArgs(args);
    if (!parsed)
    {
        return invalidArguments("code.references", parsed.takeError());
    }
    bool includeDeclaration = true;
    if (const auto flag = args.getAsObject()->getBoolean("include_declaration"))
    {
        includeDeclaration = *flag;
    }

    ToolOutput failure;
    auto       client = connect(manager, parsed->filePath, failure);
    if (!client)
    {
        return failure;
    }

    auto locations = client->references(parsed->filePath, parsed->position, includeDeclaration);
    if (!locations)
    {
        return operationFailed("Find references", locations.takeError());
    }

    llvm::json::Array references;
    for (const Location& location : *locations)
    {
        references.push_back(locationItem(location, /*withPreview=*/true));
    }
    const auto total = static_cast<std::int64_t>(references.size());
    return succeed(llvm::json::Object{{"references", std::move(references)}, {"total_count", total}});
}

ToolOutput handleCodeHover(const llvm::json::Value& args, ServerManager& manager)
{
    auto parsed = parsePositionArgs(args);
    if (!parsed)
    {
        return invalidArguments("code.hover", parsed.takeError());
    }

    ToolOutput failure;
    auto       client = connect(manager, parsed->filePath, failure);
    if (!client)
    {
        return failure;
    }

    auto hover = client->hover(parsed->filePath, parsed->position);
    if (!hover)
    {
        return operationFailed("Hover", hover.takeError());
    }
    if (!*hover)
    {
        return succeed(llvm::json::Object{{"content", ""}, {"range", nullptr}});
    }
    const Hover& info = **hover;
    return succeed(llvm::json::Object{
        {"content", info.contents},
        {"range", info.range ? lineRange(*info.range) : llvm::json::Value(nullptr)},
    });
}

ToolOutput handleCodeSymbols(const llvm::json::Value& args, ServerManager& manager)
{
    auto object = requireObject(args);
    if (!object)
    {
        return invalidArguments("code.symbols", object.takeError());
    }
    auto path = requireString(**object, "path");
    if (!path)
    {
        return invalidArguments("code.symbols", path.takeError());
    }
    auto scope = requireString(**object, "scope");
    if (!scope)
    {
        return invalidArguments("code.symbols", scope.takeError());
    }
    std::string query;
    if (const auto text = (*object)->getString("query"))
    {
        query = text->str();
    }

    if (*scope == "workspace")
    {
        return fail("Workspace symbol search not supported. Path: " + *path);
    }
    if (*scope != "file")
    {
        return invalidArguments("code.symbols", argumentError("'scope' must be \"file\" or \"workspace\""));
    }
    if (!llvm::sys::fs::is_regular_file(absolutePath(manager, *path)))
    {
        return fail("Symbol search failed: " + *path + " is not a regular file");
    }

    ToolOutput failure;
    auto       client = connect(manager, *path, failure);
    if (!client)
    {
        return failure;
    }

    auto symbols = client->documentSymbols(*path);
    if (!symbols)
    {
        return operationFailed("Symbol search", symbols.takeError());
    }

    llvm::json::Array items;
    for (const SymbolInformation& symbol : *symbols)
    {
        if (!query.empty() && !llvm::StringRef(symbol.name).contains_insensitive(query))
        {
            continue;
        }
        items.push_back(llvm::json::Object{
            {"name", symbol.name},
            {"kind", static_cast<std::int64_t>(symbol.kind)},
            {"file_path", uriToPath(symbol.uri)},
            {"range", lineRange(symbol.range)},
            {"container", optionalText(symbol.containerName)},
        });
    }
    return succeed(llvm::json::Object{{"symbols", std::move(items)}});
}

llvm::ArrayRef<llvm::StringRef> toolNames()
{
    static const std::array<llvm::StringRef, 6> Names = {
        "code.complete",
        "code.diagnostics",
        "code.definition",
        "code.references",
        "code.hover",
        "code.symbols",
    };
    return Names;
}

ToolOutput dispatchToolCall(const llvm::StringRef name, const llvm::json::Value& args, ServerManager& manager)
{
    if (name == "code.complete")
    {
        return handleCodeComplete(args, manager);
    }
    if (name == "code.diagnostics")
    {
        return handleCodeDiagnostics(args, manager);
    }
    if (name == "code.definition")
    {
        return handleCodeDefinition(args, manager);
    }
    if (name == "code.references")
    {
        return handleCodeReferences(args, manager);
    }
    if (name == "code.hover")
    {
        return handleCodeHover(args, manager);
    }
    if (name == "code.symbols")
    {
        return handleCodeSymbols(args, manager);
    }
    return fail(("Unknown tool: " + name).str());
}

}  // namespace codeintel::lsp
