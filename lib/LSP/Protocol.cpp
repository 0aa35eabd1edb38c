//===----------------------------------------------------------------------===//
//
// Part of the codeintel project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements LSP data model parsing, serialization, and URI conversion.
///
//===----------------------------------------------------------------------===//

#include "codeintel/LSP/Protocol.h"

#include <cctype>
#include <limits>
#include <utility>

namespace codeintel::lsp
{
namespace
{

std::optional<std::uint32_t> parseUnsigned(const llvm::json::Object& object, llvm::StringRef key)
{
    const auto value = object.getInteger(key);
    if (!value || *value < 0 || *value > std::numeric_limits<std::uint32_t>::max())
    {
        return std::nullopt;
    }
    return static_cast<std::uint32_t>(*value);
}

std::optional<std::string> optionalString(const llvm::json::Object& object, llvm::StringRef key)
{
    if (const auto text = object.getString(key))
    {
        return text->str();
    }
    return std::nullopt;
}

template <typename T, typename ParseFn>
std::optional<std::vector<T>> parseList(const llvm::json::Value& value, ParseFn parseElement)
{
    const auto* array = value.getAsArray();
    if (!array)
    {
        return std::nullopt;
    }
    std::vector<T> out;
    out.reserve(array->size());
    for (const llvm::json::Value& element : *array)
    {
        std::optional<T> parsed = parseElement(element);
        if (!parsed)
        {
            return std::nullopt;
        }
        out.push_back(std::move(*parsed));
    }
    return out;
}

void flattenDocumentSymbol(const llvm::json::Object&         symbol,
                           llvm::StringRef                   documentUri,
                           const std::optional<std::string>& container,
                           std::vector<SymbolInformation>&   out,
                           bool&                             ok)
{
    const auto  name  = symbol.getString("name");
    const auto  kind  = parseUnsigned(symbol, "kind");
    const auto* range = symbol.get("range");
    if (!name || !kind || !range)
    {
        ok = false;
        return;
    }
    const auto parsedRange = parseRange(*range);
    if (!parsedRange)
    {
        ok = false;
        return;
    }

    out.push_back(SymbolInformation{name->str(), *kind, documentUri.str(), *parsedRange, container});

    if (const auto* children = symbol.getArray("children"))
    {
        const std::optional<std::string> childContainer = name->str();
        for (const llvm::json::Value& child : *children)
        {
            const auto* childObject = child.getAsObject();
            if (!childObject)
            {
                ok = false;
                return;
            }
            flattenDocumentSymbol(*childObject, documentUri, childContainer, out, ok);
            if (!ok)
            {
                return;
            }
        }
    }
}

bool isUnreservedPathChar(const char ch)
{
    return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '-' || ch == '.' || ch == '_' || ch == '~' ||
           ch == '/';
}

int hexDigitValue(const char ch)
{
    if (ch >= '0' && ch <= '9')
    {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f')
    {
        return ch - 'a' + 10;
    }
    if (ch >= 'A' && ch <= 'F')
    {
        return ch - 'A' + 10;
    }
    return -1;
}

}  // namespace

llvm::json::Value toJSON(const Position& position)
{
    return llvm::json::Object{
        {"line", static_cast<std::int64_t>(position.line)},
        {"character", static_cast<std::int64_t>(position.character)},
    };
}

llvm::json::Value toJSON(const Range& range)
{
    return llvm::json::Object{
        {"start", toJSON(range.start)},
        {"end", toJSON(range.end)},
    };
}

std::optional<Position> parsePosition(const llvm::json::Value& value)
{
    const auto* object = value.getAsObject();
    if (!object)
    {
        return std::nullopt;
    }
    const auto line      = parseUnsigned(*object, "line");
    const auto character = parseUnsigned(*object, "character");
    if (!line || !character)
    {
        return std::nullopt;
    }
    return Position{*line, *character};
}

std::optional<Range> parseRange(const llvm::json::Value& value)
{
    const auto* object = value.getAsObject();
    if (!object)
    {
        return std::nullopt;
    }
    const auto* start = object->get("start");
    const auto* end   = object->get("end");
    if (!start || !end)
    {
        return std::nullopt;
    }
    const auto startPosition = parsePosition(*start);
    const auto endPosition   = parsePosition(*end);
    if (!startPosition || !endPosition)
    {
        return std::nullopt;
    }
    return Range{*startPosition, *endPosition};
}

std::optional<Diagnostic> parseDiagnostic(const llvm::json::Value& value)
{
    const auto* object = value.getAsObject();
    if (!object)
    {
        return std::nullopt;
    }
    const auto* rangeValue = object->get("range");
    const auto  message    = object->getString("message");
    if (!rangeValue || !message)
    {
        return std::nullopt;
    }
    const auto range = parseRange(*rangeValue);
    if (!range)
    {
        return std::nullopt;
    }

    Diagnostic diagnostic;
    diagnostic.range   = *range;
    diagnostic.message = message->str();
    if (const auto severity = object->getInteger("severity"))
    {
        if (*severity >= 1 && *severity <= 4)
        {
            diagnostic.severity = static_cast<DiagnosticSeverity>(*severity);
        }
    }
    if (const auto* code = object->get("code"))
    {
        if (code->kind() != llvm::json::Value::Null)
        {
            diagnostic.code = *code;
        }
    }
    diagnostic.source = optionalString(*object, "source");
    return diagnostic;
}

std::optional<CompletionItem> parseCompletionItem(const llvm::json::Value& value)
{
    const auto* object = value.getAsObject();
    if (!object)
    {
        return std::nullopt;
    }
    const auto label = object->getString("label");
    if (!label)
    {
        return std::nullopt;
    }

    CompletionItem item;
    item.label = label->str();
    if (const auto kind = object->getInteger("kind"))
    {
        if (*kind >= 1 && *kind <= 25)
        {
            item.kind = static_cast<CompletionItemKind>(*kind);
        }
    }
    item.detail = optionalString(*object, "detail");
    if (const auto* documentation = object->get("documentation"))
    {
        item.documentation = flattenMarkup(*documentation);
    }
    item.insertText = optionalString(*object, "insertText");
    if (!item.insertText)
    {
        if (const auto* textEdit = object->getObject("textEdit"))
        {
            item.insertText = optionalString(*textEdit, "newText");
        }
    }
    return item;
}

std::optional<Location> parseLocation(const llvm::json::Value& value)
{
    const auto* object = value.getAsObject();
    if (!object)
    {
        return std::nullopt;
    }
    const auto  uri        = object->getString("uri");
    const auto* rangeValue = object->get("range");
    if (!uri || !rangeValue)
    {
        return std::nullopt;
    }
    const auto range = parseRange(*rangeValue);
    if (!range)
    {
        return std::nullopt;
    }
    return Location{uri->str(), *range};
}

std::optional<Location> parseLocationLink(const llvm::json::Value& value)
{
    const auto* object = value.getAsObject();
    if (!object)
    {
        return std::nullopt;
    }
    const auto  uri        = object->getString("targetUri");
    const auto* rangeValue = object->get("targetSelectionRange");
    if (!rangeValue)
    {
        rangeValue = object->get("targetRange");
    }
    if (!uri || !rangeValue)
    {
        return std::nullopt;
    }
    const auto range = parseRange(*rangeValue);
    if (!range)
    {
        return std::nullopt;
    }
    return Location{uri->str(), *range};
}

std::optional<std::vector<Diagnostic>> parseDiagnosticList(const llvm::json::Value& value)
{
    return parseList<Diagnostic>(value, parseDiagnostic);
}

std::optional<std::vector<CompletionItem>> parseCompletionItemList(const llvm::json::Value& value)
{
    return parseList<CompletionItem>(value, parseCompletionItem);
}

std::optional<std::vector<Location>> parseLocationList(const llvm::json::Value& value)
{
    return parseList<Location>(value, [](const llvm::json::Value& element) -> std::optional<Location> {
        if (auto location = parseLocation(element))
        {
            return location;
        }
        return parseLocationLink(element);
    });
}

std::optional<Hover> parseHover(const llvm::json::Value& value)
{
    const auto* object = value.getAsObject();
    if (!object)
    {
        return std::nullopt;
    }
    const auto* contents = object->get("contents");
    if (!contents)
    {
        return std::nullopt;
    }
    auto text = flattenMarkup(*contents);
    if (!text)
    {
        return std::nullopt;
    }

    Hover hover;
    hover.contents = std::move(*text);
    if (const auto* range = object->get("range"))
    {
        hover.range = parseRange(*range);
    }
    return hover;
}

std::optional<std::vector<SymbolInformation>> parseDocumentSymbols(const llvm::json::Value& value,
                                                                   llvm::StringRef          documentUri)
{
    const auto* array = value.getAsArray();
    if (!array)
    {
        return std::nullopt;
    }

    std::vector<SymbolInformation> out;
    for (const llvm::json::Value& element : *array)
    {
        const auto* symbol = element.getAsObject();
        if (!symbol)
        {
            return std::nullopt;
        }

        if (const auto* locationValue = symbol->get("location"))
        {
            const auto name     = symbol->getString("name");
            const auto kind     = parseUnsigned(*symbol, "kind");
            const auto location = parseLocation(*locationValue);
            if (!name || !kind || !location)
            {
                return std::nullopt;
            }
            out.push_back(SymbolInformation{name->str(),
                                            *kind,
                                            location->uri,
                                            location->range,
                                            optionalString(*symbol, "containerName")});
            continue;
        }

        bool ok = true;
        flattenDocumentSymbol(*symbol, documentUri, std::nullopt, out, ok);
        if (!ok)
        {
            return std::nullopt;
        }
    }
    return out;
}

std::optional<std::string> flattenMarkup(const llvm::json::Value& value)
{
    if (const auto text = value.getAsString())
    {
        return text->str();
    }
    if (const auto* object = value.getAsObject())
    {
        // MarkupContent and MarkedString objects both carry `value`.
        if (const auto text = object->getString("value"))
        {
            return text->str();
        }
        return std::nullopt;
    }
    if (const auto* array = value.getAsArray())
    {
        std::string joined;
        for (const llvm::json::Value& element : *array)
        {
            const auto part = flattenMarkup(element);
            if (!part)
            {
                return std::nullopt;
            }
            if (part->empty())
            {
                continue;
            }
            if (!joined.empty())
            {
                joined += "\n\n";
            }
            joined += *part;
        }
        return joined;
    }
    return std::nullopt;
}

std::string pathToUri(const llvm::StringRef path)
{
    static constexpr char HexDigits[] = "0123456789ABCDEF";
    std::string           uri         = "file://";
    if (!path.empty() && path.front() != '/')
    {
        uri += '/';
    }
    for (const char ch : path)
    {
        if (isUnreservedPathChar(ch))
        {
            uri += ch;
            continue;
        }
        const auto byte = static_cast<unsigned char>(ch);
        uri += '%';
        uri += HexDigits[byte >> 4U];
        uri += HexDigits[byte & 0x0FU];
    }
    return uri;
}

std::string uriToPath(const llvm::StringRef uri)
{
    llvm::StringRef rest = uri;
    if (!rest.consume_front("file://"))
    {
        return uri.str();
    }

    std::string path;
    path.reserve(rest.size());
    for (std::size_t i = 0; i < rest.size(); ++i)
    {
        if (rest[i] == '%' && i + 2 < rest.size())
        {
            const int high = hexDigitValue(rest[i + 1]);
            const int low  = hexDigitValue(rest[i + 2]);
            if (high >= 0 && low >= 0)
            {
                path += static_cast<char>((high << 4) | low);
                i += 2;
                continue;
            }
        }
        path += rest[i];
    }
    return path;
}

}  // namespace codeintel::lsp
