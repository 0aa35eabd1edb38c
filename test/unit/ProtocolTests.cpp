//===----------------------------------------------------------------------===//
//
// Part of the codeintel project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <string>

#include "FakeLanguageServer.h"
#include "codeintel/LSP/Protocol.h"

using codeintel::test::parseJson;

namespace
{

bool testDiagnostics()
{
    const auto list = codeintel::lsp::parseDiagnosticList(parseJson(R"json([
        {"range": {"start": {"line": 3, "character": 4}, "end": {"line": 3, "character": 9}},
         "severity": 2, "code": 401, "source": "pyflakes", "message": "unused import"},
        {"range": {"start": {"line": 0, "character": 0}, "end": {"line": 0, "character": 1}},
         "message": "no severity"}
    ])json"));
    if (!list || list->size() != 2U)
    {
        std::cerr << "expected two parsed diagnostics\n";
        return false;
    }
    const auto& first = (*list)[0];
    if (first.range.start.line != 3U || first.range.end.character != 9U ||
        first.severity != codeintel::lsp::DiagnosticSeverity::Warning || !first.code ||
        !first.code->getAsInteger() || *first.code->getAsInteger() != 401 ||
        first.source != std::optional<std::string>("pyflakes") || first.message != "unused import")
    {
        std::cerr << "diagnostic fields decoded incorrectly\n";
        return false;
    }
    if ((*list)[1].severity || (*list)[1].code || (*list)[1].source)
    {
        std::cerr << "absent diagnostic fields must stay empty\n";
        return false;
    }
    if (codeintel::lsp::parseDiagnosticList(parseJson(R"json([{"message": "no range"}])json")))
    {
        std::cerr << "a diagnostic without a range must fail the list\n";
        return false;
    }
    return true;
}

bool testCompletionItems()
{
    const auto items = codeintel::lsp::parseCompletionItemList(parseJson(R"json([
        {"label": "println!", "kind": 3, "detail": "macro", "insertText": "println!($0)",
         "documentation": {"kind": "markdown", "value": "Prints to stdout."}},
        {"label": "len", "documentation": "Returns the length.",
         "textEdit": {"range": {"start": {"line": 0, "character": 0}, "end": {"line": 0, "character": 1}},
                      "newText": "len()"}},
        {"label": "bare", "kind": 99}
    ])json"));
    if (!items || items->size() != 3U)
    {
        std::cerr << "expected three completion items\n";
        return false;
    }
    const auto& first = (*items)[0];
    if (first.kind != codeintel::lsp::CompletionItemKind::Function || first.detail != std::optional<std::string>("macro") ||
        first.documentation != std::optional<std::string>("Prints to stdout.") ||
        first.insertText != std::optional<std::string>("println!($0)"))
    {
        std::cerr << "completion item with MarkupContent decoded incorrectly\n";
        return false;
    }
    if ((*items)[1].documentation != std::optional<std::string>("Returns the length.") ||
        (*items)[1].insertText != std::optional<std::string>("len()"))
    {
        std::cerr << "expected plain documentation and textEdit insert text\n";
        return false;
    }
    if ((*items)[2].kind || (*items)[2].detail || (*items)[2].documentation || (*items)[2].insertText)
    {
        std::cerr << "unknown kind and absent fields must stay empty\n";
        return false;
    }
    return true;
}

bool testLocations()
{
    const auto locations = codeintel::lsp::parseLocationList(parseJson(R"json([
        {"uri": "file:///ws/a.rs", "range": {"start": {"line": 1, "character": 2}, "end": {"line": 1, "character": 5}}},
        {"targetUri": "file:///ws/b.rs",
         "targetRange": {"start": {"line": 10, "character": 0}, "end": {"line": 20, "character": 1}},
         "targetSelectionRange": {"start": {"line": 12, "character": 4}, "end": {"line": 12, "character": 8}}}
    ])json"));
    if (!locations || locations->size() != 2U)
    {
        std::cerr << "expected a Location and a LocationLink\n";
        return false;
    }
    if ((*locations)[0].uri != "file:///ws/a.rs" || (*locations)[0].range.start.character != 2U)
    {
        std::cerr << "Location decoded incorrectly\n";
        return false;
    }
    if ((*locations)[1].uri != "file:///ws/b.rs" || (*locations)[1].range.start.line != 12U)
    {
        std::cerr << "LocationLink must use its target selection range\n";
        return false;
    }
    return true;
}

bool testHover()
{
    const auto markup = codeintel::lsp::parseHover(parseJson(R"json({
        "contents": {"kind": "markdown", "value": "```rust\nfn main()\n```"},
        "range": {"start": {"line": 0, "character": 3}, "end": {"line": 0, "character": 7}}
    })json"));
    if (!markup || markup->contents != "```rust\nfn main()\n```" || !markup->range || markup->range->end.character != 7U)
    {
        std::cerr << "MarkupContent hover decoded incorrectly\n";
        return false;
    }

    const auto marked = codeintel::lsp::parseHover(
        parseJson(R"json({"contents": [{"language": "python", "value": "def f()"}, "", "Docstring."]})json"));
    if (!marked || marked->contents != "def f()\n\nDocstring." || marked->range)
    {
        std::cerr << "MarkedString array hover must join non-empty parts\n";
        return false;
    }

    if (codeintel::lsp::parseHover(llvm::json::Value(nullptr)))
    {
        std::cerr << "null hover must decode to nothing\n";
        return false;
    }
    return true;
}

bool testDocumentSymbols()
{
    const auto hierarchical = codeintel::lsp::parseDocumentSymbols(parseJson(R"json([
        {"name": "Server", "kind": 5,
         "range": {"start": {"line": 0, "character": 0}, "end": {"line": 9, "character": 1}},
         "selectionRange": {"start": {"line": 0, "character": 6}, "end": {"line": 0, "character": 12}},
         "children": [
            {"name": "start", "kind": 6,
             "range": {"start": {"line": 2, "character": 4}, "end": {"line": 4, "character": 5}},
             "selectionRange": {"start": {"line": 2, "character": 8}, "end": {"line": 2, "character": 13}}}
         ]}
    ])json"),
                                                                   "file:///ws/server.py");
    if (!hierarchical || hierarchical->size() != 2U)
    {
        std::cerr << "expected hierarchical symbols to flatten into two entries\n";
        return false;
    }
    const auto& child = (*hierarchical)[1];
    if (child.name != "start" || child.kind != 6U || child.uri != "file:///ws/server.py" ||
        child.containerName != std::optional<std::string>("Server") || (*hierarchical)[0].containerName)
    {
        std::cerr << "flattened symbols carry wrong container or uri\n";
        return false;
    }

    const auto flat = codeintel::lsp::parseDocumentSymbols(parseJson(R"json([
        {"name": "helper", "kind": 12, "containerName": "utils",
         "location": {"uri": "file:///ws/utils.py",
                      "range": {"start": {"line": 5, "character": 0}, "end": {"line": 7, "character": 0}}}}
    ])json"),
                                                           "file:///ws/ignored.py");
    if (!flat || flat->size() != 1U || (*flat)[0].uri != "file:///ws/utils.py" ||
        (*flat)[0].containerName != std::optional<std::string>("utils"))
    {
        std::cerr << "SymbolInformation entries must keep their own location\n";
        return false;
    }
    return true;
}

bool testUris()
{
    const std::string uri = codeintel::lsp::pathToUri("/tmp/my project/src/main.rs");
    if (uri != "file:///tmp/my%20project/src/main.rs")
    {
        std::cerr << "unexpected file URI: " << uri << "\n";
        return false;
    }
    if (codeintel::lsp::uriToPath(uri) != "/tmp/my project/src/main.rs")
    {
        std::cerr << "file URI did not decode back to its path\n";
        return false;
    }
    if (codeintel::lsp::uriToPath("untitled:Untitled-1") != "untitled:Untitled-1")
    {
        std::cerr << "non-file URIs must pass through\n";
        return false;
    }

    const llvm::json::Value position = codeintel::lsp::toJSON(codeintel::lsp::Position{4, 2});
    const auto              line     = position.getAsObject()->getInteger("line");
    const auto              column   = position.getAsObject()->getInteger("character");
    if (!line || *line != 4 || !column || *column != 2)
    {
        std::cerr << "position serialized incorrectly\n";
        return false;
    }
    return true;
}

}  // namespace

bool runProtocolTests()
{
    bool ok = true;
    ok      = testDiagnostics() && ok;
    ok      = testCompletionItems() && ok;
    ok      = testLocations() && ok;
    ok      = testHover() && ok;
    ok      = testDocumentSymbols() && ok;
    ok      = testUris() && ok;
    return ok;
}
