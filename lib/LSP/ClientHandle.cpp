//===----------------------------------------------------------------------===//
//
// Part of the codeintel project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements typed LSP requests and result normalization.
///
//===----------------------------------------------------------------------===//

#include "codeintel/LSP/ClientHandle.h"

#include "codeintel/Support/Log.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/Path.h"

#include <utility>

namespace codeintel::lsp
{

ClientHandle::ClientHandle(std::shared_ptr<ServerSession> session, std::string workspaceRoot)
    : session_(std::move(session))
    , workspaceRoot_(std::move(workspaceRoot))
    , language_(session_->language())
    , rootUri_(session_->rootUri())
{
}

std::string ClientHandle::documentUri(const llvm::StringRef filePath) const
{
    if (filePath.substr(0, 7) == "file://")
    {
        return filePath.str();
    }
    if (llvm::sys::path::is_absolute(filePath) || workspaceRoot_.empty())
    {
        return pathToUri(filePath);
    }
    llvm::SmallString<256> absolute(workspaceRoot_);
    llvm::sys::path::append(absolute, filePath);
    llvm::sys::path::remove_dots(absolute, /*remove_dot_dot=*/true);
    return pathToUri(absolute.str());
}

llvm::json::Value ClientHandle::positionParams(const llvm::StringRef filePath, const Position position) const
{
    return llvm::json::Object{
        {"textDocument", llvm::json::Object{{"uri", documentUri(filePath)}}},
        {"position", toJSON(position)},
    };
}

llvm::Expected<llvm::json::Value> ClientHandle::request(const llvm::StringRef method, llvm::json::Value params) const
{
    RequestResult result = session_->send(method, std::move(params));
    if (!result.ok())
    {
        return toError(result, language_, method);
    }
    return std::move(result.value);
}

llvm::Expected<std::vector<CompletionItem>> ClientHandle::completion(const llvm::StringRef filePath,
                                                                     const Position        position) const
{
    auto result = request("textDocument/completion", positionParams(filePath, position));
    if (!result)
    {
        return result.takeError();
    }

    // CompletionList or CompletionItem[].
    const llvm::json::Value* items = &*result;
    if (const auto* list = result->getAsObject())
    {
        items = list->get("items");
    }
    if (items)
    {
        if (auto parsed = parseCompletionItemList(*items))
        {
            return std::move(*parsed);
        }
    }
    if (result->kind() != llvm::json::Value::Null)
    {
        logDebug(language_, "unexpected completion result shape; returning no items");
    }
    return std::vector<CompletionItem>{};
}

std::vector<Diagnostic> ClientHandle::diagnostics(const llvm::StringRef filePath) const
{
    const std::string uri = documentUri(filePath);
    auto              result =
        request("textDocument/diagnostic", llvm::json::Object{{"textDocument", llvm::json::Object{{"uri", uri}}}});
    if (result)
    {
        if (const auto* report = result->getAsObject())
        {
            const llvm::json::Value* list = report->get("items");
            if (!list)
            {
                list = report->get("diagnostics");
            }
            if (list)
            {
                if (auto parsed = parseDiagnosticList(*list))
                {
                    return std::move(*parsed);
                }
            }
        }
    }
    else
    {
        logDebug(language_,
                 "diagnostic pull failed, using pushed diagnostics: " + llvm::toString(result.takeError()));
    }

    if (auto pushed = session_->pushedDiagnostics(uri))
    {
        return std::move(*pushed);
    }
    return {};
}

llvm::Expected<std::vector<Location>> ClientHandle::definition(const llvm::StringRef filePath,
                                                               const Position        position) const
{
    auto result = request("textDocument/definition", positionParams(filePath, position));
    if (!result)
    {
        return result.takeError();
    }

    if (result->getAsObject())
    {
        if (auto location = parseLocation(*result))
        {
            return std::vector<Location>{std::move(*location)};
        }
        if (auto link = parseLocationLink(*result))
        {
            return std::vector<Location>{std::move(*link)};
        }
        return std::vector<Location>{};
    }
    if (auto locations = parseLocationList(*result))
    {
        return std::move(*locations);
    }
    return std::vector<Location>{};
}

llvm::Expected<std::optional<Hover>> ClientHandle::hover(const llvm::StringRef filePath, const Position position) const
{
    auto result = request("textDocument/hover", positionParams(filePath, position));
    if (!result)
    {
        return result.takeError();
    }
    return parseHover(*result);
}

llvm::Expected<std::vector<Location>> ClientHandle::references(const llvm::StringRef filePath,
                                                               const Position        position,
                                                               const bool            includeDeclaration) const
{
    llvm::json::Value params = positionParams(filePath, position);
    params.getAsObject()->try_emplace("context", llvm::json::Object{{"includeDeclaration", includeDeclaration}});

    auto result = request("textDocument/references", std::move(params));
    if (!result)
    {
        return result.takeError();
    }
    if (auto locations = parseLocationList(*result))
    {
        return std::move(*locations);
    }
    return std::vector<Location>{};
}

llvm::Expected<std::vector<SymbolInformation>> ClientHandle::documentSymbols(const llvm::StringRef filePath) const
{
    const std::string uri = documentUri(filePath);
    auto              result =
        request("textDocument/documentSymbol", llvm::json::Object{{"textDocument", llvm::json::Object{{"uri", uri}}}});
    if (!result)
    {
        return result.takeError();
    }
    if (auto symbols = parseDocumentSymbols(*result, uri))
    {
        return std::move(*symbols);
    }
    return std::vector<SymbolInformation>{};
}

std::vector<Diagnostic> ClientHandle::pushedDiagnostics(const llvm::StringRef filePath) const
{
    if (auto pushed = session_->pushedDiagnostics(documentUri(filePath)))
    {
        return std::move(*pushed);
    }
    return {};
}

bool ClientHandle::isAlive() const
{
    return session_->state() != SessionState::Closed;
}

}  // namespace codeintel::lsp
