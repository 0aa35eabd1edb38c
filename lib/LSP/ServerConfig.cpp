//===----------------------------------------------------------------------===//
//
// Part of the codeintel project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the server catalog and manager option parsing.
///
//===----------------------------------------------------------------------===//

#include "codeintel/LSP/ServerConfig.h"

#include "llvm/Support/MemoryBuffer.h"

#include <algorithm>
#include <cctype>
#include <optional>
#include <system_error>

namespace codeintel::lsp
{
namespace
{

llvm::Error catalogError(const llvm::Twine& message)
{
    return llvm::createStringError(std::make_error_code(std::errc::invalid_argument), message);
}

std::optional<std::vector<std::string>> parseStringArrayValue(const llvm::json::Value& value)
{
    const auto* array = value.getAsArray();
    if (!array)
    {
        return std::nullopt;
    }

    std::vector<std::string> out;
    out.reserve(array->size());
    for (const llvm::json::Value& item : *array)
    {
        const auto text = item.getAsString();
        if (!text)
        {
            return std::nullopt;
        }
        out.emplace_back(text->str());
    }
    return out;
}

std::string normalizeExtension(llvm::StringRef extension)
{
    extension = extension.trim();
    extension.consume_front(".");
    std::string normalized = extension.str();
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](const unsigned char value) {
        return static_cast<char>(std::tolower(value));
    });
    return normalized;
}

llvm::Expected<ServerConfig> parseServerEntry(const llvm::json::Value& value, const std::size_t index)
{
    const auto* entry = value.getAsObject();
    if (!entry)
    {
        return catalogError("servers[" + llvm::Twine(index) + "] is not an object");
    }

    ServerConfig config;
    const auto   language = entry->getString("language");
    const auto   command  = entry->getString("command");
    if (!language || language->empty())
    {
        return catalogError("servers[" + llvm::Twine(index) + "] is missing 'language'");
    }
    if (!command || command->empty())
    {
        return catalogError("servers[" + llvm::Twine(index) + "] is missing 'command'");
    }
    config.language = language->str();
    config.command  = command->str();

    if (const auto* argsValue = entry->get("args"))
    {
        const auto args = parseStringArrayValue(*argsValue);
        if (!args)
        {
            return catalogError("servers[" + llvm::Twine(index) + "].args must be an array of strings");
        }
        config.args = *args;
    }

    if (const auto* envValue = entry->get("env"))
    {
        const auto* env = envValue->getAsObject();
        if (!env)
        {
            return catalogError("servers[" + llvm::Twine(index) + "].env must be an object");
        }
        for (const auto& [key, item] : *env)
        {
            const auto text = item.getAsString();
            if (!text)
            {
                return catalogError("servers[" + llvm::Twine(index) + "].env." + key.str() + " must be a string");
            }
            config.env.insert_or_assign(key.str(), text->str());
        }
    }

    const auto* extensionsValue = entry->get("fileExtensions");
    const auto  extensions      = extensionsValue ? parseStringArrayValue(*extensionsValue) : std::nullopt;
    if (!extensions)
    {
        return catalogError("servers[" + llvm::Twine(index) + "].fileExtensions must be an array of strings");
    }
    for (const std::string& extension : *extensions)
    {
        std::string normalized = normalizeExtension(extension);
        if (!normalized.empty())
        {
            config.fileExtensions.insert(std::move(normalized));
        }
    }
    if (config.fileExtensions.empty())
    {
        return catalogError("servers[" + llvm::Twine(index) + "] declares no file extensions");
    }
    return config;
}

std::optional<std::chrono::milliseconds> parsePositiveMillis(const llvm::json::Object& settings, llvm::StringRef key)
{
    const auto value = settings.getInteger(key);
    if (!value || *value <= 0)
    {
        return std::nullopt;
    }
    return std::chrono::milliseconds(*value);
}

}  // namespace

std::vector<ServerConfig> defaultServerConfigs()
{
    return {
        ServerConfig{"rust", "rust-analyzer", {}, {}, {"rs"}},
        ServerConfig{"typescript", "typescript-language-server", {"--stdio"}, {}, {"ts", "tsx", "js", "jsx"}},
        ServerConfig{"python", "pylsp", {}, {}, {"py", "pyi"}},
        ServerConfig{"go", "gopls", {}, {}, {"go"}},
        ServerConfig{"java", "jdtls", {}, {}, {"java"}},
    };
}

llvm::Expected<std::vector<ServerConfig>> parseServerCatalog(const llvm::json::Value& document)
{
    const auto* root = document.getAsObject();
    if (!root)
    {
        return catalogError("server catalog must be a JSON object");
    }
    const auto* servers = root->getArray("servers");
    if (!servers)
    {
        return catalogError("server catalog is missing the 'servers' array");
    }

    std::vector<ServerConfig> out;
    out.reserve(servers->size());
    for (std::size_t index = 0; index < servers->size(); ++index)
    {
        auto config = parseServerEntry((*servers)[index], index);
        if (!config)
        {
            return config.takeError();
        }
        out.push_back(std::move(*config));
    }
    return out;
}

llvm::Expected<std::vector<ServerConfig>> loadServerCatalogFile(const llvm::StringRef path)
{
    auto buffer = llvm::MemoryBuffer::getFile(path);
    if (!buffer)
    {
        return llvm::createStringError(buffer.getError(),
                                       "cannot read server catalog '" + path + "': " + buffer.getError().message());
    }

    auto document = llvm::json::parse((*buffer)->getBuffer());
    if (!document)
    {
        return catalogError("invalid server catalog '" + path + "': " + llvm::toString(document.takeError()));
    }

    auto configs = parseServerCatalog(*document);
    if (!configs)
    {
        return catalogError("invalid server catalog '" + path + "': " + llvm::toString(configs.takeError()));
    }
    return configs;
}

std::vector<ServerConfig> mergeServerCatalogs(std::vector<ServerConfig> base, const std::vector<ServerConfig>& overrides)
{
    for (const ServerConfig& replacement : overrides)
    {
        const auto existing = std::find_if(base.begin(), base.end(), [&replacement](const ServerConfig& config) {
            return config.language == replacement.language;
        });
        if (existing != base.end())
        {
            *existing = replacement;
        }
        else
        {
            base.push_back(replacement);
        }
    }
    return base;
}

TraceLevel parseTraceLevel(const llvm::StringRef text)
{
    if (text == "off")
    {
        return TraceLevel::Off;
    }
    if (text == "verbose")
    {
        return TraceLevel::Verbose;
    }
    return TraceLevel::Basic;
}

bool applyManagerSettings(const llvm::json::Value& settings, ManagerOptions& options)
{
    const auto* object = settings.getAsObject();
    if (!object)
    {
        return false;
    }

    if (const auto timeout = parsePositiveMillis(*object, "requestTimeoutMs"))
    {
        options.requestTimeout = *timeout;
    }
    if (const auto timeout = parsePositiveMillis(*object, "handshakeTimeoutMs"))
    {
        options.handshakeTimeout = *timeout;
    }
    if (const auto timeout = parsePositiveMillis(*object, "shutdownTimeoutMs"))
    {
        options.shutdownTimeout = *timeout;
    }
    if (const auto rawTrace = object->getString("trace"))
    {
        options.traceLevel = parseTraceLevel(*rawTrace);
    }
    return true;
}

}  // namespace codeintel::lsp
