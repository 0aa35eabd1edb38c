//===----------------------------------------------------------------------===//
//
// Part of the codeintel project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements file routing and the per-language session cache.
///
//===----------------------------------------------------------------------===//

#include "codeintel/LSP/ServerManager.h"

#include "codeintel/LSP/Error.h"
#include "codeintel/LSP/Protocol.h"
#include "codeintel/Support/Log.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace codeintel::lsp
{
namespace
{

constexpr llvm::StringRef ManagerComponent = "manager";

std::string makeAbsoluteRoot(std::string root)
{
    llvm::SmallString<256> absolute(root.empty() ? std::string(".") : root);
    if (const std::error_code ec = llvm::sys::fs::make_absolute(absolute))
    {
        logWarning(ManagerComponent, "cannot make workspace root absolute: " + llvm::Twine(ec.message()));
        return root;
    }
    llvm::sys::path::remove_dots(absolute, /*remove_dot_dot=*/true);
    return absolute.str().str();
}

std::string extensionOf(llvm::StringRef filePath)
{
    llvm::StringRef extension = llvm::sys::path::extension(filePath);
    extension.consume_front(".");
    std::string normalized = extension.str();
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](const unsigned char value) {
        return static_cast<char>(std::tolower(value));
    });
    return normalized;
}

void applyTraceLevel(const TraceLevel level)
{
    switch (level)
    {
    case TraceLevel::Off:
        setLogLevel(LogLevel::Error);
        break;
    case TraceLevel::Basic:
        // Basic keeps the process-wide default unless something raised it.
        break;
    case TraceLevel::Verbose:
        setLogLevel(LogLevel::Debug);
        break;
    }
}

}  // namespace

ProcessLauncher childProcessLauncher()
{
    return [](const ServerConfig& config) -> llvm::Expected<std::unique_ptr<ServerProcess>> {
        auto process = ChildProcess::spawn(config);
        if (!process)
        {
            return process.takeError();
        }
        return std::unique_ptr<ServerProcess>(std::move(*process));
    };
}

ServerManager::ServerManager(std::string               workspaceRoot,
                             std::vector<ServerConfig> configs,
                             ManagerOptions            options,
                             ProcessLauncher           launcher)
    : workspaceRoot_(makeAbsoluteRoot(std::move(workspaceRoot)))
    , rootUri_(pathToUri(workspaceRoot_))
    , configs_(std::move(configs))
    , options_(options)
    , launcher_(launcher ? std::move(launcher) : childProcessLauncher())
{
    applyTraceLevel(options_.traceLevel);
}

ServerManager::~ServerManager()
{
    shutdownAll();
}

const ServerConfig* ServerManager::resolve(const llvm::StringRef filePath) const
{
    const std::string extension = extensionOf(filePath);
    if (extension.empty())
    {
        return nullptr;
    }
    for (const ServerConfig& config : configs_)
    {
        if (config.fileExtensions.count(extension) != 0U)
        {
            return &config;
        }
    }
    return nullptr;
}

std::optional<std::string> ServerManager::languageForFile(const llvm::StringRef filePath) const
{
    if (const ServerConfig* config = resolve(filePath))
    {
        return config->language;
    }
    return std::nullopt;
}

std::shared_ptr<ServerSession> ServerManager::cachedSession(const std::string& language) const
{
    std::shared_lock<std::shared_mutex> lock(cacheMutex_);
    const auto                          it = sessions_.find(language);
    return it == sessions_.end() ? nullptr : it->second;
}

std::mutex& ServerManager::creationMutex(const std::string& language)
{
    std::lock_guard<std::mutex> lock(creationMutexesGuard_);
    auto&                       slot = creationMutexes_[language];
    if (!slot)
    {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

llvm::Expected<ClientHandle> ServerManager::getOrCreate(const llvm::StringRef filePath)
{
    const ServerConfig* config = resolve(filePath);
    if (!config)
    {
        const std::string extension = extensionOf(filePath);
        const std::string subject   = extension.empty() ? "files without an extension" : "." + extension + " files";
        return makeLspError(ErrorKind::UnsupportedLanguage, "no language server configured for " + subject);
    }
    const std::string& language = config->language;

    if (auto session = cachedSession(language); session && session->state() != SessionState::Closed)
    {
        return ClientHandle(std::move(session), workspaceRoot_);
    }

    std::lock_guard<std::mutex> creationLock(creationMutex(language));
    if (auto session = cachedSession(language))
    {
        if (session->state() != SessionState::Closed)
        {
            return ClientHandle(std::move(session), workspaceRoot_);
        }
        logWarning(ManagerComponent, language + " server has exited; restarting");
        {
            std::unique_lock<std::shared_mutex> lock(cacheMutex_);
            sessions_.erase(language);
        }
        session->shutdown();
    }

    auto process = launcher_(*config);
    if (!process)
    {
        return process.takeError();
    }

    auto session = ServerSession::create(language, rootUri_, std::move(*process), options_, telemetry_);
    if (llvm::Error error = session->initialize())
    {
        return std::move(error);
    }

    {
        std::unique_lock<std::shared_mutex> lock(cacheMutex_);
        sessions_.insert_or_assign(language, session);
    }
    return ClientHandle(std::move(session), workspaceRoot_);
}

void ServerManager::shutdownAll()
{
    std::map<std::string, std::shared_ptr<ServerSession>> sessions;
    {
        std::unique_lock<std::shared_mutex> lock(cacheMutex_);
        sessions.swap(sessions_);
    }
    for (auto& [language, session] : sessions)
    {
        logInfo(ManagerComponent, "shutting down " + llvm::Twine(language) + " server");
        session->shutdown();
    }
}

std::size_t ServerManager::sessionCount() const
{
    std::shared_lock<std::shared_mutex> lock(cacheMutex_);
    return sessions_.size();
}

}  // namespace codeintel::lsp
