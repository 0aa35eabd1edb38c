//===----------------------------------------------------------------------===//
//
// Part of the codeintel project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Routes files to language servers and owns their sessions.
///
/// The manager keeps at most one live session per language. Lookups take a
/// shared lock; a miss takes the language's creation mutex so that concurrent
/// first use launches exactly one server, and only the final insert takes the
/// cache lock exclusively.
///
//===----------------------------------------------------------------------===//
#ifndef CODEINTEL_LSP_SERVER_MANAGER_H
#define CODEINTEL_LSP_SERVER_MANAGER_H

#include "codeintel/LSP/ClientHandle.h"
#include "codeintel/LSP/ServerConfig.h"
#include "codeintel/LSP/ServerProcess.h"
#include "codeintel/LSP/ServerSession.h"
#include "codeintel/LSP/Telemetry.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace codeintel::lsp
{

/// @brief Starts a server process for a configuration.
using ProcessLauncher = std::function<llvm::Expected<std::unique_ptr<ServerProcess>>(const ServerConfig&)>;

/// @brief Launcher that spawns real child processes.
[[nodiscard]] ProcessLauncher childProcessLauncher();

/// @brief Language-server registry and session cache.
class ServerManager final
{
public:
    /// @brief Creates a manager.
    /// @param[in] workspaceRoot Workspace directory; made absolute.
    /// @param[in] configs Server catalog; first match wins on shared extensions.
    /// @param[in] options Deadlines and verbosity.
    /// @param[in] launcher Process launcher; defaults to child processes.
    explicit ServerManager(std::string               workspaceRoot,
                           std::vector<ServerConfig> configs  = defaultServerConfigs(),
                           ManagerOptions            options  = {},
                           ProcessLauncher           launcher = {});

    /// @brief Shuts down every session.
    ~ServerManager();

    ServerManager(const ServerManager&)            = delete;
    ServerManager& operator=(const ServerManager&) = delete;

    /// @brief Finds the configuration serving a file by extension.
    /// @param[in] filePath File path.
    /// @return Matching configuration, or `nullptr`.
    [[nodiscard]] const ServerConfig* resolve(llvm::StringRef filePath) const;

    /// @brief Returns the language serving a file.
    [[nodiscard]] std::optional<std::string> languageForFile(llvm::StringRef filePath) const;

    /// @brief Returns a handle to the session serving a file, starting the
    /// server on first use.
    /// @param[in] filePath File path.
    /// @return Handle, or an `UnsupportedLanguage`, `SpawnFailure`, or
    /// `HandshakeFailure` error. Failures are not cached.
    [[nodiscard]] llvm::Expected<ClientHandle> getOrCreate(llvm::StringRef filePath);

    /// @brief Gracefully shuts down every session and empties the cache.
    void shutdownAll();

    /// @brief Number of cached sessions.
    [[nodiscard]] std::size_t sessionCount() const;

    [[nodiscard]] const std::string& workspaceRoot() const
    {
        return workspaceRoot_;
    }

    [[nodiscard]] const std::vector<ServerConfig>& configs() const
    {
        return configs_;
    }

    [[nodiscard]] const ManagerOptions& options() const
    {
        return options_;
    }

    [[nodiscard]] Telemetry& telemetry()
    {
        return *telemetry_;
    }

private:
    [[nodiscard]] std::shared_ptr<ServerSession> cachedSession(const std::string& language) const;
    [[nodiscard]] std::mutex&                    creationMutex(const std::string& language);

    std::string                                            workspaceRoot_;
    std::string                                            rootUri_;
    const std::vector<ServerConfig>                        configs_;
    const ManagerOptions                                   options_;
    ProcessLauncher                                        launcher_;
    std::shared_ptr<Telemetry>                             telemetry_{std::make_shared<Telemetry>()};
    mutable std::shared_mutex                              cacheMutex_;
    std::map<std::string, std::shared_ptr<ServerSession>>  sessions_;
    std::mutex                                             creationMutexesGuard_;
    std::map<std::string, std::unique_ptr<std::mutex>>     creationMutexes_;
};

}  // namespace codeintel::lsp

#endif  // CODEINTEL_LSP_SERVER_MANAGER_H
