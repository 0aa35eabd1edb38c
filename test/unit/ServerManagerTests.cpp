//===----------------------------------------------------------------------===//
//
// Part of the codeintel project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "FakeLanguageServer.h"
#include "codeintel/LSP/ServerManager.h"

using codeintel::lsp::ErrorKind;
using codeintel::lsp::ServerConfig;
using codeintel::lsp::ServerManager;
using codeintel::test::FakeLanguageServer;
using codeintel::test::takeErrorDetails;

namespace
{

constexpr auto        WaitTimeout   = std::chrono::seconds(3);
constexpr const char* WorkspaceRoot = "/tmp/codeintel-tests/ws";

/// Launches fake servers and keeps them alive for the manager's lifetime.
/// Declare before the manager so the fakes outlive its sessions.
class FakeFleet final
{
public:
    codeintel::lsp::ProcessLauncher launcher()
    {
        return [this](const ServerConfig& config) -> llvm::Expected<std::unique_ptr<codeintel::lsp::ServerProcess>> {
            std::lock_guard<std::mutex> lock(mutex_);
            ++launches_;
            if (failSpawn_)
            {
                return codeintel::lsp::makeLspError(ErrorKind::SpawnFailure,
                                                    "failed to start " + llvm::Twine(config.language) + " server");
            }
            fakes_.push_back(std::make_unique<FakeLanguageServer>());
            if (rejectHandshake_)
            {
                fakes_.back()->on("initialize", [](FakeLanguageServer& server, const llvm::json::Object& message) {
                    server.replyError(*message.get("id"), -32603, "workspace not found");
                });
            }
            return fakes_.back()->takeProcess();
        };
    }

    void setFailSpawn(const bool fail)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failSpawn_ = fail;
    }

    void setRejectHandshake(const bool reject)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        rejectHandshake_ = reject;
    }

    std::size_t launches() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return launches_;
    }

    FakeLanguageServer& latest()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return *fakes_.back();
    }

private:
    mutable std::mutex                               mutex_;
    std::vector<std::unique_ptr<FakeLanguageServer>> fakes_;
    std::size_t                                      launches_{0};
    bool                                             failSpawn_{false};
    bool                                             rejectHandshake_{false};
};

std::vector<ServerConfig> fakeCatalog()
{
    return {
        ServerConfig{"rust", "fake-rust-server", {}, {}, {"rs"}},
        ServerConfig{"python", "fake-python-server", {}, {}, {"py", "pyi"}},
        ServerConfig{"starlark", "fake-starlark-server", {}, {}, {"py", "bzl"}},
    };
}

codeintel::lsp::ManagerOptions fastOptions()
{
    codeintel::lsp::ManagerOptions options;
    options.requestTimeout   = std::chrono::milliseconds(3000);
    options.handshakeTimeout = std::chrono::milliseconds(3000);
    options.shutdownTimeout  = std::chrono::milliseconds(500);
    return options;
}

bool testRouting()
{
    FakeFleet     fleet;
    ServerManager manager(WorkspaceRoot, fakeCatalog(), fastOptions(), fleet.launcher());
    if (manager.languageForFile("src/main.rs") != std::optional<std::string>("rust") ||
        manager.languageForFile("/abs/Types.PYI") != std::optional<std::string>("python") ||
        manager.languageForFile("BUILD.bzl") != std::optional<std::string>("starlark"))
    {
        std::cerr << "file routing by extension incorrect\n";
        return false;
    }
    if (manager.languageForFile("tool.py") != std::optional<std::string>("python"))
    {
        std::cerr << "the first catalog entry must win on shared extensions\n";
        return false;
    }
    if (manager.resolve("Makefile") || manager.resolve("notes.txt"))
    {
        std::cerr << "unknown extensions must not resolve\n";
        return false;
    }

    const auto unsupported = takeErrorDetails(manager.getOrCreate("notes.xyz").takeError());
    if (unsupported.kind != ErrorKind::UnsupportedLanguage ||
        unsupported.message != "no language server configured for .xyz files" || fleet.launches() != 0U)
    {
        std::cerr << "unsupported files must fail without launching: " << unsupported.message << "\n";
        return false;
    }
    const auto bare = takeErrorDetails(manager.getOrCreate("Makefile").takeError());
    if (bare.kind != ErrorKind::UnsupportedLanguage ||
        bare.message != "no language server configured for files without an extension")
    {
        std::cerr << "unexpected message for extensionless files: " << bare.message << "\n";
        return false;
    }
    if (manager.workspaceRoot() != WorkspaceRoot)
    {
        std::cerr << "workspace root must stay absolute and normalized\n";
        return false;
    }
    return true;
}

bool testSessionSharing()
{
    FakeFleet     fleet;
    ServerManager manager(WorkspaceRoot, fakeCatalog(), fastOptions(), fleet.launcher());

    auto first  = manager.getOrCreate("src/main.rs");
    auto second = manager.getOrCreate("src/lib.rs");
    if (!first || !second)
    {
        std::cerr << "expected rust sessions to start\n";
        llvm::consumeError(first.takeError());
        llvm::consumeError(second.takeError());
        return false;
    }
    if (!first->sharesSessionWith(*second) || fleet.launches() != 1U || manager.sessionCount() != 1U)
    {
        std::cerr << "files of one language must share a single session\n";
        return false;
    }
    if (!fleet.latest().waitForMethod("initialized", WaitTimeout))
    {
        std::cerr << "handshake must finish with initialized\n";
        return false;
    }

    std::vector<std::thread>                  workers;
    std::mutex                                handlesMutex;
    std::vector<codeintel::lsp::ClientHandle> handles;
    std::atomic_int                           failures{0};
    for (std::size_t index = 0; index < 8U; ++index)
    {
        workers.emplace_back([&manager, &handlesMutex, &handles, &failures]() {
            auto handle = manager.getOrCreate("pkg/module.py");
            if (!handle)
            {
                llvm::consumeError(handle.takeError());
                ++failures;
                return;
            }
            std::lock_guard<std::mutex> lock(handlesMutex);
            handles.push_back(std::move(*handle));
        });
    }
    for (std::thread& worker : workers)
    {
        worker.join();
    }
    if (failures.load() != 0 || handles.size() != 8U)
    {
        std::cerr << "concurrent first use must succeed for every caller\n";
        return false;
    }
    for (const auto& handle : handles)
    {
        if (!handle.sharesSessionWith(handles.front()) || handle.language() != "python")
        {
            std::cerr << "concurrent first use must yield one python session\n";
            return false;
        }
    }
    if (fleet.launches() != 2U || manager.sessionCount() != 2U)
    {
        std::cerr << "concurrent first use must launch exactly one server\n";
        return false;
    }

    manager.shutdownAll();
    if (manager.sessionCount() != 0U || first->isAlive() || handles.front().isAlive())
    {
        std::cerr << "shutdownAll must close and forget every session\n";
        return false;
    }
    return true;
}

bool testFailuresAreNotCached()
{
    FakeFleet     fleet;
    ServerManager manager(WorkspaceRoot, fakeCatalog(), fastOptions(), fleet.launcher());

    fleet.setFailSpawn(true);
    const auto spawn = takeErrorDetails(manager.getOrCreate("src/main.rs").takeError());
    if (spawn.kind != ErrorKind::SpawnFailure || manager.sessionCount() != 0U)
    {
        std::cerr << "spawn failures must propagate and not be cached\n";
        return false;
    }

    fleet.setFailSpawn(false);
    fleet.setRejectHandshake(true);
    const auto handshake = takeErrorDetails(manager.getOrCreate("src/main.rs").takeError());
    if (handshake.kind != ErrorKind::HandshakeFailure ||
        handshake.message.rfind("Failed to initialize rust language server: ", 0) != 0U ||
        manager.sessionCount() != 0U)
    {
        std::cerr << "handshake failures must propagate and not be cached: " << handshake.message << "\n";
        return false;
    }

    fleet.setRejectHandshake(false);
    auto recovered = manager.getOrCreate("src/main.rs");
    if (!recovered || fleet.launches() != 3U || manager.sessionCount() != 1U)
    {
        std::cerr << "a later call must retry after failures\n";
        if (!recovered)
        {
            llvm::consumeError(recovered.takeError());
        }
        return false;
    }
    return true;
}

bool testRestartAfterExit()
{
    FakeFleet     fleet;
    ServerManager manager(WorkspaceRoot, fakeCatalog(), fastOptions(), fleet.launcher());

    auto original = manager.getOrCreate("src/main.rs");
    if (!original)
    {
        std::cerr << "expected rust session to start\n";
        llvm::consumeError(original.takeError());
        return false;
    }
    fleet.latest().stop();
    if (!codeintel::test::waitUntil([&original]() { return !original->isAlive(); }, WaitTimeout))
    {
        std::cerr << "session must close when its server exits\n";
        return false;
    }

    auto restarted = manager.getOrCreate("src/main.rs");
    if (!restarted || restarted->sharesSessionWith(*original) || !restarted->isAlive() || fleet.launches() != 2U ||
        manager.sessionCount() != 1U)
    {
        std::cerr << "an exited server must be replaced on next use\n";
        if (!restarted)
        {
            llvm::consumeError(restarted.takeError());
        }
        return false;
    }
    return true;
}

bool testHandleOutlivesManager()
{
    FakeFleet                                   fleet;
    std::optional<codeintel::lsp::ClientHandle> survivor;
    {
        ServerManager manager(WorkspaceRoot, fakeCatalog(), fastOptions(), fleet.launcher());
        auto          handle = manager.getOrCreate("src/main.py");
        if (!handle)
        {
            std::cerr << "expected python session to start\n";
            llvm::consumeError(handle.takeError());
            return false;
        }
        survivor.emplace(std::move(*handle));
    }
    if (survivor->isAlive())
    {
        std::cerr << "destroying the manager must close its sessions\n";
        return false;
    }

    auto       items   = survivor->completion("src/main.py", codeintel::lsp::Position{0, 0});
    const auto details = takeErrorDetails(items.takeError());
    if (details.kind != ErrorKind::SessionClosed)
    {
        std::cerr << "a handle used after its manager is gone must report a closed session: " << details.message
                  << "\n";
        return false;
    }
    return true;
}

bool testDefaultLauncher()
{
    ServerManager manager(WorkspaceRoot,
                          {ServerConfig{"ghost", "/nonexistent/codeintel-ghost-server", {}, {}, {"ghost"}}},
                          fastOptions());
    const auto details = takeErrorDetails(manager.getOrCreate("file.ghost").takeError());
    if (details.kind != ErrorKind::SpawnFailure ||
        details.message.find("/nonexistent/codeintel-ghost-server") == std::string::npos)
    {
        std::cerr << "missing server binaries must be spawn failures: " << details.message << "\n";
        return false;
    }
    return true;
}

}  // namespace

bool runServerManagerTests()
{
    bool ok = true;
    ok      = testRouting() && ok;
    ok      = testSessionSharing() && ok;
    ok      = testFailuresAreNotCached() && ok;
    ok      = testRestartAfterExit() && ok;
    ok      = testHandleOutlivesManager() && ok;
    ok      = testDefaultLauncher() && ok;
    return ok;
}
