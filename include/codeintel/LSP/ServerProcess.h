//===----------------------------------------------------------------------===//
//
// Part of the codeintel project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Language-server process boundary.
///
/// A session talks to its server through `ServerProcess`: an input stream
/// connected to the server's stdin and an output stream connected to its
/// stdout. `ChildProcess` is the production implementation; tests substitute
/// in-process servers connected by pipes.
///
//===----------------------------------------------------------------------===//
#ifndef CODEINTEL_LSP_SERVER_PROCESS_H
#define CODEINTEL_LSP_SERVER_PROCESS_H

#include "codeintel/LSP/ServerConfig.h"
#include "codeintel/Support/FdStream.h"
#include "llvm/Support/Error.h"

#include <atomic>
#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <sys/types.h>
#include <thread>

namespace codeintel::lsp
{

/// @brief Bidirectional byte channel to one language server.
class ServerProcess
{
public:
    virtual ~ServerProcess() = default;

    /// @brief Stream connected to the server's stdin.
    virtual std::ostream& input() = 0;

    /// @brief Stream connected to the server's stdout.
    virtual std::istream& output() = 0;

    /// @brief Closes the server's stdin so it observes end-of-file.
    virtual void closeInput() = 0;

    /// @brief Stops the server. Must be idempotent and must cause `output()`
    /// to reach end-of-file.
    virtual void terminate() = 0;

    /// @brief Operating-system process id, when there is one.
    [[nodiscard]] virtual std::optional<pid_t> processId() const = 0;
};

/// @brief Language server running as a child process with piped stdio.
class ChildProcess final : public ServerProcess
{
public:
    /// @brief Spawns `config.command` with `config.args` and `config.env`.
    /// @param[in] config Server launch configuration.
    /// @return Running process, or a `SpawnFailure` error.
    [[nodiscard]] static llvm::Expected<std::unique_ptr<ChildProcess>> spawn(const ServerConfig& config);

    ~ChildProcess() override;

    ChildProcess(const ChildProcess&)            = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    std::ostream&                      input() override;
    std::istream&                      output() override;
    void                               closeInput() override;
    void                               terminate() override;
    [[nodiscard]] std::optional<pid_t> processId() const override;

    /// @brief Exit status once the child has been reaped.
    [[nodiscard]] std::optional<int> exitStatus() const;

private:
    ChildProcess(std::string language, pid_t pid, UniqueFd stdinWrite, UniqueFd stdoutRead, UniqueFd stderrRead);

    void drainStderr(UniqueFd stderrRead);

    /// @brief Whether the child has exited, leaving it unreaped so its pid
    /// still reserves the process group id. Requires `mutex_`.
    [[nodiscard]] bool exitedLocked();

    /// @brief Reaps the child when it has exited. Requires `mutex_`.
    bool reapLocked(int options);

    std::string        language_;
    pid_t              pid_;
    FdOutputStream     stdin_;
    FdInputStream      stdout_;
    mutable std::mutex mutex_;
    bool               inputClosed_{false};
    bool               terminated_{false};
    std::optional<int> exitStatus_;
    std::atomic_bool   stderrStopping_{false};
    std::thread        stderrThread_;
};

/// @brief Ignores `SIGPIPE` so writes to a dead server fail instead of
/// terminating the host process. Safe to call repeatedly.
void ignoreBrokenPipeSignal();

}  // namespace codeintel::lsp

#endif  // CODEINTEL_LSP_SERVER_PROCESS_H
