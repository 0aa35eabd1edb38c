//===----------------------------------------------------------------------===//
//
// Part of the codeintel project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// One live connection to a language-server process.
///
/// A session runs two loops. The driver drains an unbounded outbound queue,
/// assigns request ids, registers completion slots, and writes frames. The
/// reader decodes frames, resolves slots by id, answers server-initiated
/// requests through the driver queue, and caches pushed diagnostics. Callers
/// block on their own slot with a deadline and never hold a lock while doing
/// so.
///
//===----------------------------------------------------------------------===//
#ifndef CODEINTEL_LSP_SERVER_SESSION_H
#define CODEINTEL_LSP_SERVER_SESSION_H

#include "codeintel/LSP/Protocol.h"
#include "codeintel/LSP/RequestResult.h"
#include "codeintel/LSP/ServerConfig.h"
#include "codeintel/LSP/ServerProcess.h"
#include "codeintel/LSP/Telemetry.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace codeintel::lsp
{

/// @brief Session lifecycle state.
enum class SessionState
{
    /// @brief Created; requests are queued but not written.
    Starting,

    /// @brief `initialize` sent, awaiting its response.
    Initializing,

    /// @brief Handshake complete; requests flow.
    Ready,

    /// @brief Terminal. New requests fail immediately.
    Closed,
};

/// @brief Returns a stable state name, e.g. `ready`.
[[nodiscard]] llvm::StringRef sessionStateName(SessionState state);

/// @brief Connection to one language-server process.
class ServerSession final
{
public:
    /// @brief Creates a session in `Starting` state.
    /// @param[in] language Language served.
    /// @param[in] rootUri Workspace root URI sent in `initialize`.
    /// @param[in] process Server process; owned by the session.
    /// @param[in] options Deadlines.
    /// @param[in] telemetry Optional telemetry recorder, shared with the session.
    /// @return Shared session.
    [[nodiscard]] static std::shared_ptr<ServerSession> create(std::string                    language,
                                                               std::string                    rootUri,
                                                               std::unique_ptr<ServerProcess> process,
                                                               ManagerOptions                 options   = {},
                                                               std::shared_ptr<Telemetry>     telemetry = nullptr);

    ~ServerSession();

    ServerSession(const ServerSession&)            = delete;
    ServerSession& operator=(const ServerSession&) = delete;

    /// @brief Performs the `initialize`/`initialized` handshake.
    ///
    /// Starts the reader loop, awaits the `initialize` response within the
    /// handshake deadline, stores the server capabilities, sends
    /// `initialized`, and starts the driver loop. On failure the session is
    /// shut down.
    ///
    /// @return Success, or a `HandshakeFailure` error naming the cause.
    [[nodiscard]] llvm::Error initialize();

    /// @brief Sends a request and blocks until it resolves.
    /// @param[in] method LSP method.
    /// @param[in] params Request params; `null` omits the field.
    /// @param[in] timeout Deadline; defaults to the request timeout option.
    /// @return Outcome envelope.
    [[nodiscard]] RequestResult send(llvm::StringRef                          method,
                                     llvm::json::Value                        params,
                                     std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// @brief Queues a notification.
    /// @return `false` when the session no longer accepts messages.
    bool notify(llvm::StringRef method, llvm::json::Value params);

    /// @brief Shuts the session down. Sends `shutdown`/`exit` when ready,
    /// stops both loops, and terminates the process. Idempotent.
    void shutdown();

    [[nodiscard]] SessionState       state() const;
    [[nodiscard]] const std::string& language() const;
    [[nodiscard]] const std::string& rootUri() const;

    /// @brief Capabilities object from the `initialize` response.
    [[nodiscard]] llvm::json::Value serverCapabilities() const;

    /// @brief Last diagnostics pushed for a document.
    /// @param[in] uri Document URI.
    /// @return Diagnostics, or `std::nullopt` when nothing was pushed.
    [[nodiscard]] std::optional<std::vector<Diagnostic>> pushedDiagnostics(llvm::StringRef uri) const;

    /// @brief Number of requests awaiting a response.
    [[nodiscard]] std::size_t pendingRequestCount() const;

private:
    class Impl;

    explicit ServerSession(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> impl_;
};

}  // namespace codeintel::lsp

#endif  // CODEINTEL_LSP_SERVER_SESSION_H
