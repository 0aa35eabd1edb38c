//===----------------------------------------------------------------------===//
//
// Part of the codeintel project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Scriptable in-process language server used by session and tool tests.
///
/// The fake speaks framed JSON-RPC over a pair of pipes and answers requests
/// from per-method handlers on its own thread. `initialize` and `shutdown`
/// are answered by default; other requests get a `null` result unless a
/// handler is installed.
///
//===----------------------------------------------------------------------===//
#ifndef CODEINTEL_TEST_FAKE_LANGUAGE_SERVER_H
#define CODEINTEL_TEST_FAKE_LANGUAGE_SERVER_H

#include "codeintel/LSP/Error.h"
#include "codeintel/LSP/ServerProcess.h"
#include "codeintel/Support/FdStream.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/JSON.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace codeintel::test
{

class FakeLanguageServer final
{
public:
    /// @brief Handles one incoming request or notification on the server thread.
    using Handler = std::function<void(FakeLanguageServer& server, const llvm::json::Object& message)>;

    FakeLanguageServer();
    ~FakeLanguageServer();

    FakeLanguageServer(const FakeLanguageServer&)            = delete;
    FakeLanguageServer& operator=(const FakeLanguageServer&) = delete;

    /// @brief Returns the client side of the connection. Call once.
    [[nodiscard]] std::unique_ptr<lsp::ServerProcess> takeProcess();

    /// @brief Installs or replaces the handler for a method.
    void on(const std::string& method, Handler handler);

    void reply(const llvm::json::Value& id, llvm::json::Value result);
    void replyError(const llvm::json::Value& id, std::int64_t code, llvm::StringRef message);

    /// @brief Writes one framed message to the client.
    void send(const llvm::json::Value& message);

    /// @brief Writes raw bytes to the client.
    void sendRaw(const std::string& bytes);

    /// @brief Closes the server's output and ends its loop, as a crash would.
    void stop();

    [[nodiscard]] bool stopped() const
    {
        return stopping_.load();
    }

    /// @brief Snapshot of every message received so far.
    [[nodiscard]] std::vector<llvm::json::Value> received() const;

    /// @brief Number of received messages with the given method.
    [[nodiscard]] std::size_t countMethod(llvm::StringRef method) const;

    /// @brief Waits until a received message satisfies `predicate`.
    [[nodiscard]] bool waitForMessage(const std::function<bool(const llvm::json::Object&)>& predicate,
                                      std::chrono::milliseconds                            timeout);

    /// @brief Waits until a message with the given method arrives.
    [[nodiscard]] bool waitForMethod(llvm::StringRef method, std::chrono::milliseconds timeout);

private:
    void run();
    void dispatch(const llvm::json::Object& message);

    UniqueFd                        clientWrite_;
    UniqueFd                        clientRead_;
    int                             inFd_{-1};
    std::unique_ptr<FdInputStream>  in_;
    std::unique_ptr<FdOutputStream> out_;

    std::mutex writeMutex_;
    bool       outputClosed_{false};

    mutable std::mutex             handlersMutex_;
    std::map<std::string, Handler> handlers_;

    mutable std::mutex             receivedMutex_;
    std::condition_variable        receivedCv_;
    std::vector<llvm::json::Value> received_;

    std::atomic_bool stopping_{false};
    bool             processTaken_{false};
    std::thread      thread_;
};

/// @brief Polls `predicate` until it holds or `timeout` elapses.
[[nodiscard]] bool waitUntil(const std::function<bool()>& predicate, std::chrono::milliseconds timeout);

/// @brief Kind and text of a consumed error.
struct ErrorDetails final
{
    std::optional<lsp::ErrorKind> kind;
    std::string                   message;
};

/// @brief Consumes `error`; success yields an empty kind and message.
[[nodiscard]] ErrorDetails takeErrorDetails(llvm::Error error);

/// @brief Parses a JSON test fixture, aborting on invalid input.
[[nodiscard]] llvm::json::Value parseJson(llvm::StringRef text);

/// @brief `object[key]` as a string; empty when `object` is null or the field is absent.
[[nodiscard]] std::string stringField(const llvm::json::Object* object, llvm::StringRef key);

/// @brief `object[key]` as an integer, if present.
[[nodiscard]] std::optional<std::int64_t> integerField(const llvm::json::Object* object, llvm::StringRef key);

/// @brief `object[key]` as a boolean, if present.
[[nodiscard]] std::optional<bool> booleanField(const llvm::json::Object* object, llvm::StringRef key);

}  // namespace codeintel::test

#endif  // CODEINTEL_TEST_FAKE_LANGUAGE_SERVER_H
