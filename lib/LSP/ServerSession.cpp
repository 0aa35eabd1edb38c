//===----------------------------------------------------------------------===//
//
// Part of the codeintel project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements language-server sessions: handshake, driver and reader loops,
/// request correlation, and shutdown.
///
//===----------------------------------------------------------------------===//

#include "codeintel/LSP/ServerSession.h"

#include "codeintel/LSP/Error.h"
#include "codeintel/LSP/JsonRpcIO.h"
#include "codeintel/Support/Log.h"
#include "codeintel/Version.h"

#include "llvm/Support/Path.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <future>
#include <mutex>
#include <thread>
#include <unistd.h>
#include <unordered_map>
#include <utility>

namespace codeintel::lsp
{
namespace
{

constexpr std::int64_t MethodNotFound = -32601;

/// One-shot completion slot for an outstanding request.
struct PendingRequest final
{
    explicit PendingRequest(std::string requestMethod)
        : method(std::move(requestMethod))
        , submitted(std::chrono::steady_clock::now())
    {
    }

    /// Resolves the slot unless it already was.
    bool resolve(RequestResult result)
    {
        if (resolved.exchange(true))
        {
            return false;
        }
        promise.set_value(std::move(result));
        return true;
    }

    std::string                           method;
    std::chrono::steady_clock::time_point submitted;
    std::promise<RequestResult>           promise;
    std::atomic_bool                      resolved{false};

    /// Assigned by the driver under the correlation-table lock; 0 until then.
    std::int64_t id{0};
};

enum class OutboundKind
{
    Request,
    Notification,
    Response,
};

struct OutboundMessage final
{
    OutboundKind                    kind{OutboundKind::Notification};
    std::string                     method;
    llvm::json::Value               payload{nullptr};
    std::shared_ptr<PendingRequest> pending;
};

RequestResult failure(const RequestStatus status, std::string message)
{
    RequestResult result;
    result.status       = status;
    result.errorMessage = std::move(message);
    return result;
}

llvm::json::Object envelope(llvm::StringRef method, llvm::json::Value params)
{
    llvm::json::Object message{{"jsonrpc", "2.0"}, {"method", method}};
    if (params.kind() != llvm::json::Value::Null)
    {
        message["params"] = std::move(params);
    }
    return message;
}

std::string workspaceFolderName(llvm::StringRef rootUri)
{
    const std::string path = uriToPath(rootUri);
    llvm::StringRef   name = llvm::sys::path::filename(llvm::StringRef(path).rtrim('/'));
    return name.empty() ? std::string("workspace") : name.str();
}

}  // namespace

llvm::StringRef sessionStateName(const SessionState state)
{
    switch (state)
    {
    case SessionState::Starting:
        return "starting";
    case SessionState::Initializing:
        return "initializing";
    case SessionState::Ready:
        return "ready";
    case SessionState::Closed:
        return "closed";
    }
    return "unknown";
}

class ServerSession::Impl final
{
public:
    Impl(std::string                    language,
         std::string                    rootUri,
         std::unique_ptr<ServerProcess> process,
         ManagerOptions                 options,
         std::shared_ptr<Telemetry>     telemetry)
        : language_(std::move(language))
        , rootUri_(std::move(rootUri))
        , process_(std::move(process))
        , options_(options)
        , telemetry_(std::move(telemetry))
        , transport_(process_->output(), process_->input())
    {
    }

    ~Impl()
    {
        shutdown();
    }

    llvm::Error initialize()
    {
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            if (state_ != SessionState::Starting)
            {
                return makeLspError(ErrorKind::HandshakeFailure,
                                    llvm::Twine(language_) + " session cannot initialize in state " +
                                        sessionStateName(state_));
            }
            state_ = SessionState::Initializing;
        }
        auto         pending = std::make_shared<PendingRequest>("initialize");
        auto         future  = pending->promise.get_future();
        std::int64_t id      = 0;
        {
            std::lock_guard<std::mutex> lock(pendingMutex_);
            id = registerLocked(pending);
        }
        // Started after registration so an early server exit fails the handshake.
        reader_ = std::thread([this]() { readLoop(); });

        llvm::json::Object message = envelope("initialize", initializeParams());
        message["id"]              = id;
        logDebug(language_, "--> initialize (id " + llvm::Twine(id) + ")");
        if (!transport_.writeMessage(llvm::json::Value(std::move(message))))
        {
            forget(id);
            pending->resolve(failure(RequestStatus::WriteFailed, "failed to write initialize request"));
        }

        const RequestResult result = await(pending, future, options_.handshakeTimeout);
        recordMetric(*pending, result);
        if (!result.ok())
        {
            return failHandshake(result.errorMessage);
        }

        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            if (const auto* response = result.value.getAsObject())
            {
                if (const auto* capabilities = response->get("capabilities"))
                {
                    capabilities_ = *capabilities;
                }
            }
        }

        if (!transport_.writeMessage(llvm::json::Value(envelope("initialized", llvm::json::Object{}))))
        {
            return failHandshake("failed to write initialized notification");
        }

        bool closedEarly = false;
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            closedEarly = state_ == SessionState::Closed;
            if (!closedEarly)
            {
                state_ = SessionState::Ready;
            }
        }
        if (closedEarly)
        {
            return failHandshake("server closed its output during the handshake");
        }
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            driverExited_ = false;
        }
        driver_ = std::thread([this]() { driveLoop(); });
        logInfo(language_, "session ready for " + llvm::Twine(rootUri_));
        return llvm::Error::success();
    }

    RequestResult send(llvm::StringRef method, llvm::json::Value params, std::optional<std::chrono::milliseconds> timeout)
    {
        auto pending = std::make_shared<PendingRequest>(method.str());
        auto future  = pending->promise.get_future();

        if (state() == SessionState::Closed)
        {
            pending->resolve(failure(RequestStatus::SessionClosed, "client is closed"));
        }
        else
        {
            OutboundMessage message;
            message.kind    = OutboundKind::Request;
            message.method  = method.str();
            message.payload = std::move(params);
            message.pending = pending;
            if (!enqueue(std::move(message)))
            {
                pending->resolve(failure(RequestStatus::SessionClosed, "client is closed"));
            }
        }

        RequestResult result = await(pending, future, timeout ? *timeout : options_.requestTimeout);
        recordMetric(*pending, result);
        return result;
    }

    bool notify(llvm::StringRef method, llvm::json::Value params)
    {
        if (state() == SessionState::Closed)
        {
            return false;
        }
        OutboundMessage message;
        message.kind    = OutboundKind::Notification;
        message.method  = method.str();
        message.payload = std::move(params);
        return enqueue(std::move(message));
    }

    void shutdown()
    {
        std::lock_guard<std::mutex> shutdownLock(shutdownMutex_);
        if (shutdownDone_)
        {
            return;
        }
        shutdownDone_ = true;

        if (state() == SessionState::Ready)
        {
            const RequestResult result = send("shutdown", nullptr, options_.shutdownTimeout);
            if (!result.ok())
            {
                logDebug(language_, "shutdown request failed: " + llvm::Twine(result.errorMessage));
            }
            if (result.status != RequestStatus::SessionClosed)
            {
                notify("exit", nullptr);
            }
        }

        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            stopping_ = true;
            queueCv_.notify_all();
            // A driver blocked on a stalled pipe is released by terminate() below.
            queueCv_.wait_for(lock, options_.shutdownTimeout, [this]() { return driverExited_; });
        }
        setState(SessionState::Closed);

        process_->terminate();
        if (driver_.joinable())
        {
            driver_.join();
        }
        if (reader_.joinable())
        {
            reader_.join();
        }
        process_->closeInput();

        std::deque<OutboundMessage> unsent;
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            unsent.swap(queue_);
        }
        for (OutboundMessage& message : unsent)
        {
            if (message.pending)
            {
                message.pending->resolve(failure(RequestStatus::SessionClosed, "session shut down"));
            }
        }
        failAllPending("session shut down");
        logInfo(language_, "session closed");
    }

    SessionState state() const
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        return state_;
    }

    const std::string& language() const
    {
        return language_;
    }

    const std::string& rootUri() const
    {
        return rootUri_;
    }

    llvm::json::Value serverCapabilities() const
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        return capabilities_;
    }

    std::optional<std::vector<Diagnostic>> pushedDiagnostics(llvm::StringRef uri) const
    {
        std::lock_guard<std::mutex> lock(diagnosticsMutex_);
        const auto                  it = diagnostics_.find(uri.str());
        if (it == diagnostics_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::size_t pendingRequestCount() const
    {
        std::lock_guard<std::mutex> lock(pendingMutex_);
        return pending_.size();
    }

private:
    llvm::json::Value initializeParams() const
    {
        const llvm::json::Array markupFormats{"markdown", "plaintext"};
        return llvm::json::Object{
            {"processId", static_cast<std::int64_t>(::getpid())},
            {"clientInfo", llvm::json::Object{{"name", "codeintel"}, {"version", kVersionString}}},
            {"rootUri", rootUri_},
            {"capabilities",
             llvm::json::Object{
                 {"textDocument",
                  llvm::json::Object{
                      {"completion",
                       llvm::json::Object{
                           {"completionItem",
                            llvm::json::Object{
                                {"snippetSupport", true},
                                {"documentationFormat", llvm::json::Array(markupFormats)},
                            }}}},
                      {"definition", llvm::json::Object{{"linkSupport", true}}},
                      {"references", llvm::json::Object{}},
                      {"hover", llvm::json::Object{{"contentFormat", llvm::json::Array(markupFormats)}}},
                      {"documentSymbol", llvm::json::Object{{"hierarchicalDocumentSymbolSupport", true}}},
                      {"publishDiagnostics", llvm::json::Object{}},
                      {"diagnostic", llvm::json::Object{{"dynamicRegistration", false}}},
                  }},
                 {"workspace", llvm::json::Object{{"workspaceFolders", true}, {"configuration", true}}},
                 {"window", llvm::json::Object{{"workDoneProgress", true}}},
             }},
            {"workspaceFolders",
             llvm::json::Array{llvm::json::Object{{"uri", rootUri_}, {"name", workspaceFolderName(rootUri_)}}}},
        };
    }

    llvm::Error failHandshake(const std::string& cause)
    {
        logError(language_, "handshake failed: " + llvm::Twine(cause));
        shutdown();
        return makeLspError(ErrorKind::HandshakeFailure,
                            "Failed to initialize " + language_ + " language server: " + cause);
    }

    void setState(const SessionState state)
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        state_ = state;
    }

    /// Queues a message for the driver. Fails once stopping.
    bool enqueue(OutboundMessage message)
    {
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (stopping_)
            {
                return false;
            }
            queue_.push_back(std::move(message));
        }
        queueCv_.notify_all();
        return true;
    }

    /// Assigns the next id and registers `pending`. Requires `pendingMutex_`.
    std::int64_t registerLocked(const std::shared_ptr<PendingRequest>& pending)
    {
        const std::int64_t id = nextId_++;
        pending->id           = id;
        pending_.emplace(id, pending);
        return id;
    }

    void forget(const std::int64_t id)
    {
        std::lock_guard<std::mutex> lock(pendingMutex_);
        pending_.erase(id);
    }

    std::shared_ptr<PendingRequest> take(const std::int64_t id)
    {
        std::lock_guard<std::mutex> lock(pendingMutex_);
        const auto                  it = pending_.find(id);
        if (it == pending_.end())
        {
            return nullptr;
        }
        std::shared_ptr<PendingRequest> pending = std::move(it->second);
        pending_.erase(it);
        return pending;
    }

    RequestResult await(const std::shared_ptr<PendingRequest>& pending,
                        std::future<RequestResult>&            future,
                        const std::chrono::milliseconds        timeout)
    {
        if (future.wait_for(timeout) != std::future_status::ready)
        {
            std::int64_t cancelId = 0;
            {
                std::lock_guard<std::mutex> lock(pendingMutex_);
                if (pending->resolve(failure(RequestStatus::TimedOut,
                                             pending->method + " timed out after " +
                                                 std::to_string(timeout.count()) + " ms")))
                {
                    cancelId = pending->id;
                    if (cancelId != 0)
                    {
                        pending_.erase(cancelId);
                    }
                }
            }
            if (cancelId != 0 && pending->method != "initialize")
            {
                notify("$/cancelRequest", llvm::json::Object{{"id", cancelId}});
            }
        }
        return future.get();
    }

    void failAllPending(const std::string& reason)
    {
        std::unordered_map<std::int64_t, std::shared_ptr<PendingRequest>> orphaned;
        {
            std::lock_guard<std::mutex> lock(pendingMutex_);
            orphaned.swap(pending_);
        }
        for (auto& [id, pending] : orphaned)
        {
            pending->resolve(failure(RequestStatus::SessionClosed, reason));
        }
    }

    void recordMetric(const PendingRequest& pending, const RequestResult& result)
    {
        if (!telemetry_)
        {
            return;
        }
        const auto latency = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() -
                                                                                   pending.submitted);
        telemetry_->record(RequestMetric{language_,
                                         pending.method,
                                         static_cast<std::uint64_t>(latency.count()),
                                         result.status});
    }

    /// Marks the session closed after the server went away.
    void markClosed(const std::string& reason)
    {
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            if (state_ == SessionState::Closed)
            {
                return;
            }
            state_ = SessionState::Closed;
        }
        logWarning(language_, "session closed: " + llvm::Twine(reason));
        peerClosed_.store(true);
        failAllPending(reason);
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            stopping_ = true;
        }
        queueCv_.notify_all();
    }

    void driveLoop()
    {
        while (true)
        {
            OutboundMessage message;
            {
                std::unique_lock<std::mutex> lock(queueMutex_);
                queueCv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
                if (queue_.empty())
                {
                    break;
                }
                message = std::move(queue_.front());
                queue_.pop_front();
            }
            dispatch(std::move(message));
        }

        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            driverExited_ = true;
        }
        queueCv_.notify_all();

        if (peerClosed_.load())
        {
            process_->terminate();
        }
    }

    void dispatch(OutboundMessage message)
    {
        if (message.kind == OutboundKind::Request)
        {
            std::int64_t id = 0;
            {
                // Checked under the table lock so `failAllPending` cannot drain it in between.
                std::lock_guard<std::mutex> lock(pendingMutex_);
                if (message.pending->resolved.load())
                {
                    // The caller gave up before the request was written.
                    return;
                }
                if (state() == SessionState::Closed)
                {
                    message.pending->resolve(failure(RequestStatus::SessionClosed, "client is closed"));
                    return;
                }
                id = registerLocked(message.pending);
            }

            llvm::json::Object request = envelope(message.method, std::move(message.payload));
            request["id"]              = id;
            logDebug(language_, "--> " + llvm::Twine(message.method) + " (id " + llvm::Twine(id) + ")");
            if (!transport_.writeMessage(llvm::json::Value(std::move(request))))
            {
                forget(id);
                message.pending->resolve(
                    failure(RequestStatus::WriteFailed, "failed to write " + message.method + " request to server"));
                handleWriteFailure();
            }
            return;
        }

        if (state() == SessionState::Closed)
        {
            logDebug(language_, "dropping outbound " + llvm::Twine(message.method) + " on closed session");
            return;
        }

        llvm::json::Value frame = message.kind == OutboundKind::Response
                                      ? std::move(message.payload)
                                      : llvm::json::Value(envelope(message.method, std::move(message.payload)));
        logDebug(language_, "--> " + llvm::Twine(message.method));
        if (!transport_.writeMessage(frame))
        {
            logWarning(language_, "failed to write " + llvm::Twine(message.method) + " to server");
            handleWriteFailure();
        }
    }

    void handleWriteFailure()
    {
        if (!transport_.writable())
        {
            markClosed("server stdin is no longer writable");
        }
    }

    void readLoop()
    {
        while (true)
        {
            llvm::json::Value message(nullptr);
            std::string       error;
            const ReadStatus  status = transport_.readMessage(message, error);
            if (status == ReadStatus::EndOfStream)
            {
                if (!error.empty())
                {
                    logWarning(language_, "read ended: " + llvm::Twine(error));
                }
                break;
            }
            if (status == ReadStatus::Malformed)
            {
                logWarning(language_, "malformed message from server: " + llvm::Twine(error));
                continue;
            }
            handleIncoming(message);
        }
        markClosed("language server closed its output");
    }

    void handleIncoming(const llvm::json::Value& message)
    {
        const auto* object = message.getAsObject();
        if (!object)
        {
            logWarning(language_, "ignoring non-object JSON-RPC message");
            return;
        }
        const auto* id     = object->get("id");
        const auto  method = object->getString("method");
        if (method && id)
        {
            handleServerRequest(*method, *id, object->get("params"));
        }
        else if (method)
        {
            handleNotification(*method, object->get("params"));
        }
        else if (id)
        {
            handleResponse(*id, *object);
        }
        else
        {
            logWarning(language_, "ignoring JSON-RPC message without id or method");
        }
    }

    void handleResponse(const llvm::json::Value& idValue, const llvm::json::Object& response)
    {
        const auto id = idValue.getAsInteger();
        if (!id)
        {
            logWarning(language_, "ignoring response with non-integer id");
            return;
        }
        const std::shared_ptr<PendingRequest> pending = take(*id);
        if (!pending)
        {
            logDebug(language_, "dropping response for unknown request id " + llvm::Twine(*id));
            return;
        }
        logDebug(language_, "<-- " + llvm::Twine(pending->method) + " (id " + llvm::Twine(*id) + ")");

        RequestResult result;
        if (const auto* error = response.get("error"))
        {
            result.status = RequestStatus::ServerError;
            result.value  = *error;
            if (const auto* errorObject = error->getAsObject())
            {
                if (const auto code = errorObject->getInteger("code"))
                {
                    result.serverCode = *code;
                }
                if (const auto text = errorObject->getString("message"))
                {
                    result.errorMessage = text->str();
                }
            }
            if (result.errorMessage.empty())
            {
                result.errorMessage = "server returned an error";
            }
            if (result.serverCode)
            {
                result.errorMessage += " (code " + std::to_string(*result.serverCode) + ")";
            }
        }
        else if (const auto* value = response.get("result"))
        {
            result.status = RequestStatus::Completed;
            result.value  = *value;
        }
        else
        {
            result.status       = RequestStatus::MalformedResponse;
            result.errorMessage = "response carries neither result nor error";
        }
        pending->resolve(std::move(result));
    }

    void handleServerRequest(llvm::StringRef method, const llvm::json::Value& id, const llvm::json::Value* params)
    {
        llvm::json::Object response{{"jsonrpc", "2.0"}, {"id", id}};
        if (method == "workspace/configuration")
        {
            llvm::json::Array results;
            if (const auto* paramsObject = params ? params->getAsObject() : nullptr)
            {
                if (const auto* items = paramsObject->getArray("items"))
                {
                    for (std::size_t i = 0; i < items->size(); ++i)
                    {
                        results.push_back(nullptr);
                    }
                }
            }
            response["result"] = std::move(results);
        }
        else if (method == "window/workDoneProgress/create" || method == "client/registerCapability" ||
                 method == "client/unregisterCapability")
        {
            response["result"] = nullptr;
        }
        else
        {
            logDebug(language_, "rejecting unsupported server request " + method);
            response["error"] = llvm::json::Object{{"code", MethodNotFound},
                                                   {"message", ("Method not found: " + method).str()}};
        }

        OutboundMessage message;
        message.kind    = OutboundKind::Response;
        message.method  = method.str();
        message.payload = std::move(response);
        if (!enqueue(std::move(message)))
        {
            logDebug(language_, "session stopping; not answering " + method);
        }
    }

    void handleNotification(llvm::StringRef method, const llvm::json::Value* params)
    {
        const auto* paramsObject = params ? params->getAsObject() : nullptr;
        if (method == "textDocument/publishDiagnostics")
        {
            if (paramsObject)
            {
                const auto  uri         = paramsObject->getString("uri");
                const auto* diagnostics = paramsObject->get("diagnostics");
                if (uri && diagnostics)
                {
                    if (auto parsed = parseDiagnosticList(*diagnostics))
                    {
                        logDebug(language_,
                                 "<-- publishDiagnostics " + *uri + " (" + llvm::Twine(parsed->size()) +
                                     " diagnostics)");
                        std::lock_guard<std::mutex> lock(diagnosticsMutex_);
                        diagnostics_.insert_or_assign(uri->str(), std::move(*parsed));
                        return;
                    }
                }
            }
            logWarning(language_, "ignoring malformed publishDiagnostics notification");
            return;
        }

        if (method == "window/logMessage" || method == "window/showMessage")
        {
            if (!paramsObject)
            {
                return;
            }
            const auto text = paramsObject->getString("message");
            const auto type = paramsObject->getInteger("type");
            if (!text)
            {
                return;
            }
            // MessageType: 1 error, 2 warning, 3 info, 4 log.
            const std::int64_t messageType = type ? *type : 4;
            const LogLevel     level       = messageType <= 2 ? LogLevel::Warning
                                             : messageType == 3 ? LogLevel::Info
                                                                : LogLevel::Debug;
            codeintel::log(level, language_, "server: " + *text);
            return;
        }

        logDebug(language_, "ignoring notification " + method);
    }

    const std::string              language_;
    const std::string              rootUri_;
    std::unique_ptr<ServerProcess> process_;
    const ManagerOptions           options_;
    std::shared_ptr<Telemetry>     telemetry_;
    JsonRpcStdioTransport          transport_;

    mutable std::mutex stateMutex_;
    SessionState       state_{SessionState::Starting};
    llvm::json::Value  capabilities_{llvm::json::Object{}};

    std::mutex                  queueMutex_;
    std::condition_variable     queueCv_;
    std::deque<OutboundMessage> queue_;
    bool                        stopping_{false};
    bool                        driverExited_{true};

    mutable std::mutex                                                pendingMutex_;
    std::unordered_map<std::int64_t, std::shared_ptr<PendingRequest>> pending_;
    std::int64_t                                                      nextId_{1};

    mutable std::mutex                                       diagnosticsMutex_;
    std::unordered_map<std::string, std::vector<Diagnostic>> diagnostics_;

    std::atomic_bool peerClosed_{false};
    std::mutex       shutdownMutex_;
    bool             shutdownDone_{false};
    std::thread      reader_;
    std::thread      driver_;
};

ServerSession::ServerSession(std::unique_ptr<Impl> impl)
    : impl_(std::move(impl))
{
}

ServerSession::~ServerSession() = default;

std::shared_ptr<ServerSession> ServerSession::create(std::string                    language,
                                                     std::string                    rootUri,
                                                     std::unique_ptr<ServerProcess> process,
                                                     ManagerOptions                 options,
                                                     std::shared_ptr<Telemetry>     telemetry)
{
    auto impl = std::make_unique<Impl>(std::move(language),
                                       std::move(rootUri),
                                       std::move(process),
                                       options,
                                       std::move(telemetry));
    return std::shared_ptr<ServerSession>(new ServerSession(std::move(impl)));
}

llvm::Error ServerSession::initialize()
{
    return impl_->initialize();
}

RequestResult ServerSession::send(llvm::StringRef                          method,
                                  llvm::json::Value                        params,
                                  std::optional<std::chrono::milliseconds> timeout)
{
    return impl_->send(method, std::move(params), timeout);
}

bool ServerSession::notify(llvm::StringRef method, llvm::json::Value params)
{
    return impl_->notify(method, std::move(params));
}

void ServerSession::shutdown()
{
    impl_->shutdown();
}

SessionState ServerSession::state() const
{
    return impl_->state();
}

const std::string& ServerSession::language() const
{
    return impl_->language();
}

const std::string& ServerSession::rootUri() const
{
    return impl_->rootUri();
}

llvm::json::Value ServerSession::serverCapabilities() const
{
    return impl_->serverCapabilities();
}

std::optional<std::vector<Diagnostic>> ServerSession::pushedDiagnostics(llvm::StringRef uri) const
{
    return impl_->pushedDiagnostics(uri);
}

std::size_t ServerSession::pendingRequestCount() const
{
    return impl_->pendingRequestCount();
}

}  // namespace codeintel::lsp
