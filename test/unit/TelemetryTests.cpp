//===----------------------------------------------------------------------===//
//
// Part of the codeintel project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "codeintel/LSP/Error.h"
#include "codeintel/LSP/RequestResult.h"
#include "codeintel/LSP/Telemetry.h"

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

bool runTelemetryTests()
{
    codeintel::lsp::Telemetry telemetry;
    telemetry.record({"rust", "textDocument/hover", 120U, codeintel::lsp::RequestStatus::Completed});

    std::vector<codeintel::lsp::RequestMetric> forwarded;
    telemetry.setSink([&forwarded](const codeintel::lsp::RequestMetric& metric) { forwarded.push_back(metric); });
    telemetry.record({"rust", "textDocument/hover", 9000U, codeintel::lsp::RequestStatus::TimedOut});
    telemetry.record({"python", "textDocument/hover", 80U, codeintel::lsp::RequestStatus::Completed});

    if (telemetry.requestCount("textDocument/hover") != 3U ||
        telemetry.requestCount("textDocument/hover", codeintel::lsp::RequestStatus::Completed) != 2U ||
        telemetry.requestCount("textDocument/hover", codeintel::lsp::RequestStatus::TimedOut) != 1U ||
        telemetry.requestCount("textDocument/definition") != 0U)
    {
        std::cerr << "telemetry counts incorrect\n";
        return false;
    }
    if (forwarded.size() != 2U || forwarded[0].language != "rust" || forwarded[0].latencyMicros != 9000U)
    {
        std::cerr << "sink must see only samples recorded after it was set\n";
        return false;
    }
    telemetry.setSink({});
    telemetry.record({"rust", "shutdown", 5U, codeintel::lsp::RequestStatus::Completed});
    if (forwarded.size() != 2U)
    {
        std::cerr << "an empty sink must disable forwarding\n";
        return false;
    }

    if (codeintel::lsp::requestStatusName(codeintel::lsp::RequestStatus::TimedOut) != "timed-out" ||
        codeintel::lsp::errorKindName(codeintel::lsp::ErrorKind::SessionClosed) != "session-closed" ||
        codeintel::lsp::errorKindForStatus(codeintel::lsp::RequestStatus::WriteFailed) !=
            codeintel::lsp::ErrorKind::TransportWriteFailure ||
        codeintel::lsp::errorKindForStatus(codeintel::lsp::RequestStatus::SessionClosed) !=
            codeintel::lsp::ErrorKind::SessionClosed)
    {
        std::cerr << "status and error kind names incorrect\n";
        return false;
    }

    codeintel::lsp::RequestResult result;
    result.status       = codeintel::lsp::RequestStatus::ServerError;
    result.errorMessage = "boom (code -32603)";
    result.serverCode   = -32603;
    std::optional<std::int64_t> serverCode;
    std::string                 message;
    llvm::handleAllErrors(codeintel::lsp::toError(result, "rust", "textDocument/hover"),
                          [&](const codeintel::lsp::LspError& error) {
                              serverCode = error.serverCode();
                              message    = error.text();
                          });
    if (serverCode != std::optional<std::int64_t>(-32603) || message != "rust textDocument/hover failed: boom (code -32603)")
    {
        std::cerr << "toError must keep the server code and name the request: " << message << "\n";
        return false;
    }

    // The generic LLVM error text is the description itself.
    std::string baseMessage;
    llvm::handleAllErrors(codeintel::lsp::makeLspError(codeintel::lsp::ErrorKind::SpawnFailure, "no such server"),
                          [&baseMessage](const llvm::ErrorInfoBase& error) { baseMessage = error.message(); });
    if (baseMessage != "no such server" ||
        llvm::toString(codeintel::lsp::makeLspError(codeintel::lsp::ErrorKind::Timeout, "late")) != "late")
    {
        std::cerr << "LspError must render through the LLVM error interface: " << baseMessage << "\n";
        return false;
    }

    if (codeintel::lsp::takeErrorKind(llvm::createStringError(llvm::inconvertibleErrorCode(), "plain")) ||
        codeintel::lsp::takeErrorKind(llvm::Error::success()) ||
        codeintel::lsp::takeErrorKind(codeintel::lsp::makeLspError(codeintel::lsp::ErrorKind::Timeout, "late")) !=
            codeintel::lsp::ErrorKind::Timeout)
    {
        std::cerr << "takeErrorKind must only recognise LspError payloads\n";
        return false;
    }
    return true;
}
