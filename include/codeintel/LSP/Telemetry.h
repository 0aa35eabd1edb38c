//===----------------------------------------------------------------------===//
//
// Part of the codeintel project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Request telemetry aggregation and sink integration.
///
/// Sessions record one sample per finished request. Samples are counted per
/// method and status and forwarded to an optional sink for tracing and tests.
///
//===----------------------------------------------------------------------===//
#ifndef CODEINTEL_LSP_TELEMETRY_H
#define CODEINTEL_LSP_TELEMETRY_H

#include "codeintel/LSP/RequestResult.h"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace codeintel::lsp
{

/// @brief Telemetry sample for a finished request.
struct RequestMetric final
{
    /// @brief Session language.
    std::string language;

    /// @brief LSP method name.
    std::string method;

    /// @brief Time from submission to resolution in microseconds.
    std::uint64_t latencyMicros{0};

    /// @brief Request outcome.
    RequestStatus status{RequestStatus::Completed};
};

/// @brief Sink callback invoked for each telemetry sample.
using RequestMetricSink = std::function<void(const RequestMetric&)>;

/// @brief Thread-safe request telemetry recorder.
class Telemetry final
{
public:
    /// @brief Sets the sink callback for newly recorded metrics.
    /// @param[in] sink Sink callback. Empty sink disables forwarding.
    void setSink(RequestMetricSink sink);

    /// @brief Records one request metric sample.
    /// @param[in] metric Sample to record.
    void record(const RequestMetric& metric);

    /// @brief Returns total recorded request count for the method.
    [[nodiscard]] std::uint64_t requestCount(std::string_view method) const;

    /// @brief Returns recorded request count for the method and outcome.
    [[nodiscard]] std::uint64_t requestCount(std::string_view method, RequestStatus status) const;

private:
    mutable std::mutex                                                     mutex_;
    RequestMetricSink                                                      sink_;
    std::unordered_map<std::string, std::map<RequestStatus, std::uint64_t>> requestCounts_;
};

}  // namespace codeintel::lsp

#endif  // CODEINTEL_LSP_TELEMETRY_H
