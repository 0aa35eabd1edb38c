//===----------------------------------------------------------------------===//
//
// Part of the codeintel project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements request telemetry recording and sink forwarding.
///
//===----------------------------------------------------------------------===//

#include "codeintel/LSP/Telemetry.h"

#include <utility>

namespace codeintel::lsp
{

void Telemetry::setSink(RequestMetricSink sink)
{
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void Telemetry::record(const RequestMetric& metric)
{
    RequestMetricSink sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++requestCounts_[metric.method][metric.status];
        sink = sink_;
    }
    if (sink)
    {
        sink(metric);
    }
}

std::uint64_t Telemetry::requestCount(const std::string_view method) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto                  it = requestCounts_.find(std::string(method));
    if (it == requestCounts_.end())
    {
        return 0U;
    }
    std::uint64_t total = 0U;
    for (const auto& [status, count] : it->second)
    {
        total += count;
    }
    return total;
}

std::uint64_t Telemetry::requestCount(const std::string_view method, const RequestStatus status) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto                  it = requestCounts_.find(std::string(method));
    if (it == requestCounts_.end())
    {
        return 0U;
    }
    const auto statusIt = it->second.find(status);
    return statusIt == it->second.end() ? 0U : statusIt->second;
}

}  // namespace codeintel::lsp
