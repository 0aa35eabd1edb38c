//===----------------------------------------------------------------------===//
//
// Part of the codeintel project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the serialized `llvm::errs()` log sink.
///
//===----------------------------------------------------------------------===//

#include "codeintel/Support/Log.h"

#include "llvm/Support/raw_ostream.h"

#include <atomic>
#include <mutex>

namespace codeintel
{
namespace
{

std::atomic<LogLevel>& threshold()
{
    static std::atomic<LogLevel> level{LogLevel::Warning};
    return level;
}

std::mutex& sinkMutex()
{
    static std::mutex mutex;
    return mutex;
}

llvm::StringRef levelTag(const LogLevel level)
{
    switch (level)
    {
    case LogLevel::Error:
        return "error";
    case LogLevel::Warning:
        return "warning";
    case LogLevel::Info:
        return "info";
    case LogLevel::Debug:
        return "debug";
    }
    return "debug";
}

}  // namespace

void setLogLevel(const LogLevel level)
{
    threshold().store(level, std::memory_order_relaxed);
}

LogLevel logLevel()
{
    return threshold().load(std::memory_order_relaxed);
}

bool isLogEnabled(const LogLevel level)
{
    return static_cast<int>(level) <= static_cast<int>(logLevel());
}

void log(const LogLevel level, const llvm::StringRef component, const llvm::Twine& message)
{
    if (!isLogEnabled(level))
    {
        return;
    }

    std::lock_guard<std::mutex> lock(sinkMutex());
    llvm::errs() << "[codeintel]";
    if (!component.empty())
    {
        llvm::errs() << "[" << component << "]";
    }
    llvm::errs() << " " << levelTag(level) << ": " << message << "\n";
    llvm::errs().flush();
}

}  // namespace codeintel
