//===----------------------------------------------------------------------===//
//
// Part of the codeintel project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Process-wide diagnostic logging to `llvm::errs()`.
///
/// Lines are written as `[codeintel][<component>] <message>` and serialized
/// across threads. Session reader/driver loops, child stderr forwarding, and
/// the manager all log through this sink.
///
//===----------------------------------------------------------------------===//
#ifndef CODEINTEL_SUPPORT_LOG_H
#define CODEINTEL_SUPPORT_LOG_H

#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"

namespace codeintel
{

/// @brief Log line severity, most severe first.
enum class LogLevel
{
    /// @brief Failures that abort an operation.
    Error,

    /// @brief Recoverable problems.
    Warning,

    /// @brief Lifecycle events (server start, shutdown).
    Info,

    /// @brief Protocol-level tracing.
    Debug,
};

/// @brief Sets the most verbose level that is still emitted.
/// @param[in] level New threshold.
void setLogLevel(LogLevel level);

/// @brief Returns the current threshold.
/// @return Most verbose level that is emitted.
[[nodiscard]] LogLevel logLevel();

/// @brief Returns whether a line at `level` would be emitted.
/// @param[in] level Candidate level.
/// @return `true` when `level` passes the threshold.
[[nodiscard]] bool isLogEnabled(LogLevel level);

/// @brief Emits one log line.
/// @param[in] level Line severity.
/// @param[in] component Short component tag, typically a language name.
/// @param[in] message Message text.
void log(LogLevel level, llvm::StringRef component, const llvm::Twine& message);

inline void logError(llvm::StringRef component, const llvm::Twine& message)
{
    log(LogLevel::Error, component, message);
}

inline void logWarning(llvm::StringRef component, const llvm::Twine& message)
{
    log(LogLevel::Warning, component, message);
}

inline void logInfo(llvm::StringRef component, const llvm::Twine& message)
{
    log(LogLevel::Info, component, message);
}

inline void logDebug(llvm::StringRef component, const llvm::Twine& message)
{
    log(LogLevel::Debug, component, message);
}

}  // namespace codeintel

#endif  // CODEINTEL_SUPPORT_LOG_H
