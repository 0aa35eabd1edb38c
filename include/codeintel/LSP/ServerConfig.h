//===----------------------------------------------------------------------===//
//
// Part of the codeintel project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Language-server catalog and manager runtime options.
///
/// The catalog maps languages to server launch commands and file extensions.
/// It starts from a built-in table and may be extended or overridden by a JSON
/// catalog file. Options control request deadlines and log verbosity.
///
//===----------------------------------------------------------------------===//
#ifndef CODEINTEL_LSP_SERVER_CONFIG_H
#define CODEINTEL_LSP_SERVER_CONFIG_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <chrono>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace codeintel::lsp
{

/// @brief Trace verbosity level for session logs.
enum class TraceLevel
{
    /// @brief Errors only.
    Off,

    /// @brief Lifecycle events.
    Basic,

    /// @brief Protocol traffic.
    Verbose,
};

/// @brief Launch description for one language server.
struct ServerConfig final
{
    /// @brief Language identifier, also sent as the LSP `languageId`.
    std::string language;

    /// @brief Executable name or path, resolved through `PATH`.
    std::string command;

    /// @brief Ordered command-line arguments.
    std::vector<std::string> args;

    /// @brief Environment variables overlaid on the parent environment.
    std::map<std::string, std::string> env;

    /// @brief File extensions without the leading dot.
    std::set<std::string> fileExtensions;
};

/// @brief Manager-wide timing and verbosity options.
struct ManagerOptions final
{
    /// @brief Deadline for each request after `initialize`.
    std::chrono::milliseconds requestTimeout{10000};

    /// @brief Deadline for the `initialize` response.
    std::chrono::milliseconds handshakeTimeout{30000};

    /// @brief Deadline for the graceful `shutdown` response.
    std::chrono::milliseconds shutdownTimeout{2000};

    /// @brief Configured trace verbosity.
    TraceLevel traceLevel{TraceLevel::Basic};
};

/// @brief Returns the built-in server table.
/// @return Configurations for rust, typescript, python, go, and java.
[[nodiscard]] std::vector<ServerConfig> defaultServerConfigs();

/// @brief Parses a catalog document `{"servers": [...]}`.
/// @param[in] document Parsed JSON document.
/// @return Configurations in document order, or an error naming the bad entry.
[[nodiscard]] llvm::Expected<std::vector<ServerConfig>> parseServerCatalog(const llvm::json::Value& document);

/// @brief Reads and parses a catalog file.
/// @param[in] path File path.
/// @return Configurations, or an error naming the file.
[[nodiscard]] llvm::Expected<std::vector<ServerConfig>> loadServerCatalogFile(llvm::StringRef path);

/// @brief Merges catalogs by language.
/// @param[in] base Base configurations.
/// @param[in] overrides Entries replacing same-language base entries; other
/// languages are appended.
/// @return Merged catalog preserving base order.
[[nodiscard]] std::vector<ServerConfig> mergeServerCatalogs(std::vector<ServerConfig>        base,
                                                            const std::vector<ServerConfig>& overrides);

/// @brief Applies a settings object to manager options.
/// @param[in] settings Object with optional `requestTimeoutMs`,
/// `handshakeTimeoutMs`, `shutdownTimeoutMs`, and `trace` keys.
/// @param[in,out] options Options to update.
/// @return `true` when `settings` was an object.
[[nodiscard]] bool applyManagerSettings(const llvm::json::Value& settings, ManagerOptions& options);

/// @brief Parses `off`, `basic`, or `verbose`; anything else maps to `Basic`.
[[nodiscard]] TraceLevel parseTraceLevel(llvm::StringRef text);

}  // namespace codeintel::lsp

#endif  // CODEINTEL_LSP_SERVER_CONFIG_H
