//===----------------------------------------------------------------------===//
//
// Part of the codeintel project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Stdio JSON-RPC framing utilities for Language Server Protocol transport.
///
/// Messages are encoded with `Content-Length` framing and decoded into LLVM
/// JSON values. The reader also accepts bare newline-delimited JSON lines so
/// that servers which skip the header block still interoperate.
///
//===----------------------------------------------------------------------===//
#ifndef CODEINTEL_LSP_JSON_RPC_IO_H
#define CODEINTEL_LSP_JSON_RPC_IO_H

#include "llvm/Support/JSON.h"

#include <cstddef>
#include <iosfwd>
#include <mutex>
#include <string>

namespace codeintel::lsp
{

/// @brief Largest `Content-Length` the reader accepts. Larger frames end the stream.
inline constexpr std::size_t MaxFrameBytes = 64U * 1024U * 1024U;

/// @brief Outcome of reading one framed message.
enum class ReadStatus
{
    /// @brief A full message was read and parsed.
    Message,

    /// @brief A frame was consumed but did not hold valid JSON. The stream is
    /// still usable.
    Malformed,

    /// @brief The stream ended, a frame was truncated, or a frame declared a
    /// length above `MaxFrameBytes`.
    EndOfStream,
};

/// @brief JSON-RPC stdio transport with `Content-Length` framing.
class JsonRpcStdioTransport final
{
public:
    /// @brief Creates a transport over input and output streams.
    /// @param[in] in Input stream.
    /// @param[in] out Output stream.
    JsonRpcStdioTransport(std::istream& in, std::ostream& out);

    /// @brief Reads one framed JSON-RPC message.
    /// @param[out] message Parsed JSON payload.
    /// @param[out] error Parsing/framing error text when the read fails.
    /// @return Read outcome.
    [[nodiscard]] ReadStatus readMessage(llvm::json::Value& message, std::string& error);

    /// @brief Writes one framed JSON-RPC message.
    /// @param[in] message JSON payload to write.
    /// @return `true` when write succeeds.
    [[nodiscard]] bool writeMessage(const llvm::json::Value& message);

    /// @brief Returns whether the output stream can still accept writes.
    [[nodiscard]] bool writable() const;

private:
    std::istream&      input_;
    std::ostream&      output_;
    mutable std::mutex writeMutex_;
};

/// @brief Encodes a payload with a `Content-Length` header block.
/// @param[in] payload Serialized JSON text.
/// @return Framed bytes.
[[nodiscard]] std::string encodeFrame(const std::string& payload);

}  // namespace codeintel::lsp

#endif  // CODEINTEL_LSP_JSON_RPC_IO_H
