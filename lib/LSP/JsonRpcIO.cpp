//===----------------------------------------------------------------------===//
//
// Part of the codeintel project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements `Content-Length` framed JSON-RPC stdio transport.
///
//===----------------------------------------------------------------------===//

#include "codeintel/LSP/JsonRpcIO.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

#include <istream>
#include <ostream>
#include <string>

namespace codeintel::lsp
{
namespace
{

/// Values above `MaxFrameBytes` saturate to `MaxFrameBytes + 1`.
bool parseContentLengthHeader(const std::string& line, std::size_t& contentLength)
{
    static constexpr llvm::StringRef Prefix = "Content-Length:";
    llvm::StringRef                  header = line;
    if (!header.consume_front(Prefix))
    {
        return false;
    }
    header = header.trim();
    if (header.empty())
    {
        return false;
    }
    std::size_t value = 0;
    for (const char ch : header)
    {
        if (ch < '0' || ch > '9')
        {
            return false;
        }
        value = value * 10U + static_cast<std::size_t>(ch - '0');
        if (value > MaxFrameBytes)
        {
            value = MaxFrameBytes + 1U;
        }
    }
    contentLength = value;
    return true;
}

ReadStatus parsePayload(const std::string& payload, llvm::json::Value& message, std::string& error)
{
    llvm::Expected<llvm::json::Value> parsed = llvm::json::parse(payload);
    if (!parsed)
    {
        error = "invalid JSON payload: " + llvm::toString(parsed.takeError());
        return ReadStatus::Malformed;
    }
    message = std::move(*parsed);
    return ReadStatus::Message;
}

}  // namespace

JsonRpcStdioTransport::JsonRpcStdioTransport(std::istream& in, std::ostream& out)
    : input_(in)
    , output_(out)
{
}

ReadStatus JsonRpcStdioTransport::readMessage(llvm::json::Value& message, std::string& error)
{
    error.clear();
    std::size_t contentLength    = 0U;
    bool        hasContentLength = false;
    bool        hasHeaders       = false;
    std::string line;
    while (std::getline(input_, line))
    {
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        if (line.empty())
        {
            if (hasHeaders)
            {
                break;
            }
            continue;
        }

        if (!hasHeaders && line.front() == '{')
        {
            return parsePayload(line, message, error);
        }

        hasHeaders = true;
        if (std::size_t parsedLength = 0; parseContentLengthHeader(line, parsedLength))
        {
            contentLength    = parsedLength;
            hasContentLength = true;
        }
    }

    if (!hasHeaders)
    {
        return ReadStatus::EndOfStream;
    }

    if (!input_)
    {
        error = "stream ended inside header block";
        return ReadStatus::EndOfStream;
    }

    if (!hasContentLength)
    {
        error = "missing Content-Length header";
        return ReadStatus::Malformed;
    }

    // The body cannot be skipped reliably, so the stream is unusable.
    if (contentLength > MaxFrameBytes)
    {
        error = "Content-Length exceeds the " + std::to_string(MaxFrameBytes) + "-byte frame limit";
        return ReadStatus::EndOfStream;
    }

    std::string payload(contentLength, '\0');
    input_.read(payload.data(), static_cast<std::streamsize>(contentLength));
    if (input_.gcount() != static_cast<std::streamsize>(contentLength))
    {
        error = "truncated JSON-RPC payload";
        return ReadStatus::EndOfStream;
    }

    return parsePayload(payload, message, error);
}

bool JsonRpcStdioTransport::writeMessage(const llvm::json::Value& message)
{
    std::string              payload;
    llvm::raw_string_ostream payloadStream(payload);
    payloadStream << message;
    payloadStream.flush();

    std::lock_guard<std::mutex> lock(writeMutex_);
    if (!output_)
    {
        return false;
    }
    output_ << "Content-Length: " << payload.size() << "\r\n\r\n" << payload;
    output_.flush();
    return static_cast<bool>(output_);
}

bool JsonRpcStdioTransport::writable() const
{
    std::lock_guard<std::mutex> lock(writeMutex_);
    return static_cast<bool>(output_);
}

std::string encodeFrame(const std::string& payload)
{
    return "Content-Length: " + std::to_string(payload.size()) + "\r\n\r\n" + payload;
}

}  // namespace codeintel::lsp
