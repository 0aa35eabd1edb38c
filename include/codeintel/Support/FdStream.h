//===----------------------------------------------------------------------===//
//
// Part of the codeintel project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Standard stream adapters over POSIX file descriptors.
///
/// Child-process pipes are exposed as `std::istream`/`std::ostream` so that the
/// JSON-RPC transport can run unchanged over pipes and in-memory streams.
///
//===----------------------------------------------------------------------===//
#ifndef CODEINTEL_SUPPORT_FD_STREAM_H
#define CODEINTEL_SUPPORT_FD_STREAM_H

#include <array>
#include <istream>
#include <ostream>
#include <streambuf>

namespace codeintel
{

/// @brief Owning wrapper for a POSIX file descriptor.
class UniqueFd final
{
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd)
        : fd_(fd)
    {
    }
    ~UniqueFd();

    UniqueFd(UniqueFd&& other) noexcept;
    UniqueFd& operator=(UniqueFd&& other) noexcept;
    UniqueFd(const UniqueFd&)            = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    [[nodiscard]] int get() const
    {
        return fd_;
    }

    [[nodiscard]] bool valid() const
    {
        return fd_ >= 0;
    }

    /// @brief Releases ownership without closing.
    /// @return The descriptor, or `-1` when empty.
    [[nodiscard]] int release();

    /// @brief Closes the descriptor if open.
    void reset();

private:
    int fd_{-1};
};

/// @brief Creates a pipe whose both ends are marked close-on-exec.
/// @param[out] readEnd Read end of the pipe.
/// @param[out] writeEnd Write end of the pipe.
/// @return `true` on success; `errno` describes the failure otherwise.
[[nodiscard]] bool makePipe(UniqueFd& readEnd, UniqueFd& writeEnd);

/// @brief Unidirectional stream buffer over a file descriptor.
///
/// Reads block until data or end-of-file. Writes retry on `EINTR` and report a
/// failed `sync` when the peer has gone away.
class FdStreamBuf final : public std::streambuf
{
public:
    explicit FdStreamBuf(UniqueFd fd);
    ~FdStreamBuf() override;

    FdStreamBuf(const FdStreamBuf&)            = delete;
    FdStreamBuf& operator=(const FdStreamBuf&) = delete;

    /// @brief Flushes pending output and closes the descriptor.
    void close();

    [[nodiscard]] int fd() const
    {
        return fd_.get();
    }

protected:
    int_type        underflow() override;
    int_type        overflow(int_type ch) override;
    int             sync() override;
    std::streamsize xsputn(const char* data, std::streamsize count) override;

private:
    bool flushOutput();
    bool writeAll(const char* data, std::size_t count);

    static constexpr std::size_t BufferSize = 4096U;

    UniqueFd                      fd_;
    std::array<char, BufferSize>  inBuffer_{};
    std::array<char, BufferSize>  outBuffer_{};
};

/// @brief Input stream reading from an owned descriptor.
class FdInputStream final : public std::istream
{
public:
    explicit FdInputStream(UniqueFd fd);

    void close()
    {
        buffer_.close();
    }

private:
    FdStreamBuf buffer_;
};

/// @brief Output stream writing to an owned descriptor.
class FdOutputStream final : public std::ostream
{
public:
    explicit FdOutputStream(UniqueFd fd);

    void close()
    {
        buffer_.close();
    }

private:
    FdStreamBuf buffer_;
};

}  // namespace codeintel

#endif  // CODEINTEL_SUPPORT_FD_STREAM_H
