//===----------------------------------------------------------------------===//
//
// Part of the codeintel project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements descriptor ownership and descriptor-backed stream buffers.
///
//===----------------------------------------------------------------------===//

#include "codeintel/Support/FdStream.h"

#include <cerrno>
#include <fcntl.h>
#include <unistd.h>
#include <utility>

namespace codeintel
{

UniqueFd::~UniqueFd()
{
    reset();
}

UniqueFd::UniqueFd(UniqueFd&& other) noexcept
    : fd_(other.release())
{
}

UniqueFd& UniqueFd::operator=(UniqueFd&& other) noexcept
{
    if (this != &other)
    {
        reset();
        fd_ = other.release();
    }
    return *this;
}

int UniqueFd::release()
{
    const int fd = fd_;
    fd_          = -1;
    return fd;
}

void UniqueFd::reset()
{
    if (fd_ >= 0)
    {
        ::close(fd_);
        fd_ = -1;
    }
}

bool makePipe(UniqueFd& readEnd, UniqueFd& writeEnd)
{
    int fds[2] = {-1, -1};
    if (::pipe2(fds, O_CLOEXEC) != 0)
    {
        return false;
    }
    readEnd  = UniqueFd(fds[0]);
    writeEnd = UniqueFd(fds[1]);
    return true;
}

FdStreamBuf::FdStreamBuf(UniqueFd fd)
    : fd_(std::move(fd))
{
    setg(inBuffer_.data(), inBuffer_.data(), inBuffer_.data());
    setp(outBuffer_.data(), outBuffer_.data() + outBuffer_.size());
}

FdStreamBuf::~FdStreamBuf()
{
    close();
}

void FdStreamBuf::close()
{
    if (!fd_.valid())
    {
        return;
    }
    flushOutput();
    fd_.reset();
}

FdStreamBuf::int_type FdStreamBuf::underflow()
{
    if (gptr() < egptr())
    {
        return traits_type::to_int_type(*gptr());
    }
    if (!fd_.valid())
    {
        return traits_type::eof();
    }

    ssize_t count = 0;
    do
    {
        count = ::read(fd_.get(), inBuffer_.data(), inBuffer_.size());
    } while (count < 0 && errno == EINTR);

    if (count <= 0)
    {
        return traits_type::eof();
    }
    setg(inBuffer_.data(), inBuffer_.data(), inBuffer_.data() + count);
    return traits_type::to_int_type(*gptr());
}

FdStreamBuf::int_type FdStreamBuf::overflow(const int_type ch)
{
    if (!flushOutput())
    {
        return traits_type::eof();
    }
    if (traits_type::eq_int_type(ch, traits_type::eof()))
    {
        return traits_type::not_eof(ch);
    }
    *pptr() = traits_type::to_char_type(ch);
    pbump(1);
    return ch;
}

int FdStreamBuf::sync()
{
    return flushOutput() ? 0 : -1;
}

std::streamsize FdStreamBuf::xsputn(const char* data, const std::streamsize count)
{
    const auto available = static_cast<std::streamsize>(epptr() - pptr());
    if (count <= available)
    {
        traits_type::copy(pptr(), data, static_cast<std::size_t>(count));
        pbump(static_cast<int>(count));
        return count;
    }
    if (!flushOutput() || !writeAll(data, static_cast<std::size_t>(count)))
    {
        return 0;
    }
    return count;
}

bool FdStreamBuf::flushOutput()
{
    const auto pending = static_cast<std::size_t>(pptr() - pbase());
    if (pending == 0U)
    {
        return true;
    }
    const bool ok = writeAll(pbase(), pending);
    setp(outBuffer_.data(), outBuffer_.data() + outBuffer_.size());
    return ok;
}

bool FdStreamBuf::writeAll(const char* data, std::size_t count)
{
    if (!fd_.valid())
    {
        return false;
    }
    while (count > 0U)
    {
        const ssize_t written = ::write(fd_.get(), data, count);
        if (written < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            return false;
        }
        data += written;
        count -= static_cast<std::size_t>(written);
    }
    return true;
}

FdInputStream::FdInputStream(UniqueFd fd)
    : std::istream(nullptr)
    , buffer_(std::move(fd))
{
    rdbuf(&buffer_);
}

FdOutputStream::FdOutputStream(UniqueFd fd)
    : std::ostream(nullptr)
    , buffer_(std::move(fd))
{
    rdbuf(&buffer_);
}

}  // namespace codeintel
