//===----------------------------------------------------------------------===//
//
// Part of the Vigil project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: audit/CodeStream.cpp
// Purpose: Implements file-backed and buffer-backed code streams.
// Key invariants: The file path is used verbatim; no resolution happens here.
// Ownership/Lifetime: See CodeStream.hpp.
// Links: audit/CodeStream.hpp
//
//===----------------------------------------------------------------------===//

#include "audit/CodeStream.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>

#if defined(_WIN32)
#include <io.h>
#else
#include <unistd.h>
#endif

namespace vigil::audit
{
namespace
{
using support::ErrorCode;
using support::Expected;
using support::makeError;

constexpr std::size_t kReadChunk = 64 * 1024;

#if defined(_WIN32)
constexpr int kRawOpenFlags = _O_RDONLY | _O_BINARY | _O_NOINHERIT;
#else
constexpr int kRawOpenFlags = O_RDONLY | O_CLOEXEC;
#endif

/// @brief Build a diagnostic from errno for @p path.
support::Diag errnoError(int err, const std::string &path)
{
    return makeError(support::errorCodeFromErrno(err), std::strerror(err), path);
}

void closeDescriptor(int fd) noexcept
{
#if defined(_WIN32)
    ::_close(fd);
#else
    ::close(fd);
#endif
}
} // namespace

const int FileCodeStream::kOpenFlags = kRawOpenFlags;

Expected<std::string> CodeStream::readAll()
{
    std::string out;
    std::array<std::byte, kReadChunk> chunk;
    for (;;)
    {
        auto got = read(chunk);
        if (!got)
            return got.error();
        if (got.value() == 0)
            break;
        out.append(reinterpret_cast<const char *>(chunk.data()), got.value());
    }
    return out;
}

FileCodeStream::FileCodeStream(std::string path, int fd) noexcept : path_(std::move(path)), fd_(fd)
{
}

FileCodeStream::~FileCodeStream()
{
    if (fd_ >= 0)
        closeDescriptor(fd_);
}

/// @brief Open @p path for reading its raw bytes.
///
/// @details Mirrors a plain read-only binary open: the path is passed to the
///          operating system untouched, EINTR is retried, and directories are
///          refused the same way a read of them would fail.  Failures carry
///          the OS error text and the path as subject.
Expected<CodeStreamPtr> FileCodeStream::open(std::string_view path)
{
    std::string target(path);
    if (target.empty() || target.find('\0') != std::string::npos)
        return makeError(ErrorCode::InvalidArgument, "path must be a non-empty string", target);

#if defined(_WIN32)
    int fd = ::_open(target.c_str(), kRawOpenFlags);
#else
    int fd = -1;
    do
    {
        fd = ::open(target.c_str(), kRawOpenFlags);
    } while (fd < 0 && errno == EINTR);
#endif
    if (fd < 0)
        return errnoError(errno, target);

    struct stat info{};
    if (::fstat(fd, &info) != 0)
    {
        const int err = errno;
        closeDescriptor(fd);
        return errnoError(err, target);
    }
    if ((info.st_mode & S_IFMT) == S_IFDIR)
    {
        closeDescriptor(fd);
        return errnoError(EISDIR, target);
    }

    return CodeStreamPtr(new FileCodeStream(std::move(target), fd));
}

Expected<std::size_t> FileCodeStream::read(std::span<std::byte> buffer)
{
    if (buffer.empty())
        return std::size_t{0};
#if defined(_WIN32)
    const unsigned request = static_cast<unsigned>(std::min<std::size_t>(buffer.size(), 1u << 30));
    const int got = ::_read(fd_, buffer.data(), request);
#else
    ssize_t got = -1;
    do
    {
        got = ::read(fd_, buffer.data(), buffer.size());
    } while (got < 0 && errno == EINTR);
#endif
    if (got < 0)
        return errnoError(errno, path_);
    return static_cast<std::size_t>(got);
}

BufferCodeStream::BufferCodeStream(std::string path, std::string contents) noexcept
    : path_(std::move(path)), contents_(std::move(contents))
{
}

CodeStreamPtr BufferCodeStream::make(std::string path, std::string contents)
{
    return std::make_unique<BufferCodeStream>(std::move(path), std::move(contents));
}

Expected<std::size_t> BufferCodeStream::read(std::span<std::byte> buffer)
{
    const std::size_t remaining = contents_.size() - offset_;
    const std::size_t count = std::min(remaining, buffer.size());
    if (count != 0)
        std::memcpy(buffer.data(), contents_.data() + offset_, count);
    offset_ += count;
    return count;
}

} // namespace vigil::audit
