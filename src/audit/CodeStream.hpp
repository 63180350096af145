//===----------------------------------------------------------------------===//
//
// Part of the Vigil project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: audit/CodeStream.hpp
// Purpose: Declares the raw-byte reader returned by the verified open path.
// Key invariants: Streams are read-only and binary; read() returns 0 only at
//                 end of stream.
// Ownership/Lifetime: FileCodeStream owns its descriptor and closes it on
//                     destruction. BufferCodeStream owns its bytes.
// Links: docs/audit.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace vigil::audit
{

/// @brief File-like object presenting raw bytes intended for execution.
class CodeStream
{
  public:
    virtual ~CodeStream() = default;

    /// @brief Read up to @p buffer.size() bytes.
    /// @return Number of bytes copied; 0 at end of stream.
    virtual support::Expected<std::size_t> read(std::span<std::byte> buffer) = 0;

    /// @brief Path or label the stream was produced for.
    virtual std::string_view path() const noexcept = 0;

    /// @brief Drain the remaining bytes.
    support::Expected<std::string> readAll();
};

using CodeStreamPtr = std::unique_ptr<CodeStream>;

/// @brief Unbuffered read-only binary file.
class FileCodeStream final : public CodeStream
{
  public:
    /// @brief Flags used for the raw open; reported in the "open" audit event.
    static const int kOpenFlags;

    /// @brief Open @p path read-only in binary mode without resolving it.
    /// @return The stream, or FileNotFound / PermissionDenied / IOError.
    static support::Expected<CodeStreamPtr> open(std::string_view path);

    ~FileCodeStream() override;

    FileCodeStream(const FileCodeStream &) = delete;
    FileCodeStream &operator=(const FileCodeStream &) = delete;

    support::Expected<std::size_t> read(std::span<std::byte> buffer) override;

    std::string_view path() const noexcept override
    {
        return path_;
    }

  private:
    FileCodeStream(std::string path, int fd) noexcept;

    std::string path_;
    int fd_ = -1;
};

/// @brief In-memory stream standing in for a file.
class BufferCodeStream final : public CodeStream
{
  public:
    BufferCodeStream(std::string path, std::string contents) noexcept;

    /// @brief Convenience factory returning an owning pointer.
    static CodeStreamPtr make(std::string path, std::string contents);

    support::Expected<std::size_t> read(std::span<std::byte> buffer) override;

    std::string_view path() const noexcept override
    {
        return path_;
    }

  private:
    std::string path_;
    std::string contents_;
    std::size_t offset_ = 0;
};

} // namespace vigil::audit
