//===----------------------------------------------------------------------===//
//
// Part of the Vigil project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Declares the diagnostic record and error taxonomy shared by every
//          audit subsystem.
// Key invariants: Error codes are stable; their numeric values are exposed
//                 through the C API.
// Ownership/Lifetime: Diagnostics are value types.
// Links: docs/audit.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace vigil::support
{

/// @brief Severity levels for diagnostics.
enum class Severity
{
    Note,
    Warning,
    Error
};

/// @brief Classifies why an audited operation failed.
enum class ErrorCode : int32_t
{
    None = 0,              ///< No error recorded.
    HookAborted = 1,       ///< An audit hook vetoed the event.
    HookConflict = 2,      ///< A single-slot hook was already installed.
    InvalidArgument = 3,   ///< Caller supplied an unusable argument.
    FileNotFound = 4,      ///< Open on a path that does not exist.
    PermissionDenied = 5,  ///< Open refused by the operating system.
    IOError = 6,           ///< Generic I/O failure.
    ResourceExhausted = 7, ///< Allocation or capacity failure.
    ContextClosed = 8,     ///< Operation on a context after teardown.
};

/// @brief Single diagnostic message.
struct Diagnostic
{
    Severity severity = Severity::Error; ///< Message severity
    ErrorCode code = ErrorCode::None;    ///< Failure classification
    std::string message;                 ///< Human-readable text
    std::string subject;                 ///< Event name or path the message refers to
};

/// @brief Convert an error code to its canonical spelling.
/// @param code Enumerated error code.
/// @return Stable string view naming the code.
constexpr std::string_view toString(ErrorCode code) noexcept
{
    switch (code)
    {
        case ErrorCode::None:
            return "None";
        case ErrorCode::HookAborted:
            return "HookAborted";
        case ErrorCode::HookConflict:
            return "HookConflict";
        case ErrorCode::InvalidArgument:
            return "InvalidArgument";
        case ErrorCode::FileNotFound:
            return "FileNotFound";
        case ErrorCode::PermissionDenied:
            return "PermissionDenied";
        case ErrorCode::IOError:
            return "IOError";
        case ErrorCode::ResourceExhausted:
            return "ResourceExhausted";
        case ErrorCode::ContextClosed:
            return "ContextClosed";
    }
    return "IOError";
}

/// @brief Map an errno value from a failed open to an error code.
/// @param err Value of errno captured immediately after the failure.
/// @return FileNotFound, PermissionDenied or IOError.
ErrorCode errorCodeFromErrno(int err) noexcept;

/// @brief Render @p diag as a single line to @p os.
/// @details Format: "<severity>[<code>]: <subject>: <message>"; the subject
///          segment is omitted when empty.
void printDiagnostic(const Diagnostic &diag, std::ostream &os);

} // namespace vigil::support
