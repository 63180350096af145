/**
 * @file diagnostics.cpp
 * @brief Implements diagnostic formatting and errno classification.
 * @copyright
 *     GNU GPL v3. See the LICENSE file in the project root for full terms.
 * @details
 *     Diagnostics produced by the audit core are plain values.  This unit
 *     turns them into text and maps operating-system failures from the
 *     default open-code path onto the project's error codes.
 */

#include "diagnostics.hpp"

#include <cerrno>

namespace vigil::support
{
namespace
{
/// @brief Convert diagnostic severity to lowercase string.
const char *severityToString(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "";
}
} // namespace

/**
 * @brief Classifies an errno value captured after a failed open.
 *
 * Missing paths and missing parent directories both report FileNotFound so a
 * caller sees the same outcome as a raw open.  Access failures map to
 * PermissionDenied; everything else is a generic IOError.
 *
 * @param err errno value.
 * @return Matching error code.
 */
ErrorCode errorCodeFromErrno(int err) noexcept
{
    switch (err)
    {
        case ENOENT:
        case ENOTDIR:
            return ErrorCode::FileNotFound;
        case EACCES:
        case EPERM:
            return ErrorCode::PermissionDenied;
        case ENOMEM:
            return ErrorCode::ResourceExhausted;
        default:
            return ErrorCode::IOError;
    }
}

/**
 * @brief Writes a diagnostic without a trailing newline.
 *
 * @param diag Diagnostic to format.
 * @param os Output stream that receives the text.
 */
void printDiagnostic(const Diagnostic &diag, std::ostream &os)
{
    os << severityToString(diag.severity) << '[' << toString(diag.code) << "]: ";
    if (!diag.subject.empty())
        os << diag.subject << ": ";
    os << diag.message;
}
} // namespace vigil::support
