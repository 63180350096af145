//===----------------------------------------------------------------------===//
//
// Part of the Vigil project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the Expected<void> helpers and the diagnostic constructors used by
// the audit core.  Every failure that leaves the dispatcher, the registries or
// the open-code path is built here so error text stays uniform.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Supplies the `Expected<void>` specialisation and diagnostic helpers.

#include "diag_expected.hpp"

namespace vigil::support
{
/// @brief Construct an Expected<void> that stores a diagnostic error state.
///
/// @details A default-constructed `Expected` contains no diagnostic payload and
///          represents success; moving a diagnostic in marks it failed.
Expected<void>::Expected(Diag diag) : error_(std::move(diag))
{
}

/// @brief Report whether the Expected<void> represents a successful outcome.
/// @return True if the instance holds no diagnostic.
bool Expected<void>::hasValue() const
{
    return !error_.has_value();
}

Expected<void>::operator bool() const
{
    return hasValue();
}

/// @brief Access the diagnostic that describes the recorded failure.
/// @details Callers must ensure the `Expected` represents an error first.
const Diag &Expected<void>::error() const &
{
    return *error_;
}

/// @brief Build an error diagnostic with the provided code and message.
///
/// @param code Failure classification.
/// @param msg Human-readable description of the problem.
/// @param subject Event name or path, empty when not applicable.
/// @return Diagnostic populated with error severity.
Diag makeError(ErrorCode code, std::string msg, std::string subject)
{
    Diag diag;
    diag.severity = Severity::Error;
    diag.code = code;
    diag.message = std::move(msg);
    diag.subject = std::move(subject);
    return diag;
}

void printDiag(const Diag &diag, std::ostream &os)
{
    printDiagnostic(diag, os);
    os << '\n';
}
} // namespace vigil::support
