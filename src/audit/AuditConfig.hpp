//===----------------------------------------------------------------------===//
//
// Part of the Vigil project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: audit/AuditConfig.hpp
// Purpose: Defines runtime configuration for the audit core.
// Key invariants: No setting changes which hooks see an event or in what
//                 order; configuration only affects diagnostics output.
// Ownership/Lifetime: Value type copied into each Runtime.
// Links: docs/audit.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/log.hpp"

#include <functional>
#include <optional>
#include <string_view>

namespace vigil::audit
{

/// @brief Environment lookup used by fromEnvironment(); defaults to std::getenv.
using EnvLookup = std::function<const char *(const char *name)>;

/// @brief Settings read once when a Runtime is constructed.
struct AuditConfig
{
    /// @brief Emit one DEBUG line per dispatched event (VIGIL_AUDIT_TRACE).
    bool traceDispatch = false;

    /// @brief Minimum log level to apply process-wide (VIGIL_LOG_LEVEL).
    /// @details Left empty to keep the logger's current level.
    std::optional<support::LogLevel> logLevel;

    /// @brief Build a configuration from environment variables.
    /// @details Unrecognised values are ignored, preserving the defaults.
    ///          Enabling tracing without an explicit level selects Debug so
    ///          the trace lines are visible.
    static AuditConfig fromEnvironment(const EnvLookup &lookup = {});
};

/// @brief Parse a boolean switch: 1/true/on/yes or 0/false/off/no.
std::optional<bool> parseFlag(std::string_view text);

} // namespace vigil::audit
