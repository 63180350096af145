//===----------------------------------------------------------------------===//
//
// Part of the Vigil project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: audit/Events.hpp
// Purpose: Names of the audit events raised by the audit core itself.
// Key invariants: Names and argument order are public contract; they do not
//                 change within a release line.
// Ownership/Lifetime: Compile-time constants.
// Links: docs/audit.md#event-catalogue
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string_view>

namespace vigil::audit::events
{

/// Raised before a global or context hook is appended. Args: ().
inline constexpr std::string_view kAddHook = "audit.add_hook";

/// Raised before the open-code slot is filled. Args: ().
inline constexpr std::string_view kSetOpenCodeHook = "audit.set_open_code_hook";

/// Raised by the default open-code path before the file is opened.
/// Args: (path: Str, mode: Str, flags: Int).
inline constexpr std::string_view kOpen = "open";

/// Raised to global hooks when a context is created. Args: (id: Int, name: Str).
inline constexpr std::string_view kContextCreate = "vigil.context.create";

/// Raised during context teardown before its hooks are dropped; cannot be
/// aborted. Args: (id: Int).
inline constexpr std::string_view kContextClearHooks = "vigil.context.clear_hooks";

} // namespace vigil::audit::events
