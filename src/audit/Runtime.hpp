//===----------------------------------------------------------------------===//
//
// Part of the Vigil project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: audit/Runtime.hpp
// Purpose: Declares the process-level audit state: the global hook registry,
//          the dispatcher and the single open-code hook slot.
// Key invariants: Global hooks run before context hooks, each in insertion
//                 order. The first failing hook ends a raise. The open-code
//                 slot moves from unset to set exactly once.
// Ownership/Lifetime: Runtime owns the global registry and the open-code slot.
//                     Contexts borrow their Runtime, which must outlive them.
// Links: docs/audit.md
//
//===----------------------------------------------------------------------===//
//
// DISPATCH MODEL
// ==============
//
// Every call site that audits an operation goes through raise(), audit() or
// raiseDeferred():
//
//   1. An empty event name is rejected.
//   2. If neither the global registry nor the context registry holds a hook,
//      the call returns success at once.  audit() and raiseDeferred() build
//      their EventArgs only after this check, so unobserved events cost two
//      atomic loads.
//   3. The length of both registries is captured.  Hooks appended while the
//      raise runs (by a hook, or by another thread) wait for the next raise.
//   4. Global hooks run in insertion order, then context hooks.
//   5. The first hook that returns a diagnostic stops the walk; the diagnostic
//      is returned to the caller, who must abort the guarded operation.
//
// Hooks run with no library lock held.  A hook may register hooks, raise
// events or open code; a hook that raises the event it is handling without a
// base case recurses until the stack is exhausted.
//
// C++ exceptions thrown by a hook are not intercepted and unwind through the
// dispatcher to the raising call site.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "audit/AuditConfig.hpp"
#include "audit/CodeStream.hpp"
#include "audit/EventArgs.hpp"
#include "audit/HookRegistry.hpp"
#include "support/diag_expected.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string_view>
#include <utility>

namespace vigil::audit
{

class Context;

/// @brief Replacement for the default verified open.
/// @param path Path exactly as passed to openCode().
/// @param userData Pointer supplied at installation.
/// @return A stream standing in for the file, or a diagnostic to fail the open.
using OpenCodeHookFn = support::Expected<CodeStreamPtr> (*)(std::string_view path,
                                                            void *userData);

/// @brief Process-level audit state and dispatcher.
///
/// Embedders use the instance returned by process().  Tests construct their
/// own Runtime so each case starts from empty registries.
class Runtime
{
  public:
    explicit Runtime(AuditConfig config = {});
    ~Runtime();

    Runtime(const Runtime &) = delete;
    Runtime &operator=(const Runtime &) = delete;

    /// @brief The process-wide runtime used by the C API.
    /// @details Created on first use from AuditConfig::fromEnvironment() and
    ///          destroyed with other function-local statics, so global hooks
    ///          stay installed until exit.  Hooks must not be raised from
    ///          static destructors that run after it.
    static Runtime &process();

    const AuditConfig &config() const noexcept
    {
        return config_;
    }

    //=========================================================================
    // Global registration
    //=========================================================================

    /// @brief Append a process-level hook.
    /// @details Legal before any context exists.  Raises audit.add_hook to the
    ///          hooks already installed (the new hook does not see it); a veto
    ///          leaves the hook uninstalled and is returned.  No removal API
    ///          exists.
    support::Expected<void> addGlobalHook(HookFn fn,
                                          void *userData,
                                          std::unique_ptr<HookPayload> payload = nullptr);

    const HookRegistry &globalHooks() const noexcept
    {
        return globalHooks_;
    }

    //=========================================================================
    // Dispatch
    //=========================================================================

    /// @brief True when a raise in @p ctx would reach at least one hook.
    bool hasHooks(const Context *ctx) const noexcept;

    /// @brief hasHooks() for the context bound to the calling thread.
    bool hasHooks() const noexcept;

    /// @brief Dispatch @p event with prebuilt @p args in @p ctx (may be null).
    support::Expected<void> raise(Context *ctx, std::string_view event, const EventArgs &args);

    /// @brief Dispatch in the context bound to the calling thread.
    support::Expected<void> raise(std::string_view event, const EventArgs &args);

    /// @brief Build the argument tuple from @p values only if a hook will see it.
    template <typename... Values>
    support::Expected<void> auditIn(Context *ctx, std::string_view event, Values &&...values)
    {
        if (event.empty())
            return invalidEventName();
        if (!hasHooks(ctx))
            return {};
        const EventArgs args{AuditValue(std::forward<Values>(values))...};
        return dispatch(ctx, event, args);
    }

    /// @brief auditIn() for the context bound to the calling thread.
    template <typename... Values>
    support::Expected<void> audit(std::string_view event, Values &&...values)
    {
        return auditIn(boundContext(), event, std::forward<Values>(values)...);
    }

    /// @brief Invoke @p build to produce the EventArgs only if a hook will see them.
    template <typename Builder>
    support::Expected<void> raiseDeferred(Context *ctx, std::string_view event, Builder &&build)
    {
        if (event.empty())
            return invalidEventName();
        if (!hasHooks(ctx))
            return {};
        const EventArgs args = std::forward<Builder>(build)();
        return dispatch(ctx, event, args);
    }

    //=========================================================================
    // Verified open
    //=========================================================================

    /// @brief Install the open-code hook.
    /// @details Fails with HookConflict, raising nothing and invoking nothing,
    ///          once a hook is set.  Otherwise raises audit.set_open_code_hook;
    ///          a veto leaves the slot empty.
    support::Expected<void> setOpenCodeHook(OpenCodeHookFn fn,
                                            void *userData,
                                            std::unique_ptr<HookPayload> payload = nullptr);

    bool hasOpenCodeHook() const noexcept
    {
        return openCodeSlot_.load(std::memory_order_acquire) != nullptr;
    }

    /// @brief Open @p path for execution.
    /// @details With no hook installed this raises "open" and performs a raw
    ///          read-only binary open.  With a hook installed the hook's stream
    ///          is returned verbatim.  @p path is never resolved.
    support::Expected<CodeStreamPtr> openCode(Context *ctx, std::string_view path);

    /// @brief openCode() in the context bound to the calling thread.
    support::Expected<CodeStreamPtr> openCode(std::string_view path);

    /// @brief The calling thread's bound context when it belongs to this runtime.
    Context *boundContext() const noexcept;

  private:
    friend class Context;

    /// @brief Installed open-code hook; immutable once published.
    struct OpenCodeSlot
    {
        OpenCodeHookFn fn = nullptr;
        void *userData = nullptr;
        std::unique_ptr<HookPayload> payload;
    };

    /// @brief Walk both registries; callers have already done the fast-path check.
    support::Expected<void> dispatch(Context *ctx, std::string_view event, const EventArgs &args);

    static support::Diag invalidEventName();

    uint64_t nextContextId() noexcept
    {
        return nextContextId_.fetch_add(1, std::memory_order_relaxed);
    }

    AuditConfig config_;
    HookRegistry globalHooks_{HookScope::Global};

    std::mutex openCodeMutex_;
    std::unique_ptr<OpenCodeSlot> openCodeOwner_;
    std::atomic<const OpenCodeSlot *> openCodeSlot_{nullptr};

    std::atomic<uint64_t> nextContextId_{1};
};

} // namespace vigil::audit
