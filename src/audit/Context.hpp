//===----------------------------------------------------------------------===//
//
// Part of the Vigil project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: audit/Context.hpp
// Purpose: Declares an isolated execution context with its own hook registry.
// Key invariants: Context hooks are invisible to every other context. Once
//                 closed, a context accepts no hooks and its registry is empty.
// Ownership/Lifetime: Contexts are owned by the embedder via unique_ptr and
//                     borrow their Runtime. A context must not be destroyed
//                     while a raise in it is in progress, or while another
//                     thread has it bound.
// Links: docs/audit.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "audit/Runtime.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vigil::audit
{

/// @brief Parameters for Context::create().
struct ContextConfig
{
    /// @brief Label used in diagnostics and the vigil.context.create event.
    std::string name;

    /// @brief Hooks installed in order right after creation.
    std::vector<ContextHook> hooks;
};

/// @brief One interpreter-like execution environment.
class Context
{
  public:
    /// @brief Create a context attached to @p runtime.
    /// @details Raises vigil.context.create to the global hooks; a veto stops
    ///          creation.  Configured hooks are then added one by one, each
    ///          through addHook(), so each is audited like a script-side add.
    static support::Expected<std::unique_ptr<Context>> create(Runtime &runtime,
                                                              ContextConfig config = {});

    ~Context();

    Context(const Context &) = delete;
    Context &operator=(const Context &) = delete;

    uint64_t id() const noexcept
    {
        return id_;
    }

    const std::string &name() const noexcept
    {
        return name_;
    }

    Runtime &runtime() const noexcept
    {
        return runtime_;
    }

    bool closed() const noexcept
    {
        return closed_.load(std::memory_order_acquire);
    }

    const HookRegistry &hooks() const noexcept
    {
        return hooks_;
    }

    /// @brief Append a hook visible only inside this context.
    /// @details Raises audit.add_hook in this context first; the new hook does
    ///          not observe its own registration.
    /// @return ContextClosed after close(), the veto of an existing hook, or
    ///         the registry's error.
    support::Expected<void> addHook(ContextHook hook);

    /// @brief Raise @p event with values converted lazily.
    template <typename... Values>
    support::Expected<void> audit(std::string_view event, Values &&...values)
    {
        return runtime_.auditIn(this, event, std::forward<Values>(values)...);
    }

    support::Expected<void> raise(std::string_view event, const EventArgs &args);

    template <typename Builder>
    support::Expected<void> raiseDeferred(std::string_view event, Builder &&build)
    {
        return runtime_.raiseDeferred(this, event, std::forward<Builder>(build));
    }

    /// @brief Verified open with this context's hooks observing the "open" event.
    support::Expected<CodeStreamPtr> openCode(std::string_view path);

    /// @brief Tear down the context's hooks.
    /// @details Raises vigil.context.clear_hooks once.  Hook failures are
    ///          logged and ignored; teardown always completes.  Idempotent.
    ///          When called from a hook while a raise is walking this context,
    ///          the context is closed at once and its hooks are dropped when
    ///          the outermost raise returns.
    /// @pre No other thread is raising in this context.
    void close();

    /// @brief Context bound to the calling thread, or nullptr.
    static Context *current() noexcept;

  private:
    friend class ContextScope;
    friend class Runtime;

    /// @brief Marks a dispatch walking hooks_ for its whole duration.
    class DispatchGuard
    {
      public:
        explicit DispatchGuard(Context *ctx) noexcept;
        ~DispatchGuard();

        DispatchGuard(const DispatchGuard &) = delete;
        DispatchGuard &operator=(const DispatchGuard &) = delete;

      private:
        Context *ctx_;
    };

    Context(Runtime &runtime, uint64_t id, std::string name);

    void dropHooks();

    Runtime &runtime_;
    uint64_t id_;
    std::string name_;
    HookRegistry hooks_{HookScope::Context};
    std::atomic<bool> closed_{false};
    std::atomic<uint32_t> dispatchDepth_{0};
    std::atomic<bool> dropPending_{false};
};

/// @brief RAII helper binding a context to the calling thread.
///
/// Scopes form a per-thread chain; ending a scope rebinds the enclosing one so
/// scopes nest.  Destroying a context unbinds it from every scope on the
/// destroying thread, so an enclosing scope never rebinds a dead context.
class ContextScope
{
  public:
    explicit ContextScope(Context &ctx) noexcept;
    ~ContextScope();

    ContextScope(const ContextScope &) = delete;
    ContextScope &operator=(const ContextScope &) = delete;

  private:
    friend class Context;

    Context *ctx_;
    ContextScope *outer_;
};

} // namespace vigil::audit
