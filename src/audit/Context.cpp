//===----------------------------------------------------------------------===//
//
// Part of the Vigil project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: audit/Context.cpp
// Purpose: Implements context creation, context-scoped hooks, teardown and
//          the thread-local context binding.
// Key invariants: The clear-hooks event is raised at most once per context.
// Ownership/Lifetime: See Context.hpp.
// Links: audit/Context.hpp
//
//===----------------------------------------------------------------------===//

#include "audit/Context.hpp"

#include "audit/Events.hpp"
#include "support/log.hpp"

#include <exception>
#include <string>

namespace vigil::audit
{
namespace
{
using support::ErrorCode;
using support::Expected;
using support::makeError;

constexpr std::string_view kLogComponent = "audit.context";

/// Innermost live ContextScope on this thread.
thread_local ContextScope *tlsScope = nullptr;
} // namespace

Context::Context(Runtime &runtime, uint64_t id, std::string name)
    : runtime_(runtime), id_(id), name_(std::move(name))
{
}

Expected<std::unique_ptr<Context>> Context::create(Runtime &runtime, ContextConfig config)
{
    const uint64_t id = runtime.nextContextId();
    if (config.name.empty())
        config.name = "context-" + std::to_string(id);

    // Only process-level hooks decide whether a context may come into being.
    if (auto allowed = runtime.auditIn(nullptr, events::kContextCreate, id, config.name); !allowed)
        return allowed.error();

    std::unique_ptr<Context> ctx(new Context(runtime, id, std::move(config.name)));
    for (auto &hook : config.hooks)
    {
        if (auto added = ctx->addHook(std::move(hook)); !added)
            return added.error();
    }

    support::logDebug(kLogComponent,
                      "created " + ctx->name_ + " (id " + std::to_string(id) + ", " +
                          std::to_string(ctx->hooks_.size()) + " hooks)");
    return ctx;
}

Context::~Context()
{
    for (ContextScope *scope = tlsScope; scope; scope = scope->outer_)
    {
        if (scope->ctx_ == this)
            scope->ctx_ = nullptr;
    }
    close();
}

Expected<void> Context::addHook(ContextHook hook)
{
    if (closed())
        return makeError(ErrorCode::ContextClosed, "context is closed", name_);
    if (!hook)
        return makeError(ErrorCode::InvalidArgument, "audit hook must not be empty");

    if (auto allowed = audit(events::kAddHook); !allowed)
    {
        support::logDebug(kLogComponent,
                          "hook for " + name_ + " rejected: " + allowed.error().message);
        return allowed.error();
    }
    return hooks_.append(std::move(hook));
}

Expected<void> Context::raise(std::string_view event, const EventArgs &args)
{
    return runtime_.raise(this, event, args);
}

Expected<CodeStreamPtr> Context::openCode(std::string_view path)
{
    return runtime_.openCode(this, path);
}

/// @brief Drop this context's hooks after announcing it.
///
/// @details The announcement still reaches the context's own hooks, which is
///          their last chance to flush state.  Its outcome is advisory: a
///          failing or throwing hook is reported at WARN level and the hooks
///          are dropped regardless.  Global hooks are untouched.
void Context::close()
{
    if (closed_.exchange(true, std::memory_order_acq_rel))
        return;

    bool failed = false;
    std::string failure;
    try
    {
        if (auto announced = audit(events::kContextClearHooks, id_); !announced)
        {
            failed = true;
            failure = announced.error().message;
        }
    }
    catch (const std::exception &ex)
    {
        failed = true;
        failure = ex.what();
    }
    if (failed)
        support::logWarn(kLogComponent,
                         "ignoring failure of " + std::string(events::kContextClearHooks) +
                             " in " + name_ + ": " + failure);

    // A hook closing its own context: the enclosing walk still indexes hooks_.
    if (dispatchDepth_.load(std::memory_order_acquire) != 0)
    {
        dropPending_.store(true, std::memory_order_release);
        support::logDebug(kLogComponent, "closed " + name_ + " during dispatch, drop deferred");
        return;
    }
    dropHooks();
}

void Context::dropHooks()
{
    const std::size_t dropped = hooks_.size();
    hooks_.clear();
    if (support::logEnabled(support::LogLevel::Debug))
        support::logDebug(kLogComponent,
                          "closed " + name_ + ", dropped " + std::to_string(dropped) + " hooks");
}

Context::DispatchGuard::DispatchGuard(Context *ctx) noexcept : ctx_(ctx)
{
    if (ctx_)
        ctx_->dispatchDepth_.fetch_add(1, std::memory_order_acq_rel);
}

Context::DispatchGuard::~DispatchGuard()
{
    if (!ctx_)
        return;
    if (ctx_->dispatchDepth_.fetch_sub(1, std::memory_order_acq_rel) == 1 &&
        ctx_->dropPending_.exchange(false, std::memory_order_acq_rel))
        ctx_->dropHooks();
}

Context *Context::current() noexcept
{
    return tlsScope ? tlsScope->ctx_ : nullptr;
}

ContextScope::ContextScope(Context &ctx) noexcept : ctx_(&ctx), outer_(tlsScope)
{
    tlsScope = this;
}

ContextScope::~ContextScope()
{
    tlsScope = outer_;
}

} // namespace vigil::audit
