//===----------------------------------------------------------------------===//
//
// Part of the Vigil project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: audit/Runtime.cpp
// Purpose: Implements global hook registration, event dispatch and the
//          verified open path.
// Key invariants: No library lock is held while a hook runs. Registry lengths
//                 are captured once per raise.
// Ownership/Lifetime: The process runtime lives until static destruction.
// Links: audit/Runtime.hpp, docs/audit.md
//
//===----------------------------------------------------------------------===//

#include "audit/Runtime.hpp"

#include "audit/Context.hpp"
#include "audit/Events.hpp"
#include "support/log.hpp"

#include <string>

namespace vigil::audit
{
namespace
{
using support::Diag;
using support::ErrorCode;
using support::Expected;
using support::makeError;

constexpr std::string_view kLogComponent = "audit";

/// @brief Run entries [0, count) of @p registry, stopping at the first failure.
/// @param failedAt Receives the index of the vetoing hook.
Expected<void> runHooks(const HookRegistry &registry,
                        std::size_t count,
                        std::string_view event,
                        const EventArgs &args,
                        std::size_t &failedAt)
{
    for (std::size_t i = 0; i < count; ++i)
    {
        auto result = registry[i](event, args);
        if (!result)
        {
            failedAt = i;
            return result;
        }
    }
    return {};
}

AuditConfig processConfig()
{
    AuditConfig config = AuditConfig::fromEnvironment();
    if (config.logLevel)
        support::setLogLevel(*config.logLevel);
    return config;
}

Diag openCodeConflict()
{
    return makeError(ErrorCode::HookConflict, "open-code hook is already set");
}
} // namespace

Runtime::Runtime(AuditConfig config) : config_(std::move(config)) {}

Runtime::~Runtime() = default;

Runtime &Runtime::process()
{
    static Runtime instance(processConfig());
    return instance;
}

Expected<void> Runtime::addGlobalHook(HookFn fn, void *userData, std::unique_ptr<HookPayload> payload)
{
    if (!fn)
        return makeError(ErrorCode::InvalidArgument, "audit hook must not be null");

    if (auto allowed = audit(events::kAddHook); !allowed)
    {
        support::logDebug(kLogComponent, "global hook rejected: " + allowed.error().message);
        return allowed.error();
    }

    if (auto added = globalHooks_.append(fn, userData, std::move(payload)); !added)
        return added.error();

    if (support::logEnabled(support::LogLevel::Debug))
        support::logDebug(kLogComponent,
                          "global hook #" + std::to_string(globalHooks_.size()) + " installed");
    return {};
}

bool Runtime::hasHooks(const Context *ctx) const noexcept
{
    if (!globalHooks_.empty())
        return true;
    return ctx && !ctx->hooks().empty();
}

bool Runtime::hasHooks() const noexcept
{
    return hasHooks(boundContext());
}

Diag Runtime::invalidEventName()
{
    return makeError(ErrorCode::InvalidArgument, "audit event name must not be empty");
}

Expected<void> Runtime::raise(Context *ctx, std::string_view event, const EventArgs &args)
{
    if (event.empty())
        return invalidEventName();
    if (!hasHooks(ctx))
        return {};
    return dispatch(ctx, event, args);
}

Expected<void> Runtime::raise(std::string_view event, const EventArgs &args)
{
    return raise(boundContext(), event, args);
}

/// @brief Deliver one event to every hook visible in @p ctx.
///
/// @details Both registry lengths are read before the first hook runs.  Global
///          entries are walked first, then the context's own.  A failing hook
///          ends the walk; its diagnostic is returned with the event name
///          filled in as subject when the hook left it empty, and with
///          HookAborted as code when the hook left it unclassified.
Expected<void> Runtime::dispatch(Context *ctx, std::string_view event, const EventArgs &args)
{
    // Holds off a same-thread close() of ctx from draining hooks mid-walk.
    Context::DispatchGuard guard(ctx);
    const HookRegistry *local = ctx ? &ctx->hooks() : nullptr;
    const std::size_t globalCount = globalHooks_.size();
    const std::size_t localCount = local ? local->size() : 0;

    if (config_.traceDispatch && support::logEnabled(support::LogLevel::Debug))
    {
        std::string line = "raise ";
        line.append(event);
        line += args.toString();
        line += " global=" + std::to_string(globalCount);
        line += " context=" + std::to_string(localCount);
        if (ctx)
            line += " ctx=" + std::to_string(ctx->id());
        support::logDebug(kLogComponent, line);
    }

    std::size_t failedAt = 0;
    HookScope failedScope = HookScope::Global;
    auto result = runHooks(globalHooks_, globalCount, event, args, failedAt);
    if (result && local)
    {
        failedScope = HookScope::Context;
        result = runHooks(*local, localCount, event, args, failedAt);
    }
    if (result)
        return {};

    Diag diag = result.error();
    if (diag.code == ErrorCode::None)
        diag.code = ErrorCode::HookAborted;
    if (diag.subject.empty())
        diag.subject = std::string(event);

    if (support::logEnabled(support::LogLevel::Debug))
    {
        std::string line(event);
        line += " vetoed by ";
        line.append(toString(failedScope));
        line += " hook #" + std::to_string(failedAt) + ": " + diag.message;
        support::logDebug(kLogComponent, line);
    }
    return diag;
}

Expected<void> Runtime::setOpenCodeHook(OpenCodeHookFn fn,
                                        void *userData,
                                        std::unique_ptr<HookPayload> payload)
{
    if (!fn)
        return makeError(ErrorCode::InvalidArgument, "open-code hook must not be null");

    // A set slot is final: refuse before auditing so no hook observes the attempt.
    if (hasOpenCodeHook())
        return openCodeConflict();

    if (auto allowed = audit(events::kSetOpenCodeHook); !allowed)
        return allowed.error();

    auto slot = std::make_unique<OpenCodeSlot>();
    slot->fn = fn;
    slot->userData = userData;
    slot->payload = std::move(payload);

    {
        std::lock_guard<std::mutex> lock(openCodeMutex_);
        if (openCodeOwner_)
            return openCodeConflict();
        openCodeOwner_ = std::move(slot);
        openCodeSlot_.store(openCodeOwner_.get(), std::memory_order_release);
    }

    support::logInfo(kLogComponent, "open-code hook installed");
    return {};
}

/// @brief Open @p path for execution through the hook or the default path.
///
/// @details The installed hook fully replaces the default behaviour: it is
///          called with the path untouched and its stream or diagnostic is
///          handed back as is.  The "open" event is raised only on the default
///          path, which then performs a raw read-only binary open.
Expected<CodeStreamPtr> Runtime::openCode(Context *ctx, std::string_view path)
{
    if (path.empty())
        return makeError(ErrorCode::InvalidArgument, "path must be a non-empty string");

    if (const OpenCodeSlot *slot = openCodeSlot_.load(std::memory_order_acquire))
    {
        auto opened = slot->fn(path, slot->userData);
        if (opened && !opened.value())
            return makeError(ErrorCode::IOError, "open-code hook returned no stream", std::string(path));
        return opened;
    }

    if (auto allowed = auditIn(ctx, events::kOpen, path, "rb", FileCodeStream::kOpenFlags); !allowed)
        return allowed.error();
    return FileCodeStream::open(path);
}

Expected<CodeStreamPtr> Runtime::openCode(std::string_view path)
{
    return openCode(boundContext(), path);
}

Context *Runtime::boundContext() const noexcept
{
    Context *ctx = Context::current();
    if (ctx && &ctx->runtime() == this)
        return ctx;
    return nullptr;
}

} // namespace vigil::audit
