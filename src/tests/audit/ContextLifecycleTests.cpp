//===----------------------------------------------------------------------===//
// Part of the Vigil project, under the GNU GPL v3.
//===----------------------------------------------------------------------===//
// File: src/tests/audit/ContextLifecycleTests.cpp
//
// Purpose:
//   Verify context creation and teardown: the creation event, configured
//   hooks, the non-abortable clear-hooks event, use after close and the
//   thread-local binding.
//
// Links: src/audit/Context.hpp
//===----------------------------------------------------------------------===//
#include "audit/Context.hpp"
#include "audit/Events.hpp"
#include "support/log.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace vigil::audit;
using vigil::support::ErrorCode;
using vigil::support::Expected;
using vigil::support::LogLevel;
using vigil::support::makeError;

namespace
{

struct Seen
{
    std::vector<std::string> events;
    std::vector<EventArgs> args;
};

Expected<void> remember(std::string_view event, const EventArgs &args, void *userData)
{
    auto *seen = static_cast<Seen *>(userData);
    seen->events.emplace_back(event);
    seen->args.push_back(args);
    return {};
}

/// Captures log lines for the duration of a test.
class LogCapture
{
  public:
    LogCapture()
    {
        previousLevel_ = vigil::support::logLevel();
        vigil::support::setLogLevel(LogLevel::Debug);
        previousSink_ = vigil::support::setLogSink(
            [this](LogLevel level, std::string_view line)
            {
                if (level >= LogLevel::Warn)
                    warnings.emplace_back(line);
            });
    }

    ~LogCapture()
    {
        vigil::support::setLogSink(previousSink_);
        vigil::support::setLogLevel(previousLevel_);
    }

    std::vector<std::string> warnings;

  private:
    vigil::support::LogSink previousSink_;
    LogLevel previousLevel_;
};

} // namespace

TEST(ContextLifecycle, CreationIsAuditedGlobally)
{
    Runtime rt;
    Seen seen;
    ASSERT_TRUE(rt.addGlobalHook(&remember, &seen));

    auto ctx = Context::create(rt, {"worker", {}});
    ASSERT_TRUE(ctx);
    ASSERT_EQ(seen.events.size(), 1u);
    EXPECT_EQ(seen.events[0], events::kContextCreate);
    ASSERT_EQ(seen.args[0].size(), 2u);
    EXPECT_EQ(seen.args[0][0].asInt(), static_cast<int64_t>(ctx.value()->id()));
    EXPECT_EQ(seen.args[0][1].asStr(), "worker");
}

TEST(ContextLifecycle, CreationCanBeVetoed)
{
    Runtime rt;
    auto deny = [](std::string_view event, const EventArgs &, void *) -> Expected<void>
    {
        if (event == events::kContextCreate)
            return makeError(ErrorCode::HookAborted, "no new contexts");
        return {};
    };
    ASSERT_TRUE(rt.addGlobalHook(deny, nullptr));

    auto ctx = Context::create(rt, {"blocked", {}});
    ASSERT_FALSE(ctx);
    EXPECT_EQ(ctx.error().message, "no new contexts");
}

TEST(ContextLifecycle, ContextsGetDistinctIdsAndDefaultNames)
{
    Runtime rt;
    auto a = Context::create(rt);
    auto b = Context::create(rt);
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    EXPECT_NE(a.value()->id(), b.value()->id());
    EXPECT_EQ(a.value()->name(), "context-" + std::to_string(a.value()->id()));
    EXPECT_EQ(&a.value()->runtime(), &rt);
}

TEST(ContextLifecycle, ConfiguredHooksAreInstalledInOrder)
{
    Runtime rt;
    std::vector<std::string> order;
    ContextConfig config;
    config.name = "configured";
    config.hooks.push_back(
        [&order](std::string_view event, const EventArgs &) -> Expected<void>
        {
            order.push_back("first:" + std::string(event));
            return {};
        });
    config.hooks.push_back(
        [&order](std::string_view event, const EventArgs &) -> Expected<void>
        {
            order.push_back("second:" + std::string(event));
            return {};
        });

    auto ctx = Context::create(rt, std::move(config));
    ASSERT_TRUE(ctx);
    EXPECT_EQ(ctx.value()->hooks().size(), 2u);
    // The first hook observed the second one's registration.
    EXPECT_EQ(order, (std::vector<std::string>{"first:audit.add_hook"}));

    order.clear();
    ASSERT_TRUE(ctx.value()->audit("run"));
    EXPECT_EQ(order, (std::vector<std::string>{"first:run", "second:run"}));
}

TEST(ContextLifecycle, ContextAddHookVetoedByGlobalHook)
{
    Runtime rt;
    auto sealed = [](std::string_view event, const EventArgs &, void *) -> Expected<void>
    {
        if (event == events::kAddHook)
            return makeError(ErrorCode::HookAborted, "sealed");
        return {};
    };
    auto ctx = Context::create(rt);
    ASSERT_TRUE(ctx);
    ASSERT_TRUE(rt.addGlobalHook(sealed, nullptr));

    auto added = ctx.value()->addHook([](std::string_view, const EventArgs &) -> Expected<void>
                                      { return {}; });
    ASSERT_FALSE(added);
    EXPECT_TRUE(ctx.value()->hooks().empty());
}

TEST(ContextLifecycle, CloseRaisesClearHooksThenDrains)
{
    Runtime rt;
    Seen global;
    std::vector<std::string> local;
    ASSERT_TRUE(rt.addGlobalHook(&remember, &global));

    auto ctx = Context::create(rt, {"closing", {}});
    ASSERT_TRUE(ctx);
    ASSERT_TRUE(ctx.value()->addHook(
        [&local](std::string_view event, const EventArgs &) -> Expected<void>
        {
            local.emplace_back(event);
            return {};
        }));
    global.events.clear();
    global.args.clear();

    ctx.value()->close();
    EXPECT_TRUE(ctx.value()->closed());
    EXPECT_TRUE(ctx.value()->hooks().empty());
    ASSERT_EQ(global.events.size(), 1u);
    EXPECT_EQ(global.events[0], events::kContextClearHooks);
    EXPECT_EQ(global.args[0][0].asInt(), static_cast<int64_t>(ctx.value()->id()));
    EXPECT_EQ(local, (std::vector<std::string>{std::string(events::kContextClearHooks)}));

    // Idempotent: a second close raises nothing.
    ctx.value()->close();
    EXPECT_EQ(global.events.size(), 1u);

    // Global hooks survive context teardown.
    EXPECT_EQ(rt.globalHooks().size(), 1u);
}

TEST(ContextLifecycle, ClearHooksFailureIsLoggedNotPropagated)
{
    LogCapture capture;
    Runtime rt;
    auto ctx = Context::create(rt, {"stubborn", {}});
    ASSERT_TRUE(ctx);
    ASSERT_TRUE(ctx.value()->addHook(
        [](std::string_view event, const EventArgs &) -> Expected<void>
        {
            if (event == events::kContextClearHooks)
                return makeError(ErrorCode::HookAborted, "refusing teardown");
            return {};
        }));

    ctx.value()->close();
    EXPECT_TRUE(ctx.value()->hooks().empty());
    ASSERT_EQ(capture.warnings.size(), 1u);
    EXPECT_NE(capture.warnings[0].find("refusing teardown"), std::string::npos);
    EXPECT_NE(capture.warnings[0].find("[WARN]"), std::string::npos);
}

TEST(ContextLifecycle, ThrowingClearHooksStillCompletesTeardown)
{
    LogCapture capture;
    Runtime rt;
    auto ctx = Context::create(rt);
    ASSERT_TRUE(ctx);
    ASSERT_TRUE(ctx.value()->addHook(
        [](std::string_view event, const EventArgs &) -> Expected<void>
        {
            if (event == events::kContextClearHooks)
                throw std::runtime_error("flush failed");
            return {};
        }));

    ctx.value()->close();
    EXPECT_TRUE(ctx.value()->hooks().empty());
    ASSERT_EQ(capture.warnings.size(), 1u);
    EXPECT_NE(capture.warnings[0].find("flush failed"), std::string::npos);
}

TEST(ContextLifecycle, AddHookAfterCloseFails)
{
    Runtime rt;
    auto ctx = Context::create(rt);
    ASSERT_TRUE(ctx);
    ctx.value()->close();

    auto added = ctx.value()->addHook([](std::string_view, const EventArgs &) -> Expected<void>
                                      { return {}; });
    ASSERT_FALSE(added);
    EXPECT_EQ(added.error().code, ErrorCode::ContextClosed);
}

TEST(ContextLifecycle, DestructionClosesContext)
{
    Runtime rt;
    Seen seen;
    ASSERT_TRUE(rt.addGlobalHook(&remember, &seen));
    {
        auto ctx = Context::create(rt);
        ASSERT_TRUE(ctx);
        seen.events.clear();
    }
    EXPECT_EQ(seen.events, (std::vector<std::string>{std::string(events::kContextClearHooks)}));
}

TEST(ContextLifecycle, ScopesNestAndRestore)
{
    Runtime rt;
    auto outer = Context::create(rt, {"outer", {}});
    auto inner = Context::create(rt, {"inner", {}});
    ASSERT_TRUE(outer);
    ASSERT_TRUE(inner);

    EXPECT_EQ(Context::current(), nullptr);
    {
        ContextScope a(*outer.value());
        EXPECT_EQ(Context::current(), outer.value().get());
        {
            ContextScope b(*inner.value());
            EXPECT_EQ(Context::current(), inner.value().get());
            EXPECT_EQ(rt.boundContext(), inner.value().get());
        }
        EXPECT_EQ(Context::current(), outer.value().get());
    }
    EXPECT_EQ(Context::current(), nullptr);
}

TEST(ContextLifecycle, BindingIsPerThread)
{
    Runtime rt;
    auto ctx = Context::create(rt);
    ASSERT_TRUE(ctx);
    ContextScope scope(*ctx.value());

    Context *seenOnOtherThread = ctx.value().get();
    std::thread other([&] { seenOnOtherThread = Context::current(); });
    other.join();
    EXPECT_EQ(seenOnOtherThread, nullptr);
}

TEST(ContextLifecycle, ForeignRuntimeContextIsIgnored)
{
    Runtime mine;
    Runtime theirs;
    auto ctx = Context::create(theirs);
    ASSERT_TRUE(ctx);
    ContextScope scope(*ctx.value());
    EXPECT_EQ(mine.boundContext(), nullptr);
    EXPECT_EQ(theirs.boundContext(), ctx.value().get());
}

namespace
{

struct SelfClosing
{
    std::unique_ptr<Context> *ctx = nullptr;
    std::vector<std::string> trail;
};

} // namespace

TEST(ContextLifecycle, HookMayCloseItsOwnContextMidDispatch)
{
    Runtime rt;
    SelfClosing state;
    auto created = Context::create(rt, {"exiting", {}});
    ASSERT_TRUE(created);
    std::unique_ptr<Context> ctx = std::move(created).value();
    state.ctx = &ctx;

    ASSERT_TRUE(ctx->addHook(
        [&state](std::string_view event, const EventArgs &) -> Expected<void>
        {
            state.trail.push_back("closer:" + std::string(event));
            if (event == "exec")
                (*state.ctx)->close();
            return {};
        }));
    ASSERT_TRUE(ctx->addHook(
        [&state](std::string_view event, const EventArgs &) -> Expected<void>
        {
            state.trail.push_back("follower:" + std::string(event));
            return {};
        }));
    state.trail.clear();

    ASSERT_TRUE(ctx->audit("exec"));

    // The nested teardown event reaches both hooks, and the walk of "exec"
    // still reaches the second hook registered before the raise began.
    EXPECT_EQ(state.trail,
              (std::vector<std::string>{"closer:exec",
                                        "closer:" + std::string(events::kContextClearHooks),
                                        "follower:" + std::string(events::kContextClearHooks),
                                        "follower:exec"}));
    EXPECT_TRUE(ctx->closed());
    EXPECT_TRUE(ctx->hooks().empty());

    state.trail.clear();
    ASSERT_TRUE(ctx->audit("exec"));
    EXPECT_TRUE(state.trail.empty());
}

TEST(ContextLifecycle, ThrowAfterSelfCloseStillDropsHooks)
{
    Runtime rt;
    auto created = Context::create(rt);
    ASSERT_TRUE(created);
    std::unique_ptr<Context> ctx = std::move(created).value();
    Context *raw = ctx.get();

    ASSERT_TRUE(ctx->addHook(
        [raw](std::string_view event, const EventArgs &) -> Expected<void>
        {
            if (event == "exec")
            {
                raw->close();
                throw std::runtime_error("interpreter exiting");
            }
            return {};
        }));

    EXPECT_THROW((void)ctx->audit("exec"), std::runtime_error);
    EXPECT_TRUE(ctx->closed());
    EXPECT_TRUE(ctx->hooks().empty());
}

TEST(ContextLifecycle, DestroyedContextIsUnboundFromEnclosingScopes)
{
    Runtime rt;
    auto a = Context::create(rt, {"a", {}});
    auto b = Context::create(rt, {"b", {}});
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    std::unique_ptr<Context> first = std::move(a).value();
    std::unique_ptr<Context> second = std::move(b).value();

    {
        ContextScope outer(*first);
        {
            ContextScope inner(*second);
            first.reset();
            EXPECT_EQ(Context::current(), second.get());
        }
        EXPECT_EQ(Context::current(), nullptr);
        EXPECT_EQ(rt.boundContext(), nullptr);
        EXPECT_FALSE(rt.hasHooks());
        EXPECT_TRUE(rt.audit("after.destroy"));
    }
    EXPECT_EQ(Context::current(), nullptr);
}

TEST(ContextLifecycle, DestroyingTheBoundContextUnbindsIt)
{
    Runtime rt;
    auto outer = Context::create(rt, {"outer", {}});
    auto inner = Context::create(rt, {"inner", {}});
    ASSERT_TRUE(outer);
    ASSERT_TRUE(inner);
    std::unique_ptr<Context> keep = std::move(outer).value();
    std::unique_ptr<Context> doomed = std::move(inner).value();

    ContextScope a(*keep);
    {
        ContextScope b(*doomed);
        doomed.reset();
        EXPECT_EQ(Context::current(), nullptr);
    }
    EXPECT_EQ(Context::current(), keep.get());
}
