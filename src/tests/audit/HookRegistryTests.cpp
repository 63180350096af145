//===----------------------------------------------------------------------===//
// Part of the Vigil project, under the GNU GPL v3.
//===----------------------------------------------------------------------===//
// File: src/tests/audit/HookRegistryTests.cpp
//
// Purpose:
//   Verify the append-only hook registry: ordering, duplicates, payload
//   ownership, segment growth and publication to concurrent readers.
//
// Key invariants:
//   - Entries are visited in insertion order and never move
//   - A reader that observes size() == n can use entries [0, n)
//
// Links: src/audit/HookRegistry.hpp
//===----------------------------------------------------------------------===//
#include "audit/EventArgs.hpp"
#include "audit/HookRegistry.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace vigil::audit;
using vigil::support::ErrorCode;
using vigil::support::Expected;

namespace
{

Expected<void> recordIndex(std::string_view, const EventArgs &, void *userData)
{
    auto *slot = static_cast<std::vector<int> *>(userData);
    slot->push_back(static_cast<int>(slot->size()));
    return {};
}

Expected<void> noop(std::string_view, const EventArgs &, void *)
{
    return {};
}

struct CountingPayload final : HookPayload
{
    explicit CountingPayload(int &destroyed) : destroyed(destroyed) {}
    ~CountingPayload() override
    {
        ++destroyed;
    }
    int &destroyed;
};

} // namespace

TEST(HookRegistry, StartsEmpty)
{
    HookRegistry reg(HookScope::Global);
    EXPECT_TRUE(reg.empty());
    EXPECT_EQ(reg.size(), 0u);
    EXPECT_EQ(reg.scope(), HookScope::Global);
    EXPECT_EQ(toString(HookScope::Context), "context");
}

TEST(HookRegistry, RejectsNullHook)
{
    HookRegistry reg(HookScope::Global);
    auto added = reg.append(nullptr, nullptr);
    ASSERT_FALSE(added);
    EXPECT_EQ(added.error().code, ErrorCode::InvalidArgument);
    EXPECT_TRUE(reg.empty());

    auto closure = reg.append(ContextHook{});
    ASSERT_FALSE(closure);
    EXPECT_EQ(closure.error().code, ErrorCode::InvalidArgument);
}

TEST(HookRegistry, DuplicatesAreDistinctEntries)
{
    HookRegistry reg(HookScope::Global);
    std::vector<int> calls;
    ASSERT_TRUE(reg.append(&recordIndex, &calls));
    ASSERT_TRUE(reg.append(&recordIndex, &calls));
    ASSERT_EQ(reg.size(), 2u);

    const EventArgs args;
    for (std::size_t i = 0; i < reg.size(); ++i)
        ASSERT_TRUE(reg[i]("x", args));
    EXPECT_EQ(calls.size(), 2u);
}

TEST(HookRegistry, EntriesKeepScopeAndUserData)
{
    HookRegistry reg(HookScope::Context);
    int marker = 0;
    ASSERT_TRUE(reg.append(&noop, &marker));
    EXPECT_EQ(reg[0].scope, HookScope::Context);
    EXPECT_EQ(reg[0].userData, &marker);
    EXPECT_EQ(reg[0].fn, &noop);
}

TEST(HookRegistry, ClosureHooksAreInvoked)
{
    HookRegistry reg(HookScope::Context);
    std::string seen;
    ASSERT_TRUE(reg.append(ContextHook(
        [&seen](std::string_view event, const EventArgs &args) -> Expected<void>
        {
            seen = std::string(event) + args.toString();
            return {};
        })));
    ASSERT_TRUE(reg[0]("compile", EventArgs{"src"}));
    EXPECT_EQ(seen, "compile('src')");
}

TEST(HookRegistry, EntriesStayPutAcrossGrowth)
{
    HookRegistry reg(HookScope::Global);
    ASSERT_TRUE(reg.append(&noop, nullptr));
    const HookEntry *first = &reg[0];

    for (int i = 0; i < 1000; ++i)
        ASSERT_TRUE(reg.append(&noop, nullptr));

    EXPECT_EQ(reg.size(), 1001u);
    EXPECT_EQ(&reg[0], first);
    for (std::size_t i = 0; i < reg.size(); ++i)
        EXPECT_EQ(reg[i].fn, &noop);
}

TEST(HookRegistry, OwnsPayloadUntilDestroyed)
{
    int destroyed = 0;
    {
        HookRegistry reg(HookScope::Global);
        ASSERT_TRUE(reg.append(&noop, nullptr, std::make_unique<CountingPayload>(destroyed)));
        ASSERT_TRUE(reg.append(&noop, nullptr, std::make_unique<CountingPayload>(destroyed)));
        EXPECT_EQ(destroyed, 0);
    }
    EXPECT_EQ(destroyed, 2);
}

TEST(HookRegistry, ConcurrentAppendsArePublishedCompletely)
{
    HookRegistry reg(HookScope::Global);
    constexpr int kWriters = 4;
    constexpr int kPerWriter = 500;
    std::atomic<bool> done{false};
    std::atomic<bool> torn{false};

    std::thread reader(
        [&]
        {
            while (!done.load())
            {
                const std::size_t n = reg.size();
                for (std::size_t i = 0; i < n; ++i)
                {
                    if (reg[i].fn != &noop)
                        torn = true;
                }
            }
        });

    std::vector<std::thread> writers;
    for (int w = 0; w < kWriters; ++w)
    {
        writers.emplace_back(
            [&]
            {
                for (int i = 0; i < kPerWriter; ++i)
                {
                    if (!reg.append(&noop, nullptr))
                        torn = true;
                }
            });
    }
    for (auto &t : writers)
        t.join();
    done = true;
    reader.join();

    EXPECT_FALSE(torn.load());
    EXPECT_EQ(reg.size(), static_cast<std::size_t>(kWriters * kPerWriter));
}
