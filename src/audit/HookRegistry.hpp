//===----------------------------------------------------------------------===//
//
// Part of the Vigil project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: audit/HookRegistry.hpp
// Purpose: Declares the append-only hook registry used for both the
//          process-wide and the per-context observer lists.
// Key invariants: Entries are never removed, replaced or moved once appended.
//                 There is no removal API; only the owning
//                 Runtime or Context may drain a registry, during teardown.
// Ownership/Lifetime: The registry owns every entry and any payload attached
//                     to it until teardown.
// Links: docs/audit.md
//
//===----------------------------------------------------------------------===//
//
// STORAGE LAYOUT
// ==============
//
// Entries live in a fixed directory of segments.  Segment k holds 8 << k
// entries, so an entry's address never changes once written and no segment is
// ever reallocated.  Appends are serialised by a mutex and published by a
// release store of the entry count; readers load the count with acquire
// semantics and then index without locking.  A dispatcher that snapshots
// size() therefore sees a consistent prefix even while other threads append.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string_view>

namespace vigil::audit
{

class EventArgs;
class Context;
class Runtime;

/// @brief Trust level a hook was registered with.
enum class HookScope : uint8_t
{
    Global,  ///< Process-wide, typically installed by the embedder.
    Context, ///< Visible only inside one execution context.
};

constexpr std::string_view toString(HookScope scope) noexcept
{
    return scope == HookScope::Global ? "global" : "context";
}

/// @brief Native hook: an invocable plus an opaque user pointer.
/// @return Success to let the event proceed, a diagnostic to abort it.
using HookFn = support::Expected<void> (*)(std::string_view event,
                                           const EventArgs &args,
                                           void *userData);

/// @brief Closure hook registered from script-facing code.
using ContextHook =
    std::function<support::Expected<void>(std::string_view event, const EventArgs &args)>;

/// @brief State kept alive by a registry entry, such as a captured closure.
struct HookPayload
{
    virtual ~HookPayload() = default;
};

/// @brief One registered observer.
struct HookEntry
{
    HookFn fn = nullptr;                  ///< Invocable; never null in a published entry.
    void *userData = nullptr;             ///< Passed back to @ref fn unchanged.
    HookScope scope = HookScope::Global;  ///< Registry the entry belongs to.
    std::unique_ptr<HookPayload> payload; ///< Optional owned state behind @ref userData.

    support::Expected<void> operator()(std::string_view event, const EventArgs &args) const
    {
        return fn(event, args, userData);
    }
};

/// @brief Grow-only ordered list of hook entries.
///
/// Duplicates are legal: appending the same function twice produces two
/// entries and two invocations per raise.
class HookRegistry
{
  public:
    explicit HookRegistry(HookScope scope) noexcept;
    ~HookRegistry();

    HookRegistry(const HookRegistry &) = delete;
    HookRegistry &operator=(const HookRegistry &) = delete;

    /// @brief Append a native hook.
    /// @param fn Hook function; must not be null.
    /// @param userData Opaque pointer handed back on every invocation.
    /// @param payload Optional state owned by the new entry.
    /// @return InvalidArgument for a null @p fn, ResourceExhausted when storage
    ///         cannot grow; success otherwise.
    support::Expected<void> append(HookFn fn,
                                   void *userData,
                                   std::unique_ptr<HookPayload> payload = nullptr);

    /// @brief Append a closure hook; the registry keeps the closure alive.
    support::Expected<void> append(ContextHook hook);

    /// @brief Number of published entries (acquire load).
    std::size_t size() const noexcept;

    bool empty() const noexcept
    {
        return size() == 0;
    }

    /// @brief Access a published entry.
    /// @pre @p index < a value previously returned by size().
    const HookEntry &operator[](std::size_t index) const noexcept;

    HookScope scope() const noexcept
    {
        return scope_;
    }

  private:
    friend class Context;
    friend class Runtime;

    /// @brief Drop every entry; teardown only.
    /// @pre No other thread is reading or appending.
    void clear() noexcept;

    static constexpr std::size_t kFirstSegmentBits = 3;
    static constexpr std::size_t kMaxSegments = 40;

    static std::size_t segmentOf(std::size_t index) noexcept;
    static std::size_t segmentCapacity(std::size_t segment) noexcept;
    static std::size_t segmentBase(std::size_t segment) noexcept;

    HookScope scope_;
    std::mutex appendMutex_;
    std::atomic<std::size_t> count_{0};
    std::array<std::unique_ptr<HookEntry[]>, kMaxSegments> segments_{};
};

} // namespace vigil::audit
