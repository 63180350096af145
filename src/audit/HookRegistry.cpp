//===----------------------------------------------------------------------===//
//
// Part of the Vigil project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: audit/HookRegistry.cpp
// Purpose: Implements the segmented append-only hook registry.
// Key invariants: count_ is only advanced after the entry at the old count is
//                 fully written; segments are allocated once and never moved.
// Ownership/Lifetime: Registry owns entries and payloads.
// Links: audit/HookRegistry.hpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Append and lookup for the audit hook registries.
/// @details Appends take a mutex and publish with a release store.  Lookups
///          are lock-free.  Closure hooks are stored as a payload with a
///          trampoline function so both registries share one entry type.

#include "audit/HookRegistry.hpp"

#include "audit/EventArgs.hpp"

#include <bit>
#include <new>
#include <utility>

namespace vigil::audit
{
namespace
{
using support::ErrorCode;
using support::Expected;
using support::makeError;

/// @brief Payload wrapping a closure registered through the script surface.
struct ClosurePayload final : HookPayload
{
    explicit ClosurePayload(ContextHook fn) : fn(std::move(fn)) {}

    ContextHook fn;
};

/// @brief Trampoline forwarding a native invocation to the stored closure.
Expected<void> invokeClosure(std::string_view event, const EventArgs &args, void *userData)
{
    return static_cast<ClosurePayload *>(userData)->fn(event, args);
}
} // namespace

HookRegistry::HookRegistry(HookScope scope) noexcept : scope_(scope) {}

HookRegistry::~HookRegistry() = default;

std::size_t HookRegistry::segmentOf(std::size_t index) noexcept
{
    const std::size_t pos = index + (std::size_t{1} << kFirstSegmentBits);
    return static_cast<std::size_t>(std::bit_width(pos)) - 1 - kFirstSegmentBits;
}

std::size_t HookRegistry::segmentCapacity(std::size_t segment) noexcept
{
    return std::size_t{1} << (segment + kFirstSegmentBits);
}

std::size_t HookRegistry::segmentBase(std::size_t segment) noexcept
{
    return segmentCapacity(segment) - (std::size_t{1} << kFirstSegmentBits);
}

/// @brief Append a native hook and publish it to readers.
///
/// @details The slot at the current count is filled while holding the append
///          mutex.  A fresh segment is allocated when the slot opens a new one.
///          Only after the entry is complete is the count advanced with release
///          ordering, so a reader that observes the new count also observes
///          the entry.
Expected<void> HookRegistry::append(HookFn fn, void *userData, std::unique_ptr<HookPayload> payload)
{
    if (!fn)
        return makeError(ErrorCode::InvalidArgument, "audit hook must not be null");

    std::lock_guard<std::mutex> lock(appendMutex_);
    const std::size_t index = count_.load(std::memory_order_relaxed);
    const std::size_t segment = segmentOf(index);
    if (segment >= kMaxSegments)
        return makeError(ErrorCode::ResourceExhausted, "audit hook registry is full");

    auto &storage = segments_[segment];
    if (!storage)
    {
        storage.reset(new (std::nothrow) HookEntry[segmentCapacity(segment)]);
        if (!storage)
            return makeError(ErrorCode::ResourceExhausted,
                             "out of memory while growing the audit hook registry");
    }

    HookEntry &entry = storage[index - segmentBase(segment)];
    entry.fn = fn;
    entry.userData = userData;
    entry.scope = scope_;
    entry.payload = std::move(payload);

    count_.store(index + 1, std::memory_order_release);
    return {};
}

Expected<void> HookRegistry::append(ContextHook hook)
{
    if (!hook)
        return makeError(ErrorCode::InvalidArgument, "audit hook must not be empty");

    std::unique_ptr<ClosurePayload> payload(new (std::nothrow) ClosurePayload(std::move(hook)));
    if (!payload)
        return makeError(ErrorCode::ResourceExhausted, "out of memory while registering audit hook");
    void *userData = payload.get();
    return append(&invokeClosure, userData, std::move(payload));
}

std::size_t HookRegistry::size() const noexcept
{
    return count_.load(std::memory_order_acquire);
}

const HookEntry &HookRegistry::operator[](std::size_t index) const noexcept
{
    const std::size_t segment = segmentOf(index);
    return segments_[segment][index - segmentBase(segment)];
}

void HookRegistry::clear() noexcept
{
    std::lock_guard<std::mutex> lock(appendMutex_);
    count_.store(0, std::memory_order_release);
    for (auto &segment : segments_)
        segment.reset();
}

} // namespace vigil::audit
