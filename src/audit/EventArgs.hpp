//===----------------------------------------------------------------------===//
//
// Part of the Vigil project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: audit/EventArgs.hpp
// Purpose: Declares the argument tuple delivered with every audit event.
// Key invariants: EventArgs is immutable once constructed. Str, Bytes and
//                 Object values reference caller-owned data; nothing is copied
//                 for auditing.
// Ownership/Lifetime: Referenced data must outlive the raise that carries it.
//                     Hooks that keep values past their return must copy them.
// Links: docs/audit.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace vigil::audit
{

/// @brief One positional value of an audit event.
///
/// A small tagged value.  Scalars are stored inline; strings, byte ranges and
/// objects are stored as non-owning references to live data so a hook can
/// inspect the object actually involved in the operation.
class AuditValue
{
  public:
    enum class Kind : uint8_t
    {
        None,   ///< Absent value.
        Bool,   ///< Boolean flag.
        Int,    ///< Signed 64-bit integer.
        Float,  ///< Double precision float.
        Str,    ///< Borrowed UTF-8 text.
        Bytes,  ///< Borrowed byte range.
        Object, ///< Borrowed opaque object with a type label.
    };

    /// @brief Construct a None value.
    constexpr AuditValue() noexcept = default;

    constexpr AuditValue(std::nullptr_t) noexcept {}

    constexpr AuditValue(bool value) noexcept : kind_(Kind::Bool)
    {
        scalar_.b = value;
    }

    template <typename T,
              std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
    constexpr AuditValue(T value) noexcept : kind_(Kind::Int)
    {
        scalar_.i = static_cast<int64_t>(value);
    }

    constexpr AuditValue(double value) noexcept : kind_(Kind::Float)
    {
        scalar_.f = value;
    }

    /// @brief Borrow a C string; a null pointer yields None.
    AuditValue(const char *text) noexcept;

    AuditValue(char *text) noexcept : AuditValue(static_cast<const char *>(text)) {}

    AuditValue(std::string_view text) noexcept;

    AuditValue(const std::string &text) noexcept : AuditValue(std::string_view(text)) {}

    /// Pointers must be wrapped with object() so they never decay to Bool.
    template <typename T> AuditValue(T *) = delete;

    /// @brief Borrow a byte range.
    static AuditValue bytes(std::span<const std::byte> data) noexcept;

    /// @brief Borrow an opaque object labelled with @p typeName.
    /// @details A null @p object yields None.
    static AuditValue object(const void *object, std::string_view typeName) noexcept;

    Kind kind() const noexcept
    {
        return kind_;
    }

    bool isNone() const noexcept
    {
        return kind_ == Kind::None;
    }

    /// @name Typed accessors
    /// @pre kind() matches the accessor.
    /// @{
    bool asBool() const noexcept
    {
        return scalar_.b;
    }

    int64_t asInt() const noexcept
    {
        return scalar_.i;
    }

    double asFloat() const noexcept
    {
        return scalar_.f;
    }

    std::string_view asStr() const noexcept
    {
        return {static_cast<const char *>(ref_), size_};
    }

    std::span<const std::byte> asBytes() const noexcept
    {
        return {static_cast<const std::byte *>(ref_), size_};
    }

    const void *asObject() const noexcept
    {
        return ref_;
    }

    /// @brief Type label supplied with object(); empty for other kinds.
    std::string_view typeName() const noexcept
    {
        return typeName_;
    }
    /// @}

    /// @brief Scalars and text compare by value; bytes by content; objects by identity.
    bool operator==(const AuditValue &other) const noexcept;

    /// @brief Short human-readable rendering used by tracing and tests.
    std::string toString() const;

  private:
    Kind kind_ = Kind::None;

    union Scalar
    {
        bool b;
        int64_t i;
        double f;
    } scalar_{};

    const void *ref_ = nullptr;
    std::size_t size_ = 0;
    std::string_view typeName_;
};

/// @brief Immutable ordered tuple of values describing one occurrence.
class EventArgs
{
  public:
    using const_iterator = std::vector<AuditValue>::const_iterator;

    EventArgs() = default;

    EventArgs(std::initializer_list<AuditValue> values) : values_(values) {}

    explicit EventArgs(std::vector<AuditValue> values) : values_(std::move(values)) {}

    std::size_t size() const noexcept
    {
        return values_.size();
    }

    bool empty() const noexcept
    {
        return values_.empty();
    }

    /// @pre @p index < size().
    const AuditValue &operator[](std::size_t index) const noexcept
    {
        return values_[index];
    }

    const_iterator begin() const noexcept
    {
        return values_.begin();
    }

    const_iterator end() const noexcept
    {
        return values_.end();
    }

    bool operator==(const EventArgs &other) const noexcept
    {
        return values_ == other.values_;
    }

    /// @brief Render as "(v0, v1, ...)".
    std::string toString() const;

  private:
    std::vector<AuditValue> values_;
};

} // namespace vigil::audit
