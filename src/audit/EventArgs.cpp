//===----------------------------------------------------------------------===//
//
// Part of the Vigil project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: audit/EventArgs.cpp
// Purpose: Implements construction, comparison and rendering of audit values.
// Key invariants: Borrowed values never copy the referenced data.
// Ownership/Lifetime: See EventArgs.hpp.
// Links: docs/audit.md
//
//===----------------------------------------------------------------------===//

#include "audit/EventArgs.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <sstream>

namespace vigil::audit
{

AuditValue::AuditValue(const char *text) noexcept
{
    if (!text)
        return;
    kind_ = Kind::Str;
    ref_ = text;
    size_ = std::strlen(text);
}

AuditValue::AuditValue(std::string_view text) noexcept
    : kind_(Kind::Str), ref_(text.data()), size_(text.size())
{
}

AuditValue AuditValue::bytes(std::span<const std::byte> data) noexcept
{
    AuditValue value;
    value.kind_ = Kind::Bytes;
    value.ref_ = data.data();
    value.size_ = data.size();
    return value;
}

AuditValue AuditValue::object(const void *object, std::string_view typeName) noexcept
{
    AuditValue value;
    if (!object)
        return value;
    value.kind_ = Kind::Object;
    value.ref_ = object;
    value.typeName_ = typeName;
    return value;
}

bool AuditValue::operator==(const AuditValue &other) const noexcept
{
    if (kind_ != other.kind_)
        return false;
    switch (kind_)
    {
        case Kind::None:
            return true;
        case Kind::Bool:
            return scalar_.b == other.scalar_.b;
        case Kind::Int:
            return scalar_.i == other.scalar_.i;
        case Kind::Float:
            return scalar_.f == other.scalar_.f;
        case Kind::Str:
            return asStr() == other.asStr();
        case Kind::Bytes:
        {
            const auto lhs = asBytes();
            const auto rhs = other.asBytes();
            return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end());
        }
        case Kind::Object:
            return ref_ == other.ref_;
    }
    return false;
}

std::string AuditValue::toString() const
{
    switch (kind_)
    {
        case Kind::None:
            return "None";
        case Kind::Bool:
            return scalar_.b ? "True" : "False";
        case Kind::Int:
            return std::to_string(scalar_.i);
        case Kind::Float:
        {
            std::ostringstream os;
            os << scalar_.f;
            return os.str();
        }
        case Kind::Str:
        {
            std::string out;
            out.reserve(size_ + 2);
            out += '\'';
            out += asStr();
            out += '\'';
            return out;
        }
        case Kind::Bytes:
            return "<" + std::to_string(size_) + " bytes>";
        case Kind::Object:
        {
            char addr[32];
            std::snprintf(addr, sizeof(addr), "%p", ref_);
            std::string out = "<";
            out += typeName_.empty() ? std::string_view("object") : typeName_;
            out += " at ";
            out += addr;
            out += '>';
            return out;
        }
    }
    return "None";
}

std::string EventArgs::toString() const
{
    std::string out = "(";
    for (std::size_t i = 0; i < values_.size(); ++i)
    {
        if (i != 0)
            out += ", ";
        out += values_[i].toString();
    }
    out += ')';
    return out;
}

} // namespace vigil::audit
