//===----------------------------------------------------------------------===//
//
// Part of the Vigil project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/audit/rt_audit.cpp
// Purpose: Bridges the C audit API onto the process-wide audit Runtime.
// Key invariants: Every entry point converts Expected failures and
//                 exceptions into a -1/NULL return plus a thread-local error
//                 record.
// Ownership/Lifetime: C hook registrations own a small payload recording the
//                     function and user pointer. Streams handed to C own the
//                     underlying CodeStream.
// Links: include/vigil/runtime/rt_audit.h
//
//===----------------------------------------------------------------------===//

#include "vigil/runtime/rt_audit.h"

#include "audit/Runtime.hpp"

#include <cstdarg>
#include <cstddef>
#include <exception>
#include <memory>
#include <new>
#include <string>
#include <vector>

using vigil::audit::AuditValue;
using vigil::audit::CodeStreamPtr;
using vigil::audit::EventArgs;
using vigil::audit::Runtime;
using vigil::support::Diag;
using vigil::support::ErrorCode;
using vigil::support::Expected;
using vigil::support::makeError;

struct vigil_audit_args
{
    const EventArgs &args;
};

struct vigil_code_stream
{
    CodeStreamPtr stream;
};

static_assert(static_cast<int>(ErrorCode::HookAborted) == VIGIL_AUDIT_E_HOOK_ABORTED);
static_assert(static_cast<int>(ErrorCode::HookConflict) == VIGIL_AUDIT_E_HOOK_CONFLICT);
static_assert(static_cast<int>(ErrorCode::InvalidArgument) == VIGIL_AUDIT_E_INVALID_ARGUMENT);
static_assert(static_cast<int>(ErrorCode::FileNotFound) == VIGIL_AUDIT_E_FILE_NOT_FOUND);
static_assert(static_cast<int>(ErrorCode::PermissionDenied) == VIGIL_AUDIT_E_PERMISSION_DENIED);
static_assert(static_cast<int>(ErrorCode::IOError) == VIGIL_AUDIT_E_IO);
static_assert(static_cast<int>(ErrorCode::ResourceExhausted) == VIGIL_AUDIT_E_RESOURCE_EXHAUSTED);
static_assert(static_cast<int>(ErrorCode::ContextClosed) == VIGIL_AUDIT_E_CONTEXT_CLOSED);

static_assert(static_cast<int>(AuditValue::Kind::None) == VIGIL_AUDIT_NONE);
static_assert(static_cast<int>(AuditValue::Kind::Object) == VIGIL_AUDIT_OBJECT);

namespace
{

thread_local std::string tlsLastError;
thread_local ErrorCode tlsLastCode = ErrorCode::None;

/// Reason attached by a C hook through vigil_audit_set_error().
thread_local std::string tlsHookReason;

int fail(const Diag &diag)
{
    tlsLastCode = diag.code;
    tlsLastError = diag.subject.empty() ? diag.message : diag.subject + ": " + diag.message;
    return -1;
}

int fail(ErrorCode code, const char *message)
{
    return fail(makeError(code, message));
}

/// Record an exception escaping a C++ hook; the C caller sees a failed call.
int failException(const std::exception &ex)
{
    if (dynamic_cast<const std::bad_alloc *>(&ex))
        return fail(ErrorCode::ResourceExhausted, "out of memory");
    return fail(ErrorCode::HookAborted, ex.what());
}

/// Record an exception of a type outside the std::exception hierarchy.
int failUnknownException()
{
    return fail(ErrorCode::HookAborted, "audit hook threw a non-standard exception");
}

void clearError()
{
    tlsLastCode = ErrorCode::None;
    tlsLastError.clear();
}

/// Registration record for a C audit hook.
struct CHookPayload final : vigil::audit::HookPayload
{
    vigil_audit_hook_fn fn;
    void *userData;

    CHookPayload(vigil_audit_hook_fn fn, void *userData) : fn(fn), userData(userData) {}
};

/// Registration record for the C open-code hook.
struct COpenCodePayload final : vigil::audit::HookPayload
{
    vigil_open_code_hook_fn fn;
    void *userData;

    COpenCodePayload(vigil_open_code_hook_fn fn, void *userData) : fn(fn), userData(userData) {}
};

Expected<void> invokeCHook(std::string_view event, const EventArgs &args, void *userData)
{
    const auto *hook = static_cast<const CHookPayload *>(userData);
    const std::string name(event);
    vigil_audit_args view{args};

    tlsHookReason.clear();
    if (hook->fn(name.c_str(), &view, hook->userData) == 0)
        return {};

    std::string reason = tlsHookReason.empty() ? "aborted by native audit hook" : tlsHookReason;
    tlsHookReason.clear();
    return makeError(ErrorCode::HookAborted, std::move(reason), name);
}

Expected<CodeStreamPtr> invokeCOpenCodeHook(std::string_view path, void *userData)
{
    const auto *hook = static_cast<const COpenCodePayload *>(userData);
    const std::string target(path);

    tlsHookReason.clear();
    vigil_code_stream *stream = hook->fn(target.c_str(), hook->userData);
    if (!stream)
    {
        std::string reason = tlsHookReason.empty() ? "open-code hook failed" : tlsHookReason;
        tlsHookReason.clear();
        return makeError(ErrorCode::IOError, std::move(reason), target);
    }
    CodeStreamPtr owned = std::move(stream->stream);
    delete stream;
    return owned;
}

/// Convert the variadic arguments described by @p format.
Expected<EventArgs> collectArgs(const char *format, va_list ap)
{
    std::vector<AuditValue> values;
    for (const char *f = format; f && *f; ++f)
    {
        switch (*f)
        {
            case 'n':
                values.emplace_back();
                break;
            case 'b':
                values.emplace_back(va_arg(ap, int) != 0);
                break;
            case 'i':
                values.emplace_back(va_arg(ap, int));
                break;
            case 'L':
                values.emplace_back(va_arg(ap, long long));
                break;
            case 'd':
                values.emplace_back(va_arg(ap, double));
                break;
            case 's':
                values.emplace_back(va_arg(ap, const char *));
                break;
            case 'y':
            {
                const auto *data = static_cast<const std::byte *>(va_arg(ap, const void *));
                const std::size_t size = va_arg(ap, size_t);
                if (!data && size != 0)
                    return makeError(ErrorCode::InvalidArgument, "null bytes argument with non-zero size");
                values.push_back(AuditValue::bytes({data, size}));
                break;
            }
            case 'p':
                values.push_back(AuditValue::object(va_arg(ap, const void *), "pointer"));
                break;
            default:
                return makeError(ErrorCode::InvalidArgument,
                                 std::string("unknown audit format character '") + *f + "'");
        }
    }
    return EventArgs(std::move(values));
}

const AuditValue *argAt(const vigil_audit_args *args, size_t index)
{
    if (!args || index >= args->args.size())
        return nullptr;
    return &args->args[index];
}

} // namespace

extern "C"
{

int vigil_audit_add_global_hook(vigil_audit_hook_fn fn, void *user_data)
{
    clearError();
    if (!fn)
        return fail(ErrorCode::InvalidArgument, "audit hook must not be null");
    try
    {
        auto payload = std::make_unique<CHookPayload>(fn, user_data);
        void *ud = payload.get();
        auto added = Runtime::process().addGlobalHook(&invokeCHook, ud, std::move(payload));
        return added ? 0 : fail(added.error());
    }
    catch (const std::exception &ex)
    {
        return failException(ex);
    }
    catch (...)
    {
        return failUnknownException();
    }
}

int vigil_audit_raise(const char *event, const char *format, ...)
{
    clearError();
    if (!event || !*event)
        return fail(ErrorCode::InvalidArgument, "audit event name must not be empty");

    va_list ap;
    va_start(ap, format);
    int status = 0;
    try
    {
        Runtime &runtime = Runtime::process();
        if (!runtime.hasHooks())
        {
            va_end(ap);
            return 0;
        }
        auto args = collectArgs(format, ap);
        if (!args)
            status = fail(args.error());
        else if (auto raised = runtime.raise(event, args.value()); !raised)
            status = fail(raised.error());
    }
    catch (const std::exception &ex)
    {
        status = failException(ex);
    }
    catch (...)
    {
        status = failUnknownException();
    }
    va_end(ap);
    return status;
}

int vigil_audit_has_hooks(void)
{
    clearError();
    try
    {
        return Runtime::process().hasHooks() ? 1 : 0;
    }
    catch (const std::exception &ex)
    {
        return failException(ex);
    }
}

void vigil_audit_set_error(const char *message)
{
    tlsHookReason = message ? message : "";
}

const char *vigil_audit_last_error(void)
{
    return tlsLastError.c_str();
}

int32_t vigil_audit_last_error_code(void)
{
    return static_cast<int32_t>(tlsLastCode);
}

int vigil_audit_set_open_code_hook(vigil_open_code_hook_fn fn, void *user_data)
{
    clearError();
    if (!fn)
        return fail(ErrorCode::InvalidArgument, "open-code hook must not be null");
    try
    {
        auto payload = std::make_unique<COpenCodePayload>(fn, user_data);
        void *ud = payload.get();
        auto set = Runtime::process().setOpenCodeHook(&invokeCOpenCodeHook, ud, std::move(payload));
        return set ? 0 : fail(set.error());
    }
    catch (const std::exception &ex)
    {
        return failException(ex);
    }
    catch (...)
    {
        return failUnknownException();
    }
}

vigil_code_stream *vigil_open_code(const char *path)
{
    clearError();
    if (!path)
    {
        fail(ErrorCode::InvalidArgument, "path must be a non-empty string");
        return nullptr;
    }
    try
    {
        auto opened = Runtime::process().openCode(path);
        if (!opened)
        {
            fail(opened.error());
            return nullptr;
        }
        return new vigil_code_stream{std::move(opened).value()};
    }
    catch (const std::exception &ex)
    {
        failException(ex);
        return nullptr;
    }
    catch (...)
    {
        failUnknownException();
        return nullptr;
    }
}

vigil_code_stream *vigil_code_stream_from_buffer(const char *path, const void *data, size_t size)
{
    clearError();
    if (!data && size != 0)
    {
        fail(ErrorCode::InvalidArgument, "null buffer with non-zero size");
        return nullptr;
    }
    try
    {
        std::string contents(static_cast<const char *>(data), size);
        return new vigil_code_stream{
            vigil::audit::BufferCodeStream::make(path ? path : "", std::move(contents))};
    }
    catch (const std::exception &ex)
    {
        failException(ex);
        return nullptr;
    }
    catch (...)
    {
        failUnknownException();
        return nullptr;
    }
}

int64_t vigil_code_stream_read(vigil_code_stream *stream, void *buffer, size_t capacity)
{
    clearError();
    if (!stream || !stream->stream || (!buffer && capacity != 0))
        return fail(ErrorCode::InvalidArgument, "invalid stream read");
    try
    {
        auto got = stream->stream->read({static_cast<std::byte *>(buffer), capacity});
        if (!got)
            return fail(got.error());
        return static_cast<int64_t>(got.value());
    }
    catch (const std::exception &ex)
    {
        return failException(ex);
    }
    catch (...)
    {
        return failUnknownException();
    }
}

void vigil_code_stream_close(vigil_code_stream *stream)
{
    delete stream;
}

size_t vigil_audit_args_count(const vigil_audit_args *args)
{
    return args ? args->args.size() : 0;
}

int vigil_audit_args_kind(const vigil_audit_args *args, size_t index)
{
    const AuditValue *v = argAt(args, index);
    return v ? static_cast<int>(v->kind()) : -1;
}

int vigil_audit_args_bool(const vigil_audit_args *args, size_t index)
{
    const AuditValue *v = argAt(args, index);
    return v && v->kind() == AuditValue::Kind::Bool && v->asBool() ? 1 : 0;
}

int64_t vigil_audit_args_int(const vigil_audit_args *args, size_t index)
{
    const AuditValue *v = argAt(args, index);
    return v && v->kind() == AuditValue::Kind::Int ? v->asInt() : 0;
}

double vigil_audit_args_float(const vigil_audit_args *args, size_t index)
{
    const AuditValue *v = argAt(args, index);
    return v && v->kind() == AuditValue::Kind::Float ? v->asFloat() : 0.0;
}

const char *vigil_audit_args_str(const vigil_audit_args *args, size_t index, size_t *length)
{
    const AuditValue *v = argAt(args, index);
    if (!v || v->kind() != AuditValue::Kind::Str)
    {
        if (length)
            *length = 0;
        return nullptr;
    }
    if (length)
        *length = v->asStr().size();
    return v->asStr().data();
}

const void *vigil_audit_args_bytes(const vigil_audit_args *args, size_t index, size_t *length)
{
    const AuditValue *v = argAt(args, index);
    if (!v || v->kind() != AuditValue::Kind::Bytes)
    {
        if (length)
            *length = 0;
        return nullptr;
    }
    if (length)
        *length = v->asBytes().size();
    return v->asBytes().data();
}

const void *vigil_audit_args_object(const vigil_audit_args *args, size_t index)
{
    const AuditValue *v = argAt(args, index);
    return v && v->kind() == AuditValue::Kind::Object ? v->asObject() : nullptr;
}

} // extern "C"
