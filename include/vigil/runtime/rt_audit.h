//===----------------------------------------------------------------------===//
//
// Part of the Vigil project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/vigil/runtime/rt_audit.h
// Purpose: C entry points for embedders and native extensions to install
//          audit hooks, raise audit events and open code through the verified
//          open path.
//
// Key invariants:
//   - Functions returning int report 0 on success and -1 on failure; the
//     failure is described by vigil_audit_last_error() on the same thread.
//   - Hooks return 0 to let an event proceed and non-zero to abort it.
//   - Installed hooks are never removed.
//   - No C++ exception crosses this boundary.
//
// Ownership/Lifetime:
//   - All calls operate on the process-wide audit runtime.
//   - vigil_code_stream objects are owned by the caller and released with
//     vigil_code_stream_close().
//   - Argument views handed to hooks are valid only during the hook call.
//
// Links: src/audit/rt_audit.cpp, docs/audit.md
//
//===----------------------------------------------------------------------===//
#pragma once

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

    /// @brief Failure categories reported by vigil_audit_last_error_code().
    enum vigil_audit_error
    {
        VIGIL_AUDIT_OK = 0,                   ///< No failure recorded.
        VIGIL_AUDIT_E_HOOK_ABORTED = 1,       ///< A hook vetoed the event.
        VIGIL_AUDIT_E_HOOK_CONFLICT = 2,      ///< The open-code hook is already set.
        VIGIL_AUDIT_E_INVALID_ARGUMENT = 3,   ///< Null or malformed input.
        VIGIL_AUDIT_E_FILE_NOT_FOUND = 4,     ///< Path does not exist.
        VIGIL_AUDIT_E_PERMISSION_DENIED = 5,  ///< Access to the path was refused.
        VIGIL_AUDIT_E_IO = 6,                 ///< Other input/output failure.
        VIGIL_AUDIT_E_RESOURCE_EXHAUSTED = 7, ///< Out of memory or registry full.
        VIGIL_AUDIT_E_CONTEXT_CLOSED = 8      ///< Context already torn down.
    };

    /// @brief Kind tag of one audit argument.
    enum vigil_audit_kind
    {
        VIGIL_AUDIT_NONE = 0,
        VIGIL_AUDIT_BOOL = 1,
        VIGIL_AUDIT_INT = 2,
        VIGIL_AUDIT_FLOAT = 3,
        VIGIL_AUDIT_STR = 4,
        VIGIL_AUDIT_BYTES = 5,
        VIGIL_AUDIT_OBJECT = 6
    };

    /// @brief Read-only view of an event's argument tuple.
    typedef struct vigil_audit_args vigil_audit_args;

    /// @brief Readable raw-byte stream produced by the verified open path.
    typedef struct vigil_code_stream vigil_code_stream;

    /// @brief Audit hook: return 0 to allow, non-zero to abort the event.
    typedef int (*vigil_audit_hook_fn)(const char *event,
                                       const vigil_audit_args *args,
                                       void *user_data);

    /// @brief Open-code hook: return a stream for @p path, or NULL to fail.
    typedef vigil_code_stream *(*vigil_open_code_hook_fn)(const char *path, void *user_data);

    //=========================================================================
    // Hooks and events
    //=========================================================================

    /// @brief Append a process-wide audit hook.
    /// @details Legal before any execution context exists.  Raises
    ///          "audit.add_hook" to the hooks already installed; if one of them
    ///          aborts, @p fn is not installed.
    /// @return 0 on success, -1 on failure.
    int vigil_audit_add_global_hook(vigil_audit_hook_fn fn, void *user_data);

    /// @brief Raise @p event to every visible hook.
    /// @details Arguments are described by @p format, one character per value:
    ///          'n' none (no argument consumed), 'b' bool (int),
    ///          'i' int, 'L' long long, 'd' double, 's' const char * (NULL
    ///          becomes none), 'y' bytes (const void *, size_t), 'p' opaque
    ///          pointer.  The tuple is built only when a hook is installed.
    ///          @p format may be NULL for an empty tuple.
    /// @return 0 when every hook allowed the event, -1 otherwise.
    int vigil_audit_raise(const char *event, const char *format, ...);

    /// @brief Check whether a raise on this thread would reach any hook.
    /// @return 1 or 0, or -1 if the process runtime could not be created.
    int vigil_audit_has_hooks(void);

    /// @brief Attach a reason to the abort the calling hook is about to return.
    void vigil_audit_set_error(const char *message);

    /// @brief Message describing the last failure on this thread, or "".
    const char *vigil_audit_last_error(void);

    /// @brief Category of the last failure on this thread (vigil_audit_error).
    int32_t vigil_audit_last_error_code(void);

    //=========================================================================
    // Verified open
    //=========================================================================

    /// @brief Install the process-wide open-code hook.
    /// @return 0 on success; -1 with VIGIL_AUDIT_E_HOOK_CONFLICT when a hook is
    ///         already set, or with the veto of an audit hook.
    int vigil_audit_set_open_code_hook(vigil_open_code_hook_fn fn, void *user_data);

    /// @brief Open @p path for execution.
    /// @return A new stream, or NULL on failure.
    vigil_code_stream *vigil_open_code(const char *path);

    /// @brief Wrap a copy of @p size bytes at @p data as a stream labelled @p path.
    /// @details Intended for open-code hooks that serve content from memory.
    vigil_code_stream *vigil_code_stream_from_buffer(const char *path,
                                                     const void *data,
                                                     size_t size);

    /// @brief Read up to @p capacity bytes into @p buffer.
    /// @return Bytes read, 0 at end of stream, -1 on failure.
    int64_t vigil_code_stream_read(vigil_code_stream *stream, void *buffer, size_t capacity);

    /// @brief Release @p stream; NULL is ignored.
    void vigil_code_stream_close(vigil_code_stream *stream);

    //=========================================================================
    // Argument access (valid only inside a hook)
    //=========================================================================

    size_t vigil_audit_args_count(const vigil_audit_args *args);

    /// @return The vigil_audit_kind of argument @p index, or -1 when out of range.
    int vigil_audit_args_kind(const vigil_audit_args *args, size_t index);

    int vigil_audit_args_bool(const vigil_audit_args *args, size_t index);
    int64_t vigil_audit_args_int(const vigil_audit_args *args, size_t index);
    double vigil_audit_args_float(const vigil_audit_args *args, size_t index);

    /// @brief Text of a string argument; not NUL-terminated in general.
    /// @param length Receives the byte length; may be NULL.
    const char *vigil_audit_args_str(const vigil_audit_args *args, size_t index, size_t *length);

    const void *vigil_audit_args_bytes(const vigil_audit_args *args, size_t index, size_t *length);

    const void *vigil_audit_args_object(const vigil_audit_args *args, size_t index);

#ifdef __cplusplus
}
#endif
