/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __S3WIRE_DEBUG_HPP_INCLUDED__
#define __S3WIRE_DEBUG_HPP_INCLUDED__

#include <cstdio>
#include <stddef.h>

//  Unified debug macros for s3wire components
//  Enable with -DS3WIRE_DEBUG=1 during compilation
//
//  Usage:
//    S3WIRE_DBG_STREAM ("item %zu encoded: %zu bytes", index, size);
//    S3WIRE_DBG_WRITER ("write completed");
//    S3WIRE_GLOBAL_ERROR ("frame rejected: %s", reason);

#ifdef S3WIRE_DEBUG

#define S3WIRE_DBG(category, fmt, ...)                                         \
    do {                                                                       \
        fprintf (stderr, "[S3WIRE:" category "] " fmt "\n", ##__VA_ARGS__);    \
    } while (0)

#define S3WIRE_DBG_THIS(category, fmt, ...)                                    \
    do {                                                                       \
        fprintf (stderr, "[S3WIRE:" category ":%p] " fmt "\n",                 \
                 static_cast<const void *> (this), ##__VA_ARGS__);             \
    } while (0)

#else

#define S3WIRE_DBG(category, fmt, ...) ((void) 0)
#define S3WIRE_DBG_THIS(category, fmt, ...) ((void) 0)

#endif

//  Component-specific macros
#define S3WIRE_DBG_STREAM(fmt, ...) S3WIRE_DBG_THIS ("STREAM", fmt, ##__VA_ARGS__)
#define S3WIRE_DBG_WRITER(fmt, ...) S3WIRE_DBG_THIS ("WRITER", fmt, ##__VA_ARGS__)
#define S3WIRE_DBG_DECODER(fmt, ...)                                           \
    S3WIRE_DBG_THIS ("DECODER", fmt, ##__VA_ARGS__)

//  Severity-based macros (with this pointer)
#define S3WIRE_LOG_ERROR(fmt, ...) S3WIRE_DBG_THIS ("ERROR", fmt, ##__VA_ARGS__)
#define S3WIRE_LOG_WARN(fmt, ...) S3WIRE_DBG_THIS ("WARN", fmt, ##__VA_ARGS__)
#define S3WIRE_LOG_INFO(fmt, ...) S3WIRE_DBG_THIS ("INFO", fmt, ##__VA_ARGS__)
#define S3WIRE_LOG_DEBUG(fmt, ...) S3WIRE_DBG_THIS ("DEBUG", fmt, ##__VA_ARGS__)

//  Global severity macros (without this pointer)
#define S3WIRE_GLOBAL_ERROR(fmt, ...) S3WIRE_DBG ("ERROR", fmt, ##__VA_ARGS__)
#define S3WIRE_GLOBAL_WARN(fmt, ...) S3WIRE_DBG ("WARN", fmt, ##__VA_ARGS__)
#define S3WIRE_GLOBAL_INFO(fmt, ...) S3WIRE_DBG ("INFO", fmt, ##__VA_ARGS__)
#define S3WIRE_GLOBAL_DEBUG(fmt, ...) S3WIRE_DBG ("DEBUG", fmt, ##__VA_ARGS__)

// Debug counters - only active when S3WIRE_DEBUG_COUNTERS is defined
// These are for testing purposes only, not part of the public API

#if defined(S3WIRE_DEBUG_COUNTERS)

namespace s3wire
{
size_t debug_get_frames_encoded ();
size_t debug_get_error_frames_encoded ();
size_t debug_get_bytes_encoded ();
size_t debug_get_encode_failures ();
void debug_reset_counters ();

void debug_inc_frames_encoded ();
void debug_inc_error_frames_encoded ();
void debug_add_bytes_encoded (size_t bytes_);
void debug_inc_encode_failures ();
}

#define S3WIRE_DEBUG_INC_FRAMES_ENCODED() s3wire::debug_inc_frames_encoded ()
#define S3WIRE_DEBUG_INC_ERROR_FRAMES_ENCODED()                                \
    s3wire::debug_inc_error_frames_encoded ()
#define S3WIRE_DEBUG_ADD_BYTES_ENCODED(x) s3wire::debug_add_bytes_encoded (x)
#define S3WIRE_DEBUG_INC_ENCODE_FAILURES() s3wire::debug_inc_encode_failures ()

#else

#define S3WIRE_DEBUG_INC_FRAMES_ENCODED() ((void) 0)
#define S3WIRE_DEBUG_INC_ERROR_FRAMES_ENCODED() ((void) 0)
#define S3WIRE_DEBUG_ADD_BYTES_ENCODED(x) ((void) 0)
#define S3WIRE_DEBUG_INC_ENCODE_FAILURES() ((void) 0)

#endif // S3WIRE_DEBUG_COUNTERS

#endif
