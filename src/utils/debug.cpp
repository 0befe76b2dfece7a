/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/debug.hpp"

#if defined(S3WIRE_DEBUG_COUNTERS)

#include <atomic>

namespace
{
std::atomic<size_t> frames_encoded (0);
std::atomic<size_t> error_frames_encoded (0);
std::atomic<size_t> bytes_encoded (0);
std::atomic<size_t> encode_failures (0);
}

size_t s3wire::debug_get_frames_encoded ()
{
    return frames_encoded.load (std::memory_order_relaxed);
}

size_t s3wire::debug_get_error_frames_encoded ()
{
    return error_frames_encoded.load (std::memory_order_relaxed);
}

size_t s3wire::debug_get_bytes_encoded ()
{
    return bytes_encoded.load (std::memory_order_relaxed);
}

size_t s3wire::debug_get_encode_failures ()
{
    return encode_failures.load (std::memory_order_relaxed);
}

void s3wire::debug_reset_counters ()
{
    frames_encoded.store (0, std::memory_order_relaxed);
    error_frames_encoded.store (0, std::memory_order_relaxed);
    bytes_encoded.store (0, std::memory_order_relaxed);
    encode_failures.store (0, std::memory_order_relaxed);
}

void s3wire::debug_inc_frames_encoded ()
{
    frames_encoded.fetch_add (1, std::memory_order_relaxed);
}

void s3wire::debug_inc_error_frames_encoded ()
{
    error_frames_encoded.fetch_add (1, std::memory_order_relaxed);
}

void s3wire::debug_add_bytes_encoded (size_t bytes_)
{
    bytes_encoded.fetch_add (bytes_, std::memory_order_relaxed);
}

void s3wire::debug_inc_encode_failures ()
{
    encode_failures.fetch_add (1, std::memory_order_relaxed);
}

#endif
