/* SPDX-License-Identifier: MPL-2.0 */

#include "protocol/event_stream_decoder.hpp"
#include "crypto/checksum.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"
#include "utils/wire.hpp"

#include <algorithm>

namespace
{
static uint32_t compute_effective_max (int64_t max_frame_size_)
{
    uint64_t limit = s3wire::es_max_frame_size;
    if (max_frame_size_ >= 0
        && static_cast<uint64_t> (max_frame_size_) < limit)
        limit = static_cast<uint64_t> (max_frame_size_);
    return static_cast<uint32_t> (limit);
}
}

s3wire::event_stream_decoder_t::event_stream_decoder_t (
  int64_t max_frame_size_) :
    _frame_length (0),
    _error_code (es_error_none),
    _max_frame_size_effective (compute_effective_max (max_frame_size_))
{
    next_step (_prelude, es_prelude_size,
               &event_stream_decoder_t::prelude_ready);
}

s3wire::event_stream_decoder_t::event_stream_decoder_t (
  const options_t &options_) :
    _frame_length (0),
    _error_code (es_error_none),
    _max_frame_size_effective (options_.effective_max_frame_size ())
{
    next_step (_prelude, es_prelude_size,
               &event_stream_decoder_t::prelude_ready);
}

s3wire::event_stream_decoder_t::~event_stream_decoder_t ()
{
}

void s3wire::event_stream_decoder_t::reset ()
{
    _error_code = es_error_none;
    _frame.clear ();
    _frame_length = 0;
    _in_progress.clear ();
    next_step (_prelude, es_prelude_size,
               &event_stream_decoder_t::prelude_ready);
}

int s3wire::event_stream_decoder_t::fail (int error_code_, int errno_)
{
    _error_code = error_code_;
    S3WIRE_DBG_DECODER ("frame rejected: %s",
                        event_stream_error_reason (error_code_));
    errno = errno_;
    return -1;
}

int s3wire::event_stream_decoder_t::prelude_ready (unsigned char const *)
{
    const uint32_t total_length = get_uint32 (_prelude);
    const uint32_t headers_length = get_uint32 (_prelude + 4);

    if (unlikely (total_length < es_frame_overhead
                  || headers_length > total_length - es_frame_overhead))
        return fail (es_error_frame_invalid, EPROTO);

    if (unlikely (total_length > _max_frame_size_effective))
        return fail (es_error_frame_too_large, EMSGSIZE);

    const uint32_t prelude_crc = get_uint32 (_prelude + es_prelude_crc_offset);
    if (unlikely (crc32_t::checksum_u32 (_prelude, es_prelude_crc_offset)
                  != prelude_crc))
        return fail (es_error_prelude_crc_mismatch, EPROTO);

    _in_progress.clear ();
    _frame.assign (_prelude, _prelude + es_prelude_size);
    _frame_length = total_length;
    return next_body_chunk ();
}

int s3wire::event_stream_decoder_t::next_body_chunk ()
{
    const size_t held = _frame.size ();
    const size_t chunk =
      std::min (static_cast<size_t> (_frame_length) - held,
                static_cast<size_t> (es_decoder_read_chunk));
    _frame.resize (held + chunk);
    next_step (&_frame[held], chunk, &event_stream_decoder_t::body_ready);
    return 0;
}

int s3wire::event_stream_decoder_t::body_ready (unsigned char const *)
{
    if (_frame.size () < _frame_length)
        return next_body_chunk ();

    const uint32_t total_length = _frame_length;
    const uint32_t headers_length = get_uint32 (&_frame[4]);
    const uint32_t covered = total_length - es_message_crc_size;

    if (unlikely (crc32_t::checksum_u32 (&_frame[0], covered)
                  != get_uint32 (&_frame[covered])))
        return fail (es_error_message_crc_mismatch, EPROTO);

    _in_progress.clear ();
    if (parse_headers (&_frame[es_prelude_size], headers_length) == -1)
        return -1;

    const uint32_t payload_length =
      total_length - headers_length - es_frame_overhead;
    if (payload_length > 0)
        _in_progress.set_payload (
          &_frame[es_prelude_size + headers_length], payload_length);

    next_step (_prelude, es_prelude_size,
               &event_stream_decoder_t::prelude_ready);
    return 1;
}

int s3wire::event_stream_decoder_t::parse_headers (const unsigned char *data_,
                                                   uint32_t size_)
{
    const unsigned char *pos = data_;
    const unsigned char *const end = data_ + size_;

    while (pos < end) {
        const size_t name_len = get_uint8 (pos);
        pos += 1;
        //  name, type byte and value length must follow.
        if (static_cast<size_t> (end - pos) < name_len + 3)
            return fail (es_error_header_invalid, EPROTO);
        const std::string name (reinterpret_cast<const char *> (pos),
                                name_len);
        pos += name_len;

        if (get_uint8 (pos) != es_header_value_type_string)
            return fail (es_error_header_invalid, EPROTO);
        pos += 1;

        const size_t value_len = get_uint16 (pos);
        pos += 2;
        if (static_cast<size_t> (end - pos) < value_len)
            return fail (es_error_header_invalid, EPROTO);
        _in_progress.add_header (
          name, std::string (reinterpret_cast<const char *> (pos), value_len));
        pos += value_len;
    }
    return 0;
}
