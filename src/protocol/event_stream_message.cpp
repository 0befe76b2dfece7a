/* SPDX-License-Identifier: MPL-2.0 */

#include "protocol/event_stream_message.hpp"
#include "crypto/checksum.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"
#include "utils/wire.hpp"

#include <string.h>

s3wire::message_t::message_t ()
{
}

s3wire::message_t &s3wire::message_t::add_header (const std::string &name_,
                                                  const std::string &value_)
{
    _headers.push_back (header_t (name_, value_));
    return *this;
}

const s3wire::header_t *
s3wire::message_t::find_header (const std::string &name_) const
{
    for (std::vector<header_t>::const_iterator it = _headers.begin ();
         it != _headers.end (); ++it)
        if (it->name == name_)
            return &*it;
    return NULL;
}

void s3wire::message_t::set_payload (const void *data_, size_t size_)
{
    s3wire_assert (data_ != NULL || size_ == 0);
    _payload = std::string (static_cast<const char *> (data_), size_);
}

void s3wire::message_t::clear ()
{
    _headers.clear ();
    _payload = boost::none;
}

int s3wire::message_t::encoded_size (uint32_t *total_length_,
                                     uint32_t *headers_length_) const
{
    uint32_t headers_length = 0;
    for (std::vector<header_t>::const_iterator it = _headers.begin ();
         it != _headers.end (); ++it) {
        if (!checked_add_u32 (&headers_length, es_header_fixed_size)
            || !checked_add_u32 (&headers_length, it->name.size ())
            || !checked_add_u32 (&headers_length, it->value.size ())) {
            errno = EOVERFLOW;
            return -1;
        }
    }

    uint32_t total_length = headers_length;
    if (!checked_add_u32 (&total_length, es_frame_overhead)
        || !checked_add_u32 (&total_length,
                             _payload ? _payload->size () : 0)) {
        errno = EOVERFLOW;
        return -1;
    }

    *total_length_ = total_length;
    *headers_length_ = headers_length;
    return 0;
}

int s3wire::message_t::encode (std::vector<unsigned char> &out_,
                               int *error_) const
{
    uint32_t total_length = 0;
    uint32_t headers_length = 0;
    if (encoded_size (&total_length, &headers_length) == -1) {
        if (error_)
            *error_ = es_error_length_overflow;
        S3WIRE_DEBUG_INC_ENCODE_FAILURES ();
        return -1;
    }

    const size_t offset = out_.size ();
    out_.resize (offset + total_length);
    unsigned char *const frame = &out_[offset];
    unsigned char *pos = frame;

    put_uint32 (pos, total_length);
    put_uint32 (pos + 4, headers_length);
    put_uint32 (pos + es_prelude_crc_offset,
                crc32_t::checksum_u32 (pos, es_prelude_crc_offset));
    pos += es_prelude_size;

    for (std::vector<header_t>::const_iterator it = _headers.begin ();
         it != _headers.end (); ++it) {
        const size_t name_len = it->name.size ();
        const size_t value_len = it->value.size ();
        if (name_len > es_max_header_name_length
            || value_len > es_max_header_value_length) {
            out_.resize (offset);
            if (error_)
                *error_ = es_error_int_overflow;
            S3WIRE_DEBUG_INC_ENCODE_FAILURES ();
            errno = EOVERFLOW;
            return -1;
        }
        put_uint8 (pos, static_cast<uint8_t> (name_len));
        pos += 1;
        if (name_len)
            memcpy (pos, it->name.data (), name_len);
        pos += name_len;
        put_uint8 (pos, es_header_value_type_string);
        pos += 1;
        put_uint16 (pos, static_cast<uint16_t> (value_len));
        pos += 2;
        if (value_len)
            memcpy (pos, it->value.data (), value_len);
        pos += value_len;
    }

    if (_payload && !_payload->empty ()) {
        memcpy (pos, _payload->data (), _payload->size ());
        pos += _payload->size ();
    }

    const size_t covered = static_cast<size_t> (pos - frame);
    s3wire_assert (covered + es_message_crc_size == total_length);
    put_uint32 (pos, crc32_t::checksum_u32 (frame, covered));

    if (error_)
        *error_ = es_error_none;
    S3WIRE_DEBUG_INC_FRAMES_ENCODED ();
    S3WIRE_DEBUG_ADD_BYTES_ENCODED (total_length);
    return 0;
}
