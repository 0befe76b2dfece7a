/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __S3WIRE_EVENT_STREAM_PROTOCOL_HPP_INCLUDED__
#define __S3WIRE_EVENT_STREAM_PROTOCOL_HPP_INCLUDED__

#include <stdint.h>

namespace s3wire
{
//  Event stream framing constants.
enum
{
    es_prelude_size = 12,
    es_prelude_crc_offset = 8,
    es_message_crc_size = 4,
    es_frame_overhead = es_prelude_size + es_message_crc_size,
    es_header_fixed_size = 4,
    es_header_value_type_string = 7,
    es_max_header_name_length = 0xFF,
    es_max_header_value_length = 0xFFFF,
    //  Largest amount of frame body the decoder buffers ahead of the data
    //  actually received.
    es_decoder_read_chunk = 65536
};

const uint32_t es_max_frame_size = 0xFFFFFFFFu;

//  Error kinds reported by the codec and the decoder.
enum
{
    es_error_none = 0,
    es_error_length_overflow = 1,
    es_error_int_overflow = 2,
    es_error_frame_invalid = 3,
    es_error_frame_too_large = 4,
    es_error_prelude_crc_mismatch = 5,
    es_error_message_crc_mismatch = 6,
    es_error_header_invalid = 7
};

inline const char *event_stream_error_reason (int code_)
{
    switch (code_) {
        case es_error_none:
            return "no error";
        case es_error_length_overflow:
            return "Message Serialization: LengthOverflow";
        case es_error_int_overflow:
            return "Message Serialization: IntOverflow";
        case es_error_frame_invalid:
            return "Message Deserialization: FrameInvalid";
        case es_error_frame_too_large:
            return "Message Deserialization: FrameTooLarge";
        case es_error_prelude_crc_mismatch:
            return "Message Deserialization: PreludeChecksumMismatch";
        case es_error_message_crc_mismatch:
            return "Message Deserialization: MessageChecksumMismatch";
        case es_error_header_invalid:
            return "Message Deserialization: HeaderInvalid";
        default:
            return "unknown";
    }
}
}

//  Well-known header names and values.
#define S3WIRE_HEADER_EVENT_TYPE ":event-type"
#define S3WIRE_HEADER_CONTENT_TYPE ":content-type"
#define S3WIRE_HEADER_MESSAGE_TYPE ":message-type"
#define S3WIRE_HEADER_ERROR_CODE ":error-code"
#define S3WIRE_HEADER_ERROR_MESSAGE ":error-message"

#define S3WIRE_MESSAGE_TYPE_EVENT "event"
#define S3WIRE_MESSAGE_TYPE_ERROR "error"

#define S3WIRE_CONTENT_TYPE_XML "text/xml"
#define S3WIRE_CONTENT_TYPE_OCTET_STREAM "application/octet-stream"

#endif
