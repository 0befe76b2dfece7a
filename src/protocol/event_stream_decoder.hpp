/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __S3WIRE_EVENT_STREAM_DECODER_HPP_INCLUDED__
#define __S3WIRE_EVENT_STREAM_DECODER_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>

#include <vector>

#include "core/options.hpp"
#include "protocol/decoder.hpp"
#include "protocol/event_stream_message.hpp"
#include "protocol/event_stream_protocol.hpp"

namespace s3wire
{
//  Decoder for event stream frames. Once decode () returned 1 the frame
//  is available through msg () until the next call. Errors are sticky:
//  every later call fails the same way until reset ().
class event_stream_decoder_t S3WIRE_FINAL
    : public decoder_base_t<event_stream_decoder_t>
{
  public:
    //  max_frame_size_ < 0 means the 32-bit length field is the only
    //  limit. The frame buffer grows with the bytes received, so an
    //  announced length is never allocated up front.
    explicit event_stream_decoder_t (int64_t max_frame_size_ = -1);

    //  Takes the frame limit from options_.max_frame_size.
    explicit event_stream_decoder_t (const options_t &options_);
    ~event_stream_decoder_t ();

    const message_t *msg () const { return &_in_progress; }
    int error_code () const { return _error_code; }

    //  Bytes of the current frame held so far.
    size_t buffered () const { return _frame.size (); }
    uint32_t max_frame_size () const { return _max_frame_size_effective; }

    //  Discards partial input and any error, expecting a new prelude.
    void reset ();

  private:
    int prelude_ready (unsigned char const *read_from_);
    int body_ready (unsigned char const *read_from_);

    int next_body_chunk ();

    int fail (int error_code_, int errno_);
    int parse_headers (const unsigned char *data_, uint32_t size_);

    unsigned char _prelude[es_prelude_size];
    std::vector<unsigned char> _frame;
    uint32_t _frame_length;
    int _error_code;
    message_t _in_progress;
    const uint32_t _max_frame_size_effective;

    S3WIRE_NON_COPYABLE_NOR_MOVABLE (event_stream_decoder_t)
};
}

#endif
