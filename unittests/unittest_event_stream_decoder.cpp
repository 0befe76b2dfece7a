/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "core/options.hpp"
#include "crypto/checksum.hpp"
#include "protocol/event_stream_decoder.hpp"
#include "protocol/event_stream_message.hpp"
#include "protocol/event_stream_protocol.hpp"
#include "utils/wire.hpp"

#include <unity.h>

void setUp ()
{
}

void tearDown ()
{
}

static std::vector<unsigned char> encode_records (const std::string &payload_)
{
    s3wire::message_t msg;
    msg.add_header (":event-type", "Records")
      .add_header (":content-type", "application/octet-stream")
      .add_header (":message-type", "event");
    msg.set_payload (payload_);
    std::vector<unsigned char> out;
    const int rc = msg.encode (out);
    TEST_ASSERT_EQUAL_INT (0, rc);
    return out;
}

//  Rewrites both CRCs after the frame was tampered with.
static void fix_crcs (std::vector<unsigned char> &frame_)
{
    s3wire::put_uint32 (&frame_[8],
                        s3wire::crc32_t::checksum_u32 (&frame_[0], 8));
    const size_t covered = frame_.size () - 4;
    s3wire::put_uint32 (&frame_[covered],
                        s3wire::crc32_t::checksum_u32 (&frame_[0], covered));
}

void test_decode_round_trip ()
{
    const std::vector<unsigned char> frame = encode_records ("1,alice\n");

    s3wire::event_stream_decoder_t decoder;
    size_t processed = 0;
    const int rc = decoder.decode (&frame[0], frame.size (), processed);
    TEST_ASSERT_EQUAL_INT (1, rc);
    TEST_ASSERT_EQUAL_UINT (frame.size (), processed);

    const s3wire::message_t *msg = decoder.msg ();
    TEST_ASSERT_EQUAL_UINT (3, msg->headers ().size ());
    TEST_ASSERT_EQUAL_STRING (":event-type",
                              msg->headers ()[0].name.c_str ());
    TEST_ASSERT_EQUAL_STRING ("Records", msg->headers ()[0].value.c_str ());
    TEST_ASSERT_EQUAL_STRING (":content-type",
                              msg->headers ()[1].name.c_str ());
    TEST_ASSERT_EQUAL_STRING (":message-type",
                              msg->headers ()[2].name.c_str ());
    TEST_ASSERT_TRUE (msg->payload ());
    TEST_ASSERT_EQUAL_STRING ("1,alice\n", msg->payload ()->c_str ());
}

void test_decode_no_payload ()
{
    s3wire::message_t msg;
    msg.add_header (":event-type", "Cont").add_header (":message-type",
                                                       "event");
    std::vector<unsigned char> frame;
    TEST_ASSERT_SUCCESS_ERRNO (msg.encode (frame));

    s3wire::event_stream_decoder_t decoder;
    size_t processed = 0;
    TEST_ASSERT_EQUAL_INT (1,
                           decoder.decode (&frame[0], frame.size (), processed));
    TEST_ASSERT_FALSE (decoder.msg ()->payload ());
    TEST_ASSERT_EQUAL_UINT (2, decoder.msg ()->headers ().size ());
}

void test_decode_byte_by_byte ()
{
    const std::vector<unsigned char> frame = encode_records ("payload");

    s3wire::event_stream_decoder_t decoder;
    for (size_t i = 0; i < frame.size (); ++i) {
        size_t processed = 0;
        const int rc = decoder.decode (&frame[i], 1, processed);
        TEST_ASSERT_EQUAL_UINT (1, processed);
        if (i + 1 < frame.size ())
            TEST_ASSERT_EQUAL_INT (0, rc);
        else
            TEST_ASSERT_EQUAL_INT (1, rc);
    }
    TEST_ASSERT_EQUAL_STRING ("payload", decoder.msg ()->payload ()->c_str ());
}

void test_decode_two_frames_in_one_buffer ()
{
    std::vector<unsigned char> data = encode_records ("first");
    const std::vector<unsigned char> second = encode_records ("second");
    data.insert (data.end (), second.begin (), second.end ());

    s3wire::event_stream_decoder_t decoder;
    size_t processed = 0;
    TEST_ASSERT_EQUAL_INT (1, decoder.decode (&data[0], data.size (), processed));
    TEST_ASSERT_EQUAL_UINT (data.size () - second.size (), processed);
    TEST_ASSERT_EQUAL_STRING ("first", decoder.msg ()->payload ()->c_str ());

    const size_t offset = processed;
    TEST_ASSERT_EQUAL_INT (
      1, decoder.decode (&data[offset], data.size () - offset, processed));
    TEST_ASSERT_EQUAL_UINT (second.size (), processed);
    TEST_ASSERT_EQUAL_STRING ("second", decoder.msg ()->payload ()->c_str ());
}

void test_prelude_crc_mismatch ()
{
    std::vector<unsigned char> frame = encode_records ("x");
    frame[8] ^= 0x01;

    s3wire::event_stream_decoder_t decoder;
    size_t processed = 0;
    TEST_ASSERT_FAILURE_ERRNO (
      EPROTO, decoder.decode (&frame[0], frame.size (), processed));
    TEST_ASSERT_EQUAL_INT (s3wire::es_error_prelude_crc_mismatch,
                           decoder.error_code ());

    //  Errors are sticky.
    TEST_ASSERT_FAILURE_ERRNO (
      EPROTO, decoder.decode (&frame[0], frame.size (), processed));
}

void test_message_crc_mismatch ()
{
    std::vector<unsigned char> frame = encode_records ("abc");
    frame[frame.size () - 6] ^= 0x80;

    s3wire::event_stream_decoder_t decoder;
    size_t processed = 0;
    TEST_ASSERT_FAILURE_ERRNO (
      EPROTO, decoder.decode (&frame[0], frame.size (), processed));
    TEST_ASSERT_EQUAL_INT (s3wire::es_error_message_crc_mismatch,
                           decoder.error_code ());
}

void test_bad_value_type ()
{
    std::vector<unsigned char> frame = encode_records ("abc");
    //  Value type byte of the first header follows ":event-type".
    TEST_ASSERT_EQUAL_HEX8 (7, frame[12 + 1 + 11]);
    frame[12 + 1 + 11] = 6;
    fix_crcs (frame);

    s3wire::event_stream_decoder_t decoder;
    size_t processed = 0;
    TEST_ASSERT_FAILURE_ERRNO (
      EPROTO, decoder.decode (&frame[0], frame.size (), processed));
    TEST_ASSERT_EQUAL_INT (s3wire::es_error_header_invalid,
                           decoder.error_code ());
}

void test_header_past_region ()
{
    s3wire::message_t msg;
    msg.add_header ("name", "value");
    std::vector<unsigned char> frame;
    TEST_ASSERT_SUCCESS_ERRNO (msg.encode (frame));

    //  Claim a value longer than the headers region.
    s3wire::put_uint16 (&frame[12 + 1 + 4 + 1], 200);
    fix_crcs (frame);

    s3wire::event_stream_decoder_t decoder;
    size_t processed = 0;
    TEST_ASSERT_FAILURE_ERRNO (
      EPROTO, decoder.decode (&frame[0], frame.size (), processed));
    TEST_ASSERT_EQUAL_INT (s3wire::es_error_header_invalid,
                           decoder.error_code ());
}

void test_frame_invalid ()
{
    unsigned char prelude[12];
    s3wire::put_uint32 (prelude, 15);
    s3wire::put_uint32 (prelude + 4, 0);
    s3wire::put_uint32 (prelude + 8, s3wire::crc32_t::checksum_u32 (prelude, 8));

    s3wire::event_stream_decoder_t decoder;
    size_t processed = 0;
    TEST_ASSERT_FAILURE_ERRNO (EPROTO,
                               decoder.decode (prelude, sizeof prelude, processed));
    TEST_ASSERT_EQUAL_INT (s3wire::es_error_frame_invalid,
                           decoder.error_code ());

    decoder.reset ();
    s3wire::put_uint32 (prelude, 20);
    s3wire::put_uint32 (prelude + 4, 5);
    s3wire::put_uint32 (prelude + 8, s3wire::crc32_t::checksum_u32 (prelude, 8));
    TEST_ASSERT_FAILURE_ERRNO (EPROTO,
                               decoder.decode (prelude, sizeof prelude, processed));
    TEST_ASSERT_EQUAL_INT (s3wire::es_error_frame_invalid,
                           decoder.error_code ());
}

void test_frame_too_large ()
{
    const std::vector<unsigned char> frame = encode_records ("0123456789");

    s3wire::event_stream_decoder_t decoder (
      static_cast<int64_t> (frame.size () - 1));
    size_t processed = 0;
    TEST_ASSERT_FAILURE_ERRNO (
      EMSGSIZE, decoder.decode (&frame[0], frame.size (), processed));
    TEST_ASSERT_EQUAL_INT (s3wire::es_error_frame_too_large,
                           decoder.error_code ());

    s3wire::event_stream_decoder_t exact (static_cast<int64_t> (frame.size ()));
    TEST_ASSERT_EQUAL_INT (1, exact.decode (&frame[0], frame.size (), processed));
}

void test_frame_limit_from_options ()
{
    const std::vector<unsigned char> frame = encode_records ("0123456789");

    s3wire::options_t options;
    TEST_ASSERT_EQUAL_UINT32 (0xFFFFFFFFu,
                              s3wire::event_stream_decoder_t (options)
                                .max_frame_size ());

    const int64_t limit = static_cast<int64_t> (frame.size () - 1);
    TEST_ASSERT_SUCCESS_ERRNO (
      options.setopt (S3WIRE_MAX_FRAME_SIZE, &limit, sizeof limit));
    s3wire::event_stream_decoder_t decoder (options);
    TEST_ASSERT_EQUAL_UINT32 (frame.size () - 1, decoder.max_frame_size ());

    size_t processed = 0;
    TEST_ASSERT_FAILURE_ERRNO (
      EMSGSIZE, decoder.decode (&frame[0], frame.size (), processed));
    TEST_ASSERT_EQUAL_INT (s3wire::es_error_frame_too_large,
                           decoder.error_code ());
}

void test_announced_length_not_allocated_up_front ()
{
    //  Valid prelude announcing a 1 GiB frame, followed by a few body bytes.
    unsigned char data[12 + 100];
    memset (data, 'x', sizeof data);
    s3wire::put_uint32 (data, 0x40000000u);
    s3wire::put_uint32 (data + 4, 0);
    s3wire::put_uint32 (data + 8, s3wire::crc32_t::checksum_u32 (data, 8));

    s3wire::event_stream_decoder_t decoder;
    size_t processed = 0;
    TEST_ASSERT_EQUAL_INT (0, decoder.decode (data, sizeof data, processed));
    TEST_ASSERT_EQUAL_UINT (sizeof data, processed);
    TEST_ASSERT_EQUAL_INT (s3wire::es_error_none, decoder.error_code ());
    TEST_ASSERT_TRUE (decoder.buffered ()
                      <= static_cast<size_t> (s3wire::es_prelude_size
                                              + s3wire::es_decoder_read_chunk));
}

void test_decode_frame_larger_than_read_chunk ()
{
    const std::string payload (
      3 * static_cast<size_t> (s3wire::es_decoder_read_chunk) + 17, 'p');
    const std::vector<unsigned char> frame = encode_records (payload);

    s3wire::event_stream_decoder_t decoder;
    size_t processed = 0;
    TEST_ASSERT_EQUAL_INT (1,
                           decoder.decode (&frame[0], frame.size (), processed));
    TEST_ASSERT_EQUAL_UINT (frame.size (), processed);
    TEST_ASSERT_TRUE (decoder.msg ()->payload ());
    TEST_ASSERT_TRUE (*decoder.msg ()->payload () == payload);
}

void test_reset_after_error ()
{
    std::vector<unsigned char> bad = encode_records ("x");
    bad[0] ^= 0xFF;
    const std::vector<unsigned char> good = encode_records ("ok");

    s3wire::event_stream_decoder_t decoder;
    size_t processed = 0;
    TEST_ASSERT_EQUAL_INT (-1, decoder.decode (&bad[0], bad.size (), processed));

    decoder.reset ();
    TEST_ASSERT_EQUAL_INT (s3wire::es_error_none, decoder.error_code ());
    TEST_ASSERT_EQUAL_INT (1,
                           decoder.decode (&good[0], good.size (), processed));
    TEST_ASSERT_EQUAL_STRING ("ok", decoder.msg ()->payload ()->c_str ());
}

int main (void)
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_decode_round_trip);
    RUN_TEST (test_decode_no_payload);
    RUN_TEST (test_decode_byte_by_byte);
    RUN_TEST (test_decode_two_frames_in_one_buffer);
    RUN_TEST (test_prelude_crc_mismatch);
    RUN_TEST (test_message_crc_mismatch);
    RUN_TEST (test_bad_value_type);
    RUN_TEST (test_header_past_region);
    RUN_TEST (test_frame_invalid);
    RUN_TEST (test_frame_too_large);
    RUN_TEST (test_frame_limit_from_options);
    RUN_TEST (test_announced_length_not_allocated_up_front);
    RUN_TEST (test_decode_frame_larger_than_read_chunk);
    RUN_TEST (test_reset_after_error);
    return UNITY_END ();
}
