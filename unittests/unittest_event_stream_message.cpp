/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "crypto/checksum.hpp"
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

void test_encode_end_event_bytes ()
{
    s3wire::message_t msg;
    msg.add_header (":event-type", "End").add_header (":message-type", "event");

    std::vector<unsigned char> out;
    TEST_ASSERT_SUCCESS_ERRNO (msg.encode (out));
    TEST_ASSERT_EQUAL_UINT (56, out.size ());
    TEST_ASSERT_EQUAL_STRING (
      "0000003800000028c1c684d40b3a6576656e742d74797065070003456e640d3a6d657373"
      "6167652d747970650700056576656e74fe2cee99",
      to_hex (&out[0], out.size ()).c_str ());
}

void test_encode_with_payload_bytes ()
{
    s3wire::message_t msg;
    msg.add_header ("a", "b");
    msg.set_payload (std::string ("xyz"));

    std::vector<unsigned char> out;
    TEST_ASSERT_SUCCESS_ERRNO (msg.encode (out));
    TEST_ASSERT_EQUAL_STRING ("0000001900000006e1b18faf01610700016278797a3975962f",
                              to_hex (&out[0], out.size ()).c_str ());
}

void test_encode_empty_message ()
{
    s3wire::message_t msg;
    std::vector<unsigned char> out;
    TEST_ASSERT_SUCCESS_ERRNO (msg.encode (out));
    TEST_ASSERT_EQUAL_UINT (s3wire::es_frame_overhead, out.size ());
    TEST_ASSERT_EQUAL_UINT32 (16, s3wire::get_uint32 (&out[0]));
    TEST_ASSERT_EQUAL_UINT32 (0, s3wire::get_uint32 (&out[4]));
}

void test_lengths_and_crcs ()
{
    s3wire::message_t msg;
    msg.add_header (":event-type", "Records")
      .add_header (":content-type", "application/octet-stream")
      .add_header (":message-type", "event");
    msg.set_payload (std::string ("id,name\n1,alice\n"));

    uint32_t total = 0;
    uint32_t headers = 0;
    TEST_ASSERT_SUCCESS_ERRNO (msg.encoded_size (&total, &headers));

    std::vector<unsigned char> out;
    TEST_ASSERT_SUCCESS_ERRNO (msg.encode (out));
    TEST_ASSERT_EQUAL_UINT (total, out.size ());
    TEST_ASSERT_EQUAL_UINT32 (total, s3wire::get_uint32 (&out[0]));
    TEST_ASSERT_EQUAL_UINT32 (headers, s3wire::get_uint32 (&out[4]));
    TEST_ASSERT_EQUAL_UINT32 ((4 + 11 + 7) + (4 + 13 + 24) + (4 + 13 + 5),
                              headers);
    TEST_ASSERT_EQUAL_UINT32 (headers + 16 + 16, total);

    TEST_ASSERT_EQUAL_HEX32 (s3wire::crc32_t::checksum_u32 (&out[0], 8),
                             s3wire::get_uint32 (&out[8]));
    TEST_ASSERT_EQUAL_HEX32 (
      s3wire::crc32_t::checksum_u32 (&out[0], out.size () - 4),
      s3wire::get_uint32 (&out[out.size () - 4]));
}

void test_encode_appends ()
{
    s3wire::message_t msg;
    msg.add_header ("a", "b");

    std::vector<unsigned char> out (3, 0xAA);
    TEST_ASSERT_SUCCESS_ERRNO (msg.encode (out));
    TEST_ASSERT_EQUAL_UINT (3 + 22, out.size ());
    TEST_ASSERT_EQUAL_HEX8 (0xAA, out[2]);
    TEST_ASSERT_EQUAL_UINT32 (22, s3wire::get_uint32 (&out[3]));
}

void test_header_name_too_long ()
{
    s3wire::message_t msg;
    msg.add_header ("ok", "fine");
    msg.add_header (std::string (256, 'n'), "v");

    std::vector<unsigned char> out (2, 0x55);
    int error = s3wire::es_error_none;
    TEST_ASSERT_FAILURE_ERRNO (EOVERFLOW, msg.encode (out, &error));
    TEST_ASSERT_EQUAL_INT (s3wire::es_error_int_overflow, error);
    TEST_ASSERT_EQUAL_UINT (2, out.size ());
    TEST_ASSERT_EQUAL_STRING ("Message Serialization: IntOverflow",
                              s3wire::event_stream_error_reason (error));
}

void test_header_value_too_long ()
{
    s3wire::message_t msg;
    msg.add_header ("n", std::string (65536, 'v'));

    std::vector<unsigned char> out;
    int error = s3wire::es_error_none;
    TEST_ASSERT_FAILURE_ERRNO (EOVERFLOW, msg.encode (out, &error));
    TEST_ASSERT_EQUAL_INT (s3wire::es_error_int_overflow, error);
    TEST_ASSERT_TRUE (out.empty ());
}

void test_header_limits_accepted ()
{
    s3wire::message_t msg;
    msg.add_header (std::string (255, 'n'), std::string (65535, 'v'));

    std::vector<unsigned char> out;
    TEST_ASSERT_SUCCESS_ERRNO (msg.encode (out));
    TEST_ASSERT_EQUAL_UINT (16 + 4 + 255 + 65535, out.size ());
    TEST_ASSERT_EQUAL_HEX8 (255, out[12]);
    TEST_ASSERT_EQUAL_UINT16 (65535, s3wire::get_uint16 (&out[12 + 1 + 255 + 1]));
}

void test_checked_add ()
{
    uint32_t value = 0xFFFFFFF0u;
    TEST_ASSERT_TRUE (s3wire::checked_add_u32 (&value, 0x0F));
    TEST_ASSERT_EQUAL_HEX32 (0xFFFFFFFFu, value);
    TEST_ASSERT_FALSE (s3wire::checked_add_u32 (&value, 1));
    TEST_ASSERT_EQUAL_HEX32 (0xFFFFFFFFu, value);

    value = 0;
    TEST_ASSERT_FALSE (s3wire::checked_add_u32 (&value, 0x100000000ull));
    TEST_ASSERT_EQUAL_HEX32 (0, value);
}

void test_error_reasons ()
{
    TEST_ASSERT_EQUAL_STRING (
      "Message Serialization: LengthOverflow",
      s3wire::event_stream_error_reason (s3wire::es_error_length_overflow));
    TEST_ASSERT_EQUAL_STRING (
      "Message Serialization: IntOverflow",
      s3wire::event_stream_error_reason (s3wire::es_error_int_overflow));
}

void test_find_header ()
{
    s3wire::message_t msg;
    msg.add_header ("x", "1").add_header ("y", "2").add_header ("x", "3");
    const s3wire::header_t *header = msg.find_header ("x");
    TEST_ASSERT_NOT_NULL (header);
    TEST_ASSERT_EQUAL_STRING ("1", header->value.c_str ());
    TEST_ASSERT_NULL (msg.find_header ("z"));
    TEST_ASSERT_EQUAL_UINT (3, msg.headers ().size ());
}

int main (void)
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_encode_end_event_bytes);
    RUN_TEST (test_encode_with_payload_bytes);
    RUN_TEST (test_encode_empty_message);
    RUN_TEST (test_lengths_and_crcs);
    RUN_TEST (test_encode_appends);
    RUN_TEST (test_header_name_too_long);
    RUN_TEST (test_header_value_too_long);
    RUN_TEST (test_header_limits_accepted);
    RUN_TEST (test_checked_add);
    RUN_TEST (test_error_reasons);
    RUN_TEST (test_find_header);
    return UNITY_END ();
}
