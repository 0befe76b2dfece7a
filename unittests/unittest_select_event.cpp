/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "core/s3_error.hpp"
#include "protocol/event_stream_message.hpp"
#include "protocol/select_event.hpp"

#include <unity.h>

void setUp ()
{
}

void tearDown ()
{
}

static void assert_header (const s3wire::message_t &msg_,
                           size_t index_,
                           const char *name_,
                           const char *value_)
{
    TEST_ASSERT_TRUE (index_ < msg_.headers ().size ());
    TEST_ASSERT_EQUAL_STRING (name_, msg_.headers ()[index_].name.c_str ());
    TEST_ASSERT_EQUAL_STRING (value_, msg_.headers ()[index_].value.c_str ());
}

static s3wire::message_t map_event (const s3wire::select_event_t &event_)
{
    s3wire::xml_serializer_t serializer;
    s3wire::message_t msg;
    s3wire::event_to_message (event_, serializer, msg);
    return msg;
}

void test_continuation ()
{
    const s3wire::message_t msg =
      map_event (s3wire::select_event_t::make_continuation ());
    TEST_ASSERT_EQUAL_UINT (2, msg.headers ().size ());
    assert_header (msg, 0, ":event-type", "Cont");
    assert_header (msg, 1, ":message-type", "event");
    TEST_ASSERT_FALSE (msg.payload ());
}

void test_end ()
{
    const s3wire::message_t msg =
      map_event (s3wire::select_event_t::make_end ());
    TEST_ASSERT_EQUAL_UINT (2, msg.headers ().size ());
    assert_header (msg, 0, ":event-type", "End");
    assert_header (msg, 1, ":message-type", "event");
    TEST_ASSERT_FALSE (msg.payload ());
}

void test_records_with_payload ()
{
    const s3wire::message_t msg = map_event (
      s3wire::select_event_t::make_records (std::string ("a,b\n")));
    TEST_ASSERT_EQUAL_UINT (3, msg.headers ().size ());
    assert_header (msg, 0, ":event-type", "Records");
    assert_header (msg, 1, ":content-type", "application/octet-stream");
    assert_header (msg, 2, ":message-type", "event");
    TEST_ASSERT_EQUAL_STRING ("a,b\n", msg.payload ()->c_str ());
}

void test_records_without_payload ()
{
    const s3wire::message_t msg =
      map_event (s3wire::select_event_t::make_records (boost::none));
    TEST_ASSERT_EQUAL_UINT (3, msg.headers ().size ());
    TEST_ASSERT_FALSE (msg.payload ());
}

void test_progress_with_details ()
{
    s3wire::select_details_t details;
    details.bytes_scanned = 512;
    details.bytes_processed = 256;
    details.bytes_returned = 64;
    const s3wire::message_t msg =
      map_event (s3wire::select_event_t::make_progress (details));

    TEST_ASSERT_EQUAL_UINT (3, msg.headers ().size ());
    assert_header (msg, 0, ":event-type", "Progress");
    assert_header (msg, 1, ":content-type", "text/xml");
    assert_header (msg, 2, ":message-type", "event");
    TEST_ASSERT_EQUAL_STRING (
      "<?xml version=\"1.0\" encoding=\"UTF-8\"?><Progress>"
      "<BytesScanned>512</BytesScanned><BytesProcessed>256</BytesProcessed>"
      "<BytesReturned>64</BytesReturned></Progress>",
      msg.payload ()->c_str ());
}

void test_progress_without_details ()
{
    const s3wire::message_t msg =
      map_event (s3wire::select_event_t::make_progress (boost::none));
    assert_header (msg, 0, ":event-type", "Progress");
    assert_header (msg, 1, ":content-type", "text/xml");
    TEST_ASSERT_FALSE (msg.payload ());
}

void test_stats_partial_details ()
{
    s3wire::select_details_t details;
    details.bytes_returned = 7;
    const s3wire::message_t msg =
      map_event (s3wire::select_event_t::make_stats (details));
    assert_header (msg, 0, ":event-type", "Stats");
    assert_header (msg, 1, ":content-type", "text/xml");
    assert_header (msg, 2, ":message-type", "event");
    TEST_ASSERT_EQUAL_STRING ("<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
                              "<Stats><BytesReturned>7</BytesReturned></Stats>",
                              msg.payload ()->c_str ());
}

struct fixed_serializer_t : public s3wire::i_xml_serializer
{
    fixed_serializer_t () : calls (0) {}
    int serialize (const char *root_,
                   const s3wire::select_details_t &,
                   std::string &out_)
    {
        ++calls;
        out_ = std::string ("<") + root_ + "/>";
        return 0;
    }
    int calls;
};

void test_custom_serializer ()
{
    fixed_serializer_t serializer;
    s3wire::message_t msg;
    s3wire::event_to_message (
      s3wire::select_event_t::make_stats (s3wire::select_details_t ()),
      serializer, msg);
    TEST_ASSERT_EQUAL_INT (1, serializer.calls);
    TEST_ASSERT_EQUAL_STRING ("<Stats/>", msg.payload ()->c_str ());

    //  Records never reach the serializer.
    s3wire::event_to_message (
      s3wire::select_event_t::make_records (std::string ("r")), serializer,
      msg);
    TEST_ASSERT_EQUAL_INT (1, serializer.calls);
}

void test_error_static_code ()
{
    s3wire::message_t msg;
    s3wire::error_to_message (
      s3wire::s3_error_t (s3wire::s3_error_internal_error,
                          "something went wrong"),
      msg);
    TEST_ASSERT_EQUAL_UINT (3, msg.headers ().size ());
    assert_header (msg, 0, ":error-code", "InternalError");
    assert_header (msg, 1, ":error-message", "something went wrong");
    assert_header (msg, 2, ":message-type", "error");
    TEST_ASSERT_FALSE (msg.payload ());
}

void test_error_custom_code ()
{
    s3wire::message_t msg;
    s3wire::error_to_message (
      s3wire::s3_error_t::custom ("CustomErr", "custom message"), msg);
    assert_header (msg, 0, ":error-code", "CustomErr");
    assert_header (msg, 1, ":error-message", "custom message");
    assert_header (msg, 2, ":message-type", "error");
}

void test_error_without_message ()
{
    s3wire::message_t msg;
    s3wire::error_to_message (s3wire::s3_error_t (s3wire::s3_error_no_such_key),
                              msg);
    TEST_ASSERT_EQUAL_UINT (3, msg.headers ().size ());
    assert_header (msg, 0, ":error-code", "NoSuchKey");
    assert_header (msg, 1, ":error-message", "");
    assert_header (msg, 2, ":message-type", "error");
}

void test_error_code_table ()
{
    TEST_ASSERT_NULL (s3wire::s3_error_code_str (s3wire::s3_error_custom));
    TEST_ASSERT_EQUAL_STRING (
      "NotSignedUp", s3wire::s3_error_code_str (s3wire::s3_error_not_signed_up));
    TEST_ASSERT_EQUAL_STRING (
      "AccessDenied",
      s3wire::s3_error_code_str (s3wire::s3_error_access_denied));
    for (int code = 1; code < s3wire::s3_error_code_count; ++code)
        TEST_ASSERT_NOT_NULL (s3wire::s3_error_code_str (
          static_cast<s3wire::s3_error_code_t> (code)));
}

int main (void)
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_continuation);
    RUN_TEST (test_end);
    RUN_TEST (test_records_with_payload);
    RUN_TEST (test_records_without_payload);
    RUN_TEST (test_progress_with_details);
    RUN_TEST (test_progress_without_details);
    RUN_TEST (test_stats_partial_details);
    RUN_TEST (test_custom_serializer);
    RUN_TEST (test_error_static_code);
    RUN_TEST (test_error_custom_code);
    RUN_TEST (test_error_without_message);
    RUN_TEST (test_error_code_table);
    return UNITY_END ();
}
