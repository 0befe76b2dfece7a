/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "core/s3_error.hpp"
#include "protocol/event_stream_decoder.hpp"
#include "protocol/event_stream_protocol.hpp"
#include "protocol/select_event_stream.hpp"

#include <unity.h>

void setUp ()
{
}

void tearDown ()
{
}

//  Source that counts how often it was polled.
class counting_source_t : public s3wire::i_select_event_source
{
  public:
    explicit counting_source_t (int *polls_) : _polls (polls_) {}

    s3wire::select_event_list_t list;

    s3wire::select_item_t next ()
    {
        ++*_polls;
        return list.next ();
    }
    s3wire::size_hint_t size_hint () const
    {
        return s3wire::size_hint_t (3, boost::none);
    }

  private:
    int *_polls;
};

static std::unique_ptr<s3wire::i_select_event_source>
make_source (s3wire::select_event_list_t *list_)
{
    return std::unique_ptr<s3wire::i_select_event_source> (list_);
}

static std::string event_type_of (const std::vector<unsigned char> &chunk_)
{
    s3wire::event_stream_decoder_t decoder;
    size_t processed = 0;
    const int rc = decoder.decode (&chunk_[0], chunk_.size (), processed);
    TEST_ASSERT_EQUAL_INT (1, rc);
    TEST_ASSERT_EQUAL_UINT (chunk_.size (), processed);
    const s3wire::header_t *header =
      decoder.msg ()->find_header (":event-type");
    if (header)
        return header->value;
    header = decoder.msg ()->find_header (":error-code");
    TEST_ASSERT_NOT_NULL (header);
    return "error:" + header->value;
}

void test_one_chunk_per_event ()
{
    s3wire::select_event_list_t *list = new s3wire::select_event_list_t;
    list->push_event (s3wire::select_event_t::make_records (std::string ("r1")))
      .push_event (s3wire::select_event_t::make_continuation ())
      .push_event (s3wire::select_event_t::make_stats (boost::none))
      .push_event (s3wire::select_event_t::make_end ());
    s3wire::select_event_stream_t stream (make_source (list));

    const char *expected[] = {"Records", "Cont", "Stats", "End"};
    std::vector<unsigned char> chunk;
    for (size_t i = 0; i < 4; ++i) {
        TEST_ASSERT_EQUAL_INT (1, stream.next (chunk));
        TEST_ASSERT_EQUAL_STRING (expected[i], event_type_of (chunk).c_str ());
        TEST_ASSERT_EQUAL_INT (s3wire::select_event_stream_t::running,
                               stream.state ());
    }
    TEST_ASSERT_EQUAL_INT (0, stream.next (chunk));
    TEST_ASSERT_EQUAL_INT (s3wire::select_event_stream_t::ended_cleanly,
                           stream.state ());
    TEST_ASSERT_EQUAL_INT (0, stream.next (chunk));
}

void test_error_is_final_chunk ()
{
    int polls = 0;
    counting_source_t *source = new counting_source_t (&polls);
    source->list
      .push_event (s3wire::select_event_t::make_records (std::string ("r")))
      .push_error (s3wire::s3_error_t (s3wire::s3_error_internal_error, "boom"))
      .push_event (s3wire::select_event_t::make_end ());
    s3wire::select_event_stream_t stream (
      std::unique_ptr<s3wire::i_select_event_source> (source));

    std::vector<unsigned char> chunk;
    TEST_ASSERT_EQUAL_INT (1, stream.next (chunk));
    TEST_ASSERT_EQUAL_STRING ("Records", event_type_of (chunk).c_str ());

    TEST_ASSERT_EQUAL_INT (1, stream.next (chunk));
    TEST_ASSERT_EQUAL_STRING ("error:InternalError",
                              event_type_of (chunk).c_str ());
    TEST_ASSERT_EQUAL_INT (s3wire::select_event_stream_t::ended_cleanly,
                           stream.state ());

    //  The source is not polled any more.
    TEST_ASSERT_EQUAL_INT (2, polls);
    TEST_ASSERT_EQUAL_INT (0, stream.next (chunk));
    TEST_ASSERT_EQUAL_INT (0, stream.next (chunk));
    TEST_ASSERT_EQUAL_INT (2, polls);
}

void test_again_passthrough ()
{
    s3wire::select_event_list_t *list = new s3wire::select_event_list_t;
    list->push (s3wire::select_item_t::make_again ())
      .push_event (s3wire::select_event_t::make_continuation ())
      .push (s3wire::select_item_t::make_again ())
      .push (s3wire::select_item_t::make_again ());
    s3wire::select_event_stream_t stream (make_source (list));

    std::vector<unsigned char> chunk;
    TEST_ASSERT_FAILURE_ERRNO (EAGAIN, stream.next (chunk));
    TEST_ASSERT_EQUAL_INT (s3wire::select_event_stream_t::running,
                           stream.state ());
    TEST_ASSERT_EQUAL_INT (1, stream.next (chunk));
    TEST_ASSERT_EQUAL_STRING ("Cont", event_type_of (chunk).c_str ());
    TEST_ASSERT_FAILURE_ERRNO (EAGAIN, stream.next (chunk));
    TEST_ASSERT_FAILURE_ERRNO (EAGAIN, stream.next (chunk));
    TEST_ASSERT_EQUAL_INT (0, stream.next (chunk));
    TEST_ASSERT_EQUAL_INT (s3wire::select_event_stream_t::ended_cleanly,
                           stream.state ());
}

void test_size_hint_forwarded ()
{
    int polls = 0;
    counting_source_t *source = new counting_source_t (&polls);
    s3wire::select_event_stream_t stream (
      std::unique_ptr<s3wire::i_select_event_source> (source));
    const s3wire::size_hint_t hint = stream.size_hint ();
    TEST_ASSERT_EQUAL_UINT (3, hint.lower);
    TEST_ASSERT_FALSE (hint.upper);
    TEST_ASSERT_EQUAL_INT (0, polls);
}

void test_list_size_hint_exact ()
{
    s3wire::select_event_list_t *list = new s3wire::select_event_list_t;
    list->push_event (s3wire::select_event_t::make_continuation ())
      .push (s3wire::select_item_t::make_again ())
      .push_error (s3wire::s3_error_t (s3wire::s3_error_slow_down));
    s3wire::select_event_stream_t stream (make_source (list));

    s3wire::size_hint_t hint = stream.size_hint ();
    TEST_ASSERT_EQUAL_UINT (2, hint.lower);
    TEST_ASSERT_TRUE (hint.upper);
    TEST_ASSERT_EQUAL_UINT (2, *hint.upper);

    std::vector<unsigned char> chunk;
    TEST_ASSERT_EQUAL_INT (1, stream.next (chunk));
    hint = stream.size_hint ();
    TEST_ASSERT_EQUAL_UINT (1, hint.lower);
    TEST_ASSERT_EQUAL_UINT (1, *hint.upper);
}

void test_list_size_hint_stops_at_error ()
{
    s3wire::select_event_list_t *list = new s3wire::select_event_list_t;
    list->push_event (s3wire::select_event_t::make_continuation ())
      .push_error (s3wire::s3_error_t (s3wire::s3_error_slow_down))
      .push_event (s3wire::select_event_t::make_continuation ())
      .push_event (s3wire::select_event_t::make_end ());
    s3wire::select_event_stream_t stream (make_source (list));

    const s3wire::size_hint_t hint = stream.size_hint ();
    TEST_ASSERT_EQUAL_UINT (2, hint.lower);
    TEST_ASSERT_TRUE (hint.upper);
    TEST_ASSERT_EQUAL_UINT (2, *hint.upper);

    std::vector<unsigned char> chunk;
    size_t frames = 0;
    while (stream.next (chunk) == 1)
        ++frames;
    TEST_ASSERT_EQUAL_UINT (*hint.upper, frames);
}

void test_overflow_ends_abnormally ()
{
    int polls = 0;
    counting_source_t *source = new counting_source_t (&polls);
    //  The message header value exceeds the 16-bit length field.
    source->list
      .push_error (s3wire::s3_error_t (s3wire::s3_error_internal_error,
                                       std::string (70000, 'm')))
      .push_event (s3wire::select_event_t::make_end ());
    s3wire::select_event_stream_t stream (
      std::unique_ptr<s3wire::i_select_event_source> (source));

    std::vector<unsigned char> chunk;
    TEST_ASSERT_FAILURE_ERRNO (EOVERFLOW, stream.next (chunk));
    TEST_ASSERT_EQUAL_INT (s3wire::select_event_stream_t::ended_abnormally,
                           stream.state ());
    TEST_ASSERT_EQUAL_INT (s3wire::es_error_int_overflow, stream.error_code ());
    TEST_ASSERT_EQUAL_INT (0, stream.next (chunk));
    TEST_ASSERT_EQUAL_INT (1, polls);
}

int main (void)
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_one_chunk_per_event);
    RUN_TEST (test_error_is_final_chunk);
    RUN_TEST (test_again_passthrough);
    RUN_TEST (test_size_hint_forwarded);
    RUN_TEST (test_list_size_hint_exact);
    RUN_TEST (test_list_size_hint_stops_at_error);
    RUN_TEST (test_overflow_ends_abnormally);
    return UNITY_END ();
}
