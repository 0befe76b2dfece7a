/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "asio/event_stream_writer.hpp"
#include "protocol/event_stream_decoder.hpp"
#include "protocol/select_event_stream.hpp"

#include <boost/asio.hpp>
#include <boost/asio/local/connect_pair.hpp>
#include <boost/asio/local/stream_protocol.hpp>

#include <unity.h>

typedef boost::asio::local::stream_protocol::socket socket_t;

void setUp ()
{
}

void tearDown ()
{
}

//  Reads everything until the peer closes and returns the :event-type
//  (or error code) of every frame received.
static std::vector<std::string> drain (socket_t &reader_)
{
    std::vector<unsigned char> data;
    boost::system::error_code ec;
    unsigned char buf[4096];
    for (;;) {
        const size_t n = reader_.read_some (boost::asio::buffer (buf), ec);
        if (ec)
            break;
        data.insert (data.end (), buf, buf + n);
    }
    TEST_ASSERT_TRUE (ec == boost::asio::error::eof);

    std::vector<std::string> types;
    s3wire::event_stream_decoder_t decoder;
    size_t offset = 0;
    while (offset < data.size ()) {
        size_t processed = 0;
        const int rc =
          decoder.decode (&data[offset], data.size () - offset, processed);
        TEST_ASSERT_EQUAL_INT (1, rc);
        offset += processed;
        const s3wire::header_t *header =
          decoder.msg ()->find_header (":event-type");
        if (!header)
            header = decoder.msg ()->find_header (":error-code");
        TEST_ASSERT_NOT_NULL (header);
        types.push_back (header->value);
    }
    return types;
}

static s3wire::select_event_list_t *make_events ()
{
    s3wire::select_event_list_t *list = new s3wire::select_event_list_t;
    list->push_event (s3wire::select_event_t::make_records (std::string ("1\n")))
      .push (s3wire::select_item_t::make_again ())
      .push_event (s3wire::select_event_t::make_records (std::string ("2\n")))
      .push_event (s3wire::select_event_t::make_stats (boost::none))
      .push_event (s3wire::select_event_t::make_end ());
    return list;
}

static void run_writer (bool batch_)
{
    boost::asio::io_context io;
    socket_t writer (io);
    socket_t reader (io);
    boost::asio::local::connect_pair (writer, reader);

    s3wire::select_event_stream_t events (
      std::unique_ptr<s3wire::i_select_event_source> (make_events ()));
    s3wire::event_stream_writer_t<socket_t> stream_writer (writer, events,
                                                           batch_);

    bool done = false;
    boost::system::error_code result = boost::asio::error::fault;
    stream_writer.start ([&] (const boost::system::error_code &ec_) {
        done = true;
        result = ec_;
    });
    TEST_ASSERT_TRUE (stream_writer.active ());
    io.run ();

    TEST_ASSERT_TRUE (done);
    TEST_ASSERT_FALSE (result);
    TEST_ASSERT_FALSE (stream_writer.active ());
    TEST_ASSERT_EQUAL_UINT (4, stream_writer.frames_written ());
    TEST_ASSERT_EQUAL_INT (s3wire::select_event_stream_t::ended_cleanly,
                           events.state ());

    writer.close ();
    const std::vector<std::string> types = drain (reader);
    TEST_ASSERT_EQUAL_UINT (4, types.size ());
    TEST_ASSERT_EQUAL_STRING ("Records", types[0].c_str ());
    TEST_ASSERT_EQUAL_STRING ("Records", types[1].c_str ());
    TEST_ASSERT_EQUAL_STRING ("Stats", types[2].c_str ());
    TEST_ASSERT_EQUAL_STRING ("End", types[3].c_str ());
}

void test_async_writer ()
{
    run_writer (false);
}

void test_async_writer_batched ()
{
    run_writer (true);
}

void test_async_writer_batch_from_options ()
{
    boost::asio::io_context io;
    socket_t writer (io);
    socket_t reader (io);
    boost::asio::local::connect_pair (writer, reader);

    s3wire::options_t options;
    const int batch = 1;
    TEST_ASSERT_SUCCESS_ERRNO (
      options.setopt (S3WIRE_WRITE_BATCH, &batch, sizeof batch));

    s3wire::select_event_stream_t events (
      std::unique_ptr<s3wire::i_select_event_source> (make_events ()));
    s3wire::event_stream_writer_t<socket_t> stream_writer (writer, events,
                                                           options);
    TEST_ASSERT_TRUE (stream_writer.batch ());

    boost::system::error_code result = boost::asio::error::fault;
    stream_writer.start (
      [&] (const boost::system::error_code &ec_) { result = ec_; });
    io.run ();

    TEST_ASSERT_FALSE (result);
    TEST_ASSERT_EQUAL_UINT (4, stream_writer.frames_written ());

    writer.close ();
    TEST_ASSERT_EQUAL_UINT (4, drain (reader).size ());

    const s3wire::options_t defaults;
    s3wire::select_event_stream_t more (
      std::unique_ptr<s3wire::i_select_event_source> (make_events ()));
    s3wire::event_stream_writer_t<socket_t> unbatched (writer, more, defaults);
    TEST_ASSERT_FALSE (unbatched.batch ());
}

void test_async_writer_abnormal_end ()
{
    boost::asio::io_context io;
    socket_t writer (io);
    socket_t reader (io);
    boost::asio::local::connect_pair (writer, reader);

    s3wire::select_event_list_t *list = new s3wire::select_event_list_t;
    list->push_event (s3wire::select_event_t::make_continuation ())
      .push_error (s3wire::s3_error_t (s3wire::s3_error_internal_error,
                                       std::string (70000, 'm')));
    s3wire::select_event_stream_t events (
      std::unique_ptr<s3wire::i_select_event_source> (list));
    s3wire::event_stream_writer_t<socket_t> stream_writer (writer, events);

    boost::system::error_code result;
    stream_writer.start (
      [&] (const boost::system::error_code &ec_) { result = ec_; });
    io.run ();

    TEST_ASSERT_TRUE (result
                      == boost::system::errc::make_error_code (
                        boost::system::errc::value_too_large));
    TEST_ASSERT_EQUAL_UINT (1, stream_writer.frames_written ());

    writer.close ();
    const std::vector<std::string> types = drain (reader);
    TEST_ASSERT_EQUAL_UINT (1, types.size ());
    TEST_ASSERT_EQUAL_STRING ("Cont", types[0].c_str ());
}

void test_async_writer_transport_error ()
{
    boost::asio::io_context io;
    socket_t writer (io);
    socket_t reader (io);
    boost::asio::local::connect_pair (writer, reader);
    reader.close ();

    s3wire::select_event_list_t *list = new s3wire::select_event_list_t;
    list->push_event (s3wire::select_event_t::make_continuation ());
    s3wire::select_event_stream_t events (
      std::unique_ptr<s3wire::i_select_event_source> (list));
    s3wire::event_stream_writer_t<socket_t> stream_writer (writer, events);

    boost::system::error_code result;
    bool done = false;
    stream_writer.start ([&] (const boost::system::error_code &ec_) {
        done = true;
        result = ec_;
    });
    io.run ();

    TEST_ASSERT_TRUE (done);
    TEST_ASSERT_TRUE (result);
    TEST_ASSERT_EQUAL_UINT (0, stream_writer.frames_written ());
}

void test_sync_writer ()
{
    boost::asio::io_context io;
    socket_t writer (io);
    socket_t reader (io);
    boost::asio::local::connect_pair (writer, reader);

    s3wire::select_event_stream_t events (
      std::unique_ptr<s3wire::i_select_event_source> (make_events ()));

    //  The first call stops at the item that is not ready yet.
    boost::system::error_code ec = s3wire::write_event_stream (writer, events);
    TEST_ASSERT_TRUE (ec == boost::asio::error::would_block);
    ec = s3wire::write_event_stream (writer, events);
    TEST_ASSERT_FALSE (ec);

    writer.close ();
    const std::vector<std::string> types = drain (reader);
    TEST_ASSERT_EQUAL_UINT (4, types.size ());
    TEST_ASSERT_EQUAL_STRING ("End", types[3].c_str ());
}

int main (void)
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_async_writer);
    RUN_TEST (test_async_writer_batched);
    RUN_TEST (test_async_writer_batch_from_options);
    RUN_TEST (test_async_writer_abnormal_end);
    RUN_TEST (test_async_writer_transport_error);
    RUN_TEST (test_sync_writer);
    return UNITY_END ();
}
