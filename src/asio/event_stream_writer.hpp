/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __S3WIRE_EVENT_STREAM_WRITER_HPP_INCLUDED__
#define __S3WIRE_EVENT_STREAM_WRITER_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>

#include <functional>
#include <vector>

#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>

#include "core/options.hpp"
#include "protocol/select_event_stream.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"
#include "utils/macros.hpp"

namespace s3wire
{
//  Maps the final state of an event stream to the writer's result.
inline boost::system::error_code
event_stream_result (const select_event_stream_t &events_)
{
    if (events_.state () == select_event_stream_t::ended_abnormally)
        return boost::system::errc::make_error_code (
          boost::system::errc::value_too_large);
    return boost::system::error_code ();
}

//  Drains a select event stream into an asio stream. Exactly one
//  async_write is outstanding at a time. The stream, the event source
//  and the writer must stay alive until the handler has run.
template <typename AsyncWriteStream> class event_stream_writer_t
{
  public:
    typedef std::function<void (const boost::system::error_code &)>
      handler_t;

    //  With batch_ set, all frames ready at once go out in one write.
    event_stream_writer_t (AsyncWriteStream &stream_,
                           select_event_stream_t &events_,
                           bool batch_ = false) :
        _stream (stream_),
        _events (events_),
        _batch (batch_),
        _active (false),
        _pending_frames (0),
        _frames_written (0),
        _bytes_written (0)
    {
    }

    //  Takes the batching mode from options_.write_batch.
    event_stream_writer_t (AsyncWriteStream &stream_,
                           select_event_stream_t &events_,
                           const options_t &options_) :
        _stream (stream_),
        _events (events_),
        _batch (options_.write_batch),
        _active (false),
        _pending_frames (0),
        _frames_written (0),
        _bytes_written (0)
    {
    }

    bool batch () const { return _batch; }

    //  Starts writing. handler_ is called once, with success when the
    //  event stream ended cleanly, errc::value_too_large when it ended
    //  abnormally, or the transport error.
    void start (handler_t handler_)
    {
        s3wire_assert (!_active);
        _active = true;
        _handler = handler_;
        pull ();
    }

    bool active () const { return _active; }
    uint64_t frames_written () const { return _frames_written; }
    uint64_t bytes_written () const { return _bytes_written; }

  private:
    void pull ()
    {
        _buffer.clear ();
        size_t frames = 0;

        for (;;) {
            const int rc = _events.next (_chunk);
            if (rc == 1) {
                _buffer.insert (_buffer.end (), _chunk.begin (),
                                _chunk.end ());
                ++frames;
                if (!_batch)
                    break;
                continue;
            }
            if (rc == -1 && errno == EAGAIN) {
                if (frames > 0)
                    break;
                S3WIRE_DBG_WRITER ("source not ready, retrying");
                boost::asio::post (_stream.get_executor (),
                                   [this] () { pull (); });
                return;
            }
            //  End of stream, either clean or after an encoding failure.
            //  Frames already pulled are flushed first.
            if (frames > 0)
                break;
            finish (event_stream_result (_events));
            return;
        }

        _pending_frames = frames;
        boost::asio::async_write (
          _stream, boost::asio::buffer (_buffer),
          [this] (const boost::system::error_code &ec_, size_t bytes_) {
              on_write (ec_, bytes_);
          });
    }

    void on_write (const boost::system::error_code &ec_, size_t bytes_)
    {
        if (ec_) {
            S3WIRE_DBG_WRITER ("write failed: %s", ec_.message ().c_str ());
            finish (ec_);
            return;
        }
        _frames_written += _pending_frames;
        _bytes_written += bytes_;
        pull ();
    }

    void finish (const boost::system::error_code &ec_)
    {
        S3WIRE_DBG_WRITER ("finished: %llu frames, %llu bytes",
                           static_cast<unsigned long long> (_frames_written),
                           static_cast<unsigned long long> (_bytes_written));
        _active = false;
        handler_t handler;
        handler.swap (_handler);
        if (handler)
            handler (ec_);
    }

    AsyncWriteStream &_stream;
    select_event_stream_t &_events;
    const bool _batch;
    bool _active;
    handler_t _handler;
    std::vector<unsigned char> _chunk;
    std::vector<unsigned char> _buffer;
    size_t _pending_frames;
    uint64_t _frames_written;
    uint64_t _bytes_written;

    S3WIRE_NON_COPYABLE_NOR_MOVABLE (event_stream_writer_t)
};

//  Blocking variant: writes frames until the event stream ends. Returns
//  boost::asio::error::would_block if the source is not ready; the call
//  can be repeated later.
template <typename SyncWriteStream>
boost::system::error_code write_event_stream (SyncWriteStream &stream_,
                                              select_event_stream_t &events_)
{
    std::vector<unsigned char> chunk;
    for (;;) {
        const int rc = events_.next (chunk);
        if (rc == 1) {
            boost::system::error_code ec;
            boost::asio::write (stream_, boost::asio::buffer (chunk), ec);
            if (ec)
                return ec;
            continue;
        }
        if (rc == -1 && errno == EAGAIN)
            return boost::asio::error::would_block;
        return event_stream_result (events_);
    }
}
}

#endif
