/* SPDX-License-Identifier: MPL-2.0 */

#include "protocol/select_event_stream.hpp"
#include "protocol/event_stream_protocol.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"

s3wire::select_item_t::select_item_t (kind_t kind_) : _kind (kind_)
{
}

s3wire::select_item_t
s3wire::select_item_t::make_event (const select_event_t &event_)
{
    select_item_t item (event);
    item._event = event_;
    return item;
}

s3wire::select_item_t s3wire::select_item_t::make_error (const s3_error_t &error_)
{
    select_item_t item (error);
    item._error = error_;
    return item;
}

s3wire::select_item_t s3wire::select_item_t::make_end ()
{
    return select_item_t (end);
}

s3wire::select_item_t s3wire::select_item_t::make_again ()
{
    return select_item_t (again);
}

const s3wire::select_event_t &s3wire::select_item_t::get_event () const
{
    s3wire_assert (_kind == event);
    return *_event;
}

const s3wire::s3_error_t &s3wire::select_item_t::get_error () const
{
    s3wire_assert (_kind == error);
    return *_error;
}

s3wire::select_event_list_t::select_event_list_t ()
{
}

s3wire::select_event_list_t &
s3wire::select_event_list_t::push (const select_item_t &item_)
{
    _items.push_back (item_);
    return *this;
}

s3wire::select_event_list_t &
s3wire::select_event_list_t::push_event (const select_event_t &event_)
{
    return push (select_item_t::make_event (event_));
}

s3wire::select_event_list_t &
s3wire::select_event_list_t::push_error (const s3_error_t &error_)
{
    return push (select_item_t::make_error (error_));
}

s3wire::select_item_t s3wire::select_event_list_t::next ()
{
    if (_items.empty ())
        return select_item_t::make_end ();
    const select_item_t item = _items.front ();
    _items.pop_front ();
    return item;
}

s3wire::size_hint_t s3wire::select_event_list_t::size_hint () const
{
    size_t count = 0;
    for (std::deque<select_item_t>::const_iterator it = _items.begin ();
         it != _items.end (); ++it) {
        if (it->kind () == select_item_t::end)
            break;
        if (it->kind () == select_item_t::error) {
            ++count;
            break;
        }
        if (it->kind () != select_item_t::again)
            ++count;
    }
    return size_hint_t (count, count);
}

s3wire::select_event_stream_t::select_event_stream_t (
  std::unique_ptr<i_select_event_source> source_,
  i_xml_serializer *serializer_) :
    _source (std::move (source_)),
    _serializer (serializer_ ? serializer_ : &_default_serializer),
    _state (running),
    _error_code (es_error_none)
{
    s3wire_assert (_source);
}

s3wire::select_event_stream_t::~select_event_stream_t ()
{
}

int s3wire::select_event_stream_t::next (std::vector<unsigned char> &chunk_)
{
    if (_state != running)
        return 0;

    const select_item_t item = _source->next ();
    switch (item.kind ()) {
        case select_item_t::event:
            S3WIRE_DBG_STREAM ("event %s", item.get_event ().event_type ());
            event_to_message (item.get_event (), *_serializer, _msg);
            return encode (_msg, chunk_);

        case select_item_t::error: {
            const s3_error_t &error = item.get_error ();
            S3WIRE_LOG_DEBUG ("request level error %s",
                              error.code_str ().c_str ());
            error_to_message (error, _msg);
            const int rc = encode (_msg, chunk_);
            if (rc == 1) {
                S3WIRE_DEBUG_INC_ERROR_FRAMES_ENCODED ();
                _state = ended_cleanly;
            }
            return rc;
        }

        case select_item_t::end:
            S3WIRE_DBG_STREAM ("end of stream");
            _state = ended_cleanly;
            return 0;

        case select_item_t::again:
            errno = EAGAIN;
            return -1;
    }
    s3wire_assert (false);
    return -1;
}

int s3wire::select_event_stream_t::encode (const message_t &msg_,
                                           std::vector<unsigned char> &chunk_)
{
    chunk_.clear ();
    int error_code = es_error_none;
    if (msg_.encode (chunk_, &error_code) == -1) {
        S3WIRE_LOG_ERROR ("frame encoding failed: %s",
                          event_stream_error_reason (error_code));
        _error_code = error_code;
        _state = ended_abnormally;
        errno = EOVERFLOW;
        return -1;
    }
    S3WIRE_DBG_STREAM ("frame encoded: %zu bytes", chunk_.size ());
    return 1;
}

s3wire::size_hint_t s3wire::select_event_stream_t::size_hint () const
{
    return _source->size_hint ();
}
