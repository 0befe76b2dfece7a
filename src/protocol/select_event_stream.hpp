/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __S3WIRE_SELECT_EVENT_STREAM_HPP_INCLUDED__
#define __S3WIRE_SELECT_EVENT_STREAM_HPP_INCLUDED__

#include <stddef.h>

#include <deque>
#include <memory>
#include <vector>

#include <boost/optional.hpp>

#include "core/s3_error.hpp"
#include "protocol/event_stream_message.hpp"
#include "protocol/select_event.hpp"
#include "utils/macros.hpp"

namespace s3wire
{
//  One item produced by an event source.
class select_item_t
{
  public:
    enum kind_t
    {
        event,
        error,
        end,
        //  Nothing ready yet; ask again later.
        again
    };

    static select_item_t make_event (const select_event_t &event_);
    static select_item_t make_error (const s3_error_t &error_);
    static select_item_t make_end ();
    static select_item_t make_again ();

    kind_t kind () const { return _kind; }
    const select_event_t &get_event () const;
    const s3_error_t &get_error () const;

  private:
    explicit select_item_t (kind_t kind_);

    kind_t _kind;
    boost::optional<select_event_t> _event;
    boost::optional<s3_error_t> _error;
};

//  Remaining item count: a lower bound and an optional upper bound.
struct size_hint_t
{
    size_hint_t () : lower (0) {}
    size_hint_t (size_t lower_, const boost::optional<size_t> &upper_) :
        lower (lower_),
        upper (upper_)
    {
    }

    size_t lower;
    boost::optional<size_t> upper;
};

//  Upstream producer of select events.
struct i_select_event_source
{
    virtual ~i_select_event_source () S3WIRE_DEFAULT

    virtual select_item_t next () = 0;
    virtual size_hint_t size_hint () const = 0;
};

//  Source over a prepared sequence of items. Yields end once exhausted.
class select_event_list_t S3WIRE_FINAL : public i_select_event_source
{
  public:
    select_event_list_t ();

    select_event_list_t &push (const select_item_t &item_);
    select_event_list_t &push_event (const select_event_t &event_);
    select_event_list_t &push_error (const s3_error_t &error_);

    select_item_t next () S3WIRE_OVERRIDE;

    //  Exact: the queued events up to and including the first error.
    size_hint_t size_hint () const S3WIRE_OVERRIDE;

  private:
    std::deque<select_item_t> _items;
};

//  Turns a source of select events into encoded event stream frames, one
//  frame per event. A request-level error becomes the final frame.
class select_event_stream_t
{
  public:
    enum state_t
    {
        running,
        ended_cleanly,
        ended_abnormally
    };

    //  serializer_ renders Progress/Stats details; NULL selects the
    //  built-in XML serializer. It must outlive the stream.
    explicit select_event_stream_t (
      std::unique_ptr<i_select_event_source> source_,
      i_xml_serializer *serializer_ = NULL);
    ~select_event_stream_t ();

    //  Replaces chunk_ with the next encoded frame and returns 1. Returns
    //  0 once the stream has ended. Returns -1 with errno EAGAIN when the
    //  source has nothing ready and -1 with errno EOVERFLOW when a frame
    //  cannot be encoded, which ends the stream.
    int next (std::vector<unsigned char> &chunk_);

    size_hint_t size_hint () const;
    state_t state () const { return _state; }

    //  es_error_* kind of the failure that ended the stream abnormally.
    int error_code () const { return _error_code; }

  private:
    int encode (const message_t &msg_, std::vector<unsigned char> &chunk_);

    std::unique_ptr<i_select_event_source> _source;
    xml_serializer_t _default_serializer;
    i_xml_serializer *_serializer;
    message_t _msg;
    state_t _state;
    int _error_code;

    S3WIRE_NON_COPYABLE_NOR_MOVABLE (select_event_stream_t)
};
}

#endif
