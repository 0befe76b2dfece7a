/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __S3WIRE_SELECT_EVENT_HPP_INCLUDED__
#define __S3WIRE_SELECT_EVENT_HPP_INCLUDED__

#include <stdint.h>

#include <string>

#include <boost/optional.hpp>

#include "core/s3_error.hpp"
#include "protocol/event_stream_message.hpp"
#include "utils/macros.hpp"

namespace s3wire
{
//  Byte counters attached to Progress and Stats events.
struct select_details_t
{
    boost::optional<int64_t> bytes_scanned;
    boost::optional<int64_t> bytes_processed;
    boost::optional<int64_t> bytes_returned;
};

//  One SelectObjectContent event.
class select_event_t
{
  public:
    enum type_t
    {
        continuation,
        end,
        progress,
        records,
        stats
    };

    static select_event_t make_continuation ();
    static select_event_t make_end ();
    static select_event_t
    make_progress (const boost::optional<select_details_t> &details_);
    static select_event_t
    make_records (const boost::optional<std::string> &payload_);
    static select_event_t
    make_stats (const boost::optional<select_details_t> &details_);

    type_t type () const { return _type; }

    //  Set for Progress and Stats only.
    const boost::optional<select_details_t> &details () const
    {
        return _details;
    }

    //  Set for Records only.
    const boost::optional<std::string> &payload () const { return _payload; }

    //  Value of the :event-type header.
    const char *event_type () const;

  private:
    explicit select_event_t (type_t type_);

    type_t _type;
    boost::optional<select_details_t> _details;
    boost::optional<std::string> _payload;
};

//  Renders Progress and Stats details as an XML document.
struct i_xml_serializer
{
    virtual ~i_xml_serializer () S3WIRE_DEFAULT

    //  Replaces out_ with the document, root_ being the element name.
    //  Returns 0 on success, -1 on failure.
    virtual int serialize (const char *root_,
                           const select_details_t &details_,
                           std::string &out_) = 0;
};

//  Default serializer: XML declaration followed by the root element with
//  one child per present counter.
class xml_serializer_t S3WIRE_FINAL : public i_xml_serializer
{
  public:
    int serialize (const char *root_,
                   const select_details_t &details_,
                   std::string &out_) S3WIRE_OVERRIDE;
};

//  Replaces msg_ with the frame carrying event_. A serializer failure is a
//  programming error.
void event_to_message (const select_event_t &event_,
                       i_xml_serializer &serializer_,
                       message_t &msg_);

//  Replaces msg_ with the error frame for error_.
void error_to_message (const s3_error_t &error_, message_t &msg_);
}

#endif
