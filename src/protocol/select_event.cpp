/* SPDX-License-Identifier: MPL-2.0 */

#include "protocol/select_event.hpp"
#include "protocol/event_stream_protocol.hpp"
#include "utils/err.hpp"

#include <sstream>

namespace
{
void append_counter (std::ostringstream &os_,
                     const char *name_,
                     const boost::optional<int64_t> &value_)
{
    if (value_)
        os_ << '<' << name_ << '>' << *value_ << "</" << name_ << '>';
}
}

s3wire::select_event_t::select_event_t (type_t type_) : _type (type_)
{
}

s3wire::select_event_t s3wire::select_event_t::make_continuation ()
{
    return select_event_t (continuation);
}

s3wire::select_event_t s3wire::select_event_t::make_end ()
{
    return select_event_t (end);
}

s3wire::select_event_t s3wire::select_event_t::make_progress (
  const boost::optional<select_details_t> &details_)
{
    select_event_t event (progress);
    event._details = details_;
    return event;
}

s3wire::select_event_t
s3wire::select_event_t::make_records (const boost::optional<std::string> &payload_)
{
    select_event_t event (records);
    event._payload = payload_;
    return event;
}

s3wire::select_event_t s3wire::select_event_t::make_stats (
  const boost::optional<select_details_t> &details_)
{
    select_event_t event (stats);
    event._details = details_;
    return event;
}

const char *s3wire::select_event_t::event_type () const
{
    switch (_type) {
        case continuation:
            return "Cont";
        case end:
            return "End";
        case progress:
            return "Progress";
        case records:
            return "Records";
        case stats:
            return "Stats";
    }
    s3wire_assert (false);
    return NULL;
}

int s3wire::xml_serializer_t::serialize (const char *root_,
                                         const select_details_t &details_,
                                         std::string &out_)
{
    std::ostringstream os;
    os << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>";
    os << '<' << root_ << '>';
    append_counter (os, "BytesScanned", details_.bytes_scanned);
    append_counter (os, "BytesProcessed", details_.bytes_processed);
    append_counter (os, "BytesReturned", details_.bytes_returned);
    os << "</" << root_ << '>';
    if (!os)
        return -1;
    out_ = os.str ();
    return 0;
}

void s3wire::event_to_message (const select_event_t &event_,
                               i_xml_serializer &serializer_,
                               message_t &msg_)
{
    msg_.clear ();
    msg_.add_header (S3WIRE_HEADER_EVENT_TYPE, event_.event_type ());

    switch (event_.type ()) {
        case select_event_t::continuation:
        case select_event_t::end:
            break;

        case select_event_t::progress:
        case select_event_t::stats:
            msg_.add_header (S3WIRE_HEADER_CONTENT_TYPE,
                             S3WIRE_CONTENT_TYPE_XML);
            if (event_.details ()) {
                std::string xml;
                const int rc =
                  serializer_.serialize (event_.event_type (), *event_.details (),
                                         xml);
                s3wire_assert (rc == 0);
                msg_.set_payload (xml);
            }
            break;

        case select_event_t::records:
            msg_.add_header (S3WIRE_HEADER_CONTENT_TYPE,
                             S3WIRE_CONTENT_TYPE_OCTET_STREAM);
            if (event_.payload ())
                msg_.set_payload (*event_.payload ());
            break;
    }

    msg_.add_header (S3WIRE_HEADER_MESSAGE_TYPE, S3WIRE_MESSAGE_TYPE_EVENT);
}

void s3wire::error_to_message (const s3_error_t &error_, message_t &msg_)
{
    msg_.clear ();
    msg_.add_header (S3WIRE_HEADER_ERROR_CODE, error_.code_str ());
    msg_.add_header (S3WIRE_HEADER_ERROR_MESSAGE,
                     error_.message () ? *error_.message () : std::string ());
    msg_.add_header (S3WIRE_HEADER_MESSAGE_TYPE, S3WIRE_MESSAGE_TYPE_ERROR);
}
