/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __S3WIRE_EVENT_STREAM_MESSAGE_HPP_INCLUDED__
#define __S3WIRE_EVENT_STREAM_MESSAGE_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "protocol/event_stream_protocol.hpp"

namespace s3wire
{
//  Name/value pair carried by a frame. Both are raw byte strings; only
//  the string value type is ever produced.
struct header_t
{
    header_t () {}
    header_t (const std::string &name_, const std::string &value_) :
        name (name_),
        value (value_)
    {
    }

    std::string name;
    std::string value;
};

//  One event stream frame: headers in wire order and an optional payload.
class message_t
{
  public:
    message_t ();

    message_t &add_header (const std::string &name_,
                           const std::string &value_);
    const std::vector<header_t> &headers () const { return _headers; }

    //  First header with the given name, or NULL.
    const header_t *find_header (const std::string &name_) const;

    void set_payload (const std::string &payload_) { _payload = payload_; }
    void set_payload (const void *data_, size_t size_);
    void clear_payload () { _payload = boost::none; }
    const boost::optional<std::string> &payload () const { return _payload; }

    //  Appends the encoded frame to out_. Returns 0 on success. On failure
    //  returns -1 with errno EOVERFLOW, stores the es_error_* kind in
    //  *error_ if given, and leaves out_ unchanged.
    int encode (std::vector<unsigned char> &out_, int *error_ = NULL) const;

    //  Computes the frame and headers region lengths with checked
    //  arithmetic. Returns -1 with errno EOVERFLOW if either does not
    //  fit into 32 bits.
    int encoded_size (uint32_t *total_length_,
                      uint32_t *headers_length_) const;

    void clear ();

  private:
    std::vector<header_t> _headers;
    boost::optional<std::string> _payload;
};

//  Adds b_ to *a_ unless the sum exceeds UINT32_MAX. Returns false on
//  overflow, leaving *a_ untouched.
inline bool checked_add_u32 (uint32_t *a_, uint64_t b_)
{
    if (b_ > 0xFFFFFFFFu - static_cast<uint64_t> (*a_))
        return false;
    *a_ = static_cast<uint32_t> (*a_ + b_);
    return true;
}
}

#endif
