/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __S3WIRE_DECODER_HPP_INCLUDED__
#define __S3WIRE_DECODER_HPP_INCLUDED__

#include <stddef.h>
#include <string.h>

#include <algorithm>

#include "utils/err.hpp"
#include "utils/macros.hpp"

namespace s3wire
{
//  Helper base class for decoders that know the amount of data to read
//  in advance at any moment. Knowing the amount in advance is a property
//  of the protocol used. The decoder copies incoming bytes into the buffer
//  given to next_step and calls the step function once that buffer is
//  full.
//
//  This class implements the state machine that parses the incoming
//  buffer. Derived class should implement individual state machine
//  actions. A step returns 0 to continue, 1 when a message is complete
//  and -1 on error.

template <typename T> class decoder_base_t
{
  public:
    decoder_base_t () : _next (NULL), _read_pos (NULL), _to_read (0) {}

    virtual ~decoder_base_t () {}

    //  Processes the data in the buffer. bytes_used_ is set to the number
    //  of bytes consumed. Returns 1 when a message is complete, 0 when
    //  more data is needed and -1 on error (errno is set).
    int decode (const unsigned char *data_, size_t size_, size_t &bytes_used_)
    {
        bytes_used_ = 0;

        while (bytes_used_ < size_) {
            const size_t to_copy = std::min (_to_read, size_ - bytes_used_);
            if (to_copy) {
                memcpy (_read_pos, data_ + bytes_used_, to_copy);
                _read_pos += to_copy;
                _to_read -= to_copy;
                bytes_used_ += to_copy;
            }
            while (_to_read == 0) {
                const int rc =
                  (static_cast<T *> (this)->*_next) (data_ + bytes_used_);
                if (rc != 0)
                    return rc;
            }
        }
        return 0;
    }

  protected:
    //  Prototype of state machine action. Action should return 0 on
    //  success, 1 on a complete message and -1 on error.
    typedef int (T::*step_t) (unsigned char const *);

    //  This function should be called from derived class to read data
    //  from the buffer and schedule next state machine action.
    void next_step (void *read_pos_, size_t to_read_, step_t next_)
    {
        _read_pos = static_cast<unsigned char *> (read_pos_);
        _to_read = to_read_;
        _next = next_;
    }

  private:
    //  Next step. If set to NULL, it means that associated data stream
    //  is dead.
    step_t _next;

    //  Where to store the read data.
    unsigned char *_read_pos;

    //  How much data to read before taking next step.
    size_t _to_read;

    S3WIRE_NON_COPYABLE_NOR_MOVABLE (decoder_base_t)
};
}

#endif
