/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __S3WIRE_OPTIONS_HPP_INCLUDED__
#define __S3WIRE_OPTIONS_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>

#include "s3wire.h"

namespace s3wire
{
struct options_t
{
    options_t ();

    int setopt (int option_, const void *optval_, size_t optvallen_);
    int getopt (int option_, void *optval_, size_t *optvallen_) const;

    //  Applies S3WIRE_CHECKSUM_ALGORITHMS and S3WIRE_MAX_FRAME_SIZE from
    //  the environment. Returns -1 with errno EINVAL if a variable is set
    //  to an unusable value; the options are left untouched in that case.
    int load_env ();

    //  Largest frame the decoder accepts, resolving -1 to the u32 maximum.
    uint32_t effective_max_frame_size () const;

    //  Algorithms a new checksum hasher activates (S3WIRE_CHECKSUM_* bits).
    int checksum_algorithms;

    //  Largest frame accepted by the decoder; -1 means no limit other than
    //  the u32 length field.
    int64_t max_frame_size;

    //  If true, the writer coalesces all immediately ready chunks into one
    //  write.
    bool write_batch;
};

int do_getopt (void *optval_, size_t *optvallen_, int value_);
int do_setopt_int_as_bool_strict (const void *optval_,
                                  size_t optvallen_,
                                  bool *out_value_);
}

#endif
