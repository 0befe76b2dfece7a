/* SPDX-License-Identifier: MPL-2.0 */

#include <string.h>
#include <stdlib.h>
#include <limits.h>
#include <string>

#include "core/options.hpp"
#include "crypto/checksum_hasher.hpp"
#include "utils/err.hpp"
#include "utils/macros.hpp"

static int opt_invalid ()
{
#if defined(S3WIRE_ACT_MILITANT)
    s3wire_assert (false);
#endif
    errno = EINVAL;
    return -1;
}

template <typename T>
static int do_setopt (const void *const optval_,
                      const size_t optvallen_,
                      T *const out_value_)
{
    if (optval_ != NULL && optvallen_ == sizeof (T)) {
        memcpy (out_value_, optval_, sizeof (T));
        return 0;
    }
    return opt_invalid ();
}

int s3wire::do_getopt (void *const optval_,
                       size_t *const optvallen_,
                       int value_)
{
    if (*optvallen_ != sizeof (int))
        return opt_invalid ();
    memcpy (optval_, &value_, sizeof (int));
    return 0;
}

int s3wire::do_setopt_int_as_bool_strict (const void *const optval_,
                                          const size_t optvallen_,
                                          bool *const out_value_)
{
    int value = -1;
    if (do_setopt (optval_, optvallen_, &value) == -1)
        return -1;
    if (value == 0 || value == 1) {
        *out_value_ = (value != 0);
        return 0;
    }
    return opt_invalid ();
}

//  Accepts -1 (unlimited) or a size in [16, UINT32_MAX].
static bool valid_max_frame_size (int64_t value_)
{
    return value_ == -1
           || (value_ >= 16 && value_ <= static_cast<int64_t> (UINT32_MAX));
}

s3wire::options_t::options_t () :
    checksum_algorithms (0),
    max_frame_size (-1),
    write_batch (false)
{
}

int s3wire::options_t::setopt (int option_,
                               const void *optval_,
                               size_t optvallen_)
{
    switch (option_) {
        case S3WIRE_CHECKSUM_ALGORITHMS: {
            int value = 0;
            if (do_setopt (optval_, optvallen_, &value) == -1)
                return -1;
            if ((value & ~S3WIRE_CHECKSUM_ALL) != 0)
                return opt_invalid ();
            checksum_algorithms = value;
            return 0;
        }

        case S3WIRE_MAX_FRAME_SIZE: {
            int64_t value = 0;
            if (do_setopt (optval_, optvallen_, &value) == -1)
                return -1;
            if (!valid_max_frame_size (value))
                return opt_invalid ();
            max_frame_size = value;
            return 0;
        }

        case S3WIRE_WRITE_BATCH:
            return do_setopt_int_as_bool_strict (optval_, optvallen_,
                                                 &write_batch);

        default:
            break;
    }
    return opt_invalid ();
}

int s3wire::options_t::getopt (int option_,
                               void *optval_,
                               size_t *optvallen_) const
{
    switch (option_) {
        case S3WIRE_CHECKSUM_ALGORITHMS:
            return do_getopt (optval_, optvallen_, checksum_algorithms);

        case S3WIRE_MAX_FRAME_SIZE:
            if (*optvallen_ == sizeof (int64_t)) {
                memcpy (optval_, &max_frame_size, sizeof (int64_t));
                return 0;
            }
            break;

        case S3WIRE_WRITE_BATCH:
            return do_getopt (optval_, optvallen_, write_batch ? 1 : 0);

        default:
            break;
    }
    return opt_invalid ();
}

int s3wire::options_t::load_env ()
{
    int algorithms = checksum_algorithms;
    int64_t frame_size = max_frame_size;

    const char *env = getenv ("S3WIRE_CHECKSUM_ALGORITHMS");
    if (env) {
        if (parse_checksum_algorithms (std::string (env), &algorithms) == -1)
            return -1;
    }

    env = getenv ("S3WIRE_MAX_FRAME_SIZE");
    if (env) {
        char *end = NULL;
        errno = 0;
        const long long value = strtoll (env, &end, 10);
        if (errno != 0 || end == env || *end != '\0'
            || !valid_max_frame_size (value))
            return opt_invalid ();
        frame_size = value;
    }

    checksum_algorithms = algorithms;
    max_frame_size = frame_size;
    return 0;
}

uint32_t s3wire::options_t::effective_max_frame_size () const
{
    if (max_frame_size < 0)
        return UINT32_MAX;
    return static_cast<uint32_t> (max_frame_size);
}
