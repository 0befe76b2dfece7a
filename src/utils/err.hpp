/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __S3WIRE_ERR_HPP_INCLUDED__
#define __S3WIRE_ERR_HPP_INCLUDED__

#include <assert.h>
#include <errno.h>
#include <string.h>
#include <stdlib.h>
#include <stdio.h>

#include "s3wire.h"
#include "utils/likely.hpp"

namespace s3wire
{
const char *errno_to_string (int errno_);
#if defined __clang__
#if __has_feature(attribute_analyzer_noreturn)
void s3wire_abort (const char *errmsg_) __attribute__ ((analyzer_noreturn));
#else
void s3wire_abort (const char *errmsg_);
#endif
#else
void s3wire_abort (const char *errmsg_);
#endif
void print_backtrace ();
}

//  This macro works in exactly the same way as the normal assert. It is used
//  in its stead because it stays active in release builds and reports the
//  failing expression before aborting.
#define s3wire_assert(x)                                                       \
    do {                                                                       \
        if (unlikely (!(x))) {                                                 \
            fprintf (stderr, "Assertion failed: %s (%s:%d)\n", #x, __FILE__,   \
                     __LINE__);                                                \
            fflush (stderr);                                                   \
            s3wire::s3wire_abort (#x);                                         \
        }                                                                      \
    } while (false)

//  Provides convenient way to check whether memory allocation have succeeded.
#define alloc_assert(x)                                                        \
    do {                                                                       \
        if (unlikely (!(x))) {                                                 \
            fprintf (stderr, "FATAL ERROR: OUT OF MEMORY (%s:%d)\n", __FILE__, \
                     __LINE__);                                                \
            fflush (stderr);                                                   \
            s3wire::s3wire_abort ("FATAL ERROR: OUT OF MEMORY");               \
        }                                                                      \
    } while (false)

//  Checks the return value of an OpenSSL call (1 on success).
#define ssl_assert(x)                                                          \
    do {                                                                       \
        if (unlikely ((x) != 1)) {                                             \
            fprintf (stderr, "OpenSSL call failed: %s (%s:%d)\n", #x,          \
                     __FILE__, __LINE__);                                      \
            fflush (stderr);                                                   \
            s3wire::s3wire_abort (#x);                                         \
        }                                                                      \
    } while (false)

#endif
