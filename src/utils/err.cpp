/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/err.hpp"
#include "utils/macros.hpp"

#if defined __GLIBC__ || defined __APPLE__
#include <execinfo.h>
#endif

const char *s3wire::errno_to_string (int errno_)
{
    switch (errno_) {
#if S3WIRE_HAUSNUMERO + 1 == EOVERFLOW
        case EOVERFLOW:
            return "Value too large for defined data type";
#endif
#if S3WIRE_HAUSNUMERO + 2 == EPROTO
        case EPROTO:
            return "Protocol error";
#endif
#if S3WIRE_HAUSNUMERO + 3 == EMSGSIZE
        case EMSGSIZE:
            return "Message too long";
#endif
        default:
#if defined _MSC_VER
#pragma warning(push)
#pragma warning(disable : 4996)
#endif
            return strerror (errno_);
#if defined _MSC_VER
#pragma warning(pop)
#endif
    }
}

void s3wire::s3wire_abort (const char *errmsg_)
{
    LIBS3WIRE_UNUSED (errmsg_);
    print_backtrace ();
    abort ();
}

void s3wire::print_backtrace ()
{
#if defined __GLIBC__ || defined __APPLE__
    void *frames[64];
    const int depth = backtrace (frames, 64);
    backtrace_symbols_fd (frames, depth, 2);
#endif
}

int s3wire_errno (void)
{
    return errno;
}

const char *s3wire_strerror (int errnum_)
{
    return s3wire::errno_to_string (errnum_);
}

void s3wire_version (int *major_, int *minor_, int *patch_)
{
    *major_ = S3WIRE_VERSION_MAJOR;
    *minor_ = S3WIRE_VERSION_MINOR;
    *patch_ = S3WIRE_VERSION_PATCH;
}
