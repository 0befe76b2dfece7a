/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __TESTUTIL_HPP_INCLUDED__
#define __TESTUTIL_HPP_INCLUDED__

#include "s3wire.h"

#include <errno.h>
#include <stddef.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <array>
#include <string>
#include <vector>

#if !defined _WIN32
#include <unistd.h>
#endif

#include <unity.h>

//  Asserts that expr_ succeeded (did not return -1), printing errno text
//  otherwise.
#define TEST_ASSERT_SUCCESS_ERRNO(expr)                                        \
    test_assert_success_errno_helper (expr, #expr, __LINE__)

//  Asserts that expr_ failed with -1 and the given errno.
#define TEST_ASSERT_FAILURE_ERRNO(error_code, expr)                            \
    {                                                                          \
        const int _rc = (expr);                                                \
        TEST_ASSERT_EQUAL_INT (-1, _rc);                                       \
        TEST_ASSERT_EQUAL_INT (error_code, errno);                             \
    }

inline int test_assert_success_errno_helper (int rc_, const char *expr_,
                                             int line_)
{
    if (rc_ == -1) {
        char buffer[512];
        snprintf (buffer, sizeof (buffer), "%s failed, errno = %i (%s)",
                  expr_, errno, s3wire_strerror (errno));
        UNITY_TEST_FAIL (line_, buffer);
    }
    return rc_;
}

//  Aborts the test binary if it hangs.
inline void setup_test_environment (int timeout_seconds_ = 60)
{
#if !defined _WIN32
    alarm (timeout_seconds_);
#else
    (void) timeout_seconds_;
#endif
}

inline std::string to_hex (const unsigned char *data_, size_t size_)
{
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve (size_ * 2);
    for (size_t i = 0; i < size_; ++i) {
        out += digits[data_[i] >> 4];
        out += digits[data_[i] & 0x0f];
    }
    return out;
}

template <size_t N>
inline std::string to_hex (const std::array<unsigned char, N> &bytes_)
{
    return to_hex (bytes_.data (), N);
}

inline std::string to_string (const std::vector<unsigned char> &bytes_)
{
    return std::string (bytes_.begin (), bytes_.end ());
}

#endif
