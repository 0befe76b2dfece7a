/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "core/options.hpp"

#include <unity.h>

void setUp ()
{
    unsetenv ("S3WIRE_CHECKSUM_ALGORITHMS");
    unsetenv ("S3WIRE_MAX_FRAME_SIZE");
}

void tearDown ()
{
}

void test_defaults ()
{
    const s3wire::options_t options;
    TEST_ASSERT_EQUAL_INT (0, options.checksum_algorithms);
    TEST_ASSERT_TRUE (options.max_frame_size == -1);
    TEST_ASSERT_FALSE (options.write_batch);
    TEST_ASSERT_EQUAL_HEX32 (0xFFFFFFFFu, options.effective_max_frame_size ());
}

void test_checksum_algorithms ()
{
    s3wire::options_t options;
    const int algorithms = S3WIRE_CHECKSUM_CRC32 | S3WIRE_CHECKSUM_SHA256;
    TEST_ASSERT_SUCCESS_ERRNO (options.setopt (S3WIRE_CHECKSUM_ALGORITHMS,
                                               &algorithms, sizeof algorithms));

    int value = 0;
    size_t size = sizeof value;
    TEST_ASSERT_SUCCESS_ERRNO (
      options.getopt (S3WIRE_CHECKSUM_ALGORITHMS, &value, &size));
    TEST_ASSERT_EQUAL_INT (algorithms, value);

    const int unknown = 0x100;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL,
      options.setopt (S3WIRE_CHECKSUM_ALGORITHMS, &unknown, sizeof unknown));
    TEST_ASSERT_EQUAL_INT (algorithms, options.checksum_algorithms);
}

void test_max_frame_size ()
{
    s3wire::options_t options;
    int64_t limit = 1024;
    TEST_ASSERT_SUCCESS_ERRNO (
      options.setopt (S3WIRE_MAX_FRAME_SIZE, &limit, sizeof limit));
    TEST_ASSERT_EQUAL_UINT32 (1024, options.effective_max_frame_size ());

    int64_t value = 0;
    size_t size = sizeof value;
    TEST_ASSERT_SUCCESS_ERRNO (
      options.getopt (S3WIRE_MAX_FRAME_SIZE, &value, &size));
    TEST_ASSERT_TRUE (value == 1024);

    //  Wrong width, too small, too large.
    const int narrow = 1024;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, options.setopt (S3WIRE_MAX_FRAME_SIZE, &narrow, sizeof narrow));
    limit = 15;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, options.setopt (S3WIRE_MAX_FRAME_SIZE, &limit, sizeof limit));
    limit = 0x100000000ll;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, options.setopt (S3WIRE_MAX_FRAME_SIZE, &limit, sizeof limit));

    limit = -1;
    TEST_ASSERT_SUCCESS_ERRNO (
      options.setopt (S3WIRE_MAX_FRAME_SIZE, &limit, sizeof limit));
    TEST_ASSERT_EQUAL_HEX32 (0xFFFFFFFFu, options.effective_max_frame_size ());
}

void test_write_batch ()
{
    s3wire::options_t options;
    const int on = 1;
    TEST_ASSERT_SUCCESS_ERRNO (
      options.setopt (S3WIRE_WRITE_BATCH, &on, sizeof on));
    TEST_ASSERT_TRUE (options.write_batch);

    int value = 0;
    size_t size = sizeof value;
    TEST_ASSERT_SUCCESS_ERRNO (options.getopt (S3WIRE_WRITE_BATCH, &value, &size));
    TEST_ASSERT_EQUAL_INT (1, value);

    const int two = 2;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, options.setopt (S3WIRE_WRITE_BATCH, &two, sizeof two));
}

void test_unknown_option ()
{
    s3wire::options_t options;
    const int value = 1;
    TEST_ASSERT_FAILURE_ERRNO (EINVAL, options.setopt (99, &value, sizeof value));

    int out = 0;
    size_t size = sizeof out;
    TEST_ASSERT_FAILURE_ERRNO (EINVAL, options.getopt (99, &out, &size));

    size = 1;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, options.getopt (S3WIRE_CHECKSUM_ALGORITHMS, &out, &size));
}

void test_load_env ()
{
    s3wire::options_t options;
    setenv ("S3WIRE_CHECKSUM_ALGORITHMS", "crc32c,crc64nvme", 1);
    setenv ("S3WIRE_MAX_FRAME_SIZE", "65536", 1);
    TEST_ASSERT_SUCCESS_ERRNO (options.load_env ());
    TEST_ASSERT_EQUAL_INT (S3WIRE_CHECKSUM_CRC32C | S3WIRE_CHECKSUM_CRC64NVME,
                           options.checksum_algorithms);
    TEST_ASSERT_EQUAL_UINT32 (65536, options.effective_max_frame_size ());
}

void test_load_env_invalid ()
{
    s3wire::options_t options;
    setenv ("S3WIRE_CHECKSUM_ALGORITHMS", "sha1", 1);
    setenv ("S3WIRE_MAX_FRAME_SIZE", "lots", 1);
    TEST_ASSERT_FAILURE_ERRNO (EINVAL, options.load_env ());
    TEST_ASSERT_EQUAL_INT (0, options.checksum_algorithms);

    setenv ("S3WIRE_MAX_FRAME_SIZE", "64", 1);
    setenv ("S3WIRE_CHECKSUM_ALGORITHMS", "sha3", 1);
    TEST_ASSERT_FAILURE_ERRNO (EINVAL, options.load_env ());
    TEST_ASSERT_TRUE (options.max_frame_size == -1);
}

int main (void)
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_defaults);
    RUN_TEST (test_checksum_algorithms);
    RUN_TEST (test_max_frame_size);
    RUN_TEST (test_write_batch);
    RUN_TEST (test_unknown_option);
    RUN_TEST (test_load_env);
    RUN_TEST (test_load_env_invalid);
    return UNITY_END ();
}
