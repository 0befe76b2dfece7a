/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "core/options.hpp"
#include "crypto/checksum_hasher.hpp"

#include <unity.h>

#include <map>

void setUp ()
{
}

void tearDown ()
{
}

static const char hello[] = "hello world";
static const size_t hello_size = sizeof (hello) - 1;

void test_no_algorithm_active ()
{
    s3wire::checksum_hasher_t hasher;
    TEST_ASSERT_EQUAL_INT (0, hasher.algorithms ());
    hasher.update (hello, hello_size);
    const s3wire::checksum_t sum = hasher.finalize ();
    TEST_ASSERT_FALSE (sum.checksum_crc32);
    TEST_ASSERT_FALSE (sum.checksum_crc32c);
    TEST_ASSERT_FALSE (sum.checksum_sha1);
    TEST_ASSERT_FALSE (sum.checksum_sha256);
    TEST_ASSERT_FALSE (sum.checksum_crc64nvme);
}

void test_algorithms_from_options ()
{
    s3wire::options_t options;
    const int algorithms = S3WIRE_CHECKSUM_CRC32 | S3WIRE_CHECKSUM_CRC64NVME;
    TEST_ASSERT_SUCCESS_ERRNO (options.setopt (S3WIRE_CHECKSUM_ALGORITHMS,
                                               &algorithms, sizeof algorithms));

    s3wire::checksum_hasher_t hasher (options);
    TEST_ASSERT_EQUAL_INT (algorithms, hasher.algorithms ());
    hasher.update (hello, hello_size);
    const s3wire::checksum_t sum = hasher.finalize ();
    TEST_ASSERT_TRUE (sum.checksum_crc32);
    TEST_ASSERT_EQUAL_STRING ("DUoRhQ==", sum.checksum_crc32->c_str ());
    TEST_ASSERT_TRUE (sum.checksum_crc64nvme);
    TEST_ASSERT_EQUAL_STRING ("jSnVw/bqjr4=", sum.checksum_crc64nvme->c_str ());
    TEST_ASSERT_FALSE (sum.checksum_crc32c);
    TEST_ASSERT_FALSE (sum.checksum_sha1);
    TEST_ASSERT_FALSE (sum.checksum_sha256);
}

void test_single_crc32 ()
{
    s3wire::checksum_hasher_t hasher (S3WIRE_CHECKSUM_CRC32);
    hasher.update (hello, hello_size);
    const s3wire::checksum_t sum = hasher.finalize ();
    TEST_ASSERT_TRUE (sum.checksum_crc32);
    TEST_ASSERT_EQUAL_STRING ("DUoRhQ==", sum.checksum_crc32->c_str ());
    TEST_ASSERT_FALSE (sum.checksum_crc32c);
    TEST_ASSERT_FALSE (sum.checksum_sha1);
    TEST_ASSERT_FALSE (sum.checksum_sha256);
    TEST_ASSERT_FALSE (sum.checksum_crc64nvme);
}

void test_single_crc32c ()
{
    s3wire::checksum_hasher_t hasher (S3WIRE_CHECKSUM_CRC32C);
    hasher.update (hello, hello_size);
    const s3wire::checksum_t sum = hasher.finalize ();
    TEST_ASSERT_EQUAL_STRING ("yZRlqg==", sum.checksum_crc32c->c_str ());
    TEST_ASSERT_FALSE (sum.checksum_crc32);
}

void test_single_sha1 ()
{
    s3wire::checksum_hasher_t hasher (S3WIRE_CHECKSUM_SHA1);
    hasher.update (hello, hello_size);
    const s3wire::checksum_t sum = hasher.finalize ();
    TEST_ASSERT_EQUAL_STRING ("Kq5sNclPz7QV2+lfQIuc6R7oRu0=",
                              sum.checksum_sha1->c_str ());
    TEST_ASSERT_FALSE (sum.checksum_sha256);
}

void test_single_sha256 ()
{
    s3wire::checksum_hasher_t hasher (S3WIRE_CHECKSUM_SHA256);
    hasher.update (hello, hello_size);
    const s3wire::checksum_t sum = hasher.finalize ();
    TEST_ASSERT_EQUAL_STRING ("uU0nuZNNPgilLlLX2n2r+sSE7+N6U4DukIj3rOLvzek=",
                              sum.checksum_sha256->c_str ());
    TEST_ASSERT_FALSE (sum.checksum_sha1);
}

void test_single_crc64nvme ()
{
    s3wire::checksum_hasher_t hasher (S3WIRE_CHECKSUM_CRC64NVME);
    hasher.update (hello, hello_size);
    const s3wire::checksum_t sum = hasher.finalize ();
    TEST_ASSERT_EQUAL_STRING ("jSnVw/bqjr4=", sum.checksum_crc64nvme->c_str ());
    TEST_ASSERT_FALSE (sum.checksum_crc32);
}

void test_all_algorithms_empty_input ()
{
    s3wire::checksum_hasher_t hasher (S3WIRE_CHECKSUM_ALL);
    TEST_ASSERT_EQUAL_INT (S3WIRE_CHECKSUM_ALL, hasher.algorithms ());
    const s3wire::checksum_t sum = hasher.finalize ();
    TEST_ASSERT_EQUAL_STRING ("AAAAAA==", sum.checksum_crc32->c_str ());
    TEST_ASSERT_EQUAL_STRING ("AAAAAA==", sum.checksum_crc32c->c_str ());
    TEST_ASSERT_EQUAL_STRING ("2jmj7l5rSw0yVb/vlWAYkK/YBwk=",
                              sum.checksum_sha1->c_str ());
    TEST_ASSERT_EQUAL_STRING ("47DEQpj8HBSa+/TImW+5JCeuQeRkm5NMpJWZG3hSuFU=",
                              sum.checksum_sha256->c_str ());
    TEST_ASSERT_EQUAL_STRING ("AAAAAAAAAAA=",
                              sum.checksum_crc64nvme->c_str ());
}

void test_enable_before_update ()
{
    s3wire::checksum_hasher_t hasher;
    hasher.enable (S3WIRE_CHECKSUM_CRC32);
    hasher.enable (S3WIRE_CHECKSUM_SHA256);
    TEST_ASSERT_EQUAL_INT (S3WIRE_CHECKSUM_CRC32 | S3WIRE_CHECKSUM_SHA256,
                           hasher.algorithms ());
    hasher.update (hello, hello_size);
    const s3wire::checksum_t sum = hasher.finalize ();
    TEST_ASSERT_EQUAL_STRING ("DUoRhQ==", sum.checksum_crc32->c_str ());
    TEST_ASSERT_EQUAL_STRING ("uU0nuZNNPgilLlLX2n2r+sSE7+N6U4DukIj3rOLvzek=",
                              sum.checksum_sha256->c_str ());
    TEST_ASSERT_FALSE (sum.checksum_crc32c);
}

void test_split_update_equivalence ()
{
    s3wire::checksum_hasher_t reference (S3WIRE_CHECKSUM_ALL);
    reference.update (hello, hello_size);
    const s3wire::checksum_t expected = reference.finalize ();

    for (size_t split = 0; split <= hello_size; ++split) {
        s3wire::checksum_hasher_t hasher (S3WIRE_CHECKSUM_ALL);
        hasher.update (hello, split);
        hasher.update (hello + split, hello_size - split);
        const s3wire::checksum_t sum = hasher.finalize ();
        TEST_ASSERT_TRUE (sum.matches (expected));
        TEST_ASSERT_TRUE (expected.matches (sum));
    }
}

void test_matches ()
{
    s3wire::checksum_hasher_t hasher (S3WIRE_CHECKSUM_CRC32
                                      | S3WIRE_CHECKSUM_SHA1);
    hasher.update (hello, hello_size);
    const s3wire::checksum_t sum = hasher.finalize ();

    s3wire::checksum_t expected;
    TEST_ASSERT_TRUE (sum.matches (expected));

    expected.checksum_crc32 = std::string ("DUoRhQ==");
    TEST_ASSERT_TRUE (sum.matches (expected));

    expected.checksum_crc32 = std::string ("AAAAAA==");
    TEST_ASSERT_FALSE (sum.matches (expected));

    //  Field expected but never computed.
    s3wire::checksum_t other;
    other.checksum_sha256 = std::string ("x");
    TEST_ASSERT_FALSE (sum.matches (other));
}

static void collect_header (std::map<std::string, std::string> *headers_,
                            const char *name_,
                            const std::string &value_)
{
    (*headers_)[name_] = value_;
}

struct header_collector_t
{
    explicit header_collector_t (std::map<std::string, std::string> *out_) :
        out (out_)
    {
    }
    void operator() (const char *name_, const std::string &value_) const
    {
        collect_header (out, name_, value_);
    }
    std::map<std::string, std::string> *out;
};

void test_for_each_header ()
{
    s3wire::checksum_hasher_t hasher (S3WIRE_CHECKSUM_CRC32C
                                      | S3WIRE_CHECKSUM_CRC64NVME);
    hasher.update (hello, hello_size);
    const s3wire::checksum_t sum = hasher.finalize ();

    std::map<std::string, std::string> headers;
    sum.for_each_header (header_collector_t (&headers));
    TEST_ASSERT_EQUAL_UINT (2, headers.size ());
    TEST_ASSERT_EQUAL_STRING ("yZRlqg==",
                              headers["x-amz-checksum-crc32c"].c_str ());
    TEST_ASSERT_EQUAL_STRING ("jSnVw/bqjr4=",
                              headers["x-amz-checksum-crc64nvme"].c_str ());
}

void test_algorithm_names ()
{
    TEST_ASSERT_EQUAL_INT (S3WIRE_CHECKSUM_CRC32,
                           s3wire::checksum_algorithm_from_name ("CRC32", 5));
    TEST_ASSERT_EQUAL_INT (S3WIRE_CHECKSUM_CRC32C,
                           s3wire::checksum_algorithm_from_name ("crc32c", 6));
    TEST_ASSERT_EQUAL_INT (S3WIRE_CHECKSUM_CRC64NVME,
                           s3wire::checksum_algorithm_from_name ("Crc64Nvme",
                                                                 9));
    TEST_ASSERT_EQUAL_INT (0, s3wire::checksum_algorithm_from_name ("MD5", 3));
    TEST_ASSERT_EQUAL_INT (0, s3wire::checksum_algorithm_from_name ("CRC3", 4));

    int algorithms = 0;
    TEST_ASSERT_SUCCESS_ERRNO (
      s3wire::parse_checksum_algorithms ("sha1, SHA256 ,crc32", &algorithms));
    TEST_ASSERT_EQUAL_INT (S3WIRE_CHECKSUM_SHA1 | S3WIRE_CHECKSUM_SHA256
                             | S3WIRE_CHECKSUM_CRC32,
                           algorithms);

    TEST_ASSERT_SUCCESS_ERRNO (
      s3wire::parse_checksum_algorithms ("", &algorithms));
    TEST_ASSERT_EQUAL_INT (0, algorithms);

    algorithms = 42;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, s3wire::parse_checksum_algorithms ("sha1,md5", &algorithms));
    TEST_ASSERT_EQUAL_INT (42, algorithms);
}

int main (void)
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_no_algorithm_active);
    RUN_TEST (test_algorithms_from_options);
    RUN_TEST (test_single_crc32);
    RUN_TEST (test_single_crc32c);
    RUN_TEST (test_single_sha1);
    RUN_TEST (test_single_sha256);
    RUN_TEST (test_single_crc64nvme);
    RUN_TEST (test_all_algorithms_empty_input);
    RUN_TEST (test_enable_before_update);
    RUN_TEST (test_split_update_equivalence);
    RUN_TEST (test_matches);
    RUN_TEST (test_for_each_header);
    RUN_TEST (test_algorithm_names);
    return UNITY_END ();
}
