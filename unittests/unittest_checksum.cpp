/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "crypto/base64.hpp"
#include "crypto/checksum.hpp"
#include "utils/wire.hpp"

#include <unity.h>

void setUp ()
{
}

void tearDown ()
{
}

static const char check_input[] = "123456789";
static const size_t check_size = sizeof (check_input) - 1;

void test_crc32_check_value ()
{
    const s3wire::crc32_t::output_t sum =
      s3wire::crc32_t::checksum (check_input, check_size);
    TEST_ASSERT_EQUAL_STRING ("cbf43926", to_hex (sum).c_str ());
    TEST_ASSERT_EQUAL_HEX32 (
      0xCBF43926u, s3wire::crc32_t::checksum_u32 (check_input, check_size));
}

void test_crc32_u32_matches_bytes ()
{
    const char data[] = "hello world";
    const s3wire::crc32_t::output_t sum =
      s3wire::crc32_t::checksum (data, sizeof (data) - 1);
    TEST_ASSERT_EQUAL_HEX32 (
      s3wire::get_uint32 (sum.data ()),
      s3wire::crc32_t::checksum_u32 (data, sizeof (data) - 1));
}

void test_crc32c_check_value ()
{
    const s3wire::crc32c_t::output_t sum =
      s3wire::crc32c_t::checksum (check_input, check_size);
    TEST_ASSERT_EQUAL_STRING ("e3069283", to_hex (sum).c_str ());
}

void test_crc64nvme_check_value ()
{
    const s3wire::crc64nvme_t::output_t sum =
      s3wire::crc64nvme_t::checksum (check_input, check_size);
    TEST_ASSERT_EQUAL_STRING ("ae8b14860a799888", to_hex (sum).c_str ());
}

void test_sha1_check_value ()
{
    const s3wire::sha1_t::output_t sum =
      s3wire::sha1_t::checksum (check_input, check_size);
    TEST_ASSERT_EQUAL_STRING ("f7c3bc1d808e04732adf679965ccc34ca7ae3441",
                              to_hex (sum).c_str ());
}

void test_sha256_empty ()
{
    const s3wire::sha256_t::output_t sum = s3wire::sha256_t::checksum ("", 0);
    TEST_ASSERT_EQUAL_STRING (
      "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
      to_hex (sum).c_str ());
}

void test_md5_values ()
{
    TEST_ASSERT_EQUAL_STRING ("d41d8cd98f00b204e9800998ecf8427e",
                              to_hex (s3wire::md5_t::checksum ("", 0)).c_str ());
    TEST_ASSERT_EQUAL_STRING (
      "25f9e794323b453885f5181f1b624d0b",
      to_hex (s3wire::md5_t::checksum (check_input, check_size)).c_str ());
}

void test_empty_input_crcs ()
{
    TEST_ASSERT_EQUAL_STRING ("00000000",
                              to_hex (s3wire::crc32_t::checksum ("", 0)).c_str ());
    TEST_ASSERT_EQUAL_STRING (
      "00000000", to_hex (s3wire::crc32c_t::checksum ("", 0)).c_str ());
    TEST_ASSERT_EQUAL_STRING (
      "0000000000000000",
      to_hex (s3wire::crc64nvme_t::checksum ("", 0)).c_str ());
}

template <typename T> static void check_incremental ()
{
    const typename T::output_t expected =
      T::checksum (check_input, check_size);

    for (size_t split = 0; split <= check_size; ++split) {
        T hasher;
        hasher.update (check_input, split);
        hasher.update (check_input + split, check_size - split);
        TEST_ASSERT_FALSE (hasher.finalized ());
        const typename T::output_t sum = hasher.finalize ();
        TEST_ASSERT_TRUE (hasher.finalized ());
        TEST_ASSERT_EQUAL_MEMORY (expected.data (), sum.data (),
                                  sum.size ());
    }
}

void test_incremental_equals_one_shot ()
{
    check_incremental<s3wire::crc32_t> ();
    check_incremental<s3wire::crc32c_t> ();
    check_incremental<s3wire::crc64nvme_t> ();
    check_incremental<s3wire::sha1_t> ();
    check_incremental<s3wire::sha256_t> ();
    check_incremental<s3wire::md5_t> ();
}

void test_output_sizes ()
{
    TEST_ASSERT_EQUAL_INT (4, s3wire::crc32_t::output_size);
    TEST_ASSERT_EQUAL_INT (4, s3wire::crc32c_t::output_size);
    TEST_ASSERT_EQUAL_INT (8, s3wire::crc64nvme_t::output_size);
    TEST_ASSERT_EQUAL_INT (20, s3wire::sha1_t::output_size);
    TEST_ASSERT_EQUAL_INT (32, s3wire::sha256_t::output_size);
    TEST_ASSERT_EQUAL_INT (16, s3wire::md5_t::output_size);
}

void test_base64_encode ()
{
    const unsigned char data[] = {0, 1, 2, 3};
    TEST_ASSERT_EQUAL_STRING ("AAECAw==",
                              s3wire::base64_encode (data, 4).c_str ());
    TEST_ASSERT_EQUAL_STRING ("", s3wire::base64_encode (data, 0).c_str ());
}

void test_base64_decode ()
{
    std::vector<unsigned char> out;
    TEST_ASSERT_SUCCESS_ERRNO (s3wire::base64_decode ("AAECAw==", out));
    TEST_ASSERT_EQUAL_UINT (4, out.size ());
    const unsigned char expected[] = {0, 1, 2, 3};
    TEST_ASSERT_EQUAL_MEMORY (expected, &out[0], 4);

    TEST_ASSERT_SUCCESS_ERRNO (s3wire::base64_decode ("DUoRhQ==", out));
    TEST_ASSERT_EQUAL_UINT (4, out.size ());
    TEST_ASSERT_EQUAL_HEX32 (0x0D4A1185u, s3wire::get_uint32 (&out[0]));
}

void test_base64_decode_malformed ()
{
    std::vector<unsigned char> out;
    TEST_ASSERT_FAILURE_ERRNO (EINVAL, s3wire::base64_decode ("AAE", out));
    TEST_ASSERT_FAILURE_ERRNO (EINVAL, s3wire::base64_decode ("AA*C", out));
    TEST_ASSERT_FAILURE_ERRNO (EINVAL, s3wire::base64_decode ("====", out));
    TEST_ASSERT_FAILURE_ERRNO (EINVAL, s3wire::base64_decode ("A===", out));
    TEST_ASSERT_FAILURE_ERRNO (EINVAL, s3wire::base64_decode ("AA=A", out));
    TEST_ASSERT_FAILURE_ERRNO (EINVAL, s3wire::base64_decode ("A=B=", out));
    TEST_ASSERT_FAILURE_ERRNO (EINVAL, s3wire::base64_decode ("AA==AAAA", out));
}

int main (void)
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_crc32_check_value);
    RUN_TEST (test_crc32_u32_matches_bytes);
    RUN_TEST (test_crc32c_check_value);
    RUN_TEST (test_crc64nvme_check_value);
    RUN_TEST (test_sha1_check_value);
    RUN_TEST (test_sha256_empty);
    RUN_TEST (test_md5_values);
    RUN_TEST (test_empty_input_crcs);
    RUN_TEST (test_incremental_equals_one_shot);
    RUN_TEST (test_output_sizes);
    RUN_TEST (test_base64_encode);
    RUN_TEST (test_base64_decode);
    RUN_TEST (test_base64_decode_malformed);
    return UNITY_END ();
}
