/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "auth/secret_key.hpp"
#include "auth/simple_auth.hpp"
#include "core/region.hpp"
#include "core/s3_error.hpp"

#include <unity.h>

void setUp ()
{
}

void tearDown ()
{
}

void test_secret_key_equality ()
{
    const s3wire::secret_key_t a (std::string ("wJalrXUtnFEMI/K7MDENG"));
    const s3wire::secret_key_t b (std::string ("wJalrXUtnFEMI/K7MDENG"));
    const s3wire::secret_key_t c (std::string ("wJalrXUtnFEMI/K7MDENH"));
    const s3wire::secret_key_t d (std::string ("short"));

    TEST_ASSERT_TRUE (a.equals (b));
    TEST_ASSERT_FALSE (a.equals (c));
    TEST_ASSERT_FALSE (a.equals (d));
    TEST_ASSERT_TRUE (a.equals ("wJalrXUtnFEMI/K7MDENG", 21));
    TEST_ASSERT_TRUE (s3wire::secret_key_t ().equals (s3wire::secret_key_t ()));
}

void test_secret_key_copy ()
{
    s3wire::secret_key_t a (std::string ("secret"));
    s3wire::secret_key_t b;
    TEST_ASSERT_TRUE (b.empty ());
    b = a;
    TEST_ASSERT_TRUE (b.equals (a));
    const s3wire::secret_key_t c (b);
    TEST_ASSERT_EQUAL_STRING ("secret", c.expose ().c_str ());
}

void test_secret_key_placeholder ()
{
    TEST_ASSERT_EQUAL_STRING ("[SENSITIVE-SECRET-KEY]",
                              s3wire::secret_key_t::placeholder ());
}

void test_auth_lookup ()
{
    s3wire::simple_auth_t auth ("AKID", s3wire::secret_key_t (std::string ("secret")));
    const s3wire::secret_key_t *key = auth.lookup ("AKID");
    TEST_ASSERT_NOT_NULL (key);
    TEST_ASSERT_EQUAL_STRING ("secret", key->expose ().c_str ());
    TEST_ASSERT_NULL (auth.lookup ("other"));
}

void test_auth_register_replaces ()
{
    s3wire::simple_auth_t auth;
    TEST_ASSERT_FALSE (
      auth.register_key ("key", s3wire::secret_key_t (std::string ("old"))));
    TEST_ASSERT_TRUE (
      auth.register_key ("key", s3wire::secret_key_t (std::string ("new"))));
    TEST_ASSERT_EQUAL_UINT (1, auth.size ());
    TEST_ASSERT_EQUAL_STRING ("new", auth.lookup ("key")->expose ().c_str ());
}

void test_auth_get_secret_key ()
{
    s3wire::simple_auth_t auth ("AKID", s3wire::secret_key_t (std::string ("secret")));

    s3wire::secret_key_t out;
    TEST_ASSERT_SUCCESS_ERRNO (auth.get_secret_key ("AKID", out));
    TEST_ASSERT_EQUAL_STRING ("secret", out.expose ().c_str ());

    s3wire::s3_error_t error (s3wire::s3_error_internal_error);
    TEST_ASSERT_FAILURE_ERRNO (ENOENT,
                               auth.get_secret_key ("nobody", out, &error));
    TEST_ASSERT_EQUAL_INT (s3wire::s3_error_not_signed_up, error.code ());
    TEST_ASSERT_EQUAL_STRING ("NotSignedUp", error.code_str ().c_str ());
    TEST_ASSERT_TRUE (error.message ());
    TEST_ASSERT_EQUAL_STRING ("Your account is not signed up",
                              error.message ()->c_str ());
}

void test_region_valid ()
{
    s3wire::region_t region;
    TEST_ASSERT_SUCCESS_ERRNO (s3wire::region_t::parse ("us-east-1", region));
    TEST_ASSERT_EQUAL_STRING ("us-east-1", region.str ().c_str ());
    TEST_ASSERT_SUCCESS_ERRNO (s3wire::region_t::parse ("cn-north-1", region));
    TEST_ASSERT_SUCCESS_ERRNO (s3wire::region_t::parse ("-", region));
    TEST_ASSERT_EQUAL_STRING ("-", region.str ().c_str ());
}

void test_region_invalid ()
{
    s3wire::region_t region;
    TEST_ASSERT_SUCCESS_ERRNO (s3wire::region_t::parse ("eu-west-2", region));

    TEST_ASSERT_FAILURE_ERRNO (EINVAL, s3wire::region_t::parse ("", region));
    TEST_ASSERT_FAILURE_ERRNO (EINVAL,
                               s3wire::region_t::parse ("US-EAST-1", region));
    TEST_ASSERT_FAILURE_ERRNO (EINVAL,
                               s3wire::region_t::parse ("us east", region));
    TEST_ASSERT_FAILURE_ERRNO (EINVAL,
                               s3wire::region_t::parse ("us_east_1", region));
    TEST_ASSERT_EQUAL_STRING ("eu-west-2", region.str ().c_str ());
}

int main (void)
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_secret_key_equality);
    RUN_TEST (test_secret_key_copy);
    RUN_TEST (test_secret_key_placeholder);
    RUN_TEST (test_auth_lookup);
    RUN_TEST (test_auth_register_replaces);
    RUN_TEST (test_auth_get_secret_key);
    RUN_TEST (test_region_valid);
    RUN_TEST (test_region_invalid);
    return UNITY_END ();
}
