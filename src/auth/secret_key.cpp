/* SPDX-License-Identifier: MPL-2.0 */

#include "auth/secret_key.hpp"
#include "utils/err.hpp"

#include <openssl/crypto.h>

s3wire::secret_key_t::secret_key_t ()
{
}

s3wire::secret_key_t::secret_key_t (const std::string &secret_) :
    _secret (secret_.data (), secret_.size ())
{
}

s3wire::secret_key_t::secret_key_t (const char *data_, size_t size_) :
    _secret (data_, size_)
{
    s3wire_assert (data_ != NULL || size_ == 0);
}

s3wire::secret_key_t::secret_key_t (const secret_key_t &other_) :
    _secret (other_._secret)
{
}

s3wire::secret_key_t &
s3wire::secret_key_t::operator= (const secret_key_t &other_)
{
    if (this != &other_) {
        wipe ();
        _secret = other_._secret;
    }
    return *this;
}

s3wire::secret_key_t::~secret_key_t ()
{
    wipe ();
}

//  Short keys live inside the string object itself and never reach the
//  allocator, so they are cleansed here.
void s3wire::secret_key_t::wipe ()
{
    if (!_secret.empty ())
        OPENSSL_cleanse (&_secret[0], _secret.size ());
    _secret.clear ();
}

bool s3wire::secret_key_t::equals (const secret_key_t &other_) const
{
    return equals (other_._secret.data (), other_._secret.size ());
}

bool s3wire::secret_key_t::equals (const char *data_, size_t size_) const
{
    if (size_ != _secret.size ())
        return false;
    if (size_ == 0)
        return true;
    return CRYPTO_memcmp (_secret.data (), data_, size_) == 0;
}
