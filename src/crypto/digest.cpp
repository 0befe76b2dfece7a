/* SPDX-License-Identifier: MPL-2.0 */

#include "crypto/checksum.hpp"

#include <openssl/evp.h>

s3wire::evp_digest_t::evp_digest_t (const EVP_MD *md_) :
    _ctx (EVP_MD_CTX_new ())
{
    alloc_assert (_ctx);
    ssl_assert (EVP_DigestInit_ex (_ctx, md_, NULL));
}

s3wire::evp_digest_t::~evp_digest_t ()
{
    EVP_MD_CTX_free (_ctx);
}

void s3wire::evp_digest_t::update (const unsigned char *data_, size_t size_)
{
    if (size_ == 0)
        return;
    ssl_assert (EVP_DigestUpdate (_ctx, data_, size_));
}

void s3wire::evp_digest_t::final (unsigned char *out_, size_t size_)
{
    unsigned int len = 0;
    ssl_assert (EVP_DigestFinal_ex (_ctx, out_, &len));
    s3wire_assert (len == size_);
}

s3wire::sha1_t::sha1_t () : _digest (EVP_sha1 ())
{
}

void s3wire::sha1_t::append (const unsigned char *data_, size_t size_)
{
    _digest.update (data_, size_);
}

void s3wire::sha1_t::finish (unsigned char *out_)
{
    _digest.final (out_, output_size);
}

s3wire::sha256_t::sha256_t () : _digest (EVP_sha256 ())
{
}

void s3wire::sha256_t::append (const unsigned char *data_, size_t size_)
{
    _digest.update (data_, size_);
}

void s3wire::sha256_t::finish (unsigned char *out_)
{
    _digest.final (out_, output_size);
}

s3wire::md5_t::md5_t () : _digest (EVP_md5 ())
{
}

void s3wire::md5_t::append (const unsigned char *data_, size_t size_)
{
    _digest.update (data_, size_);
}

void s3wire::md5_t::finish (unsigned char *out_)
{
    _digest.final (out_, output_size);
}
