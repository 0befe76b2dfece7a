/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __S3WIRE_CHECKSUM_HPP_INCLUDED__
#define __S3WIRE_CHECKSUM_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>

#include <array>

#include "utils/err.hpp"
#include "utils/macros.hpp"

typedef struct evp_md_ctx_st EVP_MD_CTX;
typedef struct evp_md_st EVP_MD;

namespace s3wire
{
//  Helper base class for checksum algorithms. It implements the common
//  contract: update() any number of times, then finalize() exactly once.
//  Derived classes provide append() and finish() for the actual algorithm.
//  Updating or finalizing a finalized instance is a programming error.

template <typename T, size_t N> class checksum_base_t
{
  public:
    enum
    {
        output_size = N
    };
    typedef std::array<unsigned char, N> output_t;

    void update (const void *data_, size_t size_)
    {
        s3wire_assert (!_finalized);
        s3wire_assert (data_ != NULL || size_ == 0);
        static_cast<T *> (this)->append (
          static_cast<const unsigned char *> (data_), size_);
    }

    output_t finalize ()
    {
        s3wire_assert (!_finalized);
        _finalized = true;
        output_t out;
        static_cast<T *> (this)->finish (out.data ());
        return out;
    }

    bool finalized () const { return _finalized; }

    //  One-shot convenience, equivalent to new + update + finalize.
    static output_t checksum (const void *data_, size_t size_)
    {
        T hasher;
        hasher.update (data_, size_);
        return hasher.finalize ();
    }

  protected:
    checksum_base_t () : _finalized (false) {}
    ~checksum_base_t () {}

  private:
    bool _finalized;
};

//  CRC-32/ISO-HDLC, the zlib/Ethernet polynomial. Also used internally for
//  event stream framing.
class crc32_t S3WIRE_FINAL : public checksum_base_t<crc32_t, 4>
{
  public:
    crc32_t ();

    //  Raw CRC value of the buffer, for framing.
    static uint32_t checksum_u32 (const void *data_, size_t size_);

  private:
    friend class checksum_base_t<crc32_t, 4>;
    void append (const unsigned char *data_, size_t size_);
    void finish (unsigned char *out_);

    unsigned long _crc;
};

//  CRC-32C (Castagnoli, iSCSI).
class crc32c_t S3WIRE_FINAL : public checksum_base_t<crc32c_t, 4>
{
  public:
    crc32c_t ();

  private:
    friend class checksum_base_t<crc32c_t, 4>;
    void append (const unsigned char *data_, size_t size_);
    void finish (unsigned char *out_);

    uint32_t _crc;
};

//  CRC-64/NVME.
class crc64nvme_t S3WIRE_FINAL : public checksum_base_t<crc64nvme_t, 8>
{
  public:
    crc64nvme_t ();

  private:
    friend class checksum_base_t<crc64nvme_t, 8>;
    void append (const unsigned char *data_, size_t size_);
    void finish (unsigned char *out_);

    uint64_t _crc;
};

//  Owns an OpenSSL message digest context.
class evp_digest_t
{
  public:
    explicit evp_digest_t (const EVP_MD *md_);
    ~evp_digest_t ();

    void update (const unsigned char *data_, size_t size_);
    void final (unsigned char *out_, size_t size_);

  private:
    EVP_MD_CTX *_ctx;

    S3WIRE_NON_COPYABLE_NOR_MOVABLE (evp_digest_t)
};

class sha1_t S3WIRE_FINAL : public checksum_base_t<sha1_t, 20>
{
  public:
    sha1_t ();

  private:
    friend class checksum_base_t<sha1_t, 20>;
    void append (const unsigned char *data_, size_t size_);
    void finish (unsigned char *out_);

    evp_digest_t _digest;
};

class sha256_t S3WIRE_FINAL : public checksum_base_t<sha256_t, 32>
{
  public:
    sha256_t ();

  private:
    friend class checksum_base_t<sha256_t, 32>;
    void append (const unsigned char *data_, size_t size_);
    void finish (unsigned char *out_);

    evp_digest_t _digest;
};

//  MD5 is not offered as a content checksum; it computes entity tags.
class md5_t S3WIRE_FINAL : public checksum_base_t<md5_t, 16>
{
  public:
    md5_t ();

  private:
    friend class checksum_base_t<md5_t, 16>;
    void append (const unsigned char *data_, size_t size_);
    void finish (unsigned char *out_);

    evp_digest_t _digest;
};
}

#endif
