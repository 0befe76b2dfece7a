/* SPDX-License-Identifier: MPL-2.0 */

#include "crypto/checksum.hpp"
#include "utils/wire.hpp"

#include <limits.h>
#include <zlib.h>

namespace
{
//  Lookup table for a reflected (LSB-first) CRC of width T.
template <typename T, T Poly> struct reflected_crc_table_t
{
    reflected_crc_table_t ()
    {
        for (unsigned int i = 0; i < 256; ++i) {
            T crc = static_cast<T> (i);
            for (int bit = 0; bit < 8; ++bit)
                crc = (crc & 1) ? static_cast<T> ((crc >> 1) ^ Poly)
                                : static_cast<T> (crc >> 1);
            entries[i] = crc;
        }
    }

    T entries[256];
};

template <typename T, T Poly>
T reflected_crc_update (T crc_, const unsigned char *data_, size_t size_)
{
    static const reflected_crc_table_t<T, Poly> table;
    for (size_t i = 0; i < size_; ++i)
        crc_ = table.entries[(crc_ ^ data_[i]) & 0xff] ^ (crc_ >> 8);
    return crc_;
}

const uint32_t crc32c_poly = 0x82F63B78u;
const uint64_t crc64nvme_poly = 0x9A6C9329AC4BC9B5ull;

unsigned long zlib_crc32 (unsigned long crc_,
                          const unsigned char *data_,
                          size_t size_)
{
    //  zlib takes a 32-bit length.
    while (size_ > 0) {
        const uInt chunk =
          size_ > UINT_MAX ? UINT_MAX : static_cast<uInt> (size_);
        crc_ = crc32 (crc_, data_, chunk);
        data_ += chunk;
        size_ -= chunk;
    }
    return crc_;
}
}

s3wire::crc32_t::crc32_t () : _crc (crc32 (0L, Z_NULL, 0))
{
}

uint32_t s3wire::crc32_t::checksum_u32 (const void *data_, size_t size_)
{
    s3wire_assert (data_ != NULL || size_ == 0);
    const unsigned long crc =
      zlib_crc32 (crc32 (0L, Z_NULL, 0),
                  static_cast<const unsigned char *> (data_), size_);
    return static_cast<uint32_t> (crc & 0xffffffffu);
}

void s3wire::crc32_t::append (const unsigned char *data_, size_t size_)
{
    _crc = zlib_crc32 (_crc, data_, size_);
}

void s3wire::crc32_t::finish (unsigned char *out_)
{
    put_uint32 (out_, static_cast<uint32_t> (_crc & 0xffffffffu));
}

s3wire::crc32c_t::crc32c_t () : _crc (0xFFFFFFFFu)
{
}

void s3wire::crc32c_t::append (const unsigned char *data_, size_t size_)
{
    _crc = reflected_crc_update<uint32_t, crc32c_poly> (_crc, data_, size_);
}

void s3wire::crc32c_t::finish (unsigned char *out_)
{
    put_uint32 (out_, _crc ^ 0xFFFFFFFFu);
}

s3wire::crc64nvme_t::crc64nvme_t () : _crc (0xFFFFFFFFFFFFFFFFull)
{
}

void s3wire::crc64nvme_t::append (const unsigned char *data_, size_t size_)
{
    _crc =
      reflected_crc_update<uint64_t, crc64nvme_poly> (_crc, data_, size_);
}

void s3wire::crc64nvme_t::finish (unsigned char *out_)
{
    put_uint64 (out_, _crc ^ 0xFFFFFFFFFFFFFFFFull);
}
