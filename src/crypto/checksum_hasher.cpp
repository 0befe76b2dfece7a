/* SPDX-License-Identifier: MPL-2.0 */

#include "crypto/checksum_hasher.hpp"
#include "crypto/base64.hpp"
#include "core/options.hpp"
#include "utils/err.hpp"

#include <new>

#include <string.h>
#include <strings.h>

namespace
{
struct algorithm_name_t
{
    const char *name;
    int bit;
};

const algorithm_name_t algorithm_names[] = {
  {"CRC32", S3WIRE_CHECKSUM_CRC32},
  {"CRC32C", S3WIRE_CHECKSUM_CRC32C},
  {"SHA1", S3WIRE_CHECKSUM_SHA1},
  {"SHA256", S3WIRE_CHECKSUM_SHA256},
  {"CRC64NVME", S3WIRE_CHECKSUM_CRC64NVME},
};

template <typename T> std::string encode_digest (T &hasher_)
{
    const typename T::output_t sum = hasher_.finalize ();
    return s3wire::base64_encode (sum.data (), sum.size ());
}

bool field_matches (const boost::optional<std::string> &actual_,
                    const boost::optional<std::string> &expected_)
{
    if (!expected_)
        return true;
    return actual_ && *actual_ == *expected_;
}
}

bool s3wire::checksum_t::matches (const checksum_t &expected_) const
{
    return field_matches (checksum_crc32, expected_.checksum_crc32)
           && field_matches (checksum_crc32c, expected_.checksum_crc32c)
           && field_matches (checksum_sha1, expected_.checksum_sha1)
           && field_matches (checksum_sha256, expected_.checksum_sha256)
           && field_matches (checksum_crc64nvme,
                             expected_.checksum_crc64nvme);
}

int s3wire::checksum_algorithm_from_name (const char *name_, size_t len_)
{
    const size_t count = sizeof algorithm_names / sizeof algorithm_names[0];
    for (size_t i = 0; i < count; ++i) {
        const char *candidate = algorithm_names[i].name;
        if (strlen (candidate) == len_
            && strncasecmp (candidate, name_, len_) == 0)
            return algorithm_names[i].bit;
    }
    return 0;
}

int s3wire::parse_checksum_algorithms (const std::string &list_,
                                       int *algorithms_)
{
    int result = 0;
    size_t pos = 0;
    while (pos <= list_.size ()) {
        size_t end = list_.find (',', pos);
        if (end == std::string::npos)
            end = list_.size ();

        //  Trim surrounding blanks.
        size_t first = pos;
        size_t last = end;
        while (first < last && (list_[first] == ' ' || list_[first] == '\t'))
            ++first;
        while (last > first && (list_[last - 1] == ' ' || list_[last - 1] == '\t'))
            --last;

        if (last > first) {
            const int bit =
              checksum_algorithm_from_name (list_.data () + first, last - first);
            if (bit == 0) {
                errno = EINVAL;
                return -1;
            }
            result |= bit;
        }
        pos = end + 1;
    }
    *algorithms_ = result;
    return 0;
}

s3wire::checksum_hasher_t::checksum_hasher_t () :
    _updated (false),
    _finalized (false)
{
}

s3wire::checksum_hasher_t::checksum_hasher_t (int algorithms_) :
    _updated (false),
    _finalized (false)
{
    enable (algorithms_);
}

s3wire::checksum_hasher_t::checksum_hasher_t (const options_t &options_) :
    _updated (false),
    _finalized (false)
{
    enable (options_.checksum_algorithms);
}

s3wire::checksum_hasher_t::~checksum_hasher_t ()
{
}

void s3wire::checksum_hasher_t::enable (int algorithms_)
{
    s3wire_assert (!_updated && !_finalized);
    s3wire_assert ((algorithms_ & ~S3WIRE_CHECKSUM_ALL) == 0);

    if ((algorithms_ & S3WIRE_CHECKSUM_CRC32) && !_crc32)
        _crc32.reset (new (std::nothrow) crc32_t);
    if ((algorithms_ & S3WIRE_CHECKSUM_CRC32C) && !_crc32c)
        _crc32c.reset (new (std::nothrow) crc32c_t);
    if ((algorithms_ & S3WIRE_CHECKSUM_SHA1) && !_sha1)
        _sha1.reset (new (std::nothrow) sha1_t);
    if ((algorithms_ & S3WIRE_CHECKSUM_SHA256) && !_sha256)
        _sha256.reset (new (std::nothrow) sha256_t);
    if ((algorithms_ & S3WIRE_CHECKSUM_CRC64NVME) && !_crc64nvme)
        _crc64nvme.reset (new (std::nothrow) crc64nvme_t);

    alloc_assert (!(algorithms_ & S3WIRE_CHECKSUM_CRC32) || _crc32);
    alloc_assert (!(algorithms_ & S3WIRE_CHECKSUM_CRC32C) || _crc32c);
    alloc_assert (!(algorithms_ & S3WIRE_CHECKSUM_SHA1) || _sha1);
    alloc_assert (!(algorithms_ & S3WIRE_CHECKSUM_SHA256) || _sha256);
    alloc_assert (!(algorithms_ & S3WIRE_CHECKSUM_CRC64NVME) || _crc64nvme);
}

int s3wire::checksum_hasher_t::algorithms () const
{
    int result = 0;
    if (_crc32)
        result |= S3WIRE_CHECKSUM_CRC32;
    if (_crc32c)
        result |= S3WIRE_CHECKSUM_CRC32C;
    if (_sha1)
        result |= S3WIRE_CHECKSUM_SHA1;
    if (_sha256)
        result |= S3WIRE_CHECKSUM_SHA256;
    if (_crc64nvme)
        result |= S3WIRE_CHECKSUM_CRC64NVME;
    return result;
}

void s3wire::checksum_hasher_t::update (const void *data_, size_t size_)
{
    s3wire_assert (!_finalized);
    _updated = true;

    if (_crc32)
        _crc32->update (data_, size_);
    if (_crc32c)
        _crc32c->update (data_, size_);
    if (_sha1)
        _sha1->update (data_, size_);
    if (_sha256)
        _sha256->update (data_, size_);
    if (_crc64nvme)
        _crc64nvme->update (data_, size_);
}

s3wire::checksum_t s3wire::checksum_hasher_t::finalize ()
{
    s3wire_assert (!_finalized);
    _finalized = true;

    checksum_t result;
    if (_crc32)
        result.checksum_crc32 = encode_digest (*_crc32);
    if (_crc32c)
        result.checksum_crc32c = encode_digest (*_crc32c);
    if (_sha1)
        result.checksum_sha1 = encode_digest (*_sha1);
    if (_sha256)
        result.checksum_sha256 = encode_digest (*_sha256);
    if (_crc64nvme)
        result.checksum_crc64nvme = encode_digest (*_crc64nvme);

    //  Release the digest contexts; nothing can be fed any more.
    _crc32.reset ();
    _crc32c.reset ();
    _sha1.reset ();
    _sha256.reset ();
    _crc64nvme.reset ();
    return result;
}
