/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __S3WIRE_CHECKSUM_HASHER_HPP_INCLUDED__
#define __S3WIRE_CHECKSUM_HASHER_HPP_INCLUDED__

#include <stddef.h>

#include <memory>
#include <string>

#include <boost/optional.hpp>

#include "crypto/checksum.hpp"
#include "utils/macros.hpp"

namespace s3wire
{
struct options_t;

//  Content checksums as advertised in x-amz-checksum-* headers. Each field
//  holds the base64 digest, or nothing when the algorithm was not active.
struct checksum_t
{
    boost::optional<std::string> checksum_crc32;
    boost::optional<std::string> checksum_crc32c;
    boost::optional<std::string> checksum_sha1;
    boost::optional<std::string> checksum_sha256;
    boost::optional<std::string> checksum_crc64nvme;

    //  True if every field present in expected_ is present here with the
    //  same value.
    bool matches (const checksum_t &expected_) const;

    //  Calls fn_ (header_name, value) for each present field.
    template <typename F> void for_each_header (F fn_) const
    {
        if (checksum_crc32)
            fn_ ("x-amz-checksum-crc32", *checksum_crc32);
        if (checksum_crc32c)
            fn_ ("x-amz-checksum-crc32c", *checksum_crc32c);
        if (checksum_sha1)
            fn_ ("x-amz-checksum-sha1", *checksum_sha1);
        if (checksum_sha256)
            fn_ ("x-amz-checksum-sha256", *checksum_sha256);
        if (checksum_crc64nvme)
            fn_ ("x-amz-checksum-crc64nvme", *checksum_crc64nvme);
    }
};

//  Maps an x-amz-checksum-algorithm value (case-insensitive) to its
//  S3WIRE_CHECKSUM_* bit. Returns 0 for unknown names.
int checksum_algorithm_from_name (const char *name_, size_t len_);

//  Parses a comma-separated list of algorithm names into a bit set.
//  Returns -1 with errno EINVAL on an unknown name.
int parse_checksum_algorithms (const std::string &list_, int *algorithms_);

//  Feeds one byte stream to several checksum algorithms at once.
class checksum_hasher_t
{
  public:
    checksum_hasher_t ();

    //  algorithms_ is a set of S3WIRE_CHECKSUM_* bits.
    explicit checksum_hasher_t (int algorithms_);

    //  Activates options_.checksum_algorithms.
    explicit checksum_hasher_t (const options_t &options_);
    ~checksum_hasher_t ();

    //  Activates more algorithms. Must precede the first update.
    void enable (int algorithms_);

    int algorithms () const;

    //  Feeds data to every active algorithm; inactive ones are skipped.
    void update (const void *data_, size_t size_);

    //  Finalizes every active algorithm. The hasher cannot be used
    //  afterwards.
    checksum_t finalize ();

  private:
    std::unique_ptr<crc32_t> _crc32;
    std::unique_ptr<crc32c_t> _crc32c;
    std::unique_ptr<sha1_t> _sha1;
    std::unique_ptr<sha256_t> _sha256;
    std::unique_ptr<crc64nvme_t> _crc64nvme;

    bool _updated;
    bool _finalized;

    S3WIRE_MOVE_ONLY (checksum_hasher_t)
  public:
    checksum_hasher_t (checksum_hasher_t &&) S3WIRE_DEFAULT
    checksum_hasher_t &operator= (checksum_hasher_t &&) S3WIRE_DEFAULT
};
}

#endif
