/* SPDX-License-Identifier: MPL-2.0 */

#include "crypto/base64.hpp"
#include "utils/err.hpp"

#include <errno.h>
#include <limits.h>
#include <openssl/evp.h>

std::string s3wire::base64_encode (const unsigned char *data_, size_t size_)
{
    //  Inputs are digests, far below the int range EVP_EncodeBlock takes.
    s3wire_assert (size_ <= INT_MAX / 4 * 3);
    if (size_ == 0)
        return std::string ();

    std::string out;
    out.resize ((size_ + 2) / 3 * 4 + 1);
    const int len =
      EVP_EncodeBlock (reinterpret_cast<unsigned char *> (&out[0]), data_,
                       static_cast<int> (size_));
    s3wire_assert (len >= 0);
    out.resize (static_cast<size_t> (len));
    return out;
}

int s3wire::base64_decode (const std::string &text_,
                           std::vector<unsigned char> &out_)
{
    const size_t len = text_.size ();
    if (len % 4 != 0 || len > INT_MAX) {
        errno = EINVAL;
        return -1;
    }
    if (len == 0) {
        out_.clear ();
        return 0;
    }

    //  Padding may only occupy the last one or two positions.
    size_t padding = 0;
    if (text_[len - 1] == '=') {
        padding++;
        if (text_[len - 2] == '=')
            padding++;
    }
    if (text_.find ('=') < len - padding) {
        errno = EINVAL;
        return -1;
    }

    std::vector<unsigned char> buf (len / 4 * 3 + 1);
    const int rc = EVP_DecodeBlock (
      &buf[0], reinterpret_cast<const unsigned char *> (text_.data ()),
      static_cast<int> (len));
    if (rc < 0) {
        errno = EINVAL;
        return -1;
    }

    //  EVP_DecodeBlock keeps the zero bytes produced by padding.
    buf.resize (static_cast<size_t> (rc) - padding);
    out_.swap (buf);
    return 0;
}
