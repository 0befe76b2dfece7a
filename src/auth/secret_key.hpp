/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __S3WIRE_SECRET_KEY_HPP_INCLUDED__
#define __S3WIRE_SECRET_KEY_HPP_INCLUDED__

#include <stddef.h>

#include <string>

#include "utils/secure_allocator.hpp"

namespace s3wire
{
//  S3 secret access key. The bytes are wiped when the key is destroyed
//  and never printed.
class secret_key_t
{
  public:
    secret_key_t ();
    explicit secret_key_t (const std::string &secret_);
    secret_key_t (const char *data_, size_t size_);
    secret_key_t (const secret_key_t &other_);
    secret_key_t &operator= (const secret_key_t &other_);
    ~secret_key_t ();

    const secure_string_t &expose () const { return _secret; }
    bool empty () const { return _secret.empty (); }

    //  Constant-time comparison.
    bool equals (const secret_key_t &other_) const;
    bool equals (const char *data_, size_t size_) const;

    //  Text to print instead of the key.
    static const char *placeholder () { return "[SENSITIVE-SECRET-KEY]"; }

  private:
    void wipe ();

    secure_string_t _secret;
};
}

#endif
