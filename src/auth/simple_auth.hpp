/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __S3WIRE_SIMPLE_AUTH_HPP_INCLUDED__
#define __S3WIRE_SIMPLE_AUTH_HPP_INCLUDED__

#include <map>
#include <string>

#include "auth/secret_key.hpp"
#include "core/s3_error.hpp"

namespace s3wire
{
//  In-memory table of access key to secret key.
class simple_auth_t
{
  public:
    simple_auth_t ();
    simple_auth_t (const std::string &access_key_,
                   const secret_key_t &secret_key_);

    //  Returns true if an existing entry was replaced.
    bool register_key (const std::string &access_key_,
                       const secret_key_t &secret_key_);

    //  Returns NULL for unknown access keys.
    const secret_key_t *lookup (const std::string &access_key_) const;

    //  Copies the secret key into out_. For unknown access keys returns -1
    //  with errno ENOENT and stores a NotSignedUp error in *error_ if given.
    int get_secret_key (const std::string &access_key_,
                        secret_key_t &out_,
                        s3_error_t *error_ = NULL) const;

    size_t size () const { return _keys.size (); }

  private:
    typedef std::map<std::string, secret_key_t> keys_t;
    keys_t _keys;
};
}

#endif
