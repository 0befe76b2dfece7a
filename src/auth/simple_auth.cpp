/* SPDX-License-Identifier: MPL-2.0 */

#include "auth/simple_auth.hpp"
#include "utils/err.hpp"

s3wire::simple_auth_t::simple_auth_t ()
{
}

s3wire::simple_auth_t::simple_auth_t (const std::string &access_key_,
                                      const secret_key_t &secret_key_)
{
    _keys.insert (keys_t::value_type (access_key_, secret_key_));
}

bool s3wire::simple_auth_t::register_key (const std::string &access_key_,
                                          const secret_key_t &secret_key_)
{
    const std::pair<keys_t::iterator, bool> res =
      _keys.insert (keys_t::value_type (access_key_, secret_key_));
    if (res.second)
        return false;
    res.first->second = secret_key_;
    return true;
}

const s3wire::secret_key_t *
s3wire::simple_auth_t::lookup (const std::string &access_key_) const
{
    const keys_t::const_iterator it = _keys.find (access_key_);
    if (it == _keys.end ())
        return NULL;
    return &it->second;
}

int s3wire::simple_auth_t::get_secret_key (const std::string &access_key_,
                                           secret_key_t &out_,
                                           s3_error_t *error_) const
{
    const secret_key_t *secret = lookup (access_key_);
    if (!secret) {
        if (error_)
            *error_ = s3_error_t (s3_error_not_signed_up,
                                  "Your account is not signed up");
        errno = ENOENT;
        return -1;
    }
    out_ = *secret;
    return 0;
}
