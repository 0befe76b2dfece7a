/* SPDX-License-Identifier: MPL-2.0 */

#include "core/region.hpp"
#include "utils/err.hpp"

s3wire::region_t::region_t ()
{
}

bool s3wire::region_t::is_valid (const std::string &text_)
{
    if (text_.empty ())
        return false;
    for (std::string::const_iterator it = text_.begin (); it != text_.end ();
         ++it) {
        const char c = *it;
        if (!((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-'))
            return false;
    }
    return true;
}

int s3wire::region_t::parse (const std::string &text_, region_t &out_)
{
    if (!is_valid (text_)) {
        errno = EINVAL;
        return -1;
    }
    out_._name = text_;
    return 0;
}
