/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __S3WIRE_REGION_HPP_INCLUDED__
#define __S3WIRE_REGION_HPP_INCLUDED__

#include <string>

namespace s3wire
{
//  Validated S3 region name: non-empty, lowercase letters, digits and
//  hyphens only.
class region_t
{
  public:
    //  Stores text_ in out_ if it is a valid region name. Otherwise
    //  returns -1 with errno EINVAL and leaves out_ unchanged.
    static int parse (const std::string &text_, region_t &out_);

    static bool is_valid (const std::string &text_);

    region_t ();

    const std::string &str () const { return _name; }

    bool operator== (const region_t &other_) const
    {
        return _name == other_._name;
    }
    bool operator!= (const region_t &other_) const
    {
        return _name != other_._name;
    }

  private:
    std::string _name;
};
}

#endif
