/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __S3WIRE_BASE64_HPP_INCLUDED__
#define __S3WIRE_BASE64_HPP_INCLUDED__

#include <stddef.h>

#include <string>
#include <vector>

namespace s3wire
{
//  Standard alphabet, padded, no line breaks.
std::string base64_encode (const unsigned char *data_, size_t size_);

//  Decodes padded standard base64. Returns 0 on success, -1 with errno set
//  to EINVAL if the input is not well-formed.
int base64_decode (const std::string &text_, std::vector<unsigned char> &out_);
}

#endif
