/* SPDX-License-Identifier: MPL-2.0 */

#include "core/s3_error.hpp"
#include "utils/err.hpp"

namespace
{
const char *const s3_error_codes[s3wire::s3_error_code_count] = {
  NULL,
  "AccessDenied",
  "BadDigest",
  "CSVParsingError",
  "EntityTooLarge",
  "ExpiredToken",
  "ExpressionTooLong",
  "InternalError",
  "InvalidArgument",
  "InvalidBucketName",
  "InvalidDigest",
  "InvalidExpressionType",
  "InvalidRequest",
  "InvalidTextEncoding",
  "JSONParsingError",
  "MalformedXML",
  "MethodNotAllowed",
  "MissingContentLength",
  "NoSuchBucket",
  "NoSuchKey",
  "NotImplemented",
  "NotSignedUp",
  "OverflowError",
  "ParseUnexpectedToken",
  "PreconditionFailed",
  "ServiceUnavailable",
  "SignatureDoesNotMatch",
  "SlowDown",
  "UnsupportedSyntax",
};
}

const char *s3wire::s3_error_code_str (s3_error_code_t code_)
{
    if (code_ <= s3_error_custom || code_ >= s3_error_code_count)
        return NULL;
    return s3_error_codes[code_];
}

s3wire::s3_error_t::s3_error_t (s3_error_code_t code_) : _code (code_)
{
    s3wire_assert (s3_error_code_str (code_) != NULL);
}

s3wire::s3_error_t::s3_error_t (s3_error_code_t code_,
                                const std::string &message_) :
    _code (code_),
    _message (message_)
{
    s3wire_assert (s3_error_code_str (code_) != NULL);
}

s3wire::s3_error_t s3wire::s3_error_t::custom (const std::string &code_)
{
    s3_error_t error (s3_error_internal_error);
    error._code = s3_error_custom;
    error._custom_code = code_;
    return error;
}

s3wire::s3_error_t s3wire::s3_error_t::custom (const std::string &code_,
                                               const std::string &message_)
{
    s3_error_t error = custom (code_);
    error._message = message_;
    return error;
}

std::string s3wire::s3_error_t::code_str () const
{
    if (_code == s3_error_custom)
        return _custom_code;
    return s3_error_code_str (_code);
}
