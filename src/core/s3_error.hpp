/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __S3WIRE_S3_ERROR_HPP_INCLUDED__
#define __S3WIRE_S3_ERROR_HPP_INCLUDED__

#include <string>

#include <boost/optional.hpp>

namespace s3wire
{
//  Well-known S3 error codes. s3_error_custom marks a code given as text.
enum s3_error_code_t
{
    s3_error_custom = 0,
    s3_error_access_denied,
    s3_error_bad_digest,
    s3_error_csv_parsing_error,
    s3_error_entity_too_large,
    s3_error_expired_token,
    s3_error_expression_too_long,
    s3_error_internal_error,
    s3_error_invalid_argument,
    s3_error_invalid_bucket_name,
    s3_error_invalid_digest,
    s3_error_invalid_expression_type,
    s3_error_invalid_request,
    s3_error_invalid_text_encoding,
    s3_error_json_parsing_error,
    s3_error_malformed_xml,
    s3_error_method_not_allowed,
    s3_error_missing_content_length,
    s3_error_no_such_bucket,
    s3_error_no_such_key,
    s3_error_not_implemented,
    s3_error_not_signed_up,
    s3_error_overflow_error,
    s3_error_parse_unexpected_token,
    s3_error_precondition_failed,
    s3_error_service_unavailable,
    s3_error_signature_does_not_match,
    s3_error_slow_down,
    s3_error_unsupported_syntax,
    s3_error_code_count
};

//  Wire text of a well-known code, or NULL for s3_error_custom and
//  out-of-range values.
const char *s3_error_code_str (s3_error_code_t code_);

//  Request-level S3 error: a code and an optional message.
class s3_error_t
{
  public:
    explicit s3_error_t (s3_error_code_t code_);
    s3_error_t (s3_error_code_t code_, const std::string &message_);

    //  Error carrying a code outside the well-known table.
    static s3_error_t custom (const std::string &code_);
    static s3_error_t custom (const std::string &code_,
                              const std::string &message_);

    s3_error_code_t code () const { return _code; }

    //  The code as sent on the wire.
    std::string code_str () const;

    const boost::optional<std::string> &message () const { return _message; }

  private:
    s3_error_code_t _code;
    std::string _custom_code;
    boost::optional<std::string> _message;
};
}

#endif
