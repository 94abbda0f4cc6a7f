#pragma once
#include <faultline/schema/tag.hpp>

namespace faultline::schema::tags {

/// Error carries a ready-made response to return verbatim.
inline const auto response = tag_t{"faultline.http/response"};

/// Request body could not be decoded in its declared format.
inline const auto decode_failure = tag_t{"faultline.format/decode"};

inline const auto request_coercion =
    tag_t{"faultline.coercion/request-coercion"};
inline const auto response_coercion =
    tag_t{"faultline.coercion/response-coercion"};

}  // namespace faultline::schema::tags
