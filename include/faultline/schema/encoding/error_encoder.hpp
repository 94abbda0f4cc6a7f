#pragma once
#include <faultline/schema/error.hpp>
#include <faultline/schema/primitives.hpp>
#include <functional>

namespace faultline::schema::encoding {

/// Turns a coercion failure into a response body.
using coercion_encoder_t = std::function<body_t(const coercion_failure_t&)>;

/// Structured encoding with `coercion`, `in`, `value` and `problems` fields.
body_t encode_coercion_failure(const coercion_failure_t& failure);

}  // namespace faultline::schema::encoding
