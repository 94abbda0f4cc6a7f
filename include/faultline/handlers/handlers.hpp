#pragma once

#include <spdlog/logger.h>
#include <faultline/dispatch/registry.hpp>
#include <faultline/schema/encoding/error_encoder.hpp>
#include <faultline/schema/error.hpp>
#include <faultline/schema/request.hpp>
#include <memory>

namespace faultline::handlers {

/// Safe fallback for any error: 500 naming the error type. Never throws.
schema::outcome_t default_handler(const schema::fault_t& error,
                                  const schema::request_t& request);

/// Returns the response embedded in the error.
schema::outcome_t http_response_handler(const schema::fault_t& error,
                                        const schema::request_t& request);

/// 400 plain-text answer for a body that could not be decoded.
schema::outcome_t request_parsing_handler(const schema::fault_t& error,
                                          const schema::request_t& request);

/// Handler answering coercion failures with `status` and the encoded failure.
///
/// An error without a coercion payload becomes a new, untagged error so the
/// host pipeline dispatches it again and the default handler answers.
dispatch::handler_t create_coercion_handler(
    schema::status_t status,
    schema::encoding::coercion_encoder_t encoder =
        schema::encoding::encode_coercion_failure);

/// Wrap that logs `<timestamp> <method> "<uri>" => <message>` and the trace
/// to `logger`, then calls the resolved handler once.
///
/// A null `logger` means the spdlog default logger at call time.
dispatch::wrap_t make_log_to_console_wrap(
    std::shared_ptr<spdlog::logger> logger = nullptr);

/// `default`, embedded response, decode failure, request coercion (400) and
/// response coercion (500).
dispatch::handler_map_t default_handlers();

}  // namespace faultline::handlers
