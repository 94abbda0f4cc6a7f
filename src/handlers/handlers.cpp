#include <spdlog/fmt/chrono.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <ctime>
#include <faultline/handlers/handlers.hpp>
#include <faultline/schema/tags.hpp>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

using namespace faultline::schema;

namespace faultline::handlers {

namespace {

// Raised as a value when a handler cannot answer the error it was given.
class unanswerable_error final : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

fault_t unanswerable(const fault_t& error, const std::string_view missing) {
  auto next = make_error<unanswerable_error>(
      fmt::format("{} error carries no {}",
                  error.tag ? error.tag->name : error.type.name, missing));
  next.trace.push_back(error.type.name + ": " + error.message);
  next.trace.insert(std::end(next.trace), std::begin(error.trace),
                    std::end(error.trace));
  return next;
}

std::string timestamp() {
  const auto now = std::chrono::system_clock::now();
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          now.time_since_epoch())
                          .count() %
                      1000;
  return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03}Z",
                     fmt::gmtime(std::chrono::system_clock::to_time_t(now)),
                     millis);
}

}  // namespace

outcome_t default_handler(const fault_t& error, const request_t&) {
  return response_t{
      .status = 500,
      .body = fields_t{{"type", "exception"}, {"class", error.type.name}}};
}

outcome_t http_response_handler(const fault_t& error, const request_t&) {
  if (!error.response) {
    return unanswerable(error, "response");
  }
  return *error.response;
}

outcome_t request_parsing_handler(const fault_t& error, const request_t&) {
  const auto* failure = std::get_if<decode_failure_t>(&error.data);
  if (failure == nullptr) {
    return unanswerable(error, "decode format");
  }
  return response_t{.status = 400,
                    .headers = {{"Content-Type", "text/plain"}},
                    .body = "Malformed " + quote(failure->format) +
                            " request."};
}

dispatch::handler_t create_coercion_handler(
    const status_t status,
    schema::encoding::coercion_encoder_t encoder) {
  return [status, encoder = std::move(encoder)](
             const fault_t& error, const request_t&) -> outcome_t {
    const auto* failure = std::get_if<coercion_failure_t>(&error.data);
    if (failure == nullptr) {
      return unanswerable(error, "coercion failure");
    }
    return response_t{.status = status, .body = encoder(*failure)};
  };
}

dispatch::wrap_t make_log_to_console_wrap(
    std::shared_ptr<spdlog::logger> logger) {
  return [logger = std::move(logger)](const dispatch::handler_t& handler,
                                      const fault_t& error,
                                      const request_t& request) {
    auto sink = logger ? logger : spdlog::default_logger();
    sink->error("{} {} {} => {}", timestamp(), request.method,
                quote(request.uri), error.message);
    for (const auto& frame : error.trace) {
      sink->error("  caused by {}", frame);
    }
    return handler(error, request);
  };
}

dispatch::handler_map_t default_handlers() {
  return dispatch::handler_map_t{
      {dispatch::default_key, default_handler},
      {tags::response, http_response_handler},
      {tags::decode_failure, request_parsing_handler},
      {tags::request_coercion, create_coercion_handler(400)},
      {tags::response_coercion, create_coercion_handler(500)},
  };
}

}  // namespace faultline::handlers
