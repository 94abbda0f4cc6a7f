#pragma once
#include <faultline/schema/primitives.hpp>
#include <faultline/schema/response.hpp>
#include <faultline/schema/tag.hpp>
#include <faultline/schema/type.hpp>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace faultline::schema {

/// Payload of a request body that could not be decoded.
struct decode_failure_t final {
  std::string format;
};

/// Payload of a request or response that failed schema coercion.
struct coercion_failure_t final {
  std::string coercion;
  std::string in;
  std::string value;
  std::vector<std::string> problems;
};

using error_data_t = std::variant<std::monostate,
                                  decode_failure_t,
                                  coercion_failure_t,
                                  fields_t>;

/// Application error as seen by the dispatch engine.
///
/// `trace` holds the messages of nested causes, outermost first.
struct fault_t final {
  type_t type;
  std::string message;
  std::vector<std::string> trace;
  std::optional<tag_t> tag;
  error_data_t data;
  std::optional<response_t> response;
};

/// Result of a handler: a terminal response or an error to re-dispatch.
using outcome_t = std::variant<response_t, fault_t>;

/// Exception carrying a tag and structured data, for code that throws.
class tagged_exception : public std::runtime_error {
 public:
  tagged_exception(const std::string& message,
                   tag_t tag,
                   error_data_t data = {},
                   std::optional<response_t> response = std::nullopt);

  const tag_t& tag() const noexcept { return tag_; }
  const error_data_t& data() const noexcept { return data_; }
  const std::optional<response_t>& response() const noexcept {
    return response_;
  }

 private:
  tag_t tag_;
  error_data_t data_;
  std::optional<response_t> response_;
};

/// Build an error value from a caught exception.
///
/// The type is the dynamic type of the exception. Tag, data and response are
/// taken from a `tagged_exception`; nested exceptions fill the trace. A value
/// not derived from `std::exception` becomes an error of `unknown_type`.
fault_t make_error(const std::exception_ptr& ex);

/// Build an untagged error of type `T` without throwing.
template <typename T>
fault_t make_error(const std::string& message) {
  return fault_t{.type = type_of<T>(), .message = message};
}

/// Build a tagged error value of type `tagged_exception` without throwing.
fault_t make_tagged_error(const std::string& message,
                          tag_t tag,
                          error_data_t data = {});

bool is_error(const outcome_t& outcome);
bool is_response(const outcome_t& outcome);

}  // namespace faultline::schema
