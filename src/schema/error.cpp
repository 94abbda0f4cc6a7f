#include <faultline/schema/error.hpp>
#include <utility>

namespace faultline::schema {

namespace {

// Appends the messages of the causes nested inside `ex`, outermost first.
void collect_nested(const std::exception& ex, std::vector<std::string>& trace) {
  try {
    std::rethrow_if_nested(ex);
  } catch (const std::exception& nested) {
    trace.push_back(type_of(nested).name + ": " + nested.what());
    collect_nested(nested, trace);
  } catch (...) {
    trace.push_back(unknown_type.name);
  }
}

}  // namespace

tagged_exception::tagged_exception(const std::string& message,
                                   tag_t tag,
                                   error_data_t data,
                                   std::optional<response_t> response)
    : std::runtime_error(message),
      tag_(std::move(tag)),
      data_(std::move(data)),
      response_(std::move(response)) {}

fault_t make_error(const std::exception_ptr& ex) {
  if (!ex) {
    return make_error<std::exception>("no exception");
  }
  auto error = fault_t{};
  try {
    std::rethrow_exception(ex);
  } catch (const tagged_exception& tagged) {
    error.type = type_of(tagged);
    error.message = tagged.what();
    error.tag = tagged.tag();
    error.data = tagged.data();
    error.response = tagged.response();
    collect_nested(tagged, error.trace);
  } catch (const std::exception& other) {
    error.type = type_of(other);
    error.message = other.what();
    collect_nested(other, error.trace);
  } catch (...) {
    error.type = unknown_type;
    error.message = "unknown exception";
  }
  return error;
}

fault_t make_tagged_error(const std::string& message,
                          tag_t tag,
                          error_data_t data) {
  return fault_t{.type = type_of<tagged_exception>(),
                 .message = message,
                 .tag = std::move(tag),
                 .data = std::move(data)};
}

bool is_error(const outcome_t& outcome) {
  return std::holds_alternative<fault_t>(outcome);
}

bool is_response(const outcome_t& outcome) {
  return std::holds_alternative<response_t>(outcome);
}

}  // namespace faultline::schema
