#pragma once

#include <faultline/schema/error.hpp>
#include <faultline/schema/request.hpp>
#include <faultline/schema/response.hpp>
#include <functional>
#include <optional>
#include <string>

namespace faultline::interceptor {

/// State threaded through a pipeline run. After an error stage at most one of
/// `response` and `error` is set.
struct context_t final {
  schema::request_t request;
  std::optional<schema::response_t> response;
  std::optional<schema::fault_t> error;
  /// Set by an error stage that swapped `error` for a new one produced while
  /// handling it. The chain re-runs that stage while this is set.
  bool replaced{false};
};

using stage_t = std::function<context_t(context_t)>;

/// A named unit of the host pipeline. Any stage may be empty.
struct interceptor_t final {
  std::string name;
  stage_t enter;
  stage_t leave;
  stage_t error;
};

}  // namespace faultline::interceptor
