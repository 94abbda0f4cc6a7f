#pragma once

#include <faultline/interceptor/interceptor.hpp>
#include <faultline/schema/error.hpp>
#include <faultline/schema/request.hpp>
#include <faultline/schema/response.hpp>
#include <cstddef>
#include <functional>
#include <vector>

namespace faultline::pipeline {

/// Terminal request handler at the end of the chain.
using endpoint_t =
    std::function<schema::response_t(const schema::request_t&)>;

/// Executes interceptors around an endpoint.
///
/// Enter stages run first to last, then the endpoint, then leave stages last
/// to first. Once an error is raised (thrown or left in the context) the
/// chain unwinds through error stages instead, starting with the interceptor
/// that failed. An error stage that answers with a response resumes the
/// leave stages of the interceptors outside it.
///
/// When an error stage replaces the error with a new one (and marks the
/// context `replaced`), that same stage is run again on the new error, at
/// most `redispatch_limit` times, before the error moves outward. A stage
/// that passes the error through runs once.
class chain final {
 public:
  explicit chain(std::vector<interceptor::interceptor_t> interceptors,
                 std::size_t redispatch_limit = 2);

  /// Run `request` through the chain. Returns the final response or the
  /// error nothing answered.
  schema::outcome_t execute(const schema::request_t& request,
                            const endpoint_t& endpoint) const;

  const std::vector<interceptor::interceptor_t>& interceptors() const {
    return interceptors_;
  }

 private:
  interceptor::context_t unwind_error(const interceptor::interceptor_t& unit,
                                      interceptor::context_t context) const;

  std::vector<interceptor::interceptor_t> interceptors_;
  std::size_t redispatch_limit_{2};
};

}  // namespace faultline::pipeline
