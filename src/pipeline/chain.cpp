#include <spdlog/spdlog.h>
#include <faultline/common/errors.hpp>
#include <faultline/pipeline/chain.hpp>
#include <stdexcept>
#include <utility>

using faultline::interceptor::context_t;
using faultline::interceptor::interceptor_t;
using faultline::interceptor::stage_t;

namespace faultline::pipeline {

namespace {

// Runs one stage. Anything thrown other than a core error lands in the
// context.
context_t run_stage(const stage_t& stage, const context_t& context) {
  try {
    return stage(context);
  } catch (const common::core_error&) {
    throw;
  } catch (...) {
    auto failed = context;
    failed.response.reset();
    failed.error = schema::make_error(std::current_exception());
    return failed;
  }
}

}  // namespace

chain::chain(std::vector<interceptor_t> interceptors,
             const std::size_t redispatch_limit)
    : interceptors_(std::move(interceptors)),
      redispatch_limit_(redispatch_limit) {}

context_t chain::unwind_error(const interceptor_t& unit,
                              context_t context) const {
  if (!unit.error) {
    return context;
  }
  context.replaced = false;
  context = run_stage(unit.error, context);
  for (auto attempt = std::size_t{0};
       context.error && context.replaced && attempt < redispatch_limit_;
       ++attempt) {
    spdlog::debug("Re-dispatching '{}' through '{}'", context.error->type.name,
                  unit.name);
    context.replaced = false;
    context = run_stage(unit.error, context);
  }
  context.replaced = false;
  return context;
}

schema::outcome_t chain::execute(const schema::request_t& request,
                                 const endpoint_t& endpoint) const {
  auto context = context_t{.request = request};
  auto entered = std::size_t{0};

  for (const auto& unit : interceptors_) {
    ++entered;
    if (unit.enter) {
      context = run_stage(unit.enter, context);
    }
    if (context.error || context.response) {
      break;
    }
  }

  if (!context.error && !context.response) {
    try {
      context.response = endpoint(context.request);
    } catch (const common::core_error&) {
      throw;
    } catch (...) {
      context.error = schema::make_error(std::current_exception());
    }
  }

  while (entered > 0) {
    const auto& unit = interceptors_[--entered];
    if (context.error) {
      context = unwind_error(unit, std::move(context));
    } else if (unit.leave) {
      context = run_stage(unit.leave, context);
    }
  }

  if (context.error) {
    spdlog::warn("Unhandled '{}' for {} {}: {}", context.error->type.name,
                 context.request.method, context.request.uri,
                 context.error->message);
    return std::move(*context.error);
  }
  if (!context.response) {
    return schema::make_error<std::logic_error>(
        "pipeline produced no response");
  }
  return std::move(*context.response);
}

}  // namespace faultline::pipeline
