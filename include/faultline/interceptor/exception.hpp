#pragma once

#include <faultline/dispatch/engine.hpp>
#include <faultline/dispatch/registry.hpp>
#include <faultline/hierarchy/tag_hierarchy.hpp>
#include <faultline/hierarchy/type_hierarchy.hpp>
#include <faultline/interceptor/interceptor.hpp>
#include <memory>
#include <string_view>

namespace faultline::interceptor {

inline constexpr auto exception_interceptor_name =
    std::string_view{"faultline.interceptor/exception"};

/// Everything an exception interceptor dispatches against.
///
/// Built once when the pipeline is configured and shared read-only by every
/// request afterwards.
struct configuration final {
  configuration(dispatch::handler_registry registry,
                std::shared_ptr<const hierarchy::tag_hierarchy> tags,
                std::shared_ptr<const hierarchy::type_hierarchy> types);
  configuration(const configuration&) = delete;
  configuration& operator=(const configuration&) = delete;

  dispatch::handler_registry registry;
  std::shared_ptr<const hierarchy::tag_hierarchy> tags;
  std::shared_ptr<const hierarchy::type_hierarchy> types;
  dispatch::engine engine;
};

/// Configuration with the default handlers, an empty tag hierarchy and the
/// standard exception types.
std::shared_ptr<const configuration> default_configuration();

/// Dispatch the context's error and write back the outcome.
///
/// The returned context holds either `response` or a replacement `error`,
/// never both. A replacement error also sets `replaced`. A context without an
/// error is returned unchanged.
context_t on_error(const configuration& config, context_t context);

/// Interceptor whose error stage runs `on_error` against `config`.
interceptor_t exception_interceptor(
    std::shared_ptr<const configuration> config);

/// Same as above with `default_configuration()`.
interceptor_t exception_interceptor();

}  // namespace faultline::interceptor
