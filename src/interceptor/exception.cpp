#include <spdlog/spdlog.h>
#include <faultline/common/errors.hpp>
#include <faultline/handlers/handlers.hpp>
#include <faultline/interceptor/exception.hpp>
#include <utility>

namespace faultline::interceptor {

namespace {

template <typename T>
const T& required(const std::shared_ptr<const T>& value,
                  const std::string_view what) {
  if (!value) {
    throw common::configuration_error{"exception interceptor has no " +
                                      std::string{what}};
  }
  return *value;
}

}  // namespace

configuration::configuration(
    dispatch::handler_registry registry,
    std::shared_ptr<const hierarchy::tag_hierarchy> tags,
    std::shared_ptr<const hierarchy::type_hierarchy> types)
    : registry(std::move(registry)),
      tags(std::move(tags)),
      types(std::move(types)),
      engine(this->registry,
             required(this->tags, "tag hierarchy"),
             required(this->types, "type hierarchy")) {}

std::shared_ptr<const configuration> default_configuration() {
  return std::make_shared<const configuration>(
      dispatch::handler_registry{handlers::default_handlers()},
      std::make_shared<const hierarchy::tag_hierarchy>(),
      hierarchy::type_hierarchy::standard());
}

context_t on_error(const configuration& config, context_t context) {
  if (!context.error) {
    return context;
  }
  auto outcome = config.engine.dispatch(*context.error, context.request);
  std::visit(overloaded{[&](schema::response_t& response) {
                          context.response = std::move(response);
                          context.error.reset();
                          context.replaced = false;
                        },
                        [&](schema::fault_t& error) {
                          spdlog::debug("Error handler raised '{}': {}",
                                        error.type.name, error.message);
                          context.error = std::move(error);
                          context.response.reset();
                          context.replaced = true;
                        }},
             outcome);
  return context;
}

interceptor_t exception_interceptor(
    std::shared_ptr<const configuration> config) {
  return interceptor_t{
      .name = std::string{exception_interceptor_name},
      .error = [config = std::move(config)](context_t context) {
        return on_error(*config, std::move(context));
      }};
}

interceptor_t exception_interceptor() {
  return exception_interceptor(default_configuration());
}

}  // namespace faultline::interceptor
