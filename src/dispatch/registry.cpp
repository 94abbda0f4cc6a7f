#include <spdlog/spdlog.h>
#include <faultline/common/errors.hpp>
#include <faultline/dispatch/registry.hpp>
#include <utility>

namespace faultline::dispatch {

std::string to_string(const identifier_t& identifier) {
  auto out = std::string{};
  std::visit(overloaded{[&](const default_key_t&) { out = "default"; },
                        [&](const schema::tag_t& tag) { out = tag.name; },
                        [&](const schema::type_t& type) { out = type.name; }},
             identifier);
  return out;
}

handler_map_t merge(const handler_map_t& base,
                    const handler_map_t& overrides) {
  auto merged = base;
  for (const auto& [identifier, handler] : overrides) {
    if (!handler) {
      merged.erase(identifier);
      continue;
    }
    if (std::holds_alternative<default_key_t>(identifier) &&
        merged.contains(identifier)) {
      spdlog::debug("Overriding default error handler");
    }
    merged.insert_or_assign(identifier, handler);
  }
  return merged;
}

handler_registry::handler_registry(handler_map_t handlers,
                                   std::optional<wrap_t> wrap)
    : handlers_(std::move(handlers)), wrap_(std::move(wrap)) {
  auto it = handlers_.find(default_key);
  if (it == std::end(handlers_) || !it->second) {
    throw common::configuration_error{
        "error handler registry has no default handler"};
  }
  if (wrap_ && !*wrap_) {
    wrap_.reset();
  }
  spdlog::debug("Error handler registry ready with {} handler(s){}",
                handlers_.size(), wrap_ ? " and a wrap" : "");
}

const handler_t* handler_registry::find(const identifier_t& identifier) const {
  auto it = handlers_.find(identifier);
  if (it == std::end(handlers_) || !it->second) {
    return nullptr;
  }
  return &it->second;
}

const handler_t& handler_registry::default_handler() const {
  return handlers_.at(default_key);
}

const wrap_t* handler_registry::wrap() const {
  return wrap_ ? &*wrap_ : nullptr;
}

}  // namespace faultline::dispatch
