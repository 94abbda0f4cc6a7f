#include <spdlog/spdlog.h>
#include <array>
#include <faultline/common/errors.hpp>
#include <faultline/dispatch/engine.hpp>

using namespace faultline::schema;

namespace faultline::dispatch {

std::string_view to_string(const rule value) {
  switch (value) {
    case rule::tag_exact:
      return "tag";
    case rule::type_exact:
      return "type";
    case rule::tag_ancestor:
      return "tag ancestor";
    case rule::type_ancestor:
      return "supertype";
    case rule::fallback_default:
    default:
      return "default";
  }
}

engine::engine(const handler_registry& registry,
               const hierarchy::tag_hierarchy& tags,
               const hierarchy::type_hierarchy& types)
    : registry_(registry), tags_(tags), types_(types) {}

std::optional<resolution> engine::lookup(
    const identifier_t& key,
    const dispatch::rule matched_by) const {
  const auto* handler = registry_.find(key);
  if (handler == nullptr) {
    return std::nullopt;
  }
  return resolution{.handler = handler, .rule = matched_by, .key = key};
}

std::optional<resolution> engine::match_tag(const fault_t& error) const {
  if (!error.tag) {
    return std::nullopt;
  }
  return lookup(*error.tag, rule::tag_exact);
}

std::optional<resolution> engine::match_type(const fault_t& error) const {
  return lookup(error.type, rule::type_exact);
}

std::optional<resolution> engine::match_tag_ancestor(
    const fault_t& error) const {
  if (!error.tag) {
    return std::nullopt;
  }
  for (const auto& ancestor : tags_.ancestors_nearest_first(*error.tag)) {
    if (auto found = lookup(ancestor, rule::tag_ancestor)) {
      return found;
    }
  }
  return std::nullopt;
}

std::optional<resolution> engine::match_type_ancestor(
    const fault_t& error) const {
  for (const auto& super_type : types_.super_types(error.type)) {
    if (auto found = lookup(super_type, rule::type_ancestor)) {
      return found;
    }
  }
  return std::nullopt;
}

std::optional<resolution> engine::match_default(const fault_t&) const {
  return lookup(default_key, rule::fallback_default);
}

resolution engine::resolve(const fault_t& error) const {
  static constexpr auto strategies = std::array<strategy_t, 5>{
      &engine::match_tag, &engine::match_type, &engine::match_tag_ancestor,
      &engine::match_type_ancestor, &engine::match_default};

  for (auto strategy : strategies) {
    if (auto found = (this->*strategy)(error)) {
      spdlog::debug("Resolved {} error handler '{}' for '{}'",
                    to_string(found->rule), to_string(found->key),
                    error.tag ? error.tag->name : error.type.name);
      return *found;
    }
  }
  throw common::configuration_error{"no error handler for '" +
                                    error.type.name +
                                    "' and no default handler"};
}

outcome_t engine::dispatch(const fault_t& error,
                           const request_t& request) const {
  auto resolved = resolve(error);
  try {
    if (const auto* wrap = registry_.wrap()) {
      return (*wrap)(*resolved.handler, error, request);
    }
    return (*resolved.handler)(error, request);
  } catch (const common::core_error&) {
    throw;
  } catch (...) {
    auto raised = make_error(std::current_exception());
    spdlog::warn("Error handler '{}' threw '{}': {}", to_string(resolved.key),
                 raised.type.name, raised.message);
    return raised;
  }
}

}  // namespace faultline::dispatch
