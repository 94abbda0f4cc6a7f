#pragma once

#include <faultline/schema/error.hpp>
#include <faultline/schema/request.hpp>
#include <faultline/schema/tag.hpp>
#include <faultline/schema/type.hpp>
#include <compare>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace faultline::dispatch {

/// Converts an error and the failing request into a response or a new error.
using handler_t = std::function<schema::outcome_t(const schema::fault_t&,
                                                  const schema::request_t&)>;

/// Invoked instead of the resolved handler; may call it any number of times.
using wrap_t = std::function<schema::outcome_t(const handler_t&,
                                               const schema::fault_t&,
                                               const schema::request_t&)>;

/// Reserved key of the fallback handler.
struct default_key_t final {
  auto operator<=>(const default_key_t&) const = default;
};

inline constexpr auto default_key = default_key_t{};

/// Registry key: the reserved default, an error tag, or an error type.
using identifier_t = std::variant<default_key_t, schema::tag_t, schema::type_t>;

using handler_map_t = std::map<identifier_t, handler_t>;

std::string to_string(const identifier_t& identifier);

/// Union of `base` and `overrides`; overrides win. An empty handler in
/// `overrides` removes the entry.
handler_map_t merge(const handler_map_t& base, const handler_map_t& overrides);

/// Immutable identifier-to-handler mapping consulted by the engine.
class handler_registry final {
 public:
  /// Throws `common::configuration_error` when `handlers` has no usable
  /// `default_key` entry.
  explicit handler_registry(handler_map_t handlers,
                            std::optional<wrap_t> wrap = std::nullopt);

  /// Handler registered under `identifier`, or nullptr.
  const handler_t* find(const identifier_t& identifier) const;

  const handler_t& default_handler() const;

  /// Wrap function, or nullptr when none is installed.
  const wrap_t* wrap() const;

  const handler_map_t& handlers() const { return handlers_; }

 private:
  handler_map_t handlers_;
  std::optional<wrap_t> wrap_;
};

}  // namespace faultline::dispatch
