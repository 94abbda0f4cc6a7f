#pragma once

#include <faultline/dispatch/registry.hpp>
#include <faultline/hierarchy/tag_hierarchy.hpp>
#include <faultline/hierarchy/type_hierarchy.hpp>
#include <faultline/schema/error.hpp>
#include <faultline/schema/request.hpp>
#include <optional>
#include <string_view>

namespace faultline::dispatch {

/// Resolution rules in the order the engine tries them.
enum class rule {
  tag_exact,
  type_exact,
  tag_ancestor,
  type_ancestor,
  fallback_default,
};

std::string_view to_string(rule value);

/// The handler picked for an error and why.
struct resolution final {
  const handler_t* handler{};
  dispatch::rule rule{dispatch::rule::fallback_default};
  identifier_t key{default_key};
};

/// Resolves and invokes the error handler for a failed request.
///
/// The engine only reads the registry and hierarchies, so one instance can
/// serve concurrent dispatches. Callers own all three and must keep them
/// alive for the engine's lifetime.
class engine final {
 public:
  engine(const handler_registry& registry,
         const hierarchy::tag_hierarchy& tags,
         const hierarchy::type_hierarchy& types);

  /// Pick the single handler for `error`.
  ///
  /// Rules, first match wins: exact tag, exact type, nearest registered
  /// ancestor of the tag, nearest registered supertype, `default`. Throws
  /// `common::configuration_error` when nothing matches.
  resolution resolve(const schema::fault_t& error) const;

  /// Resolve and invoke, through the registry's wrap when one is installed.
  ///
  /// The result is a response, or a new error the host pipeline must
  /// dispatch again. Anything the handler or wrap throws is returned as that
  /// new error (of `schema::unknown_type` when it is not a `std::exception`).
  /// Only `common::core_error`s propagate.
  schema::outcome_t dispatch(const schema::fault_t& error,
                             const schema::request_t& request) const;

 private:
  using strategy_t = std::optional<resolution> (engine::*)(
      const schema::fault_t&) const;

  std::optional<resolution> match_tag(const schema::fault_t& error) const;
  std::optional<resolution> match_type(const schema::fault_t& error) const;
  std::optional<resolution> match_tag_ancestor(
      const schema::fault_t& error) const;
  std::optional<resolution> match_type_ancestor(
      const schema::fault_t& error) const;
  std::optional<resolution> match_default(const schema::fault_t& error) const;

  std::optional<resolution> lookup(const identifier_t& key,
                                   dispatch::rule matched_by) const;

  const handler_registry& registry_;
  const hierarchy::tag_hierarchy& tags_;
  const hierarchy::type_hierarchy& types_;
};

}  // namespace faultline::dispatch
