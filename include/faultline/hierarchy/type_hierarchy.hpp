#pragma once

#include <faultline/schema/type.hpp>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace faultline::hierarchy {

/// Declared supertype chains of error types.
///
/// C++ cannot walk base classes at runtime, so every error type that should
/// match a handler registered on one of its bases is declared here once, at
/// setup. Each type has a single declared parent.
class type_hierarchy final {
 public:
  type_hierarchy() = default;
  type_hierarchy(const type_hierarchy&) = delete;
  type_hierarchy& operator=(const type_hierarchy&) = delete;

  /// Hierarchy preloaded with the standard library exception trees.
  static std::unique_ptr<type_hierarchy> standard();

  /// Declare `parent` as the direct supertype of `child`.
  ///
  /// Re-declaring the same parent is a no-op. A different parent throws
  /// `common::configuration_error`; a cycle throws `common::cycle_error`.
  void declare(const schema::type_t& child, const schema::type_t& parent);

  template <typename Child, typename Parent>
  void declare() {
    declare(schema::type_of<Child>(), schema::type_of<Parent>());
  }

  std::optional<schema::type_t> parent(const schema::type_t& type) const;

  /// Strict supertypes of `type`, nearest first, up to the topmost declared
  /// type.
  std::vector<schema::type_t> super_types(const schema::type_t& type) const;

 private:
  mutable std::shared_mutex mutex_;
  std::map<schema::type_t, schema::type_t> parents_;
};

}  // namespace faultline::hierarchy
