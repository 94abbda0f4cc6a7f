#pragma once

#include <faultline/schema/tag.hpp>
#include <map>
#include <set>
#include <shared_mutex>
#include <vector>

namespace faultline::hierarchy {

/// Append-only "derives from" graph over error tags.
///
/// A tag may have several parents. Writes happen at configuration time and
/// take an exclusive lock; every query takes a shared lock, so any number of
/// dispatches may read concurrently.
class tag_hierarchy final {
 public:
  tag_hierarchy() = default;
  tag_hierarchy(const tag_hierarchy&) = delete;
  tag_hierarchy& operator=(const tag_hierarchy&) = delete;

  /// Record that `child` derives from `parent`.
  ///
  /// Idempotent. Throws `common::cycle_error` (leaving the graph unchanged)
  /// when `parent` already derives from `child` or the two are equal.
  void derive(const schema::tag_t& child, const schema::tag_t& parent);

  /// Direct parents of `tag`.
  std::set<schema::tag_t> parents(const schema::tag_t& tag) const;

  /// Every tag reachable through parent edges, excluding `tag`.
  std::set<schema::tag_t> ancestors(const schema::tag_t& tag) const;

  /// Every tag reachable through child edges, excluding `tag`.
  std::set<schema::tag_t> descendants(const schema::tag_t& tag) const;

  /// Ancestors in breadth-first order, nearest first. Tags at the same
  /// distance are ordered by name.
  std::vector<schema::tag_t> ancestors_nearest_first(
      const schema::tag_t& tag) const;

  /// True when `child == parent` or `parent` is an ancestor of `child`.
  bool isa(const schema::tag_t& child, const schema::tag_t& parent) const;

 private:
  using edges_t = std::map<schema::tag_t, std::set<schema::tag_t>>;

  static std::set<schema::tag_t> closure(const edges_t& edges,
                                         const schema::tag_t& tag);

  mutable std::shared_mutex mutex_;
  edges_t parents_;
  edges_t children_;
};

}  // namespace faultline::hierarchy
