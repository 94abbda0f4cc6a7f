#include <spdlog/spdlog.h>
#include <faultline/common/errors.hpp>
#include <faultline/hierarchy/tag_hierarchy.hpp>
#include <mutex>
#include <utility>

using faultline::schema::tag_t;

namespace faultline::hierarchy {

std::set<tag_t> tag_hierarchy::closure(const edges_t& edges, const tag_t& tag) {
  auto seen = std::set<tag_t>{};
  auto pending = std::vector<tag_t>{tag};
  while (!pending.empty()) {
    auto current = std::move(pending.back());
    pending.pop_back();
    auto it = edges.find(current);
    if (it == std::end(edges)) {
      continue;
    }
    for (const auto& next : it->second) {
      if (seen.insert(next).second) {
        pending.push_back(next);
      }
    }
  }
  return seen;
}

void tag_hierarchy::derive(const tag_t& child, const tag_t& parent) {
  auto lock = std::unique_lock{mutex_};
  if (child == parent) {
    throw common::cycle_error{"tag '" + child.name +
                              "' cannot derive from itself"};
  }
  auto existing = parents_.find(child);
  if (existing != std::end(parents_) && existing->second.contains(parent)) {
    return;
  }
  if (closure(parents_, parent).contains(child)) {
    throw common::cycle_error{"tag '" + parent.name +
                              "' already derives from '" + child.name + "'"};
  }
  parents_[child].insert(parent);
  children_[parent].insert(child);
  spdlog::debug("Derived tag '{}' from '{}'", child.name, parent.name);
}

std::set<tag_t> tag_hierarchy::parents(const tag_t& tag) const {
  auto lock = std::shared_lock{mutex_};
  auto it = parents_.find(tag);
  if (it == std::end(parents_)) {
    return {};
  }
  return it->second;
}

std::set<tag_t> tag_hierarchy::ancestors(const tag_t& tag) const {
  auto lock = std::shared_lock{mutex_};
  return closure(parents_, tag);
}

std::set<tag_t> tag_hierarchy::descendants(const tag_t& tag) const {
  auto lock = std::shared_lock{mutex_};
  return closure(children_, tag);
}

std::vector<tag_t> tag_hierarchy::ancestors_nearest_first(
    const tag_t& tag) const {
  auto lock = std::shared_lock{mutex_};
  auto ordered = std::vector<tag_t>{};
  auto seen = std::set<tag_t>{tag};
  auto level = std::set<tag_t>{tag};
  while (!level.empty()) {
    // Parents one step further out, sorted by name.
    auto next = std::set<tag_t>{};
    for (const auto& current : level) {
      auto it = parents_.find(current);
      if (it == std::end(parents_)) {
        continue;
      }
      for (const auto& parent : it->second) {
        if (!seen.contains(parent)) {
          next.insert(parent);
        }
      }
    }
    seen.insert(std::begin(next), std::end(next));
    ordered.insert(std::end(ordered), std::begin(next), std::end(next));
    level = std::move(next);
  }
  return ordered;
}

bool tag_hierarchy::isa(const tag_t& child, const tag_t& parent) const {
  if (child == parent) {
    return true;
  }
  return ancestors(child).contains(parent);
}

}  // namespace faultline::hierarchy
