#include <faultline/common/errors.hpp>
#include <faultline/hierarchy/tag_hierarchy.hpp>
#include <gtest/gtest.h>

#include <atomic>
#include <set>
#include <thread>
#include <vector>

using faultline::common::cycle_error;
using faultline::hierarchy::tag_hierarchy;
using faultline::schema::tag_t;

namespace {

const auto app_exception = tag_t{"app/exception"};
const auto app_error = tag_t{"app/error"};
const auto app_failure = tag_t{"app/failure"};
const auto app_not_found = tag_t{"app/not-found"};

}  // namespace

TEST(tag_hierarchy, ancestors_and_descendants_are_transitive) {
  auto tags = tag_hierarchy{};
  tags.derive(app_error, app_exception);
  tags.derive(app_not_found, app_error);

  EXPECT_EQ(tags.ancestors(app_not_found),
            (std::set<tag_t>{app_error, app_exception}));
  EXPECT_EQ(tags.descendants(app_exception),
            (std::set<tag_t>{app_error, app_not_found}));
  EXPECT_TRUE(tags.ancestors(app_exception).empty());
  EXPECT_TRUE(tags.descendants(app_not_found).empty());
}

TEST(tag_hierarchy, queries_exclude_the_tag_itself) {
  auto tags = tag_hierarchy{};
  tags.derive(app_error, app_exception);
  EXPECT_FALSE(tags.ancestors(app_error).contains(app_error));
  EXPECT_FALSE(tags.descendants(app_exception).contains(app_exception));
}

TEST(tag_hierarchy, derive_is_idempotent) {
  auto tags = tag_hierarchy{};
  tags.derive(app_error, app_exception);
  tags.derive(app_error, app_exception);
  EXPECT_EQ(tags.parents(app_error), (std::set<tag_t>{app_exception}));
  EXPECT_EQ(tags.descendants(app_exception), (std::set<tag_t>{app_error}));
}

TEST(tag_hierarchy, reverse_derive_is_a_cycle_and_leaves_graph_intact) {
  auto tags = tag_hierarchy{};
  tags.derive(app_error, app_exception);
  EXPECT_THROW(tags.derive(app_exception, app_error), cycle_error);
  EXPECT_EQ(tags.ancestors(app_error), (std::set<tag_t>{app_exception}));
  EXPECT_TRUE(tags.ancestors(app_exception).empty());
}

TEST(tag_hierarchy, transitive_cycle_is_rejected) {
  auto tags = tag_hierarchy{};
  tags.derive(app_not_found, app_error);
  tags.derive(app_error, app_exception);
  EXPECT_THROW(tags.derive(app_exception, app_not_found), cycle_error);
  EXPECT_TRUE(tags.parents(app_exception).empty());
}

TEST(tag_hierarchy, self_derivation_is_a_cycle) {
  auto tags = tag_hierarchy{};
  EXPECT_THROW(tags.derive(app_error, app_error), cycle_error);
}

TEST(tag_hierarchy, multiple_parents_are_ordered_nearest_first) {
  auto tags = tag_hierarchy{};
  tags.derive(app_not_found, app_failure);
  tags.derive(app_not_found, app_error);
  tags.derive(app_error, app_exception);
  tags.derive(app_failure, app_exception);

  auto ordered = tags.ancestors_nearest_first(app_not_found);
  ASSERT_EQ(ordered.size(), 3u);
  EXPECT_EQ(ordered[0], app_error);
  EXPECT_EQ(ordered[1], app_failure);
  EXPECT_EQ(ordered[2], app_exception);
}

TEST(tag_hierarchy, ties_are_ordered_by_name_across_the_whole_level) {
  const auto leaf = tag_t{"app/leaf"};
  const auto billing = tag_t{"app/billing"};
  const auto catalog = tag_t{"app/catalog"};
  const auto yard = tag_t{"app/yard"};
  const auto zone = tag_t{"app/zone"};
  auto tags = tag_hierarchy{};
  tags.derive(leaf, billing);
  tags.derive(leaf, catalog);
  tags.derive(billing, zone);
  tags.derive(catalog, yard);

  EXPECT_EQ(tags.ancestors_nearest_first(leaf),
            (std::vector<tag_t>{billing, catalog, yard, zone}));
}

TEST(tag_hierarchy, shared_ancestor_appears_once_at_nearest_distance) {
  auto tags = tag_hierarchy{};
  tags.derive(app_not_found, app_failure);
  tags.derive(app_not_found, app_exception);
  tags.derive(app_failure, app_exception);

  EXPECT_EQ(tags.ancestors_nearest_first(app_not_found),
            (std::vector<tag_t>{app_exception, app_failure}));
}

TEST(tag_hierarchy, isa_is_reflexive_and_follows_parents) {
  auto tags = tag_hierarchy{};
  tags.derive(app_error, app_exception);
  EXPECT_TRUE(tags.isa(app_error, app_error));
  EXPECT_TRUE(tags.isa(app_error, app_exception));
  EXPECT_FALSE(tags.isa(app_exception, app_error));
}

TEST(tag_hierarchy, concurrent_readers_see_configured_graph) {
  auto tags = tag_hierarchy{};
  tags.derive(app_error, app_exception);
  tags.derive(app_not_found, app_error);

  auto mismatches = std::atomic<int>{0};
  auto readers = std::vector<std::thread>{};
  for (auto i = 0; i < 8; ++i) {
    readers.emplace_back([&] {
      for (auto n = 0; n < 500; ++n) {
        if (tags.ancestors_nearest_first(app_not_found).size() != 2u) {
          ++mismatches;
        }
      }
    });
  }
  for (auto& reader : readers) {
    reader.join();
  }
  EXPECT_EQ(mismatches.load(), 0);
}
