#pragma once
#include <compare>
#include <string>
#include <string_view>

namespace faultline::schema {

/// Symbolic error tag. Namespaced by convention: `"app/not-found"`.
struct tag_t final {
  std::string name;

  auto operator<=>(const tag_t&) const = default;
};

inline tag_t make_tag(const std::string_view name) {
  return tag_t{std::string{name}};
}

}  // namespace faultline::schema
