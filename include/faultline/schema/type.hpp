#pragma once
#include <boost/core/demangle.hpp>
#include <compare>
#include <exception>
#include <initializer_list>
#include <string>
#include <string_view>
#include <typeinfo>
#include <utility>

namespace faultline::schema {

/// Runtime type descriptor of an error value.
struct type_t final {
  std::string name;

  auto operator<=>(const type_t&) const = default;
};

inline type_t make_type(const std::type_info& info) {
  auto name = boost::core::demangle(info.name());
  // std::throw_with_nested throws an unnamed wrapper deriving from the type
  // the caller passed; report that type instead.
  for (const auto prefix : {std::string_view{"std::_Nested_exception<"},
                            std::string_view{"std::__nested<"}}) {
    if (name.starts_with(prefix) && name.ends_with('>')) {
      name = name.substr(prefix.size(), name.size() - prefix.size() - 1);
      break;
    }
  }
  return type_t{std::move(name)};
}

/// Descriptor for a thrown value that is not a `std::exception`.
inline const auto unknown_type = type_t{"unknown"};

/// Static type descriptor, e.g. `type_of<std::runtime_error>()`.
template <typename T>
type_t type_of() {
  return make_type(typeid(T));
}

/// Dynamic type descriptor of a caught exception.
inline type_t type_of(const std::exception& ex) {
  return make_type(typeid(ex));
}

}  // namespace faultline::schema
