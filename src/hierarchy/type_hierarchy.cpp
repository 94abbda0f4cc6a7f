#include <spdlog/spdlog.h>
#include <any>
#include <faultline/common/errors.hpp>
#include <faultline/hierarchy/type_hierarchy.hpp>
#include <faultline/schema/error.hpp>
#include <functional>
#include <future>
#include <ios>
#include <mutex>
#include <new>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <typeinfo>
#include <variant>

using faultline::schema::type_t;

namespace faultline::hierarchy {

std::unique_ptr<type_hierarchy> type_hierarchy::standard() {
  auto types = std::make_unique<type_hierarchy>();
  types->declare<std::logic_error, std::exception>();
  types->declare<std::invalid_argument, std::logic_error>();
  types->declare<std::domain_error, std::logic_error>();
  types->declare<std::length_error, std::logic_error>();
  types->declare<std::out_of_range, std::logic_error>();
  types->declare<std::future_error, std::logic_error>();
  types->declare<std::runtime_error, std::exception>();
  types->declare<std::range_error, std::runtime_error>();
  types->declare<std::overflow_error, std::runtime_error>();
  types->declare<std::underflow_error, std::runtime_error>();
  types->declare<std::system_error, std::runtime_error>();
  types->declare<std::ios_base::failure, std::system_error>();
  types->declare<std::bad_alloc, std::exception>();
  types->declare<std::bad_array_new_length, std::bad_alloc>();
  types->declare<std::bad_cast, std::exception>();
  types->declare<std::bad_any_cast, std::bad_cast>();
  types->declare<std::bad_typeid, std::exception>();
  types->declare<std::bad_optional_access, std::exception>();
  types->declare<std::bad_variant_access, std::exception>();
  types->declare<std::bad_function_call, std::exception>();
  types->declare<schema::tagged_exception, std::runtime_error>();
  return types;
}

void type_hierarchy::declare(const type_t& child, const type_t& parent) {
  auto lock = std::unique_lock{mutex_};
  if (child == parent) {
    throw common::cycle_error{"type '" + child.name +
                              "' cannot be its own supertype"};
  }
  if (auto it = parents_.find(child); it != std::end(parents_)) {
    if (it->second == parent) {
      return;
    }
    throw common::configuration_error{
        "type '" + child.name + "' already declares supertype '" +
        it->second.name + "', not '" + parent.name + "'"};
  }
  for (auto it = parents_.find(parent); it != std::end(parents_);
       it = parents_.find(it->second)) {
    if (it->second == child) {
      throw common::cycle_error{"type '" + parent.name +
                                "' already has supertype '" + child.name + "'"};
    }
  }
  parents_.emplace(child, parent);
  spdlog::debug("Declared type '{}' with supertype '{}'", child.name,
                parent.name);
}

std::optional<type_t> type_hierarchy::parent(const type_t& type) const {
  auto lock = std::shared_lock{mutex_};
  auto it = parents_.find(type);
  if (it == std::end(parents_)) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<type_t> type_hierarchy::super_types(const type_t& type) const {
  auto lock = std::shared_lock{mutex_};
  auto chain = std::vector<type_t>{};
  for (auto it = parents_.find(type); it != std::end(parents_);
       it = parents_.find(it->second)) {
    chain.push_back(it->second);
  }
  return chain;
}

}  // namespace faultline::hierarchy
