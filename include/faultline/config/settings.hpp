#pragma once

#include <boost/program_options.hpp>
#include <faultline/dispatch/registry.hpp>
#include <faultline/hierarchy/tag_hierarchy.hpp>
#include <faultline/hierarchy/type_hierarchy.hpp>
#include <faultline/interceptor/exception.hpp>
#include <faultline/schema/tag.hpp>
#include <faultline/schema/type.hpp>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace faultline::config {

/// Pipeline settings read from the command line or an INI file.
///
/// Hierarchy entries are written `child -> parent`:
///
///     derive = app/not-found -> app/client-error
///     declare = app::db_error -> std::runtime_error
///     log-errors = true
struct settings final {
  std::vector<std::pair<schema::tag_t, schema::tag_t>> derivations;
  std::vector<std::pair<schema::type_t, schema::type_t>> declarations;
  bool log_errors{false};
  std::string log_level{"info"};
};

/// Options understood by `from_variables`.
boost::program_options::options_description options_description();

/// Parse an INI file into `variables`. Throws `common::configuration_error`
/// when the file cannot be read or parsed.
void load_file(const std::string& path,
               const boost::program_options::options_description& description,
               boost::program_options::variables_map& variables);

/// Split `child -> parent`. Throws `common::configuration_error` on any other
/// shape.
std::pair<std::string, std::string> parse_edge(std::string_view entry);

settings from_variables(const boost::program_options::variables_map& variables);

/// Record the configured derivations and declarations.
void apply(const settings& config,
           hierarchy::tag_hierarchy& tags,
           hierarchy::type_hierarchy& types);

/// Default handlers merged with `overrides`, the configured hierarchies on
/// top of the standard exception types, and `wrap` when given.
///
/// With `log_errors` set the console-logging wrap is installed; when `wrap`
/// is also given, logging runs first and then hands over to `wrap`.
std::shared_ptr<const interceptor::configuration> make_configuration(
    const settings& config,
    const dispatch::handler_map_t& overrides = {},
    std::optional<dispatch::wrap_t> wrap = std::nullopt);

}  // namespace faultline::config
