#include <spdlog/spdlog.h>
#include <faultline/common/errors.hpp>
#include <faultline/config/settings.hpp>
#include <faultline/handlers/handlers.hpp>
#include <cctype>
#include <fstream>
#include <optional>

namespace po = boost::program_options;

namespace faultline::config {

namespace {

bool is_space(const char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view trim(std::string_view value) {
  while (!value.empty() && is_space(value.front())) {
    value.remove_prefix(1);
  }
  while (!value.empty() && is_space(value.back())) {
    value.remove_suffix(1);
  }
  return value;
}

}  // namespace

po::options_description options_description() {
  auto description = po::options_description{"Error dispatch"};
  description.add_options()(
      "derive", po::value<std::vector<std::string>>()->composing(),
      "Tag derivation 'child -> parent' (repeatable)")(
      "declare", po::value<std::vector<std::string>>()->composing(),
      "Error type supertype 'child -> parent' (repeatable)")(
      "log-errors",
      po::value<bool>()->default_value(false)->implicit_value(true),
      "Log every dispatched error before handling it")(
      "log-level", po::value<std::string>()->default_value("info"),
      "trace, debug, info, warn, error, critical or off");
  return description;
}

void load_file(const std::string& path,
               const po::options_description& description,
               po::variables_map& variables) {
  auto input = std::ifstream{path};
  if (!input.good()) {
    throw common::configuration_error{"cannot open config file '" + path +
                                      "'"};
  }
  try {
    po::store(po::parse_config_file(input, description), variables);
  } catch (const po::error& ex) {
    throw common::configuration_error{"invalid config file '" + path +
                                      "': " + ex.what()};
  }
  spdlog::info("Loaded configuration from '{}'", path);
}

std::pair<std::string, std::string> parse_edge(const std::string_view entry) {
  const auto arrow = entry.find("->");
  if (arrow == std::string_view::npos) {
    throw common::configuration_error{"expected 'child -> parent', got '" +
                                      std::string{entry} + "'"};
  }
  auto child = trim(entry.substr(0, arrow));
  auto parent = trim(entry.substr(arrow + 2));
  if (child.empty() || parent.empty() ||
      parent.find("->") != std::string_view::npos) {
    throw common::configuration_error{"expected 'child -> parent', got '" +
                                      std::string{entry} + "'"};
  }
  return {std::string{child}, std::string{parent}};
}

settings from_variables(const po::variables_map& variables) {
  auto config = settings{};
  if (variables.contains("derive")) {
    for (const auto& entry :
         variables["derive"].as<std::vector<std::string>>()) {
      auto [child, parent] = parse_edge(entry);
      config.derivations.emplace_back(schema::tag_t{std::move(child)},
                                      schema::tag_t{std::move(parent)});
    }
  }
  if (variables.contains("declare")) {
    for (const auto& entry :
         variables["declare"].as<std::vector<std::string>>()) {
      auto [child, parent] = parse_edge(entry);
      config.declarations.emplace_back(schema::type_t{std::move(child)},
                                       schema::type_t{std::move(parent)});
    }
  }
  if (variables.contains("log-errors")) {
    config.log_errors = variables["log-errors"].as<bool>();
  }
  if (variables.contains("log-level")) {
    config.log_level = variables["log-level"].as<std::string>();
  }
  return config;
}

void apply(const settings& config,
           hierarchy::tag_hierarchy& tags,
           hierarchy::type_hierarchy& types) {
  for (const auto& [child, parent] : config.derivations) {
    tags.derive(child, parent);
  }
  for (const auto& [child, parent] : config.declarations) {
    types.declare(child, parent);
  }
  spdlog::info("Applied {} tag derivation(s) and {} type declaration(s)",
               config.derivations.size(), config.declarations.size());
}

std::shared_ptr<const interceptor::configuration> make_configuration(
    const settings& config,
    const dispatch::handler_map_t& overrides,
    std::optional<dispatch::wrap_t> wrap) {
  auto tags = std::make_shared<hierarchy::tag_hierarchy>();
  auto types = std::shared_ptr<hierarchy::type_hierarchy>{
      hierarchy::type_hierarchy::standard()};
  apply(config, *tags, *types);

  if (config.log_errors) {
    auto log = handlers::make_log_to_console_wrap();
    if (wrap) {
      wrap = [log = std::move(log), inner = std::move(*wrap)](
                 const dispatch::handler_t& handler,
                 const schema::fault_t& error,
                 const schema::request_t& request) {
        return log(
            [&inner, &handler](const schema::fault_t& logged,
                               const schema::request_t& on) {
              return inner(handler, logged, on);
            },
            error, request);
      };
    } else {
      wrap = std::move(log);
    }
  }
  return std::make_shared<const interceptor::configuration>(
      dispatch::handler_registry{
          dispatch::merge(handlers::default_handlers(), overrides),
          std::move(wrap)},
      std::move(tags), std::move(types));
}

}  // namespace faultline::config
