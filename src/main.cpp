#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <faultline/common/errors.hpp>
#include <faultline/config/settings.hpp>
#include <faultline/interceptor/exception.hpp>
#include <faultline/pipeline/chain.hpp>
#include <faultline/schema/error.hpp>
#include <faultline/schema/tags.hpp>
#include <functional>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace po = boost::program_options;
using namespace faultline;

namespace {

struct failure_options final {
  std::string tag;
  std::string type{"runtime_error"};
  std::string message{"request failed"};
  std::string format;
  int status{};
};

using thrower_t = std::function<void(const std::string&)>;

const std::map<std::string, thrower_t>& standard_throwers() {
  static const auto throwers = std::map<std::string, thrower_t>{
      {"runtime_error",
       [](const std::string& m) { throw std::runtime_error{m}; }},
      {"logic_error", [](const std::string& m) { throw std::logic_error{m}; }},
      {"invalid_argument",
       [](const std::string& m) { throw std::invalid_argument{m}; }},
      {"out_of_range",
       [](const std::string& m) { throw std::out_of_range{m}; }},
      {"overflow_error",
       [](const std::string& m) { throw std::overflow_error{m}; }},
      {"range_error", [](const std::string& m) { throw std::range_error{m}; }},
  };
  return throwers;
}

// Endpoint that fails the way the command line asked it to.
pipeline::endpoint_t failing_endpoint(const failure_options& failure) {
  if (failure.tag.empty() && !standard_throwers().contains(failure.type)) {
    throw common::configuration_error{"unknown error type '" + failure.type +
                                      "'"};
  }
  return [failure](const schema::request_t&) -> schema::response_t {
    if (failure.tag.empty()) {
      standard_throwers().at(failure.type)(failure.message);
    }
    auto tag = schema::tag_t{failure.tag};
    auto data = schema::error_data_t{};
    auto response = std::optional<schema::response_t>{};
    if (tag == schema::tags::decode_failure && !failure.format.empty()) {
      data = schema::decode_failure_t{.format = failure.format};
    }
    if (tag == schema::tags::response && failure.status != 0) {
      response = schema::response_t{
          .status = static_cast<schema::status_t>(failure.status),
          .body = failure.message};
    }
    throw schema::tagged_exception{failure.message, std::move(tag),
                                   std::move(data), std::move(response)};
  };
}

void print_response(const schema::response_t& response) {
  std::cout << response.status << std::endl;
  for (const auto& [name, value] : response.headers) {
    std::cout << name << ": " << value << std::endl;
  }
  std::cout << std::endl << schema::to_string(response.body) << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
  spdlog::init_thread_pool(8192, 1);

  auto request = schema::request_t{};
  auto failure = failure_options{};
  auto config_path = std::string{};
  auto log_file = std::string{};

  auto vm = po::variables_map{};
  auto description = po::options_description{"Faultline"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_path),
      "INI file with dispatch settings")(
      "log-file", po::value<std::string>(&log_file),
      "Also write logs to this file")(
      "method,m", po::value<std::string>(&request.method)->default_value("GET"),
      "Request method")(
      "uri,u", po::value<std::string>(&request.uri)->default_value("/"),
      "Request target")(
      "tag,t", po::value<std::string>(&failure.tag),
      "Raise a tagged error with this tag")(
      "type",
      po::value<std::string>(&failure.type)->default_value("runtime_error"),
      "Standard exception to raise when no tag is given")(
      "message", po::value<std::string>(&failure.message)
                     ->default_value("request failed"),
      "Error message")(
      "format,f", po::value<std::string>(&failure.format),
      "Declared format of an undecodable body")(
      "status,s", po::value<int>(&failure.status),
      "Status of the response embedded in the error");
  description.add(config::options_description());

  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("config")) {
      config::load_file(vm["config"].as<std::string>(), description, vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << std::endl << description << std::endl;
    return 2;
  } catch (const common::configuration_error& ex) {
    std::cerr << ex.what() << std::endl;
    return 2;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  auto sinks = std::vector<spdlog::sink_ptr>{
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
  if (!log_file.empty()) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
  }
  auto logger = std::make_shared<spdlog::async_logger>(
      "faultline", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto exit_code = 0;
  try {
    auto settings = config::from_variables(vm);
    spdlog::set_level(spdlog::level::from_str(settings.log_level));
    auto configuration = config::make_configuration(settings);
    auto handling = pipeline::chain{
        {interceptor::exception_interceptor(std::move(configuration))}};

    auto outcome = handling.execute(request, failing_endpoint(failure));
    if (const auto* response = std::get_if<schema::response_t>(&outcome)) {
      print_response(*response);
    } else {
      const auto& error = std::get<schema::fault_t>(outcome);
      std::cerr << error.type.name << ": " << error.message << std::endl;
      exit_code = 1;
    }
  } catch (const common::core_error& ex) {
    spdlog::error("{}", ex.what());
    exit_code = 2;
  }

  spdlog::shutdown();
  return exit_code;
}
