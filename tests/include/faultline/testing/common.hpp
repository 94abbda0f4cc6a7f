#pragma once

#include <spdlog/logger.h>
#include <spdlog/sinks/ostream_sink.h>
#include <faultline/dispatch/registry.hpp>
#include <faultline/schema/error.hpp>
#include <faultline/schema/request.hpp>
#include <faultline/schema/response.hpp>

#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace faultline::testing {

inline schema::request_t make_request(const std::string_view method = "GET",
                                      const std::string_view uri = "/") {
  return schema::request_t{.method = std::string{method},
                           .uri = std::string{uri}};
}

inline schema::response_t make_response(const schema::status_t status,
                                        std::string body = {}) {
  return schema::response_t{.status = status, .body = std::move(body)};
}

/// Handler answering with `status` and its own name as the body.
inline dispatch::handler_t named_handler(std::string name,
                                         const schema::status_t status = 200) {
  return [name = std::move(name), status](const schema::fault_t&,
                                          const schema::request_t&) {
    return schema::outcome_t{make_response(status, name)};
  };
}

inline std::string body_text(const schema::outcome_t& outcome) {
  return schema::to_string(std::get<schema::response_t>(outcome).body);
}

inline schema::status_t status_of(const schema::outcome_t& outcome) {
  return std::get<schema::response_t>(outcome).status;
}

/// Logger writing bare messages, one per line, into `out`.
inline std::shared_ptr<spdlog::logger> make_stream_logger(std::ostream& out) {
  auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
  auto logger = std::make_shared<spdlog::logger>("faultline-test", sink);
  logger->set_pattern("%v");
  logger->set_level(spdlog::level::trace);
  return logger;
}

inline std::vector<std::string> lines_of(const std::string& text) {
  auto lines = std::vector<std::string>{};
  auto input = std::istringstream{text};
  for (auto line = std::string{}; std::getline(input, line);) {
    lines.push_back(line);
  }
  return lines;
}

}  // namespace faultline::testing
