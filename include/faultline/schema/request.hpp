#pragma once
#include <faultline/schema/primitives.hpp>
#include <string>

namespace faultline::schema {

struct request_t final {
  std::string method{"GET"};
  std::string uri{"/"};
  headers_t headers;
  std::string body;
};

}  // namespace faultline::schema
