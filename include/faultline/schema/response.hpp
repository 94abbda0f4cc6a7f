#pragma once
#include <faultline/schema/primitives.hpp>

namespace faultline::schema {

struct response_t final {
  status_t status{200};
  headers_t headers;
  body_t body;
};

}  // namespace faultline::schema
