#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>

namespace faultline::schema {

using headers_t = std::map<std::string, std::string>;
using fields_t = std::map<std::string, std::string>;
using status_t = uint16_t;

/// Response body: empty, plain text, or structured fields.
using body_t = std::variant<std::monostate, std::string, fields_t>;

/// Render a body as text (fields as `{"k" "v", ...}`).
std::string to_string(const body_t& body);

/// Quote a string the way a printed literal looks: `json` -> `"json"`.
std::string quote(std::string_view value);

}  // namespace faultline::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
