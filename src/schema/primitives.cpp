#include <faultline/schema/primitives.hpp>
#include <iterator>

namespace faultline::schema {

std::string quote(const std::string_view value) {
  auto out = std::string{};
  out.reserve(value.size() + 2);
  out.push_back('"');
  for (auto c : value) {
    if (c == '"' || c == '\\') {
      out.push_back('\\');
    }
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

std::string to_string(const body_t& body) {
  auto out = std::string{};
  std::visit(overloaded{[&](const std::monostate&) {},
                        [&](const std::string& text) { out = text; },
                        [&](const fields_t& fields) {
                          out.push_back('{');
                          auto first = true;
                          for (const auto& [key, value] : fields) {
                            if (!first) {
                              out.append(", ");
                            }
                            first = false;
                            out.append(quote(key));
                            out.push_back(' ');
                            out.append(quote(value));
                          }
                          out.push_back('}');
                        }},
             body);
  return out;
}

}  // namespace faultline::schema
