#include <faultline/schema/encoding/error_encoder.hpp>

namespace faultline::schema::encoding {

body_t encode_coercion_failure(const coercion_failure_t& failure) {
  auto problems = std::string{};
  for (const auto& problem : failure.problems) {
    if (!problems.empty()) {
      problems.append("; ");
    }
    problems.append(problem);
  }
  return fields_t{{"coercion", failure.coercion},
                  {"in", failure.in},
                  {"value", failure.value},
                  {"problems", problems}};
}

}  // namespace faultline::schema::encoding
