#pragma once

#include <stdexcept>
#include <string>

namespace faultline::common {

/// Base for failures raised by faultline itself.
///
/// These always propagate to the caller; application errors never derive
/// from it and are carried as values instead.
class core_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// Registry or hierarchy setup is unusable (e.g. no `default` handler).
class configuration_error final : public core_error {
 public:
  using core_error::core_error;
};

/// A derivation would make a hierarchy cyclic. The hierarchy is unchanged.
class cycle_error final : public core_error {
 public:
  using core_error::core_error;
};

}  // namespace faultline::common
