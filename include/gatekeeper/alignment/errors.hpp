#pragma once

#include <stdexcept>

namespace gatekeeper::alignment {

/// Unregistered operation type, invalid parameter set or invalid policy.
///
/// Always fatal to the call that raised it; never folded into a verdict.
class configuration_error final : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace gatekeeper::alignment
