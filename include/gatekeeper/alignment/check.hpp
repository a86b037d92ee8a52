#pragma once

#include <gatekeeper/schema/parameter_bundle.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace gatekeeper::alignment {

/// What a predicate hands back: the boolean outcome plus a scratch bundle
/// that only this check's describe step reads.
struct check_outcome final {
  bool passed{false};
  schema::parameter_bundle scratch;
};

using check_outcome_t = check_outcome;

using predicate_t =
    std::function<check_outcome_t(const schema::parameter_bundle& params)>;

using describe_t = std::function<std::optional<std::string>(
    bool passed,
    const schema::parameter_bundle& params,
    const schema::parameter_bundle& scratch)>;

/// A named, independently evaluable predicate over operation parameters.
///
/// Critical checks veto the operation on failure and weigh double in the
/// aggregate confidence.
struct check final {
  std::string name;
  std::string display_name;
  std::string category;
  bool critical{false};
  uint32_t confidence{100};
  predicate_t predicate;
  describe_t describe;
};

using check_t = check;

}  // namespace gatekeeper::alignment
