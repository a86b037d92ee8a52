#pragma once

#include <cstdint>

// Schema type: policy configuration.
// Alignment workflow: the two knobs of the allow decision. Check criticality
// and confidence weights belong to the parameter sets, not here.
namespace gatekeeper::schema {

template <uint16_t Version>
struct policy_config;

template <>
struct policy_config<1> final {
  uint16_t version{1};
  uint32_t minimum_confidence{85};
  uint32_t max_non_critical_failures{2};
};

using policy_config_t = policy_config<1>;

}  // namespace gatekeeper::schema
