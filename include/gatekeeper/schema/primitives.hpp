#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace gatekeeper::schema {

using timestamp_milliseconds_t = uint64_t;
using duration_milliseconds_t = uint64_t;
using duration_microseconds_t = uint64_t;
using operation_type_t = std::string;

using string_list_t = std::vector<std::string>;
using string_map_t = std::map<std::string, std::string>;

/// One entry of an agent's recent tool history.
struct recent_action_t final {
  std::string tool;
  timestamp_milliseconds_t timestamp{};
};

using recent_actions_t = std::vector<recent_action_t>;

using parameter_value_t = std::variant<std::monostate,
                                       bool,
                                       int64_t,
                                       double,
                                       std::string,
                                       string_list_t,
                                       string_map_t,
                                       recent_actions_t>;

/// Wall clock in milliseconds since the Unix epoch.
timestamp_milliseconds_t now_milliseconds();

}  // namespace gatekeeper::schema
