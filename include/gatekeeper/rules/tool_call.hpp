#pragma once

#include <gatekeeper/alignment/check.hpp>
#include <gatekeeper/schema/primitives.hpp>

#include <functional>
#include <vector>

namespace gatekeeper::rules {

using clock_fn_t = std::function<schema::timestamp_milliseconds_t()>;

/// How recent a read_file must be for a surgical_edit tool call.
inline constexpr auto kReadBeforeEditWindow =
    schema::duration_milliseconds_t{60000};

/// Checks guarding an agent tool call: `tool_name`, `available_tools`,
/// `tool_params` and `recent_actions`.
std::vector<alignment::check_t> make_tool_call_checks(
    clock_fn_t now = schema::now_milliseconds);

}  // namespace gatekeeper::rules
