#pragma once

#include <gatekeeper/alignment/registry.hpp>

namespace gatekeeper::rules {

/// Registry holding the reference parameter sets for surgical_edit,
/// command_execution, tool_call and file_operation.
alignment::registry make_default_registry();

}  // namespace gatekeeper::rules
