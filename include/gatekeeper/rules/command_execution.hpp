#pragma once

#include <gatekeeper/alignment/check.hpp>

#include <vector>

namespace gatekeeper::rules {

/// Checks guarding a shell command: `command`, `cwd`, `workspace_root`.
std::vector<alignment::check_t> make_command_execution_checks();

}  // namespace gatekeeper::rules
