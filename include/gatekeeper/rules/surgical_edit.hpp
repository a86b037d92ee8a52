#pragma once

#include <gatekeeper/alignment/check.hpp>

#include <vector>

namespace gatekeeper::rules {

/// Checks guarding an in-place text replacement.
///
/// Reads `content` (the whole file), `old_string` (the text being replaced)
/// and `new_string` (its replacement). Catches runaway selections, syntax
/// damage and removed definitions before the edit is applied.
std::vector<alignment::check_t> make_surgical_edit_checks();

}  // namespace gatekeeper::rules
