#pragma once

#include <gatekeeper/alignment/check.hpp>

#include <cstddef>
#include <string_view>
#include <vector>

namespace gatekeeper::rules {

inline constexpr auto kMaxFileBytes = std::size_t{5} * 1024 * 1024;

/// Checks guarding a file read/write: `file_path`, `workspace_root` and the
/// optional `content` being written.
std::vector<alignment::check_t> make_file_operation_checks();

/// Strict UTF-8 validation (no overlongs, surrogates or values past U+10FFFF).
bool is_valid_utf8(std::string_view text);

}  // namespace gatekeeper::rules
