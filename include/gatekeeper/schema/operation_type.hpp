#pragma once

#include <string_view>

// Schema type: operation type.
// Alignment workflow: selects the parameter set evaluated before an agent
// operation runs. The registry accepts any identifier; these are the
// operation types shipped with the reference rule bodies.
namespace gatekeeper::schema {

inline constexpr auto kSurgicalEdit = std::string_view{"surgical_edit"};
inline constexpr auto kCommandExecution =
    std::string_view{"command_execution"};
inline constexpr auto kToolCall = std::string_view{"tool_call"};
inline constexpr auto kFileOperation = std::string_view{"file_operation"};

}  // namespace gatekeeper::schema
