#pragma once

#include <string_view>

// Field names understood by the reference rule bodies.
namespace gatekeeper::schema::parameter_names {

// surgical_edit, file_operation
inline constexpr auto kContent = std::string_view{"content"};
inline constexpr auto kOldString = std::string_view{"old_string"};
inline constexpr auto kNewString = std::string_view{"new_string"};

// command_execution
inline constexpr auto kCommand = std::string_view{"command"};
inline constexpr auto kCwd = std::string_view{"cwd"};
inline constexpr auto kWorkspaceRoot = std::string_view{"workspace_root"};

// tool_call
inline constexpr auto kToolName = std::string_view{"tool_name"};
inline constexpr auto kAvailableTools = std::string_view{"available_tools"};
inline constexpr auto kToolParams = std::string_view{"tool_params"};
inline constexpr auto kRecentActions = std::string_view{"recent_actions"};

// file_operation
inline constexpr auto kFilePath = std::string_view{"file_path"};

}  // namespace gatekeeper::schema::parameter_names
