#include <gatekeeper/rules/command_execution.hpp>
#include <gatekeeper/rules/default_registry.hpp>
#include <gatekeeper/rules/file_operation.hpp>
#include <gatekeeper/rules/surgical_edit.hpp>
#include <gatekeeper/rules/tool_call.hpp>
#include <gatekeeper/schema/operation_type.hpp>

#include <string>

namespace gatekeeper::rules {

alignment::registry make_default_registry() {
  auto builder = alignment::registry_builder{};
  builder
      .add(std::string{schema::kSurgicalEdit}, make_surgical_edit_checks())
      .add(std::string{schema::kCommandExecution},
           make_command_execution_checks())
      .add(std::string{schema::kToolCall}, make_tool_call_checks())
      .add(std::string{schema::kFileOperation}, make_file_operation_checks());
  return builder.build();
}

}  // namespace gatekeeper::rules
