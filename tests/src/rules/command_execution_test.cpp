#include <gtest/gtest.h>
#include <gatekeeper/rules/command_execution.hpp>
#include <gatekeeper/testing/common.hpp>

#include <string>

using gatekeeper::testing::evaluate_named;

namespace {

gatekeeper::schema::parameter_bundle make_command(
    const std::string& command,
    const std::string& cwd = "/work/project/src",
    const std::string& workspace_root = "/work/project") {
  return gatekeeper::schema::parameter_bundle{
      {"command", command}, {"cwd", cwd}, {"workspace_root", workspace_root}};
}

bool passes(const std::string_view name,
            const gatekeeper::schema::parameter_bundle& params) {
  return evaluate_named(gatekeeper::rules::make_command_execution_checks(),
                        name, params)
      .passed;
}

}  // namespace

TEST(command_execution, every_check_is_critical) {
  for (const auto& check :
       gatekeeper::rules::make_command_execution_checks()) {
    EXPECT_TRUE(check.critical) << check.name;
  }
}

TEST(command_execution, destructive_commands_are_rejected) {
  EXPECT_FALSE(passes("not_destructive", make_command("rm -rf /")));
  EXPECT_FALSE(passes("not_destructive", make_command("DEL /F build.log")));
  EXPECT_FALSE(passes("not_destructive", make_command("format c:")));
  EXPECT_FALSE(passes("not_destructive", make_command("mkfs.ext4 /dev/sdb1")));
  EXPECT_FALSE(passes("not_destructive", make_command("cat x >/dev/sda")));
}

TEST(command_execution, ordinary_commands_pass) {
  EXPECT_TRUE(passes("not_destructive", make_command("ls -la")));
  EXPECT_TRUE(passes("not_destructive", make_command("git format-patch -1")));
  EXPECT_TRUE(passes("path_safety", make_command("cat ./notes.txt")));
}

TEST(command_execution, destructive_message) {
  const auto result =
      evaluate_named(gatekeeper::rules::make_command_execution_checks(),
                     "not_destructive", make_command("rm -rf build"));
  EXPECT_EQ(result.message.value_or(""), "DESTRUCTIVE COMMAND DETECTED");
}

TEST(command_execution, working_directory_must_be_under_workspace) {
  EXPECT_TRUE(passes("working_directory_correct", make_command("ls")));
  EXPECT_TRUE(passes("working_directory_correct",
                     make_command("ls", "/work/project", "/work/project")));
  EXPECT_FALSE(passes("working_directory_correct", make_command("ls", "/tmp")));
  EXPECT_FALSE(
      passes("working_directory_correct", make_command("ls", "/tmp", "")));
}

TEST(command_execution, path_traversal_is_rejected) {
  EXPECT_FALSE(passes("path_safety", make_command("cat ../secrets.txt")));
}
