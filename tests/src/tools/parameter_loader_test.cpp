#include <gtest/gtest.h>
#include <gatekeeper/testing/common.hpp>
#include <gatekeeper/tools/parameter_loader.hpp>

#include <sstream>
#include <string>

namespace {

gatekeeper::schema::parameter_bundle parse(const std::string& json) {
  auto stream = std::istringstream{json};
  return gatekeeper::tools::parse_parameter_bundle(stream);
}

}  // namespace

TEST(parameter_loader, maps_json_shapes_onto_bundle_values) {
  const auto params = parse(R"({
    "tool_name": "surgical_edit",
    "available_tools": ["read_file", "surgical_edit"],
    "tool_params": {"path": "src/a.js", "line": 3},
    "recent_actions": [{"tool": "read_file", "timestamp": 1700000000000}]
  })");

  EXPECT_EQ(params.get<std::string>("tool_name"), "surgical_edit");
  EXPECT_EQ(params.get<gatekeeper::schema::string_list_t>("available_tools"),
            (gatekeeper::schema::string_list_t{"read_file", "surgical_edit"}));
  const auto& tool_params =
      params.get<gatekeeper::schema::string_map_t>("tool_params");
  EXPECT_EQ(tool_params.at("path"), "src/a.js");
  EXPECT_EQ(tool_params.at("line"), "3");
  const auto& actions =
      params.get<gatekeeper::schema::recent_actions_t>("recent_actions");
  ASSERT_EQ(actions.size(), 1u);
  EXPECT_EQ(actions.front().tool, "read_file");
  EXPECT_EQ(actions.front().timestamp, 1700000000000u);
}

TEST(parameter_loader, empty_containers_keep_their_shape) {
  const auto params = parse(R"({
    "tool_name": "list_files",
    "tool_params": {},
    "recent_actions": [ ],
    "available_tools": [],
    "note": "",
    "nested": {"inner": "{}"}
  })");

  EXPECT_TRUE(params.get<gatekeeper::schema::string_map_t>("tool_params")
                  .empty());
  EXPECT_TRUE(
      params.get<gatekeeper::schema::recent_actions_t>("recent_actions")
          .empty());
  EXPECT_TRUE(params.get<gatekeeper::schema::string_list_t>("available_tools")
                  .empty());
  EXPECT_EQ(params.get<std::string>("note"), "");
  EXPECT_EQ(params.get<gatekeeper::schema::string_map_t>("nested").at("inner"),
            "{}");
}

TEST(parameter_loader, rejects_malformed_documents) {
  EXPECT_THROW(parse("{\"a\": "), gatekeeper::tools::load_error);
  EXPECT_THROW(parse("[\"a\", \"b\"]"), gatekeeper::tools::load_error);
  EXPECT_THROW(parse(R"({"a": {"b": {"c": "d"}}})"),
               gatekeeper::tools::load_error);
  EXPECT_THROW(parse(R"({"a": ["x", {"tool": "y"}]})"),
               gatekeeper::tools::load_error);
}

TEST(parameter_loader, assignments_store_strings) {
  auto params = gatekeeper::schema::parameter_bundle{};
  gatekeeper::tools::apply_assignment(params, "cwd=/work/project");
  gatekeeper::tools::apply_assignment(params, "command=a=b");
  EXPECT_EQ(params.get<std::string>("cwd"), "/work/project");
  EXPECT_EQ(params.get<std::string>("command"), "a=b");
  EXPECT_THROW(gatekeeper::tools::apply_assignment(params, "novalue"),
               gatekeeper::tools::load_error);
  EXPECT_THROW(gatekeeper::tools::apply_assignment(params, "=value"),
               gatekeeper::tools::load_error);
}

TEST(parameter_loader, file_assignment_reads_raw_bytes) {
  const auto path =
      gatekeeper::testing::write_temp_file("gatekeeper_content", "a\r\nb\n");
  auto params = gatekeeper::schema::parameter_bundle{};
  gatekeeper::tools::apply_file_assignment(params, "content=" + path);
  EXPECT_EQ(params.get<std::string>("content"), "a\r\nb\n");
  gatekeeper::testing::remove_path(path);

  EXPECT_THROW(gatekeeper::tools::apply_file_assignment(
                   params, "content=/nonexistent/gatekeeper/file"),
               gatekeeper::tools::load_error);
}

TEST(parameter_loader, load_from_file) {
  const auto path = gatekeeper::testing::write_temp_file(
      "gatekeeper_params", R"({"command": "ls", "cwd": "/w"})");
  const auto params = gatekeeper::tools::load_parameter_bundle(path);
  EXPECT_EQ(params.size(), 2u);
  EXPECT_EQ(params.get<std::string>("command"), "ls");
  gatekeeper::testing::remove_path(path);

  EXPECT_THROW(static_cast<void>(gatekeeper::tools::load_parameter_bundle(
                   "/nonexistent/gatekeeper.json")),
               gatekeeper::tools::load_error);
}
