#include <gatekeeper/schema/parameter_names.hpp>
#include <gatekeeper/tools/parameter_loader.hpp>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace {

using ptree_t = boost::property_tree::ptree;

bool is_array(const ptree_t& node) {
  return !node.empty() &&
         std::all_of(std::begin(node), std::end(node),
                     [](const auto& child) { return child.first.empty(); });
}

bool is_leaf(const ptree_t& node) {
  return node.empty();
}

enum class empty_container_t { object, array };

bool is_json_space(const char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// property_tree stores `{}` and `[]` as empty leaves, the same as "". Walk the
// raw text for top-level members whose value is an empty container. Keys
// written with escapes are skipped and keep loading as "".
std::map<std::string, empty_container_t, std::less<>> find_empty_containers(
    const std::string_view json) {
  auto found = std::map<std::string, empty_container_t, std::less<>>{};
  auto depth = std::size_t{0};
  auto previous = '\0';
  auto key = std::string{};

  for (auto i = std::size_t{0}; i < json.size(); ++i) {
    const auto c = json[i];
    if (is_json_space(c)) {
      continue;
    }

    if (depth == 1 && previous == ':') {
      const auto close = c == '{' ? '}' : c == '[' ? ']' : '\0';
      auto next = i + 1;
      while (next < json.size() && is_json_space(json[next])) {
        ++next;
      }
      if (close != '\0' && next < json.size() && json[next] == close) {
        if (!key.empty()) {
          found.insert_or_assign(key, c == '{' ? empty_container_t::object
                                               : empty_container_t::array);
        }
        i = next;
        previous = close;
        continue;
      }
      found.erase(key);
    }

    if (c == '"') {
      auto end = i + 1;
      auto escaped = false;
      while (end < json.size() && json[end] != '"') {
        if (json[end] == '\\') {
          escaped = true;
          ++end;
        }
        ++end;
      }
      if (depth == 1 && (previous == '{' || previous == ',')) {
        key = escaped ? std::string{}
                      : std::string{json.substr(i + 1, end - i - 1)};
      }
      i = end;
      previous = '"';
      continue;
    }

    if (c == '{' || c == '[') {
      ++depth;
    } else if ((c == '}' || c == ']') && depth > 0) {
      --depth;
    }
    previous = c;
  }
  return found;
}

gatekeeper::schema::parameter_value_t convert_empty(
    const std::string_view name, const empty_container_t kind) {
  if (kind == empty_container_t::object) {
    return gatekeeper::schema::string_map_t{};
  }
  if (name == gatekeeper::schema::parameter_names::kRecentActions) {
    return gatekeeper::schema::recent_actions_t{};
  }
  return gatekeeper::schema::string_list_t{};
}

gatekeeper::schema::parameter_value_t convert_array(const std::string& name,
                                                    const ptree_t& node) {
  if (std::all_of(std::begin(node), std::end(node),
                  [](const auto& child) { return is_leaf(child.second); })) {
    auto values = gatekeeper::schema::string_list_t{};
    for (const auto& [key, child] : node) {
      values.push_back(child.data());
    }
    return values;
  }

  auto actions = gatekeeper::schema::recent_actions_t{};
  for (const auto& [key, child] : node) {
    const auto tool = child.get_optional<std::string>("tool");
    if (!tool) {
      throw gatekeeper::tools::load_error{"array '" + name +
                                          "' mixes values and objects"};
    }
    auto timestamp =
        child.get_optional<gatekeeper::schema::timestamp_milliseconds_t>(
            "timestamp");
    actions.push_back(gatekeeper::schema::recent_action_t{
        .tool = *tool, .timestamp = timestamp.value_or(0)});
  }
  return actions;
}

gatekeeper::schema::parameter_value_t convert_object(const std::string& name,
                                                     const ptree_t& node) {
  auto values = gatekeeper::schema::string_map_t{};
  for (const auto& [key, child] : node) {
    if (!is_leaf(child)) {
      throw gatekeeper::tools::load_error{"object '" + name +
                                          "' has nested value '" + key + "'"};
    }
    values.insert_or_assign(key, child.data());
  }
  return values;
}

std::pair<std::string, std::string> split_assignment(
    const std::string_view assignment) {
  const auto equals = assignment.find('=');
  if (equals == std::string_view::npos || equals == 0) {
    throw gatekeeper::tools::load_error{"expected name=value, got '" +
                                        std::string{assignment} + "'"};
  }
  return {std::string{assignment.substr(0, equals)},
          std::string{assignment.substr(equals + 1)}};
}

}  // namespace

namespace gatekeeper::tools {

schema::parameter_bundle parse_parameter_bundle(std::istream& json) {
  const auto text = std::string{std::istreambuf_iterator<char>{json},
                                std::istreambuf_iterator<char>{}};
  auto tree = ptree_t{};
  try {
    auto stream = std::istringstream{text};
    boost::property_tree::read_json(stream, tree);
  } catch (const boost::property_tree::json_parser_error& ex) {
    throw load_error{"invalid parameter JSON: " + ex.message() + " at line " +
                     std::to_string(ex.line())};
  }
  if (is_array(tree)) {
    throw load_error{"parameter JSON must be an object"};
  }

  const auto empty_containers = find_empty_containers(text);
  auto bundle = schema::parameter_bundle{};
  for (const auto& [name, node] : tree) {
    const auto empty = empty_containers.find(name);
    if (is_leaf(node) && node.data().empty() &&
        empty != std::end(empty_containers)) {
      bundle.set(name, convert_empty(name, empty->second));
    } else if (is_leaf(node)) {
      bundle.set(name, node.data());
    } else if (is_array(node)) {
      bundle.set(name, convert_array(name, node));
    } else {
      bundle.set(name, convert_object(name, node));
    }
  }
  return bundle;
}

schema::parameter_bundle load_parameter_bundle(
    const std::filesystem::path& path) {
  auto file = std::ifstream{path};
  if (!file) {
    throw load_error{"cannot open parameter file '" + path.string() + "'"};
  }
  spdlog::debug("Loading parameters from '{}'", path.string());
  return parse_parameter_bundle(file);
}

void apply_assignment(schema::parameter_bundle& bundle,
                      const std::string_view assignment) {
  auto [name, value] = split_assignment(assignment);
  bundle.set(std::move(name), std::move(value));
}

void apply_file_assignment(schema::parameter_bundle& bundle,
                           const std::string_view assignment) {
  auto [name, path] = split_assignment(assignment);
  auto file = std::ifstream{path, std::ios::binary};
  if (!file) {
    throw load_error{"cannot open '" + path + "' for parameter '" + name + "'"};
  }
  auto content = std::ostringstream{};
  content << file.rdbuf();
  bundle.set(std::move(name), content.str());
}

}  // namespace gatekeeper::tools
