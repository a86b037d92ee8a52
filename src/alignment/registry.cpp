#include <spdlog/spdlog.h>
#include <algorithm>
#include <gatekeeper/alignment/errors.hpp>
#include <gatekeeper/alignment/registry.hpp>
#include <iterator>
#include <set>
#include <string>
#include <utility>

namespace {

void validate_checks(const gatekeeper::schema::operation_type_t& operation_type,
                     const std::vector<gatekeeper::alignment::check_t>& checks) {
  if (checks.empty()) {
    throw gatekeeper::alignment::configuration_error{
        "parameter set '" + operation_type + "' has no checks"};
  }
  auto names = std::set<std::string>{};
  for (const auto& check : checks) {
    if (check.name.empty()) {
      throw gatekeeper::alignment::configuration_error{
          "parameter set '" + operation_type + "' has a check without a name"};
    }
    if (!names.insert(check.name).second) {
      throw gatekeeper::alignment::configuration_error{
          "parameter set '" + operation_type + "' has duplicate check '" +
          check.name + "'"};
    }
    if (check.confidence > 100) {
      throw gatekeeper::alignment::configuration_error{
          "check '" + check.name + "' has confidence " +
          std::to_string(check.confidence) + " outside [0, 100]"};
    }
    if (!check.predicate) {
      throw gatekeeper::alignment::configuration_error{
          "check '" + check.name + "' has no predicate"};
    }
  }
}

}  // namespace

namespace gatekeeper::alignment {

const parameter_set_t& registry::lookup(
    const std::string_view operation_type) const {
  const auto* found = find(operation_type);
  if (found == nullptr) {
    throw configuration_error{"no parameter set registered for operation type '" +
                              std::string{operation_type} + "'"};
  }
  return *found;
}

const parameter_set_t* registry::find(
    const std::string_view operation_type) const {
  auto it = sets_.find(operation_type);
  if (it == std::end(sets_)) {
    return nullptr;
  }
  return &it->second;
}

bool registry::contains(const std::string_view operation_type) const {
  return find(operation_type) != nullptr;
}

std::vector<schema::operation_type_t> registry::operation_types() const {
  auto out = std::vector<schema::operation_type_t>{};
  out.reserve(sets_.size());
  std::transform(std::begin(sets_), std::end(sets_), std::back_inserter(out),
                 [](const auto& entry) { return entry.first; });
  return out;
}

std::size_t registry::size() const {
  return sets_.size();
}

registry_builder& registry_builder::add(schema::operation_type_t operation_type,
                                        std::vector<check_t> checks) {
  if (operation_type.empty()) {
    throw configuration_error{"operation type must not be empty"};
  }
  if (registry_.sets_.contains(operation_type)) {
    throw configuration_error{"operation type '" + operation_type +
                              "' registered twice"};
  }
  validate_checks(operation_type, checks);
  for (auto& check : checks) {
    if (check.display_name.empty()) {
      check.display_name = check.name;
    }
  }

  spdlog::debug("Registered parameter set '{}' with {} check(s)",
                operation_type, checks.size());
  auto key = operation_type;
  registry_.sets_.emplace(
      std::move(key), parameter_set_t{.operation_type = std::move(operation_type),
                                      .checks = std::move(checks)});
  return *this;
}

registry registry_builder::build() {
  auto built = std::move(registry_);
  registry_ = registry{};
  return built;
}

}  // namespace gatekeeper::alignment
