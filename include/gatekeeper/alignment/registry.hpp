#pragma once

#include <gatekeeper/alignment/check.hpp>
#include <gatekeeper/schema/primitives.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <string_view>
#include <vector>

namespace gatekeeper::alignment {

/// The ordered checks bound to one operation type.
struct parameter_set final {
  schema::operation_type_t operation_type;
  std::vector<check_t> checks;
};

using parameter_set_t = parameter_set;

class registry_builder;

/// Immutable catalog from operation type to parameter set.
class registry final {
 public:
  /// Resolve a parameter set; throws configuration_error when unregistered.
  const parameter_set_t& lookup(std::string_view operation_type) const;

  /// Resolve a parameter set; nullptr when unregistered.
  const parameter_set_t* find(std::string_view operation_type) const;

  bool contains(std::string_view operation_type) const;

  /// Registered operation types in lexical order.
  std::vector<schema::operation_type_t> operation_types() const;

  std::size_t size() const;

 private:
  friend class registry_builder;

  std::map<schema::operation_type_t, parameter_set_t, std::less<>> sets_;
};

/// Validates parameter sets as they are added and produces a registry.
///
/// Every registration error is a configuration_error thrown from add().
class registry_builder final {
 public:
  registry_builder& add(schema::operation_type_t operation_type,
                        std::vector<check_t> checks);

  registry build();

 private:
  registry registry_;
};

}  // namespace gatekeeper::alignment
