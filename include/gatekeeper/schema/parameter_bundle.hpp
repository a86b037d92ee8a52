#pragma once

#include <gatekeeper/schema/primitives.hpp>

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace gatekeeper::schema {

/// Raised by typed accessors when a field is missing or holds another type.
class parameter_error final : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// Named, typed operation parameters handed unchanged to every check.
///
/// Also used as the scratch area a predicate returns for its own describe
/// step.
class parameter_bundle final {
 public:
  using map_t = std::map<std::string, parameter_value_t, std::less<>>;

  parameter_bundle() = default;
  parameter_bundle(
      std::initializer_list<std::pair<const std::string, parameter_value_t>>
          values);

  /// Insert or overwrite a field.
  void set(std::string name, parameter_value_t value);

  bool contains(std::string_view name) const;
  bool empty() const;
  std::size_t size() const;

  /// Raw lookup; nullptr when the field is missing.
  const parameter_value_t* find(std::string_view name) const;

  /// Typed lookup; throws parameter_error when missing or mistyped.
  template <typename T>
  const T& get(const std::string_view name) const {
    const auto* value = find(name);
    if (value == nullptr) {
      throw parameter_error{"missing parameter '" + std::string{name} + "'"};
    }
    const auto* typed = std::get_if<T>(value);
    if (typed == nullptr) {
      throw parameter_error{"parameter '" + std::string{name} +
                            "' has unexpected type"};
    }
    return *typed;
  }

  /// Typed lookup for optional fields; nullptr when missing or mistyped.
  template <typename T>
  const T* try_get(const std::string_view name) const {
    const auto* value = find(name);
    if (value == nullptr) {
      return nullptr;
    }
    return std::get_if<T>(value);
  }

  const map_t& values() const;

 private:
  map_t values_;
};

}  // namespace gatekeeper::schema
