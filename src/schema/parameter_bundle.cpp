#include <gatekeeper/schema/parameter_bundle.hpp>

#include <iterator>

namespace gatekeeper::schema {

parameter_bundle::parameter_bundle(
    std::initializer_list<std::pair<const std::string, parameter_value_t>>
        values)
    : values_{values} {}

void parameter_bundle::set(std::string name, parameter_value_t value) {
  values_.insert_or_assign(std::move(name), std::move(value));
}

bool parameter_bundle::contains(const std::string_view name) const {
  return values_.find(name) != std::end(values_);
}

bool parameter_bundle::empty() const {
  return values_.empty();
}

std::size_t parameter_bundle::size() const {
  return values_.size();
}

const parameter_value_t* parameter_bundle::find(
    const std::string_view name) const {
  auto it = values_.find(name);
  if (it == std::end(values_)) {
    return nullptr;
  }
  return &it->second;
}

const parameter_bundle::map_t& parameter_bundle::values() const {
  return values_;
}

}  // namespace gatekeeper::schema
