#pragma once

#include <gatekeeper/schema/parameter_bundle.hpp>

#include <filesystem>
#include <istream>
#include <stdexcept>
#include <string_view>

namespace gatekeeper::tools {

/// Unreadable parameter file or a document that does not map onto a bundle.
class load_error final : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// Build a bundle from a JSON object.
///
/// Scalars become strings, arrays of scalars become string lists, arrays of
/// `{"tool", "timestamp"}` objects become recent actions and flat objects
/// become string maps. `{}` loads as an empty string map and `[]` as an empty
/// list: recent actions for `recent_actions`, strings for anything else.
schema::parameter_bundle parse_parameter_bundle(std::istream& json);

schema::parameter_bundle load_parameter_bundle(
    const std::filesystem::path& path);

/// Apply `name=value`, storing the value as a string.
void apply_assignment(schema::parameter_bundle& bundle,
                      std::string_view assignment);

/// Apply `name=path`, storing the file's bytes as a string.
void apply_file_assignment(schema::parameter_bundle& bundle,
                           std::string_view assignment);

}  // namespace gatekeeper::tools
