#include <gatekeeper/rules/file_operation.hpp>
#include <gatekeeper/rules/text.hpp>
#include <gatekeeper/schema/parameter_names.hpp>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <filesystem>
#include <iterator>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

namespace {

namespace names = gatekeeper::schema::parameter_names;
using gatekeeper::alignment::check_outcome_t;
using gatekeeper::alignment::check_t;
using gatekeeper::schema::parameter_bundle;

constexpr auto kSafetyChecks = "Safety Checks";
constexpr auto kSizeValidation = "Size Validation";
constexpr auto kContentValidation = "Content Validation";
constexpr auto kSecurityChecks = "Security Checks";

constexpr auto kProtectedNames = std::array<std::string_view, 5>{
    "package.json", ".git", ".env", "node_modules", ".gitignore"};

// A write without content (plain read, delete) passes the content checks.
const std::string* content_of(const parameter_bundle& params) {
  return params.try_get<std::string>(names::kContent);
}

check_t path_within_workspace() {
  return check_t{
      .name = "path_within_workspace",
      .display_name = "Path Within Workspace",
      .category = kSafetyChecks,
      .critical = true,
      .confidence = 100,
      .predicate =
          [](const parameter_bundle& params) {
            auto root = std::filesystem::path{
                params.get<std::string>(names::kWorkspaceRoot)}
                            .lexically_normal();
            if (!root.has_filename() && root.has_relative_path()) {
              root = root.parent_path();
            }
            const auto target =
                (root / params.get<std::string>(names::kFilePath))
                    .lexically_normal();
            const auto relative = target.lexically_relative(root);
            // Any leading "..", including names like "..cache", is refused.
            const auto inside = !relative.empty() && !relative.is_absolute() &&
                                !relative.string().starts_with("..");
            return check_outcome_t{.passed = inside};
          },
      .describe = [](const bool passed, const parameter_bundle&,
                     const parameter_bundle&) -> std::optional<std::string> {
        return passed ? "Path safe" : "Path outside workspace";
      }};
}

check_t not_critical_file() {
  return check_t{
      .name = "not_critical_file",
      .display_name = "Not Critical System File",
      .category = kSafetyChecks,
      .critical = true,
      .confidence = 100,
      .predicate =
          [](const parameter_bundle& params) {
            const auto& file_path = params.get<std::string>(names::kFilePath);
            const auto protected_file = std::any_of(
                std::begin(kProtectedNames), std::end(kProtectedNames),
                [&](const std::string_view name) {
                  return gatekeeper::rules::contains(file_path, name);
                });
            return check_outcome_t{.passed = !protected_file};
          },
      .describe = [](const bool passed, const parameter_bundle& params,
                     const parameter_bundle&) -> std::optional<std::string> {
        if (passed) {
          return "Not a critical file";
        }
        return fmt::format("Critical file: {}",
                           params.get<std::string>(names::kFilePath));
      }};
}

check_t file_size_reasonable() {
  return check_t{
      .name = "file_size_reasonable",
      .display_name = "File Size Reasonable",
      .category = kSizeValidation,
      .critical = false,
      .confidence = 95,
      .predicate =
          [](const parameter_bundle& params) {
            const auto* content = content_of(params);
            if (content == nullptr) {
              return check_outcome_t{.passed = true};
            }
            auto outcome = check_outcome_t{
                .passed = content->size() < gatekeeper::rules::kMaxFileBytes};
            outcome.scratch.set("megabytes", static_cast<double>(content->size()) /
                                                 (1024.0 * 1024.0));
            return outcome;
          },
      .describe = [](const bool passed, const parameter_bundle&,
                     const parameter_bundle& scratch)
          -> std::optional<std::string> {
        const auto megabytes = scratch.get<double>("megabytes");
        if (!passed) {
          return fmt::format("File too large: {:.2f}MB (max: 5MB)", megabytes);
        }
        return fmt::format("{:.2f}MB (OK)", megabytes);
      }};
}

check_t encoding_valid() {
  return check_t{
      .name = "encoding_valid",
      .display_name = "Encoding Valid (UTF-8)",
      .category = kContentValidation,
      .critical = false,
      .confidence = 98,
      .predicate =
          [](const parameter_bundle& params) {
            const auto* content = content_of(params);
            return check_outcome_t{
                .passed = content == nullptr ||
                          gatekeeper::rules::is_valid_utf8(*content)};
          },
      .describe = [](const bool passed, const parameter_bundle&,
                     const parameter_bundle&) -> std::optional<std::string> {
        return passed ? "UTF-8 encoding OK" : "Invalid encoding detected";
      }};
}

check_t no_secrets_detected() {
  return check_t{
      .name = "no_secrets_detected",
      .display_name = "No Secrets Detected",
      .category = kSecurityChecks,
      .critical = true,
      .confidence = 95,
      .predicate =
          [](const parameter_bundle& params) {
            static const auto kSecrets = std::array{
                std::regex{R"(api[_-]?key\s*[:=]\s*['"][^'"]{20,}['"])",
                           std::regex::icase},
                std::regex{R"(password\s*[:=]\s*['"][^'"]{8,}['"])",
                           std::regex::icase},
                std::regex{R"(secret\s*[:=]\s*['"][^'"]{20,}['"])",
                           std::regex::icase},
                std::regex{R"(token\s*[:=]\s*['"][^'"]{20,}['"])",
                           std::regex::icase},
                std::regex{R"(-----BEGIN (RSA |DSA )?PRIVATE KEY-----)"}};
            const auto* content = content_of(params);
            if (content == nullptr) {
              return check_outcome_t{.passed = true};
            }
            // Matched line by line; no pattern spans a newline.
            auto lines = std::istringstream{*content};
            auto line = std::string{};
            while (std::getline(lines, line)) {
              for (const auto& pattern : kSecrets) {
                if (std::regex_search(line, pattern)) {
                  return check_outcome_t{.passed = false};
                }
              }
            }
            return check_outcome_t{.passed = true};
          },
      .describe = [](const bool passed, const parameter_bundle&,
                     const parameter_bundle&) -> std::optional<std::string> {
        return passed ? "No secrets detected" : "POTENTIAL SECRETS DETECTED";
      }};
}

check_t line_endings_consistent() {
  return check_t{
      .name = "line_endings_consistent",
      .display_name = "Line Endings Consistent",
      .category = kContentValidation,
      .critical = false,
      .confidence = 90,
      .predicate =
          [](const parameter_bundle& params) {
            const auto* content = content_of(params);
            if (content == nullptr) {
              return check_outcome_t{.passed = true};
            }
            auto crlf = false;
            auto bare_lf = false;
            for (std::size_t i = 0; i < content->size(); ++i) {
              if ((*content)[i] != '\n') {
                continue;
              }
              if (i > 0 && (*content)[i - 1] == '\r') {
                crlf = true;
              } else {
                bare_lf = true;
              }
            }
            return check_outcome_t{.passed = !(crlf && bare_lf)};
          },
      .describe = [](const bool passed, const parameter_bundle&,
                     const parameter_bundle&) -> std::optional<std::string> {
        return passed ? "Line endings consistent" : "Mixed line endings";
      }};
}

check_t syntax_will_be_valid() {
  return check_t{
      .name = "syntax_will_be_valid",
      .display_name = "Syntax Will Be Valid",
      .category = kContentValidation,
      .critical = false,
      .confidence = 92,
      .predicate =
          [](const parameter_bundle& params) {
            const auto* content = content_of(params);
            const auto& file_path = params.get<std::string>(names::kFilePath);
            if (content == nullptr || !file_path.ends_with(".json")) {
              return check_outcome_t{.passed = true};
            }
            auto stream = std::istringstream{*content};
            auto tree = boost::property_tree::ptree{};
            try {
              boost::property_tree::read_json(stream, tree);
            } catch (const boost::property_tree::json_parser_error& ex) {
              auto outcome = check_outcome_t{.passed = false};
              outcome.scratch.set(
                  "syntax_error",
                  fmt::format("{} at line {}", ex.message(), ex.line()));
              return outcome;
            }
            return check_outcome_t{.passed = true};
          },
      .describe = [](const bool passed, const parameter_bundle&,
                     const parameter_bundle& scratch)
          -> std::optional<std::string> {
        if (passed) {
          return "Syntax valid";
        }
        return fmt::format("Syntax error: {}",
                           scratch.get<std::string>("syntax_error"));
      }};
}

}  // namespace

namespace gatekeeper::rules {

std::vector<alignment::check_t> make_file_operation_checks() {
  return {path_within_workspace(), not_critical_file(),
          file_size_reasonable(),  encoding_valid(),
          no_secrets_detected(),   line_endings_consistent(),
          syntax_will_be_valid()};
}

bool is_valid_utf8(const std::string_view text) {
  auto i = std::size_t{};
  while (i < text.size()) {
    const auto lead = static_cast<uint8_t>(text[i]);
    auto length = std::size_t{};
    auto code_point = uint32_t{};
    if (lead < 0x80) {
      ++i;
      continue;
    }
    if ((lead & 0xE0u) == 0xC0u) {
      length = 2;
      code_point = lead & 0x1Fu;
    } else if ((lead & 0xF0u) == 0xE0u) {
      length = 3;
      code_point = lead & 0x0Fu;
    } else if ((lead & 0xF8u) == 0xF0u) {
      length = 4;
      code_point = lead & 0x07u;
    } else {
      return false;
    }
    if (i + length > text.size()) {
      return false;
    }
    for (std::size_t k = 1; k < length; ++k) {
      const auto continuation = static_cast<uint8_t>(text[i + k]);
      if ((continuation & 0xC0u) != 0x80u) {
        return false;
      }
      code_point = (code_point << 6u) | (continuation & 0x3Fu);
    }
    constexpr auto kMinimum = std::array<uint32_t, 5>{0, 0, 0x80, 0x800, 0x10000};
    if (code_point < kMinimum[length] || code_point > 0x10FFFF ||
        (code_point >= 0xD800 && code_point <= 0xDFFF)) {
      return false;
    }
    i += length;
  }
  return true;
}

}  // namespace gatekeeper::rules
