#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <boost/program_options.hpp>
#include <cctype>
#include <gatekeeper/alignment/engine.hpp>
#include <gatekeeper/alignment/errors.hpp>
#include <gatekeeper/common/critical.hpp>
#include <gatekeeper/report/formatter.hpp>
#include <gatekeeper/rules/default_registry.hpp>
#include <gatekeeper/schema/verbosity.hpp>
#include <gatekeeper/tools/parameter_loader.hpp>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace {

namespace po = boost::program_options;

constexpr auto kExitAllowed = 0;
constexpr auto kExitDenied = 1;
constexpr auto kExitUsage = 2;
constexpr auto kEnvironmentPrefix = std::string_view{"GATEKEEPER_"};

// GATEKEEPER_MIN_CONFIDENCE -> min-confidence; anything else is ignored.
std::string environment_option(const po::options_description& description,
                               const std::string& variable) {
  if (!variable.starts_with(kEnvironmentPrefix)) {
    return {};
  }
  auto name = variable.substr(kEnvironmentPrefix.size());
  std::transform(std::begin(name), std::end(name), std::begin(name),
                 [](const char c) {
                   return c == '_' ? '-'
                                   : static_cast<char>(std::tolower(
                                         static_cast<unsigned char>(c)));
                 });
  if (description.find_nothrow(name, false) == nullptr) {
    return {};
  }
  return name;
}

void configure_logging(const std::string& level, const std::string& log_file) {
  spdlog::init_thread_pool(8192, 1);

  auto sinks = std::vector<spdlog::sink_ptr>{
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
  if (!log_file.empty()) {
    try {
      sinks.push_back(
          std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
    } catch (const spdlog::spdlog_ex& ex) {
      gatekeeper::common::critical(kExitUsage, "Cannot open log file '{}': {}",
                                   log_file, ex.what());
    }
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "gatekeeper", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(level));
}

void print_parameter_sets(const gatekeeper::alignment::registry& registry) {
  for (const auto& operation_type : registry.operation_types()) {
    const auto& parameter_set = registry.lookup(operation_type);
    std::cout << operation_type << " (" << parameter_set.checks.size()
              << " checks)\n";
    for (const auto& check : parameter_set.checks) {
      std::cout << "  " << check.name << " [" << check.category << "] "
                << check.confidence << "%"
                << (check.critical ? " critical" : "") << "\n";
    }
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  auto operation = std::string{};
  auto params_path = std::string{};
  auto assignments = std::vector<std::string>{};
  auto file_assignments = std::vector<std::string>{};
  auto policy = gatekeeper::schema::policy_config_t{};
  auto check_timeout = gatekeeper::schema::duration_milliseconds_t{};
  auto verbosity_name = std::string{};
  auto config_path = std::string{};
  auto log_level = std::string{};
  auto log_file = std::string{};

  const auto verbosity_help =
      "Report verbosity: " +
      gatekeeper::schema::accepted_names(gatekeeper::schema::kVerbosityMappings);

  auto vm = po::variables_map{};
  auto description = po::options_description{"Gatekeeper"};
  description.add_options()("help,h", "Show the help message")(
      "operation,o", po::value<std::string>(&operation),
      "Operation type to validate")(
      "params,p", po::value<std::string>(&params_path),
      "JSON file holding the parameter bundle")(
      "param", po::value<std::vector<std::string>>(&assignments)->composing(),
      "Parameter as name=value (repeatable)")(
      "param-file",
      po::value<std::vector<std::string>>(&file_assignments)->composing(),
      "Parameter as name=path, read from the file (repeatable)")(
      "min-confidence",
      po::value<uint32_t>(&policy.minimum_confidence)->default_value(85),
      "Minimum aggregate confidence for an operation to be allowed")(
      "max-non-critical-failures",
      po::value<uint32_t>(&policy.max_non_critical_failures)->default_value(2),
      "Failed non-critical checks tolerated")(
      "check-timeout-ms",
      po::value<gatekeeper::schema::duration_milliseconds_t>(&check_timeout)
          ->default_value(gatekeeper::alignment::kDefaultCheckTimeout),
      "Per-check timeout in milliseconds, 0 to disable")(
      "verbosity",
      po::value<std::string>(&verbosity_name)->default_value("full"),
      verbosity_help.c_str())(
      "config,c", po::value<std::string>(&config_path),
      "INI file with any of these options")(
      "log-level", po::value<std::string>(&log_level)->default_value("warn"),
      "spdlog level: trace, debug, info, warn, err, critical, off")(
      "log-file", po::value<std::string>(&log_file),
      "Also write logs to this file")(
      "list", "List registered parameter sets and exit")(
      "stats", "Print engine statistics after the report");

  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    po::store(po::parse_environment(description,
                                    [&](const std::string& variable) {
                                      return environment_option(description,
                                                                variable);
                                    }),
              vm);
    if (vm.contains("config")) {
      po::store(po::parse_config_file<char>(
                    vm["config"].as<std::string>().c_str(), description),
                vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << "gatekeeper: " << ex.what() << "\n" << description << "\n";
    return kExitUsage;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return kExitAllowed;
  }

  configure_logging(log_level, log_file);

  const auto verbosity =
      gatekeeper::schema::try_from_string<gatekeeper::schema::verbosity_t>(
          verbosity_name);
  if (!verbosity) {
    spdlog::error("Unknown verbosity '{}', expected {}", verbosity_name,
                  gatekeeper::schema::accepted_names(
                      gatekeeper::schema::kVerbosityMappings));
    spdlog::shutdown();
    return kExitUsage;
  }

  auto exit_code = kExitUsage;
  try {
    auto registry = gatekeeper::rules::make_default_registry();
    if (vm.contains("list")) {
      print_parameter_sets(registry);
      spdlog::shutdown();
      return kExitAllowed;
    }
    if (operation.empty()) {
      spdlog::error("--operation is required");
      spdlog::shutdown();
      return kExitUsage;
    }

    auto params = params_path.empty()
                      ? gatekeeper::schema::parameter_bundle{}
                      : gatekeeper::tools::load_parameter_bundle(params_path);
    for (const auto& assignment : assignments) {
      gatekeeper::tools::apply_assignment(params, assignment);
    }
    for (const auto& assignment : file_assignments) {
      gatekeeper::tools::apply_file_assignment(params, assignment);
    }

    auto engine = gatekeeper::alignment::engine{std::move(registry), policy,
                                                check_timeout};
    const auto verdict = engine.validate(operation, params);
    std::cout << gatekeeper::report::render_verdict(verdict, *verbosity);
    if (vm.contains("stats")) {
      std::cout << gatekeeper::report::render_statistics(engine.statistics());
    }
    exit_code = verdict.allowed ? kExitAllowed : kExitDenied;
  } catch (const gatekeeper::alignment::configuration_error& ex) {
    spdlog::error("Configuration error: {}", ex.what());
  } catch (const gatekeeper::tools::load_error& ex) {
    spdlog::error("Cannot load parameters: {}", ex.what());
  }

  spdlog::shutdown();
  return exit_code;
}
