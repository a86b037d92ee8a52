#pragma once

#include <cstdlib>
#include <utility>

#include <spdlog/spdlog.h>

namespace gatekeeper::common {

/// Abort CLI startup before any operation is validated.
///
/// The message goes through the default logger, every sink is flushed and the
/// process exits with `exit_code`. Only for faults that leave the CLI unable to
/// report a verdict, such as a log file that cannot be opened; the engine
/// itself reports problems with exceptions.
template <typename... Args>
[[noreturn]] void critical(const int exit_code,
                           spdlog::format_string_t<Args...> format,
                           Args&&... args) {
  spdlog::critical(format, std::forward<Args>(args)...);
  spdlog::shutdown();
  std::exit(exit_code);
}

}  // namespace gatekeeper::common
