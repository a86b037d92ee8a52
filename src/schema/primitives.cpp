#include <gatekeeper/schema/primitives.hpp>

#include <chrono>

namespace gatekeeper::schema {

timestamp_milliseconds_t now_milliseconds() {
  return static_cast<timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

}  // namespace gatekeeper::schema
