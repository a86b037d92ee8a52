#pragma once

#include <gatekeeper/schema/engine_statistics.hpp>
#include <gatekeeper/schema/primitives.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string_view>

namespace gatekeeper::alignment {

/// Running verdict counters shared by concurrent validate() calls.
///
/// Each counter is a single atomic increment per verdict. The per-type map
/// only grows through track(), which callers use when a registry is
/// installed.
class statistics_store final {
 public:
  statistics_store() = default;
  statistics_store(const statistics_store&) = delete;
  statistics_store& operator=(const statistics_store&) = delete;

  /// Ensure a zeroed entry exists for `operation_type`.
  void track(std::string_view operation_type);

  void record(std::string_view operation_type, bool allowed);

  schema::engine_statistics_t snapshot() const;

 private:
  struct counters final {
    std::atomic<uint64_t> total{};
    std::atomic<uint64_t> passed{};
    std::atomic<uint64_t> failed{};
  };

  static void bump(counters& target, bool allowed);

  counters overall_;
  mutable std::shared_mutex mutex_;
  std::map<schema::operation_type_t, std::unique_ptr<counters>, std::less<>>
      by_operation_type_;
};

}  // namespace gatekeeper::alignment
