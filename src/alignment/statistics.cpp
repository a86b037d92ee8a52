#include <gatekeeper/alignment/statistics.hpp>

#include <iterator>
#include <mutex>
#include <string>

namespace gatekeeper::alignment {

void statistics_store::bump(counters& target, const bool allowed) {
  target.total.fetch_add(1, std::memory_order_relaxed);
  if (allowed) {
    target.passed.fetch_add(1, std::memory_order_relaxed);
  } else {
    target.failed.fetch_add(1, std::memory_order_relaxed);
  }
}

void statistics_store::track(const std::string_view operation_type) {
  auto lock = std::unique_lock{mutex_};
  if (by_operation_type_.find(operation_type) == std::end(by_operation_type_)) {
    by_operation_type_.emplace(std::string{operation_type},
                               std::make_unique<counters>());
  }
}

void statistics_store::record(const std::string_view operation_type,
                              const bool allowed) {
  bump(overall_, allowed);
  {
    auto lock = std::shared_lock{mutex_};
    auto it = by_operation_type_.find(operation_type);
    if (it != std::end(by_operation_type_)) {
      bump(*it->second, allowed);
      return;
    }
  }
  track(operation_type);
  auto lock = std::shared_lock{mutex_};
  bump(*by_operation_type_.find(operation_type)->second, allowed);
}

schema::engine_statistics_t statistics_store::snapshot() const {
  auto out = schema::engine_statistics_t{};
  out.total_operations = overall_.total.load(std::memory_order_relaxed);
  out.passed_operations = overall_.passed.load(std::memory_order_relaxed);
  out.failed_operations = overall_.failed.load(std::memory_order_relaxed);

  auto lock = std::shared_lock{mutex_};
  for (const auto& [operation_type, value] : by_operation_type_) {
    out.by_operation_type.emplace(
        operation_type,
        schema::operation_counters_t{
            .total = value->total.load(std::memory_order_relaxed),
            .passed = value->passed.load(std::memory_order_relaxed),
            .failed = value->failed.load(std::memory_order_relaxed)});
  }
  return out;
}

}  // namespace gatekeeper::alignment
