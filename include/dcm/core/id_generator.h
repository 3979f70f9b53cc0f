#pragma once

#include <atomic>
#include <string>
#include <string_view>
#include <utility>

namespace dcm::core {

// Abstract ID generator interface for dependency injection.
// Production code stamps IDs with wall-clock microseconds; tests use a plain counter.
// Either may carry a scope, the compact period day in dcm_monitor, which is
// placed right after the prefix: "evt-20250830-...". Audit rows from different
// periods in one database then sort and filter by day.
class IIdGenerator {
 public:
  virtual ~IIdGenerator() = default;

  // Contract: returned ID is non-empty and starts with prefix.
  virtual std::string next(std::string_view prefix) = 0;

 protected:
  IIdGenerator() = default;
  IIdGenerator(const IIdGenerator&) = default;
  IIdGenerator& operator=(const IIdGenerator&) = default;
  IIdGenerator(IIdGenerator&&) = default;
  IIdGenerator& operator=(IIdGenerator&&) = default;
};

// Timestamp (microseconds) + atomic counter. Thread-safe, sortable by creation time
// within one scope.
class SystemIdGenerator final : public IIdGenerator {
 public:
  explicit SystemIdGenerator(std::string scope = {}) : scope_(std::move(scope)) {}
  ~SystemIdGenerator() override = default;

  SystemIdGenerator(const SystemIdGenerator&) = delete;
  SystemIdGenerator& operator=(const SystemIdGenerator&) = delete;
  SystemIdGenerator(SystemIdGenerator&&) = delete;
  SystemIdGenerator& operator=(SystemIdGenerator&&) = delete;

  std::string next(std::string_view prefix) override;

  [[nodiscard]] const std::string& scope() const { return scope_; }

 private:
  std::string scope_;
  std::atomic<unsigned long long> counter_{0};
};

// Sequential counter only: the same sequence of next() calls yields the same IDs.
class DeterministicIdGenerator final : public IIdGenerator {
 public:
  explicit DeterministicIdGenerator(std::string scope = {}) : scope_(std::move(scope)) {}
  ~DeterministicIdGenerator() override = default;

  DeterministicIdGenerator(const DeterministicIdGenerator&) = delete;
  DeterministicIdGenerator& operator=(const DeterministicIdGenerator&) = delete;
  DeterministicIdGenerator(DeterministicIdGenerator&&) = delete;
  DeterministicIdGenerator& operator=(DeterministicIdGenerator&&) = delete;

  std::string next(std::string_view prefix) override;

  [[nodiscard]] const std::string& scope() const { return scope_; }

 private:
  std::string scope_;
  std::atomic<unsigned long long> counter_{0};
};

}  // namespace dcm::core
