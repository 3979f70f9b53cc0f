#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace dcm::storage {

// ISnapshotStore keeps one serialized PeriodSnapshot per period date (YYYY-MM-DD).
// Saving the same period again replaces the earlier snapshot: a monitor restarted
// within a period finalizes it again with the more complete picture.
class ISnapshotStore {
 public:
  virtual ~ISnapshotStore() = default;

  virtual void save(const std::string& period_date, const std::string& snapshot_json,
                    const std::string& saved_at) = 0;
  [[nodiscard]] virtual std::optional<std::string> get_snapshot_json(
      const std::string& period_date) const = 0;
};

class InMemorySnapshotStore final : public ISnapshotStore {
 public:
  void save(const std::string& period_date, const std::string& snapshot_json,
            const std::string& saved_at) override;
  [[nodiscard]] std::optional<std::string> get_snapshot_json(
      const std::string& period_date) const override;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, std::string> snapshots_;
};

}  // namespace dcm::storage
