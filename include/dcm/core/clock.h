#pragma once

#include <chrono>
#include <string>

namespace dcm::core {

using Timestamp = std::chrono::system_clock::time_point;

// Abstract clock interface for timestamp injection.
// Allows production code to use system time while tests use fixed or manually advanced time.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  virtual ~IClock() = default;

  [[nodiscard]] virtual Timestamp now() const = 0;

  // Return current timestamp in ISO 8601 format (UTC).
  [[nodiscard]] std::string now_iso8601() const;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: returns actual system time.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  [[nodiscard]] Timestamp now() const override;
};

// Fixed clock: returns a constant timestamp until explicitly moved.
// Not thread-safe; intended for single-threaded tests and demos.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(Timestamp fixed_time) : fixed_time_(fixed_time) {}
  ~FixedClock() override = default;

  FixedClock(const FixedClock&) = default;
  FixedClock& operator=(const FixedClock&) = default;
  FixedClock(FixedClock&&) = default;
  FixedClock& operator=(FixedClock&&) = default;

  [[nodiscard]] Timestamp now() const override;

  void set(Timestamp t) { fixed_time_ = t; }
  void advance(std::chrono::seconds delta) { fixed_time_ += delta; }

 private:
  Timestamp fixed_time_;
};

// format_iso8601 renders t as "YYYY-MM-DDTHH:MM:SSZ" (UTC, second precision).
[[nodiscard]] std::string format_iso8601(Timestamp t);

}  // namespace dcm::core
