#include "dcm/core/clock.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace dcm::core {

std::string IClock::now_iso8601() const {
  return format_iso8601(now());
}

Timestamp SystemClock::now() const {
  return std::chrono::system_clock::now();
}

Timestamp FixedClock::now() const {
  return fixed_time_;
}

std::string format_iso8601(Timestamp t) {
  const auto time_t_value = std::chrono::system_clock::to_time_t(t);
  std::tm utc{};
  gmtime_r(&time_t_value, &utc);

  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

}  // namespace dcm::core
