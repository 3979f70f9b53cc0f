#pragma once

#include "dcm/core/clock.h"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace dcm::core {

// Calendar date vocabulary type. All arithmetic goes through sys_days so month
// and year boundaries are handled by <chrono>.
using Date = std::chrono::year_month_day;

// parse_compact_date accepts exactly eight digits in YYYYMMDD order and
// returns nullopt unless they form a valid calendar date.
[[nodiscard]] std::optional<Date> parse_compact_date(std::string_view text);

// parse_date_token accepts the date shapes that appear in field filenames:
//   YYYYMMDD, YYYY-MM-DD, YYYY/MM/DD  (year first)
//   DDMMYYYY, DD-MM-YYYY, DD/MM/YYYY  (year last)
// Separators are optional but a token must contain exactly eight digits.
// Year-first is tried before year-last.
[[nodiscard]] std::optional<Date> parse_date_token(std::string_view text);

[[nodiscard]] std::string format_compact(const Date& d);  // YYYYMMDD
[[nodiscard]] std::string format_iso(const Date& d);      // YYYY-MM-DD
[[nodiscard]] std::string format_month(const Date& d);    // YYYYMM

[[nodiscard]] Date add_days(const Date& d, int days);

// days_between returns (to - from) in whole days; negative when to precedes from.
[[nodiscard]] int days_between(const Date& from, const Date& to);

// Local-time helpers used at the application boundary to turn configured
// wall-clock values ("19:00 on the period day") into timestamps.
[[nodiscard]] Date local_date_of(Timestamp t);
[[nodiscard]] Timestamp local_time_on(const Date& d, int hour, int minute);
[[nodiscard]] int local_hour_of(Timestamp t);

}  // namespace dcm::core
