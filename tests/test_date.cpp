#include "dcm/core/clock.h"
#include "dcm/core/date.h"

#include "test_support.h"

#include <catch2/catch_test_macros.hpp>

using namespace dcm;
using dcm::testing::ymd;

TEST_CASE("parse_date_token: year-first shapes", "[core][date]") {
  CHECK(core::parse_date_token("20250830") == ymd(2025, 8, 30));
  CHECK(core::parse_date_token("2025-08-30") == ymd(2025, 8, 30));
  CHECK(core::parse_date_token("2025/08/30") == ymd(2025, 8, 30));
}

TEST_CASE("parse_date_token: year-last shapes are tried second", "[core][date]") {
  CHECK(core::parse_date_token("30082025") == ymd(2025, 8, 30));
  CHECK(core::parse_date_token("30-08-2025") == ymd(2025, 8, 30));
  CHECK(core::parse_date_token("30/08/2025") == ymd(2025, 8, 30));
}

TEST_CASE("parse_date_token: rejects impossible dates and wrong lengths", "[core][date]") {
  CHECK_FALSE(core::parse_date_token("20250230").has_value());
  CHECK_FALSE(core::parse_date_token("99999999").has_value());
  CHECK_FALSE(core::parse_date_token("2025083").has_value());
  CHECK_FALSE(core::parse_date_token("2025.08.30").has_value());
  CHECK_FALSE(core::parse_date_token("").has_value());
}

TEST_CASE("parse_date_token: leap day", "[core][date]") {
  CHECK(core::parse_date_token("20240229") == ymd(2024, 2, 29));
  CHECK_FALSE(core::parse_date_token("20250229").has_value());
}

TEST_CASE("parse_compact_date: digits only", "[core][date]") {
  CHECK(core::parse_compact_date("20250901") == ymd(2025, 9, 1));
  CHECK_FALSE(core::parse_compact_date("2025-09-01").has_value());
}

TEST_CASE("Date formatting", "[core][date]") {
  const auto d = ymd(2025, 9, 1);
  CHECK(core::format_compact(d) == "20250901");
  CHECK(core::format_iso(d) == "2025-09-01");
  CHECK(core::format_month(d) == "202509");
}

TEST_CASE("add_days crosses month and year boundaries", "[core][date]") {
  CHECK(core::add_days(ymd(2025, 8, 31), 1) == ymd(2025, 9, 1));
  CHECK(core::add_days(ymd(2025, 1, 1), -1) == ymd(2024, 12, 31));
  CHECK(core::add_days(ymd(2024, 2, 28), 1) == ymd(2024, 2, 29));
  CHECK(core::days_between(ymd(2025, 8, 21), ymd(2025, 9, 10)) == 20);
  CHECK(core::days_between(ymd(2025, 9, 10), ymd(2025, 8, 21)) == -20);
}

TEST_CASE("local_time_on lands on the requested local day and hour", "[core][date]") {
  const auto d = ymd(2025, 8, 30);
  const auto t = core::local_time_on(d, 19, 0);
  CHECK(core::local_date_of(t) == d);
  CHECK(core::local_hour_of(t) == 19);
  CHECK(core::local_time_on(d, 20, 30) - core::local_time_on(d, 19, 0) ==
        std::chrono::minutes(90));
}

TEST_CASE("format_iso8601 renders UTC to the second", "[core][clock]") {
  const auto t = dcm::testing::at_utc(ymd(2025, 8, 30), 20, 30);
  CHECK(core::format_iso8601(t) == "2025-08-30T20:30:00Z");

  core::FixedClock clock(t);
  CHECK(clock.now_iso8601() == "2025-08-30T20:30:00Z");
  clock.advance(std::chrono::seconds(61));
  CHECK(clock.now_iso8601() == "2025-08-30T20:31:01Z");
}
