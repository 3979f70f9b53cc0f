#include "dcm/core/date.h"

#include <cstdio>
#include <ctime>

namespace dcm::core {

namespace {

// Collect the digits of text into out; returns false on any character that is
// neither a digit nor one of the accepted separators.
bool collect_digits(std::string_view text, std::string& out) {
  out.clear();
  for (const char ch : text) {
    if (ch >= '0' && ch <= '9') {
      out.push_back(ch);
    } else if (ch != '-' && ch != '/') {
      return false;
    }
  }
  return true;
}

int to_int(std::string_view digits) {
  int value = 0;
  for (const char ch : digits) {
    value = value * 10 + (ch - '0');
  }
  return value;
}

std::optional<Date> make_date(int y, int m, int d) {
  const Date date{std::chrono::year{y}, std::chrono::month{static_cast<unsigned>(m)},
                  std::chrono::day{static_cast<unsigned>(d)}};
  if (!date.ok()) {
    return std::nullopt;
  }
  return date;
}

}  // namespace

std::optional<Date> parse_compact_date(std::string_view text) {
  if (text.size() != 8) {
    return std::nullopt;
  }
  for (const char ch : text) {
    if (ch < '0' || ch > '9') {
      return std::nullopt;
    }
  }
  return make_date(to_int(text.substr(0, 4)), to_int(text.substr(4, 2)),
                   to_int(text.substr(6, 2)));
}

std::optional<Date> parse_date_token(std::string_view text) {
  std::string digits;
  if (!collect_digits(text, digits) || digits.size() != 8) {
    return std::nullopt;
  }

  if (auto year_first = parse_compact_date(digits)) {
    return year_first;
  }

  const std::string_view view{digits};
  return make_date(to_int(view.substr(4, 4)), to_int(view.substr(2, 2)),
                   to_int(view.substr(0, 2)));
}

std::string format_compact(const Date& d) {
  char buf[16];  // NOLINT(modernize-avoid-c-arrays)
  std::snprintf(buf, sizeof(buf), "%04d%02u%02u", static_cast<int>(d.year()),
                static_cast<unsigned>(d.month()), static_cast<unsigned>(d.day()));
  return buf;
}

std::string format_iso(const Date& d) {
  char buf[16];  // NOLINT(modernize-avoid-c-arrays)
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(d.year()),
                static_cast<unsigned>(d.month()), static_cast<unsigned>(d.day()));
  return buf;
}

std::string format_month(const Date& d) {
  return format_compact(d).substr(0, 6);
}

Date add_days(const Date& d, int days) {
  return Date{std::chrono::sys_days{d} + std::chrono::days{days}};
}

int days_between(const Date& from, const Date& to) {
  return static_cast<int>((std::chrono::sys_days{to} - std::chrono::sys_days{from}).count());
}

Date local_date_of(Timestamp t) {
  const auto time_t_value = std::chrono::system_clock::to_time_t(t);
  std::tm local{};
  localtime_r(&time_t_value, &local);
  return Date{std::chrono::year{local.tm_year + 1900},
              std::chrono::month{static_cast<unsigned>(local.tm_mon + 1)},
              std::chrono::day{static_cast<unsigned>(local.tm_mday)}};
}

Timestamp local_time_on(const Date& d, int hour, int minute) {
  std::tm local{};
  local.tm_year = static_cast<int>(d.year()) - 1900;
  local.tm_mon = static_cast<int>(static_cast<unsigned>(d.month())) - 1;
  local.tm_mday = static_cast<int>(static_cast<unsigned>(d.day()));
  local.tm_hour = hour;
  local.tm_min = minute;
  local.tm_sec = 0;
  local.tm_isdst = -1;
  return std::chrono::system_clock::from_time_t(std::mktime(&local));
}

int local_hour_of(Timestamp t) {
  const auto time_t_value = std::chrono::system_clock::to_time_t(t);
  std::tm local{};
  localtime_r(&time_t_value, &local);
  return local.tm_hour;
}

}  // namespace dcm::core
