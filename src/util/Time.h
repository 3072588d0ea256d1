#pragma once

#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace time_util {

inline std::string format_iso(std::time_t t) {
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  char buf[32]{};
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

inline std::string now_iso() {
  return format_iso(std::time(nullptr));
}

// Accepts "YYYY-MM-DDTHH:MM:SS[Z]" and "YYYY-MM-DD", both read as UTC.
inline bool parse_iso(const std::string& s, std::time_t& out) {
  std::tm tm{};
  std::istringstream in(s);
  in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (in.fail()) {
    tm = std::tm{};
    std::istringstream date_only(s);
    date_only >> std::get_time(&tm, "%Y-%m-%d");
    if (date_only.fail()) return false;
  }
#if defined(_WIN32)
  out = _mkgmtime(&tm);
#else
  out = timegm(&tm);
#endif
  return out != static_cast<std::time_t>(-1);
}

inline long days_from_civil(long y, unsigned m, unsigned d) {
  y -= m <= 2;
  const long era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<long>(doe) - 719468;
}

inline long local_day_number(std::time_t t) {
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  return days_from_civil(tm.tm_year + 1900, static_cast<unsigned>(tm.tm_mon + 1),
                         static_cast<unsigned>(tm.tm_mday));
}

// Whole local calendar days from `from` to `to`; a message received earlier
// today is 0 days old regardless of the hour.
inline long calendar_days_between(std::time_t from, std::time_t to) {
  return local_day_number(to) - local_day_number(from);
}

} 
