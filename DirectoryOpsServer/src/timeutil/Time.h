#pragma once

#include <chrono>
#include <ctime>
#include <optional>
#include <string>

namespace timeutil {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

struct LocalDate {
    int year = 0;
    int month = 0;
    int day = 0;
    bool operator==(const LocalDate& o) const { return year == o.year && month == o.month && day == o.day; }
    bool operator!=(const LocalDate& o) const { return !(*this == o); }
};

// Sets TZ for the process. Local conversions below follow it.
void set_timezone(const std::string& tz);

// Accepts YYYY-MM-DDTHH:MM[:SS][.fff] with Z, +HH:MM, +HHMM or +HH. A space may replace
// the T. Without an offset the value is read as local time.
std::optional<TimePoint> parse_iso(const std::string& s);

std::optional<time_t> parse_iso_z(const std::string& s);
std::string format_iso_z(time_t t);
std::string format_iso_z(TimePoint tp);

// "YYYY-MM-DD HH:MM" in the local zone.
std::string format_local(TimePoint tp);

bool valid_date(const LocalDate& d);
LocalDate local_date_of(TimePoint tp);
LocalDate add_days(const LocalDate& d, int days);
std::optional<TimePoint> local_time_at(const LocalDate& d, int hour, int minute = 0);

// YYYY-MM-DD, DD.MM.YYYY, DD.MM.YY, DD/MM/YYYY, DD-MM-YYYY
std::optional<LocalDate> parse_date(const std::string& s);
std::string format_date(const LocalDate& d);

}
