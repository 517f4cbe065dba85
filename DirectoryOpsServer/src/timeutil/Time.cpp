#include "Time.h"
#include <cctype>
#include <cstdlib>
#include <cstdio>

namespace timeutil {

void set_timezone(const std::string& tz) {
    if (tz.empty()) return;
    setenv("TZ", tz.c_str(), 1);
    tzset();
}

static bool read_digits(const std::string& s, size_t pos, size_t count, int& out) {
    if (pos + count > s.size()) return false;
    int v = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
        v = v * 10 + (s[i] - '0');
    }
    out = v;
    return true;
}

static bool fields_match(const std::tm& tm, int y, int mon, int d, int h, int mi) {
    return tm.tm_year == y - 1900 && tm.tm_mon == mon - 1 && tm.tm_mday == d && tm.tm_hour == h && tm.tm_min == mi;
}

std::optional<TimePoint> parse_iso(const std::string& s) {
    int y = 0, mon = 0, d = 0, h = 0, mi = 0, sec = 0;
    if (!read_digits(s, 0, 4, y) || s.size() < 16) return std::nullopt;
    if (s[4] != '-' || s[7] != '-' || (s[10] != 'T' && s[10] != ' ') || s[13] != ':') return std::nullopt;
    if (!read_digits(s, 5, 2, mon) || !read_digits(s, 8, 2, d)) return std::nullopt;
    if (!read_digits(s, 11, 2, h) || !read_digits(s, 14, 2, mi)) return std::nullopt;
    size_t pos = 16;
    if (pos < s.size() && s[pos] == ':') {
        if (!read_digits(s, pos + 1, 2, sec)) return std::nullopt;
        pos += 3;
    }
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) ++pos;
    }
    if (mon < 1 || mon > 12 || d < 1 || d > 31 || h > 23 || mi > 59 || sec > 60) return std::nullopt;

    std::tm tm{};
    tm.tm_year = y - 1900;
    tm.tm_mon = mon - 1;
    tm.tm_mday = d;
    tm.tm_hour = h;
    tm.tm_min = mi;
    tm.tm_sec = sec;

    if (pos == s.size()) {
        tm.tm_isdst = -1;
        std::tm check = tm;
        time_t t = mktime(&check);
        if (t == static_cast<time_t>(-1) || check.tm_mday != d || check.tm_mon != mon - 1) return std::nullopt;
        return Clock::from_time_t(t);
    }

    long offset_sec = 0;
    if (s[pos] == 'Z' || s[pos] == 'z') {
        if (pos + 1 != s.size()) return std::nullopt;
    } else if (s[pos] == '+' || s[pos] == '-') {
        int sign = s[pos] == '-' ? -1 : 1;
        int oh = 0, om = 0;
        if (!read_digits(s, pos + 1, 2, oh)) return std::nullopt;
        size_t rest = pos + 3;
        if (rest < s.size() && s[rest] == ':') ++rest;
        if (rest < s.size()) {
            if (!read_digits(s, rest, 2, om) || rest + 2 != s.size()) return std::nullopt;
        }
        if (oh > 18 || om > 59) return std::nullopt;
        offset_sec = sign * (oh * 3600L + om * 60L);
    } else {
        return std::nullopt;
    }

    time_t t = timegm(&tm);
    std::tm check{};
    gmtime_r(&t, &check);
    if (!fields_match(check, y, mon, d, h, mi)) return std::nullopt;
    return Clock::from_time_t(t - offset_sec);
}

std::optional<time_t> parse_iso_z(const std::string& s) {
    if (s.empty() || (s.back() != 'Z' && s.back() != 'z')) return std::nullopt;
    auto tp = parse_iso(s);
    if (!tp) return std::nullopt;
    return Clock::to_time_t(*tp);
}

std::string format_iso_z(time_t t) {
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buf);
}

std::string format_iso_z(TimePoint tp) {
    return format_iso_z(Clock::to_time_t(tp));
}

std::string format_local(TimePoint tp) {
    time_t t = Clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &tm);
    return std::string(buf);
}

bool valid_date(const LocalDate& d) {
    if (d.year < 1970 || d.year > 9999 || d.month < 1 || d.month > 12 || d.day < 1) return false;
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    int max_day = days[d.month - 1];
    bool leap = (d.year % 4 == 0 && d.year % 100 != 0) || d.year % 400 == 0;
    if (d.month == 2 && leap) max_day = 29;
    return d.day <= max_day;
}

LocalDate local_date_of(TimePoint tp) {
    time_t t = Clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    return LocalDate{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday};
}

LocalDate add_days(const LocalDate& d, int days) {
    std::tm tm{};
    tm.tm_year = d.year - 1900;
    tm.tm_mon = d.month - 1;
    tm.tm_mday = d.day + days;
    tm.tm_hour = 12;
    timegm(&tm);
    return LocalDate{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday};
}

std::optional<TimePoint> local_time_at(const LocalDate& d, int hour, int minute) {
    if (!valid_date(d) || hour < 0 || hour > 23 || minute < 0 || minute > 59) return std::nullopt;
    std::tm tm{};
    tm.tm_year = d.year - 1900;
    tm.tm_mon = d.month - 1;
    tm.tm_mday = d.day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_isdst = -1;
    time_t t = mktime(&tm);
    if (t == static_cast<time_t>(-1)) return std::nullopt;
    return Clock::from_time_t(t);
}

std::optional<LocalDate> parse_date(const std::string& s) {
    LocalDate d;
    if (s.size() == 10 && s[4] == '-' && s[7] == '-') {
        if (!read_digits(s, 0, 4, d.year) || !read_digits(s, 5, 2, d.month) || !read_digits(s, 8, 2, d.day)) return std::nullopt;
        if (!valid_date(d)) return std::nullopt;
        return d;
    }
    if (s.size() != 8 && s.size() != 10) return std::nullopt;
    char sep = s[2];
    if ((sep != '.' && sep != '/' && sep != '-') || s[5] != sep) return std::nullopt;
    if (!read_digits(s, 0, 2, d.day) || !read_digits(s, 3, 2, d.month)) return std::nullopt;
    if (s.size() == 10) {
        if (!read_digits(s, 6, 4, d.year)) return std::nullopt;
    } else {
        if (!read_digits(s, 6, 2, d.year)) return std::nullopt;
        d.year += 2000;
    }
    if (!valid_date(d)) return std::nullopt;
    return d;
}

std::string format_date(const LocalDate& d) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", d.year, d.month, d.day);
    return std::string(buf);
}

}
