#include "calendar.h"
#include <cstdio>

namespace hron::ast::calendar {

std::optional<absl::CivilDay> makeDate(absl::civil_year_t y, int m, int d) {
    if (m < 1 || m > 12 || d < 1 || d > 31) return std::nullopt;
    const absl::CivilDay day(y, m, d);
    // absl 会把越界日期规范化到下个月，这里要拒绝
    if (day.year() != y || day.month() != m || day.day() != d) return std::nullopt;
    return day;
}

std::optional<absl::CivilDay> parseIsoDate(const std::string& s) {
    if (s.size() != 10 || s[4] != '-' || s[7] != '-') return std::nullopt;
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (s[i] < '0' || s[i] > '9') return std::nullopt;
    }
    const int y = std::stoi(s.substr(0, 4));
    const int m = std::stoi(s.substr(5, 2));
    const int d = std::stoi(s.substr(8, 2));
    return makeDate(y, m, d);
}

std::string formatIsoDate(const absl::CivilDay& d) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04lld-%02d-%02d",
                  static_cast<long long>(d.year()), d.month(), d.day());
    return buf;
}

absl::CivilDay firstOfMonth(absl::civil_year_t y, int m) {
    return absl::CivilDay(y, m, 1);
}

absl::CivilDay lastDayOfMonth(absl::civil_year_t y, int m) {
    return absl::CivilDay(absl::CivilMonth(y, m) + 1) - 1;
}

Weekday weekdayOf(const absl::CivilDay& d) {
    switch (absl::GetWeekday(d)) {
        case absl::Weekday::monday:    return Weekday::Monday;
        case absl::Weekday::tuesday:   return Weekday::Tuesday;
        case absl::Weekday::wednesday: return Weekday::Wednesday;
        case absl::Weekday::thursday:  return Weekday::Thursday;
        case absl::Weekday::friday:    return Weekday::Friday;
        case absl::Weekday::saturday:  return Weekday::Saturday;
        case absl::Weekday::sunday:    return Weekday::Sunday;
    }
    return Weekday::Monday;
}

absl::CivilDay lastWeekdayOfMonth(absl::civil_year_t y, int m) {
    absl::CivilDay d = lastDayOfMonth(y, m);
    while (isWeekend(d)) {
        d -= 1;
    }
    return d;
}

std::optional<absl::CivilDay> nthWeekdayOfMonth(absl::civil_year_t y, int m, Weekday wd, int n) {
    absl::CivilDay d = firstOfMonth(y, m);
    while (weekdayOf(d) != wd) {
        d += 1;
    }
    d += (n - 1) * 7;
    if (d.month() != m) return std::nullopt;
    return d;
}

absl::CivilDay lastWeekdayInMonth(absl::civil_year_t y, int m, Weekday wd) {
    absl::CivilDay d = lastDayOfMonth(y, m);
    while (weekdayOf(d) != wd) {
        d -= 1;
    }
    return d;
}

std::optional<absl::CivilDay> ordinalWeekdayOfMonth(absl::civil_year_t y, int m,
                                                    OrdinalPosition ord, Weekday wd) {
    if (ord == OrdinalPosition::Last) {
        return lastWeekdayInMonth(y, m, wd);
    }
    return nthWeekdayOfMonth(y, m, wd, ordinalToN(ord));
}

std::optional<absl::CivilDay> nearestWeekday(absl::civil_year_t y, int m, int targetDay,
                                             NearestDirection direction) {
    const int lastDay = lastDayOfMonth(y, m).day();
    if (targetDay < 1 || targetDay > lastDay) {
        return std::nullopt;
    }

    const absl::CivilDay date(y, m, targetDay);
    const Weekday w = weekdayOf(date);

    if (w == Weekday::Saturday) {
        switch (direction) {
            case NearestDirection::None:
                // 月初的周六不能退到上个月，改取周一
                return targetDay == 1 ? date + 2 : date - 1;
            case NearestDirection::Next:
                return date + 2;
            case NearestDirection::Previous:
                return date - 1;
        }
    }
    if (w == Weekday::Sunday) {
        switch (direction) {
            case NearestDirection::None:
                // 月末的周日不能进到下个月，改取周五
                return targetDay >= lastDay ? date - 2 : date + 1;
            case NearestDirection::Next:
                return date + 1;
            case NearestDirection::Previous:
                return date - 2;
        }
    }
    return date;
}

absl::CivilDay mondayOf(const absl::CivilDay& d) {
    return d - (weekdayNumber(weekdayOf(d)) - 1);
}

long monthsBetween(const absl::CivilDay& a, const absl::CivilDay& b) {
    return static_cast<long>((b.year() * 12 + b.month()) - (a.year() * 12 + a.month()));
}

} // namespace hron::ast::calendar
