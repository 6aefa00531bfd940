#pragma once
#include <optional>
#include <string>

namespace hron::ast {

// ISO 编号：Monday=1 ... Sunday=7
enum class Weekday {
    Monday = 1,
    Tuesday,
    Wednesday,
    Thursday,
    Friday,
    Saturday,
    Sunday,
};

inline int weekdayNumber(Weekday w) { return static_cast<int>(w); }

// cron 编号：Sunday=0 ... Saturday=6
inline int weekdayCronDow(Weekday w) { return static_cast<int>(w) % 7; }

inline std::optional<Weekday> weekdayFromNumber(int n) {
    if (n < 1 || n > 7) return std::nullopt;
    return static_cast<Weekday>(n);
}

inline const char* weekdayName(Weekday w) {
    switch (w) {
        case Weekday::Monday:    return "monday";
        case Weekday::Tuesday:   return "tuesday";
        case Weekday::Wednesday: return "wednesday";
        case Weekday::Thursday:  return "thursday";
        case Weekday::Friday:    return "friday";
        case Weekday::Saturday:  return "saturday";
        case Weekday::Sunday:    return "sunday";
    }
    return "";
}

enum class MonthName {
    Jan = 1, Feb, Mar, Apr, May, Jun,
    Jul, Aug, Sep, Oct, Nov, Dec,
};

inline int monthNumber(MonthName m) { return static_cast<int>(m); }

inline std::optional<MonthName> monthFromNumber(int n) {
    if (n < 1 || n > 12) return std::nullopt;
    return static_cast<MonthName>(n);
}

inline const char* monthName(MonthName m) {
    switch (m) {
        case MonthName::Jan: return "jan";
        case MonthName::Feb: return "feb";
        case MonthName::Mar: return "mar";
        case MonthName::Apr: return "apr";
        case MonthName::May: return "may";
        case MonthName::Jun: return "jun";
        case MonthName::Jul: return "jul";
        case MonthName::Aug: return "aug";
        case MonthName::Sep: return "sep";
        case MonthName::Oct: return "oct";
        case MonthName::Nov: return "nov";
        case MonthName::Dec: return "dec";
    }
    return "";
}

// 三字母缩写（大小写不敏感），cron 的月份字段用
std::optional<MonthName> parseMonthAbbrev(const std::string& s);

// 该月在闰年里最多有几天（feb=29）
int maxDaysInMonth(MonthName m);

enum class OrdinalPosition {
    First,
    Second,
    Third,
    Fourth,
    Fifth,
    Last,
};

// First..Fifth -> 1..5；Last 没有固定序号，返回 0
inline int ordinalToN(OrdinalPosition o) {
    switch (o) {
        case OrdinalPosition::First:  return 1;
        case OrdinalPosition::Second: return 2;
        case OrdinalPosition::Third:  return 3;
        case OrdinalPosition::Fourth: return 4;
        case OrdinalPosition::Fifth:  return 5;
        case OrdinalPosition::Last:   return 0;
    }
    return 0;
}

inline const char* ordinalName(OrdinalPosition o) {
    switch (o) {
        case OrdinalPosition::First:  return "first";
        case OrdinalPosition::Second: return "second";
        case OrdinalPosition::Third:  return "third";
        case OrdinalPosition::Fourth: return "fourth";
        case OrdinalPosition::Fifth:  return "fifth";
        case OrdinalPosition::Last:   return "last";
    }
    return "";
}

enum class IntervalUnit {
    Minutes,
    Hours,
};

enum class NearestDirection {
    None,      // 标准 cron W：不跨月
    Next,      // 总是取后一个工作日，可跨月
    Previous,  // 总是取前一个工作日，可跨月
};

struct TimeOfDay {
    int hour{0};
    int minute{0};

    int totalMinutes() const { return hour * 60 + minute; }
    std::string toString() const;

    bool operator==(const TimeOfDay& o) const { return hour == o.hour && minute == o.minute; }
    bool operator!=(const TimeOfDay& o) const { return !(*this == o); }
};

} // namespace hron::ast
