#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "schedule_types.h"

namespace hron::ast {

// std::visit 用的多 lambda 组合器；不写兜底分支，漏掉的变体在编译期报错
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

struct DayFilter {
    enum class Kind { Every, Weekday, Weekend, Days };

    Kind kind{Kind::Every};
    std::vector<Weekday> days;   // 仅 Kind::Days 使用

    static DayFilter every() { return DayFilter{Kind::Every, {}}; }
    static DayFilter weekday() { return DayFilter{Kind::Weekday, {}}; }
    static DayFilter weekend() { return DayFilter{Kind::Weekend, {}}; }
    static DayFilter list(std::vector<Weekday> d) { return DayFilter{Kind::Days, std::move(d)}; }

    bool operator==(const DayFilter& o) const { return kind == o.kind && days == o.days; }
    bool operator!=(const DayFilter& o) const { return !(*this == o); }
};

struct DayOfMonthSpec {
    int start{1};
    int end{1};
    bool range{false};

    static DayOfMonthSpec single(int d) { return DayOfMonthSpec{d, d, false}; }
    static DayOfMonthSpec between(int a, int b) { return DayOfMonthSpec{a, b, true}; }

    std::vector<int> expand() const;

    bool operator==(const DayOfMonthSpec& o) const {
        return start == o.start && end == o.end && range == o.range;
    }
};

// ---- MonthTarget ----

struct DaysTarget {
    std::vector<DayOfMonthSpec> specs;
    std::vector<int> expand() const;
    bool operator==(const DaysTarget& o) const { return specs == o.specs; }
};

struct LastDayTarget {
    bool operator==(const LastDayTarget&) const { return true; }
};

struct LastWeekdayTarget {
    bool operator==(const LastWeekdayTarget&) const { return true; }
};

struct NearestWeekdayTarget {
    int day{1};
    NearestDirection direction{NearestDirection::None};
    bool operator==(const NearestWeekdayTarget& o) const {
        return day == o.day && direction == o.direction;
    }
};

struct OrdinalWeekdayTarget {
    OrdinalPosition ordinal{OrdinalPosition::First};
    Weekday weekday{Weekday::Monday};
    bool operator==(const OrdinalWeekdayTarget& o) const {
        return ordinal == o.ordinal && weekday == o.weekday;
    }
};

using MonthTarget = std::variant<DaysTarget,
                                 LastDayTarget,
                                 LastWeekdayTarget,
                                 NearestWeekdayTarget,
                                 OrdinalWeekdayTarget>;

// ---- YearTarget ----

struct YearDateTarget {
    MonthName month{MonthName::Jan};
    int day{1};
    bool operator==(const YearDateTarget& o) const { return month == o.month && day == o.day; }
};

struct YearOrdinalWeekdayTarget {
    OrdinalPosition ordinal{OrdinalPosition::First};
    Weekday weekday{Weekday::Monday};
    MonthName month{MonthName::Jan};
    bool operator==(const YearOrdinalWeekdayTarget& o) const {
        return ordinal == o.ordinal && weekday == o.weekday && month == o.month;
    }
};

struct YearDayOfMonthTarget {
    int day{1};
    MonthName month{MonthName::Jan};
    bool operator==(const YearDayOfMonthTarget& o) const { return day == o.day && month == o.month; }
};

struct YearLastWeekdayTarget {
    MonthName month{MonthName::Jan};
    bool operator==(const YearLastWeekdayTarget& o) const { return month == o.month; }
};

using YearTarget = std::variant<YearDateTarget,
                                YearOrdinalWeekdayTarget,
                                YearDayOfMonthTarget,
                                YearLastWeekdayTarget>;

// ---- DateSpec（single date / except / until 共用） ----

struct NamedDate {
    MonthName month{MonthName::Jan};
    int day{1};
    bool operator==(const NamedDate& o) const { return month == o.month && day == o.day; }
};

struct IsoDate {
    std::string date;   // YYYY-MM-DD，解析阶段已校验
    bool operator==(const IsoDate& o) const { return date == o.date; }
};

using DateSpec = std::variant<NamedDate, IsoDate>;
using ExceptionSpec = DateSpec;
using UntilSpec = DateSpec;

// ---- ScheduleExpr ----

struct IntervalRepeat {
    int interval{1};
    IntervalUnit unit{IntervalUnit::Minutes};
    TimeOfDay from;
    TimeOfDay to;
    std::optional<DayFilter> dayFilter;

    bool operator==(const IntervalRepeat& o) const {
        return interval == o.interval && unit == o.unit && from == o.from && to == o.to
               && dayFilter == o.dayFilter;
    }
};

struct DayRepeat {
    int interval{1};
    DayFilter days;
    std::vector<TimeOfDay> times;

    bool operator==(const DayRepeat& o) const {
        return interval == o.interval && days == o.days && times == o.times;
    }
};

struct WeekRepeat {
    int interval{1};
    std::vector<Weekday> days;
    std::vector<TimeOfDay> times;

    bool operator==(const WeekRepeat& o) const {
        return interval == o.interval && days == o.days && times == o.times;
    }
};

struct MonthRepeat {
    int interval{1};
    MonthTarget target;
    std::vector<TimeOfDay> times;

    bool operator==(const MonthRepeat& o) const {
        return interval == o.interval && target == o.target && times == o.times;
    }
};

struct OrdinalRepeat {
    int interval{1};
    OrdinalPosition ordinal{OrdinalPosition::First};
    Weekday weekday{Weekday::Monday};
    std::vector<TimeOfDay> times;

    bool operator==(const OrdinalRepeat& o) const {
        return interval == o.interval && ordinal == o.ordinal && weekday == o.weekday
               && times == o.times;
    }
};

struct SingleDate {
    DateSpec date;
    std::vector<TimeOfDay> times;

    bool operator==(const SingleDate& o) const { return date == o.date && times == o.times; }
};

struct YearRepeat {
    int interval{1};
    YearTarget target;
    std::vector<TimeOfDay> times;

    bool operator==(const YearRepeat& o) const {
        return interval == o.interval && target == o.target && times == o.times;
    }
};

using ScheduleExpr = std::variant<IntervalRepeat,
                                  DayRepeat,
                                  WeekRepeat,
                                  MonthRepeat,
                                  OrdinalRepeat,
                                  SingleDate,
                                  YearRepeat>;

// 根节点。解析器构造一次，之后只读
struct ScheduleData {
    ScheduleExpr expr;
    std::optional<std::string> timezone;
    std::vector<ExceptionSpec> except;
    std::optional<UntilSpec> until;
    std::optional<std::string> anchor;   // starting YYYY-MM-DD
    std::vector<MonthName> during;

    bool operator==(const ScheduleData& o) const {
        return expr == o.expr && timezone == o.timezone && except == o.except
               && until == o.until && anchor == o.anchor && during == o.during;
    }
    bool operator!=(const ScheduleData& o) const { return !(*this == o); }
};

// 表达式的 interval（SingleDate 视为 1）
int exprInterval(const ScheduleExpr& expr);

} // namespace hron::ast
