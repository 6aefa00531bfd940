#include "display.h"
#include <sstream>
#include <vector>
#include "core/utils.h"

namespace hron::display {

namespace {

const char* ordinalSuffix(int n) {
    const int mod100 = n % 100;
    if (mod100 >= 11 && mod100 <= 13) return "th";
    switch (n % 10) {
        case 1: return "st";
        case 2: return "nd";
        case 3: return "rd";
        default: return "th";
    }
}

const char* unitText(int interval, ast::IntervalUnit unit) {
    if (unit == ast::IntervalUnit::Minutes) {
        return interval == 1 ? "minute" : "min";
    }
    return interval == 1 ? "hour" : "hours";
}

std::string timeList(const std::vector<ast::TimeOfDay>& times) {
    std::vector<std::string> parts;
    parts.reserve(times.size());
    for (const auto& t : times) parts.push_back(t.toString());
    return utils::join(parts, ", ");
}

std::string dayList(const std::vector<ast::Weekday>& days) {
    std::vector<std::string> parts;
    parts.reserve(days.size());
    for (auto d : days) parts.emplace_back(ast::weekdayName(d));
    return utils::join(parts, ", ");
}

std::string monthList(const std::vector<ast::MonthName>& months) {
    std::vector<std::string> parts;
    parts.reserve(months.size());
    for (auto m : months) parts.emplace_back(ast::monthName(m));
    return utils::join(parts, ", ");
}

std::string dayFilterText(const ast::DayFilter& f) {
    switch (f.kind) {
        case ast::DayFilter::Kind::Every:   return "day";
        case ast::DayFilter::Kind::Weekday: return "weekday";
        case ast::DayFilter::Kind::Weekend: return "weekend";
        case ast::DayFilter::Kind::Days:    return dayList(f.days);
    }
    return "";
}

std::string dateSpecText(const ast::DateSpec& spec) {
    return std::visit(ast::overloaded{
        [](const ast::NamedDate& d) {
            return std::string(ast::monthName(d.month)) + " " + std::to_string(d.day);
        },
        [](const ast::IsoDate& d) { return d.date; },
    }, spec);
}

std::string monthTargetText(const ast::MonthTarget& target) {
    return std::visit(ast::overloaded{
        [](const ast::DaysTarget& t) {
            std::vector<std::string> parts;
            for (const auto& s : t.specs) {
                if (s.range) {
                    parts.push_back(ordinalNumber(s.start) + " to " + ordinalNumber(s.end));
                } else {
                    parts.push_back(ordinalNumber(s.start));
                }
            }
            return utils::join(parts, ", ");
        },
        [](const ast::LastDayTarget&) { return std::string("last day"); },
        [](const ast::LastWeekdayTarget&) { return std::string("last weekday"); },
        [](const ast::NearestWeekdayTarget& t) {
            std::string out;
            if (t.direction == ast::NearestDirection::Next) out = "next ";
            else if (t.direction == ast::NearestDirection::Previous) out = "previous ";
            return out + "nearest weekday to " + ordinalNumber(t.day);
        },
        [](const ast::OrdinalWeekdayTarget& t) {
            return std::string(ast::ordinalName(t.ordinal)) + " " + ast::weekdayName(t.weekday);
        },
    }, target);
}

std::string yearTargetText(const ast::YearTarget& target) {
    return std::visit(ast::overloaded{
        [](const ast::YearDateTarget& t) {
            return std::string(ast::monthName(t.month)) + " " + std::to_string(t.day);
        },
        [](const ast::YearOrdinalWeekdayTarget& t) {
            return std::string("the ") + ast::ordinalName(t.ordinal) + " "
                   + ast::weekdayName(t.weekday) + " of " + ast::monthName(t.month);
        },
        [](const ast::YearDayOfMonthTarget& t) {
            return "the " + ordinalNumber(t.day) + " of " + ast::monthName(t.month);
        },
        [](const ast::YearLastWeekdayTarget& t) {
            return std::string("the last weekday of ") + ast::monthName(t.month);
        },
    }, target);
}

} // namespace

std::string ordinalNumber(int n) {
    return std::to_string(n) + ordinalSuffix(n);
}

std::string displayExpr(const ast::ScheduleExpr& expr) {
    std::ostringstream oss;
    std::visit(ast::overloaded{
        [&](const ast::IntervalRepeat& e) {
            oss << "every " << e.interval << " " << unitText(e.interval, e.unit)
                << " from " << e.from.toString() << " to " << e.to.toString();
            if (e.dayFilter) oss << " on " << dayFilterText(*e.dayFilter);
        },
        [&](const ast::DayRepeat& e) {
            if (e.interval > 1) {
                oss << "every " << e.interval << " days at " << timeList(e.times);
            } else {
                oss << "every " << dayFilterText(e.days) << " at " << timeList(e.times);
            }
        },
        [&](const ast::WeekRepeat& e) {
            oss << "every " << e.interval << " weeks on " << dayList(e.days)
                << " at " << timeList(e.times);
        },
        [&](const ast::MonthRepeat& e) {
            oss << "every ";
            if (e.interval > 1) oss << e.interval << " months";
            else oss << "month";
            oss << " on the " << monthTargetText(e.target) << " at " << timeList(e.times);
        },
        [&](const ast::OrdinalRepeat& e) {
            oss << ast::ordinalName(e.ordinal) << " " << ast::weekdayName(e.weekday) << " of every ";
            if (e.interval > 1) oss << e.interval << " months";
            else oss << "month";
            oss << " at " << timeList(e.times);
        },
        [&](const ast::SingleDate& e) {
            oss << "on " << dateSpecText(e.date) << " at " << timeList(e.times);
        },
        [&](const ast::YearRepeat& e) {
            oss << "every ";
            if (e.interval > 1) oss << e.interval << " years";
            else oss << "year";
            oss << " on " << yearTargetText(e.target) << " at " << timeList(e.times);
        },
    }, expr);
    return oss.str();
}

std::string display(const ast::ScheduleData& schedule) {
    std::string out = displayExpr(schedule.expr);

    if (!schedule.except.empty()) {
        std::vector<std::string> parts;
        for (const auto& e : schedule.except) parts.push_back(dateSpecText(e));
        out += " except " + utils::join(parts, ", ");
    }
    if (schedule.until) {
        out += " until " + dateSpecText(*schedule.until);
    }
    if (schedule.anchor) {
        out += " starting " + *schedule.anchor;
    }
    if (!schedule.during.empty()) {
        out += " during " + monthList(schedule.during);
    }
    if (schedule.timezone) {
        out += " in " + *schedule.timezone;
    }
    return out;
}

} // namespace hron::display
