#include "schedule_ast.h"
#include <cstdio>
#include "core/utils.h"

namespace hron::ast {

std::string TimeOfDay::toString() const {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d:%02d", hour, minute);
    return buf;
}

std::optional<MonthName> parseMonthAbbrev(const std::string& s) {
    static const char* kNames[] = {"jan", "feb", "mar", "apr", "may", "jun",
                                   "jul", "aug", "sep", "oct", "nov", "dec"};
    const std::string v = utils::to_lower(s);
    for (int i = 0; i < 12; ++i) {
        if (v == kNames[i]) return static_cast<MonthName>(i + 1);
    }
    return std::nullopt;
}

int maxDaysInMonth(MonthName m) {
    switch (m) {
        case MonthName::Feb: return 29;
        case MonthName::Apr:
        case MonthName::Jun:
        case MonthName::Sep:
        case MonthName::Nov: return 30;
        default: return 31;
    }
}

std::vector<int> DayOfMonthSpec::expand() const {
    std::vector<int> out;
    for (int d = start; d <= end; ++d) out.push_back(d);
    return out;
}

std::vector<int> DaysTarget::expand() const {
    std::vector<int> out;
    for (const auto& spec : specs) {
        auto days = spec.expand();
        out.insert(out.end(), days.begin(), days.end());
    }
    return out;
}

int exprInterval(const ScheduleExpr& expr) {
    return std::visit(overloaded{
        [](const IntervalRepeat& e) { return e.interval; },
        [](const DayRepeat& e) { return e.interval; },
        [](const WeekRepeat& e) { return e.interval; },
        [](const MonthRepeat& e) { return e.interval; },
        [](const OrdinalRepeat& e) { return e.interval; },
        [](const SingleDate&) { return 1; },
        [](const YearRepeat& e) { return e.interval; },
    }, expr);
}

} // namespace hron::ast
