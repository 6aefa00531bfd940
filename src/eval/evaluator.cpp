#include "evaluator.h"
#include <algorithm>
#include <functional>
#include <utility>
#include <absl/time/civil_time.h>
#include "ast/calendar.h"
#include "core/hron_error.h"
#include "log/logger.h"

namespace hron::eval {

namespace cal = ast::calendar;

namespace {

// 默认锚点：epoch 日期；周重复用 epoch 之后的第一个周一
const absl::CivilDay kEpochDate(1970, 1, 1);
const absl::CivilDay kEpochMonday(1970, 1, 5);

// 每种表达式自己的搜索上限
constexpr int kDayScan = 8;
constexpr int kLongDayScan = 400;
constexpr int kWeekScan = 54;
constexpr int kMonthsPerInterval = 24;
constexpr int kYearsPerInterval = 8;

using Candidates = std::vector<absl::CivilDay>;
using MonthCandidatesFn = std::function<Candidates(const absl::CivilMonth&)>;

struct EvalContext {
    const absl::TimeZone& tz;
    std::optional<absl::CivilDay> anchor;
};

std::optional<absl::CivilDay> anchorOf(const ast::ScheduleData& schedule) {
    if (!schedule.anchor) return std::nullopt;
    auto d = cal::parseIsoDate(*schedule.anchor);
    if (!d) {
        throw evalError("invalid starting date: " + *schedule.anchor);
    }
    return d;
}

absl::CivilDay isoDateOrThrow(const std::string& s) {
    auto d = cal::parseIsoDate(s);
    if (!d) {
        throw evalError("invalid date: " + s);
    }
    return *d;
}

// 墙上时间 -> 时刻。落在夏令时缺口里按缺口前的偏移换算（等价于往后推一个缺口），
// 重叠时取较早的那一次
absl::Time atTimeOnDate(const absl::CivilDay& d, const ast::TimeOfDay& tod, const absl::TimeZone& tz) {
    const absl::CivilSecond cs(d.year(), d.month(), d.day(), tod.hour, tod.minute, 0);
    return tz.At(cs).pre;
}

bool matchesDayFilter(const absl::CivilDay& d, const ast::DayFilter& f) {
    const ast::Weekday w = cal::weekdayOf(d);
    switch (f.kind) {
        case ast::DayFilter::Kind::Every:
            return true;
        case ast::DayFilter::Kind::Weekday:
            return !cal::isWeekend(d);
        case ast::DayFilter::Kind::Weekend:
            return cal::isWeekend(d);
        case ast::DayFilter::Kind::Days:
            return std::find(f.days.begin(), f.days.end(), w) != f.days.end();
    }
    return false;
}

bool matchesDuring(const absl::CivilDay& d, const std::vector<ast::MonthName>& during) {
    if (during.empty()) return true;
    for (auto m : during) {
        if (ast::monthNumber(m) == d.month()) return true;
    }
    return false;
}

bool dateSpecMatches(const absl::CivilDay& d, const ast::DateSpec& spec) {
    return std::visit(ast::overloaded{
        [&](const ast::NamedDate& n) {
            return d.month() == ast::monthNumber(n.month) && d.day() == n.day;
        },
        [&](const ast::IsoDate& iso) {
            auto target = cal::parseIsoDate(iso.date);
            return target && *target == d;
        },
    }, spec);
}

bool isExcepted(const absl::CivilDay& d, const std::vector<ast::ExceptionSpec>& except) {
    for (const auto& e : except) {
        if (dateSpecMatches(d, e)) return true;
    }
    return false;
}

// 下一个允许月份的 1 号（跨年回绕）
absl::CivilDay nextDuringMonth(const absl::CivilDay& d, const std::vector<ast::MonthName>& during) {
    std::vector<int> months;
    for (auto m : during) months.push_back(ast::monthNumber(m));
    std::sort(months.begin(), months.end());

    for (int m : months) {
        if (m > d.month()) return cal::firstOfMonth(d.year(), m);
    }
    return cal::firstOfMonth(d.year() + 1, months.front());
}

// 往前找最近的允许月份，返回它的最后一天
absl::CivilDay prevDuringMonth(const absl::CivilDay& d, const std::vector<ast::MonthName>& during) {
    absl::CivilMonth m = absl::CivilMonth(d) - 1;
    for (int i = 0; i < 13; ++i) {
        for (auto allowed : during) {
            if (ast::monthNumber(allowed) == m.month()) {
                return cal::lastDayOfMonth(m.year(), m.month());
            }
        }
        m -= 1;
    }
    return d - 1;
}

// until 的具体日期：ISO 原样；月日形式取 reference 当天或之后最近的那一次
absl::CivilDay resolveUntil(const ast::UntilSpec& until, const absl::CivilDay& reference) {
    return std::visit(ast::overloaded{
        [&](const ast::IsoDate& iso) { return isoDateOrThrow(iso.date); },
        [&](const ast::NamedDate& n) {
            const int m = ast::monthNumber(n.month);
            for (auto y = reference.year(); y <= reference.year() + 1; ++y) {
                auto d = cal::makeDate(y, m, n.day);
                if (d && *d >= reference) return *d;
            }
            // 次年也没有这一天（非闰年的 feb 29），收敛到月末
            const absl::CivilDay last = cal::lastDayOfMonth(reference.year() + 1, m);
            return std::min(last, absl::CivilDay(reference.year() + 1, m, 1) + (n.day - 1));
        },
    }, until);
}

// 当天所有时间点里严格晚于 now 的最早一个
std::optional<absl::Time> earliestFutureAtTimes(const absl::CivilDay& d,
                                                const std::vector<ast::TimeOfDay>& times,
                                                const absl::TimeZone& tz,
                                                absl::Time now) {
    std::optional<absl::Time> best;
    for (const auto& tod : times) {
        const absl::Time t = atTimeOnDate(d, tod, tz);
        if (t > now && (!best || t < *best)) {
            best = t;
        }
    }
    return best;
}

// 当天所有时间点里严格早于 now 的最晚一个
std::optional<absl::Time> latestPastAtTimes(const absl::CivilDay& d,
                                            const std::vector<ast::TimeOfDay>& times,
                                            const absl::TimeZone& tz,
                                            absl::Time now) {
    std::vector<ast::TimeOfDay> sorted = times;
    std::sort(sorted.begin(), sorted.end(), [](const ast::TimeOfDay& a, const ast::TimeOfDay& b) {
        return a.totalMinutes() > b.totalMinutes();
    });
    for (const auto& tod : sorted) {
        const absl::Time t = atTimeOnDate(d, tod, tz);
        if (t < now) return t;
    }
    return std::nullopt;
}

std::optional<absl::Time> latestAtTimes(const absl::CivilDay& d,
                                        const std::vector<ast::TimeOfDay>& times,
                                        const absl::TimeZone& tz) {
    if (times.empty()) return std::nullopt;
    auto it = std::max_element(times.begin(), times.end(),
                               [](const ast::TimeOfDay& a, const ast::TimeOfDay& b) {
                                   return a.totalMinutes() < b.totalMinutes();
                               });
    return atTimeOnDate(d, *it, tz);
}

// 往前找时的日内选取：当天只看已过去的时间点，更早的日子取最晚时间点
std::optional<absl::Time> latestOnOrBefore(const absl::CivilDay& d,
                                           const absl::CivilDay& today,
                                           const std::vector<ast::TimeOfDay>& times,
                                           const absl::TimeZone& tz,
                                           absl::Time now) {
    if (d > today) return std::nullopt;
    if (d == today) return latestPastAtTimes(d, times, tz, now);
    return latestAtTimes(d, times, tz);
}

bool monthAligned(const absl::CivilMonth& month, int interval, const std::optional<absl::CivilDay>& anchor) {
    if (interval <= 1) return true;
    const long offset = cal::monthsBetween(anchor.value_or(kEpochDate), absl::CivilDay(month));
    return offset >= 0 && offset % interval == 0;
}

bool yearAligned(absl::civil_year_t year, int interval, const std::optional<absl::CivilDay>& anchor) {
    if (interval <= 1) return true;
    const auto offset = year - anchor.value_or(kEpochDate).year();
    return offset >= 0 && offset % interval == 0;
}

// 从 month 往后到下一个对齐月的月数；锚点之前直接跳到锚点所在月
long monthsToAligned(const absl::CivilMonth& month, int interval, const std::optional<absl::CivilDay>& anchor) {
    if (interval <= 1) return 0;
    const long offset = cal::monthsBetween(anchor.value_or(kEpochDate), absl::CivilDay(month));
    if (offset < 0) return -offset;
    const long rem = offset % interval;
    return rem == 0 ? 0 : interval - rem;
}

// 往前退回上一个对齐月的月数；已在锚点之前则没有
std::optional<long> monthsSinceAligned(const absl::CivilMonth& month, int interval,
                                       const std::optional<absl::CivilDay>& anchor) {
    if (interval <= 1) return 0L;
    const long offset = cal::monthsBetween(anchor.value_or(kEpochDate), absl::CivilDay(month));
    if (offset < 0) return std::nullopt;
    return offset % interval;
}

long long yearsToAligned(absl::civil_year_t year, int interval, const std::optional<absl::CivilDay>& anchor) {
    if (interval <= 1) return 0;
    const long long offset = year - anchor.value_or(kEpochDate).year();
    if (offset < 0) return -offset;
    const long long rem = offset % interval;
    return rem == 0 ? 0 : interval - rem;
}

std::optional<long long> yearsSinceAligned(absl::civil_year_t year, int interval,
                                           const std::optional<absl::CivilDay>& anchor) {
    if (interval <= 1) return 0LL;
    const long long offset = year - anchor.value_or(kEpochDate).year();
    if (offset < 0) return std::nullopt;
    return offset % interval;
}

// interval 最大到 9 位数，乘法一律放在 long long 里做
long long stepMinutes(const ast::IntervalRepeat& e) {
    return e.unit == ast::IntervalUnit::Hours ? static_cast<long long>(e.interval) * 60 : e.interval;
}

long long monthScanLimit(int interval) {
    return interval <= 1 ? kMonthsPerInterval : static_cast<long long>(kMonthsPerInterval) * interval;
}

long long yearScanLimit(int interval) {
    return interval <= 1 ? kYearsPerInterval : static_cast<long long>(kYearsPerInterval) * interval;
}

std::vector<ast::Weekday> sortedDays(std::vector<ast::Weekday> days, bool descending) {
    std::sort(days.begin(), days.end(), [descending](ast::Weekday a, ast::Weekday b) {
        return descending ? ast::weekdayNumber(a) > ast::weekdayNumber(b)
                          : ast::weekdayNumber(a) < ast::weekdayNumber(b);
    });
    return days;
}

// ---- 月 / 年 目标展开成具体日期 ----

Candidates monthTargetDates(const ast::MonthTarget& target, const absl::CivilMonth& month) {
    const auto y = month.year();
    const int m = month.month();
    return std::visit(ast::overloaded{
        [&](const ast::DaysTarget& t) {
            Candidates out;
            const int last = cal::lastDayOfMonth(y, m).day();
            for (int day : t.expand()) {
                if (day <= last) out.emplace_back(y, m, day);
            }
            return out;
        },
        [&](const ast::LastDayTarget&) { return Candidates{cal::lastDayOfMonth(y, m)}; },
        [&](const ast::LastWeekdayTarget&) { return Candidates{cal::lastWeekdayOfMonth(y, m)}; },
        [&](const ast::NearestWeekdayTarget& t) {
            Candidates out;
            if (auto d = cal::nearestWeekday(y, m, t.day, t.direction)) out.push_back(*d);
            return out;
        },
        [&](const ast::OrdinalWeekdayTarget& t) {
            Candidates out;
            if (auto d = cal::ordinalWeekdayOfMonth(y, m, t.ordinal, t.weekday)) out.push_back(*d);
            return out;
        },
    }, target);
}

std::optional<absl::CivilDay> yearTargetDate(const ast::YearTarget& target, absl::civil_year_t year) {
    return std::visit(ast::overloaded{
        [&](const ast::YearDateTarget& t) {
            return cal::makeDate(year, ast::monthNumber(t.month), t.day);
        },
        [&](const ast::YearOrdinalWeekdayTarget& t) {
            return cal::ordinalWeekdayOfMonth(year, ast::monthNumber(t.month), t.ordinal, t.weekday);
        },
        [&](const ast::YearDayOfMonthTarget& t) {
            return cal::makeDate(year, ast::monthNumber(t.month), t.day);
        },
        [&](const ast::YearLastWeekdayTarget& t) {
            return std::optional<absl::CivilDay>(cal::lastWeekdayOfMonth(year, ast::monthNumber(t.month)));
        },
    }, target);
}

bool nearestWithDirection(const ast::ScheduleExpr& expr) {
    const auto* month = std::get_if<ast::MonthRepeat>(&expr);
    if (month == nullptr) return false;
    const auto* nearest = std::get_if<ast::NearestWeekdayTarget>(&month->target);
    return nearest != nullptr && nearest->direction != ast::NearestDirection::None;
}

// ---- next ----

std::optional<absl::Time> nextDay(const ast::DayRepeat& e, const EvalContext& ctx, absl::Time now) {
    absl::CivilDay d = absl::ToCivilDay(now, ctx.tz);

    if (e.interval <= 1) {
        for (int i = 0; i <= kDayScan; ++i, d += 1) {
            if (!matchesDayFilter(d, e.days)) continue;
            if (auto c = earliestFutureAtTimes(d, e.times, ctx.tz, now)) return c;
        }
        return std::nullopt;
    }

    const absl::civil_diff_t offset = d - ctx.anchor.value_or(kEpochDate);
    const long rem = cal::euclidMod(static_cast<long>(offset), e.interval);
    absl::CivilDay aligned = rem == 0 ? d : d + (e.interval - rem);

    for (int i = 0; i < kLongDayScan; ++i) {
        if (auto c = earliestFutureAtTimes(aligned, e.times, ctx.tz, now)) return c;
        aligned += e.interval;
    }
    return std::nullopt;
}

std::optional<absl::Time> nextInterval(const ast::IntervalRepeat& e, const EvalContext& ctx, absl::Time now) {
    const absl::CivilSecond local = absl::ToCivilSecond(now, ctx.tz);
    const absl::CivilDay today(local);
    const long long step = stepMinutes(e);
    const long long from = e.from.totalMinutes();
    const long long to = e.to.totalMinutes();

    absl::CivilDay d = today;
    for (int i = 0; i < kLongDayScan; ++i, d += 1) {
        if (e.dayFilter && !matchesDayFilter(d, *e.dayFilter)) continue;

        const long long nowMinutes = d == today ? local.hour() * 60 + local.minute() : -1;
        long long slot = from;
        if (nowMinutes >= from) {
            slot = from + ((nowMinutes - from) / step + 1) * step;
        }
        // 回拨重叠的第二遍里，墙上时间先换算到较早那次，可能不晚于 now，接着试下一个格子
        for (; slot <= to; slot += step) {
            const ast::TimeOfDay tod{static_cast<int>(slot / 60), static_cast<int>(slot % 60)};
            const absl::Time c = atTimeOnDate(d, tod, ctx.tz);
            if (c > now) return c;
        }
    }
    return std::nullopt;
}

std::optional<absl::Time> nextWeek(const ast::WeekRepeat& e, const EvalContext& ctx, absl::Time now) {
    const auto days = sortedDays(e.days, false);
    absl::CivilDay monday = cal::mondayOf(absl::ToCivilDay(now, ctx.tz));
    const absl::CivilDay anchorMonday = cal::mondayOf(ctx.anchor.value_or(kEpochMonday));

    for (int i = 0; i < kWeekScan; ++i) {
        const long weeks = static_cast<long>((monday - anchorMonday) / 7);
        // 锚点之前的周都不算，直接跳到锚点所在周
        if (weeks < 0) {
            monday = anchorMonday;
            continue;
        }

        const long rem = weeks % e.interval;
        if (rem == 0) {
            for (auto wd : days) {
                const absl::CivilDay target = monday + (ast::weekdayNumber(wd) - 1);
                if (auto c = earliestFutureAtTimes(target, e.times, ctx.tz, now)) return c;
            }
        }
        const long skip = rem == 0 ? e.interval : e.interval - rem;
        monday += skip * 7;
    }
    return std::nullopt;
}

// 按月扫描的公共骨架，MonthRepeat / OrdinalRepeat 共用
std::optional<absl::Time> nextMonthly(int interval,
                                      const std::vector<ast::TimeOfDay>& times,
                                      const MonthCandidatesFn& candidates,
                                      const EvalContext& ctx,
                                      absl::Time now,
                                      const std::vector<ast::MonthName>* during = nullptr) {
    // 从上个月开始：带方向的 nearest weekday 可能从上个月顺延到本月
    absl::CivilMonth month = absl::CivilMonth(absl::ToCivilDay(now, ctx.tz)) - 1;
    const long long limit = monthScanLimit(interval) + 1;

    for (long long i = 0; i < limit; ++i, month += 1) {
        const long skip = monthsToAligned(month, interval, ctx.anchor);
        if (skip > 0) {
            // 直接跳到下一个对齐月；循环末尾还会再 +1
            i += skip - 1;
            month += skip - 1;
            continue;
        }
        if (during != nullptr && !during->empty()
            && !matchesDuring(absl::CivilDay(month), *during)) {
            continue;
        }

        std::optional<absl::Time> best;
        for (const auto& d : candidates(month)) {
            auto c = earliestFutureAtTimes(d, times, ctx.tz, now);
            if (c && (!best || *c < *best)) best = c;
        }
        if (best) return best;
    }
    return std::nullopt;
}

std::optional<absl::Time> nextSingle(const ast::SingleDate& e, const EvalContext& ctx, absl::Time now) {
    return std::visit(ast::overloaded{
        [&](const ast::IsoDate& iso) {
            return earliestFutureAtTimes(isoDateOrThrow(iso.date), e.times, ctx.tz, now);
        },
        [&](const ast::NamedDate& n) -> std::optional<absl::Time> {
            const auto startYear = absl::ToCivilDay(now, ctx.tz).year();
            for (int y = 0; y < kYearsPerInterval; ++y) {
                auto d = cal::makeDate(startYear + y, ast::monthNumber(n.month), n.day);
                if (!d) continue;
                if (auto c = earliestFutureAtTimes(*d, e.times, ctx.tz, now)) return c;
            }
            return std::nullopt;
        },
    }, e.date);
}

std::optional<absl::Time> nextYear(const ast::YearRepeat& e, const EvalContext& ctx, absl::Time now) {
    const auto startYear = absl::ToCivilDay(now, ctx.tz).year();
    const long long limit = yearScanLimit(e.interval);

    for (long long y = 0; y < limit; ++y) {
        const auto year = startYear + y;
        const long long skip = yearsToAligned(year, e.interval, ctx.anchor);
        if (skip > 0) {
            y += skip - 1;
            continue;
        }
        auto d = yearTargetDate(e.target, year);
        if (!d) continue;
        if (auto c = earliestFutureAtTimes(*d, e.times, ctx.tz, now)) return c;
    }
    return std::nullopt;
}

std::optional<absl::Time> nextExpr(const ast::ScheduleData& schedule,
                                   const EvalContext& ctx,
                                   absl::Time now,
                                   bool duringInside) {
    return std::visit(ast::overloaded{
        [&](const ast::DayRepeat& e) { return nextDay(e, ctx, now); },
        [&](const ast::IntervalRepeat& e) { return nextInterval(e, ctx, now); },
        [&](const ast::WeekRepeat& e) { return nextWeek(e, ctx, now); },
        [&](const ast::MonthRepeat& e) {
            return nextMonthly(e.interval, e.times,
                               [&](const absl::CivilMonth& m) { return monthTargetDates(e.target, m); },
                               ctx, now, duringInside ? &schedule.during : nullptr);
        },
        [&](const ast::OrdinalRepeat& e) {
            return nextMonthly(e.interval, e.times,
                               [&](const absl::CivilMonth& m) {
                                   Candidates out;
                                   if (auto d = cal::ordinalWeekdayOfMonth(m.year(), m.month(),
                                                                           e.ordinal, e.weekday)) {
                                       out.push_back(*d);
                                   }
                                   return out;
                               },
                               ctx, now);
        },
        [&](const ast::SingleDate& e) { return nextSingle(e, ctx, now); },
        [&](const ast::YearRepeat& e) { return nextYear(e, ctx, now); },
    }, schedule.expr);
}

// ---- previous ----

std::optional<absl::Time> prevDay(const ast::DayRepeat& e, const EvalContext& ctx, absl::Time now) {
    const absl::CivilDay today = absl::ToCivilDay(now, ctx.tz);

    if (e.interval <= 1) {
        absl::CivilDay d = today;
        for (int i = 0; i <= kDayScan; ++i, d -= 1) {
            if (!matchesDayFilter(d, e.days)) continue;
            if (auto c = latestOnOrBefore(d, today, e.times, ctx.tz, now)) return c;
        }
        return std::nullopt;
    }

    const absl::civil_diff_t offset = today - ctx.anchor.value_or(kEpochDate);
    const long rem = cal::euclidMod(static_cast<long>(offset), e.interval);
    absl::CivilDay aligned = today - rem;

    // 对齐日当天的时间点可能都还没到，最多再退一个周期
    for (int i = 0; i < 2; ++i) {
        if (auto c = latestPastAtTimes(aligned, e.times, ctx.tz, now)) return c;
        aligned -= e.interval;
    }
    return std::nullopt;
}

std::optional<absl::Time> prevInterval(const ast::IntervalRepeat& e, const EvalContext& ctx, absl::Time now) {
    const absl::CivilSecond local = absl::ToCivilSecond(now, ctx.tz);
    const long long step = stepMinutes(e);
    const long long from = e.from.totalMinutes();
    const long long to = e.to.totalMinutes();

    absl::CivilDay d(local);
    for (int offset = 0; offset < kDayScan; ++offset, d -= 1) {
        if (e.dayFilter && !matchesDayFilter(d, *e.dayFilter)) continue;

        const long long nowMinutes = offset == 0 ? local.hour() * 60 + local.minute() : to + 1;
        const long long searchUntil = std::min(nowMinutes, to);
        if (searchUntil < from) continue;

        long long slot = from + ((searchUntil - from) / step) * step;
        if (offset == 0 && slot >= nowMinutes) {
            slot -= step;
        }
        if (slot >= from) {
            const ast::TimeOfDay tod{static_cast<int>(slot / 60), static_cast<int>(slot % 60)};
            return atTimeOnDate(d, tod, ctx.tz);
        }
    }
    return std::nullopt;
}

std::optional<absl::Time> prevWeek(const ast::WeekRepeat& e, const EvalContext& ctx, absl::Time now) {
    const auto days = sortedDays(e.days, true);
    const absl::CivilDay today = absl::ToCivilDay(now, ctx.tz);
    absl::CivilDay monday = cal::mondayOf(today);
    const absl::CivilDay anchorMonday = cal::mondayOf(ctx.anchor.value_or(kEpochMonday));

    for (int i = 0; i < kWeekScan; ++i) {
        const long weeks = static_cast<long>((monday - anchorMonday) / 7);
        if (weeks < 0) return std::nullopt;

        const long rem = weeks % e.interval;
        if (rem == 0) {
            for (auto wd : days) {
                const absl::CivilDay target = monday + (ast::weekdayNumber(wd) - 1);
                if (auto c = latestOnOrBefore(target, today, e.times, ctx.tz, now)) return c;
            }
        }
        const long skip = rem == 0 ? e.interval : rem;
        monday -= skip * 7;
    }
    return std::nullopt;
}

std::optional<absl::Time> prevMonthly(int interval,
                                      const std::vector<ast::TimeOfDay>& times,
                                      const MonthCandidatesFn& candidates,
                                      const EvalContext& ctx,
                                      absl::Time now) {
    const absl::CivilDay today = absl::ToCivilDay(now, ctx.tz);
    // 从下个月开始：带方向的 nearest weekday 可能从下个月提前到本月
    absl::CivilMonth month = absl::CivilMonth(today) + 1;
    const long long limit = monthScanLimit(interval) + 1;

    for (long long i = 0; i < limit; ++i, month -= 1) {
        const auto back = monthsSinceAligned(month, interval, ctx.anchor);
        if (!back) return std::nullopt;
        if (*back > 0) {
            i += *back - 1;
            month -= *back - 1;
            continue;
        }

        Candidates dates = candidates(month);
        std::sort(dates.begin(), dates.end(), std::greater<absl::CivilDay>());
        for (const auto& d : dates) {
            if (auto c = latestOnOrBefore(d, today, times, ctx.tz, now)) return c;
        }
    }
    return std::nullopt;
}

std::optional<absl::Time> prevSingle(const ast::SingleDate& e, const EvalContext& ctx, absl::Time now) {
    const absl::CivilDay today = absl::ToCivilDay(now, ctx.tz);
    return std::visit(ast::overloaded{
        [&](const ast::IsoDate& iso) {
            return latestOnOrBefore(isoDateOrThrow(iso.date), today, e.times, ctx.tz, now);
        },
        [&](const ast::NamedDate& n) -> std::optional<absl::Time> {
            const int m = ast::monthNumber(n.month);
            const auto thisYear = cal::makeDate(today.year(), m, n.day);
            const auto lastYear = cal::makeDate(today.year() - 1, m, n.day);

            if (thisYear && *thisYear < today) {
                return latestAtTimes(*thisYear, e.times, ctx.tz);
            }
            if (thisYear && *thisYear == today) {
                if (auto c = latestPastAtTimes(*thisYear, e.times, ctx.tz, now)) return c;
            }
            if (lastYear) {
                return latestAtTimes(*lastYear, e.times, ctx.tz);
            }
            return std::nullopt;
        },
    }, e.date);
}

std::optional<absl::Time> prevYear(const ast::YearRepeat& e, const EvalContext& ctx, absl::Time now) {
    const absl::CivilDay today = absl::ToCivilDay(now, ctx.tz);
    const long long limit = yearScanLimit(e.interval);

    for (long long y = 0; y < limit; ++y) {
        const auto year = today.year() - y;
        const auto back = yearsSinceAligned(year, e.interval, ctx.anchor);
        if (!back) return std::nullopt;
        if (*back > 0) {
            y += *back - 1;
            continue;
        }
        auto d = yearTargetDate(e.target, year);
        if (!d) continue;
        if (auto c = latestOnOrBefore(*d, today, e.times, ctx.tz, now)) return c;
    }
    return std::nullopt;
}

std::optional<absl::Time> prevExpr(const ast::ScheduleData& schedule, const EvalContext& ctx, absl::Time now) {
    return std::visit(ast::overloaded{
        [&](const ast::DayRepeat& e) { return prevDay(e, ctx, now); },
        [&](const ast::IntervalRepeat& e) { return prevInterval(e, ctx, now); },
        [&](const ast::WeekRepeat& e) { return prevWeek(e, ctx, now); },
        [&](const ast::MonthRepeat& e) {
            return prevMonthly(e.interval, e.times,
                               [&](const absl::CivilMonth& m) { return monthTargetDates(e.target, m); },
                               ctx, now);
        },
        [&](const ast::OrdinalRepeat& e) {
            return prevMonthly(e.interval, e.times,
                               [&](const absl::CivilMonth& m) {
                                   Candidates out;
                                   if (auto d = cal::ordinalWeekdayOfMonth(m.year(), m.month(),
                                                                           e.ordinal, e.weekday)) {
                                       out.push_back(*d);
                                   }
                                   return out;
                               },
                               ctx, now);
        },
        [&](const ast::SingleDate& e) { return prevSingle(e, ctx, now); },
        [&](const ast::YearRepeat& e) { return prevYear(e, ctx, now); },
    }, schedule.expr);
}

// ---- matches ----

// 目标日期可能从相邻月份顺延过来，按来源月份判断对齐
bool monthTargetMatches(const ast::MonthTarget& target, const absl::CivilDay& d,
                        int interval, const std::optional<absl::CivilDay>& anchor) {
    const absl::CivilMonth month(d);
    for (const absl::CivilMonth source : {month - 1, month, month + 1}) {
        if (!monthAligned(source, interval, anchor)) continue;
        for (const auto& c : monthTargetDates(target, source)) {
            if (c == d) return true;
        }
    }
    return false;
}

// 超出 Instant 能表示的范围按没有结果处理
std::optional<Instant> toInstant(const std::optional<absl::Time>& t) {
    if (!t) return std::nullopt;
    if (*t > absl::FromChrono(Instant::max()) || *t < absl::FromChrono(Instant::min())) {
        return std::nullopt;
    }
    return absl::ToChronoTime(*t);
}

std::optional<absl::Time> nextFromImpl(const ast::ScheduleData& schedule,
                                       const absl::TimeZone& tz,
                                       absl::Time now) {
    const EvalContext ctx{tz, anchorOf(schedule)};
    std::optional<absl::CivilDay> untilDay;
    if (schedule.until) {
        untilDay = resolveUntil(*schedule.until, absl::ToCivilDay(now, tz));
    }
    // 带方向的 nearest weekday 可能跨月，during 在月扫描里就地过滤
    const bool duringInside = nearestWithDirection(schedule.expr);

    absl::Time cursor = now;
    for (int i = 0; i < kMaxIterations; ++i) {
        auto candidate = nextExpr(schedule, ctx, cursor, duringInside);
        if (!candidate) return std::nullopt;

        const absl::CivilDay day = absl::ToCivilDay(*candidate, tz);
        if (untilDay && day > *untilDay) return std::nullopt;

        if (!schedule.during.empty() && !duringInside && !matchesDuring(day, schedule.during)) {
            const absl::CivilDay skipTo = nextDuringMonth(day, schedule.during);
            cursor = atTimeOnDate(skipTo, ast::TimeOfDay{0, 0}, tz) - absl::Seconds(1);
            continue;
        }
        if (isExcepted(day, schedule.except)) {
            cursor = atTimeOnDate(day + 1, ast::TimeOfDay{0, 0}, tz) - absl::Seconds(1);
            continue;
        }
        return candidate;
    }
    Logger::debug("nextFrom gave up after " + std::to_string(kMaxIterations) + " iterations", "eval");
    return std::nullopt;
}

} // namespace

absl::TimeZone resolveTimezone(const std::optional<std::string>& name) {
    if (!name) return absl::UTCTimeZone();
    absl::TimeZone tz;
    if (!absl::LoadTimeZone(*name, &tz)) {
        Logger::warn("failed to load timezone " + *name, "eval");
        throw evalError("unknown timezone: " + *name);
    }
    return tz;
}

std::optional<Instant> nextFrom(const ast::ScheduleData& schedule, const absl::TimeZone& tz, Instant now) {
    return toInstant(nextFromImpl(schedule, tz, absl::FromChrono(now)));
}

std::optional<Instant> previousFrom(const ast::ScheduleData& schedule, const absl::TimeZone& tz, Instant now) {
    const absl::Time nowT = absl::FromChrono(now);
    const EvalContext ctx{tz, anchorOf(schedule)};

    absl::Time cursor = nowT;
    for (int i = 0; i < kMaxIterations; ++i) {
        auto candidate = prevExpr(schedule, ctx, cursor);
        if (!candidate) return std::nullopt;

        const absl::CivilDay day = absl::ToCivilDay(*candidate, tz);
        if (ctx.anchor && day < *ctx.anchor) return std::nullopt;

        if (schedule.until) {
            const absl::CivilDay untilDay = resolveUntil(*schedule.until, absl::ToCivilDay(nowT, tz));
            if (day > untilDay) {
                cursor = atTimeOnDate(untilDay, ast::TimeOfDay{23, 59}, tz) + absl::Seconds(1);
                continue;
            }
        }
        if (!schedule.during.empty() && !matchesDuring(day, schedule.during)) {
            const absl::CivilDay skipTo = prevDuringMonth(day, schedule.during);
            cursor = atTimeOnDate(skipTo, ast::TimeOfDay{23, 59}, tz) + absl::Seconds(1);
            continue;
        }
        if (isExcepted(day, schedule.except)) {
            cursor = atTimeOnDate(day - 1, ast::TimeOfDay{23, 59}, tz) + absl::Seconds(1);
            continue;
        }
        return toInstant(candidate);
    }
    Logger::debug("previousFrom gave up after " + std::to_string(kMaxIterations) + " iterations", "eval");
    return std::nullopt;
}

bool matches(const ast::ScheduleData& schedule, const absl::TimeZone& tz, Instant at) {
    const absl::Time t = absl::FromChrono(at);
    const absl::CivilSecond local = absl::ToCivilSecond(t, tz);
    const absl::CivilDay d(local);
    const auto anchor = anchorOf(schedule);

    if (!matchesDuring(d, schedule.during)) return false;
    if (isExcepted(d, schedule.except)) return false;
    if (schedule.until && d > resolveUntil(*schedule.until, d)) return false;

    // 墙上时间相等，或者该时间点经夏令时换算后正好落在 t 上
    auto timeMatches = [&](const std::vector<ast::TimeOfDay>& times) {
        for (const auto& tod : times) {
            if (local.hour() == tod.hour && local.minute() == tod.minute) return true;
            if (absl::ToUnixSeconds(atTimeOnDate(d, tod, tz)) == absl::ToUnixSeconds(t)) return true;
        }
        return false;
    };

    return std::visit(ast::overloaded{
        [&](const ast::DayRepeat& e) {
            if (!matchesDayFilter(d, e.days) || !timeMatches(e.times)) return false;
            if (e.interval <= 1) return true;
            const auto offset = d - anchor.value_or(kEpochDate);
            return offset >= 0 && offset % e.interval == 0;
        },
        [&](const ast::IntervalRepeat& e) {
            if (e.dayFilter && !matchesDayFilter(d, *e.dayFilter)) return false;
            const long long current = local.hour() * 60 + local.minute();
            const long long from = e.from.totalMinutes();
            if (current < from || current > e.to.totalMinutes()) return false;
            return (current - from) % stepMinutes(e) == 0;
        },
        [&](const ast::WeekRepeat& e) {
            const ast::Weekday w = cal::weekdayOf(d);
            if (std::find(e.days.begin(), e.days.end(), w) == e.days.end()) return false;
            if (!timeMatches(e.times)) return false;
            const auto weeks = (cal::mondayOf(d) - cal::mondayOf(anchor.value_or(kEpochMonday))) / 7;
            return weeks >= 0 && weeks % e.interval == 0;
        },
        [&](const ast::MonthRepeat& e) {
            if (!timeMatches(e.times)) return false;
            return monthTargetMatches(e.target, d, e.interval, anchor);
        },
        [&](const ast::OrdinalRepeat& e) {
            if (!timeMatches(e.times)) return false;
            if (!monthAligned(absl::CivilMonth(d), e.interval, anchor)) return false;
            auto target = cal::ordinalWeekdayOfMonth(d.year(), d.month(), e.ordinal, e.weekday);
            return target && *target == d;
        },
        [&](const ast::SingleDate& e) {
            return timeMatches(e.times) && dateSpecMatches(d, e.date);
        },
        [&](const ast::YearRepeat& e) {
            if (!timeMatches(e.times)) return false;
            if (!yearAligned(d.year(), e.interval, anchor)) return false;
            auto target = yearTargetDate(e.target, d.year());
            return target && *target == d;
        },
    }, schedule.expr);
}

std::vector<Instant> nextNFrom(const ast::ScheduleData& schedule,
                               const absl::TimeZone& tz,
                               Instant now,
                               std::size_t n) {
    std::vector<Instant> out;
    absl::Time cursor = absl::FromChrono(now);
    while (out.size() < n) {
        auto next = nextFromImpl(schedule, tz, cursor);
        const auto instant = toInstant(next);
        if (!instant) break;
        out.push_back(*instant);
        // nextFrom 本身严格晚于游标，命中点即可作为下一轮起点
        cursor = *next;
    }
    return out;
}

// ---- Occurrences ----

Occurrences::Occurrences(ast::ScheduleData schedule,
                         absl::TimeZone tz,
                         Instant from,
                         std::optional<Instant> to)
    : m_schedule(std::move(schedule)),
      m_tz(tz),
      m_cursor(absl::FromChrono(from)) {
    if (to) m_to = absl::FromChrono(*to);
}

std::optional<Instant> Occurrences::next() {
    if (m_done) return std::nullopt;

    auto hit = nextFromImpl(m_schedule, m_tz, m_cursor);
    const auto instant = toInstant(hit);
    if (!instant || (m_to && *hit > *m_to)) {
        m_done = true;
        return std::nullopt;
    }
    m_cursor = *hit;
    return instant;
}

Occurrences::iterator::iterator(Occurrences* owner) : m_owner(owner) {
    if (m_owner != nullptr) m_current = m_owner->next();
}

Occurrences::iterator& Occurrences::iterator::operator++() {
    if (m_owner != nullptr) m_current = m_owner->next();
    return *this;
}

bool Occurrences::iterator::operator==(const iterator& o) const {
    // 耗尽的迭代器与 end() 相等
    if (!m_current || !o.m_current) return !m_current && !o.m_current;
    return m_owner == o.m_owner && *m_current == *o.m_current;
}

Occurrences occurrences(const ast::ScheduleData& schedule, const absl::TimeZone& tz, Instant from) {
    return Occurrences(schedule, tz, from);
}

Occurrences between(const ast::ScheduleData& schedule, const absl::TimeZone& tz, Instant from, Instant to) {
    return Occurrences(schedule, tz, from, to);
}

} // namespace hron::eval
