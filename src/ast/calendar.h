#pragma once
#include <optional>
#include <string>
#include <absl/time/civil_time.h>
#include "schedule_types.h"

namespace hron::ast {

// 纯日历工具（不涉及时区），基于 absl 的 civil time
namespace calendar {

// 严格解析 YYYY-MM-DD：必须是真实存在的日期，不允许 absl 把 02-30 滚到 03-02
std::optional<absl::CivilDay> parseIsoDate(const std::string& s);

std::string formatIsoDate(const absl::CivilDay& d);

// 构造 y-m-d，日期不存在时返回空
std::optional<absl::CivilDay> makeDate(absl::civil_year_t y, int m, int d);

absl::CivilDay firstOfMonth(absl::civil_year_t y, int m);
absl::CivilDay lastDayOfMonth(absl::civil_year_t y, int m);

// 月末最后一个工作日（周一到周五）
absl::CivilDay lastWeekdayOfMonth(absl::civil_year_t y, int m);

// 第 n 个 weekday（n 从 1 开始），溢出到下个月时返回空
std::optional<absl::CivilDay> nthWeekdayOfMonth(absl::civil_year_t y, int m, Weekday wd, int n);

// 当月最后一个 weekday
absl::CivilDay lastWeekdayInMonth(absl::civil_year_t y, int m, Weekday wd);

// OrdinalPosition 版本：Last 走 lastWeekdayInMonth，其余走 nthWeekdayOfMonth
std::optional<absl::CivilDay> ordinalWeekdayOfMonth(absl::civil_year_t y, int m,
                                                    OrdinalPosition ord, Weekday wd);

// 离 targetDay 最近的工作日，规则见 NearestDirection；该月没有 targetDay 时返回空
std::optional<absl::CivilDay> nearestWeekday(absl::civil_year_t y, int m, int targetDay,
                                             NearestDirection direction);

Weekday weekdayOf(const absl::CivilDay& d);

inline bool isWeekend(const absl::CivilDay& d) {
    const Weekday w = weekdayOf(d);
    return w == Weekday::Saturday || w == Weekday::Sunday;
}

// 该日所在周的周一
absl::CivilDay mondayOf(const absl::CivilDay& d);

// 按年月计算的月份差 b - a
long monthsBetween(const absl::CivilDay& a, const absl::CivilDay& b);

// 非负取模
inline long euclidMod(long a, long m) {
    long r = a % m;
    return r < 0 ? r + m : r;
}

} // namespace calendar
} // namespace hron::ast
