#include "cron_bridge.h"
#include <algorithm>
#include "core/hron_error.h"
#include "core/utils.h"
#include "log/logger.h"

namespace hron::cron {

namespace {

HronError notExpressible(const std::string& reason) {
    Logger::debug("toCron rejected: " + reason, "cron");
    return cronError("not expressible as cron (" + reason + ")");
}

// 按第一个 sep 切成两段
bool cut(const std::string& s, char sep, std::string& before, std::string& after) {
    const std::size_t pos = s.find(sep);
    if (pos == std::string::npos) return false;
    before = s.substr(0, pos);
    after = s.substr(pos + 1);
    return true;
}

bool contains(const std::string& s, char c) {
    return s.find(c) != std::string::npos;
}

bool isWildcard(const std::string& s) {
    return s == "*" || s == "?";
}

std::string intList(const std::vector<int>& nums) {
    std::vector<std::string> parts;
    parts.reserve(nums.size());
    for (int n : nums) parts.push_back(std::to_string(n));
    return utils::join(parts, ",");
}

int parseNumber(const std::string& s, const std::string& message) {
    int v = 0;
    if (!utils::parse_int(s, v)) {
        throw cronError(message);
    }
    return v;
}

int parseStep(const std::string& s, const std::string& message) {
    const int step = parseNumber(s, message);
    if (step == 0) {
        throw cronError("step cannot be 0");
    }
    return step;
}

int parseSingleValue(const std::string& field, const std::string& name, int min, int max) {
    int value = 0;
    if (!utils::parse_int(field, value)) {
        throw cronError("invalid " + name + " field: " + field);
    }
    if (value < min || value > max) {
        throw cronError(name + " must be " + std::to_string(min) + "-" + std::to_string(max)
                        + ", got " + std::to_string(value));
    }
    return value;
}

std::string rangeError(const std::string& start, const std::string& end) {
    return "range start must be <= end: " + start + "-" + end;
}

// 分 / 时字段展开成升序去重的取值
std::vector<int> expandField(const std::string& field, const std::string& name, int min, int max) {
    std::vector<int> values;
    for (const auto& part : utils::split(field, ',')) {
        std::string body = part;
        std::string rangePart, stepPart, a, b;
        int step = 1;
        const bool stepped = cut(part, '/', rangePart, stepPart);
        if (stepped) {
            step = parseStep(stepPart, "invalid " + name + " step: " + stepPart);
            body = rangePart;
        }

        int start = min;
        int end = max;
        if (body == "*") {
            // 整个取值范围
        } else if (cut(body, '-', a, b)) {
            start = parseSingleValue(a, name, min, max);
            end = parseSingleValue(b, name, min, max);
            if (start > end) throw cronError(rangeError(a, b));
        } else {
            start = parseSingleValue(body, name, min, max);
            if (!stepped) end = start;
        }
        for (int v = start; v <= end; v += step) values.push_back(v);
    }
    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());
    return values;
}

ast::MonthName monthFromCronNumber(int n) {
    auto m = ast::monthFromNumber(n);
    if (!m) {
        throw cronError("invalid month number: " + std::to_string(n));
    }
    return *m;
}

// 数字 1-12 或 JAN..DEC
ast::MonthName parseMonthValue(const std::string& s) {
    int n = 0;
    if (utils::parse_int(s, n)) {
        return monthFromCronNumber(n);
    }
    if (auto m = ast::parseMonthAbbrev(s)) {
        return *m;
    }
    throw cronError("invalid month: " + s);
}

// 数字 0-7 或 SUN..SAT，不把 7 归一成 0（区间要用原值比较）
int parseDowValueRaw(const std::string& s) {
    int n = 0;
    if (utils::parse_int(s, n)) {
        if (n > 7) {
            throw cronError("DOW must be 0-7, got " + std::to_string(n));
        }
        return n;
    }
    static const char* const kNames[] = {"SUN", "MON", "TUE", "WED", "THU", "FRI", "SAT"};
    const std::string upper = utils::to_upper(s);
    for (int i = 0; i < 7; ++i) {
        if (upper == kNames[i]) return i;
    }
    throw cronError("invalid DOW: " + s);
}

int parseDowValue(const std::string& s) {
    const int raw = parseDowValueRaw(s);
    return raw == 7 ? 0 : raw;
}

// cron 周编号（0 和 7 都是周日）-> Weekday
ast::Weekday cronDowToWeekday(int n) {
    if (n < 0 || n > 7) {
        throw cronError("invalid DOW number: " + std::to_string(n));
    }
    return n == 0 || n == 7 ? ast::Weekday::Sunday : static_cast<ast::Weekday>(n);
}

void validateDom(int day) {
    if (day < 1 || day > 31) {
        throw cronError("DOM must be 1-31, got " + std::to_string(day));
    }
}

std::string dayFilterToCronDow(const ast::DayFilter& f) {
    switch (f.kind) {
        case ast::DayFilter::Kind::Every:   return "*";
        case ast::DayFilter::Kind::Weekday: return "1-5";
        case ast::DayFilter::Kind::Weekend: return "0,6";
        case ast::DayFilter::Kind::Days: {
            std::vector<int> nums;
            for (auto d : f.days) nums.push_back(ast::weekdayCronDow(d));
            std::sort(nums.begin(), nums.end());
            nums.erase(std::unique(nums.begin(), nums.end()), nums.end());
            // 与 fromCron 的折叠保持一致，往返后字段不变
            if (nums == std::vector<int>{1, 2, 3, 4, 5}) return "1-5";
            if (nums == std::vector<int>{0, 6}) return "0,6";
            return intList(nums);
        }
    }
    return "*";
}

ast::ScheduleData shortcut(const std::string& cron) {
    const std::string name = utils::to_lower(cron);
    const std::vector<ast::TimeOfDay> midnight{ast::TimeOfDay{0, 0}};

    ast::ScheduleData out;
    if (name == "@yearly" || name == "@annually") {
        out.expr = ast::YearRepeat{1, ast::YearDateTarget{ast::MonthName::Jan, 1}, midnight};
    } else if (name == "@monthly") {
        out.expr = ast::MonthRepeat{1, ast::DaysTarget{{ast::DayOfMonthSpec::single(1)}}, midnight};
    } else if (name == "@weekly") {
        out.expr = ast::DayRepeat{1, ast::DayFilter::list({ast::Weekday::Sunday}), midnight};
    } else if (name == "@daily" || name == "@midnight") {
        out.expr = ast::DayRepeat{1, ast::DayFilter::every(), midnight};
    } else if (name == "@hourly") {
        out.expr = ast::IntervalRepeat{1, ast::IntervalUnit::Hours,
                                       ast::TimeOfDay{0, 0}, ast::TimeOfDay{23, 59}, std::nullopt};
    } else {
        throw cronError("unknown @ shortcut: " + cron);
    }
    return out;
}

} // namespace

// ---- toCron ----

std::string toCron(const ast::ScheduleData& schedule) {
    if (!schedule.except.empty()) throw notExpressible("except clauses not supported");
    if (schedule.until) throw notExpressible("until clauses not supported");
    if (!schedule.during.empty()) throw notExpressible("during clauses not supported");

    return std::visit(ast::overloaded{
        [](const ast::DayRepeat& e) -> std::string {
            if (e.interval > 1) throw notExpressible("multi-day intervals not supported");
            if (e.times.size() != 1) throw notExpressible("multiple times not supported");
            const auto& t = e.times.front();
            return std::to_string(t.minute) + " " + std::to_string(t.hour) + " * * "
                   + dayFilterToCronDow(e.days);
        },
        [](const ast::IntervalRepeat& e) -> std::string {
            const bool fullDay = e.from == ast::TimeOfDay{0, 0} && e.to == ast::TimeOfDay{23, 59};
            if (!fullDay) throw notExpressible("partial-day interval windows not supported");
            if (e.dayFilter) throw notExpressible("interval with day filter not supported");
            if (e.unit == ast::IntervalUnit::Minutes) {
                if (60 % e.interval != 0) {
                    throw notExpressible("*/" + std::to_string(e.interval) + " breaks at hour boundaries");
                }
                return "*/" + std::to_string(e.interval) + " * * * *";
            }
            return "0 */" + std::to_string(e.interval) + " * * *";
        },
        [](const ast::WeekRepeat&) -> std::string {
            throw notExpressible("multi-week intervals not supported");
        },
        [](const ast::MonthRepeat& e) -> std::string {
            if (e.interval > 1) throw notExpressible("multi-month intervals not supported");
            if (e.times.size() != 1) throw notExpressible("multiple times not supported");
            const auto& t = e.times.front();
            const std::string dom = std::visit(ast::overloaded{
                [](const ast::DaysTarget& target) { return intList(target.expand()); },
                [](const ast::LastDayTarget&) -> std::string {
                    throw notExpressible("last day of month not supported");
                },
                [](const ast::LastWeekdayTarget&) -> std::string {
                    throw notExpressible("last weekday of month not supported");
                },
                [](const ast::NearestWeekdayTarget&) -> std::string {
                    throw notExpressible("nearest weekday not supported");
                },
                [](const ast::OrdinalWeekdayTarget&) -> std::string {
                    throw notExpressible("ordinal weekday of month not supported");
                },
            }, e.target);
            return std::to_string(t.minute) + " " + std::to_string(t.hour) + " " + dom + " * *";
        },
        [](const ast::OrdinalRepeat&) -> std::string {
            throw notExpressible("ordinal weekday of month not supported");
        },
        [](const ast::SingleDate&) -> std::string {
            throw notExpressible("single dates are not repeating");
        },
        [](const ast::YearRepeat&) -> std::string {
            throw notExpressible("yearly schedules not supported in 5-field cron");
        },
    }, schedule.expr);
}

// ---- fromCron ----

ast::ScheduleData fromCron(const std::string& cron) {
    const std::string spec = utils::trim(cron);
    if (!spec.empty() && spec.front() == '@') {
        return shortcut(spec);
    }
    return CronReader(spec).read();
}

CronReader::CronReader(const std::string& spec) {
    const auto parts = utils::split_whitespace(spec);
    if (parts.size() != m_fields.size()) {
        throw cronError("expected 5 cron fields, got " + std::to_string(parts.size()));
    }
    std::copy(parts.begin(), parts.end(), m_fields.begin());

    // ? 与 * 等价
    if (m_fields[2] == "?") m_fields[2] = "*";
    if (m_fields[4] == "?") m_fields[4] = "*";

    m_during = parseMonthField(m_fields[3]);
}

ast::ScheduleData CronReader::withDuring(ast::ScheduleExpr expr) const {
    ast::ScheduleData out;
    out.expr = std::move(expr);
    out.during = m_during;
    return out;
}

std::vector<ast::TimeOfDay> CronReader::readTimes() const {
    const auto minutes = expandField(minuteField(), "minute", 0, 59);
    const auto hours = expandField(hourField(), "hour", 0, 23);
    std::vector<ast::TimeOfDay> times;
    times.reserve(hours.size() * minutes.size());
    for (int h : hours) {
        for (int m : minutes) times.push_back(ast::TimeOfDay{h, m});
    }
    return times;
}

ast::ScheduleData CronReader::read() const {
    ast::ScheduleData out;
    if (tryNthWeekday(out)) return out;
    if (tryLastDay(out)) return out;

    const std::string& dom = domField();
    if (!dom.empty() && dom.back() == 'W' && dom != "LW") {
        throw cronError("W (nearest weekday) not yet supported");
    }

    if (tryInterval(out)) return out;
    if (tryHourly(out)) return out;

    auto times = readTimes();

    if (dom != "*" && dowField() == "*") {
        return withDuring(ast::MonthRepeat{1, parseDomField(dom), std::move(times)});
    }
    return withDuring(ast::DayRepeat{1, parseDowField(dowField()), std::move(times)});
}

bool CronReader::tryNthWeekday(ast::ScheduleData& out) const {
    const std::string& dow = dowField();
    std::string dowPart, nthPart;

    if (cut(dow, '#', dowPart, nthPart)) {
        const ast::Weekday weekday = cronDowToWeekday(parseDowValue(dowPart));
        const int nth = parseNumber(nthPart, "invalid nth value: " + nthPart);
        if (nth < 1 || nth > 5) {
            throw cronError("nth must be 1-5, got " + std::to_string(nth));
        }
        if (!isWildcard(domField())) {
            throw cronError("DOM must be * when using # for nth weekday");
        }
        const auto ordinal = static_cast<ast::OrdinalPosition>(nth - 1);
        out = withDuring(ast::OrdinalRepeat{1, ordinal, weekday, readTimes()});
        return true;
    }

    // 5L = 当月最后一个周五
    if (dow.size() > 1 && dow.back() == 'L') {
        const ast::Weekday weekday = cronDowToWeekday(parseDowValue(dow.substr(0, dow.size() - 1)));
        if (!isWildcard(domField())) {
            throw cronError("DOM must be * when using nL for last weekday");
        }
        out = withDuring(ast::OrdinalRepeat{1, ast::OrdinalPosition::Last, weekday, readTimes()});
        return true;
    }
    return false;
}

bool CronReader::tryLastDay(ast::ScheduleData& out) const {
    const std::string& dom = domField();
    if (dom != "L" && dom != "LW") return false;

    if (!isWildcard(dowField())) {
        throw cronError("DOW must be * when using L or LW in DOM");
    }
    ast::MonthTarget target = ast::LastDayTarget{};
    if (dom == "LW") target = ast::LastWeekdayTarget{};
    out = withDuring(ast::MonthRepeat{1, target, readTimes()});
    return true;
}

bool CronReader::tryInterval(ast::ScheduleData& out) const {
    const std::string& minute = minuteField();
    const std::string& hour = hourField();
    std::string rangePart, stepPart, a, b;

    // * 等同 */1
    const std::string minuteExpr = minute == "*" ? "*/1" : minute;
    if (!contains(minuteExpr, ',') && cut(minuteExpr, '/', rangePart, stepPart)) {
        const int interval = parseStep(stepPart, "invalid minute interval value");

        int fromMinute = 0;
        int toMinute = 59;
        if (rangePart == "*") {
            // 整小时
        } else if (cut(rangePart, '-', a, b)) {
            fromMinute = parseSingleValue(a, "minute", 0, 59);
            toMinute = parseSingleValue(b, "minute", 0, 59);
            if (fromMinute > toMinute) throw cronError(rangeError(a, b));
        } else {
            // 0/15：从该分钟开始
            fromMinute = parseSingleValue(rangePart, "minute", 0, 59);
        }

        // 小时窗口；小时字段带步长或列表时交给后面按时刻展开
        bool hourWindow = true;
        int fromHour = 0;
        int toHour = 23;
        if (hour == "*") {
            // 全天
        } else if (contains(hour, '/') || contains(hour, ',')) {
            hourWindow = false;
        } else if (cut(hour, '-', a, b)) {
            fromHour = parseSingleValue(a, "hour", 0, 23);
            toHour = parseSingleValue(b, "hour", 0, 23);
            if (fromHour > toHour) throw cronError(rangeError(a, b));
        } else {
            fromHour = toHour = parseSingleValue(hour, "hour", 0, 23);
        }

        if (hourWindow) {
            std::optional<ast::DayFilter> dayFilter;
            if (dowField() != "*") dayFilter = parseDowField(dowField());

            if (isWildcard(domField())) {
                int endMinute = toMinute;
                if (fromMinute == 0 && toMinute == 59 && fromHour != toHour) {
                    // 全天写成 23:59，跨多个小时的窗口收在整点
                    endMinute = toHour == 23 ? 59 : 0;
                }
                out = withDuring(ast::IntervalRepeat{interval, ast::IntervalUnit::Minutes,
                                                     ast::TimeOfDay{fromHour, fromMinute},
                                                     ast::TimeOfDay{toHour, endMinute},
                                                     dayFilter});
                return true;
            }
        }
    }

    if (cut(hour, '/', rangePart, stepPart) && (minute == "0" || minute == "00")) {
        const int interval = parseStep(stepPart, "invalid hour interval value");

        int fromHour = 0;
        int toHour = 23;
        if (rangePart == "*") {
            // 全天
        } else if (cut(rangePart, '-', a, b)) {
            fromHour = parseSingleValue(a, "hour", 0, 23);
            toHour = parseSingleValue(b, "hour", 0, 23);
            if (fromHour > toHour) throw cronError(rangeError(a, b));
        } else {
            fromHour = parseSingleValue(rangePart, "hour", 0, 23);
        }

        if (isWildcard(domField()) && isWildcard(dowField())) {
            const int endMinute = fromHour == 0 && toHour == 23 ? 59 : 0;
            out = withDuring(ast::IntervalRepeat{interval, ast::IntervalUnit::Hours,
                                                 ast::TimeOfDay{fromHour, 0},
                                                 ast::TimeOfDay{toHour, endMinute},
                                                 std::nullopt});
            return true;
        }
    }
    return false;
}

bool CronReader::tryHourly(ast::ScheduleData& out) const {
    const std::string& minute = minuteField();
    if (hourField() != "*" || !isWildcard(domField())) return false;
    if (minute == "*" || contains(minute, ',') || contains(minute, '-') || contains(minute, '/')) {
        return false;
    }

    const int m = parseSingleValue(minute, "minute", 0, 59);
    std::optional<ast::DayFilter> dayFilter;
    if (dowField() != "*") dayFilter = parseDowField(dowField());
    out = withDuring(ast::IntervalRepeat{1, ast::IntervalUnit::Hours,
                                         ast::TimeOfDay{0, m}, ast::TimeOfDay{23, 59},
                                         dayFilter});
    return true;
}

// ---- 字段解析 ----

std::vector<ast::MonthName> parseMonthField(const std::string& field) {
    std::vector<ast::MonthName> months;
    if (field == "*") return months;

    for (const auto& part : utils::split(field, ',')) {
        std::string rangePart, stepPart, a, b;
        if (cut(part, '/', rangePart, stepPart)) {
            int start = 1;
            int end = 12;
            if (rangePart == "*") {
                // 全年
            } else if (cut(rangePart, '-', a, b)) {
                start = ast::monthNumber(parseMonthValue(a));
                end = ast::monthNumber(parseMonthValue(b));
            } else {
                throw cronError("invalid month step expression: " + part);
            }
            const int step = parseStep(stepPart, "invalid month step value: " + stepPart);
            for (int n = start; n <= end; n += step) {
                months.push_back(monthFromCronNumber(n));
            }
        } else if (cut(part, '-', a, b)) {
            const int start = ast::monthNumber(parseMonthValue(a));
            const int end = ast::monthNumber(parseMonthValue(b));
            if (start > end) {
                throw cronError("invalid month range: " + a + " > " + b);
            }
            for (int n = start; n <= end; ++n) {
                months.push_back(monthFromCronNumber(n));
            }
        } else {
            months.push_back(parseMonthValue(part));
        }
    }
    return months;
}

ast::MonthTarget parseDomField(const std::string& field) {
    ast::DaysTarget target;

    for (const auto& part : utils::split(field, ',')) {
        std::string rangePart, stepPart, a, b;
        if (cut(part, '/', rangePart, stepPart)) {
            int start = 1;
            int end = 31;
            if (rangePart == "*") {
                // 整月
            } else if (cut(rangePart, '-', a, b)) {
                start = parseNumber(a, "invalid DOM range start: " + a);
                end = parseNumber(b, "invalid DOM range end: " + b);
                if (start > end) throw cronError(rangeError(a, b));
            } else {
                start = parseNumber(rangePart, "invalid DOM value: " + rangePart);
            }
            const int step = parseStep(stepPart, "invalid DOM step: " + stepPart);
            validateDom(start);
            validateDom(end);
            for (int d = start; d <= end; d += step) {
                target.specs.push_back(ast::DayOfMonthSpec::single(d));
            }
        } else if (cut(part, '-', a, b)) {
            const int start = parseNumber(a, "invalid DOM range start: " + a);
            const int end = parseNumber(b, "invalid DOM range end: " + b);
            if (start > end) throw cronError(rangeError(a, b));
            validateDom(start);
            validateDom(end);
            target.specs.push_back(ast::DayOfMonthSpec::between(start, end));
        } else {
            const int day = parseNumber(part, "invalid DOM value: " + part);
            validateDom(day);
            target.specs.push_back(ast::DayOfMonthSpec::single(day));
        }
    }
    return target;
}

ast::DayFilter parseDowField(const std::string& field) {
    if (field == "*") return ast::DayFilter::every();

    std::vector<ast::Weekday> days;
    for (const auto& part : utils::split(field, ',')) {
        std::string rangePart, stepPart, a, b;
        if (cut(part, '/', rangePart, stepPart)) {
            int start = 0;
            int end = 6;
            if (rangePart == "*") {
                // 整周
            } else if (cut(rangePart, '-', a, b)) {
                start = parseDowValueRaw(a);
                end = parseDowValueRaw(b);
                if (start > end) throw cronError(rangeError(a, b));
            } else {
                start = parseDowValueRaw(rangePart);
            }
            const int step = parseStep(stepPart, "invalid DOW step: " + stepPart);
            for (int d = start; d <= end; d += step) {
                days.push_back(cronDowToWeekday(d));
            }
        } else if (cut(part, '-', a, b)) {
            const int start = parseDowValueRaw(a);
            const int end = parseDowValueRaw(b);
            if (start > end) throw cronError(rangeError(a, b));
            for (int d = start; d <= end; ++d) {
                days.push_back(cronDowToWeekday(d));
            }
        } else {
            days.push_back(cronDowToWeekday(parseDowValue(part)));
        }
    }

    std::vector<ast::Weekday> sorted = days;
    std::sort(sorted.begin(), sorted.end(), [](ast::Weekday x, ast::Weekday y) {
        return ast::weekdayNumber(x) < ast::weekdayNumber(y);
    });
    const std::vector<ast::Weekday> workdays{ast::Weekday::Monday, ast::Weekday::Tuesday,
                                             ast::Weekday::Wednesday, ast::Weekday::Thursday,
                                             ast::Weekday::Friday};
    const std::vector<ast::Weekday> weekend{ast::Weekday::Saturday, ast::Weekday::Sunday};
    if (sorted == workdays) return ast::DayFilter::weekday();
    if (sorted == weekend) return ast::DayFilter::weekend();
    return ast::DayFilter::list(std::move(days));
}

} // namespace hron::cron
