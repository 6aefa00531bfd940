#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
using json = nlohmann::json;

#include "core/hron_error.h"
#include "cron/cron_bridge.h"
#include "display/display.h"
#include "schedule.h"

using namespace nlohmann::json_literals;
using hron::HronError;
using hron::Schedule;

// cron -> 规范文本
static const json kFromCron = R"([
  ["0 9 * * 1-5",         "every weekday at 09:00"],
  ["0 9 * * MON-FRI",     "every weekday at 09:00"],
  ["30 17 * * 0,6",       "every weekend at 17:30"],
  ["0 9 * * MON,WED,FRI", "every monday, wednesday, friday at 09:00"],
  ["0 9 * * 7",           "every sunday at 09:00"],
  ["0 9 ? * 1",           "every monday at 09:00"],
  ["0 0 * * *",           "every day at 00:00"],
  ["0 0 1,15 * *",        "every month on the 1st, 15th at 00:00"],
  ["0 0 10-12 * *",       "every month on the 10th to 12th at 00:00"],
  ["0 9 * 1-3 *",         "every day at 09:00 during jan, feb, mar"],
  ["0 9 * JAN,JUL *",     "every day at 09:00 during jan, jul"],
  ["*/15 * * * *",        "every 15 min from 00:00 to 23:59"],
  ["0 */2 * * *",         "every 2 hours from 00:00 to 23:59"],
  ["*/30 9-17 * * 1-5",   "every 30 min from 09:00 to 17:00 on weekday"],
  ["0 9 * * 1#2",         "second monday of every month at 09:00"],
  ["0 17 * * 5L",         "last friday of every month at 17:00"],
  ["0 18 L * *",          "every month on the last day at 18:00"],
  ["0 18 LW * *",         "every month on the last weekday at 18:00"],
  ["0 * * * *",           "every 1 hour from 00:00 to 23:59"],
  ["30 * * * 1-5",        "every 1 hour from 00:30 to 23:59 on weekday"],
  ["0 9,17 * * *",        "every day at 09:00, 17:00"],
  ["0 9-11 * * *",        "every day at 09:00, 10:00, 11:00"],
  ["0,30 9 * * 1-5",      "every weekday at 09:00, 09:30"],
  ["30 */6 1 * *",        "every month on the 1st at 00:30, 06:30, 12:30, 18:30"],
  ["*/15 9 * * *",        "every 15 min from 09:00 to 09:59"],
  ["*/30 9,17 * * *",     "every day at 09:00, 09:30, 17:00, 17:30"],
  ["* * * * *",           "every 1 minute from 00:00 to 23:59"],
  ["@daily",              "every day at 00:00"],
  ["@midnight",           "every day at 00:00"],
  ["@HOURLY",             "every 1 hour from 00:00 to 23:59"],
  ["@weekly",             "every sunday at 00:00"],
  ["@monthly",            "every month on the 1st at 00:00"],
  ["@yearly",             "every year on jan 1 at 00:00"],
  ["@annually",           "every year on jan 1 at 00:00"]
])"_json;

// 非法 cron -> 错误信息
static const json kCronErrors = R"([
  ["0 9 * *",        "expected 5 cron fields, got 4"],
  ["0 9 * * * *",    "expected 5 cron fields, got 6"],
  ["0 9 15W * *",    "W (nearest weekday) not yet supported"],
  ["*/0 * * * *",    "step cannot be 0"],
  ["0 9 * * 1#6",    "nth must be 1-5, got 6"],
  ["0 9 1 * 1#2",    "DOM must be * when using # for nth weekday"],
  ["0 9 L * 1",      "DOW must be * when using L or LW in DOM"],
  ["60 9 * * *",     "minute must be 0-59, got 60"],
  ["0 24 * * *",     "hour must be 0-23, got 24"],
  ["x 9 * * *",      "invalid minute field: x"],
  ["0 9 32 * *",     "DOM must be 1-31, got 32"],
  ["0 9 * * 8",      "DOW must be 0-7, got 8"],
  ["0 9 * * FOO",    "invalid DOW: FOO"],
  ["0 9 * * 5-1",    "range start must be <= end: 5-1"],
  ["0 9 20-10 * *",  "range start must be <= end: 20-10"],
  ["@reboot",        "unknown @ shortcut: @reboot"],
  ["*/15 25 * * *",   "hour must be 0-23, got 25"],
  ["*/15 17-9 * * *", "range start must be <= end: 17-9"],
  ["*/15 9-24 * * *", "hour must be 0-23, got 24"],
  ["5-90/10 * * * *", "minute must be 0-59, got 90"],
  ["70/10 * * * *",   "minute must be 0-59, got 70"],
  ["0 20-30/2 * * *", "hour must be 0-23, got 30"],
  ["0 9,25 * * *",    "hour must be 0-23, got 25"],
  ["0 17-9 * * *",    "range start must be <= end: 17-9"],
  ["0,61 9 * * *",    "minute must be 0-59, got 61"]
])"_json;

// hron -> cron
static const json kToCron = R"([
  ["every weekday at 09:00",                  "0 9 * * 1-5"],
  ["every weekend at 10:30",                  "30 10 * * 0,6"],
  ["every sun, mon at 08:00",                 "0 8 * * 0,1"],
  ["every mon, tue, wed, thu, fri at 09:00",  "0 9 * * 1-5"],
  ["every fri, thu, wed, tue, mon at 09:00",  "0 9 * * 1-5"],
  ["every sat, sun at 10:00",                 "0 10 * * 0,6"],
  ["every mon, mon, wed at 08:00",            "0 8 * * 1,3"],
  ["every day at 00:00",                      "0 0 * * *"],
  ["every 15 min from 00:00 to 23:59",        "*/15 * * * *"],
  ["every 2 hours from 00:00 to 23:59",       "0 */2 * * *"],
  ["every month on the 1st, 15th at 12:00",   "0 12 1,15 * *"],
  ["every month on the 10th to 12th at 00:00","0 0 10,11,12 * *"]
])"_json;

// 表达不了的形状 -> 括号里的原因
static const json kNotExpressible = R"([
  ["every 7 min from 00:00 to 23:59",                     "*/7 breaks at hour boundaries"],
  ["every 30 min from 09:00 to 17:00",                    "partial-day interval windows not supported"],
  ["every 30 min from 00:00 to 23:59 on weekday",         "interval with day filter not supported"],
  ["every day at 09:00, 17:00",                           "multiple times not supported"],
  ["every 2 days at 09:00",                               "multi-day intervals not supported"],
  ["every 2 weeks on mon at 09:00",                       "multi-week intervals not supported"],
  ["every 2 months on the 1st at 09:00",                  "multi-month intervals not supported"],
  ["every month on the last day at 18:00",                "last day of month not supported"],
  ["every month on the last weekday at 18:00",            "last weekday of month not supported"],
  ["every month on the nearest weekday to 15th at 09:00", "nearest weekday not supported"],
  ["every month on the first monday at 09:00",            "ordinal weekday of month not supported"],
  ["first monday of every month at 09:00",                "ordinal weekday of month not supported"],
  ["on 2026-07-04 at 12:00",                              "single dates are not repeating"],
  ["every year on jul 4 at 12:00",                        "yearly schedules not supported in 5-field cron"],
  ["every day at 09:00 except dec 25",                    "except clauses not supported"],
  ["every day at 09:00 until 2026-12-31",                 "until clauses not supported"],
  ["every day at 09:00 during jan",                       "during clauses not supported"]
])"_json;

static void test_from_cron() {
    for (const auto& c : kFromCron) {
        const std::string cron = c[0].get<std::string>();
        const std::string want = c[1].get<std::string>();
        const std::string got = hron::display::display(hron::cron::fromCron(cron));
        if (got != want) {
            std::cerr << "cron: " << cron << "\nwant: " << want << "\ngot:  " << got << "\n";
        }
        assert(got == want);
    }

    // 与直接解析得到的结构完全一致
    assert(Schedule::fromCron("0 9 * * 1-5") == Schedule::parse("every weekday at 09:00"));
    assert(Schedule::fromCron("30 17 * * 0,6") == Schedule::parse("every weekend at 17:30"));
    assert(Schedule::fromCron("0 0 1,15 * *") == Schedule::parse("every month on the 1st, 15th at 00:00"));
    std::cout << "[OK] fromCron (" << kFromCron.size() << " cases)\n";
}

static void test_from_cron_errors() {
    for (const auto& c : kCronErrors) {
        const std::string cron = c[0].get<std::string>();
        const std::string want = c[1].get<std::string>();
        bool thrown = false;
        try {
            hron::cron::fromCron(cron);
        } catch (const HronError& e) {
            thrown = true;
            if (e.message() != want) {
                std::cerr << "cron: " << cron << "\nwant: " << want << "\ngot:  " << e.message() << "\n";
            }
            assert(e.kind() == hron::ErrorKind::Cron);
            assert(e.message() == want);
        }
        if (!thrown) std::cerr << "expected failure for: " << cron << "\n";
        assert(thrown);
    }
    std::cout << "[OK] fromCron errors (" << kCronErrors.size() << " cases)\n";
}

static void test_to_cron() {
    for (const auto& c : kToCron) {
        const std::string expr = c[0].get<std::string>();
        const std::string want = c[1].get<std::string>();
        const std::string got = Schedule::parse(expr).toCron();
        if (got != want) {
            std::cerr << "expr: " << expr << "\nwant: " << want << "\ngot:  " << got << "\n";
        }
        assert(got == want);
    }
    std::cout << "[OK] toCron (" << kToCron.size() << " cases)\n";
}

static void test_to_cron_rejections() {
    for (const auto& c : kNotExpressible) {
        const std::string expr = c[0].get<std::string>();
        const std::string want = "not expressible as cron (" + c[1].get<std::string>() + ")";
        bool thrown = false;
        try {
            Schedule::parse(expr).toCron();
        } catch (const HronError& e) {
            thrown = true;
            if (e.message() != want) {
                std::cerr << "expr: " << expr << "\nwant: " << want << "\ngot:  " << e.message() << "\n";
            }
            assert(e.kind() == hron::ErrorKind::Cron);
            assert(e.message() == want);
        }
        assert(thrown);
    }
    std::cout << "[OK] toCron rejections (" << kNotExpressible.size() << " cases)\n";
}

static void test_round_trip() {
    // 能表达的形状：hron -> cron -> hron 结构不变
    const char* exprs[] = {
        "every weekday at 09:00",
        "every weekend at 10:30",
        "every sun, mon at 08:00",
        "every day at 23:45",
        "every 15 min from 00:00 to 23:59",
        "every 2 hours from 00:00 to 23:59",
        "every month on the 1st, 15th at 12:00",
    };
    for (const char* expr : exprs) {
        const auto s = Schedule::parse(expr);
        const auto back = Schedule::fromCron(s.toCron());
        if (back != s) {
            std::cerr << "round trip: " << expr << " -> " << s.toCron() << " -> " << back.toString() << "\n";
        }
        assert(back == s);
    }

    // 反方向：cron -> hron -> cron
    const char* crons[] = {"0 9 * * 1-5", "*/20 * * * *", "0 */3 * * *", "5 4 1,2,3 * *"};
    for (const char* cron : crons) {
        assert(Schedule::fromCron(cron).toCron() == cron);
    }

    // 工作日 / 周末写成列表时，toCron 的输出再转一轮也不变
    const char* lists[] = {
        "every monday, tuesday, wednesday, thursday, friday at 09:00",
        "every saturday, sunday at 07:15",
        "every tue, thu at 18:00",
    };
    for (const char* expr : lists) {
        const std::string cron = Schedule::parse(expr).toCron();
        const std::string again = Schedule::fromCron(cron).toCron();
        if (again != cron) std::cerr << "round trip: " << expr << " -> " << cron << " -> " << again << "\n";
        assert(again == cron);
    }

    // fromCron 的结果总能按文本再解析回同一结构
    const char* parsedBack[] = {"*/15 9-17 * * *", "*/15 9 * * *", "0 9,17 * * *",
                                "30 * * * *", "5-50/15 8-10 * * 1-5", "0 */4 * * *"};
    for (const char* cron : parsedBack) {
        const auto s = Schedule::fromCron(cron);
        assert(Schedule::parse(s.toString()) == s);
    }
    std::cout << "[OK] round trip\n";
}

static void test_field_parsers() {
    using namespace hron::ast;
    auto months = hron::cron::parseMonthField("1-12/3");
    assert((months == std::vector<MonthName>{MonthName::Jan, MonthName::Apr, MonthName::Jul, MonthName::Oct}));
    assert(hron::cron::parseMonthField("*").empty());

    auto dom = std::get<DaysTarget>(hron::cron::parseDomField("1-10/3"));
    assert((dom.expand() == std::vector<int>{1, 4, 7, 10}));

    assert(hron::cron::parseDowField("*") == DayFilter::every());
    assert(hron::cron::parseDowField("1-5") == DayFilter::weekday());
    assert(hron::cron::parseDowField("6,0") == DayFilter::weekend());
    assert(hron::cron::parseDowField("6,7") == DayFilter::weekend());
    auto odd = hron::cron::parseDowField("1-5/2");
    assert((odd.days == std::vector<Weekday>{Weekday::Monday, Weekday::Wednesday, Weekday::Friday}));
    std::cout << "[OK] field parsers\n";
}

int main() {
    test_from_cron();
    test_from_cron_errors();
    test_to_cron();
    test_to_cron_rejections();
    test_round_trip();
    test_field_parsers();
    std::cout << "\nALL cron tests passed\n";
    return 0;
}
