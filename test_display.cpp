#include <cassert>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>
using json = nlohmann::json;

#include "display/display.h"
#include "parser/parser.h"

// 让 R"(...)"_json 可用
using namespace nlohmann::json_literals;

// 每条：输入 -> 规范文本
static const json kCases = R"([
  ["every day at 9:00",                                   "every day at 09:00"],
  ["every weekday at 09:00, 17:30",                       "every weekday at 09:00, 17:30"],
  ["every weekends at 10:00",                             "every weekend at 10:00"],
  ["every mon, WED, friday at 08:00",                     "every monday, wednesday, friday at 08:00"],
  ["every 3 days at 09:00",                               "every 3 days at 09:00"],
  ["every 1 minute from 09:00 to 10:00",                  "every 1 minute from 09:00 to 10:00"],
  ["every 15 minutes from 9:00 to 17:00 on weekday",      "every 15 min from 09:00 to 17:00 on weekday"],
  ["every 1 hr from 00:00 to 23:59",                      "every 1 hour from 00:00 to 23:59"],
  ["every 2 hrs from 08:00 to 20:00 on sat, sun",         "every 2 hours from 08:00 to 20:00 on saturday, sunday"],
  ["every 2 weeks on tue, thu at 10:00",                  "every 2 weeks on tuesday, thursday at 10:00"],
  ["every month on the 1st, 2nd, 3rd, 11th at 09:00",     "every month on the 1st, 2nd, 3rd, 11th at 09:00"],
  ["every month on the 21st to 23rd at 09:00",            "every month on the 21st to 23rd at 09:00"],
  ["every 3 months on the last day at 18:00",             "every 3 months on the last day at 18:00"],
  ["every month on the last weekday at 18:00",            "every month on the last weekday at 18:00"],
  ["every month on the nearest weekday to 15th at 09:00", "every month on the nearest weekday to 15th at 09:00"],
  ["every month on the previous nearest weekday to 1st at 09:00",
                                                          "every month on the previous nearest weekday to 1st at 09:00"],
  ["every month on the second friday at 09:00",           "every month on the second friday at 09:00"],
  ["last fri of every month at 17:00",                    "last friday of every month at 17:00"],
  ["first monday of every 2 months at 09:00",             "first monday of every 2 months at 09:00"],
  ["on 2026-07-04 at 12:00",                              "on 2026-07-04 at 12:00"],
  ["on december 25 at 08:00",                             "on dec 25 at 08:00"],
  ["every year on jul 4 at 12:00",                        "every year on jul 4 at 12:00"],
  ["every 2 years on the fourth thursday of november at 12:00",
                                                          "every 2 years on the fourth thursday of nov at 12:00"],
  ["every year on the 22nd of feb at 09:00",              "every year on the 22nd of feb at 09:00"],
  ["every year on the last weekday of dec at 16:00",      "every year on the last weekday of dec at 16:00"],
  ["every day at 09:00 except dec 25, 2026-01-01 until 2026-12-31 starting 2026-01-01 during jan, feb in Europe/Berlin",
   "every day at 09:00 except dec 25, 2026-01-01 until 2026-12-31 starting 2026-01-01 during jan, feb in Europe/Berlin"],
  ["every weekday at 09:00 until dec 31",                 "every weekday at 09:00 until dec 31"]
])"_json;

static void test_canonical_table() {
    for (const auto& c : kCases) {
        const std::string input = c[0].get<std::string>();
        const std::string want = c[1].get<std::string>();
        const std::string got = hron::display::display(hron::parser::parse(input));
        if (got != want) {
            std::cerr << "input:  " << input << "\nwant:   " << want << "\ngot:    " << got << "\n";
        }
        assert(got == want);
    }
    std::cout << "[OK] canonical table (" << kCases.size() << " cases)\n";
}

static void test_fixed_point() {
    // display(parse(display(parse(s)))) == display(parse(s))，并且 AST 不变
    for (const auto& c : kCases) {
        const auto first = hron::parser::parse(c[0].get<std::string>());
        const std::string text = hron::display::display(first);
        const auto second = hron::parser::parse(text);
        assert(second == first);
        assert(hron::display::display(second) == text);
    }
    std::cout << "[OK] fixed point\n";
}

static void test_ordinal_number() {
    using hron::display::ordinalNumber;
    assert(ordinalNumber(1) == "1st");
    assert(ordinalNumber(2) == "2nd");
    assert(ordinalNumber(3) == "3rd");
    assert(ordinalNumber(4) == "4th");
    assert(ordinalNumber(11) == "11th");
    assert(ordinalNumber(12) == "12th");
    assert(ordinalNumber(13) == "13th");
    assert(ordinalNumber(21) == "21st");
    assert(ordinalNumber(22) == "22nd");
    assert(ordinalNumber(31) == "31st");
    assert(ordinalNumber(111) == "111th");
    std::cout << "[OK] ordinal number\n";
}

int main() {
    test_canonical_table();
    test_fixed_point();
    test_ordinal_number();
    std::cout << "\nALL display tests passed\n";
    return 0;
}
