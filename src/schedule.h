#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <absl/time/time.h>
#include "ast/schedule_ast.h"
#include "eval/evaluator.h"

namespace hron {

using Instant = eval::Instant;

// 对外入口：解析结果 + 已加载的时区。构造后只读，可以跨线程共享
class Schedule {
public:
    // 解析 hron 表达式；词法 / 语法错误抛 HronError，时区不存在抛 EvalError
    static Schedule parse(const std::string& input);
    // 5 段 cron -> Schedule
    static Schedule fromCron(const std::string& cron);
    static bool validate(const std::string& input);

    explicit Schedule(ast::ScheduleData data);

    std::optional<Instant> nextFrom(Instant now) const;
    std::vector<Instant> nextNFrom(Instant now, std::size_t n) const;
    std::optional<Instant> previousFrom(Instant now) const;
    bool matches(Instant at) const;

    eval::Occurrences occurrences(Instant from) const;
    eval::Occurrences between(Instant from, Instant to) const;

    std::string toCron() const;
    std::string toString() const;

    // 未指定时区时为空（求值按 UTC）
    const std::optional<std::string>& timezone() const { return m_data.timezone; }
    const absl::TimeZone& zone() const { return m_zone; }
    const ast::ScheduleData& data() const { return m_data; }

    bool operator==(const Schedule& o) const { return m_data == o.m_data; }
    bool operator!=(const Schedule& o) const { return !(*this == o); }

private:
    ast::ScheduleData m_data;
    absl::TimeZone m_zone;
};

} // namespace hron
