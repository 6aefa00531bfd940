#pragma once
#include <array>
#include <string>
#include <vector>
#include "ast/schedule_ast.h"

namespace hron::cron {

// ScheduleData -> 5 段 cron。表达不了的形状抛 CronError，不做近似
std::string toCron(const ast::ScheduleData& schedule);

// 5 段 cron（或 @daily 这类简写）-> ScheduleData，字段非法时抛 CronError
ast::ScheduleData fromCron(const std::string& cron);

// 逐字段翻译 5 段 cron
class CronReader {
public:
    explicit CronReader(const std::string& spec);

    ast::ScheduleData read() const;

private:
    std::array<std::string, 5> m_fields;   // 分 时 日 月 周
    std::vector<ast::MonthName> m_during;

private:
    const std::string& minuteField() const { return m_fields[0]; }
    const std::string& hourField() const { return m_fields[1]; }
    const std::string& domField() const { return m_fields[2]; }
    const std::string& dowField() const { return m_fields[4]; }

    ast::ScheduleData withDuring(ast::ScheduleExpr expr) const;
    // 分、时字段的值 / 列表 / 区间 / 步长做笛卡尔积，按时刻升序
    std::vector<ast::TimeOfDay> readTimes() const;

    // 扩展语法：n#k、nL、L、LW
    bool tryNthWeekday(ast::ScheduleData& out) const;
    bool tryLastDay(ast::ScheduleData& out) const;
    // */N、a-b/N 这类步长写法
    bool tryInterval(ast::ScheduleData& out) const;
    // 固定分钟 + 小时 *：每小时一次
    bool tryHourly(ast::ScheduleData& out) const;
};

// 月字段 -> during 列表；"*" 返回空
std::vector<ast::MonthName> parseMonthField(const std::string& field);

// 日字段 -> DaysTarget；区间保留为区间，步长展开成单日
ast::MonthTarget parseDomField(const std::string& field);

// 周字段 -> DayFilter；正好是周一到周五 / 周六周日时折叠成 Weekday / Weekend
ast::DayFilter parseDowField(const std::string& field);

} // namespace hron::cron
