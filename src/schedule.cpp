#include "schedule.h"
#include <utility>
#include "cron/cron_bridge.h"
#include "display/display.h"
#include "parser/parser.h"

namespace hron {

Schedule Schedule::parse(const std::string& input) {
    return Schedule(parser::parse(input));
}

Schedule Schedule::fromCron(const std::string& cron) {
    return Schedule(cron::fromCron(cron));
}

bool Schedule::validate(const std::string& input) {
    return parser::validate(input);
}

Schedule::Schedule(ast::ScheduleData data)
    : m_data(std::move(data)),
      m_zone(eval::resolveTimezone(m_data.timezone)) {
}

std::optional<Instant> Schedule::nextFrom(Instant now) const {
    return eval::nextFrom(m_data, m_zone, now);
}

std::vector<Instant> Schedule::nextNFrom(Instant now, std::size_t n) const {
    return eval::nextNFrom(m_data, m_zone, now, n);
}

std::optional<Instant> Schedule::previousFrom(Instant now) const {
    return eval::previousFrom(m_data, m_zone, now);
}

bool Schedule::matches(Instant at) const {
    return eval::matches(m_data, m_zone, at);
}

eval::Occurrences Schedule::occurrences(Instant from) const {
    return eval::occurrences(m_data, m_zone, from);
}

eval::Occurrences Schedule::between(Instant from, Instant to) const {
    return eval::between(m_data, m_zone, from, to);
}

std::string Schedule::toCron() const {
    return cron::toCron(m_data);
}

std::string Schedule::toString() const {
    return display::display(m_data);
}

} // namespace hron
