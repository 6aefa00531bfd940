#pragma once
#include <chrono>
#include <cstddef>
#include <iterator>
#include <optional>
#include <string>
#include <vector>
#include <absl/time/time.h>
#include "ast/schedule_ast.h"

namespace hron::eval {

using Instant = std::chrono::system_clock::time_point;

// 单次搜索的迭代上限
constexpr int kMaxIterations = 1000;

// 没写时区时按 UTC；无法识别的 IANA 名字抛 EvalError
absl::TimeZone resolveTimezone(const std::optional<std::string>& name);

// 严格晚于 now 的下一次触发；没有则返回空
std::optional<Instant> nextFrom(const ast::ScheduleData& schedule,
                                const absl::TimeZone& tz,
                                Instant now);

// 严格早于 now 的上一次触发
std::optional<Instant> previousFrom(const ast::ScheduleData& schedule,
                                    const absl::TimeZone& tz,
                                    Instant now);

bool matches(const ast::ScheduleData& schedule, const absl::TimeZone& tz, Instant at);

// 连续调用 nextFrom，以上一次命中为新起点，最多 n 个
std::vector<Instant> nextNFrom(const ast::ScheduleData& schedule,
                               const absl::TimeZone& tz,
                               Instant now,
                               std::size_t n);

// 惰性序列：每次 next() 才计算一个结果，耗尽后一直返回空。
// 有上界时只产出 (from, to] 内的结果
class Occurrences {
public:
    Occurrences(ast::ScheduleData schedule,
                absl::TimeZone tz,
                Instant from,
                std::optional<Instant> to = std::nullopt);

    std::optional<Instant> next();
    bool exhausted() const { return m_done; }

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Instant;
        using difference_type = std::ptrdiff_t;
        using pointer = const Instant*;
        using reference = const Instant&;

        iterator() = default;
        explicit iterator(Occurrences* owner);

        reference operator*() const { return *m_current; }
        pointer operator->() const { return &*m_current; }
        iterator& operator++();

        bool operator==(const iterator& o) const;
        bool operator!=(const iterator& o) const { return !(*this == o); }

    private:
        Occurrences* m_owner{nullptr};
        std::optional<Instant> m_current;
    };

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

private:
    ast::ScheduleData m_schedule;
    absl::TimeZone m_tz;
    absl::Time m_cursor;
    std::optional<absl::Time> m_to;
    bool m_done{false};
};

Occurrences occurrences(const ast::ScheduleData& schedule, const absl::TimeZone& tz, Instant from);

// from < t <= to
Occurrences between(const ast::ScheduleData& schedule,
                    const absl::TimeZone& tz,
                    Instant from,
                    Instant to);

} // namespace hron::eval
