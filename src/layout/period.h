#pragma once

/// Period resolution: solar term → direction, configuration number and
/// sub-period.
///
/// Each of the 24 solar terms fixes a direction and three configuration
/// numbers, one per sub-period of the term.  Hour and day charts pick
/// the sub-period by one of two methods; month and year charts derive
/// everything from their own pillar.

#include "common.h"
#include "cycle/civil_date.h"
#include "cycle/sexagenary.h"

#include <array>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace qimen {

enum class SubPeriodMethod : unsigned char {
    PAIR_BASED,    ///< Decade leader of the day pair.
    ELAPSED_DAYS,  ///< Days since the term started, in five-day buckets.
};

inline constexpr std::size_t NUM_SUB_PERIODS = 3;

struct TermConfiguration {
    std::string_view name;
    Direction direction;
    std::array<int, NUM_SUB_PERIODS> configurations;
};

/// All 24 rows, starting from 冬至.
std::span<const TermConfiguration> term_table() noexcept;

/// Row for `term`.  Unknown names throw std::logic_error: the calendar
/// only ever produces the 24 table names.
const TermConfiguration& term_configuration(std::string_view term);

/// 甲子/甲午 decades → 0, 甲戌/甲辰 → 1, 甲申/甲寅 → 2.
std::size_t sub_period_by_pair(Pair day_pair);

/// `day_number` counts the term's first day as 1: 1–5 → 0, 6–10 → 1,
/// later → 2.  Anything below 1 falls back to 0.
std::size_t sub_period_by_elapsed_days(long day_number) noexcept;

/// 子午卯酉 → 0, 寅申巳亥 → 1, 辰戌丑未 → 2.
std::size_t sub_period_by_branch(Branch b) noexcept;

/// Solar term that governs the month whose branch is `month_branch`
/// (寅 → 立春, 卯 → 惊蛰, …, 丑 → 小寒).
std::string_view month_governing_term(Branch month_branch) noexcept;

struct Period {
    std::string term;            ///< Term the direction and configuration came from.
    Direction direction = Direction::FORWARD;
    int configuration = 1;       ///< Starting region of the earth layout, 1..9.
    std::size_t sub_period = 0;  ///< 0 upper, 1 middle, 2 lower.

    bool operator==(const Period&) const = default;
};

/// Period for an explicit sub-period of `term`.
Period resolve_period(std::string_view term, std::size_t sub_period);

/// Hour and day charts.
Period resolve_period(std::string_view term,
                      SubPeriodMethod method,
                      Pair day_pair,
                      CivilDate term_start,
                      CivilDate date);

/// Month charts: term, sub-period and configuration follow the month pillar.
Period resolve_month_period(Pair month_pair);

/// Year charts: direction from the current term, sub-period from the
/// year branch, configuration (cycle index mod 9) + 1.
Period resolve_year_period(std::string_view current_term, Pair year_pair);

} // namespace qimen
