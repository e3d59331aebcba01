#include "layout/period.h"

#include <stdexcept>

namespace qimen {

namespace {

constexpr Direction YANG = Direction::FORWARD;
constexpr Direction YIN  = Direction::BACKWARD;

constexpr std::array<TermConfiguration, 24> TERMS{{
    {"冬至", YANG, {1, 7, 4}},
    {"小寒", YANG, {2, 8, 5}},
    {"大寒", YANG, {3, 9, 6}},
    {"立春", YANG, {8, 5, 2}},
    {"雨水", YANG, {9, 6, 3}},
    {"惊蛰", YANG, {1, 7, 4}},
    {"春分", YANG, {3, 9, 6}},
    {"清明", YANG, {4, 1, 7}},
    {"谷雨", YANG, {5, 2, 8}},
    {"立夏", YANG, {4, 1, 7}},
    {"小满", YANG, {5, 2, 8}},
    {"芒种", YANG, {6, 3, 9}},
    {"夏至", YIN,  {9, 3, 6}},
    {"小暑", YIN,  {8, 2, 5}},
    {"大暑", YIN,  {7, 1, 4}},
    {"立秋", YIN,  {2, 5, 8}},
    {"处暑", YIN,  {1, 4, 7}},
    {"白露", YIN,  {9, 3, 6}},
    {"秋分", YIN,  {7, 1, 4}},
    {"寒露", YIN,  {6, 9, 3}},
    {"霜降", YIN,  {5, 8, 2}},
    {"立冬", YIN,  {6, 9, 3}},
    {"小雪", YIN,  {5, 8, 2}},
    {"大雪", YIN,  {4, 7, 1}},
}};

//                                               子      丑      寅      卯
constexpr std::array<std::string_view, NUM_BRANCHES> MONTH_TERMS{
    "大雪", "小寒", "立春", "惊蛰",
//   辰      巳      午      未
    "清明", "立夏", "芒种", "小暑",
//   申      酉      戌      亥
    "立秋", "白露", "寒露", "立冬",
};

} // namespace

std::span<const TermConfiguration> term_table() noexcept { return TERMS; }

const TermConfiguration& term_configuration(std::string_view term) {
    for (const auto& row : TERMS) {
        if (row.name == term) return row;
    }
    throw std::logic_error("unknown solar term: '" + std::string(term) + "'");
}

std::size_t sub_period_by_pair(Pair day_pair) {
    // Leaders sit at cycle positions 0,10,20,30,40,50; decades three
    // apart (甲子/甲午, 甲戌/甲辰, 甲申/甲寅) share a sub-period.
    return (cycle_index(day_pair) / DECADE_LENGTH) % NUM_SUB_PERIODS;
}

std::size_t sub_period_by_elapsed_days(long day_number) noexcept {
    if (day_number <= 5) return 0;
    if (day_number <= 10) return 1;
    return 2;
}

std::size_t sub_period_by_branch(Branch b) noexcept {
    // 子卯午酉 are 0 mod 3, 寅巳申亥 2 mod 3, 丑辰未戌 1 mod 3.
    switch (index_of(b) % 3) {
    case 0:  return 0;
    case 2:  return 1;
    default: return 2;
    }
}

std::string_view month_governing_term(Branch month_branch) noexcept {
    return MONTH_TERMS[index_of(month_branch)];
}

Period resolve_period(std::string_view term, std::size_t sub_period) {
    if (sub_period >= NUM_SUB_PERIODS) {
        throw std::out_of_range("sub-period out of range: " + std::to_string(sub_period));
    }
    const auto& row = term_configuration(term);
    return {std::string(row.name), row.direction,
            row.configurations[sub_period], sub_period};
}

Period resolve_period(std::string_view term,
                      SubPeriodMethod method,
                      Pair day_pair,
                      CivilDate term_start,
                      CivilDate date) {
    std::size_t sub_period = 0;
    switch (method) {
    case SubPeriodMethod::PAIR_BASED:
        sub_period = sub_period_by_pair(day_pair);
        break;
    case SubPeriodMethod::ELAPSED_DAYS:
        sub_period = sub_period_by_elapsed_days(days_between(term_start, date) + 1);
        break;
    }
    return resolve_period(term, sub_period);
}

Period resolve_month_period(Pair month_pair) {
    return resolve_period(month_governing_term(month_pair.branch),
                          sub_period_by_branch(month_pair.branch));
}

Period resolve_year_period(std::string_view current_term, Pair year_pair) {
    const auto& row = term_configuration(current_term);
    return {std::string(row.name), row.direction,
            static_cast<int>(cycle_index(year_pair) % 9) + 1,
            sub_period_by_branch(year_pair.branch)};
}

} // namespace qimen
