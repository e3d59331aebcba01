#pragma once

/// A chart request: the calendar moment plus every chart option.
///
/// Defaults give an hour chart in the rotating style with pair-based
/// sub-periods.

#include "layout/heaven.h"
#include "layout/period.h"

#include <optional>
#include <string_view>

namespace qimen {

enum class Granularity : unsigned char { HOUR, DAY, MONTH, YEAR };

struct ChartRequest {
    int year = 2000;
    int month = 1;
    int day = 1;
    int hour = 0;
    std::optional<int> minute;
    bool lunar_input = false;  ///< Date fields are a lunar date.
    Granularity granularity = Granularity::HOUR;
    ChartStyle style = ChartStyle::ROTATING;
    SubPeriodMethod method = SubPeriodMethod::PAIR_BASED;
    bool trace = false;        ///< Log each pipeline stage to stderr.
};

inline constexpr int MIN_YEAR = 1900;
inline constexpr int MAX_YEAR = 2100;

/// Throws std::invalid_argument naming the first field out of range.
/// Nothing is clamped or defaulted.
void validate(const ChartRequest& request);

const char* to_string(Granularity g) noexcept;
const char* to_string(SubPeriodMethod m) noexcept;

/// Option parsers for the command line ("hour", "flying", "elapsed", …).
/// Unknown words throw std::invalid_argument.
Granularity     parse_granularity(std::string_view text);
ChartStyle      parse_style(std::string_view text);
SubPeriodMethod parse_method(std::string_view text);

} // namespace qimen
