#include "engine/request.h"

#include <stdexcept>
#include <string>

namespace qimen {

namespace {

void check_range(const char* field, int value, int lo, int hi) {
    if (value < lo || value > hi) {
        throw std::invalid_argument(std::string(field) + " out of range [" + std::to_string(lo)
                                    + ", " + std::to_string(hi) + "]: " + std::to_string(value));
    }
}

template <class E>
void check_enum(const char* field, E value, E last) {
    if (static_cast<unsigned>(value) > static_cast<unsigned>(last)) {
        throw std::invalid_argument(std::string("invalid ") + field + ": "
                                    + std::to_string(static_cast<unsigned>(value)));
    }
}

} // namespace

void validate(const ChartRequest& request) {
    check_range("year", request.year, MIN_YEAR, MAX_YEAR);
    check_range("month", request.month, 1, 12);
    check_range("day", request.day, 1, 31);
    check_range("hour", request.hour, 0, 23);
    if (request.minute) check_range("minute", *request.minute, 0, 59);
    check_enum("granularity", request.granularity, Granularity::YEAR);
    check_enum("style", request.style, ChartStyle::ROTATING);
    check_enum("sub-period method", request.method, SubPeriodMethod::ELAPSED_DAYS);
}

const char* to_string(Granularity g) noexcept {
    switch (g) {
    case Granularity::HOUR:  return "hour";
    case Granularity::DAY:   return "day";
    case Granularity::MONTH: return "month";
    case Granularity::YEAR:  return "year";
    }
    return "?";
}

const char* to_string(SubPeriodMethod m) noexcept {
    return m == SubPeriodMethod::PAIR_BASED ? "pair" : "elapsed";
}

Granularity parse_granularity(std::string_view text) {
    if (text == "hour")  return Granularity::HOUR;
    if (text == "day")   return Granularity::DAY;
    if (text == "month") return Granularity::MONTH;
    if (text == "year")  return Granularity::YEAR;
    throw std::invalid_argument("unknown granularity: '" + std::string(text) + "'");
}

ChartStyle parse_style(std::string_view text) {
    if (text == "flying")   return ChartStyle::FLYING;
    if (text == "rotating") return ChartStyle::ROTATING;
    throw std::invalid_argument("unknown chart style: '" + std::string(text) + "'");
}

SubPeriodMethod parse_method(std::string_view text) {
    if (text == "pair")    return SubPeriodMethod::PAIR_BASED;
    if (text == "elapsed") return SubPeriodMethod::ELAPSED_DAYS;
    throw std::invalid_argument("unknown sub-period method: '" + std::string(text) + "'");
}

} // namespace qimen
