#pragma once

/// The calendar collaborator.
///
/// Converting a civil moment into sexagenary pillars and solar terms is
/// outside this engine.  A CalendarSource supplies the converted moment;
/// the engine trusts it as exact.

#include "cycle/civil_date.h"
#include "cycle/sexagenary.h"
#include "engine/request.h"

#include <string>
#include <utility>

namespace qimen {

struct Pillars {
    Pair year;
    Pair month;
    Pair day;
    Pair hour;

    bool operator==(const Pillars&) const = default;
};

struct CalendarMoment {
    CivilDate solar_date;     ///< Solar date of the moment.
    std::string lunar_date;   ///< Display text, empty when not supplied.
    Pillars pillars;
    std::string solar_term;   ///< Most recent term at or before the moment.
    CivilDate term_start;     ///< Solar date that term began.

    bool operator==(const CalendarMoment&) const = default;
};

class CalendarSource {
public:
    virtual ~CalendarSource() = default;

    /// Convert the request's moment.  Failures propagate to the caller.
    virtual CalendarMoment resolve(const ChartRequest& request) const = 0;
};

/// Returns one moment fixed at construction, whatever the request.
class PresetCalendar final : public CalendarSource {
public:
    explicit PresetCalendar(CalendarMoment moment) : moment_{std::move(moment)} {}

    CalendarMoment resolve(const ChartRequest&) const override { return moment_; }

private:
    CalendarMoment moment_;
};

} // namespace qimen
