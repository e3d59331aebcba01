#pragma once

/// Chart computation: the whole pipeline from a request to a result.
///
///   validate → calendar → period → earth → heaven → leader
///            → stars / gates / deities → grid → formations → annotations
///
/// Every call is independent and reads only immutable tables.

#include "engine/calendar.h"
#include "engine/request.h"
#include "layout/grid.h"
#include "layout/leader.h"
#include "layout/period.h"
#include "layout/symbol_layout.h"
#include "patterns/annotations.h"
#include "patterns/recognizer.h"

#include <vector>

namespace qimen {

struct ChartResult {
    CalendarMoment calendar;
    Granularity granularity = Granularity::HOUR;
    ChartStyle style = ChartStyle::ROTATING;
    SubPeriodMethod method = SubPeriodMethod::PAIR_BASED;

    Period period;
    Pair reference;            ///< Pillar the chart is anchored on.
    LeaderInfo leader;
    StarLayout stars;
    GateLayout gates;
    Grid grid;

    Region day_stem_region = 1;   ///< Heaven region of the day stem, center lent to 2.
    Region hour_stem_region = 1;  ///< Heaven region of the hour stem, center lent to 2.

    std::vector<Formation> formations;
    std::vector<Annotation> annotations;

    bool operator==(const ChartResult&) const = default;
};

/// Pillar a chart of granularity `g` is anchored on.
Pair reference_pair(const Pillars& pillars, Granularity g) noexcept;

/// Validate `request`, resolve it through `calendar` and build the chart.
ChartResult compute_chart(const ChartRequest& request, const CalendarSource& calendar);

/// Build the chart for an already-resolved moment.
ChartResult compute_chart(const ChartRequest& request, const CalendarMoment& moment);

} // namespace qimen
