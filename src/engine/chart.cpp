#include "engine/chart.h"
#include "layout/earth.h"
#include "layout/heaven.h"

#include <cstdio>
#include <optional>

namespace qimen {

namespace {

Period select_period(const ChartRequest& request, const CalendarMoment& moment) {
    const Pillars& p = moment.pillars;
    switch (request.granularity) {
    case Granularity::MONTH:
        return resolve_month_period(p.month);
    case Granularity::YEAR:
        return resolve_year_period(moment.solar_term, p.year);
    case Granularity::HOUR:
    case Granularity::DAY:
        break;
    }
    return resolve_period(moment.solar_term, request.method, p.day,
                          moment.term_start, moment.solar_date);
}

/// The pipeline proper; callers validate first.
ChartResult build_chart(const ChartRequest& request, const CalendarMoment& moment) {
    ChartResult result;
    result.calendar = moment;
    result.granularity = request.granularity;
    result.style = request.style;
    result.method = request.method;

    // ── Period and earth ────────────────────────────────────────────
    result.period = select_period(request, moment);
    const Direction dir = result.period.direction;
    const StemLayout earth = earth_layout(result.period.configuration, dir);

    if (request.trace) {
        std::fprintf(stderr, "chart: granularity=%s style=%s term=%s dun=%s ju=%d yuan=%zu\n",
                     to_string(request.granularity), to_string(request.style),
                     result.period.term.c_str(), to_string(dir),
                     result.period.configuration, result.period.sub_period);
    }

    // ── Heaven and leader ───────────────────────────────────────────
    result.reference = reference_pair(moment.pillars, request.granularity);
    const StemLayout heaven = heaven_layout(request.style, earth, result.reference, dir);
    result.leader = resolve_leader(result.reference, earth);

    if (request.trace) {
        std::fprintf(stderr, "  reference=%s anchor=%d leader=%s instrument=%s chief=%d\n",
                     to_string(result.reference).c_str(),
                     heaven_anchor(earth, result.reference),
                     to_string(result.leader.leader).c_str(),
                     glyph(result.leader.instrument), result.leader.chief_region);
    }

    // ── Stars, gates, deities ───────────────────────────────────────
    const RingKind ring = symbol_ring(request.style);
    const Branch time_branch = result.reference.branch;
    result.stars = layout_stars(result.leader.chief_region, time_branch, dir, ring);
    result.gates = layout_gates(result.leader.chief_region, time_branch, dir, ring);
    const DeityLayout deities = layout_deities(result.stars.arrived, dir);

    if (request.trace) {
        std::fprintf(stderr, "  star=%s %d->%d gate=%s %d->%d\n",
                     glyph(result.stars.chief), result.stars.home, result.stars.arrived,
                     glyph(result.gates.chief), result.gates.home, result.gates.arrived);
    }

    // ── Grid ────────────────────────────────────────────────────────
    result.grid = assemble_grid(earth, heaven, result.gates, result.stars, deities,
                                result.leader.void_branches, moment.pillars.day.branch);
    result.day_stem_region = heaven.anchor_region(disguised_stem(moment.pillars.day));
    result.hour_stem_region = heaven.anchor_region(disguised_stem(moment.pillars.hour));

    // ── Formations ──────────────────────────────────────────────────
    std::optional<HourContext> hour;
    if (request.granularity == Granularity::HOUR) {
        hour = HourContext{moment.pillars.day.stem, moment.pillars.hour, result.leader.leader};
    }
    result.formations = recognize_patterns(result.grid, result.stars, result.gates, hour);


    // ── Annotations ─────────────────────────────────────────────────
    result.annotations = annotate_regions(result.grid, moment.pillars.year,
                                          moment.pillars.month, moment.pillars.day);

    if (request.trace) {
        std::fprintf(stderr, "  formations=%zu annotations=%zu\n",
                     result.formations.size(), result.annotations.size());
    }
    return result;
}

} // namespace

Pair reference_pair(const Pillars& pillars, Granularity g) noexcept {
    switch (g) {
    case Granularity::YEAR:  return pillars.year;
    case Granularity::MONTH: return pillars.month;
    case Granularity::DAY:   return pillars.day;
    case Granularity::HOUR:  break;
    }
    return pillars.hour;
}

ChartResult compute_chart(const ChartRequest& request, const CalendarSource& calendar) {
    validate(request);
    return build_chart(request, calendar.resolve(request));
}

ChartResult compute_chart(const ChartRequest& request, const CalendarMoment& moment) {
    validate(request);
    return build_chart(request, moment);
}

} // namespace qimen
