#include "engine/calendar.h"
#include "engine/chart.h"
#include "engine/request.h"
#include "ring/regions.h"

#include <cstdlib>
#include <exception>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace {

// ── Command line ────────────────────────────────────────────────────
// qimen_chart [--granularity hour|day|month|year] [--style flying|rotating]
//             [--method pair|elapsed] [--lunar] [--trace]

qimen::ChartRequest parse_options(int argc, char** argv) {
    qimen::ChartRequest request;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        auto value = [&]() -> std::string_view {
            if (i + 1 >= argc) {
                throw std::invalid_argument("missing value for " + std::string(arg));
            }
            return argv[++i];
        };

        if (arg == "--granularity") {
            request.granularity = qimen::parse_granularity(value());
        } else if (arg == "--style") {
            request.style = qimen::parse_style(value());
        } else if (arg == "--method") {
            request.method = qimen::parse_method(value());
        } else if (arg == "--lunar") {
            request.lunar_input = true;
        } else if (arg == "--trace") {
            request.trace = true;
        } else {
            throw std::invalid_argument("unknown option: " + std::string(arg));
        }
    }
    return request;
}

// ── Moment from stdin ───────────────────────────────────────────────
// One keyword per line:
//   moment  Y M D h [m]        requested moment (validated)
//   solar   Y M D              solar date, defaults to the moment's date
//   lunar   TEXT               lunar date text, optional
//   pillars YP MP DP HP        e.g. 壬申 甲辰 丁酉 癸卯
//   term    NAME Y M D         current solar term and its start date

qimen::CalendarMoment read_moment(std::istream& in, qimen::ChartRequest& request) {
    qimen::CalendarMoment moment;
    bool have_moment = false, have_solar = false, have_pillars = false, have_term = false;

    std::string line;
    while (std::getline(in, line)) {
        std::istringstream fields(line);
        std::string keyword;
        if (!(fields >> keyword) || keyword[0] == '#') continue;

        if (keyword == "moment") {
            if (!(fields >> request.year >> request.month >> request.day >> request.hour)) {
                throw std::invalid_argument("moment: expected Y M D h [m]");
            }
            int minute = 0;
            if (fields >> minute) request.minute = minute;
            have_moment = true;
        } else if (keyword == "solar") {
            auto& d = moment.solar_date;
            if (!(fields >> d.year >> d.month >> d.day)) {
                throw std::invalid_argument("solar: expected Y M D");
            }
            have_solar = true;
        } else if (keyword == "lunar") {
            std::getline(fields >> std::ws, moment.lunar_date);
        } else if (keyword == "pillars") {
            std::string y, m, d, h;
            if (!(fields >> y >> m >> d >> h)) {
                throw std::invalid_argument("pillars: expected four stem-branch pairs");
            }
            moment.pillars = {qimen::parse_pair(y), qimen::parse_pair(m),
                              qimen::parse_pair(d), qimen::parse_pair(h)};
            have_pillars = true;
        } else if (keyword == "term") {
            auto& d = moment.term_start;
            if (!(fields >> moment.solar_term >> d.year >> d.month >> d.day)) {
                throw std::invalid_argument("term: expected NAME Y M D");
            }
            have_term = true;
        } else {
            throw std::invalid_argument("unknown keyword: " + keyword);
        }
    }

    if (!have_moment || !have_pillars || !have_term) {
        throw std::invalid_argument("input needs 'moment', 'pillars' and 'term' lines");
    }
    // A lunar moment needs the collaborator's solar date for day counting.
    if (!have_solar) {
        if (request.lunar_input) {
            throw std::invalid_argument("lunar input needs a 'solar' line");
        }
        moment.solar_date = {request.year, request.month, request.day};
    }
    return moment;
}

// ── Output ──────────────────────────────────────────────────────────

void print_chart(const qimen::ChartResult& chart) {
    using namespace qimen;
    const auto& cal = chart.calendar;
    const auto& p = cal.pillars;

    std::cout << "chart: " << to_string(chart.granularity) << ' ' << to_string(chart.style)
              << ' ' << to_string(chart.method) << '\n';
    std::cout << "solar: " << cal.solar_date.year << '-' << cal.solar_date.month << '-'
              << cal.solar_date.day;
    if (!cal.lunar_date.empty()) std::cout << "  lunar: " << cal.lunar_date;
    std::cout << '\n';
    std::cout << "pillars: " << to_string(p.year) << ' ' << to_string(p.month) << ' '
              << to_string(p.day) << ' ' << to_string(p.hour) << '\n';
    std::cout << "term: " << chart.period.term << "  dun: " << to_string(chart.period.direction)
              << "  ju: " << chart.period.configuration
              << "  yuan: " << chart.period.sub_period << '\n';
    std::cout << "leader: " << to_string(chart.leader.leader)
              << "  instrument: " << glyph(chart.leader.instrument)
              << "  void: " << glyph(chart.leader.void_branches[0])
              << glyph(chart.leader.void_branches[1]) << '\n';
    std::cout << "chief star: " << name(chart.stars.chief) << ' ' << chart.stars.home
              << " -> " << chart.stars.arrived
              << "  chief gate: " << name(chart.gates.chief) << ' ' << chart.gates.home
              << " -> " << chart.gates.arrived << '\n';
    std::cout << "day stem region: " << chart.day_stem_region
              << "  hour stem region: " << chart.hour_stem_region << '\n';

    std::cout << "\nregion  earth heaven gate star deity element\n";
    for (Region r : ALL_REGIONS) {
        const RegionCell& c = chart.grid.at(r);
        std::cout << r << ' ' << region_name(r) << "    " << glyph(c.earth) << "    "
                  << glyph(c.heaven) << "     " << glyph(c.gate) << "   " << glyph(c.star)
                  << "   " << glyph(c.deity) << "    " << glyph(c.element);
        if (c.is_void) std::cout << "  void";
        if (c.is_horse) std::cout << "  horse";
        std::cout << '\n';
    }

    std::cout << "\nformations: " << chart.formations.size() << '\n';
    for (const Formation& f : chart.formations) {
        std::cout << "  [" << glyph(f.type) << "] " << f.name << ": " << f.description;
        if (!f.regions.empty()) {
            std::cout << " (";
            for (std::size_t i = 0; i < f.regions.size(); ++i) {
                if (i != 0) std::cout << ',';
                std::cout << f.regions[i];
            }
            std::cout << ')';
        }
        std::cout << '\n';
    }

    std::cout << "\nannotations: " << chart.annotations.size() << '\n';
    for (const Annotation& a : chart.annotations) {
        std::cout << "  " << a.region << ' ' << region_name(a.region) << " [" << glyph(a.type)
                  << "] " << a.name << ": " << a.description << '\n';
    }
}

} // namespace

int main(int argc, char** argv) {
    try {
        qimen::ChartRequest request = parse_options(argc, argv);
        const qimen::PresetCalendar calendar(read_moment(std::cin, request));
        print_chart(qimen::compute_chart(request, calendar));
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << '\n';
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
