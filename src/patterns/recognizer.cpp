#include "patterns/recognizer.h"
#include "ring/regions.h"

#include <algorithm>
#include <stdexcept>
#include <string_view>

namespace qimen {

namespace {

// ── Formation collection ────────────────────────────────────────────

class FormationSink {
public:
    void add(std::string_view name, FormationType type,
             std::string description, std::vector<Region> regions) {
        Formation f{std::string(name), type, std::move(description), std::move(regions)};
        const bool seen = std::any_of(out_.begin(), out_.end(), [&](const Formation& g) {
            return g.name == f.name && g.description == f.description && g.regions == f.regions;
        });
        if (!seen) out_.push_back(std::move(f));
    }

    std::vector<Formation> take() { return std::move(out_); }

private:
    std::vector<Formation> out_;
};

// ── Description templates ───────────────────────────────────────────

std::string expand(std::string_view tmpl, const RegionCell& cell,
                   const std::optional<HourContext>& hour) {
    std::string out;
    std::size_t pos = 0;
    while (pos < tmpl.size()) {
        const std::size_t open = tmpl.find('{', pos);
        if (open == std::string_view::npos) break;
        const std::size_t close = tmpl.find('}', open);
        if (close == std::string_view::npos) break;

        out.append(tmpl.substr(pos, open - pos));
        const std::string_view key = tmpl.substr(open + 1, close - open - 1);
        if (key == "heaven") {
            out += glyph(cell.heaven);
        } else if (key == "earth") {
            out += glyph(cell.earth);
        } else if (key == "gate") {
            out += glyph(cell.gate);
        } else if (key == "star") {
            out += glyph(cell.star);
        } else if (key == "deity") {
            out += name(cell.deity);
        } else if (key == "region") {
            out += region_name(cell.region);
        } else if (key == "hour_branch" && hour) {
            out += glyph(hour->hour.branch);
        } else {
            throw std::logic_error("unknown description placeholder: {"
                                   + std::string(key) + "}");
        }
        pos = close + 1;
    }
    out.append(tmpl.substr(std::min(pos, tmpl.size())));
    return out;
}

// ── Catalog rows ────────────────────────────────────────────────────

bool matches(const RegionRule& rule, const RegionCell& cell) {
    if (!rule.heaven.admits(cell.heaven)) return false;
    if (!rule.earth.admits(cell.earth)) return false;
    if (!rule.gates.admits(cell.gate)) return false;
    if (!rule.stars.admits(cell.star)) return false;
    if (!rule.deities.admits(cell.deity)) return false;
    if (!rule.regions.admits(cell.region)) return false;

    switch (rule.relation) {
    case Relation::NONE:
        return true;
    case Relation::GATE_OVERCOMES_REGION:
        return overcomes(element_of(cell.gate), cell.element);
    }
    return false;
}

void apply_region_rules(const Grid& grid, const std::optional<HourContext>& hour,
                        FormationSink& sink) {
    for (const RegionRule& rule : region_rules()) {
        if (rule.anchor == Anchor::HOUR_BRANCH_REGION) {
            if (!hour) continue;
            const RegionCell& cell = grid[branch_region(hour->hour.branch)];
            if (matches(rule, cell)) {
                sink.add(rule.name, rule.type, expand(rule.description, cell, hour), {cell.region});
            }
            continue;
        }
        for (Region r : ALL_REGIONS) {
            if (rule.outer_only && r == CENTER) continue;
            const RegionCell& cell = grid[r];
            if (matches(rule, cell)) {
                sink.add(rule.name, rule.type, expand(rule.description, cell, hour), {r});
            }
        }
    }
}

void apply_stem_pair_rules(const Grid& grid, FormationSink& sink) {
    for (const StemPairRule& rule : stem_pair_rules()) {
        for (Region r : ALL_REGIONS) {
            const RegionCell& cell = grid[r];
            if (cell.heaven != rule.heaven || cell.earth != rule.earth) continue;
            sink.add(rule.name, rule.type,
                     std::string(rule.description) + "，于" + region_name(r) + "宫", {r});
        }
    }
}

void apply_harmony(const Grid& grid, FormationSink& sink) {
    for (Region r : ALL_REGIONS) {
        if (r == CENTER) continue;
        const RegionCell& cell = grid[r];
        for (const auto& [a, b] : harmony_pairs()) {
            if (!((cell.heaven == a && cell.earth == b) || (cell.heaven == b && cell.earth == a))) {
                continue;
            }
            const std::string heaven = glyph(cell.heaven);
            const std::string earth = glyph(cell.earth);
            sink.add(heaven + earth + "合", FormationType::AUSPICIOUS,
                     heaven + "与" + earth + "相合于" + region_name(r) + "宫", {r});
        }
    }
}

// ── Aggregates ──────────────────────────────────────────────────────

void apply_aggregates(const Grid& grid, const StarLayout& stars, const GateLayout& gates,
                      FormationSink& sink) {
    if (stars.arrived == stars.home) {
        sink.add("星伏吟", FormationType::NEUTRAL, "值符星临本宫", {stars.home});
    }
    if (gates.arrived == gates.home) {
        sink.add("门伏吟", FormationType::NEUTRAL, "值使门临本宫", {gates.home});
    }

    std::size_t same = 0;
    for (Region r : ALL_REGIONS) {
        if (grid[r].heaven == grid[r].earth) ++same;
    }
    if (same >= HIDDEN_CHART_THRESHOLD) {
        sink.add("天地伏吟", FormationType::NEUTRAL, "天盘地盘干支相同", {});
    }

    if (stars.arrived == opposite_region(stars.home)) {
        sink.add("星反吟", FormationType::NEUTRAL, "值符星落对冲宫", {stars.arrived});
    }
    if (gates.arrived == opposite_region(gates.home)) {
        sink.add("门反吟", FormationType::NEUTRAL, "值使门落对冲宫", {gates.arrived});
    }

    std::size_t crossed = 0;
    for (Region r : ALL_REGIONS) {
        if (r == CENTER) continue;
        if (grid[r].heaven == grid[opposite_region(r)].earth) ++crossed;
    }
    if (crossed >= REVERSED_CHART_THRESHOLD) {
        sink.add("天地反吟", FormationType::NEUTRAL, "天盘干多落对冲宫地盘干位", {});
    }
}

// ── Hour-chart stem rules ───────────────────────────────────────────

Region heaven_region(const Grid& grid, Stem s) {
    for (Region r : ALL_REGIONS) {
        if (grid[r].heaven == s) return r;
    }
    return 0;
}

Region earth_region(const Grid& grid, Stem s) {
    for (Region r : ALL_REGIONS) {
        if (grid[r].earth == s) return r;
    }
    return 0;
}

void apply_hour_rules(const Grid& grid, const HourContext& hour, FormationSink& sink) {
    const Stem day = hour.day_stem;
    const Stem hour_stem = hour.hour.stem;

    if (clashing_hour_stem(day) == hour_stem) {
        sink.add("五不遇时", FormationType::INAUSPICIOUS,
                 std::string("时干") + glyph(hour_stem) + "克日干" + glyph(day), {});
    }

    // 甲 never shows on a layout; both stems hide behind the reference
    // decade's instrument.
    const Stem instrument = instrument_for(hour.leader);
    const Stem day_shown = day == Stem::JIA ? instrument : day;
    const Stem hour_shown = hour_stem == Stem::JIA ? instrument : hour_stem;
    const std::string day_label = disguised_label(day, instrument);
    const std::string hour_label = disguised_label(hour_stem, instrument);

    const Region hour_heaven = heaven_region(grid, hour_shown);
    const Region day_earth = earth_region(grid, day_shown);
    if (hour_heaven != 0 && hour_heaven == day_earth) {
        sink.add("飞干格", FormationType::INAUSPICIOUS,
                 "时干" + hour_label + "飞临日干" + day_label + "地盘宫", {hour_heaven});
    }

    const Region day_heaven = heaven_region(grid, day_shown);
    const Region hour_earth = earth_region(grid, hour_shown);
    if (day_heaven != 0 && day_heaven == hour_earth) {
        sink.add("伏干格", FormationType::INAUSPICIOUS,
                 "日干" + day_label + "伏于时干" + hour_label + "地盘宫", {day_heaven});
    }
}

} // namespace

std::string disguised_label(Stem stem, Stem instrument) {
    if (stem != Stem::JIA) return glyph(stem);
    return std::string("甲(遁") + glyph(instrument) + ")";
}

std::vector<Formation> recognize_patterns(const Grid& grid,
                                          const StarLayout& stars,
                                          const GateLayout& gates,
                                          const std::optional<HourContext>& hour) {
    FormationSink sink;
    apply_region_rules(grid, hour, sink);
    apply_stem_pair_rules(grid, sink);
    apply_harmony(grid, sink);
    apply_aggregates(grid, stars, gates, sink);
    if (hour) apply_hour_rules(grid, *hour, sink);
    return sink.take();
}

} // namespace qimen
