#pragma once

/// Pattern recognition over an assembled grid.
///
/// Runs every catalog row against the grid, then a fixed set of
/// aggregate checks (chief star and gate at home or opposite home,
/// grid-wide heaven/earth agreement), then the hour-chart rules that
/// compare the day and hour stems.  Output follows catalog order and
/// holds no duplicates, so identical input gives identical output.

#include "common.h"
#include "cycle/sexagenary.h"
#include "layout/grid.h"
#include "layout/symbol_layout.h"
#include "patterns/catalog.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace qimen {

struct Formation {
    std::string name;
    FormationType type = FormationType::NEUTRAL;
    std::string description;
    std::vector<Region> regions;  ///< Empty for grid-wide formations.

    bool operator==(const Formation&) const = default;
};

/// Stems needed by the rules that only apply to hour charts.
struct HourContext {
    Stem day_stem = Stem::JIA;
    Pair hour;
    Pair leader;  ///< Decade leader of the chart's reference pair.
};

/// Minimum number of regions with equal heaven and earth stems for 天地伏吟.
inline constexpr std::size_t HIDDEN_CHART_THRESHOLD = 8;

/// Minimum number of outer regions whose heaven stem matches the earth
/// stem opposite it for 天地反吟.
inline constexpr std::size_t REVERSED_CHART_THRESHOLD = 6;

/// Label for `stem` in descriptions: 甲 also names the instrument it
/// hides behind, as in "甲(遁戊)".
std::string disguised_label(Stem stem, Stem instrument);

std::vector<Formation> recognize_patterns(const Grid& grid,
                                          const StarLayout& stars,
                                          const GateLayout& gates,
                                          const std::optional<HourContext>& hour);

} // namespace qimen
