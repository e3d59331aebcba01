#pragma once

/// Region annotations (神煞): markers looked up from the pillars.
///
/// Like the formation catalog, every annotation is a row of data.  A row
/// is keyed on one pillar value (day stem, day/month/year branch, or
/// nothing) and names, for each key value, the branches or the earth
/// stems it marks.  A marked branch lands on its region; a marked earth
/// stem lands wherever the earth layout put it, so 甲 never lands.
/// Descriptions expand {branch} to the marked branch glyph.

#include "common.h"
#include "cycle/sexagenary.h"
#include "layout/grid.h"
#include "patterns/catalog.h"
#include "symbols/stem_branch.h"

#include <array>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace qimen {

enum class AnnotationType : unsigned char { AUSPICIOUS, INAUSPICIOUS, NEUTRAL };

/// 吉 / 凶 / 中性
const char* glyph(AnnotationType t) noexcept;

using BranchSet = SymbolSet<Branch>;

/// Pillar value a row is keyed on.
enum class AnnotationKey : unsigned char {
    NONE,          ///< Fixed marks, read from entry 0.
    DAY_STEM,
    DAY_BRANCH,
    MONTH_BRANCH,
    YEAR_BRANCH,
};

struct AnnotationRule {
    std::string_view name;
    AnnotationType type = AnnotationType::NEUTRAL;
    std::string_view description;
    AnnotationKey key = AnnotationKey::NONE;
    std::array<BranchSet, NUM_BRANCHES> branches{};   ///< Indexed by the key's stem or branch.
    std::array<StemSet, NUM_BRANCHES> earth_stems{};  ///< Indexed the same way.
};

std::span<const AnnotationRule> annotation_rules() noexcept;

struct Annotation {
    std::string name;
    AnnotationType type = AnnotationType::NEUTRAL;
    std::string description;
    Region region = 1;

    bool operator==(const Annotation&) const = default;
};

/// Apply every row to the chart.  Output is in row order, marks within a
/// row in stem or branch order; a name lands on a region at most once.
std::vector<Annotation> annotate_regions(const Grid& grid, Pair year, Pair month, Pair day);

} // namespace qimen
