#pragma once

/// Grid assembly: one cell per region merging every layout.

#include "common.h"
#include "layout/stem_layout.h"
#include "layout/symbol_layout.h"
#include "symbols/element.h"
#include "symbols/spirits.h"
#include "symbols/stem_branch.h"

#include <array>

namespace qimen {

struct RegionCell {
    Region region = 1;
    Stem earth = Stem::WU;
    Stem heaven = Stem::WU;
    Gate gate = Gate::REST;
    Star star = Star::PENG;
    Deity deity = Deity::CHIEF;
    Element element = Element::WATER;
    bool is_void = false;   ///< One of the region's branches is void.
    bool is_horse = false;  ///< Region of the day branch's horse.

    bool operator==(const RegionCell&) const = default;
};

using Grid = RegionMap<RegionCell>;

Grid assemble_grid(const StemLayout& earth,
                   const StemLayout& heaven,
                   const GateLayout& gates,
                   const StarLayout& stars,
                   const DeityLayout& deities,
                   const std::array<Branch, 2>& void_pair,
                   Branch day_branch);

} // namespace qimen
