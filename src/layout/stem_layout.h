#pragma once

/// A placement of the nine marker stems on the nine regions.
///
/// Both directions are kept: region → stem and stem → region.  The
/// stem → region side reports the raw region, so a stem sitting on the
/// center answers 5; use anchor_region() when the result feeds an
/// 8-element ring.

#include "common.h"
#include "symbols/stem_branch.h"

#include <array>
#include <cstddef>

namespace qimen {

class StemLayout {
public:
    /// Put `s` on `r`.  Throws std::logic_error if the region is already
    /// taken, the stem is already placed, or `s` is 甲.
    void place(Region r, Stem s);

    /// Stem on `r`.  Throws std::logic_error if `r` is still empty.
    Stem at(Region r) const;

    /// Region holding `s`.  Throws std::logic_error if `s` is not placed.
    Region region_of(Stem s) const;

    /// region_of(s) with the center lent to region 2.
    Region anchor_region(Stem s) const { return borrow_center(region_of(s)); }

    bool contains(Stem s) const noexcept { return regions_[index_of(s)] != 0; }

    /// True once every region holds a stem.
    bool complete() const noexcept { return placed_ == NUM_REGIONS; }

    bool operator==(const StemLayout&) const = default;

private:
    bool occupied(Region r) const noexcept;

    RegionMap<Stem> stems_;
    std::array<Region, NUM_STEMS> regions_{};  ///< 0 = not placed.
    std::size_t placed_ = 0;
};

} // namespace qimen
