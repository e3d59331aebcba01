#pragma once

/// Star, gate and deity layouts.
///
/// The chief star and chief gate are the ones whose home is the chief
/// region.  Both travel to the displaced ("arrived") region and the rest
/// of their set follows in ring order behind them.  The deities follow
/// the arrived star, always on the Luoshu ring.  The center inherits the
/// gate and deity of region 2; the star 禽 never leaves the center.

#include "common.h"
#include "ring/ring.h"
#include "symbols/spirits.h"
#include "symbols/stem_branch.h"

namespace qimen {

struct StarLayout {
    RegionMap<Star> stars;
    Star chief = Star::PENG;  ///< Star whose home is the chief region.
    Region home = 1;
    Region arrived = 1;

    bool operator==(const StarLayout&) const = default;
};

struct GateLayout {
    RegionMap<Gate> gates;
    Gate chief = Gate::REST;  ///< Gate whose home is the chief region.
    Region home = 1;
    Region arrived = 1;

    bool operator==(const GateLayout&) const = default;
};

using DeityLayout = RegionMap<Deity>;

/// The star that has no ring slot and always sits on the center.
inline constexpr Star pinned_star() noexcept { return Star::QIN; }

/// Ring stand-in for `s`: 禽 is treated as 芮 (they share the earth
/// element and the center borrows region 2); every other star is itself.
inline constexpr Star ring_star(Star s) noexcept {
    return s == pinned_star() ? Star::RUI : s;
}

StarLayout layout_stars(Region chief_region, Branch time_branch,
                        Direction dir, RingKind ring);

GateLayout layout_gates(Region chief_region, Branch time_branch,
                        Direction dir, RingKind ring);

/// 值符 lands on `star_arrived`; the others follow on the Luoshu ring.
DeityLayout layout_deities(Region star_arrived, Direction dir);

} // namespace qimen
