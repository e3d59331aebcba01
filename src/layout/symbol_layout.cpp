#include "layout/symbol_layout.h"
#include "layout/displacement.h"

#include <array>
#include <cstddef>
#include <stdexcept>

namespace qimen {

namespace {

/// Lay `order` out from `arrived`, starting with `chief`.
template <class T>
RegionMap<T> distribute(const std::array<T, RING_SIZE>& order, T chief,
                        Region arrived, Direction dir, RingKind ring) {
    std::size_t start = RING_SIZE;
    for (std::size_t i = 0; i < RING_SIZE; ++i) {
        if (order[i] == chief) start = i;
    }
    if (start == RING_SIZE) {
        throw std::logic_error("chief symbol has no ring slot");
    }

    RegionMap<T> out;
    for (std::size_t i = 0; i < RING_SIZE; ++i) {
        out[step(ring, arrived, static_cast<long>(i), dir)] = order[(start + i) % RING_SIZE];
    }
    return out;
}

} // namespace

StarLayout layout_stars(Region chief_region, Branch time_branch,
                        Direction dir, RingKind ring) {
    StarLayout layout;
    layout.chief = ring_star(star_at_home(chief_region));
    layout.home = home_region(layout.chief);
    layout.arrived = displace_chief(layout.home, time_branch, dir, ring);
    layout.stars = distribute(RING_STARS, layout.chief, layout.arrived, dir, ring);
    layout.stars[CENTER] = pinned_star();
    return layout;
}

GateLayout layout_gates(Region chief_region, Branch time_branch,
                        Direction dir, RingKind ring) {
    GateLayout layout;
    layout.chief = gate_at_home(borrow_center(chief_region));
    layout.home = home_region(layout.chief);
    layout.arrived = displace_chief(layout.home, time_branch, dir, ring);
    layout.gates = distribute(RING_GATES, layout.chief, layout.arrived, dir, ring);
    layout.gates[CENTER] = layout.gates[BORROWED_REGION];
    return layout;
}

DeityLayout layout_deities(Region star_arrived, Direction dir) {
    DeityLayout layout = distribute(RING_DEITIES, Deity::CHIEF, star_arrived,
                                    dir, RingKind::LUOSHU);
    layout[CENTER] = layout[BORROWED_REGION];
    return layout;
}

} // namespace qimen
