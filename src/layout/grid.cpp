#include "layout/grid.h"
#include "ring/regions.h"

#include <algorithm>

namespace qimen {

Grid assemble_grid(const StemLayout& earth,
                   const StemLayout& heaven,
                   const GateLayout& gates,
                   const StarLayout& stars,
                   const DeityLayout& deities,
                   const std::array<Branch, 2>& void_pair,
                   Branch day_branch) {
    const Region horse = branch_region(horse_branch(day_branch));

    Grid grid;
    for (Region r : ALL_REGIONS) {
        RegionCell& cell = grid[r];
        cell.region = r;
        cell.earth = earth.at(r);
        cell.heaven = heaven.at(r);
        cell.gate = gates.gates[r];
        cell.star = stars.stars[r];
        cell.deity = deities[r];
        cell.element = region_element(r);

        const auto branches = region_branches(r);
        cell.is_void = std::any_of(branches.begin(), branches.end(), [&](Branch b) {
            return b == void_pair[0] || b == void_pair[1];
        });
        cell.is_horse = r == horse;
    }
    return grid;
}

} // namespace qimen
