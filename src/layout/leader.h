#pragma once

/// Decade leader of the reference pair and the chief region it implies.

#include "common.h"
#include "cycle/sexagenary.h"
#include "layout/stem_layout.h"

#include <array>

namespace qimen {

struct LeaderInfo {
    Pair leader;                         ///< 甲 pair opening the reference decade.
    Stem instrument = Stem::WU;          ///< Stem the leader hides behind.
    std::array<Branch, 2> void_branches{};
    Region chief_region = 1;             ///< Earth region of the instrument, center lent to 2.

    bool operator==(const LeaderInfo&) const = default;
};

LeaderInfo resolve_leader(Pair reference, const StemLayout& earth);

} // namespace qimen
