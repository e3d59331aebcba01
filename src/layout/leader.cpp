#include "layout/leader.h"

namespace qimen {

LeaderInfo resolve_leader(Pair reference, const StemLayout& earth) {
    LeaderInfo info;
    info.leader = decade_leader(reference);
    info.instrument = instrument_for(info.leader);
    info.void_branches = void_branches(info.leader);
    info.chief_region = earth.anchor_region(info.instrument);
    return info;
}

} // namespace qimen
