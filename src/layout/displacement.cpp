#include "layout/displacement.h"

namespace qimen {

Region displace_chief(Region chief, Branch time_branch, Direction dir, RingKind ring) {
    return step(ring, chief, static_cast<long>(index_of(time_branch)), dir);
}

} // namespace qimen
