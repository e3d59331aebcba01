#pragma once

/// Earth layout: the fixed stem placement for one configuration number.

#include "common.h"
#include "layout/stem_layout.h"

namespace qimen {

/// Marker i (0..7) goes i steps along the Luoshu ring from region
/// `configuration` in direction `dir`; the ninth marker (乙) sits on the
/// center.  A configuration of 5 starts from region 2.
/// Throws std::invalid_argument if `configuration` is not in 1..9.
StemLayout earth_layout(int configuration, Direction dir);

} // namespace qimen
