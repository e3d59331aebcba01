#pragma once

/// Heaven layout: the marker sequence re-anchored on the reference stem.
///
/// Both traditional styles are supported.  The flying style walks all
/// nine markers around the nine-slot Luoshu ring.  The rotating style
/// walks eight markers around the physical ring and keeps the fifth
/// marker (壬) on the center.

#include "common.h"
#include "cycle/sexagenary.h"
#include "layout/stem_layout.h"
#include "ring/ring.h"

namespace qimen {

enum class ChartStyle : unsigned char { FLYING, ROTATING };

inline constexpr const char* to_string(ChartStyle s) noexcept {
    return s == ChartStyle::FLYING ? "flying" : "rotating";
}

/// Ring used to move the chief star and gate and to lay out the stars
/// and gates: LUOSHU for flying charts, PHYSICAL for rotating charts.
inline constexpr RingKind symbol_ring(ChartStyle s) noexcept {
    return s == ChartStyle::FLYING ? RingKind::LUOSHU : RingKind::PHYSICAL;
}

/// Earth region of the reference pair's visible stem, center lent to 2.
Region heaven_anchor(const StemLayout& earth, Pair reference);

StemLayout flying_heaven(Region anchor, Direction dir);
StemLayout rotating_heaven(Region anchor, Direction dir);

StemLayout heaven_layout(ChartStyle style, const StemLayout& earth,
                         Pair reference, Direction dir);

} // namespace qimen
