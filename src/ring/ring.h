#pragma once

/// Ring traversal orders over the nine regions.
///
///   LUOSHU              1 8 3 4 9 2 7 6      backward = walk the same
///                                             table with negative steps
///   PHYSICAL            1 8 3 4 9 2 7 6      clockwise
///                       1 6 7 2 9 4 3 8      counter-clockwise, its own
///                                             table walked with positive steps
///   LUOSHU_WITH_CENTER  1 8 3 4 5 9 2 7 6    the nine-slot ring
///
/// The two 8-element rings have no slot for the center: region 5 is
/// replaced by region 2 (borrow_center) before indexing.

#include "common.h"

#include <cstddef>

namespace qimen {

enum class RingKind : unsigned char { LUOSHU, PHYSICAL, LUOSHU_WITH_CENTER };

/// 8 for the two outer rings, 9 for LUOSHU_WITH_CENTER.
std::size_t ring_size(RingKind kind) noexcept;

/// Position of `r` in the ring table selected by `kind` and `dir`
/// (only PHYSICAL has a direction-specific table).
/// Throws std::out_of_range if `r` is not a region.
std::size_t index_of(RingKind kind, Region r, Direction dir = Direction::FORWARD);

/// Region at position `index`, normalized modulo the ring size.
Region region_at(RingKind kind, long index, Direction dir = Direction::FORWARD);

/// Region reached from `r` after `n` steps in direction `dir`.
Region step(RingKind kind, Region r, long n, Direction dir);

} // namespace qimen
