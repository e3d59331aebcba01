#pragma once

/// Fixed per-region attributes: trigram name, element, associated
/// branches, the branch→region table, opposites and the horse table.

#include "common.h"
#include "symbols/element.h"
#include "symbols/stem_branch.h"

#include <span>

namespace qimen {

/// Trigram name (坎 坤 震 巽 中 乾 兑 艮 离).
const char* region_name(Region r);

Element region_element(Region r);

/// One or two branches per region; the center shares region 2's pair.
std::span<const Branch> region_branches(Region r);

/// Region that hosts `b`.
Region branch_region(Branch b) noexcept;

/// Opposite region across the center (1↔9, 3↔7, 4↔6, 2↔8).
/// Throws std::logic_error for the center, which has no opposite.
Region opposite_region(Region r);

/// Travelling-horse branch for a day branch (申子辰→寅, 寅午戌→申,
/// 亥卯未→巳, 巳酉丑→亥).
Branch horse_branch(Branch day_branch) noexcept;

} // namespace qimen
