#pragma once

/// Chief displacement: where the chief star and gate travel to.

#include "common.h"
#include "ring/ring.h"
#include "symbols/stem_branch.h"

namespace qimen {

/// Step `chief` along `ring` by the zero-based index of `time_branch`
/// (子 = 0 … 亥 = 11) in direction `dir`.
Region displace_chief(Region chief, Branch time_branch, Direction dir, RingKind ring);

} // namespace qimen
