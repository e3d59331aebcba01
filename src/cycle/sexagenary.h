#pragma once

/// The sixty-pair stem/branch cycle and its six decades.
///
/// Position i of the cycle pairs stem i mod 10 with branch i mod 12, so
/// only pairs whose stem and branch share parity exist.  Each run of
/// ten consecutive pairs starts with a 甲 pair (its decade leader),
/// which hides behind one instrument stem and leaves two branches void.

#include "symbols/stem_branch.h"

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace qimen {

inline constexpr std::size_t CYCLE_LENGTH = 60;
inline constexpr std::size_t DECADE_LENGTH = 10;

struct Pair {
    Stem stem = Stem::JIA;
    Branch branch = Branch::ZI;

    bool operator==(const Pair&) const = default;
};

inline constexpr bool is_valid_pair(Pair p) noexcept {
    return index_of(p.stem) % 2 == index_of(p.branch) % 2;
}

/// Position of `p` in the cycle (甲子 = 0).  Throws std::invalid_argument
/// for a pair that does not occur.
std::size_t cycle_index(Pair p);

/// Pair at `index` modulo 60.
Pair pair_at(std::size_t index) noexcept;

/// First pair of the decade containing `p`.
Pair decade_leader(Pair p);

/// Six-entry lookups keyed by a decade leader.  Passing a pair that is
/// not one of the six leaders throws std::logic_error.
Stem instrument_for(Pair leader);
std::array<Branch, 2> void_branches(Pair leader);

/// The stem `p` shows on the layouts: 甲 hides behind its decade's
/// instrument, every other stem stands for itself.
Stem disguised_stem(Pair p);

/// Parse two glyphs (e.g. "甲子").  Throws std::invalid_argument on
/// unknown glyphs or an impossible pair.
Pair parse_pair(std::string_view text);

std::string to_string(Pair p);

} // namespace qimen
