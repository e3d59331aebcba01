#pragma once

/// The formation catalog.
///
/// Most formations are rows of data: a RegionRule matches one grid cell
/// by the symbols on it, a StemPairRule matches a heaven stem over an
/// earth stem.  Adding a formation of either kind means adding a row;
/// the recognizer never changes.  Description templates expand these
/// placeholders against the matching cell:
///
///   {heaven} {earth}   stem glyphs           {gate}   gate glyph (休)
///   {star}             star glyph (蓬)        {deity}  deity name (太阴)
///   {region}           region name (坎)       {hour_branch}  hour branch glyph

#include "common.h"
#include "symbols/spirits.h"
#include "symbols/stem_branch.h"

#include <array>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <string_view>
#include <utility>

namespace qimen {

enum class FormationType : unsigned char { AUSPICIOUS, INAUSPICIOUS, NEUTRAL };

/// 吉格 / 凶格 / 中性
const char* glyph(FormationType t) noexcept;

/// Small bit set over an enumeration (or region numbers).  An empty set
/// admits every value.
template <class E>
class SymbolSet {
public:
    constexpr SymbolSet() noexcept = default;
    constexpr SymbolSet(std::initializer_list<E> items) noexcept {
        for (E e : items) bits_ |= std::uint32_t{1} << static_cast<unsigned>(e);
    }

    constexpr bool empty() const noexcept { return bits_ == 0; }
    constexpr bool contains(E e) const noexcept {
        return (bits_ >> static_cast<unsigned>(e)) & 1u;
    }
    constexpr bool admits(E e) const noexcept { return empty() || contains(e); }

private:
    std::uint32_t bits_ = 0;
};

using StemSet   = SymbolSet<Stem>;
using GateSet   = SymbolSet<Gate>;
using StarSet   = SymbolSet<Star>;
using DeitySet  = SymbolSet<Deity>;
using RegionSet = SymbolSet<Region>;

/// Which cells a rule looks at.
enum class Anchor : unsigned char {
    ANY_REGION,          ///< Every region (or every outer one).
    HOUR_BRANCH_REGION,  ///< Only the hour branch's region; hour charts only.
};

/// Extra relation a cell must satisfy beyond symbol membership.
enum class Relation : unsigned char {
    NONE,
    GATE_OVERCOMES_REGION,  ///< The gate's element overcomes the region's.
};

struct RegionRule {
    std::string_view name;
    FormationType type = FormationType::NEUTRAL;
    std::string_view description;
    StemSet heaven{};
    StemSet earth{};
    GateSet gates{};
    StarSet stars{};
    DeitySet deities{};
    RegionSet regions{};
    Relation relation = Relation::NONE;
    Anchor anchor = Anchor::ANY_REGION;
    bool outer_only = false;  ///< Skip the center.
};

/// Heaven stem over earth stem, any region including the center.
struct StemPairRule {
    std::string_view name;
    FormationType type;
    Stem heaven;
    Stem earth;
    std::string_view description;  ///< Reading of the pair; the region is appended.
};

std::span<const RegionRule> region_rules() noexcept;
std::span<const StemPairRule> stem_pair_rules() noexcept;

/// Heaven/earth stem pairs that combine (乙庚 丙辛 丁壬 戊癸), one
/// direction each; the recognizer checks both orders.
std::span<const std::pair<Stem, Stem>> harmony_pairs() noexcept;

/// Hour stem that clashes with `day_stem` (甲→庚, 乙→辛, …, 癸→己).
Stem clashing_hour_stem(Stem day_stem) noexcept;

} // namespace qimen
