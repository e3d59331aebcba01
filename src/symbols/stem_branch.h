#pragma once

/// Heavenly stems and earthly branches.
///
/// Glyphs are single CJK characters in UTF-8.  Parsing accepts exactly
/// one glyph and throws std::invalid_argument on anything else.

#include "symbols/element.h"

#include <array>
#include <cstddef>
#include <string_view>

namespace qimen {

enum class Stem : unsigned char { JIA, YI, BING, DING, WU, JI, GENG, XIN, REN, GUI };

enum class Branch : unsigned char {
    ZI, CHOU, YIN, MAO, CHEN, SI, WU, WEI, SHEN, YOU, XU, HAI
};

inline constexpr std::size_t NUM_STEMS    = 10;
inline constexpr std::size_t NUM_BRANCHES = 12;

/// The nine stems in layout order: six instruments then the three
/// wonders reversed (戊 己 庚 辛 壬 癸 丁 丙 乙).  甲 never appears.
inline constexpr std::array<Stem, 9> MARKER_SEQUENCE{
    Stem::WU, Stem::JI, Stem::GENG, Stem::XIN, Stem::REN, Stem::GUI,
    Stem::DING, Stem::BING, Stem::YI,
};

inline constexpr std::size_t index_of(Stem s) noexcept { return static_cast<std::size_t>(s); }
inline constexpr std::size_t index_of(Branch b) noexcept { return static_cast<std::size_t>(b); }

/// Position of `s` in MARKER_SEQUENCE, or 9 for 甲.
std::size_t marker_index(Stem s) noexcept;

/// 乙 丙 丁.
inline constexpr bool is_wonder(Stem s) noexcept {
    return s == Stem::YI || s == Stem::BING || s == Stem::DING;
}

/// 戊 己 庚 辛 壬 癸.
inline constexpr bool is_instrument(Stem s) noexcept {
    return index_of(s) >= index_of(Stem::WU);
}

Element element_of(Stem s) noexcept;

const char* glyph(Stem s) noexcept;
const char* glyph(Branch b) noexcept;

Stem   parse_stem(std::string_view text);
Branch parse_branch(std::string_view text);

} // namespace qimen
