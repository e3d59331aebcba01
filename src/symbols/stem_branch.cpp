#include "symbols/stem_branch.h"

#include <stdexcept>
#include <string>

namespace qimen {

namespace {

constexpr std::array<const char*, NUM_STEMS> STEM_GLYPHS{
    "甲", "乙", "丙", "丁", "戊", "己", "庚", "辛", "壬", "癸",
};

constexpr std::array<const char*, NUM_BRANCHES> BRANCH_GLYPHS{
    "子", "丑", "寅", "卯", "辰", "巳", "午", "未", "申", "酉", "戌", "亥",
};

/// Stems pair off by element: 甲乙 wood, 丙丁 fire, 戊己 earth, 庚辛 metal, 壬癸 water.
constexpr std::array<Element, 5> STEM_ELEMENTS{
    Element::WOOD, Element::FIRE, Element::EARTH, Element::METAL, Element::WATER,
};

} // namespace

std::size_t marker_index(Stem s) noexcept {
    for (std::size_t i = 0; i < MARKER_SEQUENCE.size(); ++i) {
        if (MARKER_SEQUENCE[i] == s) return i;
    }
    return MARKER_SEQUENCE.size();
}

Element element_of(Stem s) noexcept {
    return STEM_ELEMENTS[index_of(s) / 2];
}

const char* glyph(Stem s) noexcept { return STEM_GLYPHS[index_of(s)]; }
const char* glyph(Branch b) noexcept { return BRANCH_GLYPHS[index_of(b)]; }

Stem parse_stem(std::string_view text) {
    for (std::size_t i = 0; i < STEM_GLYPHS.size(); ++i) {
        if (text == STEM_GLYPHS[i]) return static_cast<Stem>(i);
    }
    throw std::invalid_argument("unknown stem: '" + std::string(text) + "'");
}

Branch parse_branch(std::string_view text) {
    for (std::size_t i = 0; i < BRANCH_GLYPHS.size(); ++i) {
        if (text == BRANCH_GLYPHS[i]) return static_cast<Branch>(i);
    }
    throw std::invalid_argument("unknown branch: '" + std::string(text) + "'");
}

} // namespace qimen
