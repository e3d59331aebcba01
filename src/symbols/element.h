#pragma once

/// The five elements and their control ("overcoming") cycle.

namespace qimen {

enum class Element : unsigned char { WOOD, FIRE, EARTH, METAL, WATER };

/// True if `a` overcomes `b`: wood→earth, earth→water, water→fire,
/// fire→metal, metal→wood.
inline constexpr bool overcomes(Element a, Element b) noexcept {
    switch (a) {
    case Element::WOOD:  return b == Element::EARTH;
    case Element::FIRE:  return b == Element::METAL;
    case Element::EARTH: return b == Element::WATER;
    case Element::METAL: return b == Element::WOOD;
    case Element::WATER: return b == Element::FIRE;
    }
    return false;
}

inline constexpr const char* glyph(Element e) noexcept {
    switch (e) {
    case Element::WOOD:  return "木";
    case Element::FIRE:  return "火";
    case Element::EARTH: return "土";
    case Element::METAL: return "金";
    case Element::WATER: return "水";
    }
    return "?";
}

} // namespace qimen
