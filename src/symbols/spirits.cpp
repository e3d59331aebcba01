#include "symbols/spirits.h"

#include <stdexcept>
#include <string>

namespace qimen {

namespace {

constexpr std::array<Region, RING_SIZE> GATE_HOMES{1, 8, 3, 4, 9, 2, 7, 6};

constexpr std::array<Element, RING_SIZE> GATE_ELEMENTS{
    Element::WATER, Element::EARTH, Element::WOOD, Element::WOOD,
    Element::FIRE,  Element::EARTH, Element::METAL, Element::METAL,
};

constexpr std::array<const char*, RING_SIZE> GATE_GLYPHS{
    "休", "生", "伤", "杜", "景", "死", "惊", "开",
};
constexpr std::array<const char*, RING_SIZE> GATE_NAMES{
    "休门", "生门", "伤门", "杜门", "景门", "死门", "惊门", "开门",
};

constexpr std::array<const char*, NUM_REGIONS> STAR_GLYPHS{
    "蓬", "芮", "冲", "辅", "禽", "心", "柱", "任", "英",
};
constexpr std::array<const char*, NUM_REGIONS> STAR_NAMES{
    "天蓬", "天芮", "天冲", "天辅", "天禽", "天心", "天柱", "天任", "天英",
};

constexpr std::array<const char*, RING_SIZE> DEITY_GLYPHS{
    "符", "蛇", "阴", "合", "虎", "武", "地", "天",
};
constexpr std::array<const char*, RING_SIZE> DEITY_NAMES{
    "值符", "腾蛇", "太阴", "六合", "白虎", "玄武", "九地", "九天",
};

} // namespace

Region home_region(Gate g) noexcept {
    return GATE_HOMES[static_cast<std::size_t>(g)];
}

Region home_region(Star s) noexcept {
    return static_cast<Region>(s) + 1;
}

Gate gate_at_home(Region r) {
    for (std::size_t i = 0; i < GATE_HOMES.size(); ++i) {
        if (GATE_HOMES[i] == r) return static_cast<Gate>(i);
    }
    throw std::logic_error("no gate is at home in region " + std::to_string(r));
}

Star star_at_home(Region r) {
    if (!is_valid_region(r)) {
        throw std::logic_error("no star is at home in region " + std::to_string(r));
    }
    return static_cast<Star>(r - 1);
}

Element element_of(Gate g) noexcept { return GATE_ELEMENTS[static_cast<std::size_t>(g)]; }

const char* glyph(Gate g) noexcept  { return GATE_GLYPHS[static_cast<std::size_t>(g)]; }
const char* glyph(Star s) noexcept  { return STAR_GLYPHS[static_cast<std::size_t>(s)]; }
const char* glyph(Deity d) noexcept { return DEITY_GLYPHS[static_cast<std::size_t>(d)]; }
const char* name(Gate g) noexcept   { return GATE_NAMES[static_cast<std::size_t>(g)]; }
const char* name(Star s) noexcept   { return STAR_NAMES[static_cast<std::size_t>(s)]; }
const char* name(Deity d) noexcept  { return DEITY_NAMES[static_cast<std::size_t>(d)]; }

} // namespace qimen
