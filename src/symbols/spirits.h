#pragma once

/// The three rotating symbol sets: eight gates, nine stars, eight deities.
///
/// Enumerators follow each set's distribution order around the ring
/// (stars list 禽 at its home-region position, see RING_STARS).

#include "common.h"
#include "symbols/element.h"

#include <array>
#include <cstddef>

namespace qimen {

/// 休 生 伤 杜 景 死 惊 开
enum class Gate : unsigned char { REST, LIFE, HARM, DELUSION, SCENERY, DEATH, FEAR, OPEN };

/// 蓬 芮 冲 辅 禽 心 柱 任 英 (home regions 1..9)
enum class Star : unsigned char { PENG, RUI, CHONG, FU, QIN, XIN, ZHU, REN, YING };

/// 值符 腾蛇 太阴 六合 白虎 玄武 九地 九天
enum class Deity : unsigned char {
    CHIEF, SERPENT, MOON, HARMONY, TIGER, TORTOISE, EARTH, HEAVEN
};

inline constexpr std::array<Gate, RING_SIZE> RING_GATES{
    Gate::REST, Gate::LIFE, Gate::HARM, Gate::DELUSION,
    Gate::SCENERY, Gate::DEATH, Gate::FEAR, Gate::OPEN,
};

/// Stars in ring order; 禽 has no ring slot.
inline constexpr std::array<Star, RING_SIZE> RING_STARS{
    Star::PENG, Star::RUI, Star::CHONG, Star::FU,
    Star::XIN, Star::ZHU, Star::REN, Star::YING,
};

inline constexpr std::array<Deity, RING_SIZE> RING_DEITIES{
    Deity::CHIEF, Deity::SERPENT, Deity::MOON, Deity::HARMONY,
    Deity::TIGER, Deity::TORTOISE, Deity::EARTH, Deity::HEAVEN,
};

Region home_region(Gate g) noexcept;
Region home_region(Star s) noexcept;

/// Gate whose home is `r`.  The center has no gate; asking for it throws
/// std::logic_error.
Gate gate_at_home(Region r);

/// Star whose home is `r` (禽 for the center).
Star star_at_home(Region r);

Element element_of(Gate g) noexcept;

const char* glyph(Gate g) noexcept;   ///< 休
const char* glyph(Star s) noexcept;   ///< 蓬
const char* glyph(Deity d) noexcept;  ///< 符
const char* name(Gate g) noexcept;    ///< 休门
const char* name(Star s) noexcept;    ///< 天蓬
const char* name(Deity d) noexcept;   ///< 值符

} // namespace qimen
