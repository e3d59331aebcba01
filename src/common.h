#pragma once

/// Common region constants and the shared center normalization.
///
/// The chart is a 3×3 grid of regions numbered 1–9 in Luoshu order.
/// Region 5 is the center: it never takes a slot on an 8-element ring,
/// so every ring crossing first lends it the slot of region 2.

#include <array>
#include <cassert>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace qimen {

/// A region number in 1..9.
using Region = int;

inline constexpr Region CENTER          = 5;
inline constexpr Region BORROWED_REGION = 2;  ///< Slot the center uses on 8-rings.
inline constexpr std::size_t NUM_REGIONS = 9;
inline constexpr std::size_t RING_SIZE   = 8;

inline constexpr std::array<Region, NUM_REGIONS> ALL_REGIONS{1, 2, 3, 4, 5, 6, 7, 8, 9};

inline constexpr bool is_valid_region(Region r) noexcept {
    return r >= 1 && r <= 9;
}

/// Map the center onto region 2; every other region is unchanged.
/// This is the single place the center aliasing rule lives.
inline constexpr Region borrow_center(Region r) noexcept {
    return r == CENTER ? BORROWED_REGION : r;
}

/// Half-year regime: FORWARD is yang dun, BACKWARD is yin dun.
enum class Direction : unsigned char { FORWARD, BACKWARD };

inline constexpr const char* to_string(Direction d) noexcept {
    return d == Direction::FORWARD ? "yang" : "yin";
}

/// Fixed-size map from region (1..9) to a value.
///
/// operator[] is for indices the engine produced itself; at() checks the
/// region and throws std::out_of_range.
template <class T>
class RegionMap {
public:
    RegionMap() = default;

    T& at(Region r) {
        check(r);
        return values_[static_cast<std::size_t>(r - 1)];
    }
    const T& at(Region r) const {
        check(r);
        return values_[static_cast<std::size_t>(r - 1)];
    }

    T& operator[](Region r) {
        assert(is_valid_region(r));
        return values_[static_cast<std::size_t>(r - 1)];
    }
    const T& operator[](Region r) const {
        assert(is_valid_region(r));
        return values_[static_cast<std::size_t>(r - 1)];
    }

    bool operator==(const RegionMap&) const = default;

private:
    static void check(Region r) {
        if (!is_valid_region(r)) {
            throw std::out_of_range("region out of range: " + std::to_string(r));
        }
    }

    std::array<T, NUM_REGIONS> values_{};
};

} // namespace qimen
