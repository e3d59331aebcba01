#include "ring/regions.h"

#include <array>
#include <stdexcept>
#include <string>

namespace qimen {

namespace {

constexpr std::array<const char*, NUM_REGIONS> NAMES{
    "坎", "坤", "震", "巽", "中", "乾", "兑", "艮", "离",
};

constexpr std::array<Element, NUM_REGIONS> ELEMENTS{
    Element::WATER, Element::EARTH, Element::WOOD,  Element::WOOD, Element::EARTH,
    Element::METAL, Element::METAL, Element::EARTH, Element::FIRE,
};

constexpr std::array<Branch, 1> B_ZI{Branch::ZI};
constexpr std::array<Branch, 2> B_WEI_SHEN{Branch::WEI, Branch::SHEN};
constexpr std::array<Branch, 1> B_MAO{Branch::MAO};
constexpr std::array<Branch, 2> B_CHEN_SI{Branch::CHEN, Branch::SI};
constexpr std::array<Branch, 2> B_XU_HAI{Branch::XU, Branch::HAI};
constexpr std::array<Branch, 1> B_YOU{Branch::YOU};
constexpr std::array<Branch, 2> B_CHOU_YIN{Branch::CHOU, Branch::YIN};
constexpr std::array<Branch, 1> B_WU{Branch::WU};

//                                          子 丑 寅 卯 辰 巳 午 未 申 酉 戌 亥
constexpr std::array<Region, NUM_BRANCHES> BRANCH_REGIONS{1, 8, 8, 3, 4, 4, 9, 2, 2, 7, 6, 6};

constexpr std::array<Region, NUM_REGIONS> OPPOSITES{9, 8, 7, 6, 0, 4, 3, 2, 1};

void check_region(Region r) {
    if (!is_valid_region(r)) {
        throw std::out_of_range("region out of range: " + std::to_string(r));
    }
}

} // namespace

const char* region_name(Region r) {
    check_region(r);
    return NAMES[static_cast<std::size_t>(r - 1)];
}

Element region_element(Region r) {
    check_region(r);
    return ELEMENTS[static_cast<std::size_t>(r - 1)];
}

std::span<const Branch> region_branches(Region r) {
    check_region(r);
    switch (r) {
    case 1: return B_ZI;
    case 2: return B_WEI_SHEN;
    case 3: return B_MAO;
    case 4: return B_CHEN_SI;
    case 5: return B_WEI_SHEN;
    case 6: return B_XU_HAI;
    case 7: return B_YOU;
    case 8: return B_CHOU_YIN;
    default: return B_WU;
    }
}

Region branch_region(Branch b) noexcept {
    return BRANCH_REGIONS[index_of(b)];
}

Region opposite_region(Region r) {
    check_region(r);
    if (r == CENTER) {
        throw std::logic_error("the center region has no opposite");
    }
    return OPPOSITES[static_cast<std::size_t>(r - 1)];
}

Branch horse_branch(Branch day_branch) noexcept {
    // The four triads share a horse; index by branch mod 4.
    //   子辰申 → 寅,  丑巳酉 → 亥,  寅午戌 → 申,  卯未亥 → 巳
    static constexpr std::array<Branch, 4> HORSES{
        Branch::YIN, Branch::HAI, Branch::SHEN, Branch::SI,
    };
    return HORSES[index_of(day_branch) % 4];
}

} // namespace qimen
