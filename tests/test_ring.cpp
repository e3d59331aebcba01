/// Unit tests for the ring and region tables:
///   - Ring indexing, stepping and closure for all three rings
///   - Center borrowing on the 8-element rings
///   - Checked RegionMap access
///   - Region names, elements, branches, opposites and the horse table

#include "common.h"
#include "ring/regions.h"
#include "ring/ring.h"

#include <cassert>
#include <cstdio>
#include <stdexcept>
#include <string_view>

using namespace qimen;

template <class E, class F>
static bool throws(F&& f) {
    try {
        f();
    } catch (const E&) {
        return true;
    }
    return false;
}

// ════════════════════════════════════════════════════════════════════
//  Ring topology
// ════════════════════════════════════════════════════════════════════

static void test_index_round_trip() {
    std::printf("  region_at(index_of(r)) == r\n");

    for (Direction dir : {Direction::FORWARD, Direction::BACKWARD}) {
        for (RingKind kind : {RingKind::LUOSHU, RingKind::PHYSICAL}) {
            for (Region r : ALL_REGIONS) {
                if (r == CENTER) continue;
                const auto i = static_cast<long>(index_of(kind, r, dir));
                assert(region_at(kind, i, dir) == r);
            }
        }
        for (Region r : ALL_REGIONS) {
            const auto i = static_cast<long>(index_of(RingKind::LUOSHU_WITH_CENTER, r, dir));
            assert(region_at(RingKind::LUOSHU_WITH_CENTER, i, dir) == r);
        }
    }
}

static void test_ring_closure() {
    std::printf("  full turns return to the start\n");

    for (Direction dir : {Direction::FORWARD, Direction::BACKWARD}) {
        for (Region r : ALL_REGIONS) {
            // The center rides region 2's slot on the 8-rings.
            assert(step(RingKind::LUOSHU, r, 8, dir) == borrow_center(r));
            assert(step(RingKind::PHYSICAL, r, 8, dir) == borrow_center(r));
            assert(step(RingKind::LUOSHU_WITH_CENTER, r, 9, dir) == r);
        }
    }
}

static void test_luoshu_order() {
    std::printf("  Luoshu ring order and reverse\n");

    const Region expected[] = {1, 8, 3, 4, 9, 2, 7, 6};
    for (long i = 0; i < 8; ++i) {
        assert(step(RingKind::LUOSHU, 1, i, Direction::FORWARD) == expected[i]);
    }
    // Backward walks the same table the other way.
    assert(step(RingKind::LUOSHU, 1, 1, Direction::BACKWARD) == 6);
    assert(step(RingKind::LUOSHU, 4, 2, Direction::BACKWARD) == 8);
    assert(region_at(RingKind::LUOSHU, -1) == 6);
    assert(region_at(RingKind::LUOSHU, 17) == 8);
}

static void test_physical_reverse_table() {
    std::printf("  physical ring: counter-clockwise is its own table\n");

    const Region ccw[] = {1, 6, 7, 2, 9, 4, 3, 8};
    for (long i = 0; i < 8; ++i) {
        assert(step(RingKind::PHYSICAL, 1, i, Direction::BACKWARD) == ccw[i]);
    }
    assert(step(RingKind::PHYSICAL, 7, 3, Direction::FORWARD) == 8);
    assert(index_of(RingKind::PHYSICAL, 6, Direction::BACKWARD) == 1);
    assert(index_of(RingKind::PHYSICAL, 6, Direction::FORWARD) == 7);
}

static void test_center_borrowing() {
    std::printf("  center borrows region 2 on the 8-rings\n");

    assert(borrow_center(CENTER) == 2);
    assert(borrow_center(7) == 7);
    assert(index_of(RingKind::LUOSHU, CENTER) == index_of(RingKind::LUOSHU, 2));
    assert(step(RingKind::LUOSHU, CENTER, 1, Direction::FORWARD) == 7);
    assert(index_of(RingKind::LUOSHU_WITH_CENTER, CENTER) == 4);
    assert(step(RingKind::LUOSHU_WITH_CENTER, 4, 1, Direction::FORWARD) == CENTER);
}

static void test_invalid_region() {
    std::printf("  invalid regions are rejected\n");

    assert(throws<std::out_of_range>([] { (void)index_of(RingKind::LUOSHU, 0); }));
    assert(throws<std::out_of_range>([] { (void)step(RingKind::PHYSICAL, 10, 1, Direction::FORWARD); }));
    assert(ring_size(RingKind::LUOSHU) == 8);
    assert(ring_size(RingKind::LUOSHU_WITH_CENTER) == 9);
}

static void test_region_map_checked_access() {
    std::printf("  RegionMap::at checks the region\n");

    RegionMap<int> map;
    map.at(5) = 42;
    assert(map[5] == 42);
    assert(map.at(9) == 0);

    const RegionMap<int>& view = map;
    assert(view.at(5) == 42);
    assert(throws<std::out_of_range>([&] { (void)view.at(0); }));
    assert(throws<std::out_of_range>([&] { (void)map.at(10); }));
    assert(throws<std::out_of_range>([&] { map.at(-1) = 1; }));
}

// ════════════════════════════════════════════════════════════════════
//  Region tables
// ════════════════════════════════════════════════════════════════════

static void test_region_attributes() {
    std::printf("  names and elements\n");

    assert(std::string_view(region_name(1)) == "坎");
    assert(std::string_view(region_name(5)) == "中");
    assert(std::string_view(region_name(9)) == "离");
    assert(region_element(1) == Element::WATER);
    assert(region_element(3) == Element::WOOD);
    assert(region_element(6) == Element::METAL);
    assert(region_element(9) == Element::FIRE);
    assert(region_element(8) == Element::EARTH);
}

static void test_region_branches() {
    std::printf("  branches per region and back\n");

    assert(region_branches(1).size() == 1);
    assert(region_branches(8).size() == 2);
    assert(region_branches(8)[0] == Branch::CHOU);
    assert(region_branches(8)[1] == Branch::YIN);
    assert(region_branches(5)[0] == Branch::WEI);

    // Every branch's region lists that branch.
    for (std::size_t i = 0; i < NUM_BRANCHES; ++i) {
        const auto b = static_cast<Branch>(i);
        bool found = false;
        for (Branch other : region_branches(branch_region(b))) found |= other == b;
        assert(found);
    }
    assert(branch_region(Branch::WEI) == 2);
    assert(branch_region(Branch::HAI) == 6);
}

static void test_opposites() {
    std::printf("  opposite regions\n");

    for (Region r : ALL_REGIONS) {
        if (r == CENTER) continue;
        assert(opposite_region(opposite_region(r)) == r);
        assert(opposite_region(r) + r == 10);
    }
    assert(throws<std::logic_error>([] { (void)opposite_region(CENTER); }));
}

static void test_horse() {
    std::printf("  travelling horse by day branch\n");

    assert(horse_branch(Branch::SHEN) == Branch::YIN);
    assert(horse_branch(Branch::ZI) == Branch::YIN);
    assert(horse_branch(Branch::CHEN) == Branch::YIN);
    assert(horse_branch(Branch::WU) == Branch::SHEN);
    assert(horse_branch(Branch::MAO) == Branch::SI);
    assert(horse_branch(Branch::YOU) == Branch::HAI);
    assert(horse_branch(Branch::CHOU) == Branch::HAI);
}

int main() {
    std::printf("Ring topology:\n");
    test_index_round_trip();
    test_ring_closure();
    test_luoshu_order();
    test_physical_reverse_table();
    test_center_borrowing();
    test_invalid_region();
    test_region_map_checked_access();

    std::printf("\nRegion tables:\n");
    test_region_attributes();
    test_region_branches();
    test_opposites();
    test_horse();

    std::printf("\nAll ring tests passed.\n");
    return 0;
}
