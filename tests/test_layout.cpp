/// Unit tests for the layout stages:
///   - StemLayout bookkeeping
///   - Earth layout bijection for every configuration and direction
///   - Flying and rotating heaven layouts, the leading-stem anchor
///   - Leader resolution and chief displacement
///   - Star, gate and deity layouts, the pinned star
///   - Grid assembly with void and horse flags

#include "common.h"
#include "cycle/sexagenary.h"
#include "layout/displacement.h"
#include "layout/earth.h"
#include "layout/grid.h"
#include "layout/heaven.h"
#include "layout/leader.h"
#include "layout/stem_layout.h"
#include "layout/symbol_layout.h"
#include "symbols/spirits.h"

#include <cassert>
#include <cstdio>
#include <set>
#include <stdexcept>
#include <string>
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

static Pair P(const char* text) { return parse_pair(text); }

/// Stems on regions 1..9 written as one string of glyphs.
static void expect_stems(const StemLayout& layout, std::string_view expected) {
    std::string actual;
    for (Region r : ALL_REGIONS) actual += glyph(layout.at(r));
    assert(actual == expected);
}

// ════════════════════════════════════════════════════════════════════
//  Stem layouts
// ════════════════════════════════════════════════════════════════════

static void test_stem_layout_collisions() {
    std::printf("  StemLayout rejects collisions\n");

    StemLayout layout;
    layout.place(3, Stem::WU);
    assert(layout.contains(Stem::WU));
    assert(layout.region_of(Stem::WU) == 3);
    assert(!layout.complete());
    assert(throws<std::logic_error>([&] { layout.place(3, Stem::JI); }));
    assert(throws<std::logic_error>([&] { layout.place(4, Stem::WU); }));
    assert(throws<std::logic_error>([&] { layout.place(4, Stem::JIA); }));
    assert(throws<std::logic_error>([&] { (void)layout.at(4); }));
    assert(throws<std::logic_error>([&] { (void)layout.region_of(Stem::GUI); }));
}

static void test_earth_bijection() {
    std::printf("  earth layout is a bijection for all 18 cases\n");

    for (Direction dir : {Direction::FORWARD, Direction::BACKWARD}) {
        for (int ju = 1; ju <= 9; ++ju) {
            const StemLayout earth = earth_layout(ju, dir);
            assert(earth.complete());
            std::set<Stem> seen;
            for (Region r : ALL_REGIONS) seen.insert(earth.at(r));
            assert(seen.size() == NUM_REGIONS);
            assert(earth.at(CENTER) == Stem::YI);
            assert(earth.region_of(Stem::WU) == borrow_center(ju));
        }
    }
    assert(throws<std::invalid_argument>([] { (void)earth_layout(0, Direction::FORWARD); }));
    assert(throws<std::invalid_argument>([] { (void)earth_layout(10, Direction::BACKWARD); }));
}

static void test_earth_examples() {
    std::printf("  earth layout examples\n");

    //                                     1  2  3  4  5  6  7  8  9
    expect_stems(earth_layout(4, Direction::FORWARD),  "癸庚丙戊乙壬辛丁己");
    expect_stems(earth_layout(9, Direction::BACKWARD), "壬丙庚己乙癸丁辛戊");
    // Configuration 5 starts on region 2.
    assert(earth_layout(5, Direction::FORWARD).region_of(Stem::WU) == 2);
}

static void test_heaven_anchor_leading_stem() {
    std::printf("  heaven anchor substitutes the leading stem\n");

    const StemLayout earth = earth_layout(9, Direction::BACKWARD);
    // 甲子 shows as 戊, on region 9.
    assert(heaven_anchor(earth, P("甲子")) == 9);
    // 甲戌 shows as 己, on region 4.
    assert(heaven_anchor(earth, P("甲戌")) == 4);
    // 乙 sits on the center; the anchor borrows region 2.
    assert(heaven_anchor(earth, P("乙丑")) == 2);
}

static void test_flying_heaven() {
    std::printf("  flying heaven\n");

    const StemLayout earth = earth_layout(9, Direction::BACKWARD);
    const StemLayout heaven = heaven_layout(ChartStyle::FLYING, earth, P("甲子"),
                                            Direction::BACKWARD);
    expect_stems(heaven, "癸乙辛庚己丁丙壬戊");
    assert(heaven.complete());

    // Yang period 3: 戊 on region 3, then 4 5 9 2 7 6 1 8.
    expect_stems(flying_heaven(3, Direction::FORWARD), "丙壬戊己庚丁癸乙辛");
    // Yin period 7: 戊 on region 7, then 2 9 5 4 3 8 1 6.
    expect_stems(flying_heaven(7, Direction::BACKWARD), "丙己癸壬辛乙戊丁庚");

    // Marker i sits i slots from the anchor on the nine-slot ring.
    constexpr std::array<Region, 9> nine{1, 8, 3, 4, 5, 9, 2, 7, 6};
    for (Direction dir : {Direction::FORWARD, Direction::BACKWARD}) {
        for (Region anchor : {1, 2, 3, 4, 6, 7, 8, 9}) {
            std::size_t start = 0;
            while (nine[start] != anchor) ++start;

            const StemLayout f = flying_heaven(anchor, dir);
            assert(f.complete());
            for (std::size_t i = 0; i < MARKER_SEQUENCE.size(); ++i) {
                const std::size_t slot = dir == Direction::FORWARD
                                             ? (start + i) % 9
                                             : (start + 9 - i) % 9;
                assert(f.region_of(MARKER_SEQUENCE[i]) == nine[slot]);
            }
        }
    }
}

static void test_rotating_heaven() {
    std::printf("  rotating heaven keeps 壬 on the center\n");

    const StemLayout earth = earth_layout(4, Direction::FORWARD);
    const StemLayout heaven = heaven_layout(ChartStyle::ROTATING, earth, P("癸卯"),
                                            Direction::FORWARD);
    expect_stems(heaven, "戊丁庚辛壬乙丙己癸");

    for (Direction dir : {Direction::FORWARD, Direction::BACKWARD}) {
        for (Region anchor : {1, 2, 3, 4, 6, 7, 8, 9}) {
            const StemLayout h = rotating_heaven(anchor, dir);
            assert(h.complete());
            assert(h.at(CENTER) == Stem::REN);
            assert(h.region_of(Stem::WU) == anchor);
        }
    }

    // Yin charts walk the counter-clockwise table.
    expect_stems(rotating_heaven(9, Direction::BACKWARD), "癸乙庚己壬丁丙辛戊");
}

// ════════════════════════════════════════════════════════════════════
//  Leader and displacement
// ════════════════════════════════════════════════════════════════════

static void test_resolve_leader() {
    std::printf("  leader, instrument, void and chief region\n");

    const StemLayout earth = earth_layout(4, Direction::FORWARD);
    const LeaderInfo info = resolve_leader(P("癸卯"), earth);
    assert(info.leader == P("甲午"));
    assert(info.instrument == Stem::XIN);
    assert(info.void_branches[0] == Branch::CHEN);
    assert(info.void_branches[1] == Branch::SI);
    assert(info.chief_region == 7);

    // Configuration 5 starts the ring on region 2.
    const StemLayout e5 = earth_layout(5, Direction::FORWARD);
    assert(resolve_leader(P("甲子"), e5).chief_region == 2);
}

static void test_displace_chief() {
    std::printf("  chief displacement\n");

    assert(displace_chief(7, Branch::MAO, Direction::FORWARD, RingKind::PHYSICAL) == 8);
    assert(displace_chief(7, Branch::ZI, Direction::FORWARD, RingKind::PHYSICAL) == 7);
    assert(displace_chief(9, Branch::ZI, Direction::BACKWARD, RingKind::LUOSHU) == 9);
    assert(displace_chief(1, Branch::CHOU, Direction::BACKWARD, RingKind::LUOSHU) == 6);
    assert(displace_chief(1, Branch::CHOU, Direction::BACKWARD, RingKind::PHYSICAL) == 6);
    assert(displace_chief(1, Branch::YIN, Direction::BACKWARD, RingKind::PHYSICAL) == 7);
}

// ════════════════════════════════════════════════════════════════════
//  Stars, gates, deities
// ════════════════════════════════════════════════════════════════════

static void test_pinned_star() {
    std::printf("  禽 is pinned to the center and stands in as 芮\n");

    assert(pinned_star() == Star::QIN);
    assert(ring_star(Star::QIN) == Star::RUI);
    assert(ring_star(Star::YING) == Star::YING);
    assert(home_region(Star::QIN) == CENTER);
    assert(star_at_home(CENTER) == Star::QIN);

    for (Region chief : {1, 2, 3, 4, 6, 7, 8, 9}) {
        const StarLayout s = layout_stars(chief, Branch::WU, Direction::FORWARD,
                                          RingKind::LUOSHU);
        assert(s.stars[CENTER] == Star::QIN);
        std::set<Star> seen;
        for (Region r : ALL_REGIONS) seen.insert(s.stars[r]);
        assert(seen.size() == NUM_REGIONS);
    }
    // A center chief region resolves to 芮.
    const StarLayout c = layout_stars(CENTER, Branch::ZI, Direction::FORWARD, RingKind::LUOSHU);
    assert(c.chief == Star::RUI);
    assert(c.home == 2);
}

static void test_star_gate_deity_layouts() {
    std::printf("  star, gate and deity layouts for chief 7 at 卯\n");

    const StarLayout stars = layout_stars(7, Branch::MAO, Direction::FORWARD, RingKind::PHYSICAL);
    assert(stars.chief == Star::ZHU);
    assert(stars.home == 7);
    assert(stars.arrived == 8);
    const Star expected_stars[] = {Star::XIN, Star::RUI, Star::REN, Star::YING, Star::QIN,
                                   Star::FU, Star::CHONG, Star::ZHU, Star::PENG};
    for (Region r : ALL_REGIONS) assert(stars.stars[r] == expected_stars[r - 1]);

    const GateLayout gates = layout_gates(7, Branch::MAO, Direction::FORWARD, RingKind::PHYSICAL);
    assert(gates.chief == Gate::FEAR);
    assert(gates.home == 7);
    assert(gates.arrived == 8);
    const Gate expected_gates[] = {Gate::DEATH, Gate::HARM, Gate::OPEN, Gate::REST, Gate::HARM,
                                   Gate::SCENERY, Gate::DELUSION, Gate::FEAR, Gate::LIFE};
    for (Region r : ALL_REGIONS) assert(gates.gates[r] == expected_gates[r - 1]);

    const DeityLayout deities = layout_deities(stars.arrived, Direction::FORWARD);
    const Deity expected_deities[] = {Deity::HEAVEN, Deity::TIGER, Deity::SERPENT,
                                      Deity::MOON, Deity::TIGER, Deity::EARTH,
                                      Deity::TORTOISE, Deity::CHIEF, Deity::HARMONY};
    for (Region r : ALL_REGIONS) assert(deities[r] == expected_deities[r - 1]);
}

static void test_center_copies_region_two() {
    std::printf("  center copies region 2's gate and deity\n");

    for (Direction dir : {Direction::FORWARD, Direction::BACKWARD}) {
        for (Region chief : {1, 3, 6, 8}) {
            const GateLayout g = layout_gates(chief, Branch::SHEN, dir, RingKind::PHYSICAL);
            assert(g.gates[CENTER] == g.gates[2]);
            const DeityLayout d = layout_deities(chief, dir);
            assert(d[CENTER] == d[2]);
            assert(d[chief] == Deity::CHIEF);
        }
    }
}

static void test_spirit_tables() {
    std::printf("  gate and star tables\n");

    assert(home_region(Gate::LIFE) == 8);
    assert(home_region(Gate::OPEN) == 6);
    assert(gate_at_home(9) == Gate::SCENERY);
    assert(throws<std::logic_error>([] { (void)gate_at_home(CENTER); }));
    assert(element_of(Gate::SCENERY) == Element::FIRE);
    assert(element_of(Gate::FEAR) == Element::METAL);
    assert(std::string_view(name(Gate::DEATH)) == "死门");
    assert(std::string_view(name(Star::REN)) == "天任");
    assert(std::string_view(name(Deity::MOON)) == "太阴");
    assert(std::string_view(glyph(Deity::TORTOISE)) == "武");
}

// ════════════════════════════════════════════════════════════════════
//  Grid
// ════════════════════════════════════════════════════════════════════

static void test_assemble_grid() {
    std::printf("  grid merges layouts and flags\n");

    const StemLayout earth = earth_layout(4, Direction::FORWARD);
    const StemLayout heaven = heaven_layout(ChartStyle::ROTATING, earth, P("癸卯"),
                                            Direction::FORWARD);
    const LeaderInfo leader = resolve_leader(P("癸卯"), earth);
    const StarLayout stars = layout_stars(leader.chief_region, Branch::MAO,
                                          Direction::FORWARD, RingKind::PHYSICAL);
    const GateLayout gates = layout_gates(leader.chief_region, Branch::MAO,
                                          Direction::FORWARD, RingKind::PHYSICAL);
    const DeityLayout deities = layout_deities(stars.arrived, Direction::FORWARD);

    const Grid grid = assemble_grid(earth, heaven, gates, stars, deities,
                                    leader.void_branches, Branch::YOU);
    for (Region r : ALL_REGIONS) {
        const RegionCell& c = grid[r];
        assert(c.region == r);
        assert(c.earth == earth.at(r));
        assert(c.heaven == heaven.at(r));
        assert(c.is_void == (r == 4));   // 辰巳
        assert(c.is_horse == (r == 6));  // 酉 → 亥
    }
    assert(grid[9].element == Element::FIRE);
    assert(grid[1].gate == Gate::DEATH);
    assert(grid[8].deity == Deity::CHIEF);

    // Voids on 未申 mark region 2 and the center that shares its branches.
    const Grid g2 = assemble_grid(earth, heaven, gates, stars, deities,
                                  {Branch::WU, Branch::WEI}, Branch::ZI);
    assert(g2[2].is_void && g2[5].is_void && g2[9].is_void);
    assert(!g2[1].is_void);
    assert(g2[8].is_horse);  // 子 → 寅
}

int main() {
    std::printf("Stem layouts:\n");
    test_stem_layout_collisions();
    test_earth_bijection();
    test_earth_examples();
    test_heaven_anchor_leading_stem();
    test_flying_heaven();
    test_rotating_heaven();

    std::printf("\nLeader and displacement:\n");
    test_resolve_leader();
    test_displace_chief();

    std::printf("\nStars, gates, deities:\n");
    test_pinned_star();
    test_star_gate_deity_layouts();
    test_center_copies_region_two();
    test_spirit_tables();

    std::printf("\nGrid:\n");
    test_assemble_grid();

    std::printf("\nAll layout tests passed.\n");
    return 0;
}
