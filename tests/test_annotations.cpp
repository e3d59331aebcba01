/// Unit tests for region annotations:
///   - Annotation table shape and lookup rows
///   - Branch marks and earth-stem marks on the 清明 upper-period chart
///   - Rows that mark nothing, duplicate marks under one name

#include "common.h"
#include "cycle/sexagenary.h"
#include "layout/earth.h"
#include "layout/grid.h"
#include "layout/heaven.h"
#include "layout/leader.h"
#include "layout/symbol_layout.h"
#include "patterns/annotations.h"
#include "ring/regions.h"

#include <algorithm>
#include <cassert>
#include <cstdio>
#include <string>
#include <vector>

using namespace qimen;

static Pair P(const char* text) { return parse_pair(text); }

/// Grid on the forward configuration-4 earth layout:
///   1癸 2庚 3丙 4戊 5乙 6壬 7辛 8丁 9己
static Grid base_grid() {
    const Direction dir = Direction::FORWARD;
    const StemLayout earth = earth_layout(4, dir);
    const StemLayout heaven = heaven_layout(ChartStyle::ROTATING, earth, P("癸卯"), dir);
    const LeaderInfo leader = resolve_leader(P("癸卯"), earth);
    const StarLayout stars = layout_stars(leader.chief_region, Branch::MAO, dir, RingKind::PHYSICAL);
    const GateLayout gates = layout_gates(leader.chief_region, Branch::MAO, dir, RingKind::PHYSICAL);
    return assemble_grid(earth, heaven, gates, stars, layout_deities(stars.arrived, dir),
                         leader.void_branches, Branch::YOU);
}

static bool has(const std::vector<Annotation>& as, const std::string& name,
                const std::string& description, Region region) {
    return std::any_of(as.begin(), as.end(), [&](const Annotation& a) {
        return a.name == name && a.description == description && a.region == region;
    });
}

static std::size_t count(const std::vector<Annotation>& as, const std::string& name) {
    return static_cast<std::size_t>(std::count_if(as.begin(), as.end(),
        [&](const Annotation& a) { return a.name == name; }));
}

// ════════════════════════════════════════════════════════════════════
//  Table
// ════════════════════════════════════════════════════════════════════

static void test_annotation_table() {
    std::printf("  annotation table\n");

    assert(annotation_rules().size() == 11);
    assert(std::string(glyph(AnnotationType::AUSPICIOUS)) == "吉");
    assert(std::string(glyph(AnnotationType::INAUSPICIOUS)) == "凶");

    for (const AnnotationRule& rule : annotation_rules()) {
        assert(!rule.name.empty() && !rule.description.empty());
    }

    // The day horse row agrees with the grid's horse flag.
    const AnnotationRule& horse = annotation_rules()[1];
    assert(horse.name == "日马");
    for (std::size_t b = 0; b < NUM_BRANCHES; ++b) {
        const Branch day = static_cast<Branch>(b);
        assert(horse.branches[b].contains(horse_branch(day)));
    }
}

// ════════════════════════════════════════════════════════════════════
//  Marks
// ════════════════════════════════════════════════════════════════════

static void test_base_marks() {
    std::printf("  壬申 year, 甲辰 month, 丁酉 day\n");

    const auto as = annotate_regions(base_grid(), P("壬申"), P("甲辰"), P("丁酉"));
    assert(as.size() == 11);

    assert(has(as, "天乙贵人", "最尊贵之神，主贵人相助、逢凶化吉（酉位）", 7));
    assert(has(as, "天乙贵人", "最尊贵之神，主贵人相助、逢凶化吉（亥位）", 6));
    assert(has(as, "日马", "主迁动变化，出行奔波，求财谋事有动象（亥位）", 6));
    assert(has(as, "华盖", "年华盖（辰位）", 4));
    assert(has(as, "华盖", "日华盖（丑位）", 8));
    assert(has(as, "禄神", "主财禄、俸禄，利求财求官（午位）", 9));
    assert(has(as, "桃花", "主姻缘、人缘、桃色，婚恋类事重点参考（午位）", 9));
    assert(has(as, "天医", "主医药、治疗，疾病类事重点参考（卯位）", 3));
    assert(has(as, "太岁", "岁君所在，宜静不宜动，择日参考（申年）", 2));
    assert(count(as, "羊刃") == 0);

    // Earth-stem marks follow the earth layout: 壬 on 6, 丁 on 8.
    assert(has(as, "月德", "化凶为吉，主有贵人暗助", 6));
    assert(has(as, "丁马", "丁奇落宫，主文书信息，利考试文章", 8));

    // Row order, then branch order within a row.
    assert(as[0].name == "天乙贵人" && as[0].region == 7);
    assert(as[1].name == "天乙贵人" && as[1].region == 6);
    assert(as.back().name == "丁马");
}

static void test_yang_day_blade() {
    std::printf("  yang day stems carry a blade, yin ones do not\n");

    const Grid grid = base_grid();
    const auto jia = annotate_regions(grid, P("壬申"), P("甲辰"), P("甲子"));
    assert(has(jia, "羊刃", "主刚烈、冲动，凶煞之一，主意外伤灾（卯位）", 3));
    assert(has(jia, "天乙贵人", "最尊贵之神，主贵人相助、逢凶化吉（丑位）", 8));
    assert(has(jia, "天乙贵人", "最尊贵之神，主贵人相助、逢凶化吉（未位）", 2));

    const auto yi = annotate_regions(grid, P("壬申"), P("甲辰"), P("乙丑"));
    assert(count(yi, "羊刃") == 0);
}

static void test_month_virtue_on_jia() {
    std::printf("  月德 on 甲 marks nothing\n");

    // 卯 months look for 甲, which never sits on the earth layout.
    const auto as = annotate_regions(base_grid(), P("壬申"), P("丁卯"), P("丁酉"));
    assert(count(as, "月德") == 0);
    assert(has(as, "天医", "主医药、治疗，疾病类事重点参考（寅位）", 8));
}

static void test_canopy_once_per_region() {
    std::printf("  one 华盖 when year and day share the mark\n");

    // 申 year and 子 day both mark 辰.
    const auto same = annotate_regions(base_grid(), P("壬申"), P("甲辰"), P("丙子"));
    assert(count(same, "华盖") == 1);
    assert(has(same, "华盖", "年华盖（辰位）", 4));

    // Same branch for year and day.
    const auto equal = annotate_regions(base_grid(), P("壬申"), P("甲辰"), P("庚申"));
    assert(count(equal, "华盖") == 1);
}

int main() {
    std::printf("Table:\n");
    test_annotation_table();

    std::printf("\nMarks:\n");
    test_base_marks();
    test_yang_day_blade();
    test_month_virtue_on_jia();
    test_canopy_once_per_region();

    std::printf("\nAll annotation tests passed.\n");
    return 0;
}
