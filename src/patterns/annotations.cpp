#include "patterns/annotations.h"
#include "ring/regions.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace qimen {

namespace {

constexpr AnnotationType GOOD    = AnnotationType::AUSPICIOUS;
constexpr AnnotationType BAD     = AnnotationType::INAUSPICIOUS;
constexpr AnnotationType NEUTRAL = AnnotationType::NEUTRAL;

using B = Branch;
using S = Stem;

// Rows keyed on a stem list 甲 乙 丙 丁 戊 己 庚 辛 壬 癸; rows keyed on a
// branch list 子 丑 寅 卯 辰 巳 午 未 申 酉 戌 亥.

constexpr std::array ANNOTATION_RULES{
    AnnotationRule{.name = "天乙贵人", .type = GOOD,
                   .description = "最尊贵之神，主贵人相助、逢凶化吉（{branch}位）",
                   .key = AnnotationKey::DAY_STEM,
                   .branches = {{{B::CHOU, B::WEI}, {B::ZI, B::SHEN}, {B::HAI, B::YOU},
                                 {B::HAI, B::YOU},  {B::CHOU, B::WEI}, {B::ZI, B::SHEN},
                                 {B::CHOU, B::WEI}, {B::YIN, B::WU},   {B::MAO, B::SI},
                                 {B::MAO, B::SI}}}},
    AnnotationRule{.name = "日马", .type = NEUTRAL,
                   .description = "主迁动变化，出行奔波，求财谋事有动象（{branch}位）",
                   .key = AnnotationKey::DAY_BRANCH,
                   .branches = {{{B::YIN}, {B::HAI}, {B::SHEN}, {B::SI},
                                 {B::YIN}, {B::HAI}, {B::SHEN}, {B::SI},
                                 {B::YIN}, {B::HAI}, {B::SHEN}, {B::SI}}}},
    AnnotationRule{.name = "华盖", .type = NEUTRAL,
                   .description = "年华盖（{branch}位）",
                   .key = AnnotationKey::YEAR_BRANCH,
                   .branches = {{{B::CHEN}, {B::CHOU}, {B::XU}, {B::WEI},
                                 {B::CHEN}, {B::CHOU}, {B::XU}, {B::WEI},
                                 {B::CHEN}, {B::CHOU}, {B::XU}, {B::WEI}}}},
    AnnotationRule{.name = "华盖", .type = NEUTRAL,
                   .description = "日华盖（{branch}位）",
                   .key = AnnotationKey::DAY_BRANCH,
                   .branches = {{{B::CHEN}, {B::CHOU}, {B::XU}, {B::WEI},
                                 {B::CHEN}, {B::CHOU}, {B::XU}, {B::WEI},
                                 {B::CHEN}, {B::CHOU}, {B::XU}, {B::WEI}}}},
    AnnotationRule{.name = "月德", .type = GOOD,
                   .description = "化凶为吉，主有贵人暗助",
                   .key = AnnotationKey::MONTH_BRANCH,
                   .earth_stems = {{{S::REN}, {S::GENG}, {S::BING}, {S::JIA},
                                    {S::REN}, {S::GENG}, {S::BING}, {S::JIA},
                                    {S::REN}, {S::GENG}, {S::BING}, {S::JIA}}}},
    AnnotationRule{.name = "禄神", .type = GOOD,
                   .description = "主财禄、俸禄，利求财求官（{branch}位）",
                   .key = AnnotationKey::DAY_STEM,
                   .branches = {{{B::YIN}, {B::MAO}, {B::SI}, {B::WU}, {B::SI},
                                 {B::WU}, {B::SHEN}, {B::YOU}, {B::HAI}, {B::ZI}}}},
    AnnotationRule{.name = "桃花", .type = NEUTRAL,
                   .description = "主姻缘、人缘、桃色，婚恋类事重点参考（{branch}位）",
                   .key = AnnotationKey::DAY_BRANCH,
                   .branches = {{{B::YOU}, {B::WU}, {B::MAO}, {B::ZI},
                                 {B::YOU}, {B::WU}, {B::MAO}, {B::ZI},
                                 {B::YOU}, {B::WU}, {B::MAO}, {B::ZI}}}},
    AnnotationRule{.name = "天医", .type = GOOD,
                   .description = "主医药、治疗，疾病类事重点参考（{branch}位）",
                   .key = AnnotationKey::MONTH_BRANCH,
                   .branches = {{{B::HAI}, {B::ZI}, {B::CHOU}, {B::YIN},
                                 {B::MAO}, {B::CHEN}, {B::SI}, {B::WU},
                                 {B::WEI}, {B::SHEN}, {B::YOU}, {B::XU}}}},
    AnnotationRule{.name = "太岁", .type = NEUTRAL,
                   .description = "岁君所在，宜静不宜动，择日参考（{branch}年）",
                   .key = AnnotationKey::YEAR_BRANCH,
                   .branches = {{{B::ZI}, {B::CHOU}, {B::YIN}, {B::MAO},
                                 {B::CHEN}, {B::SI}, {B::WU}, {B::WEI},
                                 {B::SHEN}, {B::YOU}, {B::XU}, {B::HAI}}}},
    // Yin day stems carry no blade.
    AnnotationRule{.name = "羊刃", .type = BAD,
                   .description = "主刚烈、冲动，凶煞之一，主意外伤灾（{branch}位）",
                   .key = AnnotationKey::DAY_STEM,
                   .branches = {{{B::MAO}, {}, {B::WU}, {}, {B::WU},
                                 {}, {B::YOU}, {}, {B::ZI}, {}}}},
    AnnotationRule{.name = "丁马", .type = GOOD,
                   .description = "丁奇落宫，主文书信息，利考试文章",
                   .earth_stems = {{{S::DING}}}},
};

std::size_t key_index(AnnotationKey key, Pair year, Pair month, Pair day) noexcept {
    switch (key) {
    case AnnotationKey::NONE:         return 0;
    case AnnotationKey::DAY_STEM:     return index_of(day.stem);
    case AnnotationKey::DAY_BRANCH:   return index_of(day.branch);
    case AnnotationKey::MONTH_BRANCH: return index_of(month.branch);
    case AnnotationKey::YEAR_BRANCH:  return index_of(year.branch);
    }
    return 0;
}

std::string expand(std::string_view tmpl, const Branch* branch) {
    constexpr std::string_view PLACEHOLDER = "{branch}";
    std::string out(tmpl);
    const std::size_t pos = out.find(PLACEHOLDER);
    if (pos == std::string::npos) return out;
    if (branch == nullptr) {
        throw std::logic_error("annotation '" + out + "' names a branch but marks a stem");
    }
    out.replace(pos, PLACEHOLDER.size(), glyph(*branch));
    return out;
}

class AnnotationSink {
public:
    void add(const AnnotationRule& rule, std::string description, Region region) {
        const bool seen = std::any_of(out_.begin(), out_.end(), [&](const Annotation& a) {
            return a.name == rule.name && a.region == region;
        });
        if (!seen) {
            out_.push_back({std::string(rule.name), rule.type, std::move(description), region});
        }
    }

    std::vector<Annotation> take() { return std::move(out_); }

private:
    std::vector<Annotation> out_;
};

} // namespace

const char* glyph(AnnotationType t) noexcept {
    switch (t) {
    case AnnotationType::AUSPICIOUS:   return "吉";
    case AnnotationType::INAUSPICIOUS: return "凶";
    case AnnotationType::NEUTRAL:      return "中性";
    }
    return "?";
}

std::span<const AnnotationRule> annotation_rules() noexcept { return ANNOTATION_RULES; }

std::vector<Annotation> annotate_regions(const Grid& grid, Pair year, Pair month, Pair day) {
    AnnotationSink sink;
    for (const AnnotationRule& rule : ANNOTATION_RULES) {
        const std::size_t k = key_index(rule.key, year, month, day);

        for (std::size_t b = 0; b < NUM_BRANCHES; ++b) {
            const Branch branch = static_cast<Branch>(b);
            if (!rule.branches[k].contains(branch)) continue;
            sink.add(rule, expand(rule.description, &branch), branch_region(branch));
        }

        for (std::size_t s = 0; s < NUM_STEMS; ++s) {
            const Stem stem = static_cast<Stem>(s);
            if (!rule.earth_stems[k].contains(stem)) continue;
            for (Region r : ALL_REGIONS) {
                if (grid[r].earth == stem) sink.add(rule, expand(rule.description, nullptr), r);
            }
        }
    }
    return sink.take();
}

} // namespace qimen
