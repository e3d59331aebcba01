#include "patterns/catalog.h"

namespace qimen {

namespace {

constexpr FormationType GOOD = FormationType::AUSPICIOUS;
constexpr FormationType BAD  = FormationType::INAUSPICIOUS;

constexpr StemSet WONDERS{Stem::YI, Stem::BING, Stem::DING};
constexpr StemSet INSTRUMENTS{Stem::WU, Stem::JI, Stem::GENG, Stem::XIN, Stem::REN, Stem::GUI};
constexpr GateSet AUSPICIOUS_GATES{Gate::OPEN, Gate::REST, Gate::LIFE};
constexpr GateSet CLOSED_GATES{Gate::DEATH, Gate::FEAR, Gate::DELUSION};

constexpr std::array REGION_RULES{
    // ── Wonders meeting gates and deities ───────────────────────────
    RegionRule{.name = "三奇得使", .type = GOOD,
               .description = "{heaven}奇临{gate}门于{region}宫",
               .heaven = WONDERS, .gates = AUSPICIOUS_GATES},
    RegionRule{.name = "三奇贵人", .type = GOOD,
               .description = "{heaven}奇遇值符于{region}宫",
               .heaven = WONDERS, .deities = {Deity::CHIEF}},
    RegionRule{.name = "三奇得门", .type = GOOD,
               .description = "{heaven}奇得{gate}门于{region}宫",
               .heaven = {Stem::YI}, .gates = {Gate::OPEN}},
    RegionRule{.name = "三奇得门", .type = GOOD,
               .description = "{heaven}奇得{gate}门于{region}宫",
               .heaven = {Stem::BING}, .gates = {Gate::LIFE}},
    RegionRule{.name = "三奇得门", .type = GOOD,
               .description = "{heaven}奇得{gate}门于{region}宫",
               .heaven = {Stem::DING}, .gates = {Gate::REST}},
    RegionRule{.name = "玉女守门", .type = GOOD,
               .description = "丁奇临{gate}门遇{deity}于{region}宫",
               .heaven = {Stem::DING}, .gates = {Gate::OPEN, Gate::REST},
               .deities = {Deity::MOON, Deity::HARMONY}},

    // ── The nine escapes ────────────────────────────────────────────
    RegionRule{.name = "天遁", .type = GOOD, .description = "丙奇临生门天心于{region}宫",
               .heaven = {Stem::BING}, .gates = {Gate::LIFE}, .stars = {Star::XIN}},
    RegionRule{.name = "地遁", .type = GOOD, .description = "乙奇临开门遇地盘己于{region}宫",
               .heaven = {Stem::YI}, .earth = {Stem::JI}, .gates = {Gate::OPEN}},
    RegionRule{.name = "人遁", .type = GOOD, .description = "丁奇临休门遇太阴于{region}宫",
               .heaven = {Stem::DING}, .gates = {Gate::REST}, .deities = {Deity::MOON}},
    RegionRule{.name = "神遁", .type = GOOD, .description = "丙奇临生门遇九天于{region}宫",
               .heaven = {Stem::BING}, .gates = {Gate::LIFE}, .deities = {Deity::HEAVEN}},
    RegionRule{.name = "鬼遁", .type = GOOD, .description = "乙奇临生门遇九地于{region}宫",
               .heaven = {Stem::YI}, .gates = {Gate::LIFE}, .deities = {Deity::EARTH}},
    RegionRule{.name = "龙遁", .type = GOOD, .description = "乙奇临休门遇六合于{region}宫",
               .heaven = {Stem::YI}, .gates = {Gate::REST}, .deities = {Deity::HARMONY}},
    RegionRule{.name = "虎遁", .type = GOOD, .description = "乙奇临开门遇太阴于{region}宫",
               .heaven = {Stem::YI}, .gates = {Gate::OPEN}, .deities = {Deity::MOON}},
    RegionRule{.name = "风遁", .type = GOOD, .description = "乙奇临开门天辅于{region}宫",
               .heaven = {Stem::YI}, .gates = {Gate::OPEN}, .stars = {Star::FU}},
    RegionRule{.name = "云遁", .type = GOOD, .description = "乙奇临休门遇六合天芮于{region}宫",
               .heaven = {Stem::YI}, .gates = {Gate::REST}, .stars = {Star::RUI},
               .deities = {Deity::HARMONY}},

    // ── Gate pressure, tombs and punishments ────────────────────────
    RegionRule{.name = "门迫", .type = BAD, .description = "{gate}门克{region}宫",
               .relation = Relation::GATE_OVERCOMES_REGION, .outer_only = true},
    RegionRule{.name = "三奇入墓", .type = BAD, .description = "{heaven}入墓于{region}宫",
               .heaven = {Stem::YI}, .regions = {2}},
    RegionRule{.name = "三奇入墓", .type = BAD, .description = "{heaven}入墓于{region}宫",
               .heaven = {Stem::BING, Stem::DING}, .regions = {6}},
    RegionRule{.name = "入墓", .type = BAD, .description = "{heaven}入墓于{region}宫",
               .heaven = {Stem::WU, Stem::JI}, .regions = {6}},
    RegionRule{.name = "入墓", .type = BAD, .description = "{heaven}入墓于{region}宫",
               .heaven = {Stem::GENG, Stem::XIN}, .regions = {8}},
    RegionRule{.name = "入墓", .type = BAD, .description = "{heaven}入墓于{region}宫",
               .heaven = {Stem::REN, Stem::GUI}, .regions = {4}},
    RegionRule{.name = "六仪击刑", .type = BAD, .description = "{heaven}击刑于{region}宫",
               .heaven = {Stem::WU}, .regions = {3}},
    RegionRule{.name = "六仪击刑", .type = BAD, .description = "{heaven}击刑于{region}宫",
               .heaven = {Stem::JI}, .regions = {2}},
    RegionRule{.name = "六仪击刑", .type = BAD, .description = "{heaven}击刑于{region}宫",
               .heaven = {Stem::GENG}, .regions = {8}},
    RegionRule{.name = "六仪击刑", .type = BAD, .description = "{heaven}击刑于{region}宫",
               .heaven = {Stem::XIN}, .regions = {9}},
    RegionRule{.name = "六仪击刑", .type = BAD, .description = "{heaven}击刑于{region}宫",
               .heaven = {Stem::REN, Stem::GUI}, .regions = {4}},

    // ── Dragon, tiger, nets and prison ──────────────────────────────
    RegionRule{.name = "青龙逃走", .type = GOOD, .description = "生门遇六合于{region}宫",
               .gates = {Gate::LIFE}, .deities = {Deity::HARMONY}},
    RegionRule{.name = "白虎猖狂", .type = BAD, .description = "庚临开门遇白虎于{region}宫",
               .heaven = {Stem::GENG}, .gates = {Gate::OPEN}, .deities = {Deity::TIGER}},
    RegionRule{.name = "天网四张", .type = BAD, .description = "戊临{gate}门于{region}宫",
               .heaven = {Stem::WU}, .gates = {Gate::DEATH, Gate::FEAR}, .regions = {6}},
    RegionRule{.name = "地网盖", .type = BAD, .description = "癸临{gate}门于{region}宫",
               .heaven = {Stem::GUI}, .gates = {Gate::DEATH, Gate::DELUSION}, .regions = {4}},
    RegionRule{.name = "天牢", .type = BAD, .description = "庚临杜门于{region}宫，主阻滞闭塞",
               .heaven = {Stem::GENG}, .gates = {Gate::DELUSION}},

    // ── Hour-branch region ──────────────────────────────────────────
    RegionRule{.name = "天显时格", .type = GOOD,
               .description = "{heaven}奇临{gate}门于{hour_branch}时宫",
               .heaven = WONDERS, .gates = AUSPICIOUS_GATES,
               .anchor = Anchor::HOUR_BRANCH_REGION},
    RegionRule{.name = "地私门格", .type = BAD,
               .description = "{heaven}临{gate}门于{hour_branch}时宫",
               .heaven = INSTRUMENTS, .gates = CLOSED_GATES,
               .anchor = Anchor::HOUR_BRANCH_REGION},
};

constexpr std::array<StemPairRule, 33> STEM_PAIR_RULES{{
    {"青龙返首", GOOD, Stem::WU,   Stem::BING,
     "戊加丙，动作大吉，百事皆宜"},
    {"飞鸟跌穴", GOOD, Stem::BING, Stem::WU,
     "丙加戊，百事吉利，谋为顺遂"},
    {"丁遇戊格", GOOD, Stem::DING, Stem::WU,
     "丁加戊，青龙转光，官人升迁，常人威昌"},
    {"日月会合", GOOD, Stem::BING, Stem::YI,
     "丙加乙，日月并行，公谋私为皆吉"},
    {"乙奇伏吟", GOOD, Stem::YI,   Stem::YI,
     "乙加乙，不宜谒贵求名，只可安分守身"},
    {"丙奇伏吟", GOOD, Stem::BING, Stem::BING,
     "丙加丙，文书逼迫，破耗遗失"},
    {"奇仪顺遂", GOOD, Stem::YI,   Stem::BING,
     "乙加丙，吉星迁官进职"},
    {"奇仪相佐", GOOD, Stem::YI,   Stem::DING,
     "乙加丁，文书事吉，百事可为"},
    {"星随月转", GOOD, Stem::DING, Stem::BING,
     "丁加丙，贵人越级高升"},
    {"天乙会合", GOOD, Stem::GUI,  Stem::WU,
     "癸加戊，财喜婚姻皆吉"},

    {"青龙折足", BAD, Stem::WU,   Stem::XIN,
     "戊加辛，吉事有阻，主失财破耗"},
    {"朱雀投江", BAD, Stem::DING, Stem::GUI,
     "丁加癸，文书口舌俱消，音信沉溺"},
    {"大格", BAD, Stem::GENG, Stem::GUI,
     "庚加癸，行人不至，官事不止，车破马伤"},
    {"小格", BAD, Stem::GENG, Stem::REN,
     "庚加壬，远行迷失道路，男女音信难通"},
    {"刑格", BAD, Stem::GENG, Stem::JI,
     "庚加己，官司被重刑"},
    {"辛仪伏吟", BAD, Stem::XIN,  Stem::XIN,
     "辛加辛，公废私就，讼狱自罹罪名"},
    {"戊仪伏吟", BAD, Stem::WU,   Stem::WU,
     "戊加戊，凡事不利，道路闭塞，以守为好"},
    {"己仪伏吟", BAD, Stem::JI,   Stem::JI,
     "己加己，地户逢鬼，百事不遂"},
    {"庚仪伏吟", BAD, Stem::GENG, Stem::GENG,
     "庚加庚，太白同宫，官灾横祸"},
    {"壬仪伏吟", BAD, Stem::REN,  Stem::REN,
     "壬加壬，天狱自刑，求谋无成，祸从内起"},
    {"癸仪伏吟", BAD, Stem::GUI,  Stem::GUI,
     "癸加癸，天网张开，不利出行，病讼皆伤"},
    {"太白入荧", BAD, Stem::GENG, Stem::BING,
     "庚加丙，占贼必来，为客进利，为主破财"},
    {"荧入太白", BAD, Stem::BING, Stem::GENG,
     "丙加庚，门户破败，盗贼耗失"},
    {"日奇被刑", BAD, Stem::YI,   Stem::GENG,
     "乙加庚，争讼财产，夫妻怀私"},
    {"贵人入狱", BAD, Stem::WU,   Stem::JI,
     "戊加己，公私皆不利"},
    {"日奇入雾", BAD, Stem::YI,   Stem::JI,
     "乙加己，被土暗昧，门凶事必凶"},
    {"大悖入刑", BAD, Stem::BING, Stem::JI,
     "丙加己，囚人刑杖，文书不行"},
    {"火入勾陈", BAD, Stem::DING, Stem::JI,
     "丁加己，奸私仇冤，事因女人"},
    {"朱雀入狱", BAD, Stem::DING, Stem::XIN,
     "丁加辛，罪人释囚，官人失位"},
    {"白虎干格", BAD, Stem::GENG, Stem::XIN,
     "庚加辛，远行车折马死，求财不利"},
    {"困龙被伤", BAD, Stem::XIN,  Stem::WU,
     "辛加戊，主官司破财，屈抑守分"},
    {"腾蛇夭矫", BAD, Stem::GUI,  Stem::DING,
     "癸加丁，文书官司，火焚难逃"},
    {"华盖悖师", BAD, Stem::GUI,  Stem::BING,
     "癸加丙，贵贱逢之，上人见喜"},
}};

constexpr std::array<std::pair<Stem, Stem>, 4> HARMONY_PAIRS{{
    {Stem::YI, Stem::GENG},
    {Stem::BING, Stem::XIN},
    {Stem::DING, Stem::REN},
    {Stem::WU, Stem::GUI},
}};

//                                              甲  乙  丙  丁  戊  己  庚  辛  壬  癸
constexpr std::array<Stem, NUM_STEMS> HOUR_CLASH{
    Stem::GENG, Stem::XIN, Stem::REN, Stem::GUI, Stem::JIA,
    Stem::YI, Stem::BING, Stem::DING, Stem::WU, Stem::JI,
};

} // namespace

const char* glyph(FormationType t) noexcept {
    switch (t) {
    case FormationType::AUSPICIOUS:   return "吉格";
    case FormationType::INAUSPICIOUS: return "凶格";
    case FormationType::NEUTRAL:      return "中性";
    }
    return "?";
}

std::span<const RegionRule> region_rules() noexcept { return REGION_RULES; }
std::span<const StemPairRule> stem_pair_rules() noexcept { return STEM_PAIR_RULES; }
std::span<const std::pair<Stem, Stem>> harmony_pairs() noexcept { return HARMONY_PAIRS; }

Stem clashing_hour_stem(Stem day_stem) noexcept {
    return HOUR_CLASH[index_of(day_stem)];
}

} // namespace qimen
