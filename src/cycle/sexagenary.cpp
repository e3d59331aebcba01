#include "cycle/sexagenary.h"

#include <stdexcept>

namespace qimen {

namespace {

struct DecadeRow {
    Pair leader;
    Stem instrument;
    std::array<Branch, 2> void_pair;
};

/// Indexed by cycle_index(leader) / 10.
constexpr std::array<DecadeRow, 6> DECADES{{
    {{Stem::JIA, Branch::ZI},   Stem::WU,   {Branch::XU, Branch::HAI}},
    {{Stem::JIA, Branch::XU},   Stem::JI,   {Branch::SHEN, Branch::YOU}},
    {{Stem::JIA, Branch::SHEN}, Stem::GENG, {Branch::WU, Branch::WEI}},
    {{Stem::JIA, Branch::WU},   Stem::XIN,  {Branch::CHEN, Branch::SI}},
    {{Stem::JIA, Branch::CHEN}, Stem::REN,  {Branch::YIN, Branch::MAO}},
    {{Stem::JIA, Branch::YIN},  Stem::GUI,  {Branch::ZI, Branch::CHOU}},
}};

const DecadeRow& decade_row(Pair leader) {
    for (const auto& row : DECADES) {
        if (row.leader == leader) return row;
    }
    throw std::logic_error("not a decade leader: " + to_string(leader));
}

// Each stem is 3 bytes of UTF-8.
constexpr std::size_t GLYPH_BYTES = 3;

} // namespace

std::size_t cycle_index(Pair p) {
    if (!is_valid_pair(p)) {
        throw std::invalid_argument("not a sexagenary pair: " + to_string(p));
    }
    // Solve i ≡ stem (mod 10), i ≡ branch (mod 12) over 0..59.
    const std::size_t s = index_of(p.stem);
    for (std::size_t i = s; i < CYCLE_LENGTH; i += NUM_STEMS) {
        if (i % NUM_BRANCHES == index_of(p.branch)) return i;
    }
    throw std::logic_error("cycle index not found for " + to_string(p));
}

Pair pair_at(std::size_t index) noexcept {
    index %= CYCLE_LENGTH;
    return {static_cast<Stem>(index % NUM_STEMS),
            static_cast<Branch>(index % NUM_BRANCHES)};
}

Pair decade_leader(Pair p) {
    const std::size_t i = cycle_index(p);
    return pair_at(i - i % DECADE_LENGTH);
}

Stem instrument_for(Pair leader) {
    return decade_row(leader).instrument;
}

std::array<Branch, 2> void_branches(Pair leader) {
    return decade_row(leader).void_pair;
}

Stem disguised_stem(Pair p) {
    if (p.stem != Stem::JIA) return p.stem;
    return instrument_for(decade_leader(p));
}

Pair parse_pair(std::string_view text) {
    if (text.size() != 2 * GLYPH_BYTES) {
        throw std::invalid_argument("expected a stem and a branch: '"
                                    + std::string(text) + "'");
    }
    Pair p{parse_stem(text.substr(0, GLYPH_BYTES)),
           parse_branch(text.substr(GLYPH_BYTES))};
    if (!is_valid_pair(p)) {
        throw std::invalid_argument("not a sexagenary pair: '" + std::string(text) + "'");
    }
    return p;
}

std::string to_string(Pair p) {
    return std::string(glyph(p.stem)) + glyph(p.branch);
}

} // namespace qimen
