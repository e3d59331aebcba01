#include "ring/ring.h"

#include <array>
#include <span>
#include <stdexcept>
#include <string>

namespace qimen {

namespace {

constexpr std::array<Region, RING_SIZE> LUOSHU_ORDER{1, 8, 3, 4, 9, 2, 7, 6};
constexpr std::array<Region, RING_SIZE> CLOCKWISE_ORDER{1, 8, 3, 4, 9, 2, 7, 6};
constexpr std::array<Region, RING_SIZE> COUNTER_CLOCKWISE_ORDER{1, 6, 7, 2, 9, 4, 3, 8};
constexpr std::array<Region, NUM_REGIONS> LUOSHU_CENTER_ORDER{1, 8, 3, 4, 5, 9, 2, 7, 6};

std::span<const Region> table_for(RingKind kind, Direction dir) noexcept {
    switch (kind) {
    case RingKind::LUOSHU:
        return LUOSHU_ORDER;
    case RingKind::PHYSICAL:
        return dir == Direction::FORWARD ? std::span<const Region>(CLOCKWISE_ORDER)
                                         : std::span<const Region>(COUNTER_CLOCKWISE_ORDER);
    case RingKind::LUOSHU_WITH_CENTER:
        return LUOSHU_CENTER_ORDER;
    }
    return LUOSHU_ORDER;
}

long wrap(long index, long size) noexcept {
    long m = index % size;
    return m < 0 ? m + size : m;
}

} // namespace

std::size_t ring_size(RingKind kind) noexcept {
    return kind == RingKind::LUOSHU_WITH_CENTER ? NUM_REGIONS : RING_SIZE;
}

std::size_t index_of(RingKind kind, Region r, Direction dir) {
    if (!is_valid_region(r)) {
        throw std::out_of_range("region out of range: " + std::to_string(r));
    }
    if (kind != RingKind::LUOSHU_WITH_CENTER) r = borrow_center(r);

    auto table = table_for(kind, dir);
    for (std::size_t i = 0; i < table.size(); ++i) {
        if (table[i] == r) return i;
    }
    throw std::out_of_range("region " + std::to_string(r) + " is not on the ring");
}

Region region_at(RingKind kind, long index, Direction dir) {
    auto table = table_for(kind, dir);
    return table[static_cast<std::size_t>(wrap(index, static_cast<long>(table.size())))];
}

Region step(RingKind kind, Region r, long n, Direction dir) {
    const long start = static_cast<long>(index_of(kind, r, dir));

    // PHYSICAL walks its direction-specific table forwards; the Luoshu
    // rings walk one table both ways.
    if (kind == RingKind::PHYSICAL || dir == Direction::FORWARD) {
        return region_at(kind, start + n, dir);
    }
    return region_at(kind, start - n, dir);
}

} // namespace qimen
