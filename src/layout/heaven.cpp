#include "layout/heaven.h"

#include <stdexcept>

namespace qimen {

namespace {

/// Marker that stays on the center in the rotating style.
constexpr std::size_t ROTATING_CENTER_MARKER = 4;

} // namespace

Region heaven_anchor(const StemLayout& earth, Pair reference) {
    return earth.anchor_region(disguised_stem(reference));
}

StemLayout flying_heaven(Region anchor, Direction dir) {
    StemLayout layout;
    for (std::size_t i = 0; i < MARKER_SEQUENCE.size(); ++i) {
        layout.place(step(RingKind::LUOSHU_WITH_CENTER, anchor, static_cast<long>(i), dir),
                     MARKER_SEQUENCE[i]);
    }
    return layout;
}

StemLayout rotating_heaven(Region anchor, Direction dir) {
    StemLayout layout;
    for (std::size_t i = 0; i < MARKER_SEQUENCE.size(); ++i) {
        if (i == ROTATING_CENTER_MARKER) {
            layout.place(CENTER, MARKER_SEQUENCE[i]);
            continue;
        }
        const std::size_t slot = i > ROTATING_CENTER_MARKER ? i - 1 : i;
        layout.place(step(RingKind::PHYSICAL, anchor, static_cast<long>(slot), dir),
                     MARKER_SEQUENCE[i]);
    }
    return layout;
}

StemLayout heaven_layout(ChartStyle style, const StemLayout& earth,
                         Pair reference, Direction dir) {
    const Region anchor = heaven_anchor(earth, reference);
    switch (style) {
    case ChartStyle::FLYING:   return flying_heaven(anchor, dir);
    case ChartStyle::ROTATING: return rotating_heaven(anchor, dir);
    }
    throw std::invalid_argument("unknown chart style");
}

} // namespace qimen
