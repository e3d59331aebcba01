#include "layout/earth.h"
#include "ring/ring.h"

#include <stdexcept>
#include <string>

namespace qimen {

StemLayout earth_layout(int configuration, Direction dir) {
    if (!is_valid_region(configuration)) {
        throw std::invalid_argument("configuration number out of range: "
                                    + std::to_string(configuration));
    }

    StemLayout layout;
    const Region start = borrow_center(configuration);
    for (std::size_t i = 0; i < RING_SIZE; ++i) {
        layout.place(step(RingKind::LUOSHU, start, static_cast<long>(i), dir),
                     MARKER_SEQUENCE[i]);
    }
    layout.place(CENTER, MARKER_SEQUENCE[RING_SIZE]);
    return layout;
}

} // namespace qimen
