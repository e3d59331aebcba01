#include "layout/stem_layout.h"

#include <stdexcept>
#include <string>

namespace qimen {

void StemLayout::place(Region r, Stem s) {
    if (!is_valid_region(r)) {
        throw std::out_of_range("region out of range: " + std::to_string(r));
    }
    if (s == Stem::JIA) {
        throw std::logic_error("甲 is never placed on a layout");
    }
    if (occupied(r)) {
        throw std::logic_error("region " + std::to_string(r) + " already holds "
                               + glyph(stems_[r]));
    }
    if (contains(s)) {
        throw std::logic_error(std::string("stem ") + glyph(s) + " already placed in region "
                               + std::to_string(regions_[index_of(s)]));
    }
    stems_[r] = s;
    regions_[index_of(s)] = r;
    ++placed_;
}

Stem StemLayout::at(Region r) const {
    if (!is_valid_region(r)) {
        throw std::out_of_range("region out of range: " + std::to_string(r));
    }
    if (!occupied(r)) {
        throw std::logic_error("region " + std::to_string(r) + " is empty");
    }
    return stems_[r];
}

Region StemLayout::region_of(Stem s) const {
    const Region r = regions_[index_of(s)];
    if (r == 0) {
        throw std::logic_error(std::string("stem ") + glyph(s) + " is not on the layout");
    }
    return r;
}

bool StemLayout::occupied(Region r) const noexcept {
    for (Region placed : regions_) {
        if (placed == r) return true;
    }
    return false;
}

} // namespace qimen
