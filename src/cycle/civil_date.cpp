#include "cycle/civil_date.h"

namespace qimen {

long days_from_civil(CivilDate d) noexcept {
    // Shift the year to start in March so the leap day falls last.
    const long y = d.month <= 2 ? d.year - 1 : d.year;
    const long era = (y >= 0 ? y : y - 399) / 400;
    const long yoe = y - era * 400;                                   // [0, 399]
    const long mp = (d.month + 9) % 12;                               // March = 0
    const long doy = (153 * mp + 2) / 5 + d.day - 1;                  // [0, 365]
    const long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;           // [0, 146096]
    return era * 146097 + doe - 719468;
}

long days_between(CivilDate from, CivilDate to) noexcept {
    return days_from_civil(to) - days_from_civil(from);
}

} // namespace qimen
