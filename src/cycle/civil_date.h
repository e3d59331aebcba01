#pragma once

/// Proleptic Gregorian dates and day arithmetic between them.

namespace qimen {

struct CivilDate {
    int year = 1970;
    int month = 1;
    int day = 1;

    bool operator==(const CivilDate&) const = default;
};

/// Days since 1970-01-01 (negative before it).
long days_from_civil(CivilDate d) noexcept;

/// `to` minus `from`, in whole days.
long days_between(CivilDate from, CivilDate to) noexcept;

} // namespace qimen
