#pragma once

#include <cstdint>
#include <ostream>

namespace stevedore::migrate {

// Partition n covers [lo, hi) of the partition key. Rows are copied from
// its source in [copy_lo, copy_hi) of the copy key, which defaults to the
// same bounds.
struct Partition {
    int64_t number = 0;
    int64_t lo = 0;
    int64_t hi = 0;
    int64_t copy_lo = 0;
    int64_t copy_hi = 0;

    static Partition make(int64_t number, int64_t lo, int64_t hi) {
        return Partition{number, lo, hi, lo, hi};
    }

    bool operator==(const Partition& o) const {
        return number == o.number && lo == o.lo && hi == o.hi &&
               copy_lo == o.copy_lo && copy_hi == o.copy_hi;
    }
    bool operator!=(const Partition& o) const { return !(*this == o); }
};

inline std::ostream& operator<<(std::ostream& os, const Partition& p) {
    os << "#" << p.number << " [" << p.lo << ", " << p.hi << ")";
    if (p.copy_lo != p.lo || p.copy_hi != p.hi) {
        os << " copy [" << p.copy_lo << ", " << p.copy_hi << ")";
    }
    return os;
}

} // namespace stevedore::migrate
