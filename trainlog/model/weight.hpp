#pragma once

#include <stdint.h>
#include <ostream>

namespace trainlog {

// All weights in a document share this unit.
static const char* const WEIGHT_UNIT = "kg";

struct Weight {
    double amount;

    Weight() : amount(0) {}
    explicit Weight(double a) : amount(a) {}

    bool operator==(const Weight& o) const { return amount == o.amount; }
    bool operator!=(const Weight& o) const { return amount != o.amount; }
};

struct SetEntry {
    uint32_t repetitions;
    Weight weight;

    SetEntry() : repetitions(0), weight() {}
    SetEntry(uint32_t r, const Weight& w) : repetitions(r), weight(w) {}

    bool operator==(const SetEntry& o) const {
        return repetitions == o.repetitions and weight == o.weight;
    }
    bool operator!=(const SetEntry& o) const { return not operator==(o); }
};

inline std::ostream& operator<<(std::ostream& o, const Weight& weight) {
    return o << weight.amount << WEIGHT_UNIT;
}

inline std::ostream& operator<<(std::ostream& o, const SetEntry& set) {
    return o << set.repetitions << " - " << set.weight;
}

}  // namespace trainlog
