#pragma once

#include <boost/optional.hpp>
#include <cstddef>
#include <cstdint>
#include <vector>
#include <iostream>

struct cell {
    // mark = reached from a root in the last mark pass
    // occupied = allocated (or forced live by rooting)
    // root = entry point; roots are always occupied and marked
    enum Flag { GcMark = 1, Occupied = 2, Root = 4 };

    cell();

    bool occupied() const;
    bool root() const;
    bool marked() const;

    // index lists are kept free of duplicates; the add/remove
    // functions report whether the list changed
    bool references(std::size_t i) const;
    bool referenced_by(std::size_t i) const;
    bool add_outgoing(std::size_t i);
    bool add_incoming(std::size_t i);
    bool remove_outgoing(std::size_t i);
    bool remove_incoming(std::size_t i);

    // back to the default (free) state
    void reset();

    boost::optional<int> value;
    std::vector<std::size_t> outgoing; // cells this cell references
    std::vector<std::size_t> incoming; // cells referencing this cell
    int refs;
    uint16_t flags;
};



inline
cell::cell() : value(), outgoing(), incoming(), refs(0), flags(0) {
}

inline
bool cell::occupied() const {
    return flags & Occupied;
}

inline
bool cell::root() const {
    return flags & Root;
}

inline
bool cell::marked() const {
    return flags & GcMark;
}

std::ostream& operator<<(std::ostream& s, const cell& c);
