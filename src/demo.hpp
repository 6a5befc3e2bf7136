#pragma once

#include "heap.hpp"

#include <boost/random/mersenne_twister.hpp>
#include <cstddef>
#include <vector>

// random demo data for an interactive session
struct demo {
    explicit demo(unsigned seed);

    // uniform in [lo, hi)
    int value(int lo, int hi);

    // fills every free cell with the same random value and no references;
    // returns the indices filled. nothing points at them, so the next
    // collection reclaims them unless they get linked first.
    std::vector<std::size_t> populate(heap& h);

    // gives each root a fresh random value, picks one root, then allocates
    // its value squared `times` times, each new cell referencing that root.
    // returns one result per attempt; empty if there are no roots.
    std::vector<index_result> arb_ref(heap& h, std::size_t times);

private:
    boost::random::mt19937 _rng;
};
