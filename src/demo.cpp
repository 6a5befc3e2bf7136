#include "demo.hpp"
#include "print.hpp"

#include <boost/random/uniform_int_distribution.hpp>

demo::demo(unsigned seed) : _rng(seed) {
}

int demo::value(int lo, int hi) {
    boost::random::uniform_int_distribution<int> dist(lo, hi - 1);
    return dist(_rng);
}

std::vector<std::size_t> demo::populate(heap& h) {
    std::vector<std::size_t> filled;
    const int v = value(0, 1000);
    for (std::size_t i = 0; i < h.size(); ++i) {
        if (h.at(i).occupied())
            continue;
        index_result r = h.alloc_at(v, heap::target(), i);
        if (const std::size_t* at = allocated(r))
            filled.push_back(*at);
    }
    return filled;
}

std::vector<index_result> demo::arb_ref(heap& h, std::size_t times) {
    std::vector<index_result> results;
    const std::vector<std::size_t> roots = h.roots();
    if (roots.empty()) {
        print::warn("no roots to reference; use --root first");
        return results;
    }

    std::vector<int> data;
    for (std::size_t r : roots) {
        const int v = value(1, 50);
        // roots are occupied, so storing cannot fail
        link_result e = h.store(r, v);
        if (e) {
            print::error("cannot store into root %lu: %s", r, e->what());
            return results;
        }
        data.push_back(v);
    }

    const std::size_t pick = value(0, (int)roots.size());
    results.reserve(times);
    for (std::size_t i = 0; i < times; ++i)
        results.push_back(h.alloc(data[pick] * data[pick], roots[pick]));
    return results;
}
