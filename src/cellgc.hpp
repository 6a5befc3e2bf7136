#pragma once

#include <cstddef>


struct heap;
struct gcimpl;

struct gc_stats {
    gc_stats() : marked(0), reclaimed(0), collections(0) {}

    std::size_t marked;      // live cells after the mark pass
    std::size_t reclaimed;   // cells returned to the free state
    std::size_t collections; // completed collections so far
};

// tracing mark & sweep collector over a heap it does not own.
// every call runs to completion; phase() is Idle between calls.
struct cellgc {
    enum Phase { Idle, Marking, Sweeping };

    explicit cellgc(heap& h);
    ~cellgc();
    cellgc(const cellgc&) = delete;
    cellgc& operator=(const cellgc&) = delete;

    gc_stats collect(); // mark & sweep
    std::size_t mark();
    std::size_t sweep();

    Phase phase() const;
    const gc_stats& stats() const;

    gcimpl* _impl;
};
