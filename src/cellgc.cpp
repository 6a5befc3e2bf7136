#include "cellgc.hpp"
#include "heap.hpp"
#include "print.hpp"

#include <deque>
#include <vector>
#include <algorithm>

struct gcimpl {
    explicit gcimpl(heap& h);
    gc_stats collect();
    std::size_t mark();
    std::size_t sweep();

    cellgc::Phase phase() const { return _phase; }
    const gc_stats& stats() const { return _stats; }

private:

    void enter(cellgc::Phase p);
    void clear_marks();
    std::size_t mark_pass();
    std::size_t sweep_pass();
    std::size_t trace(std::size_t root);

    heap& _heap;
    cellgc::Phase _phase;
    gc_stats _stats;
    std::vector<bool> _visited; // used while marking
    std::deque<std::size_t> _work;
};

cellgc::cellgc(heap& h) : _impl(new gcimpl(h)) {
}
cellgc::~cellgc() {
    delete _impl;
}
gc_stats cellgc::collect() { return _impl->collect(); }
std::size_t cellgc::mark() { return _impl->mark(); }
std::size_t cellgc::sweep() { return _impl->sweep(); }
cellgc::Phase cellgc::phase() const { return _impl->phase(); }
const gc_stats& cellgc::stats() const { return _impl->stats(); }

namespace {
    const char* phase_name(cellgc::Phase p) {
        switch (p) {
        case cellgc::Idle: return "idle";
        case cellgc::Marking: return "marking";
        case cellgc::Sweeping: return "sweeping";
        }
        return "?";
    }
}

gcimpl::gcimpl(heap& h) : _heap(h), _phase(cellgc::Idle), _stats(), _visited(), _work() {
}

void gcimpl::enter(cellgc::Phase p) {
    print::debug("gc: %s -> %s", phase_name(_phase), phase_name(p));
    _phase = p;
}

gc_stats gcimpl::collect() {
    //print::debug("gc: heap(%lu), roots(%lu)", _heap.size(), _heap.roots().size());
    enter(cellgc::Marking);
    const std::size_t marked = mark_pass();
    enter(cellgc::Sweeping);
    const std::size_t reclaimed = sweep_pass();
    enter(cellgc::Idle);

    _stats.marked = marked;
    _stats.reclaimed = reclaimed;
    ++_stats.collections;

    print::info("gc: %lu live, %lu reclaimed (collection %lu)",
                marked, reclaimed, _stats.collections);
    return _stats;
}

// mark bits are only meaningful relative to the latest pass, so
// everything but the roots starts unmarked
void gcimpl::clear_marks() {
    std::for_each(_heap._cells.begin(), _heap._cells.end(), [](cell& c) {
            if (c.root())
                c.flags |= cell::GcMark;
            else
                c.flags &= ~cell::GcMark;
        });
}

std::size_t gcimpl::mark() {
    enter(cellgc::Marking);
    const std::size_t marked = mark_pass();
    enter(cellgc::Idle);
    return marked;
}

std::size_t gcimpl::sweep() {
    enter(cellgc::Sweeping);
    const std::size_t reclaimed = sweep_pass();
    enter(cellgc::Idle);
    return reclaimed;
}

std::size_t gcimpl::mark_pass() {
    clear_marks();

    std::vector<cell>& cells = _heap._cells;
    _visited.assign(cells.size(), false);
    _work.clear();

    std::size_t marked = 0;
    for (std::size_t i = 0; i < cells.size(); ++i) {
        if (cells[i].root())
            marked += trace(i);
    }

    _work.clear();
    return marked;
}

// breadth-first over outgoing edges from one root. each index is queued
// at most once per pass, which is what makes cycles terminate. returns
// the number of cells newly marked.
std::size_t gcimpl::trace(std::size_t root) {
    std::vector<cell>& cells = _heap._cells;
    std::size_t marked = 0;

    if (!_visited[root]) {
        _visited[root] = true;
        ++marked;
    }
    // a root that references nothing keeps only itself alive
    if (cells[root].outgoing.empty())
        return marked;

    for (std::size_t n : cells[root].outgoing) {
        if (!_visited[n]) {
            _visited[n] = true;
            _work.push_back(n);
        }
    }

    while (!_work.empty()) {
        const std::size_t i = _work.front();
        _work.pop_front();

        cell& c = cells[i];
        c.flags |= cell::GcMark;
        ++marked;

        for (std::size_t n : c.outgoing) {
            if (!_visited[n]) {
                _visited[n] = true;
                _work.push_back(n);
            }
        }
    }
    return marked;
}

std::size_t gcimpl::sweep_pass() {
    std::vector<cell>& cells = _heap._cells;
    std::size_t reclaimed = 0;
    for (std::size_t i = 0; i < cells.size(); ++i) {
        // free cells are already in the default state
        if (!cells[i].marked() && cells[i].occupied()) {
            _heap.free(i);
            ++reclaimed;
        }
    }
    return reclaimed;
}
