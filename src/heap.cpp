#include "heap.hpp"
#include "print.hpp"

#include <stdexcept>
#include <sstream>

const char* alloc_error::what() const {
    switch (kind) {
    case Occupied: return "Space is occupied";
    case NoFreeMemory: return "No free memory available";
    case DataIsFree: return "The memory was free, not suitable for use";
    }
    return "unknown allocation error";
}

std::ostream& operator<<(std::ostream& s, const alloc_error& e) {
    return s << e.what();
}

heap::heap(std::size_t capacity) : _cells(capacity) {
}

std::size_t heap::size() const {
    return _cells.size();
}

const cell& heap::at(std::size_t i) const {
    check(i);
    return _cells[i];
}

void heap::check(std::size_t i) const {
    if (i >= _cells.size()) {
        std::stringstream ss;
        ss << "cell index " << i << " out of range (heap has " << _cells.size() << " cells)";
        throw std::out_of_range(ss.str());
    }
}

index_result heap::alloc(int value, target ref) {
    for (std::size_t i = 0; i < _cells.size(); ++i) {
        if (!_cells[i].occupied())
            return install(value, ref, i);
    }
    print::debug("alloc of %ld: no free cell among %lu", value, _cells.size());
    return alloc_error(alloc_error::NoFreeMemory);
}

index_result heap::alloc_at(int value, target ref, std::size_t pos) {
    check(pos);
    if (_cells[pos].occupied()) {
        print::debug("alloc of %ld: cell %lu is occupied", value, pos);
        return alloc_error(alloc_error::Occupied);
    }
    return install(value, ref, pos);
}

// pos is known to be free. the target is validated before the cell is
// written so a failed allocation leaves the heap untouched.
index_result heap::install(int value, target ref, std::size_t pos) {
    if (ref) {
        check(*ref);
        if (*ref != pos && !_cells[*ref].occupied()) {
            print::debug("alloc of %ld: target cell %lu is free", value, *ref);
            return alloc_error(alloc_error::DataIsFree);
        }
    }

    cell& c = _cells[pos];
    c.reset();
    c.value = value;
    c.flags = cell::Occupied;
    if (ref)
        connect(pos, *ref);
    return pos;
}

void heap::free(std::size_t i) {
    check(i);
    cell& c = _cells[i];

    for (std::size_t t : c.outgoing) {
        if (t == i)
            continue;
        cell& o = _cells[t];
        if (o.remove_incoming(i) && o.refs > 0)
            --o.refs;
    }
    for (std::size_t s : c.incoming) {
        if (s == i)
            continue;
        cell& o = _cells[s];
        if (o.remove_outgoing(i) && o.refs > 0)
            --o.refs;
    }
    c.reset();

    print::info("cell %lu was freed, and is now ready for use again", i);
}

link_result heap::store(std::size_t i, int value) {
    check(i);
    if (!_cells[i].occupied())
        return alloc_error(alloc_error::DataIsFree);
    _cells[i].value = value;
    return link_result();
}

link_result heap::viable(std::initializer_list<std::size_t> indices) const {
    return viable(std::vector<std::size_t>(indices));
}

link_result heap::viable(const std::vector<std::size_t>& indices) const {
    for (std::size_t i : indices)
        check(i);
    for (std::size_t i : indices) {
        if (!_cells[i].occupied())
            return alloc_error(alloc_error::DataIsFree);
    }
    return link_result();
}

link_result heap::link(std::size_t from, std::size_t to) {
    link_result r = viable({from, to});
    if (r) {
        print::debug("link %lu -> %lu: %s", from, to, std::string(r->what()));
        return r;
    }
    connect(from, to);
    return link_result();
}

void heap::connect(std::size_t from, std::size_t to) {
    cell& a = _cells[from];
    if (!a.add_outgoing(to))
        return;
    ++a.refs;

    cell& b = _cells[to];
    b.add_incoming(from);
    ++b.refs;
}

link_result heap::unlink(std::size_t from, std::size_t to) {
    link_result r = viable({from, to});
    if (r)
        return r;

    cell& a = _cells[from];
    if (!a.remove_outgoing(to))
        return link_result();
    --a.refs;

    cell& b = _cells[to];
    b.remove_incoming(from);
    --b.refs;
    return link_result();
}

bool heap::root(std::size_t i) {
    if (i >= _cells.size())
        return false;
    _cells[i].flags |= cell::Root | cell::Occupied | cell::GcMark;
    return true;
}

void heap::set_roots(std::size_t a, std::size_t b) {
    if (a >= _cells.size() || b >= _cells.size()) {
        print::warn("one value was out of bounds, using defaults...");
        a = 0;
        b = 1;
    }
    if (root(a))
        print::info("cell %lu is now a root", a);
    if (b != a && root(b))
        print::info("cell %lu is now a root", b);
}

void heap::unroot_all() {
    for (std::size_t i = 0; i < _cells.size(); ++i) {
        if (_cells[i].root()) {
            _cells[i].flags &= ~cell::Root;
            print::info("cell %lu unrooted", i);
        }
    }
}

std::vector<std::size_t> heap::roots() const {
    std::vector<std::size_t> r;
    for (std::size_t i = 0; i < _cells.size(); ++i) {
        if (_cells[i].root())
            r.push_back(i);
    }
    return r;
}

std::vector<cell_info> heap::snapshot() const {
    std::vector<cell_info> v;
    v.reserve(_cells.size());
    for (std::size_t i = 0; i < _cells.size(); ++i) {
        const cell& c = _cells[i];
        cell_info ci;
        ci.index = i;
        ci.value = c.value;
        ci.occupied = c.occupied();
        ci.free = !c.occupied();
        ci.root = c.root();
        ci.refs = c.refs;
        ci.has_outgoing = !c.outgoing.empty();
        ci.has_incoming = !c.incoming.empty();
        ci.marked = c.marked();
        v.push_back(ci);
    }
    return v;
}
