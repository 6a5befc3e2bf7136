#pragma once

#include "cell.hpp"

#include <boost/optional.hpp>
#include <boost/variant.hpp>
#include <cstddef>
#include <initializer_list>
#include <iostream>
#include <vector>

struct gcimpl;

// recoverable failures of heap operations; these are returned, never thrown
struct alloc_error {
    enum Kind { Occupied, NoFreeMemory, DataIsFree };

    explicit alloc_error(Kind k) : kind(k) {}

    const char* what() const;

    bool operator==(const alloc_error& e) const { return kind == e.kind; }
    bool operator!=(const alloc_error& e) const { return kind != e.kind; }

    Kind kind;
};

std::ostream& operator<<(std::ostream& s, const alloc_error& e);

// index of the allocated cell, or why allocation failed
typedef boost::variant<std::size_t, alloc_error> index_result;
// empty on success
typedef boost::optional<alloc_error> link_result;

inline const std::size_t* allocated(const index_result& r) {
    return boost::get<std::size_t>(&r);
}

inline const alloc_error* failed(const index_result& r) {
    return boost::get<alloc_error>(&r);
}

// read-only view of one cell, for display
struct cell_info {
    std::size_t index;
    boost::optional<int> value;
    bool occupied;
    bool free;
    bool root;
    int refs;
    bool has_outgoing;
    bool has_incoming;
    bool marked;
};

// fixed-size virtual heap. cells are addressed by index, and an index
// names the same slot for the lifetime of the heap.
//
// passing an index >= size() to any operation taking one is a caller
// error and throws std::out_of_range before anything is touched.
struct heap {
    typedef boost::optional<std::size_t> target;

    explicit heap(std::size_t capacity);

    std::size_t size() const;
    const cell& at(std::size_t i) const;

    // first-fit allocation. a target, if given, is linked from the new
    // cell and must already be occupied.
    index_result alloc(int value, target ref = target());
    // allocation at a fixed position; fails with Occupied rather than
    // overwriting a live cell
    index_result alloc_at(int value, target ref, std::size_t pos);
    // resets the cell and removes it from its neighbours' index lists
    void free(std::size_t i);
    link_result store(std::size_t i, int value);

    link_result viable(std::initializer_list<std::size_t> indices) const;
    link_result viable(const std::vector<std::size_t>& indices) const;
    // from references to; linking an existing edge changes nothing
    link_result link(std::size_t from, std::size_t to);
    link_result unlink(std::size_t from, std::size_t to);

    // roots a and b, or 0 and 1 if either is out of bounds
    void set_roots(std::size_t a, std::size_t b);
    void unroot_all();
    std::vector<std::size_t> roots() const;

    std::vector<cell_info> snapshot() const;

private:
    friend struct gcimpl;

    void check(std::size_t i) const;
    index_result install(int value, target ref, std::size_t pos);
    void connect(std::size_t from, std::size_t to);
    bool root(std::size_t i);

    std::vector<cell> _cells;
};
