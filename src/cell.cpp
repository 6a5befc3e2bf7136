#include "cell.hpp"
#include "join.hpp"

#include <algorithm>

namespace {
    bool contains(const std::vector<std::size_t>& v, std::size_t i) {
        return std::find(v.begin(), v.end(), i) != v.end();
    }

    bool insert(std::vector<std::size_t>& v, std::size_t i) {
        if (contains(v, i))
            return false;
        v.push_back(i);
        return true;
    }

    bool erase(std::vector<std::size_t>& v, std::size_t i) {
        auto it = std::find(v.begin(), v.end(), i);
        if (it == v.end())
            return false;
        v.erase(it);
        return true;
    }
}

bool cell::references(std::size_t i) const {
    return contains(outgoing, i);
}

bool cell::referenced_by(std::size_t i) const {
    return contains(incoming, i);
}

bool cell::add_outgoing(std::size_t i) {
    return insert(outgoing, i);
}

bool cell::add_incoming(std::size_t i) {
    return insert(incoming, i);
}

bool cell::remove_outgoing(std::size_t i) {
    return erase(outgoing, i);
}

bool cell::remove_incoming(std::size_t i) {
    return erase(incoming, i);
}

void cell::reset() {
    value = boost::none;
    outgoing.clear();
    incoming.clear();
    refs = 0;
    flags = 0;
}

std::ostream& operator<<(std::ostream& s, const cell& c) {
    if (!c.occupied())
        return s << "(free)";

    s << "(";
    if (c.value)
        s << *c.value;
    else
        s << "nil";
    s << " refs=" << c.refs
      << " out=[" << util::join(c.outgoing) << "]"
      << " in=[" << util::join(c.incoming) << "]";
    if (c.root())
        s << " root";
    if (c.marked())
        s << " marked";
    return s << ")";
}
