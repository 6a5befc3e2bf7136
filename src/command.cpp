#include "command.hpp"
#include "heap.hpp"
#include "cellgc.hpp"
#include "demo.hpp"
#include "join.hpp"
#include "print.hpp"

#include <boost/variant/apply_visitor.hpp>
#include <boost/variant/static_visitor.hpp>
#include <boost/lexical_cast.hpp>
#include <cctype>

using namespace std;
using boost::optional;

namespace {

    bool parse_index(const string& w, size_t& out) {
        if (w.empty() || !isdigit((unsigned char)w[0]))
            return false;
        try {
            out = boost::lexical_cast<size_t>(w);
            return true;
        }
        catch (boost::bad_lexical_cast&) {
            return false;
        }
    }

    bool parse_value(const string& w, int& out) {
        try {
            out = boost::lexical_cast<int>(w);
            return true;
        }
        catch (boost::bad_lexical_cast&) {
            return false;
        }
    }

    // word n of the line as a cell index, or def
    size_t index_arg(const vector<string>& words, size_t n, size_t def) {
        if (words.size() <= n)
            return def;
        size_t i;
        if (parse_index(words[n], i))
            return i;
        print::warn("could not parse '%s' as a number, using default: %lu", words[n], def);
        return def;
    }

    optional<size_t> optional_index_arg(const vector<string>& words, size_t n) {
        size_t i;
        if (words.size() > n && parse_index(words[n], i))
            return i;
        if (words.size() > n)
            print::warn("could not parse '%s' as a cell index, ignoring it", words[n]);
        return optional<size_t>();
    }

    optional<int> value_arg(const vector<string>& words, size_t n) {
        int v;
        if (words.size() > n && parse_value(words[n], v))
            return v;
        if (words.size() > n)
            print::warn("could not parse '%s' as a value, using a random one", words[n]);
        return optional<int>();
    }

    const char* const help_text =
        "\nAvailable Commands:\n"
        "    1. --root <cell> <cell>        make two cells the roots\n"
        "    2. --unroot                    unroot all cells\n"
        "    3. --arb_ref <times>           allocate cells referencing a root\n"
        "    4. --link_ref <cell> <cell>    first cell references the second\n"
        "    5. --alloc_at <cell> [value]   allocate at a position\n"
        "    6. --alloc [value] [cell]      allocate in the first free cell\n"
        "    7. --free <cell>               free a cell\n"
        "    8. --state                     show every cell\n"
        "    9. --populate                  fill free cells with garbage\n"
        "   10. --gc                        run the collector (mark & sweep)\n"
        "   11. --exit\n";

    struct dispatcher : public boost::static_visitor<void> {
        explicit dispatcher(session& s) : _s(s) {}

        void report(const index_result& r) const {
            if (const size_t* i = allocated(r))
                _s.out << "Cell at position " << *i << " was used\n";
            else
                _s.out << failed(r)->what() << "\n";
        }

        void operator()(const help_cmd&) const {
            print_help(_s.out);
        }
        void operator()(const root_cmd& c) const {
            _s.cells.set_roots(c.a, c.b);
        }
        void operator()(const unroot_cmd&) const {
            _s.cells.unroot_all();
        }
        void operator()(const arb_ref_cmd& c) const {
            for (const index_result& r : _s.gen.arb_ref(_s.cells, c.times))
                report(r);
            _s.out << "\n";
        }
        void operator()(const link_cmd& c) const {
            link_result r = _s.cells.link(c.from, c.to);
            if (r)
                _s.out << r->what() << "\n";
            else
                _s.out << "Cell " << c.from << " now references cell " << c.to << "\n";
        }
        void operator()(const alloc_at_cmd& c) const {
            const int v = c.value ? *c.value : _s.gen.value(0, 50);
            report(_s.cells.alloc_at(v, heap::target(), c.pos));
        }
        void operator()(const alloc_cmd& c) const {
            const int v = c.value ? *c.value : _s.gen.value(0, 50);
            report(_s.cells.alloc(v, c.target));
        }
        void operator()(const free_cmd& c) const {
            _s.cells.free(c.index);
        }
        void operator()(const state_cmd&) const {
            print_state(_s.out, _s.cells);
        }
        void operator()(const populate_cmd&) const {
            for (size_t i : _s.gen.populate(_s.cells))
                _s.out << "Cell " << i << " has been populated\n";
            _s.out << "\n";
        }
        void operator()(const gc_cmd&) const {
            const gc_stats st = _s.gc.collect();
            _s.out << "Collection " << st.collections << ": "
                   << st.marked << " live, "
                   << st.reclaimed << " reclaimed\n";
        }
        void operator()(const exit_cmd&) const {
            _s.out << "Exiting\n";
            _s.running = false;
        }
        void operator()(const unknown_cmd&) const {
            _s.out << "Unknown command. Type --help for assistance.\n";
        }

        session& _s;
    };
}

command parse_command(const vector<string>& words, size_t cells) {
    if (words.empty())
        return unknown_cmd();

    const string& w = words.front();
    const size_t last = cells ? cells - 1 : 0;

    if (w == "--help")
        return help_cmd();
    if (w == "--root") {
        root_cmd c = { index_arg(words, 1, 0), index_arg(words, 2, last) };
        return c;
    }
    if (w == "--unroot")
        return unroot_cmd();
    if (w == "--arb_ref") {
        arb_ref_cmd c = { index_arg(words, 1, 0) };
        return c;
    }
    if (w == "--link_ref") {
        link_cmd c = { index_arg(words, 1, 0), index_arg(words, 2, last) };
        return c;
    }
    if (w == "--alloc_at") {
        alloc_at_cmd c = { index_arg(words, 1, 0), value_arg(words, 2) };
        return c;
    }
    if (w == "--alloc") {
        alloc_cmd c = { value_arg(words, 1), optional_index_arg(words, 2) };
        return c;
    }
    if (w == "--free") {
        free_cmd c = { index_arg(words, 1, 0) };
        return c;
    }
    if (w == "--state")
        return state_cmd();
    if (w == "--populate")
        return populate_cmd();
    if (w == "--gc")
        return gc_cmd();
    if (w == "--exit")
        return exit_cmd();

    unknown_cmd c = { w };
    return c;
}

optional<command> read_command(token_stream& s, size_t cells) {
    vector<string> words;
    while (true) {
        const token_stream::Token t = s.next();
        if (t == token_stream::Eof) {
            if (words.empty())
                return optional<command>();
            break;
        }
        if (t == token_stream::Newline) {
            if (words.empty())
                continue;
            break;
        }
        words.push_back(s.text);
    }
    return optional<command>(parse_command(words, cells));
}

session::session(heap& h, cellgc& g, demo& d, ostream& o)
    : cells(h), gc(g), gen(d), out(o), running(true) {
}

bool run(session& s, const command& cmd) {
    boost::apply_visitor(dispatcher(s), cmd);
    return s.running;
}

void print_help(ostream& out) {
    out << help_text << endl;
}

void print_state(ostream& out, const heap& h) {
    for (const cell_info& c : h.snapshot()) {
        const cell& raw = h.at(c.index);
        out << "Cell |" << c.index << "|:\n"
            << "    1. Has data?: " << boolalpha << bool(c.value);
        if (c.value)
            out << " (" << *c.value << ")";
        out << "\n"
            << "    2. Is free?: " << c.free << "\n"
            << "    3. Is root?: " << c.root << "\n"
            << "    4. Ref amt: " << c.refs << "\n"
            << "    5. Ref Other?: " << c.has_outgoing;
        if (c.has_outgoing)
            out << " [" << util::join(raw.outgoing) << "]";
        out << "\n"
            << "    6. Ref By?: " << c.has_incoming;
        if (c.has_incoming)
            out << " [" << util::join(raw.incoming) << "]";
        out << "\n"
            << "    7. MARKED: " << c.marked << noboolalpha << "\n";
    }
}
