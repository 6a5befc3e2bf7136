#pragma once

#include "tokens.hpp"

#include <boost/optional.hpp>
#include <boost/variant.hpp>
#include <cstddef>
#include <iostream>
#include <string>
#include <vector>

struct heap;
struct cellgc;
struct demo;

// one alternative per command word
struct help_cmd {};
struct root_cmd { std::size_t a, b; };
struct unroot_cmd {};
struct arb_ref_cmd { std::size_t times; };
struct link_cmd { std::size_t from, to; };
struct alloc_at_cmd { std::size_t pos; boost::optional<int> value; };
struct alloc_cmd { boost::optional<int> value; boost::optional<std::size_t> target; };
struct free_cmd { std::size_t index; };
struct state_cmd {};
struct populate_cmd {};
struct gc_cmd {};
struct exit_cmd {};
struct unknown_cmd { std::string word; };

typedef boost::variant<help_cmd,
                       root_cmd,
                       unroot_cmd,
                       arb_ref_cmd,
                       link_cmd,
                       alloc_at_cmd,
                       alloc_cmd,
                       free_cmd,
                       state_cmd,
                       populate_cmd,
                       gc_cmd,
                       exit_cmd,
                       unknown_cmd> command;

// words of one line -> command. cells is the heap size, used for the
// default of a missing second index. unparsable indices fall back to
// their defaults with a warning.
command parse_command(const std::vector<std::string>& words, std::size_t cells);

// next non-empty line of s, or none at end of input
boost::optional<command> read_command(token_stream& s, std::size_t cells);

// everything a command can touch
struct session {
    session(heap& h, cellgc& g, demo& d, std::ostream& o);

    heap& cells;
    cellgc& gc;
    demo& gen;
    std::ostream& out;
    bool running;
};

// applies cmd to s; returns false once the session has been asked to stop
bool run(session& s, const command& cmd);

void print_help(std::ostream& out);
void print_state(std::ostream& out, const heap& h);
