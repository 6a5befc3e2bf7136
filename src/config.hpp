#pragma once

#include "print.hpp"

#include <boost/optional.hpp>
#include <cstddef>
#include <stdexcept>
#include <string>

struct config_error : public std::runtime_error {
    explicit config_error(const std::string& msg) : std::runtime_error(msg) {}
};

struct config {
    config();

    std::size_t cells;               // heap capacity
    boost::optional<unsigned> seed;  // demo generator seed; time based if unset
    print::level verbosity;
    std::string script;              // command file run before the prompt
    bool help;
};

// vheap [-n cells] [-s seed] [-q] [-v] [-f file] [-h]
config parse_args(int argc, const char* const argv[]);

const char* usage();
