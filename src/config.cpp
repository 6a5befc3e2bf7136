#include "config.hpp"

#include <boost/lexical_cast.hpp>

namespace {
    const std::size_t DefaultCells = 20;

    template <typename T>
    T numeric_arg(int argc, const char* const argv[], int& i) {
        const std::string flag = argv[i];
        if (++i >= argc)
            throw config_error("missing value for " + flag);
        const std::string text = argv[i];
        if (!text.empty() && text[0] == '-')
            throw config_error("bad value for " + flag + ": " + text);
        try {
            return boost::lexical_cast<T>(text);
        }
        catch (boost::bad_lexical_cast&) {
            throw config_error("bad value for " + flag + ": " + text);
        }
    }
}

config::config()
    : cells(DefaultCells),
      seed(),
      verbosity(print::Info),
      script(),
      help(false) {
}

config parse_args(int argc, const char* const argv[]) {
    config c;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-n") {
            c.cells = numeric_arg<std::size_t>(argc, argv, i);
            if (c.cells == 0)
                throw config_error("heap needs at least one cell");
        }
        else if (arg == "-s") {
            c.seed = numeric_arg<unsigned>(argc, argv, i);
        }
        else if (arg == "-q") {
            if (c.verbosity > print::Quiet)
                c.verbosity = print::level(c.verbosity - 1);
        }
        else if (arg == "-v") {
            if (c.verbosity < print::Debug)
                c.verbosity = print::level(c.verbosity + 1);
        }
        else if (arg == "-f") {
            if (++i >= argc)
                throw config_error("missing value for -f");
            c.script = argv[i];
        }
        else if (arg == "-h" || arg == "--help") {
            c.help = true;
        }
        else {
            throw config_error("unknown option: " + arg);
        }
    }
    return c;
}

const char* usage() {
    return
        "usage: vheap [-n cells] [-s seed] [-q] [-v] [-f file] [-h]\n"
        "  -n cells   heap capacity (default 20)\n"
        "  -s seed    seed for --populate and --arb_ref\n"
        "  -q, -v     less / more logging (repeatable)\n"
        "  -f file    run the commands in file before prompting\n"
        "  -h         this text\n";
}
