// interactive front end for the virtual heap.
// reads one command per line, see --help.

#include "heap.hpp"
#include "cellgc.hpp"
#include "command.hpp"
#include "config.hpp"
#include "demo.hpp"
#include "print.hpp"

#include <boost/exception/diagnostic_information.hpp>
#include <boost/variant/get.hpp>
#include <ctime>
#include <fstream>
#include <iostream>

using namespace std;

namespace {

    // false if the input stream failed (as opposed to running out)
    bool repl(istream& in, session& s, bool prompt) {
        token_stream tokens(in);
        while (s.running) {
            if (prompt)
                cout << ">>> " << flush;
            try {
                boost::optional<command> cmd = read_command(tokens, s.cells.size());
                if (!cmd)
                    break;
                run(s, *cmd);
            }
            catch (token_error& e) {
                print::error("%s", e.what());
                return false;
            }
            catch (boost::bad_get& e) {
                print::error("type mismatch: %s", boost::diagnostic_information(e));
            }
            catch (boost::exception& e) {
                print::error("%s", boost::diagnostic_information(e));
            }
            catch (std::exception& e) {
                print::error("%s", e.what());
            }
        }
        return !in.bad();
    }

}

int main(int argc, char* argv[]) {
    config conf;
    try {
        conf = parse_args(argc, argv);
    }
    catch (config_error& e) {
        print::error("%s", e.what());
        cerr << usage();
        return 2;
    }
    if (conf.help) {
        cout << usage();
        return 0;
    }
    print::verbosity() = conf.verbosity;

    heap cells(conf.cells);
    cellgc gc(cells);
    demo gen(conf.seed ? *conf.seed : (unsigned)time(0));
    session s(cells, gc, gen, cout);

    if (!conf.script.empty()) {
        ifstream f(conf.script.c_str());
        if (!f) {
            print::error("file not found: %s", conf.script);
            return 1;
        }
        if (!repl(f, s, false)) {
            print::error("unable to read %s", conf.script);
            return 1;
        }
    }

    if (!s.running)
        return 0;

    cout << "GCed virtual heap demonstration\n"
         << "1. Run --help to see a list of commands." << endl;
    if (!repl(cin, s, true)) {
        print::error("unable to read stdin");
        return 1;
    }
    return 0;
}
