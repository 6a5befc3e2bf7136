#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>

#include "command.hpp"
#include "cellgc.hpp"
#include "demo.hpp"
#include "heap.hpp"
#include "checks.hpp"

using namespace std;

namespace {
    vector<string> words(const char* line) {
        istringstream in(line);
        vector<string> v;
        string w;
        while (in >> w)
            v.push_back(w);
        return v;
    }

    template <typename T>
    T as(const command& c) {
        const T* t = boost::get<T>(&c);
        if (!t)
            throw std::logic_error("parsed to a different command");
        return *t;
    }

    // runs every line of text against s, stopping at --exit
    void script(session& s, const char* text) {
        istringstream in(text);
        token_stream tokens(in);
        while (s.running) {
            boost::optional<command> cmd = read_command(tokens, s.cells.size());
            if (!cmd)
                break;
            run(s, *cmd);
        }
    }

    struct CommandTests : public ::testing::Test {
        CommandTests() : h(5), gc(h), gen(1), s(h, gc, gen, out) {}

        heap h;
        cellgc gc;
        demo gen;
        ostringstream out;
        session s;
    };
}

TEST(CommandParseTests, IndexDefaults) {
    const root_cmd& r = as<root_cmd>(parse_command(words("--root"), 20));
    EXPECT_EQ(r.a, 0u);
    EXPECT_EQ(r.b, 19u);

    const root_cmd& r2 = as<root_cmd>(parse_command(words("--root 3"), 20));
    EXPECT_EQ(r2.a, 3u);
    EXPECT_EQ(r2.b, 19u);

    const link_cmd& l = as<link_cmd>(parse_command(words("--link_ref 4 2"), 20));
    EXPECT_EQ(l.from, 4u);
    EXPECT_EQ(l.to, 2u);
}

TEST(CommandParseTests, BadIndicesFallBack) {
    const root_cmd& r = as<root_cmd>(parse_command(words("--root x -2"), 10));
    EXPECT_EQ(r.a, 0u);
    EXPECT_EQ(r.b, 9u);

    const arb_ref_cmd& a = as<arb_ref_cmd>(parse_command(words("--arb_ref lots"), 10));
    EXPECT_EQ(a.times, 0u);
}

TEST(CommandParseTests, AllocForms) {
    const alloc_at_cmd& a = as<alloc_at_cmd>(parse_command(words("--alloc_at 3"), 10));
    EXPECT_EQ(a.pos, 3u);
    EXPECT_FALSE(a.value);

    const alloc_at_cmd& b = as<alloc_at_cmd>(parse_command(words("--alloc_at 3 -7"), 10));
    ASSERT_TRUE(bool(b.value));
    EXPECT_EQ(*b.value, -7);

    const alloc_cmd& c = as<alloc_cmd>(parse_command(words("--alloc 12 4"), 10));
    ASSERT_TRUE(bool(c.value));
    EXPECT_EQ(*c.value, 12);
    ASSERT_TRUE(bool(c.target));
    EXPECT_EQ(*c.target, 4u);

    const alloc_cmd& d = as<alloc_cmd>(parse_command(words("--alloc"), 10));
    EXPECT_FALSE(d.value);
    EXPECT_FALSE(d.target);
}

TEST(CommandParseTests, EveryWord) {
    EXPECT_NO_THROW(as<help_cmd>(parse_command(words("--help"), 5)));
    EXPECT_NO_THROW(as<unroot_cmd>(parse_command(words("--unroot"), 5)));
    EXPECT_NO_THROW(as<free_cmd>(parse_command(words("--free 1"), 5)));
    EXPECT_NO_THROW(as<state_cmd>(parse_command(words("--state"), 5)));
    EXPECT_NO_THROW(as<populate_cmd>(parse_command(words("--populate"), 5)));
    EXPECT_NO_THROW(as<gc_cmd>(parse_command(words("--gc"), 5)));
    EXPECT_NO_THROW(as<exit_cmd>(parse_command(words("--exit"), 5)));
    EXPECT_EQ(as<unknown_cmd>(parse_command(words("--frob 1"), 5)).word, "--frob");
}

TEST(CommandParseTests, ReadSkipsBlankLines) {
    istringstream in("\n\n  # nothing\n--gc\n\n--state");
    token_stream tokens(in);

    boost::optional<command> a = read_command(tokens, 5);
    ASSERT_TRUE(bool(a));
    EXPECT_NO_THROW(as<gc_cmd>(*a));
    boost::optional<command> b = read_command(tokens, 5);
    ASSERT_TRUE(bool(b));
    EXPECT_NO_THROW(as<state_cmd>(*b));
    EXPECT_FALSE(read_command(tokens, 5));
}

TEST_F(CommandTests, EndToEndScript) {
    script(s,
           "--root 0 1\n"
           "--alloc_at 2 9\n"
           "--link_ref 0 2\n"
           "--link_ref 3 4\n"
           "--gc\n");

    const string o = out.str();
    EXPECT_NE(o.find("Cell at position 2 was used"), string::npos);
    EXPECT_NE(o.find("Cell 0 now references cell 2"), string::npos);
    EXPECT_NE(o.find("The memory was free, not suitable for use"), string::npos);
    EXPECT_NE(o.find("Collection 1: 3 live, 0 reclaimed"), string::npos);

    EXPECT_TRUE(h.at(2).occupied());
    EXPECT_EQ(*h.at(2).value, 9);
    EXPECT_TRUE(is_default(h.at(3)));
    EXPECT_TRUE(is_default(h.at(4)));
    EXPECT_TRUE(s.running);
}

TEST_F(CommandTests, PopulateThenCollect) {
    script(s,
           "--root 0 1\n"
           "--populate\n"
           "--link_ref 1 4\n"
           "--gc\n");

    EXPECT_NE(out.str().find("Cell 2 has been populated"), string::npos);
    EXPECT_TRUE(is_default(h.at(2)));
    EXPECT_TRUE(is_default(h.at(3)));
    EXPECT_TRUE(h.at(4).occupied());
    EXPECT_TRUE(consistent(h));
}

TEST_F(CommandTests, AllocationFailuresAreReported) {
    script(s,
           "--alloc_at 1 5\n"
           "--alloc_at 1 6\n"
           "--alloc 1 3\n");
    const string o = out.str();
    EXPECT_NE(o.find("Space is occupied"), string::npos);
    EXPECT_NE(o.find("The memory was free, not suitable for use"), string::npos);
    EXPECT_EQ(*h.at(1).value, 5);
}

TEST_F(CommandTests, FullHeapReported) {
    script(s, "--populate\n--alloc 3\n");
    EXPECT_NE(out.str().find("No free memory available"), string::npos);
}

TEST_F(CommandTests, ExitStopsTheScript) {
    script(s, "--exit\n--alloc_at 0 1\n");
    EXPECT_FALSE(s.running);
    EXPECT_NE(out.str().find("Exiting"), string::npos);
    EXPECT_TRUE(is_default(h.at(0)));
}

TEST_F(CommandTests, FreeAndUnroot) {
    script(s,
           "--root 0 1\n"
           "--alloc 7 0\n"
           "--unroot\n"
           "--free 2\n");
    EXPECT_TRUE(h.roots().empty());
    EXPECT_TRUE(is_default(h.at(2)));
    EXPECT_TRUE(h.at(0).incoming.empty());
}

TEST_F(CommandTests, ArbRef) {
    script(s, "--root 0 1\n--arb_ref 2\n");
    EXPECT_TRUE(h.at(2).occupied());
    EXPECT_TRUE(h.at(3).occupied());
    EXPECT_FALSE(h.at(4).occupied());
    EXPECT_TRUE(consistent(h));
}

TEST_F(CommandTests, StateDump) {
    script(s, "--root 0 1\n--alloc_at 2 9\n--link_ref 0 2\n--state\n");
    const string o = out.str();
    EXPECT_NE(o.find("Cell |0|:"), string::npos);
    EXPECT_NE(o.find("Cell |4|:"), string::npos);
    EXPECT_NE(o.find("1. Has data?: true (9)"), string::npos);
    EXPECT_NE(o.find("5. Ref Other?: true [2]"), string::npos);
    EXPECT_NE(o.find("6. Ref By?: true [0]"), string::npos);
    EXPECT_NE(o.find("7. MARKED: true"), string::npos);
}

TEST_F(CommandTests, HelpAndUnknown) {
    script(s, "--help\nfrobnicate\n");
    const string o = out.str();
    EXPECT_NE(o.find("--link_ref"), string::npos);
    EXPECT_NE(o.find("Unknown command. Type --help for assistance."), string::npos);
}

TEST_F(CommandTests, BadIndexThrowsOutOfRange) {
    istringstream in("--free 9\n");
    token_stream tokens(in);
    boost::optional<command> cmd = read_command(tokens, h.size());
    ASSERT_TRUE(bool(cmd));
    EXPECT_THROW(run(s, *cmd), std::out_of_range);
}
