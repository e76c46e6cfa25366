#include "tests.h"

void test_seq(testing &t) {
    pcomb_builder p;
    auto parser = p.seq({"hello", "world"});

    t.test("matches sequence", [&](testing &t) {
        pcomb_state ps;
        auto node = run_parser("hello world", parser, ps);
        t.assert_equal("children", tokens({"hello", "world"}), child_tokens(node));
        t.assert_equal("leftover", std::string(""), leftover(ps));
        t.assert_equal("token", std::string("hello world"), node.token);
    });

    t.test("returns errors", [&](testing &t) {
        pcomb_state ps;
        run_parser("hello there", parser, ps);
        t.assert_equal("expected", std::string("world"), ps.error.expected);
        t.assert_equal("error pos", 6, (int) ps.error.pos);
        t.assert_equal("pos", 0, (int) ps.pos);
    });

    t.test("token matches packed input", [&](testing &t) {
        pcomb_state ps;
        auto node = run_parser("helloworld", parser, ps);
        t.assert_equal("token", std::string("helloworld"), node.token);
    });

    t.test("nested sequence reconstructs input", [&](testing &t) {
        auto nested = p.seq({p.seq({"a", "b"}), "c", p.seq({"d", "e"})});

        pcomb_state ps;
        auto node = run_parser("a b c d e", nested, ps);
        t.assert_equal("token", std::string("a b c d e"), node.token);
        t.assert_equal("top level children", 3, (int) node.children.size());
        t.assert_equal("first child", tokens({"a", "b"}), child_tokens(node.children[0]));
    });

    t.test("sequence with optional part", [&](testing &t) {
        auto twas = p.seq({p.maybe("twas"), "brillig"});

        t.test("with maybe part", [&](testing &t) {
            pcomb_state ps;
            auto node = run_parser("twas brillig", twas, ps);
            t.assert_equal("children", tokens({"twas", "brillig"}), child_tokens(node));
            t.assert_equal("leftover", std::string(""), leftover(ps));
            t.assert_equal("token", std::string("twas brillig"), node.token);
        });

        t.test("without maybe part", [&](testing &t) {
            pcomb_state ps;
            auto node = run_parser("brillig", twas, ps);
            t.assert_equal("children", tokens({"", "brillig"}), child_tokens(node));
            t.assert_equal("leftover", std::string(""), leftover(ps));
            t.assert_equal("token", std::string("brillig"), node.token);
        });
    });

    t.test("operator chaining flattens", [&](testing &t) {
        auto chained = "a" + p.exact("b") + "c";
        t.assert_equal("dump", std::string("Seq(a, b, c)"), chained.dump());

        pcomb_state ps;
        auto node = run_parser("abc", chained, ps);
        t.assert_equal("children", tokens({"a", "b", "c"}), child_tokens(node));
    });

    t.test("explicit nesting is kept", [&](testing &t) {
        auto nested = p.seq({p.seq({"a", "b"}), "c"});
        t.assert_equal("dump", std::string("Seq(Seq(a, b), c)"), nested.dump());

        auto extended = nested + "d";
        t.assert_equal("dump after +", std::string("Seq(Seq(Seq(a, b), c), d)"), extended.dump());
    });

    t.test("rejects empty input lists", [&](testing &t) {
        t.assert_throws<std::invalid_argument>("no parsers", [&] { p.seq(std::vector<pcomb_parser>{}); });
        t.assert_throws<std::invalid_argument>("empty parser", [&] { p.seq({pcomb_parser(), "a"}); });
    });
}
