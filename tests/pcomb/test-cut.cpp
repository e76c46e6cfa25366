#include "tests.h"

void test_cut(testing &t) {
    pcomb_builder p;

    t.test("any", [&](testing &t) {
        pcomb_state ps;
        run_parser("var world", p.any({p.seq({"var", p.cut(), "hello"}), "var world"}), ps);
        t.assert_equal("error", std::string("offset 4: expected hello"), ps.error.to_string());
        t.assert_equal("pos", 0, (int) ps.pos);
    });

    t.test("many", [&](testing &t) {
        auto parser = p.many(p.any({p.seq({"<", p.cut(), p.chars("a-z"), ">"}), p.chars("a-z")}));

        pcomb_state ps;
        run_parser("hello <world", parser, ps);
        t.assert_equal("error", std::string("offset 12: expected >"), ps.error.to_string());
        t.assert_equal("pos", 0, (int) ps.pos);
    });

    t.test("maybe", [&](testing &t) {
        pcomb_state ps;
        run_parser("var", p.maybe(p.seq({"var", p.cut(), "hello"})), ps);
        t.assert_equal("error", std::string("offset 3: expected hello"), ps.error.to_string());
        t.assert_equal("pos", 0, (int) ps.pos);
    });

    t.test("localizes errors in a document", [&](testing &t) {
        auto alpha = p.chars("a-z");
        auto nocut = p.many(p.any({p.seq({"<", alpha, ">"}), alpha}));
        auto cut   = p.many(p.any({p.seq({"<", p.cut(), alpha, ">"}), alpha}));

        auto res = pcomb_run(nocut, "asdf <foo");
        t.assert_true("unparsed input", res.unparsed_input());
        t.assert_equal("without cut", std::string("left unparsed: <foo"), res.message());

        res = pcomb_run(cut, "asdf <foo");
        t.assert_true("match error", res.match_error());
        t.assert_equal("with cut", std::string("offset 9: expected >"), res.message());
    });

    t.test("does not skip whitespace", [&](testing &t) {
        pcomb_state ps;
        run_parser("a   b", p.seq({"a", p.cut()}), ps);
        t.assert_equal("cut", 1, (int) ps.cut);
    });

    t.test("barrier never moves back", [&](testing &t) {
        pcomb_state ps("abc");
        ps.raise_cut(2);
        ps.raise_cut(1);
        t.assert_equal("cut", 2, (int) ps.cut);
    });
}
