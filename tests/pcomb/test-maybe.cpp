#include "tests.h"

void test_maybe(testing &t) {
    pcomb_builder p;

    t.test("matches sequence", [&](testing &t) {
        pcomb_state ps;
        auto node = run_parser("hello world", p.maybe("hello"), ps);
        t.assert_equal("token", std::string("hello"), node.token);
        t.assert_equal("leftover", std::string(" world"), leftover(ps));
    });

    t.test("returns no errors", [&](testing &t) {
        pcomb_state ps;
        auto node = run_parser("hello world", p.maybe("world"), ps);
        t.assert_true("empty node", node.empty());
        t.assert_true("no error", !ps.errored());
        t.assert_equal("pos", 0, (int) ps.pos);
    });

    t.test("absent result is empty", [&](testing &t) {
        pcomb_state ps;
        auto node = run_parser("a c", p.maybe(p.seq({p.bind("a", 1), "b"})), ps);
        t.assert_true("no error", !ps.errored());
        t.assert_true("empty node", node.empty());
    });
}
