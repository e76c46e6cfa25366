#include "tests.h"

void test_longest(testing &t) {
    pcomb_builder p;

    t.test("picks the alternative that advances furthest", [&](testing &t) {
        auto parser = p.longest("keyword", {"a", "ab", "abc"});

        pcomb_state ps;
        auto node = run_parser("abcd", parser, ps);
        t.assert_true("no error", !ps.errored());
        t.assert_equal("token", std::string("abc"), node.token);
        t.assert_equal("pos", 3, (int) ps.pos);
    });

    t.test("first match versus longest match", [&](testing &t) {
        auto first   = p.any({"a", "ab"});
        auto longest = p.longest("a or ab", {"a", "ab"});

        auto res = pcomb_run(first, "ab");
        t.assert_equal("any leaves input", std::string("left unparsed: b"), res.message());

        res = pcomb_run(longest, "ab");
        t.assert_true("longest consumes all", res.success());
        t.assert_equal("token", std::string("ab"), res.node.token);
    });

    t.test("ties keep the earliest alternative", [&](testing &t) {
        auto parser = p.longest("ab", {p.bind("ab", 1), p.bind("ab", 2)});

        pcomb_state ps;
        auto node = run_parser("ab", parser, ps);
        t.assert_equal("value", pcomb_value(1), node.value);
    });

    t.test("reports its name when nothing matches", [&](testing &t) {
        auto parser = p.longest("number or word", {p.chars("0-9"), p.chars("a-z")});

        pcomb_state ps;
        run_parser("!!", parser, ps);
        t.assert_equal("error", std::string("offset 0: expected number or word"), ps.error.to_string());
        t.assert_equal("pos", 0, (int) ps.pos);
    });

    t.test("empty matches do not count", [&](testing &t) {
        auto parser = p.longest("z", {p.maybe("z")});

        pcomb_state ps;
        run_parser("abc", parser, ps);
        t.assert_equal("error", std::string("offset 0: expected z"), ps.error.to_string());
    });

    t.test("a committed alternative propagates its failure", [&](testing &t) {
        auto parser = p.longest("x", {"ab", p.seq({"a", p.cut(), "c"})});

        pcomb_state ps;
        run_parser("ab", parser, ps);
        t.assert_equal("error", std::string("offset 1: expected c"), ps.error.to_string());
        t.assert_equal("pos", 0, (int) ps.pos);
    });

    t.test("end of input", [&](testing &t) {
        pcomb_state ps;
        run_parser("", p.longest("x", {"a"}), ps);
        t.assert_equal("expected", std::string("!EOF"), ps.error.expected);
    });

    t.test("a successful committed alternative does not block the others", [&](testing &t) {
        auto plain = p.longest("kw", {p.seq({"a", p.cut()}), "ab"});
        auto res = pcomb_run(plain, "ab");
        t.assert_true("success", res.success());
        t.assert_equal("token", std::string("ab"), res.node.token);

        auto nested = p.longest("kw", {p.seq({"a", p.cut()}), p.any({"ab"})});
        res = pcomb_run(nested, "ab");
        t.assert_true("nested success", res.success());
        t.assert_equal("nested token", std::string("ab"), res.node.token);
    });
}
