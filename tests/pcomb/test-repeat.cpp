#include "tests.h"

void test_repeat(testing &t) {
    pcomb_builder p;

    t.test("some", [&](testing &t) {
        t.test("does not match empty input", [&](testing &t) {
            auto res = pcomb_run(p.some(p.chars("a-g"), p.exact(",")), "");
            t.assert_true("match error", res.match_error());
        });

        t.test("matches sequence with sep", [&](testing &t) {
            pcomb_state ps;
            auto node = run_parser("a,b,c,d,e,", p.some(p.chars("a-g"), ","), ps);
            t.assert_true("no error", !ps.errored());
            t.assert_equal("children", tokens({"a", "b", "c", "d", "e"}), child_tokens(node));
            t.assert_equal("pos", 10, (int) ps.pos);
            t.assert_equal("token", std::string("a,b,c,d,e,"), node.token);
        });

        t.test("matches sequence without trailing sep", [&](testing &t) {
            pcomb_state ps;
            auto node = run_parser("a,b,c,d,e1111", p.some(p.chars("a-g"), ","), ps);
            t.assert_true("no error", !ps.errored());
            t.assert_equal("children", tokens({"a", "b", "c", "d", "e"}), child_tokens(node));
            t.assert_equal("leftover", std::string("1111"), leftover(ps));
        });

        t.test("matches sequence without sep", [&](testing &t) {
            pcomb_state ps;
            auto node = run_parser("a,b,c,d,e,", p.some(p.any({p.chars("a-g"), ","})), ps);
            t.assert_equal("children", tokens({"a", ",", "b", ",", "c", ",", "d", ",", "e", ","}), child_tokens(node));
            t.assert_equal("pos", 10, (int) ps.pos);
        });

        t.test("splits words automatically on space", [&](testing &t) {
            pcomb_state ps;
            auto node = run_parser("hello world", p.some(p.chars("a-z")), ps);
            t.assert_equal("children", tokens({"hello", "world"}), child_tokens(node));
            t.assert_equal("leftover", std::string(""), leftover(ps));
        });

        t.test("stops on error", [&](testing &t) {
            pcomb_state ps;
            auto node = run_parser("a,b,c,d,e,", p.some(p.chars("a-c"), ","), ps);
            t.assert_equal("children", tokens({"a", "b", "c"}), child_tokens(node));
            t.assert_equal("pos", 6, (int) ps.pos);
            t.assert_equal("leftover", std::string("d,e,"), leftover(ps));
        });

        t.test("returns error if nothing matches", [&](testing &t) {
            pcomb_state ps;
            run_parser("a,b,c", p.some(p.chars("def"), p.exact(",")), ps);
            t.assert_equal("error", std::string("offset 0: expected def"), ps.error.to_string());
            t.assert_equal("leftover", std::string("a,b,c"), leftover(ps));
        });
    });

    t.test("many", [&](testing &t) {
        t.test("matches empty input", [&](testing &t) {
            auto res = pcomb_run(p.many(p.chars("a-g"), p.exact(",")), "");
            t.assert_true("success", res.success());
        });

        t.test("matches sequence with sep", [&](testing &t) {
            pcomb_state ps;
            auto node = run_parser("a,b,c,d,e,", p.many(p.chars("a-g"), p.exact(",")), ps);
            t.assert_equal("children", tokens({"a", "b", "c", "d", "e"}), child_tokens(node));
            t.assert_equal("pos", 10, (int) ps.pos);
        });

        t.test("matches sequence without sep", [&](testing &t) {
            pcomb_state ps;
            auto node = run_parser("a,b,c,d,e,", p.many(p.any({p.chars("abcdefg"), p.exact(",")})), ps);
            t.assert_equal("children", tokens({"a", ",", "b", ",", "c", ",", "d", ",", "e", ","}), child_tokens(node));
            t.assert_equal("pos", 10, (int) ps.pos);
        });

        t.test("stops on error", [&](testing &t) {
            pcomb_state ps;
            auto node = run_parser("a,b,c,d,e,", p.many(p.chars("abc"), p.exact(",")), ps);
            t.assert_equal("children", tokens({"a", "b", "c"}), child_tokens(node));
            t.assert_equal("pos", 6, (int) ps.pos);
            t.assert_equal("leftover", std::string("d,e,"), leftover(ps));
        });

        t.test("returns no error if nothing matches", [&](testing &t) {
            pcomb_state ps;
            auto node = run_parser("a,b,c,d,e,", p.many(p.chars("def"), p.exact(",")), ps);
            t.assert_true("no error", !ps.errored());
            t.assert_equal("children", 0, (int) node.children.size());
            t.assert_equal("leftover", std::string("a,b,c,d,e,"), leftover(ps));
        });

        t.test("terminates on operands that match nothing", [&](testing &t) {
            pcomb_state ps;
            run_parser("abc", p.many(p.maybe("x")), ps);
            t.assert_true("no error", !ps.errored());
            t.assert_equal("pos", 0, (int) ps.pos);
        });

        t.test("dump", [&](testing &t) {
            t.assert_equal("many", std::string("Many(a, ,)"), p.many("a", ",").dump());
            t.assert_equal("some", std::string("Some(a)"), p.some("a").dump());
        });
    });
}
