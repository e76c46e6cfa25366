#include "tests.h"

void test_literals(testing &t) {
    pcomb_builder p;

    t.test("exact", [&](testing &t) {
        t.test("single byte", [&](testing &t) {
            pcomb_state ps;
            auto node = run_parser("<a", p.exact("<"), ps);
            t.assert_equal("token", std::string("<"), node.token);
            t.assert_equal("pos", 1, (int) ps.pos);

            run_parser("a", p.exact("<"), ps);
            t.assert_equal("error", std::string("offset 0: expected <"), ps.error.to_string());
        });

        t.test("skips leading whitespace", [&](testing &t) {
            pcomb_state ps;
            auto node = run_parser("  hi", p.exact("hi"), ps);
            t.assert_equal("token", std::string("hi"), node.token);
            t.assert_equal("pos", 4, (int) ps.pos);
        });

        t.test("implicit conversion from literals", [&](testing &t) {
            pcomb_parser from_cstr = "hi";
            pcomb_parser from_str  = std::string("hi");
            t.assert_equal("dump", from_cstr.dump(), from_str.dump());
            t.assert_true("matches", pcomb_run(from_cstr, "hi").success());
        });
    });

    t.test("chars", [&](testing &t) {
        t.test("ranges", [&](testing &t) {
            pcomb_state ps;
            auto node = run_parser("foo_Bar9 x", p.chars("a-zA-Z0-9_"), ps);
            t.assert_equal("token", std::string("foo_Bar9"), node.token);
        });

        t.test("repetition bounds", [&](testing &t) {
            pcomb_state ps;
            run_parser("1", p.chars("0-9", 2, 3), ps);
            t.assert_equal("too few", std::string("offset 0: expected 0-9"), ps.error.to_string());

            auto node = run_parser("12345", p.chars("0-9", 2, 3), ps);
            t.assert_equal("at most max", std::string("123"), node.token);
            t.assert_equal("pos", 3, (int) ps.pos);
        });

        t.test("code points", [&](testing &t) {
            pcomb_state ps;
            auto node = run_parser("\xCE\xB3\xCE\xB1\xCE\xB2\xCE\xB4", p.chars("\xCE\xB1\xCE\xB2\xCE\xB3"), ps);
            t.assert_equal("token", std::string("\xCE\xB3\xCE\xB1\xCE\xB2"), node.token);
            t.assert_equal("pos", 6, (int) ps.pos);
        });

        t.test("escaped dash", [&](testing &t) {
            pcomb_state ps;
            auto node = run_parser("a-a-b", p.chars("\\-a"), ps);
            t.assert_equal("token", std::string("a-a-"), node.token);
        });

        t.test("negated", [&](testing &t) {
            pcomb_state ps;
            auto node = run_parser("abc\"def", p.not_chars("\""), ps);
            t.assert_equal("token", std::string("abc"), node.token);

            run_parser("\"", p.not_chars("\""), ps);
            t.assert_equal("error", std::string("offset 0: expected ^\""), ps.error.to_string());
        });

        t.test("invalid matchers", [&](testing &t) {
            t.assert_throws<std::invalid_argument>("empty", [&] { p.chars(""); });
            t.assert_throws<std::invalid_argument>("reversed", [&] { p.chars("z-a"); });
            t.assert_throws<std::invalid_argument>("bounds", [&] { p.chars("a", 3, 2); });
        });
    });

    t.test("regex", [&](testing &t) {
        t.test("anchored at the cursor", [&](testing &t) {
            pcomb_state ps;
            auto node = run_parser("123abc", p.regex("[0-9]+"), ps);
            t.assert_equal("token", std::string("123"), node.token);

            run_parser("abc123", p.regex("[0-9]+"), ps);
            t.assert_equal("error", std::string("offset 0: expected [0-9]+"), ps.error.to_string());
        });

        t.test("named", [&](testing &t) {
            pcomb_state ps;
            run_parser("abc", p.named_regex("number", "[0-9]+"), ps);
            t.assert_equal("error", std::string("offset 0: expected number"), ps.error.to_string());
        });

        t.test("invalid pattern", [&](testing &t) {
            t.assert_throws<std::invalid_argument>("pattern", [&] { p.regex("("); });
        });
    });

    t.test("string literal", [&](testing &t) {
        auto str = p.string_lit("\"'");

        t.test("escapes", [&](testing &t) {
            pcomb_state ps;
            auto node = run_parser("\"a\\nb\\t\\\"c\\\\\\/\"", str, ps);
            t.assert_equal("value", pcomb_value("a\nb\t\"c\\/"), node.value);
            t.assert_equal("token keeps quotes", std::string("\"a\\nb\\t\\\"c\\\\\\/\""), node.token);
        });

        t.test("either quote", [&](testing &t) {
            pcomb_state ps;
            auto node = run_parser("'x\"y'", str, ps);
            t.assert_equal("value", pcomb_value("x\"y"), node.value);
        });

        t.test("unicode escapes", [&](testing &t) {
            pcomb_state ps;
            auto node = run_parser("\"\\u00e9\"", str, ps);
            t.assert_equal("bmp", pcomb_value("\xC3\xA9"), node.value);

            node = run_parser("\"\\ud83d\\ude00\"", str, ps);
            t.assert_equal("surrogate pair", pcomb_value("\xF0\x9F\x98\x80"), node.value);
        });

        t.test("errors", [&](testing &t) {
            pcomb_state ps;
            run_parser("\"abc", str, ps);
            t.assert_equal("unterminated", std::string("offset 4: expected end of string"), ps.error.to_string());

            run_parser("\"a\\q\"", str, ps);
            t.assert_equal("bad escape", std::string("offset 2: expected valid escape"), ps.error.to_string());

            run_parser("abc", str, ps);
            t.assert_equal("no quote", std::string("offset 0: expected \"'"), ps.error.to_string());
        });
    });

    t.test("number literal", [&](testing &t) {
        auto num = p.number_lit();

        t.test("integer", [&](testing &t) {
            pcomb_state ps;
            auto node = run_parser("42", num, ps);
            t.assert_true("is integer", node.value.is_number_integer());
            t.assert_equal("value", pcomb_value(42), node.value);
        });

        t.test("float", [&](testing &t) {
            pcomb_state ps;
            auto node = run_parser("-3.5e2", num, ps);
            t.assert_true("is float", node.value.is_number_float());
            t.assert_equal("value", pcomb_value(-350.0), node.value);
        });

        t.test("trailing dot is not consumed", [&](testing &t) {
            pcomb_state ps;
            auto node = run_parser("1.", num, ps);
            t.assert_equal("value", pcomb_value(1), node.value);
            t.assert_equal("pos", 1, (int) ps.pos);
        });

        t.test("out of range integer", [&](testing &t) {
            pcomb_state ps;
            auto node = run_parser("99999999999999999999", num, ps);
            t.assert_true("is float", node.value.is_number_float());
        });

        t.test("error", [&](testing &t) {
            pcomb_state ps;
            run_parser("abc", num, ps);
            t.assert_equal("error", std::string("offset 0: expected number"), ps.error.to_string());
        });
    });
}
