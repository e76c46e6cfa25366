#include "pcomb-impl.h"
#include "pcomb-unicode.h"

#include <cerrno>
#include <cstdlib>
#include <regex>
#include <stdexcept>

// Matches an exact literal string.
//   S -> "hello"
class exact_parser : public pcomb_parser_base {
    std::string literal_;

  public:
    static constexpr pcomb_parser_type type_value = PCOMB_PARSER_EXACT;

    explicit exact_parser(const std::string & literal) : literal_(literal) {}

    pcomb_parser_type type() const override { return type_value; }

    void parse_impl(pcomb_state & ps, pcomb_node & node) const override {
        ps.skip_ws();

        if (literal_.size() == 1) {
            if (ps.at_end() || ps.input[ps.pos] != literal_[0]) {
                ps.error_here(literal_);
                return;
            }
            ps.advance(1);
            node.token = literal_;
            return;
        }

        if (ps.input.substr(ps.pos, literal_.size()) != literal_) {
            ps.error_here(literal_);
            return;
        }

        ps.advance(literal_.size());
        node.token = literal_;
    }

    std::string name() const override { return literal_; }

    std::string dump() const override { return literal_; }
};

// Matches between min and max code points from a character class.
//   S -> [a-z]{m,n}
class chars_parser : public pcomb_parser_base {
    struct cpt_range {
        uint32_t start;
        uint32_t end;

        bool contains(uint32_t cpt) const { return cpt >= start && cpt <= end; }
    };

    std::string matcher_;
    std::vector<cpt_range> ranges_;
    bool negated_;
    int min_count_;
    int max_count_;

  public:
    static constexpr pcomb_parser_type type_value = PCOMB_PARSER_CHARS;

    chars_parser(const std::string & matcher, bool negated, int min_count, int max_count)
        : matcher_(matcher), negated_(negated), min_count_(min_count), max_count_(max_count) {
        if (matcher_.empty()) {
            throw std::invalid_argument("chars: matcher must not be empty");
        }
        if (min_count_ < 0 || (max_count_ != -1 && max_count_ < min_count_)) {
            throw std::invalid_argument(format("chars: invalid repetition {%d, %d}", min_count_, max_count_));
        }

        std::vector<uint32_t> cpts;
        std::vector<bool> escaped;
        for (size_t i = 0; i < matcher_.size(); ) {
            bool esc = false;
            if (matcher_[i] == '\\' && i + 1 < matcher_.size()) {
                esc = true;
                i++;
            }
            auto res = pcomb_parse_utf8_codepoint(matcher_, i);
            if (res.status != utf8_parse_result::SUCCESS) {
                throw std::invalid_argument("chars: matcher is not valid UTF-8: " + matcher_);
            }
            cpts.push_back(res.codepoint);
            escaped.push_back(esc);
            i += res.bytes_consumed;
        }

        size_t i = 0;
        while (i < cpts.size()) {
            uint32_t start = cpts[i];
            if (i + 2 < cpts.size() && cpts[i + 1] == '-' && !escaped[i + 1]) {
                // Range detected
                uint32_t end = cpts[i + 2];
                if (end < start) {
                    throw std::invalid_argument("chars: reversed range in " + matcher_);
                }
                ranges_.push_back(cpt_range{start, end});
                i += 3;
            } else {
                ranges_.push_back(cpt_range{start, start});
                i += 1;
            }
        }
    }

    pcomb_parser_type type() const override { return type_value; }

    void parse_impl(pcomb_state & ps, pcomb_node & node) const override {
        ps.skip_ws();

        const size_t start = ps.pos;
        size_t pos = start;
        int match_count = 0;

        while (max_count_ == -1 || match_count < max_count_) {
            if (pos >= ps.input.size()) {
                break;
            }

            auto res = pcomb_parse_utf8_codepoint(ps.input, pos);
            if (res.status != utf8_parse_result::SUCCESS) {
                break;
            }

            bool matches = false;
            for (const auto & range : ranges_) {
                if (range.contains(res.codepoint)) {
                    matches = true;
                    break;
                }
            }

            if (negated_) {
                matches = !matches;
            }

            if (!matches) {
                break;
            }

            pos += res.bytes_consumed;
            ++match_count;
        }

        if (match_count < min_count_) {
            ps.error_here(expected());
            return;
        }

        node.token = std::string(ps.input.substr(start, pos - start));
        ps.pos = pos;
    }

    std::string expected() const { return negated_ ? "^" + matcher_ : matcher_; }

    std::string name() const override { return expected(); }

    std::string dump() const override {
        std::string label = negated_ ? "NotChars(" : "Chars(";
        if (max_count_ == -1) {
            return label + matcher_ + ", " + std::to_string(min_count_) + ", unbounded)";
        }
        return label + matcher_ + ", " + std::to_string(min_count_) + ", " + std::to_string(max_count_) + ")";
    }
};

// Matches an ECMAScript regular expression anchored at the cursor.
class regex_parser : public pcomb_parser_base {
    std::string pattern_;
    std::string expected_;
    std::regex re_;

  public:
    static constexpr pcomb_parser_type type_value = PCOMB_PARSER_REGEX;

    regex_parser(const std::string & pattern, const std::string & expected)
        : pattern_(pattern), expected_(expected) {
        try {
            re_ = std::regex(pattern_, std::regex::ECMAScript);
        } catch (const std::regex_error & e) {
            throw std::invalid_argument("regex: invalid pattern '" + pattern_ + "': " + e.what());
        }
    }

    pcomb_parser_type type() const override { return type_value; }

    void parse_impl(pcomb_state & ps, pcomb_node & node) const override {
        ps.skip_ws();

        const char * begin = ps.input.data() + ps.pos;
        const char * end   = ps.input.data() + ps.input.size();

        std::cmatch m;
        if (!std::regex_search(begin, end, m, re_, std::regex_constants::match_continuous)) {
            ps.error_here(expected_);
            return;
        }

        node.token = m.str(0);
        ps.advance(static_cast<size_t>(m.length(0)));
    }

    std::string name() const override { return expected_; }

    std::string dump() const override {
        if (expected_ != pattern_) {
            return "NamedRegex(" + expected_ + ", " + pattern_ + ")";
        }
        return "Regex(" + pattern_ + ")";
    }
};

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Quoted string with backslash escapes. The value is the unescaped text.
//   S -> '"' (char | '\' escape)* '"'
class string_lit_parser : public pcomb_parser_base {
    std::string quotes_;

    // Parses 4 hex digits at pos, returns -1 if malformed
    static int32_t parse_hex4(std::string_view input, size_t pos) {
        if (pos + 4 > input.size()) {
            return -1;
        }
        int32_t value = 0;
        for (size_t i = 0; i < 4; ++i) {
            int d = hex_value(input[pos + i]);
            if (d < 0) {
                return -1;
            }
            value = (value << 4) | d;
        }
        return value;
    }

  public:
    static constexpr pcomb_parser_type type_value = PCOMB_PARSER_STRING_LIT;

    explicit string_lit_parser(const std::string & quotes) : quotes_(quotes) {
        if (quotes_.empty()) {
            throw std::invalid_argument("string_lit: at least one quote character is required");
        }
    }

    pcomb_parser_type type() const override { return type_value; }

    void parse_impl(pcomb_state & ps, pcomb_node & node) const override {
        ps.skip_ws();

        if (ps.at_end() || quotes_.find(ps.input[ps.pos]) == std::string::npos) {
            ps.error_here(quotes_);
            return;
        }

        const char quote = ps.input[ps.pos];
        const size_t start = ps.pos;
        size_t pos = start + 1;
        std::string value;

        while (pos < ps.input.size()) {
            const char c = ps.input[pos];

            if (c == quote) {
                node.token = std::string(ps.input.substr(start, pos + 1 - start));
                node.value = value;
                ps.pos = pos + 1;
                return;
            }

            if (c != '\\') {
                value += c;
                pos++;
                continue;
            }

            if (pos + 1 >= ps.input.size()) {
                break;
            }

            const char esc = ps.input[pos + 1];
            switch (esc) {
                case '"':
                case '\'':
                case '\\':
                case '/':
                    value += esc;
                    break;
                case 'b': value += '\b'; break;
                case 'f': value += '\f'; break;
                case 'n': value += '\n'; break;
                case 'r': value += '\r'; break;
                case 't': value += '\t'; break;
                case 'u': {
                    int32_t cpt = parse_hex4(ps.input, pos + 2);
                    if (cpt < 0) {
                        ps.error = pcomb_error{pos, "valid escape"};
                        return;
                    }
                    size_t consumed = 6;
                    // surrogate pair
                    if (cpt >= 0xD800 && cpt <= 0xDBFF
                            && pos + 7 < ps.input.size() && ps.input[pos + 6] == '\\' && ps.input[pos + 7] == 'u') {
                        int32_t low = parse_hex4(ps.input, pos + 8);
                        if (low >= 0xDC00 && low <= 0xDFFF) {
                            cpt = 0x10000 + ((cpt - 0xD800) << 10) + (low - 0xDC00);
                            consumed = 12;
                        }
                    }
                    value += pcomb_unicode_cpt_to_utf8(static_cast<uint32_t>(cpt));
                    pos += consumed;
                    continue;
                }
                default:
                    ps.error = pcomb_error{pos, "valid escape"};
                    return;
            }
            pos += 2;
        }

        ps.error = pcomb_error{ps.input.size(), "end of string"};
    }

    std::string name() const override { return "StringLit()"; }

    std::string dump() const override { return "StringLit(" + quotes_ + ")"; }
};

// Integer or floating point number.
//   S -> '-'? [0-9]+ ('.' [0-9]+)? ([eE] [+-]? [0-9]+)?
class number_lit_parser : public pcomb_parser_base {
    static size_t skip_digits(std::string_view input, size_t pos) {
        while (pos < input.size() && input[pos] >= '0' && input[pos] <= '9') {
            pos++;
        }
        return pos;
    }

  public:
    static constexpr pcomb_parser_type type_value = PCOMB_PARSER_NUMBER_LIT;

    pcomb_parser_type type() const override { return type_value; }

    void parse_impl(pcomb_state & ps, pcomb_node & node) const override {
        ps.skip_ws();

        const std::string_view in = ps.input;
        const size_t start = ps.pos;
        size_t pos = start;
        bool is_float = false;

        if (pos < in.size() && (in[pos] == '-' || in[pos] == '+')) {
            pos++;
        }

        size_t end = skip_digits(in, pos);
        if (end == pos) {
            ps.error_here("number");
            return;
        }
        pos = end;

        if (pos + 1 < in.size() && in[pos] == '.') {
            end = skip_digits(in, pos + 1);
            if (end > pos + 1) {
                is_float = true;
                pos = end;
            }
        }

        if (pos < in.size() && (in[pos] == 'e' || in[pos] == 'E')) {
            size_t exp = pos + 1;
            if (exp < in.size() && (in[exp] == '-' || in[exp] == '+')) {
                exp++;
            }
            end = skip_digits(in, exp);
            if (end > exp) {
                is_float = true;
                pos = end;
            }
        }

        const std::string text(in.substr(start, pos - start));

        if (!is_float) {
            errno = 0;
            long long v = std::strtoll(text.c_str(), nullptr, 10);
            if (errno != ERANGE) {
                node.value = static_cast<int64_t>(v);
            } else {
                node.value = std::strtod(text.c_str(), nullptr);
            }
        } else {
            node.value = std::strtod(text.c_str(), nullptr);
        }

        node.token = text;
        ps.pos = pos;
    }

    std::string name() const override { return "number"; }

    std::string dump() const override { return "NumberLit()"; }
};

//
// pcomb_parser: literal conversions
//

pcomb_parser::pcomb_parser(const std::string & literal) : ptr_(std::make_shared<exact_parser>(literal)) {}

pcomb_parser::pcomb_parser(const char * literal) : ptr_(std::make_shared<exact_parser>(literal ? literal : "")) {}

//
// pcomb_builder: leaf matchers
//

pcomb_parser pcomb_builder::exact(const std::string & literal) {
    return pcomb_parser(std::make_shared<exact_parser>(literal));
}

pcomb_parser pcomb_builder::chars(const std::string & matcher, int min, int max) {
    return pcomb_parser(std::make_shared<chars_parser>(matcher, false, min, max));
}

pcomb_parser pcomb_builder::not_chars(const std::string & matcher, int min, int max) {
    return pcomb_parser(std::make_shared<chars_parser>(matcher, true, min, max));
}

pcomb_parser pcomb_builder::regex(const std::string & pattern) {
    return pcomb_parser(std::make_shared<regex_parser>(pattern, pattern));
}

pcomb_parser pcomb_builder::named_regex(const std::string & name, const std::string & pattern) {
    if (name.empty()) {
        throw std::invalid_argument("named_regex: name must not be empty");
    }
    return pcomb_parser(std::make_shared<regex_parser>(pattern, name));
}

pcomb_parser pcomb_builder::string_lit(const std::string & quotes) {
    return pcomb_parser(std::make_shared<string_lit_parser>(quotes));
}

pcomb_parser pcomb_builder::number_lit() {
    return pcomb_parser(std::make_shared<number_lit_parser>());
}
