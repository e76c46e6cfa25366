#include "pcomb-impl.h"

#include <stdexcept>

static std::string dump_all(const std::vector<pcomb_parser> & parsers) {
    std::vector<std::string> parts;
    parts.reserve(parsers.size());
    for (const auto & p : parsers) {
        parts.push_back(p.dump());
    }
    return string_join(parts, ", ");
}

// Matches a sequence of parsers in order, all must succeed.
//   S -> A B C
class seq_parser : public pcomb_parser_base {
    std::vector<pcomb_parser> parsers_;
    bool chained_; // built by operator+, may be extended in place of nesting

  public:
    static constexpr pcomb_parser_type type_value = PCOMB_PARSER_SEQ;

    seq_parser(std::vector<pcomb_parser> parsers, bool chained)
        : parsers_(std::move(parsers)), chained_(chained) {
        pcomb_require_all(parsers_, "seq");
    }

    pcomb_parser_type type() const override { return type_value; }

    void parse_impl(pcomb_state & ps, pcomb_node & node) const override {
        node.children.assign(parsers_.size(), pcomb_node());

        const size_t start = ps.pos;
        for (size_t i = 0; i < parsers_.size(); ++i) {
            parsers_[i].parse(ps, node.children[i]);
            if (ps.errored()) {
                ps.pos = start;
                return;
            }
        }

        // verbatim source slice, interior whitespace included
        node.token = std::string(ps.input.substr(start, ps.pos - start));
    }

    std::string name() const override { return "Seq()"; }

    std::string dump() const override {
        return "Seq(" + dump_all(parsers_) + ")";
    }

    const std::vector<pcomb_parser> & parsers() const { return parsers_; }

    bool chained() const { return chained_; }
};

// Matches the first alternative that succeeds.
//   S -> A | B | C
//
// With a name, total failure is reported as "expected <name>" at the start
// position; without one, the furthest error of the alternatives is reported.
class any_parser : public pcomb_parser_base {
    std::vector<pcomb_parser> parsers_;
    std::string name_;
    bool chained_;

  public:
    static constexpr pcomb_parser_type type_value = PCOMB_PARSER_ANY;

    any_parser(std::vector<pcomb_parser> parsers, std::string name, bool chained)
        : parsers_(std::move(parsers)), name_(std::move(name)), chained_(chained) {
        pcomb_require_all(parsers_, "any");
    }

    pcomb_parser_type type() const override { return type_value; }

    void parse_impl(pcomb_state & ps, pcomb_node & node) const override {
        const size_t entry = ps.pos;

        ps.skip_ws();
        if (ps.at_end()) {
            ps.error_here("!EOF");
            ps.pos = entry;
            return;
        }

        const size_t start = ps.pos;

        // a deeper cut already committed this attempt
        if (ps.errored() && ps.cut > start) {
            ps.pos = entry;
            return;
        }
        ps.recover();

        // a cut left past start by an earlier, successful sibling does not
        // commit the alternatives tried here
        const size_t cut_floor = ps.cut;

        pcomb_error furthest;
        bool have_error = false;

        for (const auto & p : parsers_) {
            node.clear();
            p.parse(ps, node);
            if (!ps.errored()) {
                return;
            }

            if (ps.cut > start && ps.cut > cut_floor) {
                ps.pos = entry;
                return;
            }

            if (!have_error || ps.error.outranks(furthest)) {
                furthest   = ps.error;
                have_error = true;
            }
            ps.recover();
            ps.pos = start;
        }

        node.clear();
        if (name_.empty()) {
            ps.error = furthest;
        } else {
            ps.error = pcomb_error{start, name_};
        }
        ps.pos = entry;
    }

    std::string name() const override { return name_.empty() ? "Any()" : name_; }

    std::string dump() const override {
        if (name_.empty()) {
            return "Any(" + dump_all(parsers_) + ")";
        }
        return "AnyWithName(" + name_ + ", " + dump_all(parsers_) + ")";
    }

    const std::vector<pcomb_parser> & parsers() const { return parsers_; }

    bool chained() const { return chained_; }
};

// Evaluates every alternative and keeps the one that advanced furthest.
// Ties keep the earliest listed alternative.
class longest_parser : public pcomb_parser_base {
    std::vector<pcomb_parser> parsers_;
    std::string name_;

  public:
    static constexpr pcomb_parser_type type_value = PCOMB_PARSER_LONGEST;

    longest_parser(std::vector<pcomb_parser> parsers, std::string name)
        : parsers_(std::move(parsers)), name_(std::move(name)) {
        pcomb_require_all(parsers_, "longest");
    }

    pcomb_parser_type type() const override { return type_value; }

    void parse_impl(pcomb_state & ps, pcomb_node & node) const override {
        const size_t entry = ps.pos;

        ps.skip_ws();
        if (ps.at_end()) {
            ps.error_here("!EOF");
            ps.pos = entry;
            return;
        }

        const size_t start = ps.pos;

        if (ps.errored() && ps.cut > start) {
            ps.pos = entry;
            return;
        }
        ps.recover();

        pcomb_node best;
        size_t best_pos = start;

        for (const auto & p : parsers_) {
            const size_t cut_before = ps.cut;

            pcomb_node attempt;
            p.parse(ps, attempt);
            if (ps.errored()) {
                // only a cut raised by this attempt commits it
                if (ps.cut > start && ps.cut > cut_before) {
                    ps.pos = entry;
                    return;
                }
                ps.recover();
                ps.pos = start;
                continue;
            }

            if (ps.pos > best_pos) {
                best_pos = ps.pos;
                best     = std::move(attempt);
            }
            ps.pos = start;
        }

        if (best_pos > start) {
            ps.pos = best_pos;
            node   = std::move(best);
            return;
        }

        ps.error = pcomb_error{start, name_};
        ps.pos   = entry;
    }

    std::string name() const override { return name_; }

    std::string dump() const override {
        return "Longest(" + name_ + ", " + dump_all(parsers_) + ")";
    }
};

// Matches at least min_count repetitions of a parser, each in children[n].
// The optional separator is consumed between repetitions but not returned.
//   S -> A* or S -> A+
class repeat_parser : public pcomb_parser_base {
    pcomb_parser parser_;
    pcomb_parser separator_;
    int min_count_;

  public:
    static constexpr pcomb_parser_type type_value = PCOMB_PARSER_REPEAT;

    repeat_parser(const pcomb_parser & parser, const pcomb_parser & separator, int min_count)
        : parser_(parser), separator_(separator), min_count_(min_count) {
        pcomb_require(parser_, min_count_ > 0 ? "some" : "many");
    }

    pcomb_parser_type type() const override { return type_value; }

    void parse_impl(pcomb_state & ps, pcomb_node & node) const override {
        node.children.clear();
        node.children.reserve(5);

        const size_t start = ps.pos;
        for (;;) {
            const size_t iter_start = ps.pos;

            node.children.emplace_back();
            parser_.parse(ps, node.children.back());
            if (ps.errored()) {
                const int matched = (int) node.children.size() - 1;
                if (matched < min_count_ || ps.cut > ps.pos) {
                    ps.pos = start;
                    return;
                }
                ps.recover();
                node.children.pop_back();
                break;
            }

            if (separator_) {
                const size_t sep_start = ps.pos;
                pcomb_node discard;
                separator_.parse(ps, discard);
                if (ps.errored()) {
                    // a missing separator ends the repetition, never fails it
                    ps.recover();
                    ps.pos = sep_start;
                    break;
                }
            }

            // Prevent infinite loop on empty matches
            if (ps.pos == iter_start) {
                break;
            }
        }

        node.token = std::string(ps.input.substr(start, ps.pos - start));
    }

    std::string name() const override { return min_count_ > 0 ? "Some()" : "Many()"; }

    std::string dump() const override {
        std::string s = (min_count_ > 0 ? "Some(" : "Many(") + parser_.dump();
        if (separator_) {
            s += ", " + separator_.dump();
        }
        return s + ")";
    }
};

// Matches zero or one occurrence of a parser.
//   S -> A?
class maybe_parser : public pcomb_parser_base {
    pcomb_parser parser_;

  public:
    static constexpr pcomb_parser_type type_value = PCOMB_PARSER_MAYBE;

    explicit maybe_parser(const pcomb_parser & parser) : parser_(parser) {
        pcomb_require(parser_, "maybe");
    }

    pcomb_parser_type type() const override { return type_value; }

    void parse_impl(pcomb_state & ps, pcomb_node & node) const override {
        const size_t start = ps.pos;
        parser_.parse(ps, node);
        if (ps.errored() && ps.cut <= start) {
            ps.recover();
            ps.pos = start;
            node.clear();
        }
    }

    std::string name() const override { return "Maybe()"; }

    std::string dump() const override {
        return "Maybe(" + parser_.dump() + ")";
    }
};

// Raises the cut barrier to the current position. Consumes nothing.
class cut_parser : public pcomb_parser_base {
  public:
    static constexpr pcomb_parser_type type_value = PCOMB_PARSER_CUT;

    pcomb_parser_type type() const override { return type_value; }

    void parse_impl(pcomb_state & ps, pcomb_node & node) const override {
        (void) node;
        ps.raise_cut(ps.pos);
    }

    std::string name() const override { return "Cut()"; }

    std::string dump() const override { return "Cut"; }
};

// Sets a constant value on success.
class bind_parser : public pcomb_parser_base {
    pcomb_parser parser_;
    pcomb_value value_;

  public:
    static constexpr pcomb_parser_type type_value = PCOMB_PARSER_BIND;

    bind_parser(const pcomb_parser & parser, pcomb_value value)
        : parser_(parser), value_(std::move(value)) {
        pcomb_require(parser_, "bind");
    }

    pcomb_parser_type type() const override { return type_value; }

    void parse_impl(pcomb_state & ps, pcomb_node & node) const override {
        parser_.parse(ps, node);
        if (ps.errored()) {
            return;
        }
        node.value = value_;
    }

    std::string name() const override { return "Bind()"; }

    std::string dump() const override {
        return "Bind(" + parser_.dump() + ", " + value_.dump() + ")";
    }
};

// Invokes a callback with the populated node on success.
class map_parser : public pcomb_parser_base {
    pcomb_parser parser_;
    std::function<void(pcomb_node &)> fn_;
    std::string label_;

  public:
    static constexpr pcomb_parser_type type_value = PCOMB_PARSER_MAP;

    map_parser(const pcomb_parser & parser, std::function<void(pcomb_node &)> fn, std::string label)
        : parser_(parser), fn_(std::move(fn)), label_(std::move(label)) {
        pcomb_require(parser_, "map");
        if (!fn_) {
            throw std::invalid_argument("map: callback is empty");
        }
    }

    pcomb_parser_type type() const override { return type_value; }

    void parse_impl(pcomb_state & ps, pcomb_node & node) const override {
        parser_.parse(ps, node);
        if (ps.errored()) {
            return;
        }
        fn_(node);
    }

    std::string name() const override { return label_ + "()"; }

    std::string dump() const override {
        return label_ + "(" + parser_.dump() + ")";
    }
};

// Swaps in the no-op whitespace policy for everything below the parser.
class no_auto_ws_parser : public pcomb_parser_base {
    pcomb_parser parser_;

  public:
    static constexpr pcomb_parser_type type_value = PCOMB_PARSER_NO_AUTO_WS;

    explicit no_auto_ws_parser(const pcomb_parser & parser) : parser_(parser) {
        pcomb_require(parser_, "no_auto_ws");
    }

    pcomb_parser_type type() const override { return type_value; }

    void parse_impl(pcomb_state & ps, pcomb_node & node) const override {
        pcomb_ws_fn old_ws = ps.ws;
        ps.ws = pcomb_ws_none;
        parser_.parse(ps, node);
        ps.ws = old_ws;
    }

    std::string name() const override { return "NoAutoWS()"; }

    std::string dump() const override {
        return "NoAutoWS(" + parser_.dump() + ")";
    }
};

// Depth-first concatenation of descendant tokens; leaves keep their own.
static std::string flatten_token(const pcomb_node & n) {
    if (n.children.empty()) {
        return n.token;
    }
    std::string s;
    for (const auto & child : n.children) {
        s += flatten_token(child);
    }
    return s;
}

//
// operators
//

pcomb_parser pcomb_parser::operator+(const pcomb_parser & other) const {
    std::vector<pcomb_parser> parsers;
    if (auto seq = pcomb_cast<seq_parser>(ptr_); seq && seq->chained()) {
        parsers = seq->parsers();
    } else {
        parsers.push_back(*this);
    }
    parsers.push_back(other);
    return pcomb_parser(std::make_shared<seq_parser>(std::move(parsers), true));
}

pcomb_parser pcomb_parser::operator|(const pcomb_parser & other) const {
    std::vector<pcomb_parser> parsers;
    if (auto any = pcomb_cast<any_parser>(ptr_); any && any->chained()) {
        parsers = any->parsers();
    } else {
        parsers.push_back(*this);
    }
    parsers.push_back(other);
    return pcomb_parser(std::make_shared<any_parser>(std::move(parsers), std::string(), true));
}

pcomb_parser operator+(const char * lhs, const pcomb_parser & rhs) { return pcomb_parser(lhs) + rhs; }
pcomb_parser operator|(const char * lhs, const pcomb_parser & rhs) { return pcomb_parser(lhs) | rhs; }

pcomb_parser pcomb_parser::map(std::function<void(pcomb_node &)> fn) const {
    return pcomb_parser(std::make_shared<map_parser>(*this, std::move(fn), "Map"));
}

//
// pcomb_builder: combinators
//

pcomb_parser pcomb_builder::seq(std::initializer_list<pcomb_parser> parsers) {
    return seq(std::vector<pcomb_parser>(parsers));
}

pcomb_parser pcomb_builder::seq(const std::vector<pcomb_parser> & parsers) {
    return pcomb_parser(std::make_shared<seq_parser>(parsers, false));
}

pcomb_parser pcomb_builder::any(std::initializer_list<pcomb_parser> parsers) {
    return any(std::vector<pcomb_parser>(parsers));
}

pcomb_parser pcomb_builder::any(const std::vector<pcomb_parser> & parsers) {
    return pcomb_parser(std::make_shared<any_parser>(parsers, std::string(), false));
}

pcomb_parser pcomb_builder::any_with_name(const std::string & name, std::initializer_list<pcomb_parser> parsers) {
    return any_with_name(name, std::vector<pcomb_parser>(parsers));
}

pcomb_parser pcomb_builder::any_with_name(const std::string & name, const std::vector<pcomb_parser> & parsers) {
    if (name.empty()) {
        throw std::invalid_argument("any_with_name: name must not be empty");
    }
    return pcomb_parser(std::make_shared<any_parser>(parsers, name, false));
}

pcomb_parser pcomb_builder::longest(const std::string & name, std::initializer_list<pcomb_parser> parsers) {
    return longest(name, std::vector<pcomb_parser>(parsers));
}

pcomb_parser pcomb_builder::longest(const std::string & name, const std::vector<pcomb_parser> & parsers) {
    if (name.empty()) {
        throw std::invalid_argument("longest: name must not be empty");
    }
    return pcomb_parser(std::make_shared<longest_parser>(parsers, name));
}

pcomb_parser pcomb_builder::many(const pcomb_parser & p) {
    return pcomb_parser(std::make_shared<repeat_parser>(p, pcomb_parser(), 0));
}

pcomb_parser pcomb_builder::many(const pcomb_parser & p, const pcomb_parser & separator) {
    pcomb_require(separator, "many");
    return pcomb_parser(std::make_shared<repeat_parser>(p, separator, 0));
}

pcomb_parser pcomb_builder::some(const pcomb_parser & p) {
    return pcomb_parser(std::make_shared<repeat_parser>(p, pcomb_parser(), 1));
}

pcomb_parser pcomb_builder::some(const pcomb_parser & p, const pcomb_parser & separator) {
    pcomb_require(separator, "some");
    return pcomb_parser(std::make_shared<repeat_parser>(p, separator, 1));
}

pcomb_parser pcomb_builder::maybe(const pcomb_parser & p) {
    return pcomb_parser(std::make_shared<maybe_parser>(p));
}

pcomb_parser pcomb_builder::cut() {
    return pcomb_parser(std::make_shared<cut_parser>());
}

pcomb_parser pcomb_builder::bind(const pcomb_parser & p, const pcomb_value & value) {
    return pcomb_parser(std::make_shared<bind_parser>(p, value));
}

pcomb_parser pcomb_builder::map(const pcomb_parser & p, std::function<void(pcomb_node &)> fn) {
    return pcomb_parser(std::make_shared<map_parser>(p, std::move(fn), "Map"));
}

pcomb_parser pcomb_builder::merge(const pcomb_parser & p) {
    return pcomb_parser(std::make_shared<map_parser>(p, [](pcomb_node & node) {
        node.token = flatten_token(node);
    }, "Merge"));
}

pcomb_parser pcomb_builder::no_auto_ws(const pcomb_parser & p) {
    return pcomb_parser(std::make_shared<no_auto_ws_parser>(p));
}
