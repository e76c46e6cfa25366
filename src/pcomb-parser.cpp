#include "pcomb-impl.h"

#include <algorithm>
#include <stdexcept>

#define PCOMB_TRACE_PREVIEW 32

const char * pcomb_parser_type_name(pcomb_parser_type type) {
    switch (type) {
        case PCOMB_PARSER_EXACT:      return "exact";
        case PCOMB_PARSER_CHARS:      return "chars";
        case PCOMB_PARSER_REGEX:      return "regex";
        case PCOMB_PARSER_STRING_LIT: return "string_lit";
        case PCOMB_PARSER_NUMBER_LIT: return "number_lit";
        case PCOMB_PARSER_SEQ:        return "seq";
        case PCOMB_PARSER_ANY:        return "any";
        case PCOMB_PARSER_LONGEST:    return "longest";
        case PCOMB_PARSER_REPEAT:     return "repeat";
        case PCOMB_PARSER_MAYBE:      return "maybe";
        case PCOMB_PARSER_CUT:        return "cut";
        case PCOMB_PARSER_BIND:       return "bind";
        case PCOMB_PARSER_MAP:        return "map";
        case PCOMB_PARSER_NO_AUTO_WS: return "no_auto_ws";
        case PCOMB_PARSER_SIGNAL_SEQ: return "signal_seq";
        case PCOMB_PARSER_RULE:       return "rule";
        case PCOMB_PARSER_ROOT:       return "root";
    }
    return "unknown";
}

void pcomb_parser_base::parse(pcomb_state & ps, pcomb_node & node) const {
    if (ps.trace == nullptr) {
        parse_impl(ps, node);
        return;
    }

    const size_t start = ps.pos;
    const int    depth = ps.depth++;

    parse_impl(ps, node);

    ps.depth = depth;

    pcomb_trace_record rec;
    rec.name     = name();
    rec.pos      = start;
    rec.input    = std::string(ps.input.substr(std::min(start, ps.input.size()), PCOMB_TRACE_PREVIEW));
    rec.ok       = !ps.errored();
    rec.expected = rec.ok ? std::string() : ps.error.expected;
    rec.depth    = depth;
    ps.trace->record(rec);
}

// References a named rule for recursive or reusable grammar definitions.
//   expr -> "(" expr? ")"
class rule_parser : public pcomb_parser_base {
    std::string name_;
    std::weak_ptr<pcomb_rule_map> rules_;

  public:
    static constexpr pcomb_parser_type type_value = PCOMB_PARSER_RULE;

    rule_parser(const std::string & name, const std::shared_ptr<pcomb_rule_map> & rules)
        : name_(name), rules_(rules) {}

    pcomb_parser_type type() const override { return type_value; }

    void parse_impl(pcomb_state & ps, pcomb_node & node) const override {
        auto rules = rules_.lock();
        if (!rules) {
            PCOMB_LOG_ERROR("%s: rule '%s' used after its grammar was released\n", __func__, name_.c_str());
            ps.error_here("rule " + name_);
            return;
        }

        auto it = rules->find(name_);
        if (it == rules->end() || !it->second) {
            PCOMB_LOG_ERROR("%s: rule '%s' not found in registry\n", __func__, name_.c_str());
            ps.error_here("rule " + name_);
            return;
        }

        it->second.parse(ps, node);
    }

    std::string name() const override { return name_; }

    std::string dump() const override {
        return "Rule(" + name_ + ")";
    }
};

// Owns the rule table of a grammar so that rule references (which only hold
// weak pointers) can form cycles without leaking.
class root_parser : public pcomb_parser_base {
    pcomb_parser root_;
    std::shared_ptr<pcomb_rule_map> rules_;

  public:
    static constexpr pcomb_parser_type type_value = PCOMB_PARSER_ROOT;

    root_parser(const pcomb_parser & root, std::shared_ptr<pcomb_rule_map> rules)
        : root_(root), rules_(std::move(rules)) {}

    pcomb_parser_type type() const override { return type_value; }

    void parse_impl(pcomb_state & ps, pcomb_node & node) const override {
        root_.parse(ps, node);
    }

    std::string name() const override { return root_->name(); }

    std::string dump() const override {
        std::vector<std::string> parts;
        parts.reserve(rules_->size());
        for (const auto & it : *rules_) {
            parts.push_back(it.first + " = " + it.second.dump());
        }
        if (parts.empty()) {
            return root_.dump();
        }
        return root_.dump() + " where " + string_join(parts, "; ");
    }
};

//
// pcomb_parser
//

pcomb_parser::pcomb_parser() {}

pcomb_parser::pcomb_parser(std::shared_ptr<pcomb_parser_base> parser) : ptr_(std::move(parser)) {}

pcomb_parser_base & pcomb_parser::operator*() const {
    return *ptr_;
}

pcomb_parser_base * pcomb_parser::operator->() const {
    return ptr_.get();
}

void pcomb_parser::parse(pcomb_state & ps, pcomb_node & node) const {
    if (!ptr_) {
        throw std::logic_error("pcomb_parser::parse called on an empty parser");
    }
    ptr_->parse(ps, node);
}

std::string pcomb_parser::dump() const {
    return ptr_ ? ptr_->dump() : "<empty>";
}

//
// pcomb_builder: rules
//

pcomb_builder::pcomb_builder()
    : rules_(std::make_shared<pcomb_rule_map>()) {}

pcomb_parser pcomb_builder::rule(const std::string & name) {
    if (name.empty()) {
        throw std::invalid_argument("rule: name must not be empty");
    }
    return pcomb_parser(std::make_shared<rule_parser>(name, rules_));
}

pcomb_parser pcomb_builder::add_rule(const std::string & name, const pcomb_parser & p) {
    pcomb_require(p, "add_rule");
    auto ref = rule(name);
    (*rules_)[name] = p;
    return ref;
}

pcomb_parser build_pcomb_parser(const std::function<pcomb_parser(pcomb_builder &)> & fn) {
    pcomb_builder builder;
    auto root = fn(builder);
    pcomb_require(root, "build_pcomb_parser");

    // Wrap the root so that it owns the rules and breaks circular references
    auto rules = builder.rules();
    if (rules && !rules->empty()) {
        return pcomb_parser(std::make_shared<root_parser>(root, rules));
    }
    return root;
}
