#pragma once

#ifndef __cplusplus
#error "This header is for C++ only"
#endif

#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <initializer_list>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#ifdef PCOMB_SHARED
#    if defined(_WIN32) && !defined(__MINGW32__)
#        ifdef PCOMB_BUILD
#            define PCOMB_API __declspec(dllexport)
#        else
#            define PCOMB_API __declspec(dllimport)
#        endif
#    else
#        define PCOMB_API __attribute__ ((visibility ("default")))
#    endif
#else
#    define PCOMB_API
#endif

//
// logging
//

enum pcomb_log_level {
    PCOMB_LOG_LEVEL_NONE  = 0,
    PCOMB_LOG_LEVEL_DEBUG = 1,
    PCOMB_LOG_LEVEL_INFO  = 2,
    PCOMB_LOG_LEVEL_WARN  = 3,
    PCOMB_LOG_LEVEL_ERROR = 4,
    PCOMB_LOG_LEVEL_CONT  = 5, // continue previous log
};

typedef void (*pcomb_log_callback)(enum pcomb_log_level level, const char * text, void * user_data);

// Set callback for all future logging events.
// If this is not called, or NULL is supplied, everything is output on stderr.
PCOMB_API void pcomb_log_set(pcomb_log_callback log_callback, void * user_data);

//
// errors
//

// A failed match: the offset where it happened and a description of what was
// expected there. An empty `expected` is the "no failure" sentinel.
struct pcomb_error {
    size_t      pos = 0;
    std::string expected;

    bool empty() const { return expected.empty(); }

    // furthest position wins, ties go to this (the more recent) error
    bool outranks(const pcomb_error & other) const { return pos >= other.pos; }

    // "offset 4: expected hello"
    std::string to_string() const;
};

// Thrown by pcomb_parse() when the grammar does not match.
class PCOMB_API pcomb_match_error : public std::runtime_error {
    pcomb_error error_;

  public:
    explicit pcomb_match_error(const pcomb_error & error);

    const pcomb_error & error() const { return error_; }
    size_t pos() const { return error_.pos; }
    const std::string & expected() const { return error_.expected; }
};

// Thrown by pcomb_parse() when the grammar matched but input was left over.
class PCOMB_API pcomb_unparsed_input_error : public std::runtime_error {
    std::string remaining_;

  public:
    explicit pcomb_unparsed_input_error(const std::string & remaining);

    const std::string & remaining() const { return remaining_; }
};

//
// results
//

using pcomb_value = nlohmann::ordered_json;

// One matched span. `value` is null until a bind/map (or a literal matcher
// that produces one) assigns it.
struct pcomb_node {
    std::string             token;
    std::vector<pcomb_node> children;
    pcomb_value             value;
    bool                    noise = false; // filler matched by signal_seq

    bool empty() const { return token.empty() && children.empty() && value.is_null(); }

    void clear();

    // copy without the noise children
    pcomb_node without_noise() const;

    nlohmann::ordered_json to_json() const;
};

//
// tracing
//

struct pcomb_trace_record {
    std::string name;     // short parser label, e.g. "Seq()" or a literal
    size_t      pos;      // cursor offset on entry
    std::string input;    // preview of the input at pos
    bool        ok;
    std::string expected; // set when !ok
    int         depth;
};

class PCOMB_API pcomb_trace_sink {
  public:
    virtual ~pcomb_trace_sink() = default;

    virtual void record(const pcomb_trace_record & rec) = 0;
};

// Writes every record through the library log at debug level.
class PCOMB_API pcomb_trace_log : public pcomb_trace_sink {
  public:
    void record(const pcomb_trace_record & rec) override;
};

// Writes one JSON object per line.
class PCOMB_API pcomb_trace_json : public pcomb_trace_sink {
    std::ostream & out_;

  public:
    explicit pcomb_trace_json(std::ostream & out) : out_(out) {}

    void record(const pcomb_trace_record & rec) override;
};

// Keeps records in memory.
class PCOMB_API pcomb_trace_collect : public pcomb_trace_sink {
    std::vector<pcomb_trace_record> records_;

  public:
    void record(const pcomb_trace_record & rec) override { records_.push_back(rec); }

    const std::vector<pcomb_trace_record> & records() const { return records_; }

    void clear() { records_.clear(); }
};

//
// cursor
//

struct pcomb_state;

typedef void (*pcomb_ws_fn)(pcomb_state & ps);

PCOMB_API void pcomb_ws_none   (pcomb_state & ps);
PCOMB_API void pcomb_ws_ascii  (pcomb_state & ps); // [ \t\n\v\f\r]
PCOMB_API void pcomb_ws_unicode(pcomb_state & ps); // ascii plus the Unicode White_Space code points

// Mutable scan state for one parse. Exclusively owned by one parse call.
struct pcomb_state {
    std::string_view    input;
    size_t              pos   = 0;
    size_t              cut   = 0;
    pcomb_error         error;
    pcomb_ws_fn         ws    = pcomb_ws_unicode;
    pcomb_trace_sink *  trace = nullptr;
    int                 depth = 0;

    pcomb_state() = default;
    explicit pcomb_state(std::string_view input, pcomb_ws_fn ws = pcomb_ws_unicode, pcomb_trace_sink * trace = nullptr)
        : input(input), ws(ws ? ws : pcomb_ws_none), trace(trace) {}

    bool errored() const { return !error.empty(); }

    void error_here(const std::string & expected);
    void recover() { error.expected.clear(); }

    void advance(size_t n);
    void skip_ws() { ws(*this); }

    // the cut barrier only moves forward
    void raise_cut(size_t offset) { if (offset > cut) { cut = offset; } }

    bool at_end() const { return pos >= input.size(); }

    std::string_view remaining() const;
    std::string_view preview(size_t n) const;
};

//
// parsers
//

enum pcomb_parser_type {
    PCOMB_PARSER_EXACT,
    PCOMB_PARSER_CHARS,
    PCOMB_PARSER_REGEX,
    PCOMB_PARSER_STRING_LIT,
    PCOMB_PARSER_NUMBER_LIT,
    PCOMB_PARSER_SEQ,
    PCOMB_PARSER_ANY,
    PCOMB_PARSER_LONGEST,
    PCOMB_PARSER_REPEAT,
    PCOMB_PARSER_MAYBE,
    PCOMB_PARSER_CUT,
    PCOMB_PARSER_BIND,
    PCOMB_PARSER_MAP,
    PCOMB_PARSER_NO_AUTO_WS,
    PCOMB_PARSER_SIGNAL_SEQ,
    PCOMB_PARSER_RULE,
    PCOMB_PARSER_ROOT,
};

PCOMB_API const char * pcomb_parser_type_name(pcomb_parser_type type);

class PCOMB_API pcomb_parser_base {
  public:
    virtual ~pcomb_parser_base() = default;

    virtual pcomb_parser_type type() const = 0;

    // Template Method: emits a trace record when the state carries a sink,
    // delegates the matching to parse_impl()
    void parse(pcomb_state & ps, pcomb_node & node) const;

    virtual void parse_impl(pcomb_state & ps, pcomb_node & node) const = 0;

    // short label for trace records
    virtual std::string name() const = 0;

    // full structure, for debugging
    virtual std::string dump() const = 0;
};

// Lightweight handle around a shared parser. Converts implicitly from string
// literals (exact matches), so grammars can mix literals and sub-parsers.
class PCOMB_API pcomb_parser {
    std::shared_ptr<pcomb_parser_base> ptr_;

  public:
    pcomb_parser();
    pcomb_parser(std::shared_ptr<pcomb_parser_base> parser);
    pcomb_parser(const pcomb_parser & other) = default;
    pcomb_parser(const std::string & literal);
    pcomb_parser(const char * literal);

    pcomb_parser & operator=(const pcomb_parser & other) = default;

    pcomb_parser operator+(const pcomb_parser & other) const; // sequence
    pcomb_parser operator|(const pcomb_parser & other) const; // first match

    pcomb_parser_base & operator*() const;
    pcomb_parser_base * operator->() const;

    explicit operator bool() const { return ptr_ != nullptr; }

    std::shared_ptr<pcomb_parser_base> ptr() const { return ptr_; }

    void parse(pcomb_state & ps, pcomb_node & node) const;

    // shorthand for pcomb_builder::map()
    pcomb_parser map(std::function<void(pcomb_node &)> fn) const;

    std::string dump() const;
};

PCOMB_API pcomb_parser operator+(const char * lhs, const pcomb_parser & rhs);
PCOMB_API pcomb_parser operator|(const char * lhs, const pcomb_parser & rhs);

using pcomb_rule_map = std::unordered_map<std::string, pcomb_parser>;

class PCOMB_API pcomb_builder {
    std::shared_ptr<pcomb_rule_map> rules_;

  public:
    pcomb_builder();

    //
    // leaf matchers
    //

    // Matches an exact literal string.
    //   S -> "hello"
    pcomb_parser exact(const std::string & literal);

    // Matches between min and max code points from a class such as "a-z" or
    // "a-zA-Z0-9_". Use -1 for max to represent unbounded repetition.
    //   S -> [a-z]{m,n}
    pcomb_parser chars(const std::string & matcher, int min = 1, int max = -1);

    // Same as chars(), but matches code points NOT in the class.
    //   S -> [^a-z]{m,n}
    pcomb_parser not_chars(const std::string & matcher, int min = 1, int max = -1);

    // Matches an ECMAScript regular expression anchored at the cursor.
    pcomb_parser regex(const std::string & pattern);
    pcomb_parser named_regex(const std::string & name, const std::string & pattern);

    // Quoted string with backslash escapes; sets the value to the unescaped text.
    pcomb_parser string_lit(const std::string & quotes);

    // Integer or floating point number; sets the value accordingly.
    pcomb_parser number_lit();

    //
    // combinators
    //

    // Matches all parsers in order, each result in children[i].
    //   S -> A B C
    pcomb_parser seq(std::initializer_list<pcomb_parser> parsers);
    pcomb_parser seq(const std::vector<pcomb_parser> & parsers);

    // First alternative that matches; on total failure reports the furthest error.
    //   S -> A | B | C
    pcomb_parser any(std::initializer_list<pcomb_parser> parsers);
    pcomb_parser any(const std::vector<pcomb_parser> & parsers);

    // First alternative that matches; on total failure reports `name`.
    pcomb_parser any_with_name(const std::string & name, std::initializer_list<pcomb_parser> parsers);
    pcomb_parser any_with_name(const std::string & name, const std::vector<pcomb_parser> & parsers);

    // Alternative that advances the cursor furthest; ties keep the earliest.
    pcomb_parser longest(const std::string & name, std::initializer_list<pcomb_parser> parsers);
    pcomb_parser longest(const std::string & name, const std::vector<pcomb_parser> & parsers);

    // Zero or more matches, optionally separated. The separator is consumed
    // but not returned, a trailing separator is tolerated.
    //   S -> A*
    pcomb_parser many(const pcomb_parser & p);
    pcomb_parser many(const pcomb_parser & p, const pcomb_parser & separator);

    // One or more matches, optionally separated.
    //   S -> A+
    pcomb_parser some(const pcomb_parser & p);
    pcomb_parser some(const pcomb_parser & p, const pcomb_parser & separator);

    // Zero or one match; an absent match yields an empty node.
    //   S -> A?
    pcomb_parser maybe(const pcomb_parser & p);

    // Commit: failures past this point are not recovered by enclosing
    // alternations, repetitions or optionals.
    pcomb_parser cut();

    // Sets a constant value on success.
    pcomb_parser bind(const pcomb_parser & p, const pcomb_value & value);

    // Invokes fn with the populated node on success.
    pcomb_parser map(const pcomb_parser & p, std::function<void(pcomb_node &)> fn);

    // Replaces the token by the concatenation of all descendant tokens.
    pcomb_parser merge(const pcomb_parser & p);

    // Disables automatic whitespace skipping for everything below p.
    pcomb_parser no_auto_ws(const pcomb_parser & p);

    // Finds the signals, in order, amid arbitrary noise.
    pcomb_parser signal_seq(const pcomb_parser & noise, std::initializer_list<pcomb_parser> signals);
    pcomb_parser signal_seq(const pcomb_parser & noise, const std::vector<pcomb_parser> & signals);

    //
    // rules
    //

    // References a named rule, resolved at parse time. Use this for recursion.
    //   expr -> "(" expr? ")"
    pcomb_parser rule(const std::string & name);

    // Registers p under name and returns a reference to it.
    pcomb_parser add_rule(const std::string & name, const pcomb_parser & p);

    std::shared_ptr<pcomb_rule_map> rules() const { return rules_; }
};

// Helper function for building parsers. Wraps the returned root so that it
// owns the builder's rules.
PCOMB_API pcomb_parser build_pcomb_parser(const std::function<pcomb_parser(pcomb_builder &)> & fn);

//
// driver
//

enum pcomb_run_status {
    PCOMB_RUN_SUCCESS        = 0,
    PCOMB_RUN_MATCH_ERROR    = 1,
    PCOMB_RUN_UNPARSED_INPUT = 2,
};

PCOMB_API const char * pcomb_run_status_name(pcomb_run_status status);

struct pcomb_run_params {
    pcomb_ws_fn        ws;    // whitespace policy, pcomb_ws_unicode by default
    pcomb_trace_sink * trace; // optional, nullptr disables tracing
};

PCOMB_API pcomb_run_params pcomb_run_default_params();

struct pcomb_run_result {
    pcomb_run_status status = PCOMB_RUN_MATCH_ERROR;
    pcomb_node       node;
    pcomb_error      error;    // set for PCOMB_RUN_MATCH_ERROR
    size_t           pos = 0;  // final cursor offset
    std::string      leftover; // set for PCOMB_RUN_UNPARSED_INPUT

    bool success()        const { return status == PCOMB_RUN_SUCCESS; }
    bool match_error()    const { return status == PCOMB_RUN_MATCH_ERROR; }
    bool unparsed_input() const { return status == PCOMB_RUN_UNPARSED_INPUT; }

    const pcomb_value & value() const { return node.value; }

    // "offset 9: expected >" or "left unparsed: <foo"
    std::string message() const;
};

// Runs p over the whole input and reports leftover input separately from
// match failures.
PCOMB_API pcomb_run_result pcomb_run(
        const pcomb_parser     & p,
        std::string_view         input,
        const pcomb_run_params & params = pcomb_run_default_params());

// Same as pcomb_run(), but returns the root value and throws
// pcomb_match_error or pcomb_unparsed_input_error on failure.
PCOMB_API pcomb_value pcomb_parse(
        const pcomb_parser     & p,
        std::string_view         input,
        const pcomb_run_params & params = pcomb_run_default_params());
