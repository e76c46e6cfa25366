#include "pcomb-impl.h"
#include "pcomb-unicode.h"

#include <algorithm>

void pcomb_state::error_here(const std::string & expected) {
    error.pos      = pos;
    error.expected = expected;
}

void pcomb_state::advance(size_t n) {
    pos = std::min(pos + n, input.size());
}

std::string_view pcomb_state::remaining() const {
    if (pos >= input.size()) {
        return std::string_view();
    }
    return input.substr(pos);
}

std::string_view pcomb_state::preview(size_t n) const {
    return remaining().substr(0, n);
}

//
// whitespace policies
//

void pcomb_ws_none(pcomb_state & ps) {
    (void) ps;
}

void pcomb_ws_ascii(pcomb_state & ps) {
    while (ps.pos < ps.input.size()) {
        switch (ps.input[ps.pos]) {
            case '\t':
            case '\n':
            case '\v':
            case '\f':
            case '\r':
            case ' ':
                ps.pos++;
                break;
            default:
                return;
        }
    }
}

void pcomb_ws_unicode(pcomb_state & ps) {
    while (ps.pos < ps.input.size()) {
        auto res = pcomb_parse_utf8_codepoint(ps.input, ps.pos);
        if (res.status != utf8_parse_result::SUCCESS || !pcomb_unicode_is_space(res.codepoint)) {
            return;
        }
        ps.pos += res.bytes_consumed;
    }
}
