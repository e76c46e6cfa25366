#pragma once

#include "pcomb.h"

// JSON document grammar built from the combinators.
// The value of a successful run is the decoded document; numbers without a
// fraction or exponent decode as integers. A trailing comma inside arrays
// and objects is tolerated. Once an opening bracket or a member's colon has
// been read, errors are reported at the offending position instead of being
// backtracked over.
pcomb_parser common_json_grammar();

// Convenience wrapper around pcomb_parse() with the JSON grammar.
// Throws pcomb_match_error or pcomb_unparsed_input_error.
pcomb_value common_json_parse(std::string_view input);
