#pragma once

#include <cstdint>
#include <string>
#include <string_view>

// UTF-8 helpers for the leaf matchers and whitespace policies

struct utf8_parse_result {
    uint32_t codepoint;      // Decoded codepoint (only valid if status == SUCCESS)
    size_t bytes_consumed;   // How many bytes this codepoint uses (1-4)
    enum status { SUCCESS, INCOMPLETE, INVALID } status;

    utf8_parse_result(enum status s, uint32_t cp = 0, size_t bytes = 0)
        : codepoint(cp), bytes_consumed(bytes), status(s) {}
};

// Determine the expected length of a UTF-8 sequence from its first byte
// Returns 0 for invalid first bytes
size_t pcomb_utf8_sequence_length(unsigned char first_byte);

// Parse a single UTF-8 codepoint from input
utf8_parse_result pcomb_parse_utf8_codepoint(std::string_view input, size_t offset);

std::string pcomb_unicode_cpt_to_utf8(uint32_t cpt);

// Unicode White_Space property
bool pcomb_unicode_is_space(uint32_t cpt);
