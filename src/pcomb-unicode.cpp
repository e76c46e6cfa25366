#include "pcomb-unicode.h"

size_t pcomb_utf8_sequence_length(unsigned char first_byte) {
    // Lookup table based on high 4 bits:
    // 0xxx xxxx = 1 byte  (ASCII)
    // 110x xxxx = 2 bytes
    // 1110 xxxx = 3 bytes
    // 1111 0xxx = 4 bytes (only 0xF0-0xF4 are valid starts)
    static const size_t lookup[] = {
        1, 1, 1, 1, 1, 1, 1, 1,  // 0000-0111 (0x00-0x7F) ASCII
        0, 0, 0, 0,              // 1000-1011 (0x80-0xBF) continuation bytes
        2, 2,                    // 1100-1101 (0xC0-0xDF) 2-byte sequences
        3,                       // 1110      (0xE0-0xEF) 3-byte sequences
        4                        // 1111      (0xF0-0xFF) potential 4-byte sequences
    };

    // 0xC0-0xC1 are overlong, 0xF5-0xFF would encode beyond U+10FFFF
    if (first_byte == 0xC0 || first_byte == 0xC1 || first_byte >= 0xF5) {
        return 0;
    }

    return lookup[first_byte >> 4];
}

utf8_parse_result pcomb_parse_utf8_codepoint(std::string_view input, size_t offset) {
    if (offset >= input.size()) {
        return utf8_parse_result(utf8_parse_result::INCOMPLETE);
    }

    const unsigned char first = static_cast<unsigned char>(input[offset]);

    // ASCII fast path (1-byte sequence)
    if (first < 0x80) {
        return utf8_parse_result(utf8_parse_result::SUCCESS, first, 1);
    }

    size_t seq_len = pcomb_utf8_sequence_length(first);
    if (seq_len == 0) {
        return utf8_parse_result(utf8_parse_result::INVALID);
    }

    // The whole input is available up front, so a short tail can never be completed.
    if (input.size() - offset < seq_len) {
        return utf8_parse_result(utf8_parse_result::INCOMPLETE);
    }

    for (size_t i = 1; i < seq_len; ++i) {
        unsigned char byte = static_cast<unsigned char>(input[offset + i]);
        if ((byte & 0xC0) != 0x80) {
            return utf8_parse_result(utf8_parse_result::INVALID);
        }
    }

    uint32_t codepoint = 0;

    if (seq_len == 2) {
        // 110xxxxx 10xxxxxx
        codepoint =
            ((first & 0x1F) << 6) |
            (static_cast<unsigned char>(input[offset + 1]) & 0x3F);
    } else if (seq_len == 3) {
        // 1110xxxx 10xxxxxx 10xxxxxx
        codepoint =
            ((first & 0x0F) << 12) |
            ((static_cast<unsigned char>(input[offset + 1]) & 0x3F) << 6) |
            (static_cast<unsigned char>(input[offset + 2]) & 0x3F);

        // overlong or surrogate
        if (codepoint < 0x800 || (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
            return utf8_parse_result(utf8_parse_result::INVALID);
        }
    } else if (seq_len == 4) {
        // 11110xxx 10xxxxxx 10xxxxxx 10xxxxxx
        codepoint =
            ((first & 0x07) << 18) |
            ((static_cast<unsigned char>(input[offset + 1]) & 0x3F) << 12) |
            ((static_cast<unsigned char>(input[offset + 2]) & 0x3F) << 6) |
            (static_cast<unsigned char>(input[offset + 3]) & 0x3F);

        if (codepoint < 0x10000 || codepoint > 0x10FFFF) {
            return utf8_parse_result(utf8_parse_result::INVALID);
        }
    }

    return utf8_parse_result(utf8_parse_result::SUCCESS, codepoint, seq_len);
}

std::string pcomb_unicode_cpt_to_utf8(uint32_t cpt) {
    std::string result;

    if (/* 0x00 <= cpt && */ cpt <= 0x7f) {
        result.push_back(cpt);
        return result;
    }
    if (0x80 <= cpt && cpt <= 0x7ff) {
        result.push_back(0xc0 | ((cpt >> 6) & 0x1f));
        result.push_back(0x80 | (cpt & 0x3f));
        return result;
    }
    if (0x800 <= cpt && cpt <= 0xffff) {
        result.push_back(0xe0 | ((cpt >> 12) & 0x0f));
        result.push_back(0x80 | ((cpt >> 6) & 0x3f));
        result.push_back(0x80 | (cpt & 0x3f));
        return result;
    }
    if (0x10000 <= cpt && cpt <= 0x10ffff) {
        result.push_back(0xf0 | ((cpt >> 18) & 0x07));
        result.push_back(0x80 | ((cpt >> 12) & 0x3f));
        result.push_back(0x80 | ((cpt >> 6) & 0x3f));
        result.push_back(0x80 | (cpt & 0x3f));
        return result;
    }

    // replacement character for anything out of range
    return "\xEF\xBF\xBD";
}

bool pcomb_unicode_is_space(uint32_t cpt) {
    switch (cpt) {
        case 0x0009: case 0x000A: case 0x000B: case 0x000C: case 0x000D:
        case 0x0020:
        case 0x0085:
        case 0x00A0:
        case 0x1680:
        case 0x2028: case 0x2029:
        case 0x202F:
        case 0x205F:
        case 0x3000:
            return true;
        default:
            return cpt >= 0x2000 && cpt <= 0x200A;
    }
}
