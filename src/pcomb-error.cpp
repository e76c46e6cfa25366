#include "pcomb-impl.h"

std::string pcomb_error::to_string() const {
    return "offset " + std::to_string(pos) + ": expected " + expected;
}

pcomb_match_error::pcomb_match_error(const pcomb_error & error)
    : std::runtime_error(error.to_string()), error_(error) {}

pcomb_unparsed_input_error::pcomb_unparsed_input_error(const std::string & remaining)
    : std::runtime_error("left unparsed: " + remaining), remaining_(remaining) {}
