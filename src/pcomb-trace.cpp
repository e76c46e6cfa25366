#include "pcomb-impl.h"

#include <ostream>

void pcomb_trace_log::record(const pcomb_trace_record & rec) {
    const std::string input = pcomb_escape(rec.input);
    if (rec.ok) {
        PCOMB_LOG_DEBUG("%*s%s @%zu \"%s\" ok\n", rec.depth * 2, "", rec.name.c_str(), rec.pos, input.c_str());
    } else {
        PCOMB_LOG_DEBUG("%*s%s @%zu \"%s\" expected %s\n", rec.depth * 2, "", rec.name.c_str(), rec.pos, input.c_str(), rec.expected.c_str());
    }
}

void pcomb_trace_json::record(const pcomb_trace_record & rec) {
    nlohmann::ordered_json j = {
        {"name",  rec.name},
        {"pos",   rec.pos},
        {"input", rec.input},
        {"ok",    rec.ok},
        {"depth", rec.depth},
    };
    if (!rec.ok) {
        j["expected"] = rec.expected;
    }
    // input previews may cut a UTF-8 sequence in half
    out_ << j.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace) << "\n";
}
