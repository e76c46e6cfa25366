#include "pcomb-impl.h"

const char * pcomb_run_status_name(pcomb_run_status status) {
    switch (status) {
        case PCOMB_RUN_SUCCESS:        return "success";
        case PCOMB_RUN_MATCH_ERROR:    return "match error";
        case PCOMB_RUN_UNPARSED_INPUT: return "unparsed input";
    }
    return "unknown";
}

pcomb_run_params pcomb_run_default_params() {
    pcomb_run_params result = {
        /*.ws    =*/ pcomb_ws_unicode,
        /*.trace =*/ nullptr,
    };

    return result;
}

std::string pcomb_run_result::message() const {
    switch (status) {
        case PCOMB_RUN_SUCCESS:        return std::string();
        case PCOMB_RUN_MATCH_ERROR:    return error.to_string();
        case PCOMB_RUN_UNPARSED_INPUT: return "left unparsed: " + leftover;
    }
    return std::string();
}

pcomb_run_result pcomb_run(const pcomb_parser & p, std::string_view input, const pcomb_run_params & params) {
    pcomb_require(p, "pcomb_run");

    pcomb_state ps(input, params.ws, params.trace);
    pcomb_run_result res;

    ps.skip_ws();
    p.parse(ps, res.node);
    ps.skip_ws();

    res.pos = ps.pos;

    if (ps.errored()) {
        res.status = PCOMB_RUN_MATCH_ERROR;
        res.error  = ps.error;
        PCOMB_LOG_DEBUG("%s: %s\n", __func__, res.error.to_string().c_str());
        return res;
    }

    if (!ps.at_end()) {
        res.status   = PCOMB_RUN_UNPARSED_INPUT;
        res.leftover = std::string(ps.remaining());
        PCOMB_LOG_DEBUG("%s: %zu bytes left unparsed at offset %zu: \"%s\"\n", __func__,
                res.leftover.size(), res.pos, pcomb_escape(ps.preview(32)).c_str());
        return res;
    }

    res.status = PCOMB_RUN_SUCCESS;
    return res;
}

pcomb_value pcomb_parse(const pcomb_parser & p, std::string_view input, const pcomb_run_params & params) {
    auto res = pcomb_run(p, input, params);
    switch (res.status) {
        case PCOMB_RUN_MATCH_ERROR:    throw pcomb_match_error(res.error);
        case PCOMB_RUN_UNPARSED_INPUT: throw pcomb_unparsed_input_error(res.leftover);
        case PCOMB_RUN_SUCCESS:        break;
    }
    return std::move(res.node.value);
}
