#include "tests.h"

#include <sstream>

struct captured_log {
    std::vector<std::string> lines;
    std::vector<pcomb_log_level> levels;
};

static void capture_log(pcomb_log_level level, const char * text, void * user_data) {
    auto * log = static_cast<captured_log *>(user_data);
    log->levels.push_back(level);
    log->lines.push_back(text);
}

void test_trace(testing &t) {
    pcomb_builder p;

    t.test("collect", [&](testing &t) {
        pcomb_trace_collect sink;

        pcomb_run_params params = pcomb_run_default_params();
        params.trace = &sink;

        auto res = pcomb_run(p.seq({"a", "b"}), "a b", params);
        t.assert_true("success", res.success());

        const auto & records = sink.records();
        t.assert_equal("record count", 3, (int) records.size());
        if (records.size() == 3) {
            t.assert_equal("first", std::string("a"), records[0].name);
            t.assert_equal("first depth", 1, records[0].depth);
            t.assert_equal("second", std::string("b"), records[1].name);
            t.assert_equal("second pos", 1, (int) records[1].pos);
            t.assert_equal("last", std::string("Seq()"), records[2].name);
            t.assert_equal("last depth", 0, records[2].depth);
            t.assert_equal("last input", std::string("a b"), records[2].input);
            t.assert_true("last ok", records[2].ok);
        }
    });

    t.test("failures carry the expectation", [&](testing &t) {
        pcomb_trace_collect sink;

        pcomb_run_params params = pcomb_run_default_params();
        params.trace = &sink;

        pcomb_run(p.exact("x"), "y", params);
        t.assert_equal("record count", 1, (int) sink.records().size());
        if (!sink.records().empty()) {
            t.assert_true("not ok", !sink.records()[0].ok);
            t.assert_equal("expected", std::string("x"), sink.records()[0].expected);
        }

        sink.clear();
        t.assert_true("cleared", sink.records().empty());
    });

    t.test("tracing does not change results", [&](testing &t) {
        auto alpha  = p.chars("a-z");
        auto parser = p.many(p.any({p.seq({"<", p.cut(), alpha, ">"}), alpha}));

        pcomb_trace_collect sink;
        pcomb_run_params params = pcomb_run_default_params();
        params.trace = &sink;

        auto plain  = pcomb_run(parser, "asdf <foo");
        auto traced = pcomb_run(parser, "asdf <foo", params);
        t.assert_equal("message", plain.message(), traced.message());
        t.assert_true("records", !sink.records().empty());
    });

    t.test("json lines", [&](testing &t) {
        std::ostringstream out;
        pcomb_trace_json sink(out);

        pcomb_run_params params = pcomb_run_default_params();
        params.trace = &sink;

        pcomb_run(p.seq({"a", "c"}), "a b", params);

        std::istringstream in(out.str());
        std::string line;
        int count = 0;
        bool saw_failure = false;
        while (std::getline(in, line)) {
            auto j = nlohmann::ordered_json::parse(line);
            t.assert_true("has name", j.contains("name"));
            if (!j["ok"].get<bool>()) {
                saw_failure = true;
                t.assert_true("has expected", j.contains("expected"));
            }
            count++;
        }
        t.assert_equal("line count", 3, count);
        t.assert_true("failure recorded", saw_failure);
    });

    t.test("log sink", [&](testing &t) {
        captured_log log;
        pcomb_log_set(capture_log, &log);

        pcomb_trace_log sink;
        pcomb_run_params params = pcomb_run_default_params();
        params.trace = &sink;

        pcomb_run(p.seq({"a", "b"}), "a b", params);

        pcomb_log_set(nullptr, nullptr);

        bool found = false;
        for (size_t i = 0; i < log.lines.size(); ++i) {
            if (log.lines[i].find("Seq()") != std::string::npos) {
                found = true;
                t.assert_true("debug level", log.levels[i] == PCOMB_LOG_LEVEL_DEBUG);
            }
        }
        t.assert_true("seq traced", found);
    });
}
