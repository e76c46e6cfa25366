#include "json-grammar.h"
#include "log.h"
#include "pcomb.h"
#include "signal-grammar.h"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

struct run_config {
    enum class grammar_kind { JSON, SIGNAL } grammar = grammar_kind::JSON;

    std::string input;
    std::string log_file;
    pcomb_ws_fn ws = pcomb_ws_unicode;

    bool trace           = false;
    bool trace_json      = false;
    bool print_tree      = false;
    bool verbose         = false;
    bool disable_logging = false;

    enum class input_source { NONE, FILE, ARGUMENT, STDIN } source = input_source::NONE;
};

static void print_usage_information(const char * argv0) {
    LOG("Usage: %s [options]\n\n", argv0);
    LOG("The run program parses its input with one of the built-in grammars\n");
    LOG("and prints the resulting value as JSON to standard output.\n\n");
    LOG("Input sources (exactly one required):\n");
    LOG("  -f, --file FILENAME              Read input from file\n");
    LOG("  -p, --prompt TEXT                Use input from command line\n");
    LOG("  --stdin                          Read input from standard input\n\n");
    LOG("Grammar options:\n");
    LOG("  --grammar json|signal            Grammar to use (default: json)\n");
    LOG("                                   signal finds \"<quantity> ... eggs|chickens\" amid noise\n");
    LOG("  --ws none|ascii|unicode          Whitespace skipped between tokens (default: unicode)\n\n");
    LOG("Output options:\n");
    LOG("  --tree                           Print the match tree instead of the value\n");
    LOG("  --trace                          Log every parser invocation\n");
    LOG("  --trace-json                     Write every parser invocation to stderr as JSON lines\n\n");
    LOG("Other options:\n");
    LOG("  -v, --verbose                    Enable debug logs\n");
    LOG("  --log-disable                    Only log errors\n");
    LOG("  --log-file FILENAME              Also write logs to a file\n");
    LOG("  -h, --help                       Show this help and exit\n");
    LOG("\nExit status: 0 on success, 1 on a match error, 2 on unparsed input, 3 on usage errors\n");
    LOG("\nExamples:\n");
    LOG("  %s -p '{\"a\": [1, 2, 3]}'\n", argv0);
    LOG("  %s --grammar signal -p 'i would like 12 large eggs please'\n", argv0);
    LOG("  echo '[true, null]' | %s --stdin --tree\n", argv0);
}

static std::string read_file_safely(const std::string & filepath) {
    LOG_DBG("Reading input from file: %s\n", filepath.c_str());

    std::ifstream file(filepath, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open file '" + filepath + "': " + std::strerror(errno));
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    if (file.fail() && !file.eof()) {
        throw std::runtime_error("Error reading file '" + filepath + "': " + std::strerror(errno));
    }

    std::string content = buffer.str();
    LOG_DBG("Read %zu bytes from file\n", content.size());
    return content;
}

static std::string read_stdin_safely() {
    LOG_DBG("Reading input from standard input\n");

    std::ostringstream buffer;
    buffer << std::cin.rdbuf();

    if (std::cin.bad()) {
        throw std::runtime_error("Error reading from standard input");
    }

    std::string content = buffer.str();
    LOG_DBG("Read %zu bytes from stdin\n", content.size());
    return content;
}

static void set_source(run_config & config, run_config::input_source source) {
    if (config.source != run_config::input_source::NONE) {
        throw std::invalid_argument("Multiple input sources specified (--stdin, --file, --prompt are mutually exclusive)");
    }
    config.source = source;
}

static run_config parse_arguments(const std::vector<std::string> & argv) {
    run_config config;

    for (size_t i = 1; i < argv.size(); ++i) {
        const std::string & arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage_information(argv[0].c_str());
            std::exit(0);
        }
        else if (arg == "--stdin") {
            set_source(config, run_config::input_source::STDIN);
        }
        else if ((arg == "-f" || arg == "--file") && i + 1 < argv.size()) {
            set_source(config, run_config::input_source::FILE);
            config.input = argv[++i]; // file name until load_input()
        }
        else if ((arg == "-p" || arg == "--prompt") && i + 1 < argv.size()) {
            set_source(config, run_config::input_source::ARGUMENT);
            config.input = argv[++i];
        }
        else if (arg == "--grammar" && i + 1 < argv.size()) {
            const std::string & value = argv[++i];
            if (value == "json") {
                config.grammar = run_config::grammar_kind::JSON;
            } else if (value == "signal") {
                config.grammar = run_config::grammar_kind::SIGNAL;
            } else {
                throw std::invalid_argument("Unknown grammar: " + value);
            }
        }
        else if (arg == "--ws" && i + 1 < argv.size()) {
            const std::string & value = argv[++i];
            if (value == "none") {
                config.ws = pcomb_ws_none;
            } else if (value == "ascii") {
                config.ws = pcomb_ws_ascii;
            } else if (value == "unicode") {
                config.ws = pcomb_ws_unicode;
            } else {
                throw std::invalid_argument("Unknown whitespace policy: " + value);
            }
        }
        else if (arg == "--tree") {
            config.print_tree = true;
        }
        else if (arg == "--trace") {
            config.trace = true;
        }
        else if (arg == "--trace-json") {
            config.trace_json = true;
        }
        else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        }
        else if (arg == "--log-disable") {
            config.disable_logging = true;
        }
        else if (arg == "--log-file" && i + 1 < argv.size()) {
            config.log_file = argv[++i];
        }
        else if (arg == "-f" || arg == "--file" || arg == "-p" || arg == "--prompt" || arg == "--grammar" || arg == "--ws" || arg == "--log-file") {
            throw std::invalid_argument("Option " + arg + " requires an argument");
        }
        else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }

    if (config.source == run_config::input_source::NONE) {
        throw std::invalid_argument("Input source is required (use --stdin, --file, or --prompt)");
    }

    return config;
}

static void load_input(run_config & config) {
    switch (config.source) {
        case run_config::input_source::FILE:
            config.input = read_file_safely(config.input);
            break;
        case run_config::input_source::STDIN:
            config.input = read_stdin_safely();
            break;
        case run_config::input_source::ARGUMENT:
            break;
        case run_config::input_source::NONE:
            throw std::logic_error("Invalid input source");
    }
}

static void setup_logging(const run_config & config) {
    common_log_set_colors(common_log_main(), false);
    common_log_set_prefix(common_log_main(), true);
    common_log_set_timestamps(common_log_main(), false);

    if (!config.log_file.empty()) {
        common_log_set_file(common_log_main(), config.log_file.c_str());
    }

    pcomb_log_set(common_log_pcomb_callback, nullptr);

    if (config.verbose || config.trace) {
        common_log_set_verbosity_thold(LOG_DEFAULT_DEBUG);
    }
    if (config.disable_logging) {
        common_log_set_verbosity_thold(-1);
    }
}

int main(int argc, char ** argv) {
    std::vector<std::string> args(argv, argv + argc);

    run_config config;
    try {
        config = parse_arguments(args);
    } catch (const std::invalid_argument & e) {
        LOG_ERR("%s\n", e.what());
        LOG_ERR("Use '%s --help' for usage information\n", argv[0]);
        return 3;
    }

    setup_logging(config);

    try {
        load_input(config);
    } catch (const std::exception & e) {
        LOG_ERR("%s\n", e.what());
        return 3;
    }

    pcomb_parser grammar = config.grammar == run_config::grammar_kind::JSON
        ? common_json_grammar()
        : common_signal_grammar();

    LOG_DBG("grammar: %s\n", grammar.dump().c_str());

    if (config.trace && config.trace_json) {
        LOG_WRN("%s: --trace-json given, ignoring --trace\n", __func__);
    }

    std::unique_ptr<pcomb_trace_sink> sink;
    if (config.trace_json) {
        sink = std::make_unique<pcomb_trace_json>(std::cerr);
    } else if (config.trace) {
        sink = std::make_unique<pcomb_trace_log>();
    }

    pcomb_run_params params = pcomb_run_default_params();
    params.ws    = config.ws;
    params.trace = sink.get();

    pcomb_run_result res;
    try {
        res = pcomb_run(grammar, config.input, params);
    } catch (const std::exception & e) {
        LOG_ERR("%s: grammar action failed: %s\n", __func__, e.what());
        return 1;
    }

    LOG_INF("%s: %s after %zu of %zu bytes\n", __func__, pcomb_run_status_name(res.status), res.pos, config.input.size());

    switch (res.status) {
        case PCOMB_RUN_SUCCESS:
            break;
        case PCOMB_RUN_MATCH_ERROR:
            LOG_ERR("%s\n", res.message().c_str());
            return 1;
        case PCOMB_RUN_UNPARSED_INPUT:
            LOG_ERR("%s\n", res.message().c_str());
            return 2;
    }

    // input strings are not guaranteed to be valid UTF-8
    const auto & out = config.print_tree ? res.node.to_json() : res.value();
    printf("%s\n", out.dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::replace).c_str());

    return 0;
}
