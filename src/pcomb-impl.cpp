#include "pcomb-impl.h"

#include <climits>
#include <cstdarg>
#include <cstdio>
#include <stdexcept>
#include <vector>

struct pcomb_logger_state {
    pcomb_log_callback log_callback = pcomb_log_callback_default;
    void * log_callback_user_data = nullptr;
};

static pcomb_logger_state g_logger_state;

void pcomb_log_set(pcomb_log_callback log_callback, void * user_data) {
    g_logger_state.log_callback = log_callback ? log_callback : pcomb_log_callback_default;
    g_logger_state.log_callback_user_data = user_data;
}

static void pcomb_log_internal_v(pcomb_log_level level, const char * format, va_list args) {
    va_list args_copy;
    va_copy(args_copy, args);
    char buffer[128];
    int len = vsnprintf(buffer, 128, format, args);
    if (len < 128) {
        g_logger_state.log_callback(level, buffer, g_logger_state.log_callback_user_data);
    } else {
        char * buffer2 = new char[len + 1];
        vsnprintf(buffer2, len + 1, format, args_copy);
        buffer2[len] = 0;
        g_logger_state.log_callback(level, buffer2, g_logger_state.log_callback_user_data);
        delete[] buffer2;
    }
    va_end(args_copy);
}

void pcomb_log_internal(pcomb_log_level level, const char * format, ...) {
    va_list args;
    va_start(args, format);
    pcomb_log_internal_v(level, format, args);
    va_end(args);
}

void pcomb_log_callback_default(pcomb_log_level level, const char * text, void * user_data) {
    (void) level;
    (void) user_data;
    fputs(text, stderr);
    fflush(stderr);
}

std::string format(const char * fmt, ...) {
    va_list ap;
    va_list ap2;
    va_start(ap, fmt);
    va_copy(ap2, ap);
    int size = vsnprintf(NULL, 0, fmt, ap);
    if (size < 0 || size >= INT_MAX) {
        va_end(ap2);
        va_end(ap);
        throw std::runtime_error("format: vsnprintf failed");
    }
    std::vector<char> buf(size + 1);
    int size2 = vsnprintf(buf.data(), size + 1, fmt, ap2);
    va_end(ap2);
    va_end(ap);
    if (size2 != size) {
        throw std::runtime_error("format: vsnprintf size mismatch");
    }
    return std::string(buf.data(), size);
}

std::string string_join(const std::vector<std::string> & values, const std::string & separator) {
    std::string result;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            result += separator;
        }
        result += values[i];
    }
    return result;
}

std::string pcomb_escape(std::string_view s) {
    std::string escaped;
    escaped.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '\n': escaped += "\\n"; break;
            case '\t': escaped += "\\t"; break;
            case '\r': escaped += "\\r"; break;
            case '\\': escaped += "\\\\"; break;
            default:   escaped += c;      break;
        }
    }
    return escaped;
}

void pcomb_require(const pcomb_parser & p, const char * what) {
    if (!p) {
        throw std::invalid_argument(std::string(what) + ": parser is empty");
    }
}

void pcomb_require_all(const std::vector<pcomb_parser> & parsers, const char * what) {
    if (parsers.empty()) {
        throw std::invalid_argument(std::string(what) + ": needs at least one parser");
    }
    for (const auto & p : parsers) {
        pcomb_require(p, what);
    }
}
