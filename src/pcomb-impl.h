#pragma once

#include "pcomb.h"

#include <string>
#include <string_view>

#ifdef __GNUC__
#    if defined(__MINGW32__) && !defined(__clang__)
#        define PCOMB_ATTRIBUTE_FORMAT(...) __attribute__((format(gnu_printf, __VA_ARGS__)))
#    else
#        define PCOMB_ATTRIBUTE_FORMAT(...) __attribute__((format(printf, __VA_ARGS__)))
#    endif
#else
#    define PCOMB_ATTRIBUTE_FORMAT(...)
#endif

//
// logging
//

PCOMB_ATTRIBUTE_FORMAT(2, 3)
void pcomb_log_internal        (pcomb_log_level level, const char * format, ...);
void pcomb_log_callback_default(pcomb_log_level level, const char * text, void * user_data);

#define PCOMB_LOG(...)       pcomb_log_internal(PCOMB_LOG_LEVEL_NONE , __VA_ARGS__)
#define PCOMB_LOG_INFO(...)  pcomb_log_internal(PCOMB_LOG_LEVEL_INFO , __VA_ARGS__)
#define PCOMB_LOG_WARN(...)  pcomb_log_internal(PCOMB_LOG_LEVEL_WARN , __VA_ARGS__)
#define PCOMB_LOG_ERROR(...) pcomb_log_internal(PCOMB_LOG_LEVEL_ERROR, __VA_ARGS__)
#define PCOMB_LOG_DEBUG(...) pcomb_log_internal(PCOMB_LOG_LEVEL_DEBUG, __VA_ARGS__)
#define PCOMB_LOG_CONT(...)  pcomb_log_internal(PCOMB_LOG_LEVEL_CONT , __VA_ARGS__)

//
// helpers
//

PCOMB_ATTRIBUTE_FORMAT(1, 2)
std::string format(const char * fmt, ...);

std::string string_join(const std::vector<std::string> & values, const std::string & separator);

// escapes control characters so previews stay on one line
std::string pcomb_escape(std::string_view s);

// Convenience cast, mirrors the parser type tag
template<typename T>
static std::shared_ptr<T> pcomb_cast(const std::shared_ptr<pcomb_parser_base> & p) {
    if (!p || p->type() != T::type_value) {
        return nullptr;
    }
    return std::static_pointer_cast<T>(p);
}

// Contract checks for combinator construction
void pcomb_require(const pcomb_parser & p, const char * what);
void pcomb_require_all(const std::vector<pcomb_parser> & parsers, const char * what);
