#pragma once

#include <cstdarg>

enum classnote_log_level {
    CLASSNOTE_LOG_LEVEL_NONE  = 0,
    CLASSNOTE_LOG_LEVEL_DEBUG = 1,
    CLASSNOTE_LOG_LEVEL_INFO  = 2,
    CLASSNOTE_LOG_LEVEL_WARN  = 3,
    CLASSNOTE_LOG_LEVEL_ERROR = 4,
};

typedef void (*classnote_log_callback)(enum classnote_log_level level, const char * text, void * user_data);

// Set the log callback used by the library.
// Passing nullptr restores the default callback, which writes to stderr.
void classnote_log_set(classnote_log_callback log_callback, void * user_data);

// Messages below this level are not passed to the callback (default: INFO).
void classnote_log_set_level(enum classnote_log_level level);

#ifdef __GNUC__
#    define CLASSNOTE_ATTRIBUTE_FORMAT(...) __attribute__((format(printf, __VA_ARGS__)))
#else
#    define CLASSNOTE_ATTRIBUTE_FORMAT(...)
#endif

CLASSNOTE_ATTRIBUTE_FORMAT(2, 3)
void classnote_log_internal(enum classnote_log_level level, const char * format, ...);

#define CLASSNOTE_LOG_ERROR(...) classnote_log_internal(CLASSNOTE_LOG_LEVEL_ERROR, __VA_ARGS__)
#define CLASSNOTE_LOG_WARN(...)  classnote_log_internal(CLASSNOTE_LOG_LEVEL_WARN , __VA_ARGS__)
#define CLASSNOTE_LOG_INFO(...)  classnote_log_internal(CLASSNOTE_LOG_LEVEL_INFO , __VA_ARGS__)
#define CLASSNOTE_LOG_DEBUG(...) classnote_log_internal(CLASSNOTE_LOG_LEVEL_DEBUG, __VA_ARGS__)
