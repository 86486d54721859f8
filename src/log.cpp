#include "classnote/log.h"

#include <atomic>
#include <cstdio>
#include <vector>

static void classnote_log_callback_default(enum classnote_log_level level, const char * text, void * user_data) {
    (void) level;
    (void) user_data;
    fputs(text, stderr);
    fflush(stderr);
}

struct classnote_logger {
    classnote_log_callback log_callback = classnote_log_callback_default;
    void * log_callback_user_data = nullptr;
    std::atomic<int> min_level{CLASSNOTE_LOG_LEVEL_INFO};
};

static classnote_logger g_logger;

void classnote_log_set(classnote_log_callback log_callback, void * user_data) {
    g_logger.log_callback = log_callback ? log_callback : classnote_log_callback_default;
    g_logger.log_callback_user_data = user_data;
}

void classnote_log_set_level(enum classnote_log_level level) {
    g_logger.min_level = level;
}

void classnote_log_internal(enum classnote_log_level level, const char * format, ...) {
    if (level < g_logger.min_level.load()) {
        return;
    }

    va_list args;
    va_start(args, format);
    char buffer[1024];
    va_list args_copy;
    va_copy(args_copy, args);
    const int len = vsnprintf(buffer, sizeof(buffer), format, args);
    if (len >= 0 && len < (int) sizeof(buffer)) {
        g_logger.log_callback(level, buffer, g_logger.log_callback_user_data);
    } else if (len >= 0) {
        std::vector<char> buffer2(len + 1);
        vsnprintf(buffer2.data(), buffer2.size(), format, args_copy);
        g_logger.log_callback(level, buffer2.data(), g_logger.log_callback_user_data);
    }
    va_end(args_copy);
    va_end(args);
}
