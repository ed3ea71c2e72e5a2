#pragma once

#include "fp_log.h"
#include <cstdarg>
#include <string>

namespace fp {

// printf-style logging front-end over the fp_log C core
class Log {
public:
    static void debug(const char* format, ...) {
        va_list args;
        va_start(args, format);
        fp_log_v(FP_LOG_DEBUG, format, args);
        va_end(args);
    }

    static void info(const char* format, ...) {
        va_list args;
        va_start(args, format);
        fp_log_v(FP_LOG_INFO, format, args);
        va_end(args);
    }

    static void warn(const char* format, ...) {
        va_list args;
        va_start(args, format);
        fp_log_v(FP_LOG_WARN, format, args);
        va_end(args);
    }

    static void error(const char* format, ...) {
        va_list args;
        va_start(args, format);
        fp_log_v(FP_LOG_ERROR, format, args);
        va_end(args);
    }

    static void set_level(fp_log_level level) {
        fp_log_set_level(level);
    }

    static fp_log_level level() {
        return fp_log_get_level();
    }

    static void set_callback(fp_log_callback callback) {
        fp_log_set_callback(callback);
    }
};

} // namespace fp
