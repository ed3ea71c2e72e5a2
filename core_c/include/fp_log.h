#ifndef FP_LOG_H
#define FP_LOG_H

/// @file fp_log.h
/// @brief fragpipe logging

#ifdef _WIN32
    #if defined(FP_EXPORTS)
        #define FP_LOG_API __declspec(dllexport)
    #else
        #define FP_LOG_API
    #endif
#else
    #define FP_LOG_API
#endif

#include <stdarg.h>

#ifdef __cplusplus
extern "C" {
#endif

/// Log levels
typedef enum {
    FP_LOG_DEBUG = 0,  ///< Debug messages
    FP_LOG_INFO = 1,   ///< Informational messages
    FP_LOG_WARN = 2,   ///< Warnings
    FP_LOG_ERROR = 3   ///< Errors
} fp_log_level;

/// Callback for intercepting log output
/// @param level Message level
/// @param message Formatted message text
typedef void (*fp_log_callback)(fp_log_level level, const char* message);

/// Sets a callback that receives every message (e.g. a host console)
/// @param callback Handler, or NULL to restore the default console sink
FP_LOG_API void fp_log_set_callback(fp_log_callback callback);

/// Sets the minimal level; messages below it are dropped
FP_LOG_API void fp_log_set_level(fp_log_level min_level);

/// Returns the current minimal level
FP_LOG_API fp_log_level fp_log_get_level(void);

/// Returns the level name ("debug", "info", "warn", "error")
FP_LOG_API const char* fp_log_level_name(fp_log_level level);

/// Parses a level name. Returns 0 on unknown name, leaving *out untouched.
FP_LOG_API int fp_log_level_from_name(const char* name, fp_log_level* out);

/// Prints a message with the given level (printf-style)
FP_LOG_API void fp_log(fp_log_level level, const char* format, ...);

/// va_list variant of fp_log
FP_LOG_API void fp_log_v(fp_log_level level, const char* format, va_list args);

FP_LOG_API void fp_log_debug(const char* format, ...);
FP_LOG_API void fp_log_info(const char* format, ...);
FP_LOG_API void fp_log_warn(const char* format, ...);
FP_LOG_API void fp_log_error(const char* format, ...);

#ifdef __cplusplus
}
#endif

#endif // FP_LOG_H
