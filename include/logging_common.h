/*
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 *
 * By contributing to this project, you agree to license your contributions
 * under the GPLv3 (or any later version) or any future licenses chosen by
 * the project author(s). Contributions include any modifications,
 * enhancements, or additions to the project. These contributions become
 * part of the project and are adopted by the project author(s).
 *
 * Common Logging Interface - Callback-based logging for the remote engine
 *
 * The engine library never writes to a stream on its own. The host program
 * (the ftvremote CLI, or a test binary) registers a logging callback at
 * initialization. Debug messages are only forwarded while debug mode is on.
 */

#ifndef FTV_LOGGING_COMMON_H
#define FTV_LOGGING_COMMON_H

#include <stdarg.h>
#include <stdbool.h>

/**
 * @brief Log level enumeration
 */
typedef enum {
   FTV_LOG_DEBUG = 0,
   FTV_LOG_INFO = 1,
   FTV_LOG_WARNING = 2,
   FTV_LOG_ERROR = 3,
} ftv_log_level_t;

/**
 * @brief Callback function type for logging
 *
 * @param level Log level
 * @param file Source file name (from __FILE__)
 * @param line Line number (from __LINE__)
 * @param func Function name (from __func__)
 * @param fmt Printf-style format string
 * @param args Variable arguments list
 */
typedef void (*ftv_log_callback_t)(ftv_log_level_t level,
                                   const char *file,
                                   int line,
                                   const char *func,
                                   const char *fmt,
                                   va_list args);

/**
 * @brief Set the logging callback
 *
 * If not set, log messages are discarded.
 *
 * Thread Safety: NOT thread-safe. Call once at initialization.
 *
 * @param callback The logging callback function, or NULL to disable logging
 */
void ftv_set_logger(ftv_log_callback_t callback);

/**
 * @brief Enable or disable forwarding of FTV_LOG_DEBUG messages
 *
 * @param enabled true to forward debug messages
 */
void ftv_log_set_debug(bool enabled);

/**
 * @brief Check whether debug messages are currently forwarded
 */
bool ftv_log_debug_enabled(void);

/**
 * @brief Get the printable name of a log level ("DEBUG", "INFO", ...)
 */
const char *ftv_log_level_name(ftv_log_level_t level);

/**
 * @brief Internal logging function - do not call directly
 *
 * Use the FTV_LOG_* macros instead.
 */
void ftv_log(ftv_log_level_t level,
             const char *file,
             int line,
             const char *func,
             const char *fmt,
             ...) __attribute__((format(printf, 5, 6)));

#define FTV_LOG_DEBUG(fmt, ...) \
   ftv_log(FTV_LOG_DEBUG, __FILE__, __LINE__, __func__, fmt, ##__VA_ARGS__)

#define FTV_LOG_INFO(fmt, ...) \
   ftv_log(FTV_LOG_INFO, __FILE__, __LINE__, __func__, fmt, ##__VA_ARGS__)

#define FTV_LOG_WARNING(fmt, ...) \
   ftv_log(FTV_LOG_WARNING, __FILE__, __LINE__, __func__, fmt, ##__VA_ARGS__)

#define FTV_LOG_ERROR(fmt, ...) \
   ftv_log(FTV_LOG_ERROR, __FILE__, __LINE__, __func__, fmt, ##__VA_ARGS__)

#endif /* FTV_LOGGING_COMMON_H */
