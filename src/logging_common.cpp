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
 */

#include "logging_common.h"

static ftv_log_callback_t g_log_callback = nullptr;
static bool g_debug_enabled = false;

void ftv_set_logger(ftv_log_callback_t callback) {
   g_log_callback = callback;
}

void ftv_log_set_debug(bool enabled) {
   g_debug_enabled = enabled;
}

bool ftv_log_debug_enabled(void) {
   return g_debug_enabled;
}

const char *ftv_log_level_name(ftv_log_level_t level) {
   switch (level) {
      case FTV_LOG_DEBUG:
         return "DEBUG";
      case FTV_LOG_INFO:
         return "INFO";
      case FTV_LOG_WARNING:
         return "WARNING";
      case FTV_LOG_ERROR:
         return "ERROR";
   }
   return "UNKNOWN";
}

void ftv_log(ftv_log_level_t level,
             const char *file,
             int line,
             const char *func,
             const char *fmt,
             ...) {
   if (!g_log_callback)
      return;
   if (level == FTV_LOG_DEBUG && !g_debug_enabled)
      return;

   va_list args;
   va_start(args, fmt);
   g_log_callback(level, file, line, func, fmt, args);
   va_end(args);
}
