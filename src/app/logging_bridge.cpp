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

#include "logging_bridge.h"

#include <errno.h>
#include <stdarg.h>
#include <stdio.h>
#include <string.h>
#include <sys/time.h>
#include <time.h>

#include "config/ftv_config.h"
#include "core/path_utils.h"
#include "logging_common.h"

static FILE *s_log_file = NULL;

static const char *base_name(const char *path) {
   const char *slash = strrchr(path, '/');
   return slash ? slash + 1 : path;
}

static void write_line(FILE *out,
                       const char *stamp,
                       ftv_log_level_t level,
                       const char *file,
                       int line,
                       const char *message) {
   if (level == FTV_LOG_DEBUG) {
      fprintf(out, "[%s] %-7s %s:%d: %s\n", stamp, ftv_log_level_name(level), base_name(file),
              line, message);
   } else {
      fprintf(out, "[%s] %-7s %s\n", stamp, ftv_log_level_name(level), message);
   }
}

static void bridge_log_callback(ftv_log_level_t level,
                                const char *file,
                                int line,
                                const char *func,
                                const char *fmt,
                                va_list args) {
   (void)func;

   char message[1024];
   vsnprintf(message, sizeof(message), fmt, args);

   struct timeval tv;
   gettimeofday(&tv, NULL);
   struct tm tm_info;
   localtime_r(&tv.tv_sec, &tm_info);

   char clock[16];
   strftime(clock, sizeof(clock), "%H:%M:%S", &tm_info);
   char stamp[24];
   snprintf(stamp, sizeof(stamp), "%s.%03ld", clock, (long)(tv.tv_usec / 1000));

   write_line(stderr, stamp, level, file, line, message);
   if (s_log_file) {
      write_line(s_log_file, stamp, level, file, line, message);
      fflush(s_log_file);
   }
}

void logging_bridge_init(void) {
   ftv_set_logger(bridge_log_callback);
}

int logging_bridge_set_file(const char *path) {
   logging_bridge_shutdown();
   if (!path || path[0] == '\0') {
      return 0;
   }

   char expanded[CONFIG_PATH_MAX];
   if (!path_expand_tilde(path, expanded, sizeof(expanded))) {
      FTV_LOG_ERROR("Log file path too long: %s", path);
      return 1;
   }
   if (!path_ensure_parent_dir(expanded)) {
      FTV_LOG_ERROR("Cannot create directory for log file %s", expanded);
      return 1;
   }

   s_log_file = fopen(expanded, "a");
   if (!s_log_file) {
      FTV_LOG_ERROR("Cannot open log file %s: %s", expanded, strerror(errno));
      return 1;
   }
   return 0;
}

void logging_bridge_shutdown(void) {
   if (s_log_file) {
      fclose(s_log_file);
      s_log_file = NULL;
   }
}
