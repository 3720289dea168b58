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

#include "core/path_utils.h"

#include <errno.h>
#include <pwd.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include "logging_common.h"

bool path_expand_tilde(const char *path, char *expanded, size_t expanded_size) {
   if (!path || !expanded || expanded_size == 0) {
      return false;
   }

   if (path[0] != '~' || (path[1] != '/' && path[1] != '\0')) {
      int n = snprintf(expanded, expanded_size, "%s", path);
      return n >= 0 && (size_t)n < expanded_size;
   }

   const char *home = getenv("HOME");
   if (!home || !home[0]) {
      struct passwd *pw = getpwuid(getuid());
      home = pw ? pw->pw_dir : NULL;
   }
   if (!home) {
      FTV_LOG_ERROR("Cannot expand '%s': home directory unknown", path);
      return false;
   }

   int n = snprintf(expanded, expanded_size, "%s%s", home, path + 1);
   return n >= 0 && (size_t)n < expanded_size;
}

bool path_ensure_parent_dir(const char *file_path) {
   if (!file_path || !file_path[0]) {
      return false;
   }

   char dir[4096];
   int n = snprintf(dir, sizeof(dir), "%s", file_path);
   if (n < 0 || (size_t)n >= sizeof(dir)) {
      return false;
   }

   char *slash = strrchr(dir, '/');
   if (!slash || slash == dir) {
      return true; /* Current directory or filesystem root */
   }
   *slash = '\0';

   /* Walk the path creating each missing component */
   for (char *p = dir + 1; *p; p++) {
      if (*p != '/') {
         continue;
      }
      *p = '\0';
      if (mkdir(dir, 0700) != 0 && errno != EEXIST) {
         FTV_LOG_ERROR("Failed to create directory %s: %s", dir, strerror(errno));
         return false;
      }
      *p = '/';
   }
   if (mkdir(dir, 0700) != 0 && errno != EEXIST) {
      FTV_LOG_ERROR("Failed to create directory %s: %s", dir, strerror(errno));
      return false;
   }
   return true;
}

void safe_strncpy(char *dst, const char *src, size_t dst_size) {
   if (!dst || dst_size == 0) {
      return;
   }
   if (!src) {
      dst[0] = '\0';
      return;
   }
   size_t len = strnlen(src, dst_size - 1);
   memcpy(dst, src, len);
   dst[len] = '\0';
}

bool path_is_readable_file(const char *path) {
   struct stat st;
   if (!path || stat(path, &st) != 0) {
      return false;
   }
   return S_ISREG(st.st_mode) && access(path, R_OK) == 0;
}
