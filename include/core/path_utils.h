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
 * Path Utilities - Home expansion and directory creation for state files
 */

#ifndef FTV_PATH_UTILS_H
#define FTV_PATH_UTILS_H

#include <stdbool.h>
#include <stddef.h>

/**
 * @brief Expand tilde in path to home directory
 *
 * Handles paths like "~/.config/ftvremote" -> "/home/user/.config/ftvremote".
 * Falls back to getpwuid() if HOME environment variable is not set.
 *
 * @param path Original path (may contain leading ~/)
 * @param expanded Output buffer for expanded path
 * @param expanded_size Size of output buffer
 * @return true if expansion occurred or path copied unchanged, false on error
 */
bool path_expand_tilde(const char *path, char *expanded, size_t expanded_size);

/**
 * @brief Ensure every missing parent directory of a file path exists
 *
 * Directories are created with mode 0700.
 *
 * @param file_path Path to a file
 * @return true on success or if the directory already exists
 */
bool path_ensure_parent_dir(const char *file_path);

/**
 * @brief Copy string safely with guaranteed null termination
 *
 * Silently truncates if source is longer than destination. A NULL source
 * yields an empty string.
 */
void safe_strncpy(char *dst, const char *src, size_t dst_size);

/**
 * @brief Check whether a regular file exists and is readable
 */
bool path_is_readable_file(const char *path);

#endif /* FTV_PATH_UTILS_H */
