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
 * Logging Bridge - Connects the engine's callback logging to the console
 *
 * The engine library only formats messages through the callback registered
 * with ftv_set_logger(). The bridge writes them to stderr with a timestamp
 * and level, and optionally appends them to a log file. Call
 * logging_bridge_init() early in main() before any engine code runs.
 */

#ifndef LOGGING_BRIDGE_H
#define LOGGING_BRIDGE_H

/**
 * @brief Initialize the logging bridge
 *
 * Registers the console logging callback with the engine library.
 *
 * Thread Safety: NOT thread-safe. Call once at initialization.
 */
void logging_bridge_init(void);

/**
 * @brief Also append log lines to a file
 *
 * @param path Log file path (~ expanded), or NULL/empty to stop file logging
 * @return 0 on success, 1 if the file could not be opened
 */
int logging_bridge_set_file(const char *path);

/**
 * @brief Close the log file, if any
 */
void logging_bridge_shutdown(void);

#endif /* LOGGING_BRIDGE_H */
