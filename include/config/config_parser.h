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
 * ftvremote Configuration Parser - TOML file parsing interface
 */

#ifndef CONFIG_PARSER_H
#define CONFIG_PARSER_H

#include "config/ftv_config.h"
#include "core/ftv_error.h"

/**
 * @brief Parse a TOML configuration file into a config struct
 *
 * Fields not specified in the file retain their current values, so the
 * struct should be pre-initialized with config_set_defaults().
 *
 * @param path Path to the TOML config file
 * @param config Config struct to populate
 * @return FTV_OK, FTV_ERR_IO if the file cannot be read, or
 *         FTV_ERR_INVALID_PARAM on a TOML syntax error
 */
ftv_error_t config_parse_file(const char *path, ftv_config_t *config);

/**
 * @brief Parse TOML text into a config struct
 *
 * @param text TOML document
 * @param config Config struct to populate
 * @return FTV_OK or FTV_ERR_INVALID_PARAM on a syntax error
 */
ftv_error_t config_parse_string(const char *text, ftv_config_t *config);

/**
 * @brief Find and load the configuration file
 *
 * Searches for config files in order:
 * 1. --config PATH (if provided; failure to read it is an error)
 * 2. ./ftvremote.toml
 * 3. ~/.config/ftvremote/config.toml
 * 4. /etc/ftvremote/config.toml
 *
 * @param explicit_path Explicit path from command line (NULL to use search)
 * @param config Config struct to populate
 * @return FTV_OK when a file was loaded or none was found (defaults kept),
 *         otherwise the parse error
 */
ftv_error_t config_load_from_search(const char *explicit_path, ftv_config_t *config);

/**
 * @brief Get the path to the loaded config file
 *
 * @return Path string, or "(none - using defaults)" if no file was loaded
 */
const char *config_get_loaded_path(void);

#endif /* CONFIG_PARSER_H */
