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
 * ftvremote Configuration Environment - Environment variable overrides
 */

#ifndef CONFIG_ENV_H
#define CONFIG_ENV_H

#include <stdio.h>

#include "config/ftv_config.h"

/**
 * @brief Apply environment variable overrides to configuration
 *
 * Recognized variables:
 *   FTV_DEVICE_ADDRESS=192.168.1.50  -> device.address
 *   FTV_DEBUG=1|true|yes|on          -> logging.debug
 *   FTV_STATE_PATH=/var/lib/ftv.json -> storage.state_path
 *
 * @param config Config struct to modify
 */
void config_apply_env(ftv_config_t *config);

/**
 * @brief Write configuration as TOML
 *
 * The output can be saved and loaded back as a config file. Used by the
 * --dump-config CLI option.
 *
 * @param config Configuration to dump
 * @param out Destination stream
 */
void config_dump_toml(const ftv_config_t *config, FILE *out);

#endif /* CONFIG_ENV_H */
