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

#include "config/ftv_config.h"

#include <string.h>

#include "core/path_utils.h"

void config_set_defaults(ftv_config_t *config) {
   if (!config) {
      return;
   }

   memset(config, 0, sizeof(*config));

   config->device.address[0] = '\0';
   safe_strncpy(config->device.friendly_name, CONFIG_DEFAULT_FRIENDLY_NAME,
                sizeof(config->device.friendly_name));
   config->device.auto_wake = true;
   config->device.timeout_sec = CONFIG_DEFAULT_TIMEOUT_SEC;

   config->timing.key_delay_ms = CONFIG_DEFAULT_KEY_DELAY_MS;
   config->timing.char_delay_ms = CONFIG_DEFAULT_CHAR_DELAY_MS;
   config->timing.settle_ms = CONFIG_DEFAULT_SETTLE_MS;
   config->timing.wake_fresh_sec = CONFIG_DEFAULT_WAKE_FRESH_SEC;
   config->timing.wake_max_attempts = CONFIG_DEFAULT_WAKE_MAX_ATTEMPTS;
   config->timing.wake_backoff_ms = CONFIG_DEFAULT_WAKE_BACKOFF_MS;
   config->timing.command_interval_ms = CONFIG_DEFAULT_COMMAND_INTERVAL_MS;

   config->discovery.timeout_ms = CONFIG_DEFAULT_DISCOVERY_TIMEOUT_MS;
   config->discovery.retransmit_ms = CONFIG_DEFAULT_DISCOVERY_RETRANSMIT_MS;

   safe_strncpy(config->storage.state_path, CONFIG_DEFAULT_STATE_PATH,
                sizeof(config->storage.state_path));

   config->logging.debug = false;
   config->logging.log_file[0] = '\0';
}
