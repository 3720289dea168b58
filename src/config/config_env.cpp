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

#include "config/config_env.h"

#include <stdlib.h>
#include <strings.h>

#include "core/path_utils.h"
#include "logging_common.h"

static bool parse_env_bool(const char *name, const char *value, bool *out) {
   if (strcasecmp(value, "1") == 0 || strcasecmp(value, "true") == 0 ||
       strcasecmp(value, "yes") == 0 || strcasecmp(value, "on") == 0) {
      *out = true;
      return true;
   }
   if (strcasecmp(value, "0") == 0 || strcasecmp(value, "false") == 0 ||
       strcasecmp(value, "no") == 0 || strcasecmp(value, "off") == 0) {
      *out = false;
      return true;
   }
   FTV_LOG_WARNING("Ignoring %s=%s: expected a boolean", name, value);
   return false;
}

void config_apply_env(ftv_config_t *config) {
   if (!config) {
      return;
   }

   const char *value = getenv("FTV_DEVICE_ADDRESS");
   if (value) {
      safe_strncpy(config->device.address, value, sizeof(config->device.address));
      FTV_LOG_DEBUG("Config override: device.address from FTV_DEVICE_ADDRESS");
   }

   value = getenv("FTV_DEBUG");
   if (value && value[0]) {
      parse_env_bool("FTV_DEBUG", value, &config->logging.debug);
   }

   value = getenv("FTV_STATE_PATH");
   if (value && value[0]) {
      safe_strncpy(config->storage.state_path, value, sizeof(config->storage.state_path));
      FTV_LOG_DEBUG("Config override: storage.state_path from FTV_STATE_PATH");
   }
}

void config_dump_toml(const ftv_config_t *config, FILE *out) {
   if (!config || !out) {
      return;
   }

   fprintf(out, "[device]\n");
   fprintf(out, "address = \"%s\"\n", config->device.address);
   fprintf(out, "friendly_name = \"%s\"\n", config->device.friendly_name);
   fprintf(out, "auto_wake = %s\n", config->device.auto_wake ? "true" : "false");
   fprintf(out, "timeout_sec = %d\n", config->device.timeout_sec);

   fprintf(out, "\n[timing]\n");
   fprintf(out, "key_delay_ms = %d\n", config->timing.key_delay_ms);
   fprintf(out, "char_delay_ms = %d\n", config->timing.char_delay_ms);
   fprintf(out, "settle_ms = %d\n", config->timing.settle_ms);
   fprintf(out, "wake_fresh_sec = %d\n", config->timing.wake_fresh_sec);
   fprintf(out, "wake_max_attempts = %d\n", config->timing.wake_max_attempts);
   fprintf(out, "wake_backoff_ms = %d\n", config->timing.wake_backoff_ms);
   fprintf(out, "command_interval_ms = %d\n", config->timing.command_interval_ms);

   fprintf(out, "\n[discovery]\n");
   fprintf(out, "timeout_ms = %d\n", config->discovery.timeout_ms);
   fprintf(out, "retransmit_ms = %d\n", config->discovery.retransmit_ms);

   fprintf(out, "\n[storage]\n");
   fprintf(out, "state_path = \"%s\"\n", config->storage.state_path);

   fprintf(out, "\n[logging]\n");
   fprintf(out, "debug = %s\n", config->logging.debug ? "true" : "false");
   fprintf(out, "log_file = \"%s\"\n", config->logging.log_file);
}
