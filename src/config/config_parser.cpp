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

#include "config/config_parser.h"

#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <toml.h>

#include <string>

#include "core/path_utils.h"
#include "logging_common.h"

static char s_loaded_path[CONFIG_PATH_MAX] = "";

/* =============================================================================
 * Value Helpers
 * ============================================================================= */

static void parse_string(toml_table_t *table, const char *key, char *dst, size_t dst_size) {
   toml_datum_t d = toml_string_in(table, key);
   if (d.ok) {
      safe_strncpy(dst, d.u.s, dst_size);
      free(d.u.s);
   }
}

static void parse_int(toml_table_t *table, const char *key, int *dst) {
   toml_datum_t d = toml_int_in(table, key);
   if (d.ok) {
      *dst = (int)d.u.i;
   }
}

static void parse_bool(toml_table_t *table, const char *key, bool *dst) {
   toml_datum_t d = toml_bool_in(table, key);
   if (d.ok) {
      *dst = d.u.b != 0;
   }
}

/* Warn about keys the section does not define (usually typos) */
static void warn_unknown_keys(toml_table_t *table,
                              const char *section,
                              const char *const *known,
                              size_t known_count) {
   for (int i = 0;; i++) {
      const char *key = toml_key_in(table, i);
      if (!key) {
         break;
      }
      bool found = false;
      for (size_t k = 0; k < known_count; k++) {
         if (strcmp(key, known[k]) == 0) {
            found = true;
            break;
         }
      }
      if (!found) {
         FTV_LOG_WARNING("Config: unknown key [%s] %s", section, key);
      }
   }
}

#define KNOWN_COUNT(arr) (sizeof(arr) / sizeof((arr)[0]))

/* =============================================================================
 * Section Parsers
 * ============================================================================= */

static void parse_device_section(toml_table_t *root, device_config_t *device) {
   static const char *const known[] = { "address", "friendly_name", "auto_wake", "timeout_sec" };
   toml_table_t *table = toml_table_in(root, "device");
   if (!table) {
      return;
   }
   warn_unknown_keys(table, "device", known, KNOWN_COUNT(known));

   parse_string(table, "address", device->address, sizeof(device->address));
   parse_string(table, "friendly_name", device->friendly_name, sizeof(device->friendly_name));
   parse_bool(table, "auto_wake", &device->auto_wake);
   parse_int(table, "timeout_sec", &device->timeout_sec);
}

static void parse_timing_section(toml_table_t *root, timing_config_t *timing) {
   static const char *const known[] = { "key_delay_ms",      "char_delay_ms",
                                        "settle_ms",         "wake_fresh_sec",
                                        "wake_max_attempts", "wake_backoff_ms",
                                        "command_interval_ms" };
   toml_table_t *table = toml_table_in(root, "timing");
   if (!table) {
      return;
   }
   warn_unknown_keys(table, "timing", known, KNOWN_COUNT(known));

   parse_int(table, "key_delay_ms", &timing->key_delay_ms);
   parse_int(table, "char_delay_ms", &timing->char_delay_ms);
   parse_int(table, "settle_ms", &timing->settle_ms);
   parse_int(table, "wake_fresh_sec", &timing->wake_fresh_sec);
   parse_int(table, "wake_max_attempts", &timing->wake_max_attempts);
   parse_int(table, "wake_backoff_ms", &timing->wake_backoff_ms);
   parse_int(table, "command_interval_ms", &timing->command_interval_ms);
}

static void parse_discovery_section(toml_table_t *root, discovery_config_t *discovery) {
   static const char *const known[] = { "timeout_ms", "retransmit_ms" };
   toml_table_t *table = toml_table_in(root, "discovery");
   if (!table) {
      return;
   }
   warn_unknown_keys(table, "discovery", known, KNOWN_COUNT(known));

   parse_int(table, "timeout_ms", &discovery->timeout_ms);
   parse_int(table, "retransmit_ms", &discovery->retransmit_ms);
}

static void parse_storage_section(toml_table_t *root, storage_config_t *storage) {
   static const char *const known[] = { "state_path" };
   toml_table_t *table = toml_table_in(root, "storage");
   if (!table) {
      return;
   }
   warn_unknown_keys(table, "storage", known, KNOWN_COUNT(known));

   parse_string(table, "state_path", storage->state_path, sizeof(storage->state_path));
}

static void parse_logging_section(toml_table_t *root, logging_config_t *logging) {
   static const char *const known[] = { "debug", "log_file" };
   toml_table_t *table = toml_table_in(root, "logging");
   if (!table) {
      return;
   }
   warn_unknown_keys(table, "logging", known, KNOWN_COUNT(known));

   parse_bool(table, "debug", &logging->debug);
   parse_string(table, "log_file", logging->log_file, sizeof(logging->log_file));
}

static void parse_root(toml_table_t *root, ftv_config_t *config) {
   static const char *const known[] = { "device", "timing", "discovery", "storage", "logging" };
   warn_unknown_keys(root, "root", known, KNOWN_COUNT(known));

   parse_device_section(root, &config->device);
   parse_timing_section(root, &config->timing);
   parse_discovery_section(root, &config->discovery);
   parse_storage_section(root, &config->storage);
   parse_logging_section(root, &config->logging);
}

/* =============================================================================
 * Public API
 * ============================================================================= */

ftv_error_t config_parse_file(const char *path, ftv_config_t *config) {
   if (!path || !config) {
      return FTV_ERR_INVALID_PARAM;
   }

   FILE *fp = fopen(path, "r");
   if (!fp) {
      FTV_LOG_ERROR("Cannot open config file %s: %s", path, strerror(errno));
      return FTV_ERR_IO;
   }

   char errbuf[256];
   toml_table_t *root = toml_parse_file(fp, errbuf, sizeof(errbuf));
   fclose(fp);

   if (!root) {
      FTV_LOG_ERROR("Config parse error in %s: %s", path, errbuf);
      return FTV_ERR_INVALID_PARAM;
   }

   parse_root(root, config);
   toml_free(root);
   return FTV_OK;
}

ftv_error_t config_parse_string(const char *text, ftv_config_t *config) {
   if (!text || !config) {
      return FTV_ERR_INVALID_PARAM;
   }

   /* toml_parse() needs a writable buffer */
   std::string copy(text);
   char errbuf[256];
   toml_table_t *root = toml_parse(&copy[0], errbuf, sizeof(errbuf));
   if (!root) {
      FTV_LOG_ERROR("Config parse error: %s", errbuf);
      return FTV_ERR_INVALID_PARAM;
   }

   parse_root(root, config);
   toml_free(root);
   return FTV_OK;
}

ftv_error_t config_load_from_search(const char *explicit_path, ftv_config_t *config) {
   s_loaded_path[0] = '\0';

   if (explicit_path && explicit_path[0]) {
      ftv_error_t err = config_parse_file(explicit_path, config);
      if (err == FTV_OK) {
         safe_strncpy(s_loaded_path, explicit_path, sizeof(s_loaded_path));
      }
      return err;
   }

   const char *candidates[] = { "./ftvremote.toml", "~/.config/ftvremote/config.toml",
                                "/etc/ftvremote/config.toml" };

   for (size_t i = 0; i < KNOWN_COUNT(candidates); i++) {
      char path[CONFIG_PATH_MAX];
      if (!path_expand_tilde(candidates[i], path, sizeof(path))) {
         continue;
      }
      if (!path_is_readable_file(path)) {
         continue;
      }

      ftv_error_t err = config_parse_file(path, config);
      if (err != FTV_OK) {
         return err;
      }
      safe_strncpy(s_loaded_path, path, sizeof(s_loaded_path));
      FTV_LOG_INFO("Loaded config from %s", path);
      return FTV_OK;
   }

   FTV_LOG_DEBUG("No config file found, using defaults");
   return FTV_OK;
}

const char *config_get_loaded_path(void) {
   return s_loaded_path[0] ? s_loaded_path : "(none - using defaults)";
}
