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
 * ftvremote Configuration - Settings structure and defaults
 *
 * Values come from compile-time defaults, then the TOML file, then
 * environment overrides, then command line options, in that order.
 */

#ifndef FTV_CONFIG_H
#define FTV_CONFIG_H

#include <stdbool.h>
#include <stddef.h>

/* =============================================================================
 * Buffer Size Constants
 * ============================================================================= */
#define CONFIG_PATH_MAX 256
#define CONFIG_NAME_MAX 64
#define CONFIG_ADDRESS_MAX 64

/* =============================================================================
 * Defaults
 * ============================================================================= */
#define CONFIG_DEFAULT_FRIENDLY_NAME "ftvremote"
#define CONFIG_DEFAULT_TIMEOUT_SEC 10
#define CONFIG_DEFAULT_KEY_DELAY_MS 50
#define CONFIG_DEFAULT_CHAR_DELAY_MS 50
#define CONFIG_DEFAULT_SETTLE_MS 2000
#define CONFIG_DEFAULT_WAKE_FRESH_SEC 30
#define CONFIG_DEFAULT_WAKE_MAX_ATTEMPTS 3
#define CONFIG_DEFAULT_WAKE_BACKOFF_MS 1000
#define CONFIG_DEFAULT_COMMAND_INTERVAL_MS 150
#define CONFIG_DEFAULT_DISCOVERY_TIMEOUT_MS 10000
#define CONFIG_DEFAULT_DISCOVERY_RETRANSMIT_MS 1000
#define CONFIG_DEFAULT_STATE_PATH "~/.config/ftvremote/state.json"

/* =============================================================================
 * Device Configuration
 * ============================================================================= */
typedef struct {
   char address[CONFIG_ADDRESS_MAX];        /* Empty = not configured */
   char friendly_name[CONFIG_NAME_MAX];     /* Shown on the TV while pairing */
   bool auto_wake;                          /* Wake before every command */
   int timeout_sec;                         /* HTTP request timeout */
} device_config_t;

/* =============================================================================
 * Timing Configuration
 * ============================================================================= */
typedef struct {
   int key_delay_ms;        /* Between key down and key up */
   int char_delay_ms;       /* Between characters of a text string */
   int settle_ms;           /* After a successful wake */
   int wake_fresh_sec;      /* A wake this recent is not repeated */
   int wake_max_attempts;   /* Wake calls before giving up */
   int wake_backoff_ms;     /* Retry n waits n * backoff */
   int command_interval_ms; /* Minimum spacing of command dispatches */
} timing_config_t;

/* =============================================================================
 * Discovery Configuration
 * ============================================================================= */
typedef struct {
   int timeout_ms;    /* Length of a discovery session */
   int retransmit_ms; /* Delay before the query is resent */
} discovery_config_t;

/* =============================================================================
 * Storage / Logging Configuration
 * ============================================================================= */
typedef struct {
   char state_path[CONFIG_PATH_MAX]; /* JSON state file, ~ expanded */
} storage_config_t;

typedef struct {
   bool debug;
   char log_file[CONFIG_PATH_MAX]; /* Empty = stderr only */
} logging_config_t;

typedef struct {
   device_config_t device;
   timing_config_t timing;
   discovery_config_t discovery;
   storage_config_t storage;
   logging_config_t logging;
} ftv_config_t;

/**
 * @brief Initialize config with default values
 *
 * @param config Config struct to initialize
 */
void config_set_defaults(ftv_config_t *config);

#endif /* FTV_CONFIG_H */
