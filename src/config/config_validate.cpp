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

#include "config/config_validate.h"

#include <arpa/inet.h>
#include <stdarg.h>
#include <stdio.h>

#include "logging_common.h"

typedef struct {
   config_error_t *errors;
   size_t max_errors;
   int count;
} validate_ctx_t;

static void add_error(validate_ctx_t *ctx, const char *field, const char *fmt, ...)
    __attribute__((format(printf, 3, 4)));

static void add_error(validate_ctx_t *ctx, const char *field, const char *fmt, ...) {
   if (ctx->errors && (size_t)ctx->count < ctx->max_errors) {
      config_error_t *err = &ctx->errors[ctx->count];
      snprintf(err->field, sizeof(err->field), "%s", field);
      va_list args;
      va_start(args, fmt);
      vsnprintf(err->message, sizeof(err->message), fmt, args);
      va_end(args);
   }
   ctx->count++;
}

static void check_range(validate_ctx_t *ctx, const char *field, int value, int min, int max) {
   if (value < min || value > max) {
      add_error(ctx, field, "must be between %d and %d (got %d)", min, max, value);
   }
}

int config_validate(const ftv_config_t *config, config_error_t *errors, size_t max_errors) {
   validate_ctx_t ctx = { errors, max_errors, 0 };

   if (!config) {
      add_error(&ctx, "config", "configuration is missing");
      return ctx.count;
   }

   if (config->device.address[0]) {
      struct in_addr addr;
      if (inet_pton(AF_INET, config->device.address, &addr) != 1) {
         add_error(&ctx, "device.address", "'%s' is not an IPv4 address",
                   config->device.address);
      }
   }
   if (!config->device.friendly_name[0]) {
      add_error(&ctx, "device.friendly_name", "must not be empty");
   }
   check_range(&ctx, "device.timeout_sec", config->device.timeout_sec, 1, 300);

   check_range(&ctx, "timing.key_delay_ms", config->timing.key_delay_ms, 0, 5000);
   check_range(&ctx, "timing.char_delay_ms", config->timing.char_delay_ms, 0, 5000);
   check_range(&ctx, "timing.settle_ms", config->timing.settle_ms, 0, 60000);
   check_range(&ctx, "timing.wake_fresh_sec", config->timing.wake_fresh_sec, 0, 3600);
   check_range(&ctx, "timing.wake_max_attempts", config->timing.wake_max_attempts, 1, 10);
   check_range(&ctx, "timing.wake_backoff_ms", config->timing.wake_backoff_ms, 0, 60000);
   check_range(&ctx, "timing.command_interval_ms", config->timing.command_interval_ms, 0, 10000);

   check_range(&ctx, "discovery.timeout_ms", config->discovery.timeout_ms, 1000, 300000);
   check_range(&ctx, "discovery.retransmit_ms", config->discovery.retransmit_ms, 0, 300000);
   if (config->discovery.retransmit_ms >= config->discovery.timeout_ms) {
      add_error(&ctx, "discovery.retransmit_ms", "must be shorter than discovery.timeout_ms");
   }

   if (!config->storage.state_path[0]) {
      add_error(&ctx, "storage.state_path", "must not be empty");
   }

   return ctx.count;
}

void config_print_errors(const config_error_t *errors, int count) {
   if (!errors) {
      return;
   }
   for (int i = 0; i < count; i++) {
      FTV_LOG_ERROR("Config error: %s %s", errors[i].field, errors[i].message);
   }
}
