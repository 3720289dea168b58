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
 * Error codes shared by every engine component.
 *
 * Failures are never thrown across the engine API. Asynchronous operations
 * report an ftv_error_t through their completion callback and the engine
 * keeps running after any single failed operation.
 */

#ifndef FTV_ERROR_H
#define FTV_ERROR_H

#include <functional>

/* =============================================================================
 * Error Codes
 * ============================================================================= */
typedef enum {
   FTV_OK = 0,
   FTV_ERR_NOT_CONFIGURED, /* No target address configured */
   FTV_ERR_NOT_PAIRED,     /* No pairing token for authenticated calls */
   FTV_ERR_INVALID_PARAM,  /* Bad argument (empty PIN, unknown command) */
   FTV_ERR_BUSY,           /* Operation already in progress */
   FTV_ERR_WAKE_FAILED,    /* Wake retries exhausted */
   FTV_ERR_NETWORK,        /* Transport error (timeout, refused, send failure) */
   FTV_ERR_HTTP_STATUS,    /* Non-2xx HTTP status */
   FTV_ERR_PROTOCOL,       /* Response lacked the success sentinel */
   FTV_ERR_AUTH_REJECTED,  /* Device answered 401/403, pairing dropped */
   FTV_ERR_CANCELLED,      /* Dropped during shutdown */
   FTV_ERR_IO              /* Local socket or file failure */
} ftv_error_t;

/**
 * @brief Completion callback used by all asynchronous engine operations
 */
typedef std::function<void(ftv_error_t err)> ftv_result_cb_t;

/**
 * @brief Get error message for error code
 *
 * @param err Error code
 * @return Human-readable error message
 */
const char *ftv_error_str(ftv_error_t err);

/**
 * @brief Invoke a completion callback if one was supplied
 */
static inline void ftv_complete(const ftv_result_cb_t &cb, ftv_error_t err) {
   if (cb)
      cb(err);
}

#endif /* FTV_ERROR_H */
