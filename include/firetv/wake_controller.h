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
 * Wake Controller - Coalescing DIAL wake with retry and settle delay
 *
 * State machine:
 *
 *   IDLE --ensure_awake/wake_now--> WAKING --success--> SETTLING --settle--> IDLE
 *                                     |  ^
 *                                     |  | retry after attempt * backoff
 *                                     v  |
 *                                   (failure) --attempts exhausted--> IDLE
 *
 * Every caller that arrives while the machine is not IDLE joins the waiter
 * list and is released together with the others, in arrival order, when the
 * wake settles or fails.
 */

#ifndef WAKE_CONTROLLER_H
#define WAKE_CONTROLLER_H

#include <stdint.h>

#include <string>
#include <vector>

#include "core/ftv_error.h"
#include "core/timer_service.h"
#include "firetv/device_session.h"
#include "network/http_client.h"

#define WAKE_TIMER_RETRY "wake_retry"
#define WAKE_TIMER_SETTLE "wake_settle"

/* Some firmware answers the DIAL launch with 201 Created */
#define WAKE_STATUS_CREATED 201

typedef enum {
   WAKE_STATE_IDLE = 0,
   WAKE_STATE_WAKING,
   WAKE_STATE_SETTLING,
} wake_state_t;

typedef struct {
   uint32_t settle_ms;    /* Wait after a successful wake */
   uint32_t fresh_ms;     /* A wake this recent is not repeated */
   int max_attempts;      /* Wake POSTs before giving up */
   uint32_t backoff_ms;   /* Retry n waits n * backoff_ms */
} wake_timing_t;

/** @brief Name of a wake state, for logging */
const char *wake_state_name(wake_state_t state);

class WakeController {
 public:
   WakeController(DeviceSession &session, HttpClient &http, TimerService &timers);
   ~WakeController();

   void set_timing(const wake_timing_t &timing) { timing_ = timing; }
   const wake_timing_t &timing() const { return timing_; }

   /**
    * @brief Make sure the device is awake before an API call
    *
    * Completes immediately with FTV_OK when auto-wake is disabled or the last
    * wake is still fresh. Otherwise joins (or starts) a wake.
    *
    * @param callback Receives FTV_OK, FTV_ERR_NOT_CONFIGURED or
    *                 FTV_ERR_WAKE_FAILED
    */
   void ensure_awake(ftv_result_cb_t callback);

   /**
    * @brief Wake unconditionally
    *
    * Ignores freshness and the auto-wake setting. Joins a wake already in
    * progress instead of starting a second one.
    */
   void wake_now(ftv_result_cb_t callback);

   wake_state_t state() const { return state_; }
   size_t waiter_count() const { return waiters_.size(); }

   /**
    * @brief Abort any wake in progress and fail all waiters with @p err
    */
   void cancel(ftv_error_t err);

 private:
   void start_wake(ftv_result_cb_t callback);
   void send_wake();
   void handle_response(uint64_t generation, const http_response_t &response);
   void release(ftv_error_t err);

   DeviceSession &session_;
   HttpClient &http_;
   TimerService &timers_;
   wake_timing_t timing_;

   wake_state_t state_;
   int attempt_;
   uint64_t generation_;
   std::string wake_address_;
   std::vector<ftv_result_cb_t> waiters_;

   WakeController(const WakeController &);
   WakeController &operator=(const WakeController &);
};

#endif /* WAKE_CONTROLLER_H */
