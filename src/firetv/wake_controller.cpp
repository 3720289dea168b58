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

#include "firetv/wake_controller.h"

#include <utility>

#include "config/ftv_config.h"
#include "firetv/ftv_api.h"
#include "logging_common.h"

const char *wake_state_name(wake_state_t state) {
   switch (state) {
      case WAKE_STATE_IDLE:
         return "idle";
      case WAKE_STATE_WAKING:
         return "waking";
      case WAKE_STATE_SETTLING:
         return "settling";
      default:
         return "unknown";
   }
}

WakeController::WakeController(DeviceSession &session, HttpClient &http, TimerService &timers)
    : session_(session),
      http_(http),
      timers_(timers),
      state_(WAKE_STATE_IDLE),
      attempt_(0),
      generation_(0) {
   timing_.settle_ms = CONFIG_DEFAULT_SETTLE_MS;
   timing_.fresh_ms = CONFIG_DEFAULT_WAKE_FRESH_SEC * 1000;
   timing_.max_attempts = CONFIG_DEFAULT_WAKE_MAX_ATTEMPTS;
   timing_.backoff_ms = CONFIG_DEFAULT_WAKE_BACKOFF_MS;
}

WakeController::~WakeController() {
   timers_.cancel(WAKE_TIMER_RETRY);
   timers_.cancel(WAKE_TIMER_SETTLE);
}

void WakeController::ensure_awake(ftv_result_cb_t callback) {
   if (!session_.auto_wake()) {
      ftv_complete(callback, FTV_OK);
      return;
   }

   if (state_ != WAKE_STATE_IDLE) {
      FTV_LOG_DEBUG("Wake in progress (%s), queuing caller", wake_state_name(state_));
      waiters_.push_back(std::move(callback));
      return;
   }

   if (session_.has_woken() && timers_.now_ms() - session_.last_wake_ms() < timing_.fresh_ms) {
      ftv_complete(callback, FTV_OK);
      return;
   }

   start_wake(std::move(callback));
}

void WakeController::wake_now(ftv_result_cb_t callback) {
   if (state_ != WAKE_STATE_IDLE) {
      waiters_.push_back(std::move(callback));
      return;
   }
   start_wake(std::move(callback));
}

void WakeController::start_wake(ftv_result_cb_t callback) {
   if (!session_.has_address()) {
      FTV_LOG_ERROR("Cannot wake: No Fire TV IP address configured");
      ftv_complete(callback, FTV_ERR_NOT_CONFIGURED);
      return;
   }

   state_ = WAKE_STATE_WAKING;
   attempt_ = 1;
   waiters_.push_back(std::move(callback));
   send_wake();
}

void WakeController::send_wake() {
   uint64_t generation = ++generation_;
   wake_address_ = session_.address();

   FTV_LOG_DEBUG("Waking Fire TV at %s (attempt %d/%d)", session_.address().c_str(), attempt_,
                 timing_.max_attempts);

   http_.post(ftv_wake_url(session_.address()), "", ftv_wake_headers(),
              [this, generation](const http_response_t &response) {
                 handle_response(generation, response);
              });
}

void WakeController::handle_response(uint64_t generation, const http_response_t &response) {
   if (generation != generation_ || state_ != WAKE_STATE_WAKING) {
      FTV_LOG_DEBUG("Ignoring stale wake response");
      return;
   }

   /* The target changed while this wake was in flight: wake the new one */
   if (session_.address() != wake_address_) {
      FTV_LOG_DEBUG("Wake target changed from %s, restarting", wake_address_.c_str());
      timers_.cancel(WAKE_TIMER_RETRY);
      if (!session_.has_address()) {
         release(FTV_ERR_NOT_CONFIGURED);
         return;
      }
      attempt_ = 1;
      send_wake();
      return;
   }

   if (http_response_ok(response) || response.status_code == WAKE_STATUS_CREATED) {
      FTV_LOG_DEBUG("Fire TV wake successful");
      session_.record_wake(timers_.now_ms());
      session_.set_connected(true);

      state_ = WAKE_STATE_SETTLING;
      timers_.schedule(WAKE_TIMER_SETTLE, timing_.settle_ms, [this]() { release(FTV_OK); });
      return;
   }

   FTV_LOG_DEBUG("Fire TV wake failed: %s", http_response_error(response).c_str());

   if (attempt_ < timing_.max_attempts) {
      uint32_t delay = (uint32_t)attempt_ * timing_.backoff_ms;
      attempt_++;
      timers_.schedule(WAKE_TIMER_RETRY, delay, [this]() { send_wake(); });
      return;
   }

   FTV_LOG_WARNING("Fire TV wake failed after %d attempt(s)", attempt_);
   session_.set_connected(false);
   release(FTV_ERR_WAKE_FAILED);
}

void WakeController::release(ftv_error_t err) {
   /* Back to IDLE first: released callers may start new operations */
   std::vector<ftv_result_cb_t> waiters;
   waiters.swap(waiters_);
   state_ = WAKE_STATE_IDLE;
   attempt_ = 0;

   for (size_t i = 0; i < waiters.size(); i++) {
      ftv_complete(waiters[i], err);
   }
}

void WakeController::cancel(ftv_error_t err) {
   timers_.cancel(WAKE_TIMER_RETRY);
   timers_.cancel(WAKE_TIMER_SETTLE);
   generation_++;
   if (state_ != WAKE_STATE_IDLE || !waiters_.empty()) {
      release(err);
   }
}
