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

#include "firetv/command_queue.h"

#include <utility>

#include "config/ftv_config.h"
#include "logging_common.h"

CommandQueue::CommandQueue(TimerService &timers)
    : timers_(timers),
      min_interval_ms_(CONFIG_DEFAULT_COMMAND_INTERVAL_MS),
      in_flight_(false),
      waiting_(false),
      has_dispatched_(false),
      last_dispatch_ms_(0) {
}

CommandQueue::~CommandQueue() {
   timers_.cancel(COMMAND_QUEUE_TIMER);
}

void CommandQueue::enqueue(const std::string &label,
                           command_fn_t command,
                           ftv_result_cb_t callback) {
   Entry entry;
   entry.label = label;
   entry.command = std::move(command);
   entry.callback = std::move(callback);
   queue_.push_back(std::move(entry));

   FTV_LOG_DEBUG("Queued command %s (%zu pending)", label.c_str(), queue_.size());
   process();
}

void CommandQueue::process() {
   if (in_flight_ || waiting_ || queue_.empty()) {
      return;
   }

   if (has_dispatched_) {
      uint64_t elapsed = timers_.now_ms() - last_dispatch_ms_;
      if (elapsed < min_interval_ms_) {
         uint32_t remaining = min_interval_ms_ - (uint32_t)elapsed;
         waiting_ = true;
         timers_.schedule(COMMAND_QUEUE_TIMER, remaining, [this]() {
            waiting_ = false;
            dispatch();
         });
         return;
      }
   }

   dispatch();
}

void CommandQueue::dispatch() {
   if (in_flight_ || queue_.empty()) {
      return;
   }

   Entry entry = std::move(queue_.front());
   queue_.pop_front();

   in_flight_ = true;
   has_dispatched_ = true;
   last_dispatch_ms_ = timers_.now_ms();
   in_flight_callback_ = std::move(entry.callback);
   in_flight_done_ = std::make_shared<bool>(false);

   FTV_LOG_DEBUG("Dispatching command %s", entry.label.c_str());

   std::shared_ptr<bool> done_flag = in_flight_done_;
   std::string label = entry.label;
   entry.command([this, done_flag, label](ftv_error_t err) {
      if (*done_flag) {
         FTV_LOG_DEBUG("Ignoring repeated completion of command %s", label.c_str());
         return;
      }
      *done_flag = true;

      if (err != FTV_OK) {
         FTV_LOG_WARNING("Command %s failed: %s", label.c_str(), ftv_error_str(err));
      }

      ftv_result_cb_t callback = std::move(in_flight_callback_);
      in_flight_callback_ = nullptr;
      in_flight_ = false;

      ftv_complete(callback, err);
      process();
   });
}

void CommandQueue::clear(ftv_error_t err) {
   timers_.cancel(COMMAND_QUEUE_TIMER);
   waiting_ = false;

   std::deque<Entry> dropped;
   dropped.swap(queue_);

   if (in_flight_) {
      *in_flight_done_ = true;
      in_flight_ = false;
      ftv_result_cb_t callback = std::move(in_flight_callback_);
      in_flight_callback_ = nullptr;
      ftv_complete(callback, err);
   }

   if (!dropped.empty()) {
      FTV_LOG_INFO("Dropping %zu queued command(s)", dropped.size());
   }
   for (size_t i = 0; i < dropped.size(); i++) {
      ftv_complete(dropped[i].callback, err);
   }
}
