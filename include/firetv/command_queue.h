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
 * Command Queue - One-at-a-time dispatch with minimum spacing
 *
 * Every outbound device command passes through this queue. Only one command
 * is in flight at a time, and the start of each dispatch is at least
 * min_interval_ms after the start of the previous one. The dispatch time is
 * taken when the command is actually sent, not when it was queued.
 */

#ifndef COMMAND_QUEUE_H
#define COMMAND_QUEUE_H

#include <stdint.h>

#include <deque>
#include <functional>
#include <memory>
#include <string>

#include "core/ftv_error.h"
#include "core/timer_service.h"

#define COMMAND_QUEUE_TIMER "command_queue"

/**
 * @brief A queued command
 *
 * Must call @p done exactly once when the command finishes. Extra calls are
 * ignored.
 */
typedef std::function<void(ftv_result_cb_t done)> command_fn_t;

class CommandQueue {
 public:
   explicit CommandQueue(TimerService &timers);
   ~CommandQueue();

   void set_min_interval(uint32_t interval_ms) { min_interval_ms_ = interval_ms; }
   uint32_t min_interval() const { return min_interval_ms_; }

   /**
    * @brief Append a command and start processing if idle
    *
    * @param label Name used in log messages
    * @param command Command to run
    * @param callback Receives the command's result
    */
   void enqueue(const std::string &label, command_fn_t command, ftv_result_cb_t callback);

   /**
    * @brief Fail the in-flight command and every queued command with @p err
    */
   void clear(ftv_error_t err);

   /** @brief Commands waiting behind the one in flight */
   size_t pending() const { return queue_.size(); }

   /** @brief True while a command is in flight or a spacing delay is running */
   bool is_busy() const { return in_flight_ || waiting_; }

 private:
   struct Entry {
      std::string label;
      command_fn_t command;
      ftv_result_cb_t callback;
   };

   void process();
   void dispatch();

   TimerService &timers_;
   uint32_t min_interval_ms_;
   std::deque<Entry> queue_;

   bool in_flight_;
   bool waiting_;
   bool has_dispatched_;
   uint64_t last_dispatch_ms_;

   /* Completion of the in-flight command; the flag marks it as delivered */
   ftv_result_cb_t in_flight_callback_;
   std::shared_ptr<bool> in_flight_done_;

   CommandQueue(const CommandQueue &);
   CommandQueue &operator=(const CommandQueue &);
};

#endif /* COMMAND_QUEUE_H */
