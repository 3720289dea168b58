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
 * Event Loop - Single-threaded cooperative loop for timers, sockets and HTTP
 *
 * Uses poll() with CLOCK_MONOTONIC deadlines. Wakes when the next timer is
 * due, when a watched descriptor becomes readable, or periodically while a
 * registered poller (the curl multi transport) reports outstanding work.
 * Every callback runs on the thread that calls run().
 */

#ifndef EVENT_LOOP_H
#define EVENT_LOOP_H

#include <stdint.h>

#include <functional>
#include <map>
#include <string>
#include <vector>

#include "core/timer_service.h"

/* Poll interval while a poller has transfers in flight */
#define EVENT_LOOP_BUSY_POLL_MS 10

/* Upper bound on a single idle wait */
#define EVENT_LOOP_IDLE_WAIT_MS 1000

class EventLoop : public TimerService {
 public:
   typedef std::function<void()> fd_callback_t;

   /* Non-blocking work function; returns true while it still has work pending */
   typedef std::function<bool()> poller_t;

   EventLoop();
   ~EventLoop() override;

   /* TimerService */
   void schedule(const std::string &name,
                 uint32_t delay_ms,
                 timer_callback_t callback,
                 bool recurring = false) override;
   void cancel(const std::string &name) override;
   void cancel_all() override;
   bool is_scheduled(const std::string &name) const override;
   uint64_t now_ms() const override;

   /**
    * @brief Watch a descriptor for readability
    *
    * Replaces any previous callback for the same descriptor.
    */
   void watch_fd(int fd, fd_callback_t on_readable);
   void unwatch_fd(int fd);

   /** @brief Register a poller pumped on every iteration */
   void add_poller(poller_t poller);

   /**
    * @brief Run a single iteration
    *
    * @param max_wait_ms Longest time to block waiting for activity
    */
   void run_once(int max_wait_ms);

   /** @brief Run until stop() is called */
   void run();

   /** @brief Ask run() to return after the current iteration */
   void stop();

 private:
   struct Timer {
      uint64_t id;
      uint64_t deadline_ms;
      uint32_t interval_ms;
      bool recurring;
      timer_callback_t callback;
   };

   int next_wait_ms(int max_wait_ms) const;
   bool pump_pollers();
   void fire_due_timers();

   std::map<std::string, Timer> timers_;
   std::map<int, fd_callback_t> fds_;
   std::vector<poller_t> pollers_;
   uint64_t next_timer_id_;
   bool pollers_busy_;
   bool stop_;

   EventLoop(const EventLoop &);
   EventLoop &operator=(const EventLoop &);
};

#endif /* EVENT_LOOP_H */
