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

#include "core/event_loop.h"

#include <errno.h>
#include <poll.h>
#include <string.h>
#include <time.h>

#include <algorithm>
#include <utility>

#include "logging_common.h"

EventLoop::EventLoop() : next_timer_id_(1), pollers_busy_(false), stop_(false) {
}

EventLoop::~EventLoop() {
   cancel_all();
}

/* =============================================================================
 * Timers
 * ============================================================================= */

void EventLoop::schedule(const std::string &name,
                         uint32_t delay_ms,
                         timer_callback_t callback,
                         bool recurring) {
   Timer timer;
   timer.id = next_timer_id_++;
   timer.deadline_ms = now_ms() + delay_ms;
   timer.interval_ms = delay_ms;
   timer.recurring = recurring;
   timer.callback = std::move(callback);

   /* Re-arming under the same name implicitly cancels the previous timer */
   timers_[name] = std::move(timer);
}

void EventLoop::cancel(const std::string &name) {
   timers_.erase(name);
}

void EventLoop::cancel_all() {
   timers_.clear();
}

bool EventLoop::is_scheduled(const std::string &name) const {
   return timers_.find(name) != timers_.end();
}

uint64_t EventLoop::now_ms() const {
   struct timespec ts;
   clock_gettime(CLOCK_MONOTONIC, &ts);
   return (uint64_t)ts.tv_sec * 1000ULL + (uint64_t)ts.tv_nsec / 1000000ULL;
}

void EventLoop::fire_due_timers() {
   uint64_t now = now_ms();

   /* Snapshot due timers first: callbacks may arm, re-arm or cancel timers */
   std::vector<std::pair<uint64_t, std::pair<std::string, uint64_t>>> due;
   for (const auto &entry : timers_) {
      if (entry.second.deadline_ms <= now) {
         due.push_back(std::make_pair(entry.second.deadline_ms,
                                      std::make_pair(entry.first, entry.second.id)));
      }
   }
   std::sort(due.begin(), due.end());

   for (const auto &item : due) {
      const std::string &name = item.second.first;
      auto it = timers_.find(name);
      if (it == timers_.end() || it->second.id != item.second.second) {
         continue; /* Cancelled or replaced by an earlier callback */
      }

      timer_callback_t callback = it->second.callback;
      if (it->second.recurring) {
         it->second.deadline_ms = now + it->second.interval_ms;
      } else {
         timers_.erase(it);
      }

      if (callback) {
         callback();
      }
   }
}

/* =============================================================================
 * Descriptors and Pollers
 * ============================================================================= */

void EventLoop::watch_fd(int fd, fd_callback_t on_readable) {
   fds_[fd] = std::move(on_readable);
}

void EventLoop::unwatch_fd(int fd) {
   fds_.erase(fd);
}

void EventLoop::add_poller(poller_t poller) {
   pollers_.push_back(std::move(poller));
}

bool EventLoop::pump_pollers() {
   bool busy = false;
   for (size_t i = 0; i < pollers_.size(); i++) {
      if (pollers_[i]()) {
         busy = true;
      }
   }
   return busy;
}

int EventLoop::next_wait_ms(int max_wait_ms) const {
   int wait = max_wait_ms;
   if (pollers_busy_ && wait > EVENT_LOOP_BUSY_POLL_MS) {
      wait = EVENT_LOOP_BUSY_POLL_MS;
   }

   uint64_t now = now_ms();
   for (const auto &entry : timers_) {
      if (entry.second.deadline_ms <= now) {
         return 0;
      }
      uint64_t remaining = entry.second.deadline_ms - now;
      if (remaining < (uint64_t)wait) {
         wait = (int)remaining;
      }
   }
   return wait;
}

/* =============================================================================
 * Loop
 * ============================================================================= */

void EventLoop::run_once(int max_wait_ms) {
   std::vector<struct pollfd> pfds;
   pfds.reserve(fds_.size());
   for (const auto &entry : fds_) {
      struct pollfd pfd;
      pfd.fd = entry.first;
      pfd.events = POLLIN;
      pfd.revents = 0;
      pfds.push_back(pfd);
   }

   int wait = next_wait_ms(max_wait_ms);
   int ready = poll(pfds.empty() ? nullptr : pfds.data(), pfds.size(), wait);
   if (ready < 0 && errno != EINTR) {
      FTV_LOG_ERROR("poll failed: %s", strerror(errno));
   }

   if (ready > 0) {
      for (size_t i = 0; i < pfds.size(); i++) {
         if (!(pfds[i].revents & (POLLIN | POLLERR | POLLHUP))) {
            continue;
         }
         /* The callback may unwatch its own descriptor */
         auto it = fds_.find(pfds[i].fd);
         if (it != fds_.end()) {
            fd_callback_t callback = it->second;
            callback();
         }
      }
   }

   pollers_busy_ = pump_pollers();
   fire_due_timers();
}

void EventLoop::run() {
   stop_ = false;
   while (!stop_) {
      run_once(EVENT_LOOP_IDLE_WAIT_MS);
   }
}

void EventLoop::stop() {
   stop_ = true;
}
