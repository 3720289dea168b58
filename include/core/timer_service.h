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
 * Timer Service - Named one-shot and repeating timers
 *
 * Timers are identified by name. Scheduling a name that is already armed
 * cancels the previous timer first, so a component can suppress duplicate
 * waits simply by reusing its timer name.
 */

#ifndef TIMER_SERVICE_H
#define TIMER_SERVICE_H

#include <stdint.h>

#include <functional>
#include <string>

typedef std::function<void()> timer_callback_t;

class TimerService {
 public:
   virtual ~TimerService() {}

   /**
    * @brief Arm a named timer
    *
    * @param name Timer name (re-arming replaces the previous timer)
    * @param delay_ms Delay before the first fire
    * @param callback Invoked on the loop when the timer fires
    * @param recurring Re-arm with the same delay after each fire
    */
   virtual void schedule(const std::string &name,
                         uint32_t delay_ms,
                         timer_callback_t callback,
                         bool recurring = false) = 0;

   /** @brief Cancel a named timer (no-op if not armed) */
   virtual void cancel(const std::string &name) = 0;

   /** @brief Cancel every armed timer */
   virtual void cancel_all() = 0;

   /** @brief Check whether a named timer is armed */
   virtual bool is_scheduled(const std::string &name) const = 0;

   /** @brief Monotonic time in milliseconds */
   virtual uint64_t now_ms() const = 0;
};

#endif /* TIMER_SERVICE_H */
