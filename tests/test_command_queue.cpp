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

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "firetv/command_queue.h"
#include "test_fakes.h"

class CommandQueueTest : public ::testing::Test {
 protected:
   CommandQueueTest() : queue(timers) { queue.set_min_interval(150); }

   /* A command that records its start time and waits for finish() */
   command_fn_t deferred(const std::string &label) {
      return [this, label](ftv_result_cb_t done) {
         started.push_back(label);
         start_times.push_back(timers.now_ms());
         open.push_back(done);
      };
   }

   /* A command that completes as soon as it starts */
   command_fn_t immediate(ftv_error_t result) {
      return [this, result](ftv_result_cb_t done) {
         start_times.push_back(timers.now_ms());
         done(result);
      };
   }

   void finish(ftv_error_t err) {
      ftv_result_cb_t done = open.front();
      open.erase(open.begin());
      done(err);
   }

   FakeTimerService timers;
   CommandQueue queue;
   std::vector<std::string> started;
   std::vector<uint64_t> start_times;
   std::vector<ftv_result_cb_t> open;
};

TEST_F(CommandQueueTest, FirstCommandRunsImmediately) {
   ResultRecorder results;
   queue.enqueue("home", immediate(FTV_OK), results.callback());

   ASSERT_EQ(1u, results.count());
   EXPECT_EQ(FTV_OK, results.last());
   EXPECT_FALSE(queue.is_busy());
}

TEST_F(CommandQueueTest, BurstKeepsMinimumSpacing) {
   ResultRecorder results;
   for (int i = 0; i < 5; i++) {
      queue.enqueue("key", immediate(FTV_OK), results.callback());
   }

   EXPECT_EQ(1u, start_times.size());
   EXPECT_EQ(4u, queue.pending());

   timers.advance(1000);

   ASSERT_EQ(5u, start_times.size());
   for (size_t i = 1; i < start_times.size(); i++) {
      EXPECT_GE(start_times[i] - start_times[i - 1], 150u);
   }
   EXPECT_EQ(5u, results.count());
   EXPECT_FALSE(queue.is_busy());
}

TEST_F(CommandQueueTest, OneCommandInFlight) {
   ResultRecorder results;
   queue.enqueue("a", deferred("a"), results.callback());
   queue.enqueue("b", deferred("b"), results.callback());

   timers.advance(500);
   ASSERT_EQ(1u, started.size());
   EXPECT_TRUE(queue.is_busy());

   finish(FTV_OK);
   /* The first command took longer than the interval, so b starts now */
   ASSERT_EQ(2u, started.size());
   EXPECT_EQ("b", started[1]);

   finish(FTV_ERR_HTTP_STATUS);
   ASSERT_EQ(2u, results.count());
   EXPECT_EQ(FTV_OK, results.results[0]);
   EXPECT_EQ(FTV_ERR_HTTP_STATUS, results.results[1]);
}

TEST_F(CommandQueueTest, SpacingMeasuredFromDispatch) {
   ResultRecorder results;
   queue.enqueue("a", deferred("a"), results.callback());
   timers.advance(100);
   finish(FTV_OK);

   queue.enqueue("b", deferred("b"), results.callback());
   EXPECT_EQ(1u, started.size());
   EXPECT_EQ(50u, timers.delay_of(COMMAND_QUEUE_TIMER));

   timers.advance(50);
   ASSERT_EQ(2u, started.size());
   EXPECT_EQ(150u, start_times[1] - start_times[0]);
}

TEST_F(CommandQueueTest, FailureDoesNotStopQueue) {
   ResultRecorder results;
   queue.enqueue("a", immediate(FTV_ERR_NETWORK), results.callback());
   queue.enqueue("b", immediate(FTV_OK), results.callback());
   timers.advance(150);

   ASSERT_EQ(2u, results.count());
   EXPECT_EQ(FTV_ERR_NETWORK, results.results[0]);
   EXPECT_EQ(FTV_OK, results.results[1]);
}

TEST_F(CommandQueueTest, RepeatedCompletionIsIgnored) {
   ResultRecorder results;
   ftv_result_cb_t saved;
   queue.enqueue("a",
                 [&](ftv_result_cb_t done) {
                    saved = done;
                    done(FTV_OK);
                 },
                 results.callback());
   saved(FTV_ERR_NETWORK);

   ASSERT_EQ(1u, results.count());
   EXPECT_EQ(FTV_OK, results.last());
}

TEST_F(CommandQueueTest, ClearFailsEverything) {
   ResultRecorder results;
   queue.enqueue("a", deferred("a"), results.callback());
   queue.enqueue("b", deferred("b"), results.callback());
   queue.enqueue("c", deferred("c"), results.callback());

   queue.clear(FTV_ERR_CANCELLED);

   ASSERT_EQ(3u, results.count());
   for (size_t i = 0; i < results.count(); i++) {
      EXPECT_EQ(FTV_ERR_CANCELLED, results.results[i]);
   }
   EXPECT_FALSE(queue.is_busy());
   EXPECT_EQ(0u, queue.pending());

   /* The original command finishing late changes nothing */
   finish(FTV_OK);
   EXPECT_EQ(3u, results.count());
   timers.advance(1000);
   EXPECT_EQ(1u, started.size());
}

TEST_F(CommandQueueTest, CallbackMayEnqueue) {
   ResultRecorder results;
   queue.enqueue("a", immediate(FTV_OK), [&](ftv_error_t err) {
      results.results.push_back(err);
      queue.enqueue("b", immediate(FTV_OK), results.callback());
   });
   timers.advance(150);

   EXPECT_EQ(2u, results.count());
   EXPECT_EQ(2u, start_times.size());
}
