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
 * Command Encoder - Remote keys, media transport and text entry
 *
 * Turns logical remote actions into authenticated REST calls. Commands are
 * checked for an address and a pairing token up front, queued on the
 * CommandQueue, and run behind WakeController::ensure_awake(). A reply
 * counts as success only when it is 2xx and carries the "OK" sentinel.
 *
 * Status and properties are read-only queries and bypass the queue.
 */

#ifndef COMMAND_ENCODER_H
#define COMMAND_ENCODER_H

#include <stdint.h>

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "core/ftv_error.h"
#include "core/timer_service.h"
#include "firetv/command_queue.h"
#include "firetv/device_session.h"
#include "firetv/ftv_api.h"
#include "firetv/pairing.h"
#include "firetv/wake_controller.h"
#include "network/http_client.h"

typedef std::function<void(ftv_error_t err, const device_status_t &status)> status_cb_t;
typedef std::function<void(ftv_error_t err, const device_properties_t &properties)>
    properties_cb_t;

/**
 * @brief Split UTF-8 text into code points
 *
 * Bytes that do not start a valid sequence are returned on their own.
 */
std::vector<std::string> command_split_utf8(const std::string &text);

class CommandEncoder {
 public:
   CommandEncoder(DeviceSession &session,
                  WakeController &wake,
                  PairingController &pairing,
                  HttpClient &http,
                  CommandQueue &queue,
                  TimerService &timers);
   ~CommandEncoder();

   void set_key_delay(uint32_t delay_ms) { key_delay_ms_ = delay_ms; }
   void set_char_delay(uint32_t delay_ms) { char_delay_ms_ = delay_ms; }

   /**
    * @brief Check that commands can be sent
    *
    * @return FTV_OK, FTV_ERR_NOT_CONFIGURED or FTV_ERR_NOT_PAIRED
    */
   ftv_error_t check_ready() const;

   /**
    * @brief Press a remote key
    *
    * D-pad keys send keyDown, wait the key delay, then send keyUp. A failed
    * keyDown completes the command without sending keyUp. Home, back and
    * menu are a single press.
    */
   void send_key(ftv_key_t key, ftv_result_cb_t callback);

   void send_media(const media_request_t &request, ftv_result_cb_t callback);

   /** @brief Type one character */
   void send_character(const std::string &character, ftv_result_cb_t callback);

   /**
    * @brief Type a string one character at a time
    *
    * The whole string is one queued command. Characters are separated by the
    * character delay and the first failure stops the string.
    */
   void send_text(const std::string &text, ftv_result_cb_t callback);

   void get_status(status_cb_t callback);
   void get_properties(properties_cb_t callback);

 private:
   void run_key(ftv_key_t key, ftv_result_cb_t done);
   void run_text(uint64_t session,
                 std::shared_ptr<std::vector<std::string>> characters,
                 size_t index,
                 ftv_result_cb_t done);
   void post_command(const std::string &url, const std::string &body, ftv_result_cb_t done);
   void get_query(const char *path, std::function<void(ftv_error_t, const std::string &)> cb);
   void arm_timer(const std::string &name, uint32_t delay_ms, timer_callback_t callback);

   DeviceSession &session_;
   WakeController &wake_;
   PairingController &pairing_;
   HttpClient &http_;
   CommandQueue &queue_;
   TimerService &timers_;

   uint32_t key_delay_ms_;
   uint32_t char_delay_ms_;
   uint64_t text_session_;
   std::string pending_timer_; /* Commands are serialised, so at most one is armed */

   CommandEncoder(const CommandEncoder &);
   CommandEncoder &operator=(const CommandEncoder &);
};

#endif /* COMMAND_ENCODER_H */
