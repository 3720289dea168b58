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
 * Pairing Controller - PIN handshake and authentication failure handling
 *
 * Pairing is two steps: request_pin() asks the TV to show a PIN, then
 * verify_pin() sends the PIN back and receives the client token in the
 * "description" field of the reply. Neither step mutates pairing state on
 * failure.
 */

#ifndef PAIRING_H
#define PAIRING_H

#include <functional>
#include <string>
#include <utility>

#include "core/ftv_error.h"
#include "firetv/device_session.h"
#include "firetv/wake_controller.h"
#include "network/http_client.h"
#include "ui/host_ui.h"

/* Pairing Status texts */
#define PAIRING_STATUS_REQUESTING "Requesting PIN..."
#define PAIRING_STATUS_ENTER_PIN "Enter PIN from TV screen"
#define PAIRING_STATUS_VERIFYING "Verifying PIN..."
#define PAIRING_STATUS_REPAIR "Re-pair required"
#define PAIRING_STATUS_NO_ADDRESS "Error: No IP Address"
#define PAIRING_STATUS_NO_PIN "Error: No PIN entered"
#define PAIRING_STATUS_WAKE_FAILED "Error: Cannot wake device"
#define PAIRING_STATUS_REQUEST_FAILED "Error: PIN request failed"
#define PAIRING_STATUS_INVALID_PIN "Error: Invalid PIN"

#define HTTP_STATUS_UNAUTHORIZED 401
#define HTTP_STATUS_FORBIDDEN 403

/**
 * @brief Remove all whitespace from a PIN as typed by the user
 */
std::string pairing_strip_pin(const std::string &pin);

class PairingController {
 public:
   PairingController(DeviceSession &session,
                     WakeController &wake,
                     HttpClient &http,
                     HostUi &ui);

   /** @brief Called after a successful pairing (device info refresh) */
   void set_paired_callback(std::function<void()> callback) {
      paired_callback_ = std::move(callback);
   }

   /**
    * @brief Ask the TV to display a pairing PIN
    *
    * @param callback FTV_OK once the PIN is on screen
    */
   void request_pin(ftv_result_cb_t callback);

   /**
    * @brief Verify the PIN shown on the TV and store the returned token
    *
    * Whitespace is stripped from @p pin before it is sent. An empty PIN
    * fails with FTV_ERR_INVALID_PARAM and no request is made.
    */
   void verify_pin(const std::string &pin, ftv_result_cb_t callback);

   /** @brief Forget the pairing token */
   void clear_pairing();

   /**
    * @brief Inspect an authenticated response for token rejection
    *
    * A 401 or 403 drops the pairing immediately: the token is cleared in
    * memory and storage, status becomes "Re-pair required" and the
    * Pairing Lost event fires. Never retried.
    *
    * @return true if the response was an authentication rejection
    */
   bool check_auth(const http_response_t &response);

 private:
   void fail_request(const std::string &status, ftv_error_t err, const ftv_result_cb_t &cb);
   void fail_verify(const std::string &status, ftv_error_t err, const ftv_result_cb_t &cb);

   DeviceSession &session_;
   WakeController &wake_;
   HttpClient &http_;
   HostUi &ui_;
   std::function<void()> paired_callback_;

   PairingController(const PairingController &);
   PairingController &operator=(const PairingController &);
};

#endif /* PAIRING_H */
