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

#include "firetv/pairing.h"

#include <ctype.h>

#include <utility>

#include "firetv/ftv_api.h"
#include "logging_common.h"

std::string pairing_strip_pin(const std::string &pin) {
   std::string stripped;
   stripped.reserve(pin.size());
   for (size_t i = 0; i < pin.size(); i++) {
      if (!isspace((unsigned char)pin[i])) {
         stripped += pin[i];
      }
   }
   return stripped;
}

PairingController::PairingController(DeviceSession &session,
                                     WakeController &wake,
                                     HttpClient &http,
                                     HostUi &ui)
    : session_(session), wake_(wake), http_(http), ui_(ui) {
}

void PairingController::fail_request(const std::string &status,
                                     ftv_error_t err,
                                     const ftv_result_cb_t &cb) {
   ui_.update_property(UI_PROP_PAIRING_STATUS, status);
   ftv_complete(cb, err);
}

void PairingController::fail_verify(const std::string &status,
                                    ftv_error_t err,
                                    const ftv_result_cb_t &cb) {
   ui_.update_property(UI_PROP_PAIRING_STATUS, status);
   ui_.fire_event(UI_EVENT_PAIRING_FAILED);
   ftv_complete(cb, err);
}

/* =============================================================================
 * PIN Request
 * ============================================================================= */

void PairingController::request_pin(ftv_result_cb_t callback) {
   if (!session_.has_address()) {
      FTV_LOG_ERROR("Cannot request PIN: No Fire TV IP address configured");
      fail_request(PAIRING_STATUS_NO_ADDRESS, FTV_ERR_NOT_CONFIGURED, callback);
      return;
   }

   FTV_LOG_INFO("Requesting PIN display on Fire TV");
   ui_.update_property(UI_PROP_PAIRING_STATUS, PAIRING_STATUS_REQUESTING);

   wake_.ensure_awake([this, callback](ftv_error_t err) {
      if (err != FTV_OK) {
         fail_request(PAIRING_STATUS_WAKE_FAILED, err, callback);
         return;
      }

      pin_display_request_t request;
      request.friendly_name = session_.friendly_name();

      http_.post(ftv_api_url(session_.address(), FTV_PATH_PIN_DISPLAY, NULL),
                 ftv_encode_pin_display(request), ftv_api_headers(false, ""),
                 [this, callback](const http_response_t &response) {
                    if (!http_response_ok(response)) {
                       std::string error = http_response_error(response);
                       FTV_LOG_ERROR("PIN request failed: %s", error.c_str());
                       fail_request("Error: " + error, ftv_http_error(response), callback);
                       return;
                    }
                    if (!ftv_response_is_ok(response.body)) {
                       FTV_LOG_ERROR("PIN request failed: unexpected response");
                       fail_request(PAIRING_STATUS_REQUEST_FAILED, FTV_ERR_PROTOCOL, callback);
                       return;
                    }

                    FTV_LOG_INFO("PIN requested successfully - check Fire TV screen");
                    ui_.update_property(UI_PROP_PAIRING_STATUS, PAIRING_STATUS_ENTER_PIN);
                    ftv_complete(callback, FTV_OK);
                 });
   });
}

/* =============================================================================
 * PIN Verification
 * ============================================================================= */

void PairingController::verify_pin(const std::string &pin, ftv_result_cb_t callback) {
   if (!session_.has_address()) {
      FTV_LOG_ERROR("Cannot verify PIN: No Fire TV IP address configured");
      fail_request(PAIRING_STATUS_NO_ADDRESS, FTV_ERR_NOT_CONFIGURED, callback);
      return;
   }

   std::string cleaned = pairing_strip_pin(pin);
   if (cleaned.empty()) {
      FTV_LOG_ERROR("Cannot verify PIN: No PIN provided");
      fail_request(PAIRING_STATUS_NO_PIN, FTV_ERR_INVALID_PARAM, callback);
      return;
   }

   FTV_LOG_INFO("Verifying PIN (%zu digits)", cleaned.size());
   ui_.update_property(UI_PROP_PAIRING_STATUS, PAIRING_STATUS_VERIFYING);

   wake_.ensure_awake([this, cleaned, callback](ftv_error_t err) {
      if (err != FTV_OK) {
         fail_request(PAIRING_STATUS_WAKE_FAILED, err, callback);
         return;
      }

      pin_verify_request_t request;
      request.pin = cleaned;

      http_.post(ftv_api_url(session_.address(), FTV_PATH_PIN_VERIFY, NULL),
                 ftv_encode_pin_verify(request), ftv_api_headers(false, ""),
                 [this, callback](const http_response_t &response) {
                    if (!http_response_ok(response)) {
                       std::string error = http_response_error(response);
                       FTV_LOG_ERROR("PIN verification failed: %s", error.c_str());
                       fail_verify("Error: " + error, ftv_http_error(response), callback);
                       return;
                    }

                    /* A non-empty description is the client token */
                    api_response_t reply;
                    if (!ftv_decode_api_response(response.body, &reply) ||
                        reply.description.empty()) {
                       FTV_LOG_ERROR("PIN verification failed: Invalid PIN");
                       fail_verify(PAIRING_STATUS_INVALID_PIN, FTV_ERR_PROTOCOL, callback);
                       return;
                    }

                    FTV_LOG_INFO("Pairing successful! Token received.");
                    if (session_.store_pairing(reply.description) != FTV_OK) {
                       FTV_LOG_WARNING("Token kept in memory only, pairing will not survive restart");
                    }

                    ui_.update_property(UI_PROP_PAIRING_STATUS, PAIRING_STATUS_PAIRED);
                    ui_.update_property(UI_PROP_PIN_CODE, "");
                    ui_.fire_event(UI_EVENT_PAIRED);

                    if (paired_callback_) {
                       paired_callback_();
                    }
                    ftv_complete(callback, FTV_OK);
                 });
   });
}

/* =============================================================================
 * Token Lifecycle
 * ============================================================================= */

void PairingController::clear_pairing() {
   session_.clear_pairing();
   ui_.update_property(UI_PROP_PAIRING_STATUS, PAIRING_STATUS_NOT_PAIRED);
   FTV_LOG_INFO("Pairing cleared");
}

bool PairingController::check_auth(const http_response_t &response) {
   if (!response.transport_error.empty()) {
      return false;
   }
   if (response.status_code != HTTP_STATUS_UNAUTHORIZED &&
       response.status_code != HTTP_STATUS_FORBIDDEN) {
      return false;
   }

   FTV_LOG_ERROR("Authentication failed (HTTP %ld) - pairing may be invalid",
                 response.status_code);
   session_.clear_pairing();
   ui_.update_property(UI_PROP_PAIRING_STATUS, PAIRING_STATUS_REPAIR);
   ui_.fire_event(UI_EVENT_PAIRING_LOST);
   return true;
}
