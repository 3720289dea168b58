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

#include "firetv/command_encoder.h"

#include <utility>

#include "config/ftv_config.h"
#include "logging_common.h"

std::vector<std::string> command_split_utf8(const std::string &text) {
   std::vector<std::string> characters;
   size_t i = 0;

   while (i < text.size()) {
      unsigned char lead = (unsigned char)text[i];
      size_t len = 1;
      if (lead >= 0xF0 && lead <= 0xF4) {
         len = 4;
      } else if (lead >= 0xE0) {
         len = 3;
      } else if (lead >= 0xC2 && lead <= 0xDF) {
         len = 2;
      }
      if (lead >= 0xF5) {
         len = 1;
      }

      if (len > 1) {
         if (i + len > text.size()) {
            len = 1;
         } else {
            for (size_t k = 1; k < len; k++) {
               if (((unsigned char)text[i + k] & 0xC0) != 0x80) {
                  len = 1;
                  break;
               }
            }
         }
      }

      characters.push_back(text.substr(i, len));
      i += len;
   }

   return characters;
}

CommandEncoder::CommandEncoder(DeviceSession &session,
                               WakeController &wake,
                               PairingController &pairing,
                               HttpClient &http,
                               CommandQueue &queue,
                               TimerService &timers)
    : session_(session),
      wake_(wake),
      pairing_(pairing),
      http_(http),
      queue_(queue),
      timers_(timers),
      key_delay_ms_(CONFIG_DEFAULT_KEY_DELAY_MS),
      char_delay_ms_(CONFIG_DEFAULT_CHAR_DELAY_MS),
      text_session_(0) {
}

CommandEncoder::~CommandEncoder() {
   if (!pending_timer_.empty()) {
      timers_.cancel(pending_timer_);
   }
}

ftv_error_t CommandEncoder::check_ready() const {
   if (!session_.has_address()) {
      return FTV_ERR_NOT_CONFIGURED;
   }
   if (!session_.is_paired()) {
      return FTV_ERR_NOT_PAIRED;
   }
   return FTV_OK;
}

void CommandEncoder::arm_timer(const std::string &name,
                               uint32_t delay_ms,
                               timer_callback_t callback) {
   pending_timer_ = name;
   timers_.schedule(name, delay_ms, [this, callback]() {
      pending_timer_.clear();
      callback();
   });
}

/* =============================================================================
 * Authenticated POST
 * ============================================================================= */

void CommandEncoder::post_command(const std::string &url,
                                  const std::string &body,
                                  ftv_result_cb_t done) {
   wake_.ensure_awake([this, url, body, done](ftv_error_t err) {
      if (err != FTV_OK) {
         ftv_complete(done, err);
         return;
      }
      /* Pairing may have been lost while waiting for the wake */
      if (!session_.is_paired()) {
         ftv_complete(done, FTV_ERR_NOT_PAIRED);
         return;
      }

      http_.post(url, body, ftv_api_headers(true, session_.token()),
                 [this, url, done](const http_response_t &response) {
                    if (pairing_.check_auth(response)) {
                       ftv_complete(done, FTV_ERR_AUTH_REJECTED);
                       return;
                    }
                    if (!http_response_ok(response)) {
                       FTV_LOG_DEBUG("Command %s failed: %s", url.c_str(),
                                     http_response_error(response).c_str());
                       ftv_complete(done, ftv_http_error(response));
                       return;
                    }
                    if (!ftv_response_is_ok(response.body)) {
                       FTV_LOG_DEBUG("Command %s failed: unexpected response", url.c_str());
                       ftv_complete(done, FTV_ERR_PROTOCOL);
                       return;
                    }
                    ftv_complete(done, FTV_OK);
                 });
   });
}

/* =============================================================================
 * Keys
 * ============================================================================= */

void CommandEncoder::send_key(ftv_key_t key, ftv_result_cb_t callback) {
   ftv_error_t err = check_ready();
   if (err != FTV_OK) {
      FTV_LOG_ERROR("Cannot send key %s: %s", ftv_key_action(key), ftv_error_str(err));
      ftv_complete(callback, err);
      return;
   }

   queue_.enqueue(ftv_key_action(key),
                  [this, key](ftv_result_cb_t done) { run_key(key, std::move(done)); },
                  std::move(callback));
}

void CommandEncoder::run_key(ftv_key_t key, ftv_result_cb_t done) {
   ftv_error_t err = check_ready();
   if (err != FTV_OK) {
      ftv_complete(done, err);
      return;
   }

   const char *action = ftv_key_action(key);
   std::string url = ftv_api_url(session_.address(), FTV_PATH_KEY, action);

   key_request_t request;
   request.key = key;

   if (!ftv_key_is_dpad(key)) {
      request.key_action_type = NULL;
      post_command(url, ftv_encode_key(request), done);
      return;
   }

   request.key_action_type = FTV_KEY_ACTION_DOWN;
   post_command(url, ftv_encode_key(request), [this, key, url, done](ftv_error_t down_err) {
      if (down_err != FTV_OK) {
         ftv_complete(done, down_err);
         return;
      }

      std::string timer = std::string("dpad_") + ftv_key_action(key);
      arm_timer(timer, key_delay_ms_, [this, key, url, done]() {
         key_request_t up;
         up.key = key;
         up.key_action_type = FTV_KEY_ACTION_UP;
         post_command(url, ftv_encode_key(up), done);
      });
   });
}

/* =============================================================================
 * Media
 * ============================================================================= */

void CommandEncoder::send_media(const media_request_t &request, ftv_result_cb_t callback) {
   const char *action = ftv_media_action(request.action);

   ftv_error_t err = check_ready();
   if (err != FTV_OK) {
      FTV_LOG_ERROR("Cannot send media command %s: %s", action, ftv_error_str(err));
      ftv_complete(callback, err);
      return;
   }

   queue_.enqueue(std::string("media_") + action,
                  [this, request, action](ftv_result_cb_t done) {
                     ftv_error_t ready = check_ready();
                     if (ready != FTV_OK) {
                        ftv_complete(done, ready);
                        return;
                     }
                     post_command(ftv_api_url(session_.address(), FTV_PATH_MEDIA, action),
                                  ftv_encode_media(request), done);
                  },
                  std::move(callback));
}

/* =============================================================================
 * Text
 * ============================================================================= */

void CommandEncoder::send_character(const std::string &character, ftv_result_cb_t callback) {
   if (character.empty()) {
      ftv_complete(callback, FTV_ERR_INVALID_PARAM);
      return;
   }
   send_text(command_split_utf8(character).front(), std::move(callback));
}

void CommandEncoder::send_text(const std::string &text, ftv_result_cb_t callback) {
   if (text.empty()) {
      FTV_LOG_ERROR("Cannot send text: empty string");
      ftv_complete(callback, FTV_ERR_INVALID_PARAM);
      return;
   }

   ftv_error_t err = check_ready();
   if (err != FTV_OK) {
      FTV_LOG_ERROR("Cannot send text: %s", ftv_error_str(err));
      ftv_complete(callback, err);
      return;
   }

   std::shared_ptr<std::vector<std::string>> characters =
       std::make_shared<std::vector<std::string>>(command_split_utf8(text));
   uint64_t session = ++text_session_;

   queue_.enqueue("text",
                  [this, session, characters](ftv_result_cb_t done) {
                     run_text(session, characters, 0, std::move(done));
                  },
                  std::move(callback));
}

void CommandEncoder::run_text(uint64_t session,
                              std::shared_ptr<std::vector<std::string>> characters,
                              size_t index,
                              ftv_result_cb_t done) {
   ftv_error_t err = check_ready();
   if (err != FTV_OK) {
      ftv_complete(done, err);
      return;
   }

   text_request_t request;
   request.text = (*characters)[index];

   post_command(ftv_api_url(session_.address(), FTV_PATH_TEXT, NULL), ftv_encode_text(request),
                [this, session, characters, index, done](ftv_error_t char_err) {
                   if (char_err != FTV_OK) {
                      FTV_LOG_DEBUG("Text session %llu stopped at character %zu",
                                    (unsigned long long)session, index);
                      ftv_complete(done, char_err);
                      return;
                   }
                   size_t next = index + 1;
                   if (next >= characters->size()) {
                      ftv_complete(done, FTV_OK);
                      return;
                   }

                   std::string timer = "text_" + std::to_string(session) + "_" +
                                       std::to_string(next);
                   arm_timer(timer, char_delay_ms_, [this, session, characters, next, done]() {
                      run_text(session, characters, next, done);
                   });
                });
}

/* =============================================================================
 * Queries
 * ============================================================================= */

void CommandEncoder::get_query(const char *path,
                               std::function<void(ftv_error_t, const std::string &)> cb) {
   if (!session_.has_address()) {
      cb(FTV_ERR_NOT_CONFIGURED, "");
      return;
   }

   bool authenticated = session_.is_paired();
   std::string path_name = path;
   http_.get(ftv_api_url(session_.address(), path, NULL),
             ftv_api_headers(authenticated, session_.token()),
             [this, authenticated, path_name, cb](const http_response_t &response) {
                if (authenticated && pairing_.check_auth(response)) {
                   cb(FTV_ERR_AUTH_REJECTED, "");
                   return;
                }
                if (!http_response_ok(response)) {
                   FTV_LOG_DEBUG("GET %s failed: %s", path_name.c_str(),
                                 http_response_error(response).c_str());
                   cb(ftv_http_error(response), "");
                   return;
                }
                cb(FTV_OK, response.body);
             });
}

void CommandEncoder::get_status(status_cb_t callback) {
   get_query(FTV_PATH_STATUS, [callback](ftv_error_t err, const std::string &body) {
      device_status_t status;
      if (err == FTV_OK && !ftv_decode_status(body, &status)) {
         err = FTV_ERR_PROTOCOL;
      }
      if (callback) {
         callback(err, status);
      }
   });
}

void CommandEncoder::get_properties(properties_cb_t callback) {
   get_query(FTV_PATH_PROPERTIES, [callback](ftv_error_t err, const std::string &body) {
      device_properties_t properties;
      properties.name = FTV_DEFAULT_PRODUCT_NAME;
      if (err == FTV_OK && !ftv_decode_properties(body, &properties)) {
         err = FTV_ERR_PROTOCOL;
      }
      if (callback) {
         callback(err, properties);
      }
   });
}
