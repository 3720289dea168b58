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

#include "firetv/ftv_api.h"

#include <json-c/json.h>
#include <strings.h>

#include <string>

#define FTV_JSON_FLAGS (JSON_C_TO_STRING_PLAIN | JSON_C_TO_STRING_NOSLASHESCAPE)

typedef struct {
   ftv_key_t key;
   const char *action;
   const char *short_name;
   bool dpad;
} key_entry_t;

static const key_entry_t s_keys[] = {
   { FTV_KEY_UP, "dpad_up", "up", true },
   { FTV_KEY_DOWN, "dpad_down", "down", true },
   { FTV_KEY_LEFT, "dpad_left", "left", true },
   { FTV_KEY_RIGHT, "dpad_right", "right", true },
   { FTV_KEY_SELECT, "select", "ok", true },
   { FTV_KEY_HOME, "home", "home", false },
   { FTV_KEY_BACK, "back", "back", false },
   { FTV_KEY_MENU, "menu", "menu", false },
};

#define KEY_COUNT (sizeof(s_keys) / sizeof(s_keys[0]))

/* =============================================================================
 * Keys and Media Actions
 * ============================================================================= */

const char *ftv_key_action(ftv_key_t key) {
   for (size_t i = 0; i < KEY_COUNT; i++) {
      if (s_keys[i].key == key) {
         return s_keys[i].action;
      }
   }
   return "unknown";
}

bool ftv_key_is_dpad(ftv_key_t key) {
   for (size_t i = 0; i < KEY_COUNT; i++) {
      if (s_keys[i].key == key) {
         return s_keys[i].dpad;
      }
   }
   return false;
}

bool ftv_key_from_name(const std::string &name, ftv_key_t *key) {
   for (size_t i = 0; i < KEY_COUNT; i++) {
      if (strcasecmp(name.c_str(), s_keys[i].action) == 0 ||
          strcasecmp(name.c_str(), s_keys[i].short_name) == 0) {
         if (key) {
            *key = s_keys[i].key;
         }
         return true;
      }
   }
   return false;
}

const char *ftv_media_action(ftv_media_action_t action) {
   switch (action) {
      case FTV_MEDIA_PLAY:
         return "play";
      case FTV_MEDIA_PAUSE:
         return "pause";
      case FTV_MEDIA_STOP:
         return "stop";
      case FTV_MEDIA_SCAN:
         return "scan";
   }
   return "unknown";
}

/* =============================================================================
 * Request Encoding
 * ============================================================================= */

static std::string to_json_text(json_object *obj) {
   std::string text = json_object_to_json_string_ext(obj, FTV_JSON_FLAGS);
   json_object_put(obj);
   return text;
}

static std::string single_field(const char *key, const std::string &value) {
   json_object *obj = json_object_new_object();
   json_object_object_add(obj, key, json_object_new_string(value.c_str()));
   return to_json_text(obj);
}

std::string ftv_encode_pin_display(const pin_display_request_t &request) {
   return single_field("friendlyName", request.friendly_name);
}

std::string ftv_encode_pin_verify(const pin_verify_request_t &request) {
   return single_field("pin", request.pin);
}

std::string ftv_encode_key(const key_request_t &request) {
   json_object *obj = json_object_new_object();
   if (request.key_action_type) {
      json_object_object_add(obj, "keyActionType",
                             json_object_new_string(request.key_action_type));
   }
   return to_json_text(obj);
}

std::string ftv_encode_media(const media_request_t &request) {
   json_object *obj = json_object_new_object();
   if (request.action == FTV_MEDIA_SCAN) {
      /* The device expects every scan parameter as a string */
      json_object_object_add(
          obj, "direction",
          json_object_new_string(request.direction == FTV_SCAN_BACK ? "back" : "forward"));
      json_object_object_add(
          obj, "durationInSeconds",
          json_object_new_string(std::to_string(request.duration_sec).c_str()));
      json_object_object_add(obj, "speed",
                             json_object_new_string(std::to_string(request.speed).c_str()));
   }
   return to_json_text(obj);
}

std::string ftv_encode_text(const text_request_t &request) {
   return single_field("text", request.text);
}

media_request_t ftv_media_scan(ftv_scan_direction_t direction, int seconds) {
   media_request_t request;
   request.action = FTV_MEDIA_SCAN;
   request.direction = direction;
   request.duration_sec = seconds > 0 ? seconds : FTV_DEFAULT_SCAN_SECONDS;
   request.speed = 1;
   return request;
}

media_request_t ftv_media_simple(ftv_media_action_t action) {
   media_request_t request;
   request.action = action;
   request.direction = FTV_SCAN_FORWARD;
   request.duration_sec = 0;
   request.speed = 0;
   return request;
}

/* =============================================================================
 * Response Decoding
 * ============================================================================= */

static json_object *parse_object(const std::string &body) {
   if (body.empty()) {
      return NULL;
   }
   json_object *obj = json_tokener_parse(body.c_str());
   if (obj && !json_object_is_type(obj, json_type_object)) {
      json_object_put(obj);
      return NULL;
   }
   return obj;
}

static void collect_fields(json_object *obj, std::map<std::string, std::string> *fields) {
   json_object_object_foreach(obj, key, val) {
      if (!val) {
         continue;
      }
      if (json_object_is_type(val, json_type_string)) {
         (*fields)[key] = json_object_get_string(val);
      } else {
         (*fields)[key] = json_object_to_json_string_ext(val, FTV_JSON_FLAGS);
      }
   }
}

bool ftv_decode_api_response(const std::string &body, api_response_t *response) {
   json_object *obj = parse_object(body);
   if (!obj) {
      return false;
   }

   response->description.clear();
   json_object *description = NULL;
   if (json_object_object_get_ex(obj, "description", &description) &&
       json_object_is_type(description, json_type_string)) {
      response->description = json_object_get_string(description);
   }
   json_object_put(obj);
   return true;
}

bool ftv_response_is_ok(const std::string &body) {
   api_response_t response;
   return ftv_decode_api_response(body, &response) &&
          response.description == FTV_SUCCESS_SENTINEL;
}

bool ftv_decode_properties(const std::string &body, device_properties_t *properties) {
   json_object *obj = parse_object(body);
   if (!obj) {
      return false;
   }

   properties->fields.clear();
   collect_fields(obj, &properties->fields);
   json_object_put(obj);

   auto it = properties->fields.find("pfm");
   properties->name = (it != properties->fields.end() && !it->second.empty())
                          ? it->second
                          : std::string(FTV_DEFAULT_PRODUCT_NAME);
   return true;
}

bool ftv_decode_status(const std::string &body, device_status_t *status) {
   json_object *obj = parse_object(body);
   if (!obj) {
      return false;
   }

   status->fields.clear();
   collect_fields(obj, &status->fields);
   json_object_put(obj);
   return true;
}

/* =============================================================================
 * URLs and Headers
 * ============================================================================= */

std::string ftv_wake_url(const std::string &address) {
   return "http://" + address + ":" + std::to_string(FTV_DIAL_PORT) + FTV_PATH_WAKE;
}

std::string ftv_api_url(const std::string &address, const char *path, const char *action) {
   std::string url = "https://" + address + ":" + std::to_string(FTV_API_PORT) + path;
   if (action) {
      url += "?action=";
      url += action;
   }
   return url;
}

http_headers_t ftv_wake_headers(void) {
   http_headers_t headers;
   headers.push_back(std::make_pair("Content-Type", "text/plain"));
   return headers;
}

http_headers_t ftv_api_headers(bool authenticated, const std::string &token) {
   http_headers_t headers;
   headers.push_back(std::make_pair("Content-Type", "application/json; charset=utf-8"));
   headers.push_back(std::make_pair("Accept", "*/*"));
   headers.push_back(std::make_pair(FTV_HEADER_API_KEY, FTV_API_KEY));
   if (authenticated && !token.empty()) {
      headers.push_back(std::make_pair(FTV_HEADER_CLIENT_TOKEN, token));
   }
   return headers;
}

ftv_error_t ftv_http_error(const http_response_t &response) {
   return response.transport_error.empty() ? FTV_ERR_HTTP_STATUS : FTV_ERR_NETWORK;
}
