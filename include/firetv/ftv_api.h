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
 * Fire TV REST API - Endpoints, headers and request/response schemas
 *
 * Every endpoint has a request struct encoded to JSON here, so callers never
 * build JSON by hand. Responses share one convention: a "description" field
 * that reads "OK" on success. PIN verification is the exception, where a
 * non-empty description is the new client token.
 */

#ifndef FTV_API_H
#define FTV_API_H

#include <map>
#include <string>

#include "core/ftv_error.h"
#include "network/http_client.h"

/* =============================================================================
 * Constants
 * ============================================================================= */

/* Fixed key shipped with the official remote app */
#define FTV_API_KEY "0987654321"

#define FTV_DIAL_PORT 8009 /* Wake (DIAL) */
#define FTV_API_PORT 8080  /* HTTPS REST API, self-signed certificate */

#define FTV_PATH_WAKE "/apps/FireTVRemote"
#define FTV_PATH_PIN_DISPLAY "/v1/FireTV/pin/display"
#define FTV_PATH_PIN_VERIFY "/v1/FireTV/pin/verify"
#define FTV_PATH_KEY "/v1/FireTV"
#define FTV_PATH_MEDIA "/v1/media"
#define FTV_PATH_TEXT "/v1/FireTV/text"
#define FTV_PATH_STATUS "/v1/FireTV/status"
#define FTV_PATH_PROPERTIES "/v1/FireTV/properties"

#define FTV_SUCCESS_SENTINEL "OK"

#define FTV_HEADER_API_KEY "x-api-key"
#define FTV_HEADER_CLIENT_TOKEN "x-client-token"

#define FTV_KEY_ACTION_DOWN "keyDown"
#define FTV_KEY_ACTION_UP "keyUp"

#define FTV_DEFAULT_PRODUCT_NAME "Fire TV"
#define FTV_DEFAULT_SCAN_SECONDS 10

/* =============================================================================
 * Keys and Media Actions
 * ============================================================================= */

typedef enum {
   FTV_KEY_UP = 0,
   FTV_KEY_DOWN,
   FTV_KEY_LEFT,
   FTV_KEY_RIGHT,
   FTV_KEY_SELECT,
   FTV_KEY_HOME,
   FTV_KEY_BACK,
   FTV_KEY_MENU,
} ftv_key_t;

typedef enum {
   FTV_MEDIA_PLAY = 0,
   FTV_MEDIA_PAUSE,
   FTV_MEDIA_STOP,
   FTV_MEDIA_SCAN,
} ftv_media_action_t;

typedef enum {
   FTV_SCAN_FORWARD = 0,
   FTV_SCAN_BACK,
} ftv_scan_direction_t;

/** @brief Wire action for a key ("dpad_up", "select", "home", ...) */
const char *ftv_key_action(ftv_key_t key);

/** @brief D-pad keys are sent as a keyDown/keyUp pair */
bool ftv_key_is_dpad(ftv_key_t key);

/**
 * @brief Look up a key by name
 *
 * Accepts the wire action ("dpad_left") or the short name ("left"),
 * case-insensitively.
 */
bool ftv_key_from_name(const std::string &name, ftv_key_t *key);

/** @brief Wire action for a media command ("play", "pause", "stop", "scan") */
const char *ftv_media_action(ftv_media_action_t action);

/* =============================================================================
 * Request Schemas
 * ============================================================================= */

typedef struct {
   std::string friendly_name;
} pin_display_request_t;

typedef struct {
   std::string pin;
} pin_verify_request_t;

typedef struct {
   ftv_key_t key;
   const char *key_action_type; /* FTV_KEY_ACTION_DOWN/UP, or NULL for a single press */
} key_request_t;

typedef struct {
   ftv_media_action_t action;
   ftv_scan_direction_t direction; /* FTV_MEDIA_SCAN only */
   int duration_sec;               /* FTV_MEDIA_SCAN only */
   int speed;                      /* FTV_MEDIA_SCAN only */
} media_request_t;

typedef struct {
   std::string text; /* One character */
} text_request_t;

std::string ftv_encode_pin_display(const pin_display_request_t &request);
std::string ftv_encode_pin_verify(const pin_verify_request_t &request);
std::string ftv_encode_key(const key_request_t &request);
std::string ftv_encode_media(const media_request_t &request);
std::string ftv_encode_text(const text_request_t &request);

/** @brief Scan request with the default speed */
media_request_t ftv_media_scan(ftv_scan_direction_t direction, int seconds);

/** @brief Request for play, pause or stop */
media_request_t ftv_media_simple(ftv_media_action_t action);

/* =============================================================================
 * Response Schemas
 * ============================================================================= */

typedef struct {
   std::string description;
} api_response_t;

typedef struct {
   std::string name; /* "pfm" field */
   std::map<std::string, std::string> fields;
} device_properties_t;

typedef struct {
   std::map<std::string, std::string> fields;
} device_status_t;

/**
 * @brief Decode the common {"description": ...} response
 *
 * @return false if the body is not a JSON object. A missing or non-string
 *         description decodes as empty.
 */
bool ftv_decode_api_response(const std::string &body, api_response_t *response);

/** @brief True when the body decodes and its description is the success sentinel */
bool ftv_response_is_ok(const std::string &body);

bool ftv_decode_properties(const std::string &body, device_properties_t *properties);
bool ftv_decode_status(const std::string &body, device_status_t *status);

/* =============================================================================
 * URLs and Headers
 * ============================================================================= */

/** @brief http://<address>:8009/apps/FireTVRemote */
std::string ftv_wake_url(const std::string &address);

/**
 * @brief https://<address>:8080<path>[?action=<action>]
 *
 * @param action Query action, or NULL for none
 */
std::string ftv_api_url(const std::string &address, const char *path, const char *action);

/** @brief Content-Type: text/plain */
http_headers_t ftv_wake_headers(void);

/**
 * @brief JSON headers with the API key
 *
 * The client token header is added only when @p authenticated is set and
 * @p token is non-empty.
 */
http_headers_t ftv_api_headers(bool authenticated, const std::string &token);

/**
 * @brief Classify a failed exchange
 *
 * @return FTV_ERR_NETWORK for transport errors, FTV_ERR_HTTP_STATUS otherwise
 */
ftv_error_t ftv_http_error(const http_response_t &response);

#endif /* FTV_API_H */
