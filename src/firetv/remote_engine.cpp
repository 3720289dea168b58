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

#include "firetv/remote_engine.h"

#include <stdlib.h>

#include <utility>

#include "firetv/ftv_api.h"
#include "logging_common.h"

static std::string param_value(const command_params_t &params, const char *key) {
   auto it = params.find(key);
   return it != params.end() ? it->second : std::string();
}

RemoteEngine::RemoteEngine(HttpTransport &transport,
                           MulticastChannel &channel,
                           TimerService &timers,
                           KeyValueStore &store,
                           HostUi &ui)
    : timers_(timers),
      ui_(ui),
      session_(store, ui),
      http_(transport),
      wake_(session_, http_, timers),
      pairing_(session_, wake_, http_, ui),
      queue_(timers),
      encoder_(session_, wake_, pairing_, http_, queue_, timers),
      discovery_(channel, timers, store, ui) {
   pairing_.set_paired_callback([this]() { refresh_device_info(nullptr); });

   discovery_.set_found_callback([](const mdns_device_t &device) {
      FTV_LOG_INFO("Found Fire TV: %s at %s", device.name.c_str(), device.address.c_str());
   });
   discovery_.set_departed_callback([this](const mdns_device_t &device) {
      FTV_LOG_INFO("Fire TV left the network: %s at %s", device.name.c_str(),
                   device.address.c_str());
      if (device.address == session_.address()) {
         session_.set_connected(false);
      }
   });
   discovery_.set_complete_callback([this](size_t count) {
      FTV_LOG_INFO("Discovery complete: %zu device(s)", count);
      ftv_result_cb_t callback = std::move(discovery_callback_);
      discovery_callback_ = nullptr;
      ftv_complete(callback, FTV_OK);
   });
}

RemoteEngine::~RemoteEngine() {
   discovery_.set_complete_callback(nullptr);
}

void RemoteEngine::init(const ftv_config_t &config) {
   set_debug(config.logging.debug);

   session_.set_friendly_name(config.device.friendly_name);
   session_.set_auto_wake(config.device.auto_wake);
   set_timeout(config.device.timeout_sec);

   wake_timing_t timing;
   timing.settle_ms = (uint32_t)config.timing.settle_ms;
   timing.fresh_ms = (uint32_t)config.timing.wake_fresh_sec * 1000;
   timing.max_attempts = config.timing.wake_max_attempts;
   timing.backoff_ms = (uint32_t)config.timing.wake_backoff_ms;
   wake_.set_timing(timing);

   queue_.set_min_interval((uint32_t)config.timing.command_interval_ms);
   encoder_.set_key_delay((uint32_t)config.timing.key_delay_ms);
   encoder_.set_char_delay((uint32_t)config.timing.char_delay_ms);
   discovery_.set_timing((uint32_t)config.discovery.timeout_ms,
                         (uint32_t)config.discovery.retransmit_ms);

   session_.restore();
   size_t cached = discovery_.restore();
   if (cached > 0) {
      FTV_LOG_INFO("Restored %zu discovered device(s) from storage", cached);
   }

   if (config.device.address[0] != '\0' && session_.address() != config.device.address) {
      set_address(config.device.address);
   }

   FTV_LOG_INFO("Remote engine initialized");
}

/* =============================================================================
 * Settings
 * ============================================================================= */

void RemoteEngine::set_address(const std::string &address) {
   session_.set_address(address);
}

ftv_error_t RemoteEngine::select_discovered_device(const std::string &item) {
   if (item.empty() || item == UI_DEVICE_LIST_PLACEHOLDER) {
      return FTV_ERR_INVALID_PARAM;
   }

   std::string label;
   std::string address;
   if (!discovery_parse_list_item(item, &label, &address)) {
      FTV_LOG_WARNING("Malformed device selection: %s", item.c_str());
      return FTV_ERR_INVALID_PARAM;
   }

   FTV_LOG_INFO("Selected device: %s (%s)", label.c_str(), address.c_str());
   set_address(address);

   const mdns_device_t *device = discovery_.find(address);
   ui_.update_property(UI_PROP_DEVICE_NAME, (device && !device->name.empty())
                                                ? device->name
                                                : std::string(FTV_DEFAULT_PRODUCT_NAME));
   return FTV_OK;
}

void RemoteEngine::set_friendly_name(const std::string &name) {
   session_.set_friendly_name(name.empty() ? std::string(CONFIG_DEFAULT_FRIENDLY_NAME) : name);
}

void RemoteEngine::set_timeout(int timeout_sec) {
   if (timeout_sec <= 0) {
      timeout_sec = CONFIG_DEFAULT_TIMEOUT_SEC;
   }
   session_.set_timeout_sec(timeout_sec);
   http_.set_timeout(timeout_sec);
}

void RemoteEngine::set_auto_wake(bool enabled) {
   session_.set_auto_wake(enabled);
}

void RemoteEngine::set_debug(bool enabled) {
   ftv_log_set_debug(enabled);
   if (enabled) {
      FTV_LOG_INFO("Debug mode enabled");
   }
}

/* =============================================================================
 * Operations
 * ============================================================================= */

void RemoteEngine::discover(ftv_result_cb_t callback) {
   ftv_error_t err = discovery_.start();
   if (err != FTV_OK) {
      ftv_complete(callback, err);
      return;
   }
   discovery_callback_ = std::move(callback);
}

void RemoteEngine::test_connection(ftv_result_cb_t callback) {
   if (!session_.has_address()) {
      ui_.update_property(UI_PROP_CONNECTION_STATUS, CONNECTION_STATUS_NOT_CONNECTED);
      ftv_complete(callback, FTV_ERR_NOT_CONFIGURED);
      return;
   }

   wake_.wake_now([this, callback](ftv_error_t err) {
      if (err != FTV_OK) {
         ui_.update_property(UI_PROP_CONNECTION_STATUS, CONNECTION_STATUS_WAKE_FAILED);
         ftv_complete(callback, err);
         return;
      }

      encoder_.get_status([this, callback](ftv_error_t status_err, const device_status_t &) {
         if (status_err != FTV_OK) {
            ui_.update_property(UI_PROP_CONNECTION_STATUS, CONNECTION_STATUS_NO_STATUS);
            ftv_complete(callback, status_err);
            return;
         }
         ui_.update_property(UI_PROP_CONNECTION_STATUS, CONNECTION_STATUS_CONNECTED);
         FTV_LOG_INFO("Connection test successful");
         ftv_complete(callback, FTV_OK);
      });
   });
}

void RemoteEngine::refresh_device_info(ftv_result_cb_t callback) {
   if (!session_.has_address()) {
      ftv_complete(callback, FTV_ERR_NOT_CONFIGURED);
      return;
   }

   wake_.ensure_awake([this, callback](ftv_error_t err) {
      if (err != FTV_OK) {
         ftv_complete(callback, err);
         return;
      }
      encoder_.get_properties(
          [this, callback](ftv_error_t props_err, const device_properties_t &properties) {
             if (props_err == FTV_OK) {
                ui_.update_property(UI_PROP_DEVICE_NAME, properties.name);
             }
             ftv_complete(callback, props_err);
          });
   });
}

void RemoteEngine::send_scan(ftv_scan_direction_t direction,
                             const command_params_t &params,
                             ftv_result_cb_t callback) {
   int seconds = FTV_DEFAULT_SCAN_SECONDS;
   std::string value = param_value(params, COMMAND_PARAM_SECONDS);
   if (!value.empty()) {
      char *end = NULL;
      long parsed = strtol(value.c_str(), &end, 10);
      if (end && *end == '\0' && parsed > 0 && parsed <= 3600) {
         seconds = (int)parsed;
      }
   }
   encoder_.send_media(ftv_media_scan(direction, seconds), std::move(callback));
}

void RemoteEngine::execute_command(const std::string &name,
                                   const command_params_t &params,
                                   ftv_result_cb_t callback) {
   FTV_LOG_DEBUG("ExecuteCommand: %s", name.c_str());

   if (name == "LUA_ACTION") {
      std::string action = param_value(params, COMMAND_PARAM_ACTION);
      if (!action.empty()) {
         command_params_t remaining = params;
         remaining.erase(COMMAND_PARAM_ACTION);
         dispatch_command(action, remaining, std::move(callback));
         return;
      }
   }
   dispatch_command(name, params, std::move(callback));
}

void RemoteEngine::dispatch_command(const std::string &name,
                                    const command_params_t &params,
                                    ftv_result_cb_t callback) {
   /* Discovery and pairing */
   if (name == "DiscoverDevices") {
      discover(std::move(callback));
   } else if (name == "StopDiscovery") {
      discovery_.stop();
      ftv_complete(callback, FTV_OK);
   } else if (name == "StartPairing") {
      pairing_.request_pin(std::move(callback));
   } else if (name == "VerifyPIN") {
      std::string pin = param_value(params, COMMAND_PARAM_PIN);
      pairing_.verify_pin(pin.empty() ? pin_entry_ : pin, std::move(callback));
   } else if (name == "TestConnection") {
      test_connection(std::move(callback));
   } else if (name == "RefreshDeviceInfo") {
      refresh_device_info(std::move(callback));
   } else if (name == "ClearPairing") {
      pairing_.clear_pairing();
      ftv_complete(callback, FTV_OK);

      /* Navigation */
   } else if (name == "Up") {
      encoder_.send_key(FTV_KEY_UP, std::move(callback));
   } else if (name == "Down") {
      encoder_.send_key(FTV_KEY_DOWN, std::move(callback));
   } else if (name == "Left") {
      encoder_.send_key(FTV_KEY_LEFT, std::move(callback));
   } else if (name == "Right") {
      encoder_.send_key(FTV_KEY_RIGHT, std::move(callback));
   } else if (name == "Select") {
      encoder_.send_key(FTV_KEY_SELECT, std::move(callback));

      /* System */
   } else if (name == "Home") {
      encoder_.send_key(FTV_KEY_HOME, std::move(callback));
   } else if (name == "Back") {
      encoder_.send_key(FTV_KEY_BACK, std::move(callback));
   } else if (name == "Menu") {
      encoder_.send_key(FTV_KEY_MENU, std::move(callback));

      /* Media: the device toggles playback on "play" */
   } else if (name == "PlayPause" || name == "Play" || name == "Pause") {
      encoder_.send_media(ftv_media_simple(FTV_MEDIA_PLAY), std::move(callback));
   } else if (name == "Stop") {
      encoder_.send_media(ftv_media_simple(FTV_MEDIA_STOP), std::move(callback));
   } else if (name == "FastForward") {
      send_scan(FTV_SCAN_FORWARD, params, std::move(callback));
   } else if (name == "Rewind") {
      send_scan(FTV_SCAN_BACK, params, std::move(callback));

      /* Text */
   } else if (name == "SendText") {
      encoder_.send_text(param_value(params, COMMAND_PARAM_TEXT), std::move(callback));
   } else if (name == "SendCharacter") {
      encoder_.send_character(param_value(params, COMMAND_PARAM_CHARACTER), std::move(callback));

      /* Utility */
   } else if (name == "Wake") {
      wake_.wake_now(std::move(callback));
   } else {
      FTV_LOG_WARNING("Unknown command: %s", name.c_str());
      ftv_complete(callback, FTV_ERR_INVALID_PARAM);
   }
}

void RemoteEngine::handle_proxy_command(const std::string &command,
                                        const command_params_t &params,
                                        ftv_result_cb_t callback) {
   if (command == PROXY_COMMAND_ON) {
      FTV_LOG_INFO("Room activated - waking Fire TV");
      wake_.wake_now([this, callback](ftv_error_t err) {
         if (err != FTV_OK) {
            ftv_complete(callback, err);
            return;
         }
         encoder_.send_key(FTV_KEY_HOME, callback);
      });
   } else if (command == PROXY_COMMAND_OFF) {
      FTV_LOG_INFO("Room deactivated");
      ftv_complete(callback, FTV_OK);
   } else if (command == PROXY_COMMAND_INPUT_SELECTION) {
      wake_.wake_now(std::move(callback));
   } else {
      execute_command(command, params, std::move(callback));
   }
}

void RemoteEngine::shutdown() {
   FTV_LOG_INFO("Remote engine shutting down");

   /* Take the discovery callback first so stop() does not report success */
   ftv_result_cb_t pending_discovery = std::move(discovery_callback_);
   discovery_callback_ = nullptr;
   if (discovery_.is_active()) {
      discovery_.stop();
   }
   ftv_complete(pending_discovery, FTV_ERR_CANCELLED);

   queue_.clear(FTV_ERR_CANCELLED);
   wake_.cancel(FTV_ERR_CANCELLED);
   http_.abandon_all();
   timers_.cancel_all();
}
