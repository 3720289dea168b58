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

#include "firetv/device_session.h"

#include "config/ftv_config.h"
#include "logging_common.h"

DeviceSession::DeviceSession(KeyValueStore &store, HostUi &ui)
    : store_(store),
      ui_(ui),
      paired_(false),
      connected_(false),
      has_woken_(false),
      last_wake_ms_(0),
      auto_wake_(true),
      timeout_sec_(CONFIG_DEFAULT_TIMEOUT_SEC),
      friendly_name_(CONFIG_DEFAULT_FRIENDLY_NAME) {
}

void DeviceSession::adopt_stored_token() {
   std::string stored;
   if (store_.get(STORE_KEY_CLIENT_TOKEN, &stored) && !stored.empty()) {
      token_ = stored;
      paired_ = true;
      ui_.update_property(UI_PROP_PAIRING_STATUS, PAIRING_STATUS_PAIRED);
   } else {
      token_.clear();
      paired_ = false;
      ui_.update_property(UI_PROP_PAIRING_STATUS, PAIRING_STATUS_NOT_PAIRED);
   }
}

void DeviceSession::restore() {
   adopt_stored_token();
   if (paired_) {
      FTV_LOG_INFO("Restored pairing token from persistent storage");
   }

   std::string host;
   if (store_.get(STORE_KEY_HOST, &host) && !host.empty()) {
      address_ = host;
      ui_.update_property(UI_PROP_ADDRESS, address_);
      FTV_LOG_INFO("Restored Fire TV address %s", address_.c_str());
   }
   ui_.update_property(UI_PROP_CONNECTION_STATUS, CONNECTION_STATUS_NOT_CONNECTED);
}

void DeviceSession::set_address(const std::string &address) {
   address_ = address;
   has_woken_ = false;
   last_wake_ms_ = 0;
   connected_ = false;

   ftv_error_t err;
   if (address_.empty()) {
      err = store_.erase(STORE_KEY_HOST);
      FTV_LOG_INFO("Fire TV address cleared");
   } else {
      err = store_.set(STORE_KEY_HOST, address_);
      FTV_LOG_INFO("Fire TV address set to %s", address_.c_str());
      adopt_stored_token();
   }
   if (err != FTV_OK) {
      FTV_LOG_WARNING("Failed to persist Fire TV address: %s", ftv_error_str(err));
   }

   ui_.update_property(UI_PROP_ADDRESS, address_);
   ui_.update_property(UI_PROP_CONNECTION_STATUS, CONNECTION_STATUS_NOT_CONNECTED);
}

ftv_error_t DeviceSession::store_pairing(const std::string &token) {
   token_ = token;
   paired_ = !token_.empty();

   ftv_error_t err = store_.set(STORE_KEY_CLIENT_TOKEN, token_);
   if (err == FTV_OK && !address_.empty()) {
      err = store_.set(STORE_KEY_HOST, address_);
   }
   if (err != FTV_OK) {
      FTV_LOG_WARNING("Failed to persist pairing: %s", ftv_error_str(err));
   }
   return err;
}

void DeviceSession::clear_pairing() {
   token_.clear();
   paired_ = false;

   ftv_error_t err = store_.erase(STORE_KEY_CLIENT_TOKEN);
   if (err != FTV_OK) {
      FTV_LOG_WARNING("Failed to remove stored token: %s", ftv_error_str(err));
   }
}

void DeviceSession::set_connected(bool connected) {
   bool was_connected = connected_;
   connected_ = connected;

   if (connected) {
      ui_.update_property(UI_PROP_CONNECTION_STATUS, CONNECTION_STATUS_CONNECTED);
      if (!was_connected) {
         ui_.fire_event(UI_EVENT_CONNECTION_RESTORED);
      }
   } else {
      ui_.update_property(UI_PROP_CONNECTION_STATUS, CONNECTION_STATUS_NOT_CONNECTED);
      if (was_connected) {
         ui_.fire_event(UI_EVENT_CONNECTION_LOST);
      }
   }
}

void DeviceSession::record_wake(uint64_t now_ms) {
   has_woken_ = true;
   last_wake_ms_ = now_ms;
}
