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

#include "mdns/discovery.h"

#include <json-c/json.h>

#include <algorithm>
#include <utility>

#include "logging_common.h"

/* =============================================================================
 * Device List Helpers
 * ============================================================================= */

std::string discovery_list_item(const mdns_device_t &device) {
   std::string label = device.name;
   if (label.empty()) {
      label = std::string(MDNS_DEFAULT_PRODUCT) + " (" + device.address + ")";
   }
   if (!device.model.empty()) {
      label += " [" + device.model + "]";
   }
   return label + "|" + device.address;
}

bool discovery_parse_list_item(const std::string &item,
                               std::string *label,
                               std::string *address) {
   size_t bar = item.rfind('|');
   if (bar == std::string::npos || bar + 1 >= item.size()) {
      return false;
   }
   if (label) {
      *label = item.substr(0, bar);
   }
   if (address) {
      *address = item.substr(bar + 1);
   }
   return true;
}

static const char *json_string_field(json_object *obj, const char *key) {
   json_object *field = NULL;
   if (json_object_object_get_ex(obj, key, &field) &&
       json_object_is_type(field, json_type_string)) {
      return json_object_get_string(field);
   }
   return "";
}

std::string discovery_devices_to_json(const discovery_device_map_t &devices) {
   json_object *array = json_object_new_array();

   for (const auto &entry : devices) {
      const mdns_device_t &device = entry.second;
      json_object *obj = json_object_new_object();
      json_object_object_add(obj, "address", json_object_new_string(device.address.c_str()));
      json_object_object_add(obj, "port", json_object_new_int(device.port));
      json_object_object_add(obj, "name", json_object_new_string(device.name.c_str()));
      json_object_object_add(obj, "model", json_object_new_string(device.model.c_str()));
      json_object_object_add(obj, "manufacturer",
                             json_object_new_string(device.manufacturer.c_str()));

      json_object *props = json_object_new_object();
      for (const auto &prop : device.properties) {
         json_object_object_add(props, prop.first.c_str(),
                                json_object_new_string(prop.second.c_str()));
      }
      json_object_object_add(obj, "properties", props);
      json_object_array_add(array, obj);
   }

   std::string text = json_object_to_json_string_ext(array, JSON_C_TO_STRING_PLAIN);
   json_object_put(array);
   return text;
}

bool discovery_devices_from_json(const std::string &text, discovery_device_map_t *devices) {
   json_object *array = json_tokener_parse(text.c_str());
   if (!array) {
      return false;
   }
   if (!json_object_is_type(array, json_type_array)) {
      json_object_put(array);
      return false;
   }

   devices->clear();
   size_t count = json_object_array_length(array);
   for (size_t i = 0; i < count; i++) {
      json_object *obj = json_object_array_get_idx(array, i);
      if (!obj || !json_object_is_type(obj, json_type_object)) {
         continue;
      }

      mdns_device_t device;
      device.address = json_string_field(obj, "address");
      if (device.address.empty()) {
         continue;
      }
      device.name = json_string_field(obj, "name");
      device.model = json_string_field(obj, "model");
      device.manufacturer = json_string_field(obj, "manufacturer");
      device.goodbye = false;

      json_object *port = NULL;
      device.port = MDNS_DEFAULT_DEVICE_PORT;
      if (json_object_object_get_ex(obj, "port", &port) &&
          json_object_is_type(port, json_type_int)) {
         int value = json_object_get_int(port);
         if (value > 0 && value <= 65535) {
            device.port = (uint16_t)value;
         }
      }

      json_object *props = NULL;
      if (json_object_object_get_ex(obj, "properties", &props) &&
          json_object_is_type(props, json_type_object)) {
         json_object_object_foreach(props, key, val) {
            if (json_object_is_type(val, json_type_string)) {
               device.properties[key] = json_object_get_string(val);
            }
         }
      }

      devices->insert(std::make_pair(device.address, device));
   }

   json_object_put(array);
   return true;
}

/* =============================================================================
 * Engine
 * ============================================================================= */

DiscoveryEngine::DiscoveryEngine(MulticastChannel &channel,
                                 TimerService &timers,
                                 KeyValueStore &store,
                                 HostUi &ui)
    : channel_(channel),
      timers_(timers),
      store_(store),
      ui_(ui),
      active_(false),
      timeout_ms_(DISCOVERY_DEFAULT_TIMEOUT_MS),
      retransmit_ms_(DISCOVERY_DEFAULT_RETRANSMIT_MS) {
   channel_.set_receive_handler(
       [this](const uint8_t *data, size_t len) { handle_datagram(data, len); });
}

DiscoveryEngine::~DiscoveryEngine() {
   timers_.cancel(DISCOVERY_TIMER_RETRY);
   timers_.cancel(DISCOVERY_TIMER_TIMEOUT);
   channel_.set_receive_handler(nullptr);
   if (channel_.is_open()) {
      channel_.close();
   }
}

void DiscoveryEngine::set_timing(uint32_t timeout_ms, uint32_t retransmit_ms) {
   timeout_ms_ = timeout_ms;
   retransmit_ms_ = retransmit_ms;
}

ftv_error_t DiscoveryEngine::start() {
   if (active_) {
      FTV_LOG_INFO("Discovery already in progress");
      return FTV_ERR_BUSY;
   }

   FTV_LOG_INFO("Starting mDNS discovery for Fire TV devices...");
   devices_.clear();

   ftv_error_t err = channel_.open(MDNS_MULTICAST_ADDR, MDNS_PORT);
   if (err != FTV_OK) {
      FTV_LOG_ERROR("Discovery cannot start: %s", ftv_error_str(err));
      ui_.update_property(UI_PROP_DISCOVERY_STATUS, DISCOVERY_STATUS_ERROR);
      return err;
   }

   active_ = true;
   ui_.update_property(UI_PROP_DISCOVERY_STATUS, DISCOVERY_STATUS_ACTIVE);
   send_query();

   /* Some devices miss the first query */
   timers_.schedule(DISCOVERY_TIMER_RETRY, retransmit_ms_, [this]() {
      if (active_) {
         FTV_LOG_DEBUG("Sending mDNS query retry");
         send_query();
      }
   });
   timers_.schedule(DISCOVERY_TIMER_TIMEOUT, timeout_ms_, [this]() { stop(); });

   return FTV_OK;
}

void DiscoveryEngine::send_query() {
   std::vector<uint8_t> query = mdns_build_query();
   if (channel_.send(query) != FTV_OK) {
      FTV_LOG_WARNING("Failed to send mDNS query");
      return;
   }
   FTV_LOG_DEBUG("Sent mDNS query (%zu bytes)", query.size());
}

void DiscoveryEngine::stop() {
   if (!active_) {
      return;
   }

   active_ = false;
   timers_.cancel(DISCOVERY_TIMER_TIMEOUT);
   timers_.cancel(DISCOVERY_TIMER_RETRY);
   channel_.close();

   size_t count = devices_.size();
   FTV_LOG_INFO("Discovery complete. Found %zu Fire TV device(s)", count);

   if (count > 0) {
      ui_.update_property(UI_PROP_DISCOVERY_STATUS,
                          "Found " + std::to_string(count) + " device(s)");
   } else {
      ui_.update_property(UI_PROP_DISCOVERY_STATUS, DISCOVERY_STATUS_NONE);
   }
   publish_list();
   persist();

   if (on_complete_) {
      on_complete_(count);
   }
}

void DiscoveryEngine::handle_datagram(const uint8_t *data, size_t len) {
   if (!active_) {
      return;
   }

   FTV_LOG_DEBUG("Received mDNS datagram (%zu bytes)", len);

   mdns_device_t device;
   if (!mdns_parse_response(data, len, &device)) {
      return;
   }
   if (device.address.empty()) {
      FTV_LOG_DEBUG("Fire TV response without an A record discarded");
      return;
   }

   auto it = devices_.find(device.address);
   if (it == devices_.end()) {
      if (device.goodbye) {
         FTV_LOG_DEBUG("Goodbye from unknown device %s ignored", device.address.c_str());
         return;
      }
      FTV_LOG_INFO("Discovered Fire TV: %s at %s", device.name.c_str(), device.address.c_str());
      auto inserted = devices_.insert(std::make_pair(device.address, device));
      persist();
      publish_list();
      if (on_found_) {
         on_found_(inserted.first->second);
      }
      return;
   }

   if (device.goodbye) {
      mdns_device_t departed = it->second;
      devices_.erase(it);
      FTV_LOG_INFO("Fire TV %s at %s left the network", departed.name.c_str(),
                   departed.address.c_str());
      persist();
      publish_list();
      if (on_departed_) {
         on_departed_(departed);
      }
   }
}

size_t DiscoveryEngine::restore() {
   std::string cached;
   if (!store_.get(STORE_KEY_DISCOVERED_DEVICES, &cached) || cached.empty()) {
      return 0;
   }

   discovery_device_map_t restored;
   if (!discovery_devices_from_json(cached, &restored)) {
      FTV_LOG_WARNING("Discarding unreadable discovered device cache");
      return 0;
   }

   devices_ = std::move(restored);
   publish_list();
   FTV_LOG_INFO("Restored %zu discovered device(s)", devices_.size());
   return devices_.size();
}

const mdns_device_t *DiscoveryEngine::find(const std::string &address) const {
   auto it = devices_.find(address);
   return it == devices_.end() ? NULL : &it->second;
}

std::vector<std::string> DiscoveryEngine::display_list() const {
   std::vector<std::pair<std::string, std::string>> entries;
   for (const auto &entry : devices_) {
      std::string item = discovery_list_item(entry.second);
      entries.push_back(std::make_pair(item.substr(0, item.rfind('|')), entry.first));
   }
   std::sort(entries.begin(), entries.end());

   std::vector<std::string> items;
   items.reserve(entries.size());
   for (const auto &entry : entries) {
      items.push_back(entry.first + "|" + entry.second);
   }
   return items;
}

void DiscoveryEngine::publish_list() {
   std::vector<std::string> items;
   items.push_back(UI_DEVICE_LIST_PLACEHOLDER);
   std::vector<std::string> devices = display_list();
   items.insert(items.end(), devices.begin(), devices.end());
   ui_.update_property_list(UI_PROP_DISCOVERED_DEVICES, items);
}

void DiscoveryEngine::persist() {
   ftv_error_t err = store_.set(STORE_KEY_DISCOVERED_DEVICES, discovery_devices_to_json(devices_));
   if (err != FTV_OK) {
      FTV_LOG_WARNING("Failed to persist discovered devices: %s", ftv_error_str(err));
   }
}
