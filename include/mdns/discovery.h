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
 * Discovery Engine - mDNS search for Fire TV devices
 *
 * A discovery session joins the mDNS group, sends the PTR query, resends
 * it once after a short delay and ends after a fixed timeout. Responses
 * are merged by device address. The first response for an address wins;
 * a later goodbye (TTL 0) for that address removes it again.
 *
 * The resulting set is published to the UI as a pick list and cached in
 * the key/value store so it survives restarts.
 */

#ifndef DISCOVERY_H
#define DISCOVERY_H

#include <stddef.h>
#include <stdint.h>

#include <functional>
#include <map>
#include <string>
#include <vector>

#include "core/ftv_error.h"
#include "core/timer_service.h"
#include "mdns/mdns_codec.h"
#include "network/multicast_channel.h"
#include "storage/kv_store.h"
#include "ui/host_ui.h"

#define DISCOVERY_DEFAULT_TIMEOUT_MS 10000
#define DISCOVERY_DEFAULT_RETRANSMIT_MS 1000

#define DISCOVERY_TIMER_RETRY "mdns_retry"
#define DISCOVERY_TIMER_TIMEOUT "mdns_timeout"

/* Discovery Status values */
#define DISCOVERY_STATUS_ACTIVE "Discovering..."
#define DISCOVERY_STATUS_NONE "No devices found"
#define DISCOVERY_STATUS_ERROR "Error: Multicast unavailable"

typedef std::map<std::string, mdns_device_t> discovery_device_map_t;

/* =============================================================================
 * Device List Helpers
 * ============================================================================= */

/**
 * @brief Pick list entry for a device: "Name [model]|address"
 *
 * The " [model]" part is omitted when the model is unknown.
 */
std::string discovery_list_item(const mdns_device_t &device);

/**
 * @brief Split a pick list entry into its label and address
 *
 * @return false if the entry has no '|' or an empty address
 */
bool discovery_parse_list_item(const std::string &item,
                               std::string *label,
                               std::string *address);

/** @brief Serialize devices for the persisted cache (JSON array) */
std::string discovery_devices_to_json(const discovery_device_map_t &devices);

/**
 * @brief Parse the persisted cache
 *
 * Entries without an address are skipped.
 *
 * @return false if the text is not a JSON array
 */
bool discovery_devices_from_json(const std::string &text, discovery_device_map_t *devices);

/* =============================================================================
 * Engine
 * ============================================================================= */

class DiscoveryEngine {
 public:
   typedef std::function<void(const mdns_device_t &device)> device_cb_t;
   typedef std::function<void(size_t count)> complete_cb_t;

   DiscoveryEngine(MulticastChannel &channel,
                   TimerService &timers,
                   KeyValueStore &store,
                   HostUi &ui);
   ~DiscoveryEngine();

   void set_timing(uint32_t timeout_ms, uint32_t retransmit_ms);

   /** @brief Notified when a new device is added during a session */
   void set_found_callback(device_cb_t callback) { on_found_ = callback; }

   /** @brief Notified once when a goodbye removes a known device */
   void set_departed_callback(device_cb_t callback) { on_departed_ = callback; }

   /** @brief Notified when a session ends, with the number of devices found */
   void set_complete_callback(complete_cb_t callback) { on_complete_ = callback; }

   /**
    * @brief Start a discovery session
    *
    * @return FTV_OK, FTV_ERR_BUSY if a session is running, or FTV_ERR_IO if
    *         the multicast channel could not be opened
    */
   ftv_error_t start();

   /** @brief End the running session early (no-op when idle) */
   void stop();

   bool is_active() const { return active_; }

   /** @brief Feed one received datagram (ignored while idle) */
   void handle_datagram(const uint8_t *data, size_t len);

   /**
    * @brief Load the cached device list saved by an earlier run
    *
    * @return Number of devices restored
    */
   size_t restore();

   const discovery_device_map_t &devices() const { return devices_; }

   /** @brief Look up a device by address, NULL if unknown */
   const mdns_device_t *find(const std::string &address) const;

   /** @brief Pick list entries sorted by label, then address */
   std::vector<std::string> display_list() const;

 private:
   void send_query();
   void persist();
   void publish_list();

   MulticastChannel &channel_;
   TimerService &timers_;
   KeyValueStore &store_;
   HostUi &ui_;

   discovery_device_map_t devices_;
   bool active_;
   uint32_t timeout_ms_;
   uint32_t retransmit_ms_;

   device_cb_t on_found_;
   device_cb_t on_departed_;
   complete_cb_t on_complete_;

   DiscoveryEngine(const DiscoveryEngine &);
   DiscoveryEngine &operator=(const DiscoveryEngine &);
};

#endif /* DISCOVERY_H */
