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
 * Host UI - Operator-visible properties and events
 *
 * The engine only pushes to the UI. Properties are named text fields,
 * property lists are pick lists, and events are one-shot notifications.
 */

#ifndef HOST_UI_H
#define HOST_UI_H

#include <string>
#include <vector>

/* Properties */
#define UI_PROP_ADDRESS "Fire TV IP Address"
#define UI_PROP_DEVICE_NAME "Fire TV Name"
#define UI_PROP_PAIRING_STATUS "Pairing Status"
#define UI_PROP_PIN_CODE "PIN Code"
#define UI_PROP_CONNECTION_STATUS "Connection Status"
#define UI_PROP_DISCOVERY_STATUS "Discovery Status"
#define UI_PROP_DISCOVERED_DEVICES "Discovered Devices"

/* Events */
#define UI_EVENT_PAIRED "Paired"
#define UI_EVENT_PAIRING_FAILED "Pairing Failed"
#define UI_EVENT_PAIRING_LOST "Pairing Lost"
#define UI_EVENT_CONNECTION_RESTORED "Connection Restored"
#define UI_EVENT_CONNECTION_LOST "Connection Lost"

/* First entry of the discovered devices list */
#define UI_DEVICE_LIST_PLACEHOLDER "-- Select Device --"

class HostUi {
 public:
   virtual ~HostUi() {}

   virtual void update_property(const std::string &name, const std::string &value) = 0;

   virtual void update_property_list(const std::string &name,
                                     const std::vector<std::string> &items) = 0;

   virtual void fire_event(const std::string &name) = 0;
};

#endif /* HOST_UI_H */
