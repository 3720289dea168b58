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
 * Remote Engine - Fire TV remote control built from its components
 *
 * Owns the device session and every protocol component, wired to the
 * transport, multicast channel, timers, store and UI supplied by the host.
 * All work happens on the thread that drives the timer service; every
 * operation reports its result through an ftv_result_cb_t.
 */

#ifndef REMOTE_ENGINE_H
#define REMOTE_ENGINE_H

#include <map>
#include <string>

#include "config/ftv_config.h"
#include "core/ftv_error.h"
#include "core/timer_service.h"
#include "firetv/command_encoder.h"
#include "firetv/command_queue.h"
#include "firetv/device_session.h"
#include "firetv/pairing.h"
#include "firetv/wake_controller.h"
#include "mdns/discovery.h"
#include "network/http_client.h"
#include "network/multicast_channel.h"
#include "storage/kv_store.h"
#include "ui/host_ui.h"

/* Connection Status texts set by test_connection() */
#define CONNECTION_STATUS_NO_STATUS "Error: Cannot get status"
#define CONNECTION_STATUS_WAKE_FAILED "Error: Cannot wake device"

/* Parameter names of named commands */
#define COMMAND_PARAM_ACTION "ACTION"
#define COMMAND_PARAM_SECONDS "Seconds"
#define COMMAND_PARAM_TEXT "Text"
#define COMMAND_PARAM_CHARACTER "Character"
#define COMMAND_PARAM_PIN "PIN"

/* Commands coming from a room/AV proxy */
#define PROXY_COMMAND_ON "ON"
#define PROXY_COMMAND_OFF "OFF"
#define PROXY_COMMAND_INPUT_SELECTION "INPUT_SELECTION"

typedef std::map<std::string, std::string> command_params_t;

class RemoteEngine {
 public:
   RemoteEngine(HttpTransport &transport,
                MulticastChannel &channel,
                TimerService &timers,
                KeyValueStore &store,
                HostUi &ui);
   ~RemoteEngine();

   /**
    * @brief Restore persisted state and apply configuration
    *
    * The persisted token, address and discovered-device cache are loaded
    * first. A non-empty configured address then replaces the persisted one.
    */
   void init(const ftv_config_t &config);

   /* =========================================================================
    * Settings
    * ========================================================================= */

   void set_address(const std::string &address);

   /**
    * @brief Target a device from the discovered-device pick list
    *
    * @param item Entry in "Name|address" form
    * @return FTV_ERR_INVALID_PARAM for the placeholder or a malformed entry
    */
   ftv_error_t select_discovered_device(const std::string &item);

   void set_friendly_name(const std::string &name);
   void set_timeout(int timeout_sec);
   void set_auto_wake(bool enabled);
   void set_debug(bool enabled);

   /** @brief PIN typed by the user, used by the VerifyPIN command */
   void set_pin_entry(const std::string &pin) { pin_entry_ = pin; }

   /* =========================================================================
    * Operations
    * ========================================================================= */

   /**
    * @brief Run a discovery session
    *
    * @param callback Called when the session ends, or with the start error
    */
   void discover(ftv_result_cb_t callback);

   /** @brief Wake, then query status; updates Connection Status */
   void test_connection(ftv_result_cb_t callback);

   /** @brief Fetch device properties and publish the device name */
   void refresh_device_info(ftv_result_cb_t callback);

   /**
    * @brief Run a named command
    *
    * Names: DiscoverDevices, StopDiscovery, StartPairing, VerifyPIN,
    * TestConnection, RefreshDeviceInfo, ClearPairing, Up, Down, Left, Right,
    * Select, Home, Back, Menu, PlayPause, Play, Pause, Stop, FastForward,
    * Rewind, SendText, SendCharacter, Wake. LUA_ACTION runs the command named
    * by its ACTION parameter.
    *
    * @return Through @p callback; FTV_ERR_INVALID_PARAM for unknown names
    */
   void execute_command(const std::string &name,
                        const command_params_t &params,
                        ftv_result_cb_t callback);

   /**
    * @brief Handle a room/AV proxy command
    *
    * ON wakes the device and presses Home, OFF is logged, INPUT_SELECTION
    * wakes. Anything else is a named command.
    */
   void handle_proxy_command(const std::string &command,
                             const command_params_t &params,
                             ftv_result_cb_t callback);

   /**
    * @brief Stop discovery, fail queued work with FTV_ERR_CANCELLED and
    *        cancel all timers
    */
   void shutdown();

   /* =========================================================================
    * Components
    * ========================================================================= */

   DeviceSession &session() { return session_; }
   WakeController &wake() { return wake_; }
   PairingController &pairing() { return pairing_; }
   CommandQueue &queue() { return queue_; }
   CommandEncoder &encoder() { return encoder_; }
   DiscoveryEngine &discovery() { return discovery_; }
   HttpClient &http() { return http_; }

 private:
   void dispatch_command(const std::string &name,
                         const command_params_t &params,
                         ftv_result_cb_t callback);
   void send_scan(ftv_scan_direction_t direction,
                  const command_params_t &params,
                  ftv_result_cb_t callback);

   TimerService &timers_;
   HostUi &ui_;

   DeviceSession session_;
   HttpClient http_;
   WakeController wake_;
   PairingController pairing_;
   CommandQueue queue_;
   CommandEncoder encoder_;
   DiscoveryEngine discovery_;

   ftv_result_cb_t discovery_callback_;
   std::string pin_entry_;

   RemoteEngine(const RemoteEngine &);
   RemoteEngine &operator=(const RemoteEngine &);
};

#endif /* REMOTE_ENGINE_H */
