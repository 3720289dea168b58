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
 * Device Session - State of the single controlled Fire TV
 *
 * One session exists per engine and is handed by reference to every
 * component that needs it. Only the address and the client token are
 * persisted. The token is never logged.
 *
 * Invariant: is_paired() implies a non-empty token.
 */

#ifndef DEVICE_SESSION_H
#define DEVICE_SESSION_H

#include <stdint.h>

#include <string>

#include "core/ftv_error.h"
#include "storage/kv_store.h"
#include "ui/host_ui.h"

/* Pairing Status values owned by the session */
#define PAIRING_STATUS_PAIRED "Paired"
#define PAIRING_STATUS_NOT_PAIRED "Not Paired"

/* Connection Status values */
#define CONNECTION_STATUS_CONNECTED "Connected"
#define CONNECTION_STATUS_NOT_CONNECTED "Not Connected"

class DeviceSession {
 public:
   DeviceSession(KeyValueStore &store, HostUi &ui);

   /**
    * @brief Load the persisted address and token
    *
    * A stored token marks the session paired.
    */
   void restore();

   /* ---- Target address ---- */

   const std::string &address() const { return address_; }
   bool has_address() const { return !address_.empty(); }

   /**
    * @brief Change the target device
    *
    * Persists the address (an empty address clears it), resets wake
    * freshness and the connection flag, and reuses a persisted token if one
    * exists. A token the new device does not accept is dropped on the first
    * 401/403.
    */
   void set_address(const std::string &address);

   /* ---- Pairing ---- */

   bool is_paired() const { return paired_; }
   bool has_token() const { return !token_.empty(); }
   const std::string &token() const { return token_; }

   /**
    * @brief Record a successful pairing and persist token and address
    *
    * @return FTV_OK, or FTV_ERR_IO if persisting failed (the session is
    *         paired in memory either way)
    */
   ftv_error_t store_pairing(const std::string &token);

   /** @brief Forget the token, in memory first, then in storage */
   void clear_pairing();

   /* ---- Connection ---- */

   bool is_connected() const { return connected_; }

   /**
    * @brief Update the connection flag
    *
    * Publishes Connection Status and fires Connection Restored or
    * Connection Lost on a change.
    */
   void set_connected(bool connected);

   /* ---- Wake bookkeeping ---- */

   bool has_woken() const { return has_woken_; }
   uint64_t last_wake_ms() const { return last_wake_ms_; }
   void record_wake(uint64_t now_ms);

   /* ---- Settings ---- */

   bool auto_wake() const { return auto_wake_; }
   void set_auto_wake(bool enabled) { auto_wake_ = enabled; }

   int timeout_sec() const { return timeout_sec_; }
   void set_timeout_sec(int timeout_sec) { timeout_sec_ = timeout_sec; }

   const std::string &friendly_name() const { return friendly_name_; }
   void set_friendly_name(const std::string &name) { friendly_name_ = name; }

 private:
   void adopt_stored_token();

   KeyValueStore &store_;
   HostUi &ui_;

   std::string address_;
   std::string token_;
   bool paired_;
   bool connected_;
   bool has_woken_;
   uint64_t last_wake_ms_;
   bool auto_wake_;
   int timeout_sec_;
   std::string friendly_name_;

   DeviceSession(const DeviceSession &);
   DeviceSession &operator=(const DeviceSession &);
};

#endif /* DEVICE_SESSION_H */
