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
 * Multicast Channel - UDP group membership for discovery traffic
 *
 * The engine only ever sees datagram payloads. The sender address of a
 * received datagram is deliberately not passed on: device addresses are
 * taken from the packet contents.
 */

#ifndef MULTICAST_CHANNEL_H
#define MULTICAST_CHANNEL_H

#include <stddef.h>
#include <stdint.h>

#include <functional>
#include <string>
#include <vector>

#include "core/ftv_error.h"

class EventLoop;

typedef std::function<void(const uint8_t *data, size_t len)> multicast_receive_cb_t;

class MulticastChannel {
 public:
   virtual ~MulticastChannel() {}

   /**
    * @brief Join a multicast group and start receiving
    *
    * @param group IPv4 group address (dotted quad)
    * @param port UDP port
    * @return FTV_OK, or FTV_ERR_IO if the socket could not be set up
    */
   virtual ftv_error_t open(const std::string &group, uint16_t port) = 0;

   /** @brief Send a datagram to the joined group */
   virtual ftv_error_t send(const std::vector<uint8_t> &data) = 0;

   /** @brief Leave the group and release the socket (no-op when closed) */
   virtual void close() = 0;

   virtual bool is_open() const = 0;

   /** @brief Handler for inbound datagrams */
   virtual void set_receive_handler(multicast_receive_cb_t handler) = 0;
};

/* =============================================================================
 * POSIX UDP implementation
 * ============================================================================= */

#define MULTICAST_RECV_BUFFER_SIZE 9000
#define MULTICAST_TTL 255

class UdpMulticastChannel : public MulticastChannel {
 public:
   explicit UdpMulticastChannel(EventLoop &loop);
   ~UdpMulticastChannel() override;

   ftv_error_t open(const std::string &group, uint16_t port) override;
   ftv_error_t send(const std::vector<uint8_t> &data) override;
   void close() override;
   bool is_open() const override { return fd_ >= 0; }
   void set_receive_handler(multicast_receive_cb_t handler) override;

 private:
   void on_readable();

   EventLoop &loop_;
   int fd_;
   std::string group_;
   uint16_t port_;
   multicast_receive_cb_t handler_;

   UdpMulticastChannel(const UdpMulticastChannel &);
   UdpMulticastChannel &operator=(const UdpMulticastChannel &);
};

#endif /* MULTICAST_CHANNEL_H */
