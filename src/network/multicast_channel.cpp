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

#include "network/multicast_channel.h"

#include <arpa/inet.h>
#include <errno.h>
#include <netinet/in.h>
#include <string.h>
#include <sys/socket.h>
#include <unistd.h>

#include <utility>

#include "core/event_loop.h"
#include "logging_common.h"

UdpMulticastChannel::UdpMulticastChannel(EventLoop &loop) : loop_(loop), fd_(-1), port_(0) {
}

UdpMulticastChannel::~UdpMulticastChannel() {
   close();
}

void UdpMulticastChannel::set_receive_handler(multicast_receive_cb_t handler) {
   handler_ = std::move(handler);
}

ftv_error_t UdpMulticastChannel::open(const std::string &group, uint16_t port) {
   if (fd_ >= 0) {
      close();
   }

   struct in_addr group_addr;
   if (inet_pton(AF_INET, group.c_str(), &group_addr) != 1) {
      FTV_LOG_ERROR("Invalid multicast group address: %s", group.c_str());
      return FTV_ERR_INVALID_PARAM;
   }

   int fd = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
   if (fd < 0) {
      FTV_LOG_ERROR("Failed to create UDP socket: %s", strerror(errno));
      return FTV_ERR_IO;
   }

   int reuse = 1;
   if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
      FTV_LOG_WARNING("Failed to set SO_REUSEADDR: %s", strerror(errno));
   }
#ifdef SO_REUSEPORT
   if (setsockopt(fd, SOL_SOCKET, SO_REUSEPORT, &reuse, sizeof(reuse)) < 0) {
      FTV_LOG_WARNING("Failed to set SO_REUSEPORT: %s", strerror(errno));
   }
#endif

   struct sockaddr_in bind_addr;
   memset(&bind_addr, 0, sizeof(bind_addr));
   bind_addr.sin_family = AF_INET;
   bind_addr.sin_addr.s_addr = htonl(INADDR_ANY);
   bind_addr.sin_port = htons(port);
   if (bind(fd, (struct sockaddr *)&bind_addr, sizeof(bind_addr)) < 0) {
      FTV_LOG_ERROR("Failed to bind UDP port %u: %s", port, strerror(errno));
      ::close(fd);
      return FTV_ERR_IO;
   }

   struct ip_mreq mreq;
   memset(&mreq, 0, sizeof(mreq));
   mreq.imr_multiaddr = group_addr;
   mreq.imr_interface.s_addr = htonl(INADDR_ANY);
   if (setsockopt(fd, IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq)) < 0) {
      FTV_LOG_ERROR("Failed to join multicast group %s: %s", group.c_str(), strerror(errno));
      ::close(fd);
      return FTV_ERR_IO;
   }

   int ttl = MULTICAST_TTL;
   if (setsockopt(fd, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl)) < 0) {
      FTV_LOG_WARNING("Failed to set multicast TTL: %s", strerror(errno));
   }
   int loopback = 0;
   if (setsockopt(fd, IPPROTO_IP, IP_MULTICAST_LOOP, &loopback, sizeof(loopback)) < 0) {
      FTV_LOG_WARNING("Failed to disable multicast loopback: %s", strerror(errno));
   }

   fd_ = fd;
   group_ = group;
   port_ = port;
   loop_.watch_fd(fd_, [this]() { on_readable(); });

   FTV_LOG_INFO("Joined multicast group %s:%u", group.c_str(), port);
   return FTV_OK;
}

ftv_error_t UdpMulticastChannel::send(const std::vector<uint8_t> &data) {
   if (fd_ < 0) {
      return FTV_ERR_IO;
   }

   struct sockaddr_in dest;
   memset(&dest, 0, sizeof(dest));
   dest.sin_family = AF_INET;
   dest.sin_port = htons(port_);
   inet_pton(AF_INET, group_.c_str(), &dest.sin_addr);

   ssize_t sent = sendto(fd_, data.data(), data.size(), 0, (struct sockaddr *)&dest,
                         sizeof(dest));
   if (sent < 0) {
      FTV_LOG_ERROR("Failed to send multicast datagram: %s", strerror(errno));
      return FTV_ERR_IO;
   }
   if ((size_t)sent != data.size()) {
      FTV_LOG_WARNING("Short multicast send: %zd of %zu bytes", sent, data.size());
   }
   return FTV_OK;
}

void UdpMulticastChannel::close() {
   if (fd_ < 0) {
      return;
   }

   struct ip_mreq mreq;
   memset(&mreq, 0, sizeof(mreq));
   inet_pton(AF_INET, group_.c_str(), &mreq.imr_multiaddr);
   mreq.imr_interface.s_addr = htonl(INADDR_ANY);
   if (setsockopt(fd_, IPPROTO_IP, IP_DROP_MEMBERSHIP, &mreq, sizeof(mreq)) < 0) {
      FTV_LOG_DEBUG("Failed to leave multicast group: %s", strerror(errno));
   }

   loop_.unwatch_fd(fd_);
   ::close(fd_);
   fd_ = -1;
   FTV_LOG_DEBUG("Closed multicast channel %s:%u", group_.c_str(), port_);
}

void UdpMulticastChannel::on_readable() {
   uint8_t buffer[MULTICAST_RECV_BUFFER_SIZE];

   ssize_t received = recv(fd_, buffer, sizeof(buffer), MSG_DONTWAIT);
   if (received < 0) {
      if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
         FTV_LOG_WARNING("Multicast receive failed: %s", strerror(errno));
      }
      return;
   }

   if (handler_) {
      handler_(buffer, (size_t)received);
   }
}
