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
 * mDNS Packet Codec - Query construction and response parsing
 *
 * Covers exactly what Fire TV discovery needs: one PTR question for the
 * _amzn-wplay service, and decoding of the PTR/TXT/SRV/A records a device
 * answers with. All reads are bounds checked; a malformed packet makes the
 * parser stop early, it never reads past the buffer.
 */

#ifndef MDNS_CODEC_H
#define MDNS_CODEC_H

#include <stddef.h>
#include <stdint.h>

#include <map>
#include <string>
#include <vector>

/* =============================================================================
 * Constants
 * ============================================================================= */

#define MDNS_MULTICAST_ADDR "224.0.0.251"
#define MDNS_PORT 5353

#define MDNS_SERVICE_TYPE "_amzn-wplay._tcp.local."
#define MDNS_SERVICE_FRAGMENT "_amzn-wplay"

#define MDNS_HEADER_SIZE 12
#define MDNS_MAX_POINTER_HOPS 10
#define MDNS_MAX_LABEL_LENGTH 63

#define MDNS_TYPE_A 1
#define MDNS_TYPE_PTR 12
#define MDNS_TYPE_TXT 16
#define MDNS_TYPE_SRV 33

#define MDNS_CLASS_IN 0x0001
#define MDNS_CLASS_UNICAST_RESPONSE 0x8000 /* QU bit in questions */
#define MDNS_CLASS_CACHE_FLUSH 0x8000      /* Same bit in resource records */

/* Control port assumed until an SRV record says otherwise */
#define MDNS_DEFAULT_DEVICE_PORT 8080

/* Product name used when no TXT record carries a friendly name */
#define MDNS_DEFAULT_PRODUCT "Fire TV"

/* =============================================================================
 * Types
 * ============================================================================= */

/**
 * @brief Device described by one discovery response
 */
typedef struct {
   std::string address; /* From the A record only; empty if none was present */
   uint16_t port;
   std::string name;
   std::string model;
   std::string manufacturer;
   std::map<std::string, std::string> properties; /* Raw TXT key/value pairs */
   bool goodbye;                                  /* A record carried TTL 0 */
} mdns_device_t;

/* =============================================================================
 * Codec
 * ============================================================================= */

/**
 * @brief Encode a dotted name as length-prefixed labels
 *
 * Empty labels (including a trailing dot) are skipped. The result always
 * ends with the zero-length root label.
 */
std::vector<uint8_t> mdns_encode_name(const std::string &dotted);

/**
 * @brief Decode a possibly compressed name
 *
 * Follows compression pointers up to MDNS_MAX_POINTER_HOPS. When the name
 * contains a pointer, @p next is the byte after the first pointer; later
 * jumps do not move it.
 *
 * @param packet Whole packet (pointers are relative to its start)
 * @param len Packet length
 * @param offset Position of the first length byte
 * @param name Receives the labels joined with '.'
 * @param next Receives the offset following the encoded name
 * @return false on an out-of-bounds pointer or label, reserved label bits,
 *         a missing terminator or too many pointer hops
 */
bool mdns_decode_name(const uint8_t *packet,
                      size_t len,
                      size_t offset,
                      std::string *name,
                      size_t *next);

/** @brief Big-endian 16-bit read; 0 if fewer than 2 bytes remain */
uint16_t mdns_parse_uint16(const uint8_t *data, size_t len, size_t offset);

/** @brief Big-endian 32-bit read; 0 if fewer than 4 bytes remain */
uint32_t mdns_parse_uint32(const uint8_t *data, size_t len, size_t offset);

/**
 * @brief Build the discovery query
 *
 * One PTR question for MDNS_SERVICE_TYPE, class IN with the
 * unicast-response bit set.
 */
std::vector<uint8_t> mdns_build_query(void);

/**
 * @brief Parse a discovery response
 *
 * @param packet Datagram payload
 * @param len Payload length
 * @param device Receives the decoded device
 * @return true if a PTR record identified the Fire TV service. The device
 *         may still lack an address; callers must discard such results.
 */
bool mdns_parse_response(const uint8_t *packet, size_t len, mdns_device_t *device);

#endif /* MDNS_CODEC_H */
