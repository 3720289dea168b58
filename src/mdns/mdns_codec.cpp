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

#include "mdns/mdns_codec.h"

#include <stdio.h>

#include "logging_common.h"

/* Friendly name keys, highest precedence first */
static const char *const TXT_NAME_KEYS[] = { "fn", "n", "friendlyName" };
static const char *const TXT_MODEL_KEYS[] = { "md", "model" };
static const char *const TXT_MANUFACTURER_KEYS[] = { "manufacturer" };

/* =============================================================================
 * Primitives
 * ============================================================================= */

std::vector<uint8_t> mdns_encode_name(const std::string &dotted) {
   std::vector<uint8_t> out;
   size_t start = 0;

   while (start <= dotted.size()) {
      size_t dot = dotted.find('.', start);
      if (dot == std::string::npos) {
         dot = dotted.size();
      }
      size_t label_len = dot - start;
      if (label_len > 0) {
         out.push_back((uint8_t)label_len);
         out.insert(out.end(), dotted.begin() + start, dotted.begin() + dot);
      }
      start = dot + 1;
   }

   out.push_back(0);
   return out;
}

bool mdns_decode_name(const uint8_t *packet,
                      size_t len,
                      size_t offset,
                      std::string *name,
                      size_t *next) {
   std::string result;
   size_t pos = offset;
   size_t resume = 0;
   bool jumped = false;
   int hops = 0;

   for (;;) {
      if (pos >= len) {
         return false; /* Ran off the end without a terminator */
      }

      uint8_t length = packet[pos];
      if (length == 0) {
         pos++;
         break;
      }

      if ((length & 0xC0) == 0xC0) {
         if (pos + 1 >= len) {
            return false;
         }
         if (++hops > MDNS_MAX_POINTER_HOPS) {
            FTV_LOG_DEBUG("mDNS name at %zu: too many compression pointers", offset);
            return false;
         }
         size_t target = ((size_t)(length & 0x3F) << 8) | packet[pos + 1];
         if (target >= len) {
            FTV_LOG_DEBUG("mDNS name at %zu: pointer %zu outside packet", offset, target);
            return false;
         }
         if (!jumped) {
            resume = pos + 2;
            jumped = true;
         }
         pos = target;
         continue;
      }

      if (length & 0xC0) {
         return false; /* 01/10 label types are reserved */
      }
      if (pos + 1 + length > len) {
         return false;
      }

      if (!result.empty()) {
         result += '.';
      }
      result.append((const char *)packet + pos + 1, length);
      pos += 1 + length;
   }

   if (name) {
      *name = result;
   }
   if (next) {
      *next = jumped ? resume : pos;
   }
   return true;
}

uint16_t mdns_parse_uint16(const uint8_t *data, size_t len, size_t offset) {
   if (!data || offset > len || len - offset < 2) {
      return 0;
   }
   return (uint16_t)((data[offset] << 8) | data[offset + 1]);
}

uint32_t mdns_parse_uint32(const uint8_t *data, size_t len, size_t offset) {
   if (!data || offset > len || len - offset < 4) {
      return 0;
   }
   return ((uint32_t)data[offset] << 24) | ((uint32_t)data[offset + 1] << 16) |
          ((uint32_t)data[offset + 2] << 8) | (uint32_t)data[offset + 3];
}

static void put_uint16(std::vector<uint8_t> &out, uint16_t value) {
   out.push_back((uint8_t)(value >> 8));
   out.push_back((uint8_t)(value & 0xFF));
}

std::vector<uint8_t> mdns_build_query(void) {
   std::vector<uint8_t> packet;
   packet.reserve(MDNS_HEADER_SIZE + 32);

   put_uint16(packet, 0); /* Transaction ID (always 0 for mDNS) */
   put_uint16(packet, 0); /* Flags: standard query */
   put_uint16(packet, 1); /* Questions */
   put_uint16(packet, 0); /* Answers */
   put_uint16(packet, 0); /* Authority */
   put_uint16(packet, 0); /* Additional */

   std::vector<uint8_t> qname = mdns_encode_name(MDNS_SERVICE_TYPE);
   packet.insert(packet.end(), qname.begin(), qname.end());
   put_uint16(packet, MDNS_TYPE_PTR);
   put_uint16(packet, MDNS_CLASS_UNICAST_RESPONSE | MDNS_CLASS_IN);

   return packet;
}

/* =============================================================================
 * Response Parsing
 * ============================================================================= */

static void apply_txt_aliases(const std::map<std::string, std::string> &txt,
                              const char *const *keys,
                              size_t key_count,
                              std::string *field) {
   if (!field->empty()) {
      return; /* An earlier TXT record already supplied it */
   }
   for (size_t i = 0; i < key_count; i++) {
      auto it = txt.find(keys[i]);
      if (it != txt.end() && !it->second.empty()) {
         *field = it->second;
         return;
      }
   }
}

static void parse_txt_record(const uint8_t *rdata, size_t rdlength, mdns_device_t *device) {
   std::map<std::string, std::string> txt;
   size_t pos = 0;

   while (pos < rdlength) {
      size_t seg_len = rdata[pos++];
      if (seg_len == 0 || seg_len > rdlength - pos) {
         break;
      }
      std::string segment((const char *)rdata + pos, seg_len);
      pos += seg_len;

      size_t eq = segment.find('=');
      if (eq == std::string::npos) {
         continue;
      }
      std::string key = segment.substr(0, eq);
      std::string value = segment.substr(eq + 1);
      FTV_LOG_DEBUG("  TXT: %s = %s", key.c_str(), value.c_str());
      txt[key] = value;
      device->properties[key] = value;
   }

   apply_txt_aliases(txt, TXT_NAME_KEYS, sizeof(TXT_NAME_KEYS) / sizeof(TXT_NAME_KEYS[0]),
                     &device->name);
   apply_txt_aliases(txt, TXT_MODEL_KEYS, sizeof(TXT_MODEL_KEYS) / sizeof(TXT_MODEL_KEYS[0]),
                     &device->model);
   apply_txt_aliases(txt, TXT_MANUFACTURER_KEYS,
                     sizeof(TXT_MANUFACTURER_KEYS) / sizeof(TXT_MANUFACTURER_KEYS[0]),
                     &device->manufacturer);
}

bool mdns_parse_response(const uint8_t *packet, size_t len, mdns_device_t *device) {
   if (!packet || !device) {
      return false;
   }
   if (len < MDNS_HEADER_SIZE) {
      FTV_LOG_DEBUG("mDNS packet too short: %zu bytes", len);
      return false;
   }

   uint16_t flags = mdns_parse_uint16(packet, len, 2);
   uint16_t qd_count = mdns_parse_uint16(packet, len, 4);
   uint16_t an_count = mdns_parse_uint16(packet, len, 6);
   uint16_t ns_count = mdns_parse_uint16(packet, len, 8);
   uint16_t ar_count = mdns_parse_uint16(packet, len, 10);

   FTV_LOG_DEBUG("mDNS response: flags=%04x, questions=%u, answers=%u, authority=%u, "
                 "additional=%u",
                 flags, qd_count, an_count, ns_count, ar_count);

   device->address.clear();
   device->port = MDNS_DEFAULT_DEVICE_PORT;
   device->name.clear();
   device->model.clear();
   device->manufacturer.clear();
   device->properties.clear();
   device->goodbye = false;

   size_t pos = MDNS_HEADER_SIZE;
   for (uint16_t i = 0; i < qd_count; i++) {
      size_t next;
      if (!mdns_decode_name(packet, len, pos, NULL, &next) || next + 4 > len) {
         FTV_LOG_DEBUG("mDNS question %u malformed", i);
         return false;
      }
      pos = next + 4; /* QTYPE + QCLASS */
   }

   bool found_service = false;
   uint32_t total_records = (uint32_t)an_count + ns_count + ar_count;

   for (uint32_t i = 0; i < total_records; i++) {
      if (pos >= len) {
         break;
      }

      std::string owner;
      size_t next;
      if (!mdns_decode_name(packet, len, pos, &owner, &next)) {
         FTV_LOG_DEBUG("mDNS record %u: malformed owner name", i);
         break;
      }
      pos = next;
      if (pos + 10 > len) {
         break;
      }

      uint16_t rtype = mdns_parse_uint16(packet, len, pos);
      uint16_t rclass = mdns_parse_uint16(packet, len, pos + 2) & ~MDNS_CLASS_CACHE_FLUSH;
      uint32_t ttl = mdns_parse_uint32(packet, len, pos + 4);
      uint16_t rdlength = mdns_parse_uint16(packet, len, pos + 8);
      pos += 10;

      if (rdlength > len - pos) {
         FTV_LOG_DEBUG("mDNS record %u: rdlength %u exceeds packet", i, rdlength);
         break;
      }
      size_t rdata = pos;
      pos += rdlength;

      FTV_LOG_DEBUG("mDNS record: name=%s, type=%u, class=%u, ttl=%u, len=%u", owner.c_str(),
                    rtype, rclass, ttl, rdlength);

      if (ttl == 0) {
         device->goodbye = true;
      }

      switch (rtype) {
         case MDNS_TYPE_PTR: {
            std::string target;
            bool target_ok = mdns_decode_name(packet, len, rdata, &target, NULL);
            if (owner.find(MDNS_SERVICE_FRAGMENT) != std::string::npos ||
                (target_ok && target.find(MDNS_SERVICE_FRAGMENT) != std::string::npos)) {
               found_service = true;
            }
            FTV_LOG_DEBUG("PTR: %s -> %s", owner.c_str(), target_ok ? target.c_str() : "?");
            break;
         }
         case MDNS_TYPE_TXT:
            parse_txt_record(packet + rdata, rdlength, device);
            break;
         case MDNS_TYPE_SRV:
            if (rdlength >= 6) {
               device->port = mdns_parse_uint16(packet, len, rdata + 4);
               std::string target;
               if (mdns_decode_name(packet, len, rdata + 6, &target, NULL)) {
                  FTV_LOG_DEBUG("SRV: port=%u, target=%s", device->port, target.c_str());
               }
            }
            break;
         case MDNS_TYPE_A:
            if (rdlength == 4 && device->address.empty()) {
               char ip[16];
               snprintf(ip, sizeof(ip), "%u.%u.%u.%u", packet[rdata], packet[rdata + 1],
                        packet[rdata + 2], packet[rdata + 3]);
               device->address = ip;
               FTV_LOG_DEBUG("A record: %s -> %s", owner.c_str(), ip);
            }
            break;
         default:
            break;
      }
   }

   if (!found_service) {
      return false;
   }

   if (device->name.empty()) {
      device->name = device->address.empty()
                         ? std::string(MDNS_DEFAULT_PRODUCT)
                         : std::string(MDNS_DEFAULT_PRODUCT) + " (" + device->address + ")";
   }
   return true;
}
