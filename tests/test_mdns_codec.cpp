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

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "mdns/mdns_codec.h"
#include "mdns_packet_builder.h"

static std::vector<uint8_t> header_only() {
   return std::vector<uint8_t>(MDNS_HEADER_SIZE, 0);
}

/* =============================================================================
 * Names
 * ============================================================================= */

TEST(MdnsCodecTest, EncodeNameWritesLengthPrefixedLabels) {
   std::vector<uint8_t> encoded = mdns_encode_name("_amzn-wplay._tcp.local.");

   std::vector<uint8_t> expected;
   expected.push_back(11);
   for (char c : std::string("_amzn-wplay")) {
      expected.push_back((uint8_t)c);
   }
   expected.push_back(4);
   for (char c : std::string("_tcp")) {
      expected.push_back((uint8_t)c);
   }
   expected.push_back(5);
   for (char c : std::string("local")) {
      expected.push_back((uint8_t)c);
   }
   expected.push_back(0);

   EXPECT_EQ(expected, encoded);
}

TEST(MdnsCodecTest, EncodeNameSkipsEmptyLabels) {
   std::vector<uint8_t> encoded = mdns_encode_name("a..b.");
   std::vector<uint8_t> expected = { 1, 'a', 1, 'b', 0 };
   EXPECT_EQ(expected, encoded);
   EXPECT_EQ(std::vector<uint8_t>(1, 0), mdns_encode_name(""));
}

TEST(MdnsCodecTest, DecodeReturnsEncodedName) {
   const char *names[] = { "local", "_amzn-wplay._tcp.local", "Living Room._amzn-wplay._tcp.local",
                           "a.b.c.d.e.f" };

   for (const char *name : names) {
      std::vector<uint8_t> packet = header_only();
      std::vector<uint8_t> encoded = mdns_encode_name(name);
      packet.insert(packet.end(), encoded.begin(), encoded.end());

      std::string decoded;
      size_t next = 0;
      ASSERT_TRUE(mdns_decode_name(packet.data(), packet.size(), MDNS_HEADER_SIZE, &decoded, &next))
          << name;
      EXPECT_EQ(name, decoded);
      EXPECT_EQ(packet.size(), next);
   }
}

TEST(MdnsCodecTest, DecodeFollowsCompressionPointer) {
   std::vector<uint8_t> packet = header_only();
   std::vector<uint8_t> base = mdns_encode_name("_tcp.local");
   packet.insert(packet.end(), base.begin(), base.end());

   /* "tv" followed by a pointer to offset 12 */
   size_t start = packet.size();
   packet.push_back(2);
   packet.push_back('t');
   packet.push_back('v');
   packet.push_back(0xC0);
   packet.push_back(MDNS_HEADER_SIZE);
   packet.push_back(0xAA); /* Trailing byte after the name */

   std::string decoded;
   size_t next = 0;
   ASSERT_TRUE(mdns_decode_name(packet.data(), packet.size(), start, &decoded, &next));
   EXPECT_EQ("tv._tcp.local", decoded);
   EXPECT_EQ(start + 5, next);
}

TEST(MdnsCodecTest, DecodeRejectsSelfReferentialPointer) {
   std::vector<uint8_t> packet = header_only();
   packet.push_back(0xC0);
   packet.push_back(MDNS_HEADER_SIZE);

   std::string decoded;
   size_t next = 0;
   EXPECT_FALSE(mdns_decode_name(packet.data(), packet.size(), MDNS_HEADER_SIZE, &decoded, &next));
}

TEST(MdnsCodecTest, DecodeLimitsPointerHops) {
   std::vector<uint8_t> packet = header_only();
   packet.push_back(1);
   packet.push_back('a');
   packet.push_back(0);

   /* Pointer k points at pointer k-1; pointer 1 points at the label */
   std::vector<size_t> pointers;
   size_t previous = MDNS_HEADER_SIZE;
   for (int k = 1; k <= MDNS_MAX_POINTER_HOPS + 1; k++) {
      pointers.push_back(packet.size());
      packet.push_back((uint8_t)(0xC0 | (previous >> 8)));
      packet.push_back((uint8_t)(previous & 0xFF));
      previous = pointers.back();
   }

   std::string decoded;
   size_t next = 0;
   EXPECT_TRUE(mdns_decode_name(packet.data(), packet.size(), pointers[MDNS_MAX_POINTER_HOPS - 1],
                                &decoded, &next));
   EXPECT_EQ("a", decoded);
   EXPECT_FALSE(mdns_decode_name(packet.data(), packet.size(), pointers[MDNS_MAX_POINTER_HOPS],
                                 &decoded, &next));
}

TEST(MdnsCodecTest, DecodeRejectsMalformedNames) {
   std::string decoded;
   size_t next = 0;

   /* Reserved label type */
   std::vector<uint8_t> reserved = header_only();
   reserved.push_back(0x40);
   reserved.push_back(0);
   EXPECT_FALSE(mdns_decode_name(reserved.data(), reserved.size(), MDNS_HEADER_SIZE, &decoded,
                                 &next));

   /* Label longer than the packet */
   std::vector<uint8_t> overrun = header_only();
   overrun.push_back(10);
   overrun.push_back('x');
   EXPECT_FALSE(mdns_decode_name(overrun.data(), overrun.size(), MDNS_HEADER_SIZE, &decoded,
                                 &next));

   /* Pointer outside the packet */
   std::vector<uint8_t> outside = header_only();
   outside.push_back(0xC0);
   outside.push_back(0xFF);
   EXPECT_FALSE(mdns_decode_name(outside.data(), outside.size(), MDNS_HEADER_SIZE, &decoded,
                                 &next));

   /* Missing terminator */
   std::vector<uint8_t> unterminated = header_only();
   unterminated.push_back(1);
   unterminated.push_back('x');
   EXPECT_FALSE(mdns_decode_name(unterminated.data(), unterminated.size(), MDNS_HEADER_SIZE,
                                 &decoded, &next));
}

TEST(MdnsCodecTest, IntegerReadsAreBoundsChecked) {
   const uint8_t data[] = { 0x12, 0x34, 0x56, 0x78 };
   EXPECT_EQ(0x1234, mdns_parse_uint16(data, sizeof(data), 0));
   EXPECT_EQ(0x5678, mdns_parse_uint16(data, sizeof(data), 2));
   EXPECT_EQ(0, mdns_parse_uint16(data, sizeof(data), 3));
   EXPECT_EQ(0x12345678u, mdns_parse_uint32(data, sizeof(data), 0));
   EXPECT_EQ(0u, mdns_parse_uint32(data, sizeof(data), 1));
   EXPECT_EQ(0u, mdns_parse_uint32(data, sizeof(data), 10));
}

/* =============================================================================
 * Query
 * ============================================================================= */

TEST(MdnsCodecTest, QueryAsksForServicePtrWithUnicastBit) {
   std::vector<uint8_t> query = mdns_build_query();
   ASSERT_GT(query.size(), (size_t)MDNS_HEADER_SIZE + 4);

   EXPECT_EQ(0, mdns_parse_uint16(query.data(), query.size(), 0));
   EXPECT_EQ(0, mdns_parse_uint16(query.data(), query.size(), 2));
   EXPECT_EQ(1, mdns_parse_uint16(query.data(), query.size(), 4));
   EXPECT_EQ(0, mdns_parse_uint16(query.data(), query.size(), 6));

   std::string qname;
   size_t next = 0;
   ASSERT_TRUE(mdns_decode_name(query.data(), query.size(), MDNS_HEADER_SIZE, &qname, &next));
   EXPECT_EQ("_amzn-wplay._tcp.local", qname);
   EXPECT_EQ(MDNS_TYPE_PTR, mdns_parse_uint16(query.data(), query.size(), next));
   EXPECT_EQ(0x8001, mdns_parse_uint16(query.data(), query.size(), next + 2));
   EXPECT_EQ(next + 4, query.size());
}

/* =============================================================================
 * Responses
 * ============================================================================= */

TEST(MdnsCodecTest, ParsesNameAndAddressFromTxtAndA) {
   std::vector<uint8_t> packet = MdnsPacketBuilder::fire_tv("LivingRoom", 5);

   mdns_device_t device;
   ASSERT_TRUE(mdns_parse_response(packet.data(), packet.size(), &device));
   EXPECT_EQ("LivingRoom", device.name);
   EXPECT_EQ("10.0.0.5", device.address);
   EXPECT_EQ("AFTMM", device.model);
   EXPECT_EQ(MDNS_DEFAULT_DEVICE_PORT, device.port);
   EXPECT_FALSE(device.goodbye);
   EXPECT_EQ("LivingRoom", device.properties["fn"]);
}

TEST(MdnsCodecTest, RejectsResponseWithoutServicePtr) {
   MdnsPacketBuilder builder;
   builder.ptr("_googlecast._tcp.local", "Chromecast._googlecast._tcp.local")
       .a("Chromecast.local", 10, 0, 0, 9);
   std::vector<uint8_t> packet = builder.build();

   mdns_device_t device;
   EXPECT_FALSE(mdns_parse_response(packet.data(), packet.size(), &device));
}

TEST(MdnsCodecTest, FallsBackToProductNameWithAddress) {
   MdnsPacketBuilder builder;
   builder.ptr("_amzn-wplay._tcp.local", "x._amzn-wplay._tcp.local").a("x.local", 192, 168, 1, 20);
   std::vector<uint8_t> packet = builder.build();

   mdns_device_t device;
   ASSERT_TRUE(mdns_parse_response(packet.data(), packet.size(), &device));
   EXPECT_EQ("Fire TV (192.168.1.20)", device.name);
}

TEST(MdnsCodecTest, FirstAddressRecordWins) {
   MdnsPacketBuilder builder;
   builder.ptr("_amzn-wplay._tcp.local", "tv._amzn-wplay._tcp.local")
       .a("tv.local", 10, 0, 0, 5)
       .a("tv.local", 10, 0, 0, 6);
   std::vector<uint8_t> packet = builder.build();

   mdns_device_t device;
   ASSERT_TRUE(mdns_parse_response(packet.data(), packet.size(), &device));
   EXPECT_EQ("10.0.0.5", device.address);
}

TEST(MdnsCodecTest, TxtNameAliasesAndFirstRecordPrecedence) {
   MdnsPacketBuilder builder;
   builder.ptr("_amzn-wplay._tcp.local", "den._amzn-wplay._tcp.local")
       .txt("den._amzn-wplay._tcp.local", { "friendlyName=Other", "n=Den", "model=AFTKA" })
       .txt("den._amzn-wplay._tcp.local", { "fn=Later", "manufacturer=Amazon" })
       .a("den.local", 10, 0, 0, 7);
   std::vector<uint8_t> packet = builder.build();

   mdns_device_t device;
   ASSERT_TRUE(mdns_parse_response(packet.data(), packet.size(), &device));
   EXPECT_EQ("Den", device.name);
   EXPECT_EQ("AFTKA", device.model);
   EXPECT_EQ("Amazon", device.manufacturer);
   EXPECT_EQ("Later", device.properties["fn"]);
}

TEST(MdnsCodecTest, SrvRecordSetsPort) {
   MdnsPacketBuilder builder;
   builder.ptr("_amzn-wplay._tcp.local", "tv._amzn-wplay._tcp.local")
       .srv("tv._amzn-wplay._tcp.local", 8009, "tv.local")
       .a("tv.local", 10, 0, 0, 8);
   std::vector<uint8_t> packet = builder.build();

   mdns_device_t device;
   ASSERT_TRUE(mdns_parse_response(packet.data(), packet.size(), &device));
   EXPECT_EQ(8009, device.port);
}

TEST(MdnsCodecTest, ZeroTtlMarksGoodbye) {
   std::vector<uint8_t> packet = MdnsPacketBuilder::fire_tv("Bedroom", 6, 0);

   mdns_device_t device;
   ASSERT_TRUE(mdns_parse_response(packet.data(), packet.size(), &device));
   EXPECT_TRUE(device.goodbye);
   EXPECT_EQ("10.0.0.6", device.address);
}

TEST(MdnsCodecTest, TruncatedPacketsNeverReadPastTheEnd) {
   std::vector<uint8_t> packet = MdnsPacketBuilder::fire_tv("LivingRoom", 5);

   for (size_t len = 0; len < packet.size(); len++) {
      /* Copy into an exact-size buffer so overreads land outside it */
      std::vector<uint8_t> truncated(packet.begin(), packet.begin() + len);
      mdns_device_t device;
      bool found = mdns_parse_response(truncated.data(), truncated.size(), &device);
      if (found) {
         EXPECT_TRUE(device.address.empty() || device.address == "10.0.0.5") << len;
         EXPECT_FALSE(device.name.empty());
      }
   }
}

TEST(MdnsCodecTest, OversizedRecordLengthStopsParsing) {
   MdnsPacketBuilder builder;
   builder.ptr("_amzn-wplay._tcp.local", "tv._amzn-wplay._tcp.local");
   std::vector<uint8_t> packet = builder.build();

   /* Claim one more answer whose rdlength runs past the end */
   packet[7] = 2;
   std::vector<uint8_t> owner = mdns_encode_name("tv.local");
   packet.insert(packet.end(), owner.begin(), owner.end());
   const uint8_t fixed[] = { 0x00, 0x01, 0x00, 0x01, 0x00, 0x00, 0x00, 0x78, 0x01, 0x00 };
   packet.insert(packet.end(), fixed, fixed + sizeof(fixed));
   packet.push_back(10);

   mdns_device_t device;
   EXPECT_TRUE(mdns_parse_response(packet.data(), packet.size(), &device));
   EXPECT_TRUE(device.address.empty());
}

TEST(MdnsCodecTest, PointerLoopInOwnerNameIsBounded) {
   std::vector<uint8_t> packet = header_only();
   packet[7] = 1; /* One answer */
   size_t owner = packet.size();
   packet.push_back((uint8_t)(0xC0 | (owner >> 8)));
   packet.push_back((uint8_t)(owner & 0xFF));

   mdns_device_t device;
   EXPECT_FALSE(mdns_parse_response(packet.data(), packet.size(), &device));
}
