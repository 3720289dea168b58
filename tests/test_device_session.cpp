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

#include "firetv/device_session.h"
#include "test_fakes.h"

class DeviceSessionTest : public ::testing::Test {
 protected:
   DeviceSessionTest() : session(store, ui) {}

   MemoryStore store;
   RecordingUi ui;
   DeviceSession session;
};

TEST_F(DeviceSessionTest, RestoreEmptyStore) {
   session.restore();

   EXPECT_FALSE(session.has_address());
   EXPECT_FALSE(session.is_paired());
   EXPECT_EQ(PAIRING_STATUS_NOT_PAIRED, ui.property(UI_PROP_PAIRING_STATUS));
   EXPECT_EQ(CONNECTION_STATUS_NOT_CONNECTED, ui.property(UI_PROP_CONNECTION_STATUS));
}

TEST_F(DeviceSessionTest, RestorePersistedPairing) {
   store.values[STORE_KEY_HOST] = "10.0.0.5";
   store.values[STORE_KEY_CLIENT_TOKEN] = "AB12CD34TOKEN";

   session.restore();

   EXPECT_EQ("10.0.0.5", session.address());
   EXPECT_TRUE(session.is_paired());
   EXPECT_EQ("AB12CD34TOKEN", session.token());
   EXPECT_EQ("10.0.0.5", ui.property(UI_PROP_ADDRESS));
   EXPECT_EQ(PAIRING_STATUS_PAIRED, ui.property(UI_PROP_PAIRING_STATUS));
}

TEST_F(DeviceSessionTest, EmptyStoredTokenIsNotPaired) {
   store.values[STORE_KEY_CLIENT_TOKEN] = "";
   session.restore();
   EXPECT_FALSE(session.is_paired());
}

TEST_F(DeviceSessionTest, AddressChangeResetsWakeAndPersists) {
   session.record_wake(5000);
   session.set_connected(true);

   session.set_address("10.0.0.7");

   EXPECT_EQ("10.0.0.7", store.values[STORE_KEY_HOST]);
   EXPECT_FALSE(session.has_woken());
   EXPECT_EQ(0u, session.last_wake_ms());
   EXPECT_FALSE(session.is_connected());
   EXPECT_EQ("10.0.0.7", ui.property(UI_PROP_ADDRESS));
}

TEST_F(DeviceSessionTest, AddressChangeReusesPersistedToken) {
   store.values[STORE_KEY_CLIENT_TOKEN] = "TOKEN";
   session.set_address("10.0.0.7");
   EXPECT_TRUE(session.is_paired());
   EXPECT_EQ("TOKEN", session.token());
}

TEST_F(DeviceSessionTest, ClearingAddressRemovesIt) {
   session.set_address("10.0.0.7");
   session.set_address("");
   EXPECT_FALSE(session.has_address());
   EXPECT_FALSE(store.has(STORE_KEY_HOST));
}

TEST_F(DeviceSessionTest, StorePairingPersistsTokenAndHost) {
   session.set_address("10.0.0.5");
   EXPECT_EQ(FTV_OK, session.store_pairing("AB12CD34TOKEN"));

   EXPECT_TRUE(session.is_paired());
   EXPECT_TRUE(session.has_token());
   EXPECT_EQ("AB12CD34TOKEN", store.values[STORE_KEY_CLIENT_TOKEN]);
   EXPECT_EQ("10.0.0.5", store.values[STORE_KEY_HOST]);
}

TEST_F(DeviceSessionTest, StorePairingFailureKeepsMemoryState) {
   session.set_address("10.0.0.5");
   store.set_fail_writes(true);

   EXPECT_EQ(FTV_ERR_IO, session.store_pairing("TOKEN"));
   EXPECT_TRUE(session.is_paired());
   EXPECT_EQ("TOKEN", session.token());
}

TEST_F(DeviceSessionTest, ClearPairingForgetsToken) {
   session.store_pairing("TOKEN");
   session.clear_pairing();

   EXPECT_FALSE(session.is_paired());
   EXPECT_FALSE(session.has_token());
   EXPECT_FALSE(store.has(STORE_KEY_CLIENT_TOKEN));
}

TEST_F(DeviceSessionTest, ClearPairingSurvivesStoreFailure) {
   session.store_pairing("TOKEN");
   store.set_fail_writes(true);
   session.clear_pairing();
   EXPECT_FALSE(session.is_paired());
}

TEST_F(DeviceSessionTest, ConnectionEventsFireOnChangeOnly) {
   session.set_connected(true);
   session.set_connected(true);
   EXPECT_EQ(1, ui.event_count(UI_EVENT_CONNECTION_RESTORED));
   EXPECT_EQ(CONNECTION_STATUS_CONNECTED, ui.property(UI_PROP_CONNECTION_STATUS));

   session.set_connected(false);
   session.set_connected(false);
   EXPECT_EQ(1, ui.event_count(UI_EVENT_CONNECTION_LOST));
   EXPECT_EQ(CONNECTION_STATUS_NOT_CONNECTED, ui.property(UI_PROP_CONNECTION_STATUS));
}
