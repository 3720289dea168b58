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
#include <string.h>

#include <string>

#include "config/ftv_config.h"
#include "firetv/remote_engine.h"
#include "mdns_packet_builder.h"
#include "test_fakes.h"

#define OK_BODY "{\"description\":\"OK\"}"

class RemoteEngineTest : public ::testing::Test {
 protected:
   RemoteEngineTest() : engine(transport, channel, timers, store, ui) {
      config_set_defaults(&config);
      config.device.auto_wake = false;
      config.timing.settle_ms = 100;
   }

   void init_paired() {
      store.values[STORE_KEY_HOST] = "10.0.0.5";
      store.values[STORE_KEY_CLIENT_TOKEN] = "AB12CD34TOKEN";
      engine.init(config);
   }

   ftv_config_t config;
   FakeTimerService timers;
   FakeHttpTransport transport;
   FakeMulticastChannel channel;
   MemoryStore store;
   RecordingUi ui;
   RemoteEngine engine;
};

/* =============================================================================
 * Initialization and Settings
 * ============================================================================= */

TEST_F(RemoteEngineTest, InitRestoresPersistedState) {
   init_paired();

   EXPECT_EQ("10.0.0.5", engine.session().address());
   EXPECT_TRUE(engine.session().is_paired());
   EXPECT_EQ(PAIRING_STATUS_PAIRED, ui.property(UI_PROP_PAIRING_STATUS));
   EXPECT_EQ("10.0.0.5", ui.property(UI_PROP_ADDRESS));
   EXPECT_EQ(CONNECTION_STATUS_NOT_CONNECTED, ui.property(UI_PROP_CONNECTION_STATUS));
}

TEST_F(RemoteEngineTest, InitAppliesConfiguration) {
   config.device.timeout_sec = 7;
   config.timing.command_interval_ms = 250;
   config.timing.wake_max_attempts = 5;
   engine.init(config);

   EXPECT_EQ(7, transport.timeout());
   EXPECT_EQ(7, engine.session().timeout_sec());
   EXPECT_EQ(250u, engine.queue().min_interval());
   EXPECT_EQ(5, engine.wake().timing().max_attempts);
   EXPECT_EQ(100u, engine.wake().timing().settle_ms);
   EXPECT_FALSE(engine.session().auto_wake());
}

TEST_F(RemoteEngineTest, ConfiguredAddressOverridesPersisted) {
   strcpy(config.device.address, "10.0.0.9");
   init_paired();

   EXPECT_EQ("10.0.0.9", engine.session().address());
   EXPECT_EQ("10.0.0.9", store.values[STORE_KEY_HOST]);
   /* The stored token is offered to the new device */
   EXPECT_TRUE(engine.session().is_paired());
}

TEST_F(RemoteEngineTest, InitRestoresDiscoveredDevices) {
   discovery_device_map_t devices;
   mdns_device_t device;
   device.name = "Bedroom";
   device.address = "10.0.0.6";
   device.model = "AFTMM";
   device.port = 0;
   device.goodbye = false;
   devices[device.address] = device;
   store.values[STORE_KEY_DISCOVERED_DEVICES] = discovery_devices_to_json(devices);

   engine.init(config);

   ASSERT_TRUE(engine.discovery().find("10.0.0.6") != NULL);
   EXPECT_EQ("Bedroom", engine.discovery().find("10.0.0.6")->name);
}

TEST_F(RemoteEngineTest, NonPositiveTimeoutFallsBackToDefault) {
   engine.set_timeout(0);
   EXPECT_EQ(CONFIG_DEFAULT_TIMEOUT_SEC, engine.session().timeout_sec());
}

/* =============================================================================
 * Discovery
 * ============================================================================= */

TEST_F(RemoteEngineTest, DiscoverAndSelectDevice) {
   engine.init(config);

   ResultRecorder results;
   engine.execute_command("DiscoverDevices", command_params_t(), results.callback());
   EXPECT_EQ(DISCOVERY_STATUS_ACTIVE, ui.property(UI_PROP_DISCOVERY_STATUS));
   EXPECT_FALSE(channel.sent.empty());

   channel.deliver(MdnsPacketBuilder::fire_tv("LivingRoom", 5));
   timers.advance(config.discovery.timeout_ms);

   ASSERT_EQ(1u, results.count());
   EXPECT_EQ(FTV_OK, results.last());
   EXPECT_EQ("Found 1 device(s)", ui.property(UI_PROP_DISCOVERY_STATUS));

   const std::vector<std::string> &items = ui.lists[UI_PROP_DISCOVERED_DEVICES];
   ASSERT_EQ(2u, items.size());
   EXPECT_EQ(UI_DEVICE_LIST_PLACEHOLDER, items[0]);
   EXPECT_EQ("LivingRoom [AFTMM]|10.0.0.5", items[1]);

   EXPECT_EQ(FTV_OK, engine.select_discovered_device(items[1]));
   EXPECT_EQ("10.0.0.5", engine.session().address());
   EXPECT_EQ("LivingRoom", ui.property(UI_PROP_DEVICE_NAME));
}

TEST_F(RemoteEngineTest, SelectRejectsPlaceholderAndGarbage) {
   EXPECT_EQ(FTV_ERR_INVALID_PARAM, engine.select_discovered_device(UI_DEVICE_LIST_PLACEHOLDER));
   EXPECT_EQ(FTV_ERR_INVALID_PARAM, engine.select_discovered_device("no separator"));
   EXPECT_EQ(FTV_ERR_INVALID_PARAM, engine.select_discovered_device("Name|"));
   EXPECT_FALSE(engine.session().has_address());
}

TEST_F(RemoteEngineTest, SelectUnknownDeviceUsesDefaultName) {
   EXPECT_EQ(FTV_OK, engine.select_discovered_device("Den|10.0.0.8"));
   EXPECT_EQ("10.0.0.8", engine.session().address());
   EXPECT_EQ("Fire TV", ui.property(UI_PROP_DEVICE_NAME));
}

TEST_F(RemoteEngineTest, DepartureOfCurrentDeviceMarksDisconnected) {
   init_paired();
   engine.session().set_connected(true);

   ResultRecorder results;
   engine.discover(results.callback());
   channel.deliver(MdnsPacketBuilder::fire_tv("LivingRoom", 5));
   channel.deliver(MdnsPacketBuilder::fire_tv("LivingRoom", 5, 0));

   EXPECT_FALSE(engine.session().is_connected());
   EXPECT_EQ(1, ui.event_count(UI_EVENT_CONNECTION_LOST));
}

TEST_F(RemoteEngineTest, SecondDiscoveryWhileRunningIsBusy) {
   ResultRecorder first;
   ResultRecorder second;
   engine.discover(first.callback());
   engine.discover(second.callback());

   ASSERT_EQ(1u, second.count());
   EXPECT_EQ(FTV_ERR_BUSY, second.last());
   EXPECT_EQ(0u, first.count());

   engine.execute_command("StopDiscovery", command_params_t(), second.callback());
   ASSERT_EQ(1u, first.count());
   EXPECT_EQ(FTV_OK, first.last());
}

/* =============================================================================
 * Named Commands
 * ============================================================================= */

TEST_F(RemoteEngineTest, NavigationCommand) {
   init_paired();
   ResultRecorder results;
   engine.execute_command("Select", command_params_t(), results.callback());

   ASSERT_EQ(1u, transport.requests.size());
   EXPECT_EQ("https://10.0.0.5:8080/v1/FireTV?action=select", transport.last().url);
   EXPECT_EQ("{\"keyActionType\":\"keyDown\"}", transport.last().body);
}

TEST_F(RemoteEngineTest, UnknownCommandIsRejected) {
   init_paired();
   ResultRecorder results;
   engine.execute_command("Power", command_params_t(), results.callback());

   ASSERT_EQ(1u, results.count());
   EXPECT_EQ(FTV_ERR_INVALID_PARAM, results.last());
   EXPECT_TRUE(transport.requests.empty());
}

TEST_F(RemoteEngineTest, LuaActionRunsNamedCommand) {
   init_paired();
   command_params_t params;
   params[COMMAND_PARAM_ACTION] = "Home";

   ResultRecorder results;
   engine.execute_command("LUA_ACTION", params, results.callback());

   ASSERT_EQ(1u, transport.requests.size());
   EXPECT_EQ("https://10.0.0.5:8080/v1/FireTV?action=home", transport.last().url);
   transport.respond_next(make_response(200, OK_BODY));
   EXPECT_EQ(FTV_OK, results.last());
}

TEST_F(RemoteEngineTest, PlayAndPauseToggle) {
   init_paired();
   transport.responder = [](const http_request_t &) { return make_response(200, OK_BODY); };

   ResultRecorder results;
   engine.execute_command("Pause", command_params_t(), results.callback());
   engine.execute_command("PlayPause", command_params_t(), results.callback());
   timers.advance(150);

   ASSERT_EQ(2u, transport.requests.size());
   EXPECT_EQ("https://10.0.0.5:8080/v1/media?action=play", transport.requests[0].request.url);
   EXPECT_EQ("https://10.0.0.5:8080/v1/media?action=play", transport.requests[1].request.url);
   EXPECT_EQ(2u, results.count());
}

TEST_F(RemoteEngineTest, ScanSecondsParameter) {
   init_paired();
   command_params_t params;
   params[COMMAND_PARAM_SECONDS] = "30";

   ResultRecorder results;
   engine.execute_command("Rewind", params, results.callback());
   ASSERT_EQ(1u, transport.requests.size());
   EXPECT_EQ("https://10.0.0.5:8080/v1/media?action=scan", transport.last().url);
   EXPECT_EQ("{\"direction\":\"back\",\"durationInSeconds\":\"30\",\"speed\":\"1\"}",
             transport.last().body);
}

TEST_F(RemoteEngineTest, InvalidScanSecondsUseDefault) {
   init_paired();
   command_params_t params;
   params[COMMAND_PARAM_SECONDS] = "abc";

   ResultRecorder results;
   engine.execute_command("FastForward", params, results.callback());
   ASSERT_EQ(1u, transport.requests.size());
   EXPECT_EQ("{\"direction\":\"forward\",\"durationInSeconds\":\"10\",\"speed\":\"1\"}",
             transport.last().body);
}

TEST_F(RemoteEngineTest, SendTextCommand) {
   init_paired();
   command_params_t params;
   params[COMMAND_PARAM_TEXT] = "ok";

   ResultRecorder results;
   engine.execute_command("SendText", params, results.callback());
   ASSERT_EQ(1u, transport.requests.size());
   EXPECT_EQ("{\"text\":\"o\"}", transport.last().body);
}

TEST_F(RemoteEngineTest, VerifyPinUsesTypedEntry) {
   strcpy(config.device.address, "10.0.0.5");
   engine.init(config);
   engine.set_pin_entry("4321");

   ResultRecorder results;
   engine.execute_command("VerifyPIN", command_params_t(), results.callback());
   ASSERT_EQ(1u, transport.requests.size());
   EXPECT_EQ("{\"pin\":\"4321\"}", transport.last().body);

   transport.respond_next(make_response(200, "{\"description\":\"AB12CD34TOKEN\"}"));
   EXPECT_EQ(FTV_OK, results.last());
   EXPECT_TRUE(engine.session().is_paired());

   /* A successful pairing fetches the device name */
   ASSERT_EQ(2u, transport.requests.size());
   EXPECT_EQ("https://10.0.0.5:8080/v1/FireTV/properties", transport.last().url);
   transport.respond_next(make_response(200, "{\"pfm\":\"Fire TV Stick\"}"));
   EXPECT_EQ("Fire TV Stick", ui.property(UI_PROP_DEVICE_NAME));
}

TEST_F(RemoteEngineTest, ClearPairingCommand) {
   init_paired();
   ResultRecorder results;
   engine.execute_command("ClearPairing", command_params_t(), results.callback());

   EXPECT_EQ(FTV_OK, results.last());
   EXPECT_FALSE(engine.session().is_paired());
   EXPECT_FALSE(store.has(STORE_KEY_CLIENT_TOKEN));
   EXPECT_EQ(PAIRING_STATUS_NOT_PAIRED, ui.property(UI_PROP_PAIRING_STATUS));
}

/* =============================================================================
 * Connection
 * ============================================================================= */

TEST_F(RemoteEngineTest, TestConnectionWakesThenQueriesStatus) {
   init_paired();
   ResultRecorder results;
   engine.test_connection(results.callback());

   ASSERT_EQ(1u, transport.requests.size());
   EXPECT_EQ("http://10.0.0.5:8009/apps/FireTVRemote", transport.last().url);
   transport.respond_next(make_response(200, ""));
   timers.advance(100);

   ASSERT_EQ(2u, transport.requests.size());
   EXPECT_EQ("GET", transport.last().method);
   EXPECT_EQ("https://10.0.0.5:8080/v1/FireTV/status", transport.last().url);
   transport.respond_next(make_response(200, "{}"));

   ASSERT_EQ(1u, results.count());
   EXPECT_EQ(FTV_OK, results.last());
   EXPECT_EQ(CONNECTION_STATUS_CONNECTED, ui.property(UI_PROP_CONNECTION_STATUS));
}

TEST_F(RemoteEngineTest, TestConnectionReportsStatusFailure) {
   init_paired();
   ResultRecorder results;
   engine.test_connection(results.callback());
   transport.respond_next(make_response(200, ""));
   timers.advance(100);
   transport.respond_next(make_response(500, ""));

   EXPECT_EQ(FTV_ERR_HTTP_STATUS, results.last());
   EXPECT_EQ(CONNECTION_STATUS_NO_STATUS, ui.property(UI_PROP_CONNECTION_STATUS));
}

TEST_F(RemoteEngineTest, TestConnectionReportsWakeFailure) {
   config.timing.wake_max_attempts = 1;
   init_paired();
   ResultRecorder results;
   engine.test_connection(results.callback());
   transport.respond_next(make_transport_error("Connection refused"));

   EXPECT_EQ(FTV_ERR_WAKE_FAILED, results.last());
   EXPECT_EQ(CONNECTION_STATUS_WAKE_FAILED, ui.property(UI_PROP_CONNECTION_STATUS));
}

TEST_F(RemoteEngineTest, TestConnectionWithoutAddress) {
   engine.init(config);
   ResultRecorder results;
   engine.test_connection(results.callback());

   EXPECT_EQ(FTV_ERR_NOT_CONFIGURED, results.last());
   EXPECT_TRUE(transport.requests.empty());
}

/* =============================================================================
 * Proxy Commands
 * ============================================================================= */

TEST_F(RemoteEngineTest, ProxyOnWakesAndPressesHome) {
   init_paired();
   ResultRecorder results;
   engine.handle_proxy_command(PROXY_COMMAND_ON, command_params_t(), results.callback());

   ASSERT_EQ(1u, transport.requests.size());
   EXPECT_EQ("http://10.0.0.5:8009/apps/FireTVRemote", transport.last().url);
   transport.respond_next(make_response(200, ""));
   timers.advance(100);

   ASSERT_EQ(2u, transport.requests.size());
   EXPECT_EQ("https://10.0.0.5:8080/v1/FireTV?action=home", transport.last().url);
   transport.respond_next(make_response(200, OK_BODY));
   EXPECT_EQ(FTV_OK, results.last());
}

TEST_F(RemoteEngineTest, ProxyOffDoesNothing) {
   init_paired();
   ResultRecorder results;
   engine.handle_proxy_command(PROXY_COMMAND_OFF, command_params_t(), results.callback());

   EXPECT_EQ(FTV_OK, results.last());
   EXPECT_TRUE(transport.requests.empty());
}

TEST_F(RemoteEngineTest, ProxyOtherCommandsAreNamedCommands) {
   init_paired();
   ResultRecorder results;
   engine.handle_proxy_command("Back", command_params_t(), results.callback());

   ASSERT_EQ(1u, transport.requests.size());
   EXPECT_EQ("https://10.0.0.5:8080/v1/FireTV?action=back", transport.last().url);
}

/* =============================================================================
 * Shutdown
 * ============================================================================= */

TEST_F(RemoteEngineTest, ShutdownCancelsOutstandingWork) {
   init_paired();
   ResultRecorder commands;
   ResultRecorder discovery;
   engine.execute_command("Home", command_params_t(), commands.callback());
   engine.execute_command("Back", command_params_t(), commands.callback());
   engine.discover(discovery.callback());

   engine.shutdown();

   ASSERT_EQ(2u, commands.count());
   EXPECT_EQ(FTV_ERR_CANCELLED, commands.results[0]);
   EXPECT_EQ(FTV_ERR_CANCELLED, commands.results[1]);
   ASSERT_EQ(1u, discovery.count());
   EXPECT_EQ(FTV_ERR_CANCELLED, discovery.last());
   EXPECT_EQ(0u, timers.count());
   EXPECT_EQ(0u, engine.http().pending_count());

   /* A late reply for the abandoned request is dropped */
   transport.respond_next(make_response(200, OK_BODY));
   EXPECT_EQ(2u, commands.count());
}
