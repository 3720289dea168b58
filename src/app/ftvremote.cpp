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
 * ftvremote - Command line Fire TV remote
 *
 * Loads the configuration, restores the persisted pairing, runs one
 * command on the event loop and exits when the command completes.
 */

#include <curl/curl.h>
#include <getopt.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <string>

#include "config/config_env.h"
#include "config/config_parser.h"
#include "config/config_validate.h"
#include "config/ftv_config.h"
#include "console_ui.h"
#include "core/event_loop.h"
#include "core/path_utils.h"
#include "firetv/ftv_api.h"
#include "firetv/remote_engine.h"
#include "logging_bridge.h"
#include "logging_common.h"
#include "network/curl_transport.h"
#include "network/multicast_channel.h"
#include "storage/kv_store.h"

#define MAX_CONFIG_ERRORS 16

static volatile sig_atomic_t s_interrupted = 0;

static void signal_handler(int sig) {
   (void)sig;
   s_interrupted = 1;
}

static void print_usage(const char *prog) {
   printf("Usage: %s [OPTIONS] COMMAND [ARGS]\n\n", prog);
   printf("Options:\n");
   printf("  -c, --config PATH   Configuration file\n");
   printf("  -a, --address IP    Fire TV address (overrides config and saved state)\n");
   printf("  -d, --debug         Enable debug logging\n");
   printf("      --dump-config   Print the effective configuration and exit\n");
   printf("  -h, --help          Show this help\n\n");
   printf("Commands:\n");
   printf("  discover              Search the network for Fire TV devices\n");
   printf("  select ITEM           Target a discovered device (\"Name|IP\")\n");
   printf("  pair                  Show a pairing PIN on the TV\n");
   printf("  verify PIN            Complete pairing with the PIN from the TV\n");
   printf("  test                  Wake the device and query its status\n");
   printf("  wake                  Wake the remote receiver on the TV\n");
   printf("  info                  Fetch the device name\n");
   printf("  clear-pairing         Forget the pairing token\n");
   printf("  key NAME              up, down, left, right, ok, home, back, menu\n");
   printf("  text STRING           Type text on the TV\n");
   printf("  media ACTION [SECS]   play, pause, stop, forward, rewind\n");
   printf("  run NAME [KEY=VALUE]  Run a named command (Home, FastForward, ...)\n");
}

/* =============================================================================
 * Command Dispatch
 * ============================================================================= */

static ftv_error_t start_media(RemoteEngine &engine,
                               const std::string &action,
                               const char *seconds,
                               ftv_result_cb_t done) {
   command_params_t params;
   if (seconds) {
      params[COMMAND_PARAM_SECONDS] = seconds;
   }

   if (action == "play") {
      engine.encoder().send_media(ftv_media_simple(FTV_MEDIA_PLAY), done);
   } else if (action == "pause") {
      engine.encoder().send_media(ftv_media_simple(FTV_MEDIA_PAUSE), done);
   } else if (action == "stop") {
      engine.encoder().send_media(ftv_media_simple(FTV_MEDIA_STOP), done);
   } else if (action == "forward") {
      engine.execute_command("FastForward", params, done);
   } else if (action == "rewind") {
      engine.execute_command("Rewind", params, done);
   } else {
      fprintf(stderr, "Unknown media action: %s\n", action.c_str());
      return FTV_ERR_INVALID_PARAM;
   }
   return FTV_OK;
}

static ftv_error_t start_command(RemoteEngine &engine,
                                 int argc,
                                 char **argv,
                                 ftv_result_cb_t done) {
   std::string command = argv[0];
   command_params_t params;

   if (command == "discover") {
      engine.discover(done);
   } else if (command == "select" && argc >= 2) {
      ftv_error_t err = engine.select_discovered_device(argv[1]);
      ftv_complete(done, err);
   } else if (command == "pair") {
      engine.execute_command("StartPairing", params, done);
   } else if (command == "verify" && argc >= 2) {
      engine.set_pin_entry(argv[1]);
      engine.execute_command("VerifyPIN", params, done);
   } else if (command == "test") {
      engine.test_connection(done);
   } else if (command == "wake") {
      engine.execute_command("Wake", params, done);
   } else if (command == "info") {
      engine.refresh_device_info(done);
   } else if (command == "clear-pairing") {
      engine.execute_command("ClearPairing", params, done);
   } else if (command == "key" && argc >= 2) {
      ftv_key_t key;
      if (!ftv_key_from_name(argv[1], &key)) {
         fprintf(stderr, "Unknown key: %s\n", argv[1]);
         return FTV_ERR_INVALID_PARAM;
      }
      engine.encoder().send_key(key, done);
   } else if (command == "text" && argc >= 2) {
      params[COMMAND_PARAM_TEXT] = argv[1];
      engine.execute_command("SendText", params, done);
   } else if (command == "media" && argc >= 2) {
      return start_media(engine, argv[1], argc >= 3 ? argv[2] : NULL, done);
   } else if (command == "run" && argc >= 2) {
      for (int i = 2; i < argc; i++) {
         const char *eq = strchr(argv[i], '=');
         if (!eq) {
            fprintf(stderr, "Expected KEY=VALUE, got: %s\n", argv[i]);
            return FTV_ERR_INVALID_PARAM;
         }
         params[std::string(argv[i], eq - argv[i])] = eq + 1;
      }
      engine.execute_command(argv[1], params, done);
   } else {
      fprintf(stderr, "Unknown or incomplete command: %s\n", command.c_str());
      return FTV_ERR_INVALID_PARAM;
   }
   return FTV_OK;
}

/* =============================================================================
 * Main
 * ============================================================================= */

int main(int argc, char **argv) {
   const char *config_path = NULL;
   const char *address = NULL;
   bool debug = false;
   bool dump_config = false;

   static struct option long_options[] = {
      { "config", required_argument, 0, 'c' },
      { "address", required_argument, 0, 'a' },
      { "debug", no_argument, 0, 'd' },
      { "dump-config", no_argument, 0, 'D' },
      { "help", no_argument, 0, 'h' },
      { 0, 0, 0, 0 },
   };

   int opt;
   while ((opt = getopt_long(argc, argv, "+c:a:dh", long_options, NULL)) != -1) {
      switch (opt) {
         case 'c':
            config_path = optarg;
            break;
         case 'a':
            address = optarg;
            break;
         case 'd':
            debug = true;
            break;
         case 'D':
            dump_config = true;
            break;
         case 'h':
            print_usage(argv[0]);
            return 0;
         default:
            print_usage(argv[0]);
            return 1;
      }
   }

   logging_bridge_init();

   ftv_config_t config;
   config_set_defaults(&config);
   if (config_load_from_search(config_path, &config) != FTV_OK) {
      return 1;
   }
   config_apply_env(&config);
   if (address) {
      safe_strncpy(config.device.address, address, sizeof(config.device.address));
   }
   if (debug) {
      config.logging.debug = true;
   }

   config_error_t errors[MAX_CONFIG_ERRORS];
   int error_count = config_validate(&config, errors, MAX_CONFIG_ERRORS);
   if (error_count > 0) {
      config_print_errors(errors, error_count > MAX_CONFIG_ERRORS ? MAX_CONFIG_ERRORS
                                                                  : error_count);
      return 1;
   }

   if (dump_config) {
      config_dump_toml(&config, stdout);
      return 0;
   }

   if (optind >= argc) {
      print_usage(argv[0]);
      return 1;
   }

   ftv_log_set_debug(config.logging.debug);
   if (logging_bridge_set_file(config.logging.log_file) != 0) {
      return 1;
   }

   char state_path[CONFIG_PATH_MAX];
   if (!path_expand_tilde(config.storage.state_path, state_path, sizeof(state_path))) {
      FTV_LOG_ERROR("State path too long: %s", config.storage.state_path);
      return 1;
   }
   JsonFileStore store(state_path);
   if (store.load() != FTV_OK) {
      FTV_LOG_ERROR("Cannot load state from %s", state_path);
      return 1;
   }

   if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      FTV_LOG_ERROR("Failed to initialize libcurl");
      return 1;
   }

   signal(SIGINT, signal_handler);
   signal(SIGTERM, signal_handler);

   int exit_code = 1;
   {
      EventLoop loop;
      CurlHttpTransport transport;
      UdpMulticastChannel channel(loop);
      ConsoleUi ui(stdout);
      RemoteEngine engine(transport, channel, loop, store, ui);

      loop.add_poller([&transport]() { return transport.pump(); });
      engine.init(config);

      bool finished = false;
      ftv_error_t result = FTV_OK;
      ftv_result_cb_t done = [&finished, &result](ftv_error_t err) {
         finished = true;
         result = err;
      };

      ftv_error_t err = start_command(engine, argc - optind, argv + optind, done);
      if (err != FTV_OK) {
         finished = true;
         result = err;
      }

      while (!finished && !s_interrupted) {
         loop.run_once(EVENT_LOOP_IDLE_WAIT_MS);
      }

      if (s_interrupted && !finished) {
         FTV_LOG_INFO("Interrupted");
         result = FTV_ERR_CANCELLED;
      }

      /* Commands that refresh device info after completing may still have
       * requests in flight; shutdown() drops them */
      engine.shutdown();
      transport.abort_all();

      if (result == FTV_OK) {
         exit_code = 0;
      } else {
         fprintf(stderr, "Error: %s\n", ftv_error_str(result));
      }
   }

   curl_global_cleanup();
   logging_bridge_shutdown();
   return exit_code;
}
