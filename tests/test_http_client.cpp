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
#include <stdarg.h>
#include <stdio.h>

#include <string>
#include <vector>

#include "logging_common.h"
#include "network/http_client.h"
#include "test_fakes.h"

class HttpClientTest : public ::testing::Test {
 protected:
   HttpClientTest() : client(transport) {}

   http_callback_t record() {
      return [this](const http_response_t &response) { responses.push_back(response); };
   }

   FakeHttpTransport transport;
   HttpClient client;
   std::vector<http_response_t> responses;
};

TEST_F(HttpClientTest, RoutesAsyncCompletionByTicket) {
   std::vector<std::string> order;
   client.get("https://10.0.0.5:8080/a", http_headers_t(),
              [&order](const http_response_t &response) { order.push_back("a:" + response.body); });
   client.get("https://10.0.0.5:8080/b", http_headers_t(),
              [&order](const http_response_t &response) { order.push_back("b:" + response.body); });
   EXPECT_EQ(2u, client.pending_count());

   transport.respond(1, make_response(200, "second"));
   transport.respond(0, make_response(200, "first"));

   ASSERT_EQ(2u, order.size());
   EXPECT_EQ("b:second", order[0]);
   EXPECT_EQ("a:first", order[1]);
   EXPECT_EQ(0u, client.pending_count());
}

TEST_F(HttpClientTest, DeliversSynchronousCompletion) {
   transport.responder = [](const http_request_t &) { return make_response(201, "created"); };

   client.post("http://10.0.0.5:8009/apps/FireTVRemote", "", http_headers_t(), record());

   ASSERT_EQ(1u, responses.size());
   EXPECT_EQ(201, responses[0].status_code);
   EXPECT_EQ("created", responses[0].body);
   EXPECT_EQ(0u, client.pending_count());
}

TEST_F(HttpClientTest, SubmitFailureCompletesWithTransportError) {
   transport.set_fail_submit(true);

   client.get("https://10.0.0.5:8080/x", http_headers_t(), record());

   ASSERT_EQ(1u, responses.size());
   EXPECT_EQ(0, responses[0].status_code);
   EXPECT_FALSE(responses[0].transport_error.empty());
   EXPECT_FALSE(http_response_ok(responses[0]));
}

TEST_F(HttpClientTest, CallbackFiresAtMostOnce) {
   client.get("https://10.0.0.5:8080/x", http_headers_t(), record());
   uint64_t ticket = transport.requests[0].ticket;

   transport.deliver(ticket, make_response(200, "{}"));
   transport.deliver(ticket, make_response(200, "{}"));
   transport.deliver(ticket + 100, make_response(200, "{}"));

   EXPECT_EQ(1u, responses.size());
}

TEST_F(HttpClientTest, AbandonDropsPendingCallbacks) {
   client.get("https://10.0.0.5:8080/x", http_headers_t(), record());
   client.abandon_all();
   EXPECT_EQ(0u, client.pending_count());

   transport.respond(0, make_response(200, "{}"));
   EXPECT_TRUE(responses.empty());
}

TEST_F(HttpClientTest, RequestCarriesMethodBodyAndTimeout) {
   client.set_timeout(7);
   EXPECT_EQ(7, transport.timeout());

   http_headers_t headers;
   headers.push_back(std::make_pair("x-api-key", "0987654321"));
   client.post("https://10.0.0.5:8080/v1/FireTV/text", "{\"text\":\"a\"}", headers, record());

   const http_request_t &request = transport.last();
   EXPECT_EQ("POST", request.method);
   EXPECT_EQ("{\"text\":\"a\"}", request.body);
   EXPECT_EQ(7, request.timeout_sec);
   EXPECT_TRUE(request.allow_self_signed);
   EXPECT_EQ("0987654321", header_value(request, "x-api-key"));
}

TEST_F(HttpClientTest, CallbackMayIssueFollowUpRequest) {
   client.get("https://10.0.0.5:8080/first", http_headers_t(),
              [this](const http_response_t &) {
                 client.get("https://10.0.0.5:8080/second", http_headers_t(), record());
              });

   transport.respond(0, make_response(200, "{}"));
   ASSERT_EQ(2u, transport.requests.size());
   EXPECT_EQ(1u, client.pending_count());

   transport.respond(1, make_response(404, ""));
   ASSERT_EQ(1u, responses.size());
   EXPECT_EQ(404, responses[0].status_code);
}

TEST(HttpResponseTest, OkRequiresTwoHundredClassWithoutTransportError) {
   EXPECT_TRUE(http_response_ok(make_response(200, "")));
   EXPECT_TRUE(http_response_ok(make_response(204, "")));
   EXPECT_FALSE(http_response_ok(make_response(301, "")));
   EXPECT_FALSE(http_response_ok(make_response(401, "")));
   EXPECT_FALSE(http_response_ok(make_transport_error("Connection refused")));

   EXPECT_EQ("HTTP 500", http_response_error(make_response(500, "")));
   EXPECT_EQ("Connection refused", http_response_error(make_transport_error("Connection refused")));
}

static std::vector<std::string> captured_log;

static void capture_log_callback(ftv_log_level_t level,
                                 const char *file,
                                 int line,
                                 const char *func,
                                 const char *fmt,
                                 va_list args) {
   (void)level;
   (void)file;
   (void)line;
   (void)func;
   char message[1024];
   vsnprintf(message, sizeof(message), fmt, args);
   captured_log.push_back(message);
}

TEST_F(HttpClientTest, DebugLogOmitsSecrets) {
   bool debug = ftv_log_debug_enabled();
   captured_log.clear();
   ftv_set_logger(capture_log_callback);
   ftv_log_set_debug(true);

   http_headers_t headers;
   headers.push_back(std::make_pair("x-client-token", "tok-secret"));
   client.post("https://10.0.0.5:8080/v1/FireTV/pin/verify", "{\"pin\":\"4821\"}", headers,
               record());

   ftv_set_logger(NULL);
   ftv_log_set_debug(debug);

   ASSERT_FALSE(captured_log.empty());
   bool size_logged = false;
   for (size_t i = 0; i < captured_log.size(); i++) {
      EXPECT_EQ(std::string::npos, captured_log[i].find("4821")) << captured_log[i];
      EXPECT_EQ(std::string::npos, captured_log[i].find("tok-secret")) << captured_log[i];
      if (captured_log[i].find("14 bytes") != std::string::npos) {
         size_logged = true;
      }
   }
   EXPECT_TRUE(size_logged);
   EXPECT_EQ("{\"pin\":\"4821\"}", transport.last().body);
}
