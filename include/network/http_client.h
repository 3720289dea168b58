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
 * HTTP Client - Ticket-based request tracking on top of a transport
 *
 * A transport accepts a request and hands back an opaque ticket. The
 * response arrives later through the completion handler, keyed by that
 * ticket. HttpClient keeps the table of pending tickets and routes each
 * completion to the callback of the request that produced it.
 *
 * Transports may also complete synchronously, from inside submit(), before
 * the ticket has been returned. Such early completions are held until the
 * ticket is known and then delivered, so callers see the same behaviour
 * with either style.
 */

#ifndef HTTP_CLIENT_H
#define HTTP_CLIENT_H

#include <stdint.h>

#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

/* =============================================================================
 * Request / Response Types
 * ============================================================================= */

typedef std::vector<std::pair<std::string, std::string>> http_headers_t;

typedef struct {
   std::string method; /* "GET" or "POST" */
   std::string url;
   http_headers_t headers;
   std::string body;
   int timeout_sec;        /* 0 = transport default */
   bool allow_self_signed; /* Skip TLS peer/host verification */
} http_request_t;

typedef struct {
   long status_code;            /* 0 when no HTTP response was received */
   std::string body;
   std::string transport_error; /* Empty when the exchange completed */
} http_response_t;

/**
 * @brief True when the exchange completed with a 2xx status
 */
bool http_response_ok(const http_response_t &response);

/**
 * @brief Printable error for a failed response ("HTTP 500", transport text)
 */
std::string http_response_error(const http_response_t &response);

typedef std::function<void(const http_response_t &response)> http_callback_t;
typedef std::function<void(uint64_t ticket, const http_response_t &response)>
    http_completion_handler_t;

/* =============================================================================
 * Transport Interface
 * ============================================================================= */

class HttpTransport {
 public:
   virtual ~HttpTransport() {}

   /**
    * @brief Start a request
    *
    * @param request Request to send
    * @return Ticket identifying the request, or 0 if it could not be sent
    */
   virtual uint64_t submit(const http_request_t &request) = 0;

   /** @brief Register the handler receiving (ticket, response) completions */
   virtual void set_completion_handler(http_completion_handler_t handler) = 0;

   /** @brief Default timeout applied to requests without their own */
   virtual void set_timeout(int timeout_sec) = 0;
};

/* =============================================================================
 * Client
 * ============================================================================= */

class HttpClient {
 public:
   explicit HttpClient(HttpTransport &transport);
   ~HttpClient();

   void get(const std::string &url, const http_headers_t &headers, http_callback_t callback);

   void post(const std::string &url,
             const std::string &body,
             const http_headers_t &headers,
             http_callback_t callback);

   /**
    * @brief Route a transport completion to its pending request
    *
    * Unmatched tickets are logged and dropped.
    */
   void handle_received(uint64_t ticket, const http_response_t &response);

   /** @brief Number of requests awaiting completion */
   size_t pending_count() const;

   /** @brief Apply a default timeout to the underlying transport */
   void set_timeout(int timeout_sec);

   /**
    * @brief Drop every pending request without invoking its callback
    */
   void abandon_all();

 private:
   struct PendingRequest {
      http_callback_t callback;
      std::string url;
      std::string method;
   };

   void send(http_request_t request, http_callback_t callback);

   HttpTransport &transport_;
   std::map<uint64_t, PendingRequest> pending_;
   std::map<uint64_t, http_response_t> early_;
   int timeout_sec_;
   bool submitting_;

   HttpClient(const HttpClient &);
   HttpClient &operator=(const HttpClient &);
};

#endif /* HTTP_CLIENT_H */
