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
 * CURL HTTP Transport - libcurl multi interface driven by the event loop
 *
 * Each submitted request becomes an easy handle attached to one multi
 * handle. pump() advances every transfer without blocking and delivers
 * finished ones to the completion handler. Register pump() as an
 * EventLoop poller.
 */

#ifndef CURL_TRANSPORT_H
#define CURL_TRANSPORT_H

#include <curl/curl.h>

#include <map>
#include <memory>

#include "network/curl_buffer.h"
#include "network/http_client.h"

#define CURL_TRANSPORT_DEFAULT_TIMEOUT_SEC 10

class CurlHttpTransport : public HttpTransport {
 public:
   CurlHttpTransport();
   ~CurlHttpTransport() override;

   uint64_t submit(const http_request_t &request) override;
   void set_completion_handler(http_completion_handler_t handler) override;
   void set_timeout(int timeout_sec) override;

   /**
    * @brief Advance in-flight transfers and deliver completed ones
    *
    * @return true while transfers remain in flight
    */
   bool pump();

   /** @brief Abort every in-flight transfer without completing it */
   void abort_all();

   size_t active_count() const { return transfers_.size(); }

 private:
   struct Transfer {
      uint64_t ticket;
      CURL *easy;
      struct curl_slist *headers;
      curl_buffer_t buffer;
      std::string body;
      char error[CURL_ERROR_SIZE];
   };

   void release(Transfer *transfer);

   CURLM *multi_;
   std::map<CURL *, std::unique_ptr<Transfer>> transfers_;
   http_completion_handler_t handler_;
   uint64_t next_ticket_;
   int timeout_sec_;

   CurlHttpTransport(const CurlHttpTransport &);
   CurlHttpTransport &operator=(const CurlHttpTransport &);
};

#endif /* CURL_TRANSPORT_H */
