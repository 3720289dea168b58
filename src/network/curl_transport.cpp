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

#include "network/curl_transport.h"

#include <string.h>

#include <utility>
#include <vector>

#include "logging_common.h"

CurlHttpTransport::CurlHttpTransport()
    : multi_(curl_multi_init()), next_ticket_(1),
      timeout_sec_(CURL_TRANSPORT_DEFAULT_TIMEOUT_SEC) {
   if (!multi_) {
      FTV_LOG_ERROR("Failed to create CURL multi handle");
   }
}

CurlHttpTransport::~CurlHttpTransport() {
   abort_all();
   if (multi_) {
      curl_multi_cleanup(multi_);
   }
}

void CurlHttpTransport::set_completion_handler(http_completion_handler_t handler) {
   handler_ = std::move(handler);
}

void CurlHttpTransport::set_timeout(int timeout_sec) {
   if (timeout_sec > 0) {
      timeout_sec_ = timeout_sec;
   }
}

void CurlHttpTransport::release(Transfer *transfer) {
   if (multi_) {
      curl_multi_remove_handle(multi_, transfer->easy);
   }
   curl_easy_cleanup(transfer->easy);
   if (transfer->headers) {
      curl_slist_free_all(transfer->headers);
   }
   curl_buffer_free(&transfer->buffer);
}

uint64_t CurlHttpTransport::submit(const http_request_t &request) {
   if (!multi_) {
      return 0;
   }

   CURL *easy = curl_easy_init();
   if (!easy) {
      FTV_LOG_ERROR("Failed to create CURL handle for %s", request.url.c_str());
      return 0;
   }

   std::unique_ptr<Transfer> transfer(new Transfer());
   transfer->ticket = next_ticket_++;
   transfer->easy = easy;
   transfer->headers = curl_header_list(request.headers);
   transfer->body = request.body;
   curl_buffer_init(&transfer->buffer);
   transfer->error[0] = '\0';

   long timeout = request.timeout_sec > 0 ? request.timeout_sec : timeout_sec_;

   curl_easy_setopt(easy, CURLOPT_URL, request.url.c_str());
   curl_easy_setopt(easy, CURLOPT_NOSIGNAL, 1L);
   curl_easy_setopt(easy, CURLOPT_TIMEOUT, timeout);
   curl_easy_setopt(easy, CURLOPT_CONNECTTIMEOUT, timeout);
   curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, curl_buffer_write_callback);
   curl_easy_setopt(easy, CURLOPT_WRITEDATA, &transfer->buffer);
   curl_easy_setopt(easy, CURLOPT_ERRORBUFFER, transfer->error);
   curl_easy_setopt(easy, CURLOPT_PRIVATE, transfer.get());
   if (transfer->headers) {
      curl_easy_setopt(easy, CURLOPT_HTTPHEADER, transfer->headers);
   }
   if (request.allow_self_signed) {
      curl_easy_setopt(easy, CURLOPT_SSL_VERIFYPEER, 0L);
      curl_easy_setopt(easy, CURLOPT_SSL_VERIFYHOST, 0L);
   }
   if (request.method == "POST") {
      curl_easy_setopt(easy, CURLOPT_POST, 1L);
      curl_easy_setopt(easy, CURLOPT_POSTFIELDS, transfer->body.c_str());
      curl_easy_setopt(easy, CURLOPT_POSTFIELDSIZE, (long)transfer->body.size());
   } else if (request.method != "GET") {
      curl_easy_setopt(easy, CURLOPT_CUSTOMREQUEST, request.method.c_str());
   }

   CURLMcode mc = curl_multi_add_handle(multi_, easy);
   if (mc != CURLM_OK) {
      FTV_LOG_ERROR("curl_multi_add_handle failed: %s", curl_multi_strerror(mc));
      curl_easy_cleanup(easy);
      if (transfer->headers) {
         curl_slist_free_all(transfer->headers);
      }
      return 0;
   }

   uint64_t ticket = transfer->ticket;
   transfers_[easy] = std::move(transfer);
   return ticket;
}

bool CurlHttpTransport::pump() {
   if (!multi_ || transfers_.empty()) {
      return false;
   }

   int running = 0;
   CURLMcode mc = curl_multi_perform(multi_, &running);
   if (mc != CURLM_OK) {
      FTV_LOG_ERROR("curl_multi_perform failed: %s", curl_multi_strerror(mc));
   }

   /* Collect first: completion handlers may submit new transfers */
   std::vector<std::pair<uint64_t, http_response_t>> done;
   CURLMsg *msg;
   int queued = 0;
   while ((msg = curl_multi_info_read(multi_, &queued)) != NULL) {
      if (msg->msg != CURLMSG_DONE) {
         continue;
      }
      CURL *easy = msg->easy_handle;
      CURLcode result = msg->data.result;

      auto it = transfers_.find(easy);
      if (it == transfers_.end()) {
         curl_multi_remove_handle(multi_, easy);
         curl_easy_cleanup(easy);
         continue;
      }
      Transfer *transfer = it->second.get();

      http_response_t response;
      response.status_code = 0;
      curl_easy_getinfo(easy, CURLINFO_RESPONSE_CODE, &response.status_code);
      if (result != CURLE_OK) {
         response.transport_error =
             transfer->error[0] ? transfer->error : curl_easy_strerror(result);
         FTV_LOG_WARNING("HTTP transfer %llu failed: %s", (unsigned long long)transfer->ticket,
                         response.transport_error.c_str());
      }
      response.body = curl_buffer_str(&transfer->buffer);

      done.push_back(std::make_pair(transfer->ticket, std::move(response)));
      release(transfer);
      transfers_.erase(it);
   }

   for (const auto &item : done) {
      if (handler_) {
         handler_(item.first, item.second);
      }
   }

   return !transfers_.empty();
}

void CurlHttpTransport::abort_all() {
   for (auto &entry : transfers_) {
      release(entry.second.get());
   }
   transfers_.clear();
}
