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

#include "network/http_client.h"

#include <strings.h>

#include <utility>

#include "logging_common.h"

/* Header whose value must never reach the log */
#define HTTP_SECRET_HEADER "x-client-token"

bool http_response_ok(const http_response_t &response) {
   return response.transport_error.empty() && response.status_code >= 200 &&
          response.status_code < 300;
}

std::string http_response_error(const http_response_t &response) {
   if (!response.transport_error.empty()) {
      return response.transport_error;
   }
   return "HTTP " + std::to_string(response.status_code);
}

HttpClient::HttpClient(HttpTransport &transport)
    : transport_(transport), timeout_sec_(0), submitting_(false) {
   transport_.set_completion_handler(
       [this](uint64_t ticket, const http_response_t &response) {
          handle_received(ticket, response);
       });
}

HttpClient::~HttpClient() {
   transport_.set_completion_handler(nullptr);
}

void HttpClient::get(const std::string &url,
                     const http_headers_t &headers,
                     http_callback_t callback) {
   http_request_t request;
   request.method = "GET";
   request.url = url;
   request.headers = headers;
   request.timeout_sec = 0;
   request.allow_self_signed = true;
   send(std::move(request), std::move(callback));
}

void HttpClient::post(const std::string &url,
                      const std::string &body,
                      const http_headers_t &headers,
                      http_callback_t callback) {
   http_request_t request;
   request.method = "POST";
   request.url = url;
   request.headers = headers;
   request.body = body;
   request.timeout_sec = 0;
   request.allow_self_signed = true;
   send(std::move(request), std::move(callback));
}

void HttpClient::send(http_request_t request, http_callback_t callback) {
   if (request.timeout_sec == 0) {
      request.timeout_sec = timeout_sec_;
   }

   FTV_LOG_DEBUG("HTTP %s: %s", request.method.c_str(), request.url.c_str());
   /* Bodies carry PINs and typed text: size only */
   if (!request.body.empty()) {
      FTV_LOG_DEBUG("HTTP %s Body: %zu bytes", request.method.c_str(), request.body.size());
   }
   for (const auto &header : request.headers) {
      bool secret = strcasecmp(header.first.c_str(), HTTP_SECRET_HEADER) == 0;
      FTV_LOG_DEBUG("HTTP Header: %s: %s", header.first.c_str(),
                    secret ? "<redacted>" : header.second.c_str());
   }

   submitting_ = true;
   uint64_t ticket = transport_.submit(request);
   submitting_ = false;

   http_response_t early_response;
   bool have_early = false;
   for (auto it = early_.begin(); it != early_.end();) {
      if (ticket != 0 && it->first == ticket) {
         early_response = std::move(it->second);
         have_early = true;
      } else {
         FTV_LOG_WARNING("ReceivedAsync: No matching request for ticket %llu",
                         (unsigned long long)it->first);
      }
      it = early_.erase(it);
   }

   if (ticket == 0) {
      FTV_LOG_ERROR("HTTP %s failed to send: no ticket returned", request.method.c_str());
      http_response_t failure;
      failure.status_code = 0;
      failure.transport_error = "Failed to send request";
      if (callback) {
         callback(failure);
      }
      return;
   }

   if (pending_.find(ticket) != pending_.end()) {
      FTV_LOG_ERROR("HTTP %s ticket %llu already pending, request dropped",
                    request.method.c_str(), (unsigned long long)ticket);
      http_response_t failure;
      failure.status_code = 0;
      failure.transport_error = "Duplicate request ticket";
      if (callback) {
         callback(failure);
      }
      return;
   }

   if (have_early) {
      FTV_LOG_DEBUG("HTTP %s completed synchronously (ticket %llu, code %ld)",
                    request.method.c_str(), (unsigned long long)ticket,
                    early_response.status_code);
      if (callback) {
         callback(early_response);
      }
      return;
   }

   PendingRequest pending;
   pending.callback = std::move(callback);
   pending.url = request.url;
   pending.method = request.method;
   pending_[ticket] = std::move(pending);
   FTV_LOG_DEBUG("HTTP %s queued with ticket: %llu", request.method.c_str(),
                 (unsigned long long)ticket);
}

void HttpClient::handle_received(uint64_t ticket, const http_response_t &response) {
   FTV_LOG_DEBUG("ReceivedAsync: ticket=%llu, code=%ld, error=%s", (unsigned long long)ticket,
                 response.status_code,
                 response.transport_error.empty() ? "none" : response.transport_error.c_str());

   auto it = pending_.find(ticket);
   if (it == pending_.end()) {
      if (submitting_) {
         early_[ticket] = response;
         return;
      }
      FTV_LOG_WARNING("ReceivedAsync: No matching request for ticket %llu",
                      (unsigned long long)ticket);
      return;
   }

   /* Remove before invoking: the callback may issue further requests */
   PendingRequest request = std::move(it->second);
   pending_.erase(it);

   FTV_LOG_DEBUG("HTTP Response: %s %s code=%ld (%zu bytes)", request.method.c_str(),
                 request.url.c_str(), response.status_code, response.body.size());

   if (request.callback) {
      request.callback(response);
   }
}

size_t HttpClient::pending_count() const {
   return pending_.size();
}

void HttpClient::set_timeout(int timeout_sec) {
   timeout_sec_ = timeout_sec;
   transport_.set_timeout(timeout_sec);
}

void HttpClient::abandon_all() {
   if (!pending_.empty()) {
      FTV_LOG_INFO("Abandoning %zu pending HTTP request(s)", pending_.size());
   }
   pending_.clear();
   early_.clear();
}
