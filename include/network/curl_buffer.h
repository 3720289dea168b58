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
 * CURL buffer and header helpers for the device HTTP transport
 */

#ifndef CURL_BUFFER_H
#define CURL_BUFFER_H

#include <curl/curl.h>
#include <stddef.h>
#include <stdlib.h>
#include <string.h>

#include <string>

#include "network/http_client.h"

// Buffer capacity constants. Device replies are small JSON documents.
#define CURL_BUFFER_INITIAL_CAPACITY 1024
#define CURL_BUFFER_MAX_CAPACITY 65536

/**
 * Buffer accumulating one transfer's response body
 * Initialize with curl_buffer_init()
 */
typedef struct {
   char *data;       // Response data (null-terminated)
   size_t size;      // Current size of data (excluding null terminator)
   size_t capacity;  // Allocated capacity
} curl_buffer_t;

/**
 * CURL write callback with doubling growth
 *
 * A body larger than CURL_BUFFER_MAX_CAPACITY aborts the transfer, which
 * curl reports as CURLE_WRITE_ERROR.
 *
 * @param contents Data received from CURL
 * @param size Size of each element
 * @param nmemb Number of elements
 * @param userp Pointer to curl_buffer_t
 * @return Number of bytes handled, or 0 on error
 */
static inline size_t curl_buffer_write_callback(void *contents,
                                                size_t size,
                                                size_t nmemb,
                                                void *userp) {
   size_t total_size = size * nmemb;
   curl_buffer_t *buf = (curl_buffer_t *)userp;

   size_t required = buf->size + total_size + 1;
   if (required > CURL_BUFFER_MAX_CAPACITY) {
      return 0;
   }
   if (required > buf->capacity) {
      size_t new_capacity = buf->capacity ? buf->capacity : CURL_BUFFER_INITIAL_CAPACITY;
      while (new_capacity < required) {
         new_capacity *= 2;
      }
      if (new_capacity > CURL_BUFFER_MAX_CAPACITY) {
         new_capacity = CURL_BUFFER_MAX_CAPACITY;
      }

      char *new_data = (char *)realloc(buf->data, new_capacity);
      if (!new_data) {
         return 0;  // Signal error to CURL
      }
      buf->data = new_data;
      buf->capacity = new_capacity;
   }

   memcpy(&(buf->data[buf->size]), contents, total_size);
   buf->size += total_size;
   buf->data[buf->size] = '\0';

   return total_size;
}

static inline void curl_buffer_init(curl_buffer_t *buf) {
   buf->data = NULL;
   buf->size = 0;
   buf->capacity = 0;
}

static inline void curl_buffer_free(curl_buffer_t *buf) {
   if (buf->data) {
      free(buf->data);
      buf->data = NULL;
   }
   buf->size = 0;
   buf->capacity = 0;
}

/**
 * Copy the accumulated body into a string
 */
static inline std::string curl_buffer_str(const curl_buffer_t *buf) {
   return buf->data ? std::string(buf->data, buf->size) : std::string();
}

/**
 * Build a curl header list from request headers
 *
 * @param headers Name/value pairs
 * @return List to pass as CURLOPT_HTTPHEADER (free with curl_slist_free_all),
 *         or NULL if empty or allocation failed
 */
static inline struct curl_slist *curl_header_list(const http_headers_t &headers) {
   struct curl_slist *list = NULL;
   for (const auto &header : headers) {
      std::string line = header.first + ": " + header.second;
      struct curl_slist *next = curl_slist_append(list, line.c_str());
      if (!next) {
         curl_slist_free_all(list);
         return NULL;
      }
      list = next;
   }
   return list;
}

#endif  // CURL_BUFFER_H
