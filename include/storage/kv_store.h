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
 * Key/Value Store - Durable named values surviving restarts
 *
 * Holds the target address, the pairing token and the discovered device
 * cache. JsonFileStore keeps one flat JSON object on disk and rewrites it
 * after every mutation.
 */

#ifndef KV_STORE_H
#define KV_STORE_H

#include <map>
#include <string>

#include "core/ftv_error.h"

#define STORE_KEY_HOST "host"
#define STORE_KEY_CLIENT_TOKEN "client_token"
#define STORE_KEY_DISCOVERED_DEVICES "discovered_devices"

class KeyValueStore {
 public:
   virtual ~KeyValueStore() {}

   /**
    * @brief Read a value
    *
    * @return true if the key exists
    */
   virtual bool get(const std::string &key, std::string *value) const = 0;

   virtual ftv_error_t set(const std::string &key, const std::string &value) = 0;

   /** @brief Remove a key (succeeds if absent) */
   virtual ftv_error_t erase(const std::string &key) = 0;
};

class JsonFileStore : public KeyValueStore {
 public:
   explicit JsonFileStore(const std::string &path);

   /**
    * @brief Load values from disk
    *
    * A missing file is not an error: the store starts empty.
    *
    * @return FTV_OK, or FTV_ERR_IO if the file exists but cannot be parsed
    */
   ftv_error_t load();

   bool get(const std::string &key, std::string *value) const override;
   ftv_error_t set(const std::string &key, const std::string &value) override;
   ftv_error_t erase(const std::string &key) override;

   const std::string &path() const { return path_; }

 private:
   ftv_error_t flush();

   std::string path_;
   std::map<std::string, std::string> values_;
};

#endif /* KV_STORE_H */
