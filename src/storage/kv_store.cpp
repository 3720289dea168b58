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

#include "storage/kv_store.h"

#include <errno.h>
#include <fcntl.h>
#include <json-c/json.h>
#include <stdio.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include "core/path_utils.h"
#include "logging_common.h"

JsonFileStore::JsonFileStore(const std::string &path) : path_(path) {
}

ftv_error_t JsonFileStore::load() {
   values_.clear();

   struct stat st;
   if (stat(path_.c_str(), &st) != 0) {
      if (errno == ENOENT) {
         FTV_LOG_DEBUG("No state file at %s, starting empty", path_.c_str());
         return FTV_OK;
      }
      FTV_LOG_ERROR("Cannot stat state file %s: %s", path_.c_str(), strerror(errno));
      return FTV_ERR_IO;
   }

   json_object *root = json_object_from_file(path_.c_str());
   if (!root) {
      FTV_LOG_ERROR("Failed to parse state file %s: %s", path_.c_str(),
                    json_util_get_last_err());
      return FTV_ERR_IO;
   }
   if (!json_object_is_type(root, json_type_object)) {
      FTV_LOG_ERROR("State file %s is not a JSON object", path_.c_str());
      json_object_put(root);
      return FTV_ERR_IO;
   }

   json_object_object_foreach(root, key, val) {
      if (json_object_is_type(val, json_type_string)) {
         values_[key] = json_object_get_string(val);
      } else {
         FTV_LOG_WARNING("Ignoring non-string state entry '%s'", key);
      }
   }
   json_object_put(root);

   FTV_LOG_DEBUG("Loaded %zu state value(s) from %s", values_.size(), path_.c_str());
   return FTV_OK;
}

bool JsonFileStore::get(const std::string &key, std::string *value) const {
   auto it = values_.find(key);
   if (it == values_.end()) {
      return false;
   }
   if (value) {
      *value = it->second;
   }
   return true;
}

ftv_error_t JsonFileStore::set(const std::string &key, const std::string &value) {
   auto it = values_.find(key);
   if (it != values_.end() && it->second == value) {
      return FTV_OK;
   }
   values_[key] = value;
   return flush();
}

ftv_error_t JsonFileStore::erase(const std::string &key) {
   if (values_.erase(key) == 0) {
      return FTV_OK;
   }
   return flush();
}

ftv_error_t JsonFileStore::flush() {
   if (!path_ensure_parent_dir(path_.c_str())) {
      return FTV_ERR_IO;
   }

   json_object *root = json_object_new_object();
   if (!root) {
      return FTV_ERR_IO;
   }
   for (const auto &entry : values_) {
      json_object_object_add(root, entry.first.c_str(),
                             json_object_new_string(entry.second.c_str()));
   }
   std::string text = json_object_to_json_string_ext(root, JSON_C_TO_STRING_PRETTY);
   json_object_put(root);
   text += "\n";

   /* Write beside the target then rename so readers never see a partial file */
   std::string tmp_path = path_ + ".tmp";
   int fd = open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
   if (fd < 0) {
      FTV_LOG_ERROR("Failed to open %s: %s", tmp_path.c_str(), strerror(errno));
      return FTV_ERR_IO;
   }

   size_t written = 0;
   while (written < text.size()) {
      ssize_t n = write(fd, text.data() + written, text.size() - written);
      if (n < 0) {
         if (errno == EINTR) {
            continue;
         }
         FTV_LOG_ERROR("Failed to write %s: %s", tmp_path.c_str(), strerror(errno));
         close(fd);
         unlink(tmp_path.c_str());
         return FTV_ERR_IO;
      }
      written += (size_t)n;
   }

   if (fsync(fd) != 0) {
      FTV_LOG_WARNING("fsync failed for %s: %s", tmp_path.c_str(), strerror(errno));
   }
   close(fd);

   if (rename(tmp_path.c_str(), path_.c_str()) != 0) {
      FTV_LOG_ERROR("Failed to replace %s: %s", path_.c_str(), strerror(errno));
      unlink(tmp_path.c_str());
      return FTV_ERR_IO;
   }
   return FTV_OK;
}
