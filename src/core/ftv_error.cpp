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

#include "core/ftv_error.h"

const char *ftv_error_str(ftv_error_t err) {
   switch (err) {
      case FTV_OK:
         return "Success";
      case FTV_ERR_NOT_CONFIGURED:
         return "No IP Address";
      case FTV_ERR_NOT_PAIRED:
         return "Not paired with Fire TV";
      case FTV_ERR_INVALID_PARAM:
         return "Invalid parameter";
      case FTV_ERR_BUSY:
         return "Operation already in progress";
      case FTV_ERR_WAKE_FAILED:
         return "Cannot wake device";
      case FTV_ERR_NETWORK:
         return "Network error";
      case FTV_ERR_HTTP_STATUS:
         return "Unexpected HTTP status";
      case FTV_ERR_PROTOCOL:
         return "Unexpected response";
      case FTV_ERR_AUTH_REJECTED:
         return "Pairing rejected by device";
      case FTV_ERR_CANCELLED:
         return "Cancelled";
      case FTV_ERR_IO:
         return "I/O error";
   }
   return "Unknown error";
}
