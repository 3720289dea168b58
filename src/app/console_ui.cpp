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

#include "console_ui.h"

ConsoleUi::ConsoleUi(FILE *out) : out_(out) {
}

void ConsoleUi::update_property(const std::string &name, const std::string &value) {
   auto it = properties_.find(name);
   if (it != properties_.end() && it->second == value) {
      return;
   }
   properties_[name] = value;

   /* The PIN field is only ever cleared by the engine */
   if (name == UI_PROP_PIN_CODE) {
      return;
   }
   fprintf(out_, "%s: %s\n", name.c_str(), value.c_str());
   fflush(out_);
}

void ConsoleUi::update_property_list(const std::string &name,
                                     const std::vector<std::string> &items) {
   fprintf(out_, "%s:\n", name.c_str());
   for (size_t i = 0; i < items.size(); i++) {
      if (items[i] == UI_DEVICE_LIST_PLACEHOLDER) {
         continue;
      }
      fprintf(out_, "  %s\n", items[i].c_str());
   }
   fflush(out_);
}

void ConsoleUi::fire_event(const std::string &name) {
   fprintf(out_, "* %s\n", name.c_str());
   fflush(out_);
}

std::string ConsoleUi::property(const std::string &name) const {
   auto it = properties_.find(name);
   return it != properties_.end() ? it->second : std::string();
}
