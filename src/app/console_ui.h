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
 * Console UI - Prints engine status properties and events for the CLI
 */

#ifndef CONSOLE_UI_H
#define CONSOLE_UI_H

#include <stdio.h>

#include <map>
#include <string>
#include <vector>

#include "ui/host_ui.h"

class ConsoleUi : public HostUi {
 public:
   explicit ConsoleUi(FILE *out);

   void update_property(const std::string &name, const std::string &value) override;
   void update_property_list(const std::string &name,
                             const std::vector<std::string> &items) override;
   void fire_event(const std::string &name) override;

   /** @brief Last value published for a property, empty if never set */
   std::string property(const std::string &name) const;

 private:
   FILE *out_;
   std::map<std::string, std::string> properties_;
};

#endif /* CONSOLE_UI_H */
