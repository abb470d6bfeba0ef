/** ContactFormatter [ContactSync]
 *
 * Renders contacts for the command line.
 */

/* LICENSE
* Copyright (C) 2017-2021 Foundry 376.
*
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
* along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef ContactFormatter_hpp
#define ContactFormatter_hpp

#include <memory>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "contactsync/models/contact.hpp"

class ContactFormatter {
public:
    // Multi-line, human readable detail view.
    static std::string formatCard(std::shared_ptr<Contact> contact);

    // One row per contact: UID, NAME, EMAIL, PHONE.
    static std::string formatTable(std::vector<std::shared_ptr<Contact>> contacts);

    static nlohmann::json toJSON(std::shared_ptr<Contact> contact);
    static nlohmann::json toJSON(std::vector<std::shared_ptr<Contact>> contacts);

    static std::string formatVCF(std::vector<std::shared_ptr<Contact>> contacts);

    // "19900615" => "Jun 15, 1990", "--0615" => "Jun 15". Anything else is returned as-is.
    static std::string formatDisplayDate(std::string value);
    // Street, City, Region, PostalCode, Country joined with ", ".
    static std::string formatAddress(std::string adr);
};

#endif /* ContactFormatter_hpp */
