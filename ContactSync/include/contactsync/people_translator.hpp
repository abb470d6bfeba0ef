/** PeopleTranslator [ContactSync]
 *
 * Maps between Google People API person objects and vCard based
 * Contacts. contactFromPerson keeps everything Google returns, using
 * X-GOOGLE-* properties for fields vCard has no home for.
 * personFromContact only emits the fields updateContact accepts.
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

#ifndef PeopleTranslator_hpp
#define PeopleTranslator_hpp

#include <memory>
#include <string>
#include "nlohmann/json.hpp"
#include "contactsync/models/contact.hpp"

class PeopleTranslator {
public:
    static std::shared_ptr<Contact> contactFromPerson(const nlohmann::json & person);
    static nlohmann::json personFromContact(std::shared_ptr<Contact> contact);

    // {"year": 1990, "month": 6, "day": 15} => "19900615", {"month": 3, "day": 10} => "--0310".
    // Returns "" when the month or day is missing.
    static std::string formatDate(const nlohmann::json & date);

    // Inverse of formatDate. Dashes are ignored, the remaining digits must form
    // a valid YYYYMMDD or MMDD date. Returns null otherwise.
    static nlohmann::json parseDate(std::string value);

    // "X-GOOGLE-CUSTOM-", "Shirt size" => "X-GOOGLE-CUSTOM-SHIRT-SIZE"
    static std::string extensionKey(std::string prefix, std::string userKey);
};

#endif /* PeopleTranslator_hpp */
