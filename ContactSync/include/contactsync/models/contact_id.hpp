/** ContactId [ContactSync]
 *
 * Identifier of a contact tagged with where it came from: assigned by
 * Google (the trailing segment of a People API resource name) or
 * generated locally for a contact Google has not seen yet.
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

#ifndef ContactId_hpp
#define ContactId_hpp

#include <string>

enum class ContactOrigin {
    Local,
    Provider
};

class ContactId {
    ContactOrigin _origin;
    std::string _value;

    ContactId(ContactOrigin origin, std::string value);

public:
    static ContactId local(std::string value);
    static ContactId provider(std::string value);

    ContactOrigin origin() const;
    bool isProvider() const;
    const std::string & value() const;
    bool empty() const;

    // "people/c123" for provider identifiers, "" for local ones.
    std::string resourceName() const;

    bool operator==(const ContactId & other) const;
    bool operator!=(const ContactId & other) const;
};

#endif /* ContactId_hpp */
