/** ContactProvider [ContactSync]
 *
 * The remote side of the address book. The store pushes writes and
 * deletes through it and the sync worker pulls from it.
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

#ifndef ContactProvider_hpp
#define ContactProvider_hpp

#include <memory>
#include <vector>

#include "contactsync/models/contact.hpp"
#include "contactsync/models/contact_id.hpp"

class ContactProvider {
public:
    virtual ~ContactProvider() {}

    virtual std::vector<std::shared_ptr<Contact>> fetchContacts() = 0;

    // Creates or updates the contact remotely. Returns the provider's copy
    // of the contact when it sends one back, nullptr otherwise.
    virtual std::shared_ptr<Contact> upsertContact(std::shared_ptr<Contact> contact) = 0;

    virtual void deleteContact(const ContactId & id) = 0;
};

#endif /* ContactProvider_hpp */
