/** ContactStore [ContactSync]
 *
 * Author(s): Ben Gotow
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

#ifndef ContactStore_hpp
#define ContactStore_hpp

#include <memory>
#include <string>
#include <vector>

#include "spdlog/spdlog.h"
#include "contactsync/contact_provider.hpp"
#include "contactsync/models/contact.hpp"

/*
 Contacts live one per file in <config>/people/<uid>.vcf. When a provider is
 attached, save() and remove() are mirrored to it. Writes go to disk before
 they are pushed, deletes go to the provider before the file is removed.
 */
class ContactStore {
    std::string _dir;
    std::shared_ptr<ContactProvider> _provider;
    std::shared_ptr<spdlog::logger> logger;

    std::string pathForId(const std::string & uid);
    void writeContact(std::shared_ptr<Contact> contact);

public:
    ContactStore(std::string configDir, std::shared_ptr<ContactProvider> provider = nullptr);

    std::string directory();
    std::shared_ptr<ContactProvider> provider();

    // Throws invalid-input if uid could not be used as a file name.
    static void validateId(const std::string & uid);

    // nullptr if no file exists for the uid.
    std::shared_ptr<Contact> find(std::string uid);
    std::vector<std::shared_ptr<Contact>> findAll();

    // Looks up by uid first, then by case-insensitive full name.
    std::shared_ptr<Contact> resolve(std::string query);

    void save(std::shared_ptr<Contact> contact);
    void saveSynced(std::shared_ptr<Contact> contact);

    void remove(const ContactId & id);
    void remove(std::string uid);
};

#endif /* ContactStore_hpp */
