/** ContactSyncWorker [ContactSync]
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

#ifndef ContactSyncWorker_hpp
#define ContactSyncWorker_hpp

#include <memory>

#include "spdlog/spdlog.h"
#include "contactsync/contact_provider.hpp"
#include "contactsync/contact_store.hpp"

class ContactSyncWorker {
    ContactStore * store;
    std::shared_ptr<ContactProvider> provider;
    std::shared_ptr<spdlog::logger> logger;

public:
    ContactSyncWorker(ContactStore * store, std::shared_ptr<ContactProvider> provider);

    // Pulls every remote contact and overwrites its local file. Contacts that
    // only exist locally are left alone. Returns the number of files written.
    int run();
};

#endif /* ContactSyncWorker_hpp */
