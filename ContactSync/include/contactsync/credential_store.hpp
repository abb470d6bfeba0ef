/** CredentialStore [ContactSync]
 *
 * Owns google_creds.json and google_sync_token.txt in the config
 * directory. Both are written owner read/write only.
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

#ifndef CredentialStore_hpp
#define CredentialStore_hpp

#include <memory>
#include <mutex>
#include <string>

#include "spdlog/spdlog.h"
#include "contactsync/models/credentials.hpp"

class CredentialStore {
    std::string _dir;
    std::mutex _fileLock;
    std::shared_ptr<spdlog::logger> logger;

public:
    explicit CredentialStore(std::string configDir);

    std::string credentialsPath();
    std::string syncTokenPath();

    // nullptr if no credentials have been saved yet.
    std::shared_ptr<Credentials> load();
    void save(std::shared_ptr<Credentials> creds);

    std::string loadSyncToken();
    void saveSyncToken(std::string token);
};

#endif /* CredentialStore_hpp */
