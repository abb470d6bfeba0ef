/** OAuthTokenManager [ContactSync]
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

#ifndef OAuthTokenManager_hpp
#define OAuthTokenManager_hpp

#include <memory>
#include <mutex>
#include <string>
#include <time.h>

#include "spdlog/spdlog.h"
#include "contactsync/credential_store.hpp"
#include "contactsync/oauth_token_endpoint.hpp"

struct OAuthTokenParts {
    std::string accessToken;
    time_t expiryDate;
};

class OAuthTokenManager {
    std::shared_ptr<CredentialStore> _credentials;
    std::shared_ptr<OAuthTokenEndpoint> _endpoint;
    std::shared_ptr<spdlog::logger> logger;

    bool _cached = false;
    OAuthTokenParts _cache;
    std::mutex _cacheLock;

public:
    OAuthTokenManager(std::shared_ptr<CredentialStore> credentials, std::shared_ptr<OAuthTokenEndpoint> endpoint);

    // Refreshes using the stored refresh token unless the last access token
    // is good for at least another minute. Refreshed tokens are persisted.
    std::string accessToken();
    void invalidate();
};

#endif /* OAuthTokenManager_hpp */
