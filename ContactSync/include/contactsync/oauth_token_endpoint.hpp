/** OAuthTokenEndpoint [ContactSync]
 *
 * The token endpoint of the OAuth2 provider: turns an authorization code
 * or a refresh token into an access token response such as
 * {"access_token": "...", "refresh_token": "...", "expires_in": 3599}.
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

#ifndef OAuthTokenEndpoint_hpp
#define OAuthTokenEndpoint_hpp

#include <memory>
#include <string>
#include "nlohmann/json.hpp"
#include "contactsync/models/credentials.hpp"

class OAuthTokenEndpoint {
public:
    virtual ~OAuthTokenEndpoint() {}

    virtual nlohmann::json exchangeCode(std::shared_ptr<Credentials> creds, std::string code, std::string codeVerifier, std::string redirectUri) = 0;
    virtual nlohmann::json refresh(std::shared_ptr<Credentials> creds) = 0;
};

class GoogleTokenEndpoint : public OAuthTokenEndpoint {
    std::string _tokenUrl;

public:
    GoogleTokenEndpoint();
    explicit GoogleTokenEndpoint(std::string tokenUrl);

    nlohmann::json exchangeCode(std::shared_ptr<Credentials> creds, std::string code, std::string codeVerifier, std::string redirectUri) override;
    nlohmann::json refresh(std::shared_ptr<Credentials> creds) override;
};

#endif /* OAuthTokenEndpoint_hpp */
