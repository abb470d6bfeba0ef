/** Credentials [ContactSync]
 *
 * Google OAuth client and token pair, stored as google_creds.json.
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

#ifndef Credentials_hpp
#define Credentials_hpp

#include <string>
#include "nlohmann/json.hpp"

class Credentials {
    nlohmann::json _data;

    std::string stringForKey(const char * key);
    void setStringForKey(const char * key, std::string value);

public:
    Credentials(std::string clientId, std::string clientSecret);
    explicit Credentials(nlohmann::json json);

    std::string clientId();
    std::string clientSecret();
    std::string refreshToken();
    void setRefreshToken(std::string token);
    std::string accessToken();
    void setAccessToken(std::string token);
    std::string email();
    void setEmail(std::string email);

    // Takes the access token, and the refresh token when one was issued,
    // from an OAuth token endpoint response.
    void applyTokenResponse(const nlohmann::json & resp);

    // Names of required fields that are missing, or "" if none are.
    std::string valid();

    nlohmann::json toJSON();
};

#endif /* Credentials_hpp */
