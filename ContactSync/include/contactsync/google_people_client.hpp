/** GooglePeopleClient [ContactSync]
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

#ifndef GooglePeopleClient_hpp
#define GooglePeopleClient_hpp

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"

#include "contactsync/constants.hpp"
#include "contactsync/contact_provider.hpp"
#include "contactsync/credential_store.hpp"
#include "contactsync/oauth_token_manager.hpp"

class GooglePeopleClient : public ContactProvider {
    std::shared_ptr<OAuthTokenManager> _tokens;
    std::shared_ptr<CredentialStore> _credentials;
    std::string _apiRoot;
    std::shared_ptr<spdlog::logger> logger;

    std::string authorization();

public:
    GooglePeopleClient(std::shared_ptr<OAuthTokenManager> tokens, std::shared_ptr<CredentialStore> credentials, std::string apiRoot = GOOGLE_PEOPLE_ROOT);

    std::vector<std::shared_ptr<Contact>> fetchContacts() override;
    std::shared_ptr<Contact> upsertContact(std::shared_ptr<Contact> contact) override;
    void deleteContact(const ContactId & id) override;

    // Walks every page of a People API list, handing each page to yieldBlock.
    // The final nextSyncToken is saved to the credential store.
    void paginateGoogleCollection(std::string urlRoot, std::function<void(const nlohmann::json &)> yieldBlock);
};

#endif /* GooglePeopleClient_hpp */
