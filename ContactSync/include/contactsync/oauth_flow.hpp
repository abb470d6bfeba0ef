/** OAuthFlow [ContactSync]
 *
 * Browser based OAuth2 authorization code flow with PKCE. start() returns
 * the URL to open and begins listening on the loopback redirect URI; the
 * first callback (or cancel(), or a timeout) decides the outcome.
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

#ifndef OAuthFlow_hpp
#define OAuthFlow_hpp

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "httplib.h"
#include "spdlog/spdlog.h"

#include "contactsync/constants.hpp"
#include "contactsync/credential_store.hpp"
#include "contactsync/oauth_token_endpoint.hpp"

enum class AuthorizationState {
    Unauthenticated,
    Pending,
    Authenticated
};

class OAuthFlow {
    std::shared_ptr<CredentialStore> _credentials;
    std::shared_ptr<OAuthTokenEndpoint> _endpoint;
    int _port;
    std::shared_ptr<spdlog::logger> logger;

    std::string _verifier;
    std::string _state;

    std::unique_ptr<httplib::Server> _server;
    std::thread _listener;
    std::atomic<bool> _listenerExited;
    std::mutex _callbackMtx;
    std::mutex _teardownMtx;
    bool _tornDown = false;

    // result slot, first delivery wins
    std::mutex _resultMtx;
    std::condition_variable _resultCV;
    bool _started = false;
    bool _delivered = false;
    bool _succeeded = false;
    std::string _errorKey;
    std::string _errorMessage;

    bool deliver(bool succeeded, std::string key, std::string message);
    bool delivered();
    void teardown();

public:
    OAuthFlow(std::shared_ptr<CredentialStore> credentials, std::shared_ptr<OAuthTokenEndpoint> endpoint, int port = OAUTH_REDIRECT_PORT);
    ~OAuthFlow();

    std::string redirectURI();

    // Generates the PKCE verifier and state, binds the callback listener and
    // returns the authorization URL. Throws if the port cannot be bound.
    std::string start();

    void handleCallback(const httplib::Request & req, httplib::Response & res);

    // Safe to call from any thread. Does not wait for the listener to stop.
    void cancel();

    // Blocks until the flow completes, stops the listener and throws
    // SyncException unless tokens were saved.
    void waitForCompletion(int timeoutSeconds);

    AuthorizationState state();

    static std::string generateCodeVerifier();
    static std::string codeChallengeForVerifier(const std::string & verifier);
    static std::string generateState();
    static std::string authorizationURL(std::string clientId, std::string redirectUri, std::string state, std::string codeChallenge);
};

#endif /* OAuthFlow_hpp */
