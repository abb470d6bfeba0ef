#include "contactsync/oauth_flow.hpp"
#include "contactsync/contact_utils.hpp"
#include "contactsync/network_request_utils.hpp"
#include "contactsync/sync_exception.hpp"
#include "contactsync/thread_utils.hpp"

#include <chrono>

static const char * SUCCESS_PAGE =
    "<!DOCTYPE html><html><head><title>ContactSync</title></head>"
    "<body><h1>Authorization complete</h1>"
    "<p>You can close this window and return to the terminal.</p></body></html>";

OAuthFlow::OAuthFlow(std::shared_ptr<CredentialStore> credentials, std::shared_ptr<OAuthTokenEndpoint> endpoint, int port) :
    _credentials(credentials),
    _endpoint(endpoint),
    _port(port),
    logger(spdlog::get("logger")),
    _listenerExited(false)
{
}

OAuthFlow::~OAuthFlow() {
    cancel();
    teardown();
}

std::string OAuthFlow::generateCodeVerifier() {
    return ContactUtils::toBase64URL(ContactUtils::randomBytes(32));
}

std::string OAuthFlow::codeChallengeForVerifier(const std::string & verifier) {
    return ContactUtils::toBase64URL(ContactUtils::sha256(verifier));
}

std::string OAuthFlow::generateState() {
    return ContactUtils::toBase64URL(ContactUtils::randomBytes(16));
}

std::string OAuthFlow::authorizationURL(std::string clientId, std::string redirectUri, std::string state, std::string codeChallenge) {
    return GOOGLE_AUTH_URL +
        "?client_id=" + EscapeURLComponent(clientId) +
        "&redirect_uri=" + EscapeURLComponent(redirectUri) +
        "&response_type=code" +
        "&scope=" + EscapeURLComponent(GOOGLE_OAUTH_SCOPES) +
        "&state=" + EscapeURLComponent(state) +
        "&access_type=offline" +
        "&prompt=consent" +
        "&code_challenge=" + EscapeURLComponent(codeChallenge) +
        "&code_challenge_method=S256";
}

std::string OAuthFlow::redirectURI() {
    return "http://" + OAUTH_CALLBACK_HOST + ":" + std::to_string(_port) + OAUTH_CALLBACK_PATH;
}

std::string OAuthFlow::start() {
    {
        std::lock_guard<std::mutex> lck(_resultMtx);
        if (_started) {
            throw SyncException(SYNC_KEY_INVALID_INPUT, "Authorization has already been started.", false);
        }
    }

    auto creds = _credentials->load();
    if (creds == nullptr || creds->clientId() == "" || creds->clientSecret() == "") {
        throw SyncException(SYNC_KEY_MISSING_CREDENTIALS, "A client id and client secret are required to authorize.", false);
    }

    _verifier = generateCodeVerifier();
    _state = generateState();

    _server = std::unique_ptr<httplib::Server>(new httplib::Server());
    _server->Get(OAUTH_CALLBACK_PATH, [this](const httplib::Request & req, httplib::Response & res) {
        handleCallback(req, res);
    });
    if (!_server->bind_to_port(OAUTH_LISTEN_ADDRESS.c_str(), _port)) {
        _server = nullptr;
        throw SyncException(SYNC_KEY_LISTENER_FAILED, "Could not listen on " + OAUTH_LISTEN_ADDRESS + ":" + std::to_string(_port) + ". Is another process using the port?", false);
    }

    {
        std::lock_guard<std::mutex> lck(_resultMtx);
        _started = true;
    }

    _listener = std::thread([this]() {
        SetThreadName("oauth-listener");
        bool ok = _server->listen_after_bind();
        _listenerExited = true;
        if (!ok && deliver(false, SYNC_KEY_LISTENER_FAILED, "the callback listener stopped unexpectedly")) {
            logger->error("OAuth callback listener exited before authorization completed");
        }
    });

    // stop() is a no-op until the server is running, so make sure teardown
    // can't race the listener thread's startup.
    while (!_server->is_running() && !_listenerExited) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    logger->info("Waiting for OAuth callback on {}", redirectURI());
    return authorizationURL(creds->clientId(), redirectURI(), _state, codeChallengeForVerifier(_verifier));
}

void OAuthFlow::handleCallback(const httplib::Request & req, httplib::Response & res) {
    // httplib serves requests from a pool, only one callback may be in flight
    std::lock_guard<std::mutex> callbackLock(_callbackMtx);

    if (delivered()) {
        res.status = 409;
        res.set_content("Authorization has already completed.", "text/plain");
        return;
    }

    if (req.has_param("error")) {
        std::string error = req.get_param_value("error");
        std::string description = req.get_param_value("error_description");
        res.status = 400;
        res.set_content("Authorization failed", "text/plain");
        deliver(false, SYNC_KEY_AUTHORIZATION_FAILED, "authorization failed: " + error + " - " + description);
        return;
    }

    if (req.get_param_value("state") != _state) {
        logger->warn("OAuth callback state did not match the issued state");
        res.status = 400;
        res.set_content("Invalid state parameter", "text/plain");
        deliver(false, SYNC_KEY_STATE_MISMATCH, "state mismatch: possible CSRF attack");
        return;
    }

    std::string code = req.get_param_value("code");
    if (code == "") {
        res.status = 400;
        res.set_content("No authorization code in callback", "text/plain");
        deliver(false, SYNC_KEY_AUTHORIZATION_FAILED, "no authorization code in callback");
        return;
    }

    try {
        auto creds = _credentials->load();
        if (creds == nullptr) {
            throw SyncException(SYNC_KEY_MISSING_CREDENTIALS, "Credentials were removed during authorization.", false);
        }
        nlohmann::json resp = _endpoint->exchangeCode(creds, code, _verifier, redirectURI());

        // reload in case the file changed while we waited on the exchange
        auto latest = _credentials->load();
        if (latest == nullptr) {
            latest = creds;
        }
        latest->applyTokenResponse(resp);
        _credentials->save(latest);
    } catch (SyncException & ex) {
        logger->error("OAuth code exchange failed: {}", ex.what());
        res.status = 500;
        res.set_content("Token exchange failed", "text/plain");
        deliver(false, ex.key, ex.debuginfo);
        return;
    } catch (std::exception & ex) {
        logger->error("OAuth token response could not be stored: {}", ex.what());
        res.status = 500;
        res.set_content("Token exchange failed", "text/plain");
        deliver(false, SYNC_KEY_AUTHORIZATION_FAILED, ex.what());
        return;
    }

    res.status = 200;
    res.set_content(SUCCESS_PAGE, "text/html");
    deliver(true, "", "");
    logger->info("OAuth authorization complete");
}

bool OAuthFlow::deliver(bool succeeded, std::string key, std::string message) {
    std::lock_guard<std::mutex> lck(_resultMtx);
    if (_delivered) {
        return false;
    }
    _delivered = true;
    _succeeded = succeeded;
    _errorKey = key;
    _errorMessage = message;
    _resultCV.notify_all();
    return true;
}

bool OAuthFlow::delivered() {
    std::lock_guard<std::mutex> lck(_resultMtx);
    return _delivered;
}

void OAuthFlow::cancel() {
    deliver(false, SYNC_KEY_CANCELLED, "authorization was cancelled");
}

void OAuthFlow::teardown() {
    std::lock_guard<std::mutex> lck(_teardownMtx);
    if (_tornDown) {
        return;
    }
    _tornDown = true;

    bool succeeded = false;
    {
        std::lock_guard<std::mutex> resultLock(_resultMtx);
        succeeded = _succeeded;
    }
    if (!_server) {
        return;
    }
    if (succeeded) {
        // let the success page reach the browser before the socket closes
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    _server->stop();
    if (_listener.joinable()) {
        _listener.join();
    }
}

void OAuthFlow::waitForCompletion(int timeoutSeconds) {
    {
        std::unique_lock<std::mutex> lck(_resultMtx);
        if (!_started && !_delivered) {
            throw SyncException(SYNC_KEY_INVALID_INPUT, "Authorization has not been started.", false);
        }
        _resultCV.wait_for(lck, std::chrono::seconds(timeoutSeconds), [&] { return _delivered; });
    }
    deliver(false, SYNC_KEY_CANCELLED, "timed out waiting for authorization");
    teardown();

    std::lock_guard<std::mutex> lck(_resultMtx);
    if (!_succeeded) {
        throw SyncException(_errorKey, _errorMessage, false);
    }
}

AuthorizationState OAuthFlow::state() {
    {
        std::lock_guard<std::mutex> lck(_resultMtx);
        if (_started && !_delivered) {
            return AuthorizationState::Pending;
        }
    }
    auto creds = _credentials->load();
    if (creds && creds->refreshToken() != "") {
        return AuthorizationState::Authenticated;
    }
    return AuthorizationState::Unauthenticated;
}
