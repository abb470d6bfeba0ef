#include "contactsync/oauth_token_manager.hpp"
#include "contactsync/sync_exception.hpp"

OAuthTokenManager::OAuthTokenManager(std::shared_ptr<CredentialStore> credentials, std::shared_ptr<OAuthTokenEndpoint> endpoint) :
    _credentials(credentials),
    _endpoint(endpoint),
    logger(spdlog::get("logger"))
{
}

std::string OAuthTokenManager::accessToken() {
    // There's not much of a point to having two threads request the same token at once.
    // Only allow one thread to access / update the cache and make others wait until it
    // exits.
    std::lock_guard<std::mutex> guard(_cacheLock);

    // buffer of 60 sec since we actually need time to use the token
    if (_cached && _cache.expiryDate > time(0) + 60) {
        return _cache.accessToken;
    }

    auto creds = _credentials->load();
    if (creds == nullptr || creds->refreshToken() == "") {
        throw SyncException(SYNC_KEY_NOT_AUTHORIZED, "No refresh token is stored. Run `contactsync init` to authorize.", false);
    }

    logger->info("Fetching OAuth access token for client {}", creds->clientId());
    nlohmann::json updated = _endpoint->refresh(creds);
    creds->applyTokenResponse(updated);
    _credentials->save(creds);

    int expiresIn = (updated.count("expires_in") && updated["expires_in"].is_number_integer()) ? updated["expires_in"].get<int>() : 0;
    _cache.accessToken = creds->accessToken();
    _cache.expiryDate = time(0) + expiresIn;
    _cached = true;
    return _cache.accessToken;
}

void OAuthTokenManager::invalidate() {
    std::lock_guard<std::mutex> guard(_cacheLock);
    _cached = false;
}
