#include "contactsync/oauth_token_endpoint.hpp"
#include "contactsync/constants.hpp"
#include "contactsync/network_request_utils.hpp"
#include "contactsync/sync_exception.hpp"

static void ValidateTokenResponse(const nlohmann::json & resp, std::string operation) {
    if (!resp.is_object() || !resp.count("access_token") || !resp["access_token"].is_string()) {
        throw SyncException("invalid-oauth-resp", operation + " returned no access_token: " + resp.dump(), false);
    }
}

GoogleTokenEndpoint::GoogleTokenEndpoint() :
    _tokenUrl(GOOGLE_TOKEN_URL)
{
}

GoogleTokenEndpoint::GoogleTokenEndpoint(std::string tokenUrl) :
    _tokenUrl(tokenUrl)
{
}

nlohmann::json GoogleTokenEndpoint::exchangeCode(std::shared_ptr<Credentials> creds, std::string code, std::string codeVerifier, std::string redirectUri) {
    auto resp = MakeOAuthCodeExchangeRequest(_tokenUrl, creds->clientId(), creds->clientSecret(), code, codeVerifier, redirectUri);
    ValidateTokenResponse(resp, "Code exchange");
    return resp;
}

nlohmann::json GoogleTokenEndpoint::refresh(std::shared_ptr<Credentials> creds) {
    auto resp = MakeOAuthRefreshRequest(_tokenUrl, creds->clientId(), creds->clientSecret(), creds->refreshToken());
    ValidateTokenResponse(resp, "Token refresh");
    return resp;
}
