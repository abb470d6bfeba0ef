#include "contactsync/models/credentials.hpp"

Credentials::Credentials(std::string clientId, std::string clientSecret) {
    _data = nlohmann::json::object();
    _data["client_id"] = clientId;
    _data["client_secret"] = clientSecret;
}

Credentials::Credentials(nlohmann::json json) :
    _data(json.is_object() ? json : nlohmann::json::object())
{
}

std::string Credentials::stringForKey(const char * key) {
    if (_data.count(key) && _data[key].is_string()) {
        return _data[key].get<std::string>();
    }
    return "";
}

void Credentials::setStringForKey(const char * key, std::string value) {
    if (value == "") {
        _data.erase(key);
    } else {
        _data[key] = value;
    }
}

std::string Credentials::clientId() {
    return stringForKey("client_id");
}

std::string Credentials::clientSecret() {
    return stringForKey("client_secret");
}

std::string Credentials::refreshToken() {
    return stringForKey("refresh_token");
}

void Credentials::setRefreshToken(std::string token) {
    setStringForKey("refresh_token", token);
}

std::string Credentials::accessToken() {
    return stringForKey("access_token");
}

void Credentials::setAccessToken(std::string token) {
    setStringForKey("access_token", token);
}

std::string Credentials::email() {
    return stringForKey("email");
}

void Credentials::setEmail(std::string email) {
    setStringForKey("email", email);
}

void Credentials::applyTokenResponse(const nlohmann::json & resp) {
    if (resp.count("access_token") && resp["access_token"].is_string()) {
        setAccessToken(resp["access_token"].get<std::string>());
    }
    // Google only returns a refresh token on consent, keep the old one otherwise
    if (resp.count("refresh_token") && resp["refresh_token"].is_string()) {
        setRefreshToken(resp["refresh_token"].get<std::string>());
    }
}

std::string Credentials::valid() {
    std::string missing = "";
    if (clientId() == "") {
        missing += " client_id";
    }
    if (clientSecret() == "") {
        missing += " client_secret";
    }
    return missing;
}

nlohmann::json Credentials::toJSON() {
    return _data;
}
