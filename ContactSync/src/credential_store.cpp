#include "contactsync/credential_store.hpp"
#include "contactsync/constants.hpp"
#include "contactsync/contact_utils.hpp"
#include "contactsync/sync_exception.hpp"

CredentialStore::CredentialStore(std::string configDir) :
    _dir(configDir),
    logger(spdlog::get("logger"))
{
    ContactUtils::ensureDirectory(_dir, 0755);
}

std::string CredentialStore::credentialsPath() {
    return _dir + FS_PATH_SEP + CREDENTIALS_FILENAME;
}

std::string CredentialStore::syncTokenPath() {
    return _dir + FS_PATH_SEP + SYNC_TOKEN_FILENAME;
}

std::shared_ptr<Credentials> CredentialStore::load() {
    std::lock_guard<std::mutex> guard(_fileLock);
    std::string contents;
    if (!ContactUtils::readFile(credentialsPath(), contents)) {
        return nullptr;
    }
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(contents);
    } catch (nlohmann::json::exception & ex) {
        throw SyncException(SYNC_KEY_INVALID_INPUT, "Could not parse " + credentialsPath() + ": " + ex.what(), false);
    }
    if (!json.is_object()) {
        throw SyncException(SYNC_KEY_INVALID_INPUT, credentialsPath() + " does not contain a JSON object", false);
    }
    return std::make_shared<Credentials>(json);
}

void CredentialStore::save(std::shared_ptr<Credentials> creds) {
    std::lock_guard<std::mutex> guard(_fileLock);
    ContactUtils::writeFile(credentialsPath(), creds->toJSON().dump(2), 0600);
    logger->info("Saved credentials to {}", credentialsPath());
}

std::string CredentialStore::loadSyncToken() {
    std::lock_guard<std::mutex> guard(_fileLock);
    std::string contents;
    if (!ContactUtils::readFile(syncTokenPath(), contents)) {
        return "";
    }
    return ContactUtils::trim(contents);
}

void CredentialStore::saveSyncToken(std::string token) {
    std::lock_guard<std::mutex> guard(_fileLock);
    ContactUtils::writeFile(syncTokenPath(), token, 0600);
}
