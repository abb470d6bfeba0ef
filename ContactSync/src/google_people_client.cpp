#include "contactsync/google_people_client.hpp"
#include "contactsync/network_request_utils.hpp"
#include "contactsync/people_translator.hpp"
#include "contactsync/sync_exception.hpp"

GooglePeopleClient::GooglePeopleClient(std::shared_ptr<OAuthTokenManager> tokens, std::shared_ptr<CredentialStore> credentials, std::string apiRoot) :
    _tokens(tokens),
    _credentials(credentials),
    _apiRoot(apiRoot),
    logger(spdlog::get("logger"))
{
}

std::string GooglePeopleClient::authorization() {
    return "Bearer " + _tokens->accessToken();
}

std::vector<std::shared_ptr<Contact>> GooglePeopleClient::fetchContacts() {
    std::vector<std::shared_ptr<Contact>> results;

    std::string peopleUrl = _apiRoot + "people/me/connections?pageSize=" + std::to_string(PEOPLE_PAGE_SIZE) + "&personFields=" + PERSON_FIELDS + "&sources=" + PEOPLE_READ_SOURCES;
    paginateGoogleCollection(peopleUrl, [&](const nlohmann::json & page) {
        if (!page.count("connections") || !page["connections"].is_array()) {
            return;
        }
        for (const auto & conn : page["connections"]) {
            if (!conn.count("resourceName") || !conn["resourceName"].is_string() || conn["resourceName"].get<std::string>() == "") {
                logger->warn("Skipping Google contact with no resourceName: {}", conn.dump());
                continue;
            }
            results.push_back(PeopleTranslator::contactFromPerson(conn));
        }
    });

    logger->info("Fetched {} contacts from Google", results.size());
    return results;
}

void GooglePeopleClient::paginateGoogleCollection(std::string urlRoot, std::function<void(const nlohmann::json &)> yieldBlock) {
    std::string nextPageToken = "";
    std::string nextSyncToken = "";

    while (nextPageToken != "END") {
        auto url = urlRoot + "&requestSyncToken=true";
        if (nextPageToken != "") {
            url = url + "&pageToken=" + EscapeURLComponent(nextPageToken);
        }

        auto json = PerformJSONRequest(CreateJSONRequest(url, "GET", authorization()));

        if (json.count("nextSyncToken") && json["nextSyncToken"].is_string()) {
            nextSyncToken = json["nextSyncToken"].get<std::string>();
        }
        if (json.count("nextPageToken") && json["nextPageToken"].is_string() && json["nextPageToken"].get<std::string>() != "") {
            nextPageToken = json["nextPageToken"].get<std::string>();
        } else {
            nextPageToken = "END";
        }

        yieldBlock(json);
    }

    // Only stored for now. Every sync is a full fetch.
    if (nextSyncToken != "") {
        _credentials->saveSyncToken(nextSyncToken);
    }
}

std::shared_ptr<Contact> GooglePeopleClient::upsertContact(std::shared_ptr<Contact> contact) {
    nlohmann::json person = PeopleTranslator::personFromContact(contact);
    ContactId id = contact->id();

    nlohmann::json resp;
    if (id.isProvider()) {
        if (contact->etag() != "") {
            person["etag"] = contact->etag();
        }
        std::string body = person.dump();
        logger->info("Updating Google contact {}", contact->googleResourceName());
        std::string url = _apiRoot + contact->googleResourceName() + ":updateContact?updatePersonFields=" + PERSON_UPDATE_FIELDS + "&personFields=" + PERSON_FIELDS;
        resp = PerformJSONRequest(CreateJSONRequest(url, "PATCH", authorization(), body.c_str()));
    } else {
        std::string body = person.dump();
        logger->info("Creating Google contact for {}", id.value());
        std::string url = _apiRoot + "people:createContact?personFields=" + PERSON_FIELDS;
        resp = PerformJSONRequest(CreateJSONRequest(url, "POST", authorization(), body.c_str()));
    }

    if (!resp.is_object() || !resp.count("resourceName") || !resp["resourceName"].is_string()) {
        logger->warn("Google did not return the saved contact: {}", resp.dump());
        return nullptr;
    }
    return PeopleTranslator::contactFromPerson(resp);
}

void GooglePeopleClient::deleteContact(const ContactId & id) {
    if (!id.isProvider()) {
        throw SyncException(SYNC_KEY_INVALID_INPUT, "Contact " + id.value() + " does not exist in Google.", false);
    }
    logger->info("Deleting Google contact {}", id.resourceName());
    PerformRequest(CreateJSONRequest(_apiRoot + id.resourceName() + ":deleteContact", "DELETE", authorization()));
}
