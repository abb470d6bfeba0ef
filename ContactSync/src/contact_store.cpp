#include "contactsync/contact_store.hpp"
#include "contactsync/constants.hpp"
#include "contactsync/contact_utils.hpp"
#include "contactsync/sync_exception.hpp"

#include <cerrno>
#include <dirent.h>
#include <sys/stat.h>
#include <time.h>

ContactStore::ContactStore(std::string configDir, std::shared_ptr<ContactProvider> provider) :
    _dir(configDir + FS_PATH_SEP + CONTACTS_SUBDIR),
    _provider(provider),
    logger(spdlog::get("logger"))
{
    ContactUtils::ensureDirectory(_dir, 0755);
}

std::string ContactStore::directory() {
    return _dir;
}

std::shared_ptr<ContactProvider> ContactStore::provider() {
    return _provider;
}

void ContactStore::validateId(const std::string & uid) {
    if (uid == "" || uid == "." || uid == ".." || uid.find('/') != std::string::npos) {
        throw SyncException(SYNC_KEY_INVALID_INPUT, "\"" + uid + "\" is not a valid contact id", false);
    }
}

std::string ContactStore::pathForId(const std::string & uid) {
    validateId(uid);
    return _dir + FS_PATH_SEP + uid + CONTACT_FILE_EXT;
}

void ContactStore::writeContact(std::shared_ptr<Contact> contact) {
    ContactUtils::writeFile(pathForId(contact->uid()), contact->serialize(), 0644);
}

std::shared_ptr<Contact> ContactStore::find(std::string uid) {
    std::string path = pathForId(uid);
    std::string contents;
    if (!ContactUtils::readFile(path, contents)) {
        return nullptr;
    }
    auto contact = std::make_shared<Contact>(contents);
    if (contact->card()->incomplete()) {
        throw SyncException(SYNC_KEY_INVALID_INPUT, path + " is not a valid vCard", false);
    }
    if (contact->uid() == "") {
        // the file name is authoritative when the card has no UID
        contact->card()->setValue("UID", uid);
    }
    return contact;
}

std::vector<std::shared_ptr<Contact>> ContactStore::findAll() {
    std::vector<std::shared_ptr<Contact>> results;

    DIR * dir = opendir(_dir.c_str());
    if (dir == nullptr) {
        throw IOException("opendir", _dir);
    }

    std::vector<std::string> uids;
    struct dirent * entry;
    while ((entry = readdir(dir)) != nullptr) {
        std::string name = entry->d_name;
        if (name.size() <= CONTACT_FILE_EXT.size() || name.compare(name.size() - CONTACT_FILE_EXT.size(), CONTACT_FILE_EXT.size(), CONTACT_FILE_EXT) != 0) {
            continue;
        }
        struct stat buffer;
        std::string path = _dir + FS_PATH_SEP + name;
        if (stat(path.c_str(), &buffer) != 0 || !S_ISREG(buffer.st_mode)) {
            continue;
        }
        uids.push_back(name.substr(0, name.size() - CONTACT_FILE_EXT.size()));
    }
    closedir(dir);

    // An unreadable file fails the whole listing, naming the file.
    for (const auto & uid : uids) {
        auto contact = find(uid);
        if (contact) {
            results.push_back(contact);
        }
    }
    return results;
}

std::shared_ptr<Contact> ContactStore::resolve(std::string query) {
    bool validId = true;
    try {
        validateId(query);
    } catch (SyncException &) {
        validId = false;
    }
    if (validId) {
        auto contact = find(query);
        if (contact) {
            return contact;
        }
    }
    for (auto contact : findAll()) {
        if (ContactUtils::equalsIgnoreCase(contact->fullName(), query)) {
            return contact;
        }
    }
    return nullptr;
}

void ContactStore::save(std::shared_ptr<Contact> contact) {
    if (contact->uid() == "") {
        contact->setId(ContactId::local(ContactUtils::idRandomlyGenerated()));
    }
    time_t now = time(0);
    contact->setRevision(now);
    writeContact(contact);
    logger->info("Saved contact {}", contact->uid());

    if (!_provider) {
        return;
    }

    auto remote = _provider->upsertContact(contact);
    if (!remote) {
        return;
    }

    std::string previousUid = contact->uid();
    remote->setRevision(now);
    writeContact(remote);
    if (remote->uid() != previousUid) {
        ContactUtils::removeFile(pathForId(previousUid));
        logger->info("Contact {} is now {}", previousUid, remote->uid());
    }
    *contact = *remote;
}

void ContactStore::saveSynced(std::shared_ptr<Contact> contact) {
    time_t now = time(0);
    contact->setRevision(now);
    contact->setLastSynced(now);
    writeContact(contact);
}

void ContactStore::remove(const ContactId & id) {
    std::string path = pathForId(id.value());
    struct stat buffer;
    if (stat(path.c_str(), &buffer) != 0) {
        if (errno == ENOENT) {
            throw SyncException(SYNC_KEY_NOT_FOUND, id.value(), false);
        }
        throw IOException("stat", path);
    }

    if (id.isProvider() && _provider) {
        _provider->deleteContact(id);
    }
    if (!ContactUtils::removeFile(path)) {
        throw SyncException(SYNC_KEY_NOT_FOUND, id.value(), false);
    }
    logger->info("Deleted contact {}", id.value());
}

void ContactStore::remove(std::string uid) {
    auto contact = find(uid);
    if (!contact) {
        throw SyncException(SYNC_KEY_NOT_FOUND, uid, false);
    }
    remove(contact->id());
}
