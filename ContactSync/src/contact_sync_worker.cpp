#include "contactsync/contact_sync_worker.hpp"
#include "contactsync/sync_exception.hpp"

ContactSyncWorker::ContactSyncWorker(ContactStore * store, std::shared_ptr<ContactProvider> provider) :
    store(store),
    provider(provider),
    logger(spdlog::get("logger"))
{
}

int ContactSyncWorker::run() {
    if (!provider) {
        throw SyncException(SYNC_KEY_NOT_AUTHORIZED, "No Google account is configured. Run `contactsync init` first.", false);
    }

    logger->info("Syncing contacts");
    auto remote = provider->fetchContacts();

    int written = 0;
    for (auto contact : remote) {
        if (contact->uid() == "") {
            logger->warn("Skipping remote contact with no id");
            continue;
        }
        store->saveSynced(contact);
        written++;
    }

    logger->info("Sync complete: {} contacts written", written);
    return written;
}
