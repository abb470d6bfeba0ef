#include "contactsync/models/contact.hpp"
#include "contactsync/contact_utils.hpp"
#include "contactsync/constants.hpp"

Contact::Contact() :
    _card(std::make_shared<VCard>())
{
    _card->setValue("VERSION", VCARD_VERSION);
}

Contact::Contact(std::string vcf) :
    _card(std::make_shared<VCard>(vcf))
{
}

Contact::Contact(std::shared_ptr<VCard> card) :
    _card(card)
{
}

std::shared_ptr<Contact> Contact::fresh(std::string fullName) {
    auto contact = std::make_shared<Contact>();
    contact->setId(ContactId::local(ContactUtils::idRandomlyGenerated()));
    contact->setFullName(fullName);
    return contact;
}

std::shared_ptr<VCard> Contact::card() {
    return _card;
}

std::string Contact::serialize() {
    return _card->serialize();
}

ContactId Contact::id() {
    if (googleResourceName() != "") {
        return ContactId::provider(uid());
    }
    return ContactId::local(uid());
}

std::string Contact::uid() {
    return _card->getValue("UID");
}

void Contact::setId(ContactId id) {
    _card->setValue("UID", id.value());
    if (id.isProvider()) {
        if (ContactUtils::lastPathComponent(googleResourceName()) != id.value()) {
            setGoogleResourceName(id.resourceName());
        }
    } else {
        _card->removePropertiesWithName(PROP_RESOURCE_NAME);
    }
}

std::string Contact::googleResourceName() {
    return _card->getValue(PROP_RESOURCE_NAME);
}

void Contact::setGoogleResourceName(std::string rn) {
    if (rn == "") {
        _card->removePropertiesWithName(PROP_RESOURCE_NAME);
        return;
    }
    _card->setValue(PROP_RESOURCE_NAME, rn);
}

std::string Contact::etag() {
    return _card->getValue(PROP_ETAG);
}

void Contact::setEtag(std::string etag) {
    if (etag == "") {
        _card->removePropertiesWithName(PROP_ETAG);
        return;
    }
    _card->setValue(PROP_ETAG, etag);
}

std::string Contact::fullName() {
    return _card->getValue("FN");
}

void Contact::setFullName(std::string name) {
    _card->setValue("FN", name);
}

std::vector<std::string> Contact::nameParts() {
    std::vector<std::string> parts = VCardProperty::splitComponents(_card->getValue("N"), 5);
    parts.resize(5);
    return parts;
}

std::string Contact::primaryPhone() {
    auto phones = _card->propertiesWithName("TEL");
    for (auto phone : phones) {
        for (auto type : ContactUtils::split(ContactUtils::toLowerCase(phone->getType()), ',')) {
            if (type == "cell" || type == "mobile") {
                return phone->getValue();
            }
        }
    }
    return phones.size() ? phones.front()->getValue() : "";
}

std::string Contact::primaryEmail() {
    return _card->getValue("EMAIL");
}

std::vector<ContactField> Contact::fieldsWithName(std::string name) {
    std::vector<ContactField> fields;
    for (auto prop : _card->propertiesWithName(name)) {
        fields.push_back({prop->getValue(), prop->getType()});
    }
    return fields;
}

std::string Contact::revision() {
    return _card->getValue("REV");
}

void Contact::setRevision(time_t time) {
    _card->setValue("REV", ContactUtils::timestampForTime(time));
}

std::string Contact::lastSynced() {
    return _card->getValue(PROP_LAST_SYNCED);
}

void Contact::setLastSynced(time_t time) {
    _card->setValue(PROP_LAST_SYNCED, ContactUtils::timestampForTime(time));
}
