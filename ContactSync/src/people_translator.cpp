#include "contactsync/people_translator.hpp"
#include "contactsync/constants.hpp"
#include "contactsync/contact_utils.hpp"

#include <cctype>
#include <cstdio>

using json = nlohmann::json;

// Google omits empty groups and fields entirely, and we treat values of
// an unexpected JSON type the same way.

static std::string stringValue(const json & obj, const char * key) {
    if (obj.is_object()) {
        auto it = obj.find(key);
        if (it != obj.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return "";
}

static int intValue(const json & obj, const char * key) {
    if (obj.is_object()) {
        auto it = obj.find(key);
        if (it != obj.end() && it->is_number_integer()) {
            return it->get<int>();
        }
    }
    return 0;
}

static const json & entries(const json & obj, const char * key) {
    static const json empty = json::array();
    if (obj.is_object()) {
        auto it = obj.find(key);
        if (it != obj.end() && it->is_array()) {
            return *it;
        }
    }
    return empty;
}

static const json & member(const json & obj, const char * key) {
    static const json null = nullptr;
    if (obj.is_object()) {
        auto it = obj.find(key);
        if (it != obj.end()) {
            return *it;
        }
    }
    return null;
}

static std::string lowerType(const json & entry) {
    return ContactUtils::toLowerCase(stringValue(entry, "type"));
}

static bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
}

static bool validDate(int year, int month, int day) {
    static const int days[] = {31, 29, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12 || day < 1) {
        return false;
    }
    if (month == 2 && day == 29) {
        // year 0 stands for "no year" and accepts Feb 29
        return year == 0 || isLeapYear(year);
    }
    return day <= days[month - 1];
}

std::string PeopleTranslator::formatDate(const json & date) {
    int year = intValue(date, "year");
    int month = intValue(date, "month");
    int day = intValue(date, "day");
    if (month < 1 || month > 12 || day < 1 || day > 31) {
        return "";
    }
    char buffer[16];
    if (year > 0 && year <= 9999) {
        snprintf(buffer, sizeof(buffer), "%04d%02d%02d", year, month, day);
    } else {
        snprintf(buffer, sizeof(buffer), "--%02d%02d", month, day);
    }
    return std::string(buffer);
}

json PeopleTranslator::parseDate(std::string value) {
    std::string digits;
    for (char c : value) {
        if (c == '-') {
            continue;
        }
        if (!isdigit((unsigned char)c)) {
            return nullptr;
        }
        digits += c;
    }

    int year = 0;
    int month = 0;
    int day = 0;
    if (digits.size() == 8) {
        year = std::stoi(digits.substr(0, 4));
        month = std::stoi(digits.substr(4, 2));
        day = std::stoi(digits.substr(6, 2));
    } else if (digits.size() == 4) {
        month = std::stoi(digits.substr(0, 2));
        day = std::stoi(digits.substr(2, 2));
    } else {
        return nullptr;
    }
    if (!validDate(year, month, day)) {
        return nullptr;
    }
    return {{"year", year}, {"month", month}, {"day", day}};
}

std::string PeopleTranslator::extensionKey(std::string prefix, std::string userKey) {
    std::string key;
    for (unsigned char c : userKey) {
        if (c >= 0x80 || c == '-' || isdigit(c)) {
            key += (char)c;
        } else if (isalpha(c)) {
            key += (char)toupper(c);
        } else {
            // whitespace and anything else that can't appear in a property name
            key += '-';
        }
    }
    return prefix + key;
}

std::shared_ptr<Contact> PeopleTranslator::contactFromPerson(const json & person) {
    auto contact = std::make_shared<Contact>();
    auto card = contact->card();

    std::string resourceName = stringValue(person, "resourceName");
    std::string uid = ContactUtils::lastPathComponent(resourceName);
    card->setValue("UID", uid);
    contact->setGoogleResourceName(resourceName);
    contact->setEtag(stringValue(person, "etag"));

    const json & names = entries(person, "names");
    if (names.size() > 0) {
        const json & name = names[0];
        std::string displayName = stringValue(name, "displayName");
        if (displayName != "") {
            contact->setFullName(displayName);
        }
        card->setValue("N", VCardProperty::joinComponents({
            stringValue(name, "familyName"),
            stringValue(name, "givenName"),
            stringValue(name, "middleName"),
            stringValue(name, "honorificPrefix"),
            stringValue(name, "honorificSuffix"),
        }));
    }

    for (const auto & nick : entries(person, "nicknames")) {
        card->addProperty("NICKNAME", stringValue(nick, "value"));
    }
    for (const auto & phone : entries(person, "phoneNumbers")) {
        card->addProperty("TEL", stringValue(phone, "value"), lowerType(phone));
    }
    for (const auto & email : entries(person, "emailAddresses")) {
        card->addProperty("EMAIL", stringValue(email, "value"), lowerType(email));
    }
    for (const auto & addr : entries(person, "addresses")) {
        card->addProperty("ADR", VCardProperty::joinComponents({
            stringValue(addr, "poBox"),
            stringValue(addr, "extendedAddress"),
            stringValue(addr, "streetAddress"),
            stringValue(addr, "city"),
            stringValue(addr, "region"),
            stringValue(addr, "postalCode"),
            stringValue(addr, "country"),
        }), lowerType(addr));
    }

    const json & orgs = entries(person, "organizations");
    if (orgs.size() > 0) {
        const json & org = orgs[0];
        std::vector<std::string> orgParts { stringValue(org, "name") };
        std::string department = stringValue(org, "department");
        if (department != "") {
            orgParts.push_back(department);
        }
        card->setValue("ORG", VCardProperty::joinComponents(orgParts));
        std::string title = stringValue(org, "title");
        if (title != "") {
            card->setValue("TITLE", title);
        }
    }

    const json & birthdays = entries(person, "birthdays");
    if (birthdays.size() > 0) {
        std::string bday = formatDate(member(birthdays[0], "date"));
        if (bday != "") {
            card->setValue("BDAY", bday);
        }
    }

    for (const auto & photo : entries(person, "photos")) {
        card->addProperty("PHOTO", stringValue(photo, "url"));
    }
    for (const auto & bio : entries(person, "biographies")) {
        card->addProperty("NOTE", stringValue(bio, "value"));
    }
    for (const auto & url : entries(person, "urls")) {
        card->addProperty("URL", stringValue(url, "value"), lowerType(url));
    }

    for (const auto & event : entries(person, "events")) {
        std::string date = formatDate(member(event, "date"));
        if (date == "") {
            continue;
        }
        std::string type = stringValue(event, "type");
        if (ContactUtils::equalsIgnoreCase(type, "anniversary")) {
            card->setValue("ANNIVERSARY", date);
        } else {
            card->addProperty(EXT_EVENT, date, type);
        }
    }

    for (const auto & gender : entries(person, "genders")) {
        card->setValue("GENDER", stringValue(gender, "value"));
    }

    for (const auto & im : entries(person, "imClients")) {
        std::string protocol = ContactUtils::toLowerCase(stringValue(im, "protocol"));
        card->addProperty("IMPP", protocol + ":" + stringValue(im, "username"), lowerType(im));
    }
    for (const auto & rel : entries(person, "relations")) {
        card->addProperty("RELATED", stringValue(rel, "person"), lowerType(rel));
    }
    for (const auto & cal : entries(person, "calendarUrls")) {
        card->addProperty("CALURI", stringValue(cal, "url"), lowerType(cal));
    }
    for (const auto & sip : entries(person, "sipAddresses")) {
        card->addProperty("IMPP", "sip:" + stringValue(sip, "value"), lowerType(sip));
    }
    for (const auto & locale : entries(person, "locales")) {
        card->addProperty("LANG", stringValue(locale, "value"));
    }

    // Extensions. Type labels keep Google's case.

    for (const auto & interest : entries(person, "interests")) {
        card->addProperty(EXT_INTEREST, stringValue(interest, "value"));
    }
    for (const auto & skill : entries(person, "skills")) {
        card->addProperty(EXT_SKILL, stringValue(skill, "value"));
    }
    for (const auto & occupation : entries(person, "occupations")) {
        card->addProperty(EXT_OCCUPATION, stringValue(occupation, "value"));
    }
    for (const auto & location : entries(person, "locations")) {
        card->addProperty(EXT_LOCATION, stringValue(location, "value"), stringValue(location, "type"));
    }
    for (const auto & membership : entries(person, "memberships")) {
        const json & group = member(membership, "contactGroupMembership");
        if (group.is_object()) {
            card->addProperty(EXT_GROUP_MEMBERSHIP, stringValue(group, "contactGroupResourceName"));
        }
    }
    for (const auto & ud : entries(person, "userDefined")) {
        card->addProperty(extensionKey(EXT_CUSTOM_PREFIX, stringValue(ud, "key")), stringValue(ud, "value"));
    }
    for (const auto & cd : entries(person, "clientData")) {
        card->addProperty(extensionKey(EXT_CLIENT_PREFIX, stringValue(cd, "key")), stringValue(cd, "value"));
    }
    for (const auto & eid : entries(person, "externalIds")) {
        card->addProperty(EXT_EXTERNAL_ID, stringValue(eid, "value"), stringValue(eid, "type"));
    }
    for (const auto & kw : entries(person, "miscKeywords")) {
        card->addProperty(EXT_KEYWORD, stringValue(kw, "value"), stringValue(kw, "type"));
    }
    for (const auto & cover : entries(person, "coverPhotos")) {
        card->addProperty(EXT_COVER_PHOTO, stringValue(cover, "url"));
    }
    for (const auto & range : entries(person, "ageRanges")) {
        card->addProperty(EXT_AGE_RANGE, stringValue(range, "ageRange"));
    }
    for (const auto & source : entries(member(person, "metadata"), "sources")) {
        card->addProperty(EXT_SOURCE, stringValue(source, "id"), stringValue(source, "type"));
    }

    if (contact->fullName() == "") {
        contact->setFullName(uid);
    }
    return contact;
}

static json typedValues(std::shared_ptr<VCard> card, std::string name) {
    json values = json::array();
    for (auto prop : card->propertiesWithName(name)) {
        json entry = {{"value", prop->getValue()}};
        if (prop->getType() != "") {
            entry["type"] = prop->getType();
        }
        values.push_back(entry);
    }
    return values;
}

json PeopleTranslator::personFromContact(std::shared_ptr<Contact> contact) {
    json person = json::object();
    auto card = contact->card();

    auto n = card->firstPropertyWithName("N");
    if (n) {
        static const char * keys[] = {"familyName", "givenName", "middleName", "honorificPrefix", "honorificSuffix"};
        auto parts = VCardProperty::splitComponents(n->getValue(), 5);
        json name = json::object();
        for (size_t i = 0; i < parts.size(); i++) {
            name[keys[i]] = parts[i];
        }
        person["names"] = json::array();
        person["names"].push_back(name);
    } else if (contact->fullName() != "") {
        json name = {{"displayName", contact->fullName()}};
        person["names"] = json::array();
        person["names"].push_back(name);
    }

    json phones = typedValues(card, "TEL");
    if (phones.size()) {
        person["phoneNumbers"] = phones;
    }
    json emails = typedValues(card, "EMAIL");
    if (emails.size()) {
        person["emailAddresses"] = emails;
    }

    json addresses = json::array();
    for (auto adr : card->propertiesWithName("ADR")) {
        static const char * keys[] = {"poBox", "extendedAddress", "streetAddress", "city", "region", "postalCode", "country"};
        auto parts = VCardProperty::splitComponents(adr->getValue(), 7);
        json address = json::object();
        for (size_t i = 0; i < parts.size(); i++) {
            address[keys[i]] = parts[i];
        }
        if (adr->getType() != "") {
            address["type"] = adr->getType();
        }
        addresses.push_back(address);
    }
    if (addresses.size()) {
        person["addresses"] = addresses;
    }

    std::string org = card->getValue("ORG");
    std::string title = card->getValue("TITLE");
    if (org != "" || title != "") {
        json organization = json::object();
        if (org != "") {
            auto parts = VCardProperty::splitComponents(org, 2);
            organization["name"] = parts[0];
            if (parts.size() > 1) {
                organization["department"] = parts[1];
            }
        }
        if (title != "") {
            organization["title"] = title;
        }
        person["organizations"] = json::array();
        person["organizations"].push_back(organization);
    }

    std::string bday = card->getValue("BDAY");
    if (bday != "") {
        json date = parseDate(bday);
        if (!date.is_null()) {
            json birthday = {{"date", date}};
            person["birthdays"] = json::array();
            person["birthdays"].push_back(birthday);
        }
    }

    json bios = json::array();
    for (auto note : card->propertiesWithName("NOTE")) {
        json bio = {{"value", note->getValue()}};
        bios.push_back(bio);
    }
    if (bios.size()) {
        person["biographies"] = bios;
    }

    json urls = typedValues(card, "URL");
    if (urls.size()) {
        person["urls"] = urls;
    }

    return person;
}
