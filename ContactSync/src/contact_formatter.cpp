#include "contactsync/contact_formatter.hpp"
#include "contactsync/constants.hpp"
#include "contactsync/people_translator.hpp"

#include <algorithm>
#include <sstream>

using json = nlohmann::json;

static const char * MONTHS[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

// "  Phone:     value"
static std::string line(std::string label, std::string value) {
    label += ":";
    if (label.size() < 11) {
        label += std::string(11 - label.size(), ' ');
    } else {
        label += " ";
    }
    return "  " + label + value + "\n";
}

static std::string withLabel(std::shared_ptr<VCardProperty> prop, std::string fallback) {
    std::string type = prop->getType();
    return prop->getValue() + " (" + (type != "" ? type : fallback) + ")";
}

std::string ContactFormatter::formatDisplayDate(std::string value) {
    json date = PeopleTranslator::parseDate(value);
    if (date.is_null()) {
        return value;
    }
    int year = date["year"].get<int>();
    std::string result = std::string(MONTHS[date["month"].get<int>() - 1]) + " " + std::to_string(date["day"].get<int>());
    if (year > 0) {
        result += ", " + std::to_string(year);
    }
    return result;
}

std::string ContactFormatter::formatAddress(std::string adr) {
    auto parts = VCardProperty::splitComponents(adr, 7);
    std::string result;
    for (size_t i = 2; i < parts.size(); i++) {
        if (parts[i] == "") {
            continue;
        }
        result += result == "" ? parts[i] : ", " + parts[i];
    }
    return result;
}

std::string ContactFormatter::formatCard(std::shared_ptr<Contact> contact) {
    auto card = contact->card();
    std::string out;

    std::string fn = contact->fullName();
    if (fn != "") {
        out += fn + "\n" + std::string(fn.size(), '-') + "\n";
    }

    std::string nickname = card->getValue("NICKNAME");
    if (nickname != "") {
        out += line("Nickname", nickname);
    }

    std::string org = card->getValue("ORG");
    std::string title = card->getValue("TITLE");
    if (org != "") {
        std::string display;
        for (const auto & part : VCardProperty::splitComponents(org)) {
            if (part != "") {
                display += display == "" ? part : ", " + part;
            }
        }
        if (title != "") {
            out += line("Work", title + ", " + display);
        } else {
            out += line("Org", display);
        }
    } else if (title != "") {
        out += line("Title", title);
    }

    for (auto tel : card->propertiesWithName("TEL")) {
        out += line("Phone", withLabel(tel, "phone"));
    }
    for (auto email : card->propertiesWithName("EMAIL")) {
        out += line("Email", withLabel(email, "email"));
    }
    for (auto adr : card->propertiesWithName("ADR")) {
        std::string address = formatAddress(adr->getValue());
        if (address != "") {
            std::string type = adr->getType();
            out += line("Address", address + " (" + (type != "" ? type : "address") + ")");
        }
    }

    std::string bday = card->getValue("BDAY");
    if (bday != "") {
        out += line("Birthday", formatDisplayDate(bday));
    }
    std::string anniversary = card->getValue("ANNIVERSARY");
    if (anniversary != "") {
        out += line("Anniv", formatDisplayDate(anniversary));
    }

    for (auto url : card->propertiesWithName("URL")) {
        out += line("URL", withLabel(url, "url"));
    }
    for (auto impp : card->propertiesWithName("IMPP")) {
        out += line("IM", impp->getValue());
    }
    for (auto related : card->propertiesWithName("RELATED")) {
        out += line("Related", withLabel(related, "related"));
    }

    std::string gender = card->getValue("GENDER");
    if (gender != "") {
        out += line("Gender", gender);
    }
    for (auto note : card->propertiesWithName("NOTE")) {
        out += line("Note", note->getValue());
    }

    static const std::vector<std::pair<std::string, std::string>> extensions = {
        {EXT_INTEREST, "Interest"},
        {EXT_SKILL, "Skill"},
        {EXT_OCCUPATION, "Occupation"},
        {EXT_LOCATION, "Location"},
    };
    for (const auto & ext : extensions) {
        for (auto prop : card->propertiesWithName(ext.first)) {
            out += line(ext.second, prop->getValue());
        }
    }

    if (contact->uid() != "") {
        out += line("UID", contact->uid());
    }

    while (out.size() && out.back() == '\n') {
        out.pop_back();
    }
    return out;
}

std::string ContactFormatter::formatTable(std::vector<std::shared_ptr<Contact>> contacts) {
    std::vector<std::vector<std::string>> rows;
    rows.push_back({"UID", "NAME", "EMAIL", "PHONE"});
    for (auto contact : contacts) {
        rows.push_back({contact->uid(), contact->fullName(), contact->primaryEmail(), contact->primaryPhone()});
    }

    std::vector<size_t> widths(4, 0);
    for (const auto & row : rows) {
        for (size_t i = 0; i < row.size(); i++) {
            widths[i] = std::max(widths[i], row[i].size());
        }
    }

    std::stringstream out;
    for (const auto & row : rows) {
        for (size_t i = 0; i < row.size(); i++) {
            out << row[i];
            if (i + 1 < row.size()) {
                out << std::string(widths[i] - row[i].size() + 2, ' ');
            }
        }
        out << "\n";
    }
    return out.str();
}

static json typedList(std::shared_ptr<VCard> card, std::string name) {
    json list = json::array();
    for (auto prop : card->propertiesWithName(name)) {
        list.push_back({{"value", prop->getValue()}, {"type", prop->getType()}});
    }
    return list;
}

static json valueList(std::shared_ptr<VCard> card, std::string name) {
    json list = json::array();
    for (auto prop : card->propertiesWithName(name)) {
        list.push_back(prop->getValue());
    }
    return list;
}

json ContactFormatter::toJSON(std::shared_ptr<Contact> contact) {
    auto card = contact->card();
    auto n = contact->nameParts();

    json addresses = json::array();
    for (auto adr : card->propertiesWithName("ADR")) {
        auto parts = VCardProperty::splitComponents(adr->getValue(), 7);
        parts.resize(7);
        addresses.push_back({
            {"type", adr->getType()},
            {"po_box", parts[0]},
            {"extended", parts[1]},
            {"street", parts[2]},
            {"city", parts[3]},
            {"region", parts[4]},
            {"postal_code", parts[5]},
            {"country", parts[6]},
        });
    }

    json extensions = json::array();
    for (auto prop : card->getExtendedProperties()) {
        if (prop->getName() == PROP_ETAG || prop->getName() == PROP_RESOURCE_NAME || prop->getName() == PROP_LAST_SYNCED) {
            continue;
        }
        extensions.push_back({{"name", prop->getName()}, {"value", prop->getValue()}, {"type", prop->getType()}});
    }

    std::string org = card->getValue("ORG");
    std::string organization;
    for (const auto & part : VCardProperty::splitComponents(org)) {
        if (part != "") {
            organization += organization == "" ? part : ", " + part;
        }
    }

    return {
        {"uid", contact->uid()},
        {"full_name", contact->fullName()},
        {"name", {
            {"family", n[0]},
            {"given", n[1]},
            {"middle", n[2]},
            {"prefix", n[3]},
            {"suffix", n[4]},
        }},
        {"nicknames", valueList(card, "NICKNAME")},
        {"phones", typedList(card, "TEL")},
        {"emails", typedList(card, "EMAIL")},
        {"addresses", addresses},
        {"organization", organization},
        {"title", card->getValue("TITLE")},
        {"birthday", card->getValue("BDAY")},
        {"anniversary", card->getValue("ANNIVERSARY")},
        {"urls", typedList(card, "URL")},
        {"impp", typedList(card, "IMPP")},
        {"related", typedList(card, "RELATED")},
        {"gender", card->getValue("GENDER")},
        {"notes", valueList(card, "NOTE")},
        {"photos", valueList(card, "PHOTO")},
        {"extensions", extensions},
        {"revision", contact->revision()},
        {"last_synced", contact->lastSynced()},
        {"origin", contact->id().isProvider() ? "google" : "local"},
    };
}

json ContactFormatter::toJSON(std::vector<std::shared_ptr<Contact>> contacts) {
    json list = json::array();
    for (auto contact : contacts) {
        list.push_back(toJSON(contact));
    }
    return list;
}

std::string ContactFormatter::formatVCF(std::vector<std::shared_ptr<Contact>> contacts) {
    std::string out;
    for (auto contact : contacts) {
        out += contact->serialize();
    }
    return out;
}
