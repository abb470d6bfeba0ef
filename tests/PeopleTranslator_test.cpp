#include <gtest/gtest.h>
#include "contactsync/people_translator.hpp"
#include "contactsync/constants.hpp"

using json = nlohmann::json;

static json fullPerson() {
    return {
        {"resourceName", "people/c4242"},
        {"etag", "%EgUBAgMEBQ=="},
        {"names", {{
            {"displayName", "Jane Q. Doe"},
            {"familyName", "Doe"},
            {"givenName", "Jane"},
            {"middleName", "Q."},
        }}},
        {"nicknames", {{{"value", "JD"}}}},
        {"phoneNumbers", {
            {{"value", "+1 555 0100"}, {"type", "Work"}},
            {{"value", "+1 555 0199"}, {"type", "mobile"}},
        }},
        {"emailAddresses", {{{"value", "jane@example.com"}, {"type", "home"}}}},
        {"addresses", {{
            {"streetAddress", "1 Main St"},
            {"city", "Springfield"},
            {"region", "IL"},
            {"postalCode", "62701"},
            {"country", "USA"},
            {"type", "home"},
        }}},
        {"organizations", {{{"name", "Acme"}, {"department", "R&D"}, {"title", "Engineer"}}}},
        {"birthdays", {{{"date", {{"year", 1990}, {"month", 6}, {"day", 15}}}}}},
        {"biographies", {{{"value", "Likes climbing"}}}},
        {"urls", {{{"value", "https://example.com"}, {"type", "homepage"}}}},
    };
}

TEST(PeopleTranslatorTest, MinimalPersonUsesResourceSuffixAsIdAndName) {
    auto contact = PeopleTranslator::contactFromPerson({{"resourceName", "people/c123"}, {"etag", "abc"}});

    EXPECT_EQ(contact->uid(), "c123");
    EXPECT_EQ(contact->fullName(), "c123");
    EXPECT_TRUE(contact->id().isProvider());
    EXPECT_EQ(contact->googleResourceName(), "people/c123");
    EXPECT_EQ(contact->etag(), "abc");
}

TEST(PeopleTranslatorTest, MapsStandardFields) {
    auto contact = PeopleTranslator::contactFromPerson(fullPerson());
    auto card = contact->card();

    EXPECT_EQ(contact->fullName(), "Jane Q. Doe");
    EXPECT_EQ(card->getValue("N"), "Doe;Jane;Q.;;");
    EXPECT_EQ(card->getValue("NICKNAME"), "JD");
    EXPECT_EQ(card->getValue("ORG"), "Acme;R&D");
    EXPECT_EQ(card->getValue("TITLE"), "Engineer");
    EXPECT_EQ(card->getValue("BDAY"), "19900615");
    EXPECT_EQ(card->getValue("NOTE"), "Likes climbing");
    EXPECT_EQ(card->getValue("ADR"), ";;1 Main St;Springfield;IL;62701;USA");

    auto phones = contact->fieldsWithName("TEL");
    ASSERT_EQ(phones.size(), 2u);
    EXPECT_EQ(phones[0].type, "work");
    EXPECT_EQ(contact->primaryPhone(), "+1 555 0199");
}

TEST(PeopleTranslatorTest, PayloadContainsEveryWritableGroup) {
    auto contact = PeopleTranslator::contactFromPerson(fullPerson());
    json payload = PeopleTranslator::personFromContact(contact);

    for (const char * key : {"names", "phoneNumbers", "emailAddresses", "addresses", "organizations", "birthdays", "biographies", "urls"}) {
        EXPECT_TRUE(payload.count(key)) << key;
    }
    EXPECT_EQ(payload["names"][0]["givenName"], "Jane");
    EXPECT_EQ(payload["names"][0]["familyName"], "Doe");
    EXPECT_EQ(payload["phoneNumbers"][1]["value"], "+1 555 0199");
    EXPECT_EQ(payload["phoneNumbers"][1]["type"], "mobile");
    EXPECT_EQ(payload["addresses"][0]["city"], "Springfield");
    EXPECT_EQ(payload["addresses"][0]["type"], "home");
    EXPECT_EQ(payload["organizations"][0]["name"], "Acme");
    EXPECT_EQ(payload["organizations"][0]["department"], "R&D");
    EXPECT_EQ(payload["organizations"][0]["title"], "Engineer");
    EXPECT_EQ(payload["birthdays"][0]["date"], json({{"year", 1990}, {"month", 6}, {"day", 15}}));
}

TEST(PeopleTranslatorTest, PayloadOmitsEmptyTypesAndGroups) {
    auto contact = Contact::fresh("Ada");
    contact->card()->addProperty("TEL", "123");
    json payload = PeopleTranslator::personFromContact(contact);

    EXPECT_FALSE(payload["phoneNumbers"][0].count("type"));
    EXPECT_FALSE(payload.count("emailAddresses"));
    EXPECT_FALSE(payload.count("birthdays"));
    EXPECT_EQ(payload["names"][0]["displayName"], "Ada");
}

TEST(PeopleTranslatorTest, EventsSplitIntoAnniversaryAndExtensions) {
    json person = {
        {"resourceName", "people/c1"},
        {"events", {
            {{"type", "anniversary"}, {"date", {{"year", 2010}, {"month", 5}, {"day", 1}}}},
            {{"type", "Graduation"}, {"date", {{"month", 3}, {"day", 10}}}},
        }},
    };
    auto card = PeopleTranslator::contactFromPerson(person)->card();

    EXPECT_EQ(card->getValue("ANNIVERSARY"), "20100501");
    auto events = card->propertiesWithName(EXT_EVENT);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0]->getValue(), "--0310");
    EXPECT_EQ(events[0]->getType(), "Graduation");
}

TEST(PeopleTranslatorTest, VendorExtensionsArePreserved) {
    json person = {
        {"resourceName", "people/c1"},
        {"userDefined", {{{"key", "Shirt Size"}, {"value", "M"}}}},
        {"skills", {{{"value", "Rust"}}}},
        {"memberships", {{{"contactGroupMembership", {{"contactGroupResourceName", "contactGroups/myContacts"}}}}}},
        {"imClients", {{{"username", "jdoe"}, {"protocol", "Skype"}, {"type", "work"}}}},
    };
    auto card = PeopleTranslator::contactFromPerson(person)->card();

    EXPECT_EQ(card->getValue("X-GOOGLE-CUSTOM-SHIRT-SIZE"), "M");
    EXPECT_EQ(card->getValue(EXT_SKILL), "Rust");
    EXPECT_EQ(card->getValue(EXT_GROUP_MEMBERSHIP), "contactGroups/myContacts");
    EXPECT_EQ(card->getValue("IMPP"), "skype:jdoe");
}

TEST(PeopleTranslatorTest, FormatDate) {
    EXPECT_EQ(PeopleTranslator::formatDate({{"year", 1990}, {"month", 6}, {"day", 15}}), "19900615");
    EXPECT_EQ(PeopleTranslator::formatDate({{"month", 3}, {"day", 10}}), "--0310");
    EXPECT_EQ(PeopleTranslator::formatDate({{"year", 2000}}), "");
    EXPECT_EQ(PeopleTranslator::formatDate(nullptr), "");
}

TEST(PeopleTranslatorTest, ParseDate) {
    json expected = {{"year", 1990}, {"month", 6}, {"day", 15}};
    EXPECT_EQ(PeopleTranslator::parseDate("19900615"), expected);
    EXPECT_EQ(PeopleTranslator::parseDate("1990-06-15"), expected);
    EXPECT_EQ(PeopleTranslator::parseDate("--0310"), json({{"year", 0}, {"month", 3}, {"day", 10}}));
    EXPECT_FALSE(PeopleTranslator::parseDate("--0229").is_null());
    EXPECT_FALSE(PeopleTranslator::parseDate("20240229").is_null());

    EXPECT_TRUE(PeopleTranslator::parseDate("20230229").is_null());
    EXPECT_TRUE(PeopleTranslator::parseDate("19901315").is_null());
    EXPECT_TRUE(PeopleTranslator::parseDate("199006").is_null());
    EXPECT_TRUE(PeopleTranslator::parseDate("June 15").is_null());
}

TEST(PeopleTranslatorTest, InvalidBirthdayIsDroppedFromPayload) {
    auto contact = Contact::fresh("Ada");
    contact->card()->setValue("BDAY", "not a date");
    EXPECT_FALSE(PeopleTranslator::personFromContact(contact).count("birthdays"));
}

TEST(PeopleTranslatorTest, ExtensionKey) {
    EXPECT_EQ(PeopleTranslator::extensionKey(EXT_CUSTOM_PREFIX, "Shirt Size"), "X-GOOGLE-CUSTOM-SHIRT-SIZE");
    EXPECT_EQ(PeopleTranslator::extensionKey(EXT_CLIENT_PREFIX, "app_id.v2"), "X-GOOGLE-CLIENT-APP-ID-V2");
}

TEST(PeopleTranslatorTest, SipAddressesFollowImClients) {
    json person = {
        {"resourceName", "people/c1"},
        {"sipAddresses", {{{"value", "jane@sip.example.com"}, {"type", "Work"}}}},
        {"imClients", {
            {{"username", "jdoe"}, {"protocol", "Skype"}},
            {{"username", "jane"}, {"protocol", "XMPP"}, {"type", "Home"}},
        }},
    };
    auto impp = PeopleTranslator::contactFromPerson(person)->card()->propertiesWithName("IMPP");

    ASSERT_EQ(impp.size(), 3u);
    EXPECT_EQ(impp[0]->getValue(), "skype:jdoe");
    EXPECT_EQ(impp[1]->getValue(), "xmpp:jane");
    EXPECT_EQ(impp[1]->getType(), "home");
    EXPECT_EQ(impp[2]->getValue(), "sip:jane@sip.example.com");
    EXPECT_EQ(impp[2]->getType(), "work");
}

TEST(PeopleTranslatorTest, RelationsAndCalendarsHaveLowercaseTypes) {
    json person = {
        {"resourceName", "people/c1"},
        {"relations", {{{"person", "John Doe"}, {"type", "Spouse"}}}},
        {"calendarUrls", {{{"url", "https://cal.example.com/jane"}, {"type", "Availability"}}}},
    };
    auto card = PeopleTranslator::contactFromPerson(person)->card();

    auto related = card->firstPropertyWithName("RELATED");
    ASSERT_NE(related, nullptr);
    EXPECT_EQ(related->getValue(), "John Doe");
    EXPECT_EQ(related->getType(), "spouse");

    auto caluri = card->firstPropertyWithName("CALURI");
    ASSERT_NE(caluri, nullptr);
    EXPECT_EQ(caluri->getValue(), "https://cal.example.com/jane");
    EXPECT_EQ(caluri->getType(), "availability");
}

TEST(PeopleTranslatorTest, ExtensionTypesKeepGoogleCase) {
    json person = {
        {"resourceName", "people/c1"},
        {"locations", {{{"value", "Building 4"}, {"type", "deskLocation"}}}},
        {"externalIds", {{{"value", "E-1001"}, {"type", "Employee"}}}},
        {"miscKeywords", {{{"value", "vip"}, {"type", "OUTLOOK_BILLING_INFORMATION"}}}},
    };
    auto card = PeopleTranslator::contactFromPerson(person)->card();

    EXPECT_EQ(card->firstPropertyWithName(EXT_LOCATION)->getType(), "deskLocation");
    EXPECT_EQ(card->getValue(EXT_LOCATION), "Building 4");
    EXPECT_EQ(card->firstPropertyWithName(EXT_EXTERNAL_ID)->getType(), "Employee");
    EXPECT_EQ(card->getValue(EXT_EXTERNAL_ID), "E-1001");
    EXPECT_EQ(card->firstPropertyWithName(EXT_KEYWORD)->getType(), "OUTLOOK_BILLING_INFORMATION");
    EXPECT_EQ(card->getValue(EXT_KEYWORD), "vip");
}

TEST(PeopleTranslatorTest, ClientDataAndMetadataExtensions) {
    json person = {
        {"resourceName", "people/c1"},
        {"clientData", {{{"key", "sync.app"}, {"value", "42"}}}},
        {"coverPhotos", {{{"url", "https://example.com/cover.jpg"}}}},
        {"ageRanges", {{{"ageRange", "TWENTY_ONE_OR_OLDER"}}}},
        {"metadata", {{"sources", {{{"type", "CONTACT"}, {"id", "abc123"}}}}}},
    };
    auto card = PeopleTranslator::contactFromPerson(person)->card();

    EXPECT_EQ(card->getValue("X-GOOGLE-CLIENT-SYNC-APP"), "42");
    EXPECT_EQ(card->getValue(EXT_COVER_PHOTO), "https://example.com/cover.jpg");
    EXPECT_EQ(card->getValue(EXT_AGE_RANGE), "TWENTY_ONE_OR_OLDER");
    auto source = card->firstPropertyWithName(EXT_SOURCE);
    ASSERT_NE(source, nullptr);
    EXPECT_EQ(source->getValue(), "abc123");
    EXPECT_EQ(source->getType(), "CONTACT");
}

TEST(PeopleTranslatorTest, ExtensionKeyReplacesPunctuation) {
    EXPECT_EQ(PeopleTranslator::extensionKey(EXT_CUSTOM_PREFIX, "a.b"), "X-GOOGLE-CUSTOM-A-B");
    EXPECT_EQ(PeopleTranslator::extensionKey(EXT_CUSTOM_PREFIX, "Size (cm)!"), "X-GOOGLE-CUSTOM-SIZE--CM--");
    EXPECT_EQ(PeopleTranslator::extensionKey(EXT_CUSTOM_PREFIX, "tab\there:x;y"), "X-GOOGLE-CUSTOM-TAB-HERE-X-Y");
}

TEST(PeopleTranslatorTest, NameComponentsWithBackslashesSurviveTheCard) {
    json person = {
        {"resourceName", "people/c1"},
        {"names", {{{"familyName", "Smith\\"}, {"givenName", "John"}}}},
    };
    auto contact = PeopleTranslator::contactFromPerson(person);
    auto reloaded = std::make_shared<Contact>(contact->serialize());

    json payload = PeopleTranslator::personFromContact(reloaded);
    EXPECT_EQ(payload["names"][0]["familyName"], "Smith\\");
    EXPECT_EQ(payload["names"][0]["givenName"], "John");
}
