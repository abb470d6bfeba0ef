#include <gtest/gtest.h>
#include "contactsync/models/contact.hpp"
#include "contactsync/constants.hpp"

TEST(ContactTest, FreshContactHasLocalId) {
    auto contact = Contact::fresh("Ada Lovelace");

    EXPECT_NE(contact->uid(), "");
    EXPECT_EQ(contact->id().origin(), ContactOrigin::Local);
    EXPECT_EQ(contact->googleResourceName(), "");
    EXPECT_EQ(contact->fullName(), "Ada Lovelace");
    EXPECT_EQ(contact->card()->getValue("VERSION"), VCARD_VERSION);
}

TEST(ContactTest, ResourceNameMarksProviderOrigin) {
    auto contact = Contact::fresh("Ada");
    contact->setId(ContactId::provider("c77"));

    EXPECT_TRUE(contact->id().isProvider());
    EXPECT_EQ(contact->uid(), "c77");
    EXPECT_EQ(contact->googleResourceName(), "people/c77");
    EXPECT_EQ(contact->id(), ContactId::provider("c77"));

    contact->setId(ContactId::local("abc"));
    EXPECT_FALSE(contact->id().isProvider());
    EXPECT_EQ(contact->googleResourceName(), "");
}

TEST(ContactTest, IdentifierShapeDoesNotImplyOrigin) {
    // a local id that happens to look like a Google one
    Contact contact("BEGIN:VCARD\r\nUID:c123456\r\nFN:Ada\r\nEND:VCARD\r\n");
    EXPECT_EQ(contact.id(), ContactId::local("c123456"));
}

TEST(ContactTest, PrimaryPhoneIsFirstWhenNoMobile) {
    auto contact = Contact::fresh("Ada");
    contact->card()->addProperty("TEL", "111", "home");
    contact->card()->addProperty("TEL", "222", "work");
    EXPECT_EQ(contact->primaryPhone(), "111");
}

TEST(ContactTest, PrimaryPhonePrefersMobileRegardlessOfPosition) {
    auto contact = Contact::fresh("Ada");
    contact->card()->addProperty("TEL", "111", "home");
    contact->card()->addProperty("TEL", "222", "work");
    contact->card()->addProperty("TEL", "333", "voice,Mobile");
    EXPECT_EQ(contact->primaryPhone(), "333");

    auto cell = Contact::fresh("Bob");
    cell->card()->addProperty("TEL", "444", "cell");
    cell->card()->addProperty("TEL", "555");
    EXPECT_EQ(cell->primaryPhone(), "444");
}

TEST(ContactTest, PrimaryValuesAreEmptyWithoutFields) {
    auto contact = Contact::fresh("Ada");
    EXPECT_EQ(contact->primaryPhone(), "");
    EXPECT_EQ(contact->primaryEmail(), "");

    contact->card()->addProperty("EMAIL", "a@example.com");
    contact->card()->addProperty("EMAIL", "b@example.com");
    EXPECT_EQ(contact->primaryEmail(), "a@example.com");
}

TEST(ContactTest, NamePartsArePaddedToFive) {
    auto contact = Contact::fresh("Ada");
    contact->card()->setValue("N", "Lovelace;Ada");
    auto parts = contact->nameParts();
    ASSERT_EQ(parts.size(), 5u);
    EXPECT_EQ(parts[0], "Lovelace");
    EXPECT_EQ(parts[1], "Ada");
    EXPECT_EQ(parts[4], "");
}

TEST(ContactTest, TimestampsAreUTC) {
    auto contact = Contact::fresh("Ada");
    contact->setRevision(0);
    contact->setLastSynced(86400 + 3661);
    EXPECT_EQ(contact->revision(), "19700101T000000Z");
    EXPECT_EQ(contact->lastSynced(), "19700102T010101Z");
}
