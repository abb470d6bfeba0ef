#include <gtest/gtest.h>
#include "contactsync/contact_formatter.hpp"
#include "contactsync/people_translator.hpp"

#include <algorithm>

using json = nlohmann::json;

static std::shared_ptr<Contact> ada() {
    return PeopleTranslator::contactFromPerson({
        {"resourceName", "people/c1"},
        {"etag", "e1"},
        {"names", {{{"displayName", "Ada Lovelace"}, {"familyName", "Lovelace"}, {"givenName", "Ada"}}}},
        {"nicknames", {{{"value", "Enchantress"}}}},
        {"phoneNumbers", {{{"value", "555-0100"}, {"type", "Work"}}, {{"value", "555-0199"}, {"type", "mobile"}}}},
        {"emailAddresses", {{{"value", "ada@example.com"}}}},
        {"addresses", {{{"streetAddress", "12 St James's Square"}, {"city", "London"}, {"country", "UK"}, {"type", "home"}}}},
        {"organizations", {{{"name", "Analytical Engines"}, {"title", "Countess"}}}},
        {"birthdays", {{{"date", {{"year", 1815}, {"month", 12}, {"day", 10}}}}}},
        {"interests", {{{"value", "mathematics"}}}},
    });
}

static bool hasLine(std::string text, std::string label, std::string value) {
    std::string padded = label + ":";
    padded += std::string(padded.size() < 11 ? 11 - padded.size() : 1, ' ');
    return text.find("  " + padded + value + "\n") != std::string::npos;
}

TEST(ContactFormatter, CardStartsWithUnderlinedName) {
    std::string card = ContactFormatter::formatCard(ada());
    EXPECT_EQ(card.find("Ada Lovelace\n------------\n"), 0u);
}

TEST(ContactFormatter, CardListsFieldsWithTypeLabels) {
    std::string card = ContactFormatter::formatCard(ada()) + "\n";

    EXPECT_TRUE(hasLine(card, "Nickname", "Enchantress"));
    EXPECT_TRUE(hasLine(card, "Work", "Countess, Analytical Engines"));
    EXPECT_TRUE(hasLine(card, "Phone", "555-0100 (work)"));
    EXPECT_TRUE(hasLine(card, "Phone", "555-0199 (mobile)"));
    EXPECT_TRUE(hasLine(card, "Email", "ada@example.com (email)"));
    EXPECT_TRUE(hasLine(card, "Address", "12 St James's Square, London, UK (home)"));
    EXPECT_TRUE(hasLine(card, "Birthday", "Dec 10, 1815"));
    EXPECT_TRUE(hasLine(card, "Interest", "mathematics"));
    EXPECT_TRUE(hasLine(card, "UID", "c1"));
}

TEST(ContactFormatter, CardHasNoTrailingNewline) {
    std::string card = ContactFormatter::formatCard(ada());
    ASSERT_FALSE(card.empty());
    EXPECT_NE(card.back(), '\n');
}

TEST(ContactFormatter, TableColumnsArePadded) {
    auto contact = Contact::fresh("Ada Lovelace");
    contact->card()->addProperty("EMAIL", "ada@example.com");
    contact->card()->addProperty("TEL", "555");
    std::string uid = contact->uid();

    std::string table = ContactFormatter::formatTable({contact});

    size_t uidWidth = std::max<size_t>(uid.size(), 3);
    std::string header = "UID" + std::string(uidWidth - 3 + 2, ' ') + "NAME" + std::string(10, ' ') + "EMAIL" + std::string(12, ' ') + "PHONE\n";
    std::string row = uid + std::string(uidWidth - uid.size() + 2, ' ') + "Ada Lovelace  ada@example.com  555\n";
    EXPECT_EQ(table, header + row);
}

TEST(ContactFormatter, EmptyTableIsJustTheHeader) {
    EXPECT_EQ(ContactFormatter::formatTable({}), "UID  NAME  EMAIL  PHONE\n");
}

TEST(ContactFormatter, JSONDescribesGoogleContact) {
    json j = ContactFormatter::toJSON(ada());

    EXPECT_EQ(j["uid"], "c1");
    EXPECT_EQ(j["full_name"], "Ada Lovelace");
    EXPECT_EQ(j["name"]["family"], "Lovelace");
    EXPECT_EQ(j["name"]["given"], "Ada");
    EXPECT_EQ(j["phones"].size(), 2u);
    EXPECT_EQ(j["phones"][0]["type"], "work");
    EXPECT_EQ(j["addresses"][0]["city"], "London");
    EXPECT_EQ(j["organization"], "Analytical Engines");
    EXPECT_EQ(j["title"], "Countess");
    EXPECT_EQ(j["birthday"], "18151210");
    EXPECT_EQ(j["origin"], "google");

    ASSERT_EQ(j["extensions"].size(), 1u);
    EXPECT_EQ(j["extensions"][0]["name"], "X-GOOGLE-INTEREST");
}

TEST(ContactFormatter, JSONMarksLocalContacts) {
    json j = ContactFormatter::toJSON(Contact::fresh("Grace"));
    EXPECT_EQ(j["origin"], "local");
    EXPECT_EQ(j["extensions"].size(), 0u);
    EXPECT_TRUE(j["phones"].is_array());
}

TEST(ContactFormatter, VCFConcatenatesCards) {
    auto a = Contact::fresh("Ada");
    auto b = Contact::fresh("Grace");
    EXPECT_EQ(ContactFormatter::formatVCF({a, b}), a->serialize() + b->serialize());
}

TEST(ContactFormatter, DisplayDates) {
    EXPECT_EQ(ContactFormatter::formatDisplayDate("19900615"), "Jun 15, 1990");
    EXPECT_EQ(ContactFormatter::formatDisplayDate("1990-06-15"), "Jun 15, 1990");
    EXPECT_EQ(ContactFormatter::formatDisplayDate("--0310"), "Mar 10");
    EXPECT_EQ(ContactFormatter::formatDisplayDate("someday"), "someday");
}

TEST(ContactFormatter, AddressSkipsEmptyComponents) {
    EXPECT_EQ(ContactFormatter::formatAddress(";;1 Main St;Springfield;;62701;USA"), "1 Main St, Springfield, 62701, USA");
    EXPECT_EQ(ContactFormatter::formatAddress(";;;;;;"), "");
}
