#include <gtest/gtest.h>
#include "contactsync/vcard.hpp"

TEST(VCardTest, ParsesFoldedLinesGroupsAndParameters) {
    std::string vcf =
        "BEGIN:VCARD\r\n"
        "VERSION:4.0\r\n"
        "UID:abc\r\n"
        "FN:Jane\r\n"
        "  Doe\r\n"
        "item1.TEL;TYPE=cell:+1 555 0100\r\n"
        "NOTE:line one\\nline two\r\n"
        "END:VCARD\r\n";
    VCard card(vcf);

    EXPECT_FALSE(card.incomplete());
    EXPECT_EQ(card.getValue("FN"), "Jane Doe");
    EXPECT_EQ(card.getValue("uid"), "abc");

    auto tel = card.firstPropertyWithName("TEL");
    ASSERT_NE(tel, nullptr);
    EXPECT_EQ(tel->getGroup(), "item1");
    EXPECT_EQ(tel->getType(), "cell");
    EXPECT_EQ(tel->getValue(), "+1 555 0100");

    EXPECT_EQ(card.getValue("NOTE"), "line one\nline two");
}

TEST(VCardTest, AcceptsBareLineFeeds) {
    VCard card("BEGIN:VCARD\nFN:Ada\nEND:VCARD\n");
    EXPECT_FALSE(card.incomplete());
    EXPECT_EQ(card.getValue("FN"), "Ada");
}

TEST(VCardTest, BareParameterIsTreatedAsType) {
    VCard card("BEGIN:VCARD\r\nTEL;CELL:123\r\nEND:VCARD\r\n");
    EXPECT_EQ(card.firstPropertyWithName("TEL")->getType(), "CELL");
}

TEST(VCardTest, MissingEndIsIncomplete) {
    VCard card("BEGIN:VCARD\r\nFN:Ada\r\n");
    EXPECT_TRUE(card.incomplete());
}

TEST(VCardTest, LineWithoutColonIsIncomplete) {
    VCard card("BEGIN:VCARD\r\nFN:Ada\r\ngarbage\r\nEND:VCARD\r\n");
    EXPECT_TRUE(card.incomplete());
}

TEST(VCardTest, NewCardIsComplete) {
    VCard card;
    EXPECT_FALSE(card.incomplete());
    EXPECT_EQ(card.serialize(), "BEGIN:VCARD\r\nEND:VCARD\r\n");
}

TEST(VCardTest, SerializeEscapesValuesAndSkipsEmptyOnes) {
    VCard card;
    card.addProperty("FN", "Ada");
    card.addProperty("NOTE", "a\\b\nc");
    card.addProperty("EMAIL", "");
    card.addProperty("TEL", "123", "work");

    EXPECT_EQ(card.serialize(),
        "BEGIN:VCARD\r\n"
        "FN:Ada\r\n"
        "NOTE:a\\\\b\\nc\r\n"
        "TEL;TYPE=work:123\r\n"
        "END:VCARD\r\n");

    VCard parsed(card.serialize());
    EXPECT_EQ(parsed.getValue("NOTE"), "a\\b\nc");
}

TEST(VCardTest, QuotesParametersContainingSeparators) {
    VCardProperty prop("TEL", "1", "work,voice");
    EXPECT_EQ(prop.serialize(), "TEL;TYPE=\"work,voice\":1");

    VCardProperty parsed(prop.serialize());
    EXPECT_EQ(parsed.getType(), "work,voice");
    EXPECT_EQ(parsed.getValue(), "1");
}

TEST(VCardTest, SetValueReplacesAllProperties) {
    VCard card;
    card.addProperty("EMAIL", "a@example.com");
    card.addProperty("EMAIL", "b@example.com");
    card.setValue("EMAIL", "c@example.com");

    auto emails = card.propertiesWithName("EMAIL");
    ASSERT_EQ(emails.size(), 1u);
    EXPECT_EQ(emails[0]->getValue(), "c@example.com");
}

TEST(VCardTest, ExtendedPropertiesAreThoseStartingWithX) {
    VCard card;
    card.addProperty("FN", "Ada");
    card.addProperty("X-GOOGLE-SKILL", "math");
    card.addProperty("X-LAST-SYNCED", "20240101T000000Z");

    auto ext = card.getExtendedProperties();
    ASSERT_EQ(ext.size(), 2u);
    EXPECT_EQ(ext[0]->getName(), "X-GOOGLE-SKILL");
}

TEST(VCardTest, StructuredComponentsKeepEscapedSemicolons) {
    std::string joined = VCardProperty::joinComponents({"Smith; Jones", "Anne"});
    EXPECT_EQ(joined, "Smith\\; Jones;Anne");

    auto parts = VCardProperty::splitComponents(joined);
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0], "Smith; Jones");
    EXPECT_EQ(parts[1], "Anne");

    VCard card;
    card.addProperty("N", joined);
    VCard parsed(card.serialize());
    EXPECT_EQ(parsed.getValue("N"), joined);
}

TEST(VCardTest, SplitComponentsHonorsMaximum) {
    auto parts = VCardProperty::splitComponents("a;b;c;d", 2);
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0], "a");
    EXPECT_EQ(parts[1], "b;c;d");

    auto empty = VCardProperty::splitComponents("Doe;Jane;;;", 5);
    ASSERT_EQ(empty.size(), 5u);
    EXPECT_EQ(empty[1], "Jane");
    EXPECT_EQ(empty[4], "");
}

TEST(VCardTest, ComponentEndingInBackslashKeepsItsNeighbours) {
    std::string joined = VCardProperty::joinComponents({"Smith\\", "John", "", "", ""});
    EXPECT_EQ(joined, "Smith\\\\;John;;;");

    auto parts = VCardProperty::splitComponents(joined, 5);
    ASSERT_EQ(parts.size(), 5u);
    EXPECT_EQ(parts[0], "Smith\\");
    EXPECT_EQ(parts[1], "John");

    VCard card;
    card.addProperty("N", joined);
    card.addProperty("NOTE", "C:\\temp");
    VCard parsed(card.serialize());
    EXPECT_EQ(parsed.getValue("N"), joined);
    EXPECT_EQ(parsed.getValue("NOTE"), "C:\\temp");

    auto reparsed = VCardProperty::splitComponents(parsed.getValue("N"), 5);
    ASSERT_EQ(reparsed.size(), 5u);
    EXPECT_EQ(reparsed[0], "Smith\\");
    EXPECT_EQ(reparsed[1], "John");
}

TEST(VCardTest, ParameterLineBreaksAreCaretEncoded) {
    VCard card;
    card.addProperty("FN", "Ada");
    card.addProperty("X-GOOGLE-EVENT", "--0310", "Graduation\nParty \"2020\" ^_^");

    std::string vcf = card.serialize();
    EXPECT_NE(vcf.find("TYPE=Graduation^nParty ^'2020^' ^^_^^:--0310"), std::string::npos);

    VCard parsed(vcf);
    EXPECT_FALSE(parsed.incomplete());
    auto event = parsed.firstPropertyWithName("X-GOOGLE-EVENT");
    ASSERT_NE(event, nullptr);
    EXPECT_EQ(event->getType(), "Graduation\nParty \"2020\" ^_^");
    EXPECT_EQ(event->getValue(), "--0310");
}
