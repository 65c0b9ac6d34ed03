// tests/cardsets/test_decklist.cpp
#include "cardsets/decklist.h"
#include "cardsets/card_registry.h"

#include <gtest/gtest.h>
#include <sstream>

class DeckListTest : public ::testing::Test {
protected:
    void SetUp() override {
        registerAllCards();
    }
};

TEST_F(DeckListTest, ParsesQuantitiesAndBareNames) {
    std::istringstream input(
        "4 Lightning Bolt\n"
        "20x Mountain (LEA) 293\n"
        "Shivan Dragon\n"
        "2 Lightning Bolt\n");

    PlayerConfig config = parseDeckList(input, "Burn");

    EXPECT_EQ(config.name, "Burn");
    EXPECT_EQ(config.decklist.at("Lightning Bolt"), 6);
    EXPECT_EQ(config.decklist.at("Mountain"), 20);
    EXPECT_EQ(config.decklist.at("Shivan Dragon"), 1);
    EXPECT_EQ(config.deckSize(), 27);
}

TEST_F(DeckListTest, SkipsCommentsUnknownCardsAndSideboard) {
    std::istringstream input(
        "// main deck\n"
        "# creatures\n"
        "\n"
        "4 Grizzly Bears\n"
        "3 Tarmogoyf\n"
        "Sideboard\n"
        "4 Terror\n");

    PlayerConfig config = parseDeckList(input, "Green");

    EXPECT_EQ(config.decklist.size(), 1u);
    EXPECT_EQ(config.decklist.at("Grizzly Bears"), 4);
    EXPECT_FALSE(config.decklist.contains("Terror"));
}

TEST_F(DeckListTest, AboutSectionNamesTheDeck) {
    std::istringstream input(
        "About\n"
        "Name Monk Control\n"
        "\n"
        "Deck\n"
        "4 Venerable Monk\n"
        "16 Plains\n");

    PlayerConfig config = parseDeckList(input, "unnamed");

    EXPECT_EQ(config.name, "Monk Control");
    EXPECT_EQ(config.deckSize(), 20);
}

TEST_F(DeckListTest, MissingFileThrows) {
    EXPECT_THROW(loadDeckList("/nonexistent/deck.txt"), std::runtime_error);
}

TEST(CardRegistryTest, FindAndInstantiate) {
    registerAllCards();
    const CardRegistry& registry = CardRegistry::instance();

    const Card* bolt = registry.find("Lightning Bolt");
    ASSERT_NE(bolt, nullptr);
    EXPECT_TRUE(bolt->types.isInstant());
    EXPECT_EQ(bolt->colors, (Colors{Color::RED}));
    EXPECT_EQ(registry.find("Mox Emerald"), nullptr);
    EXPECT_THROW(registry.instantiate("Mox Emerald"), std::runtime_error);

    std::unique_ptr<Card> angel = registry.instantiate("Serra Angel");
    EXPECT_TRUE(angel->hasKeyword(Keyword::FLYING));
    EXPECT_TRUE(angel->hasKeyword(Keyword::VIGILANCE));
    EXPECT_EQ(angel->power.value(), 4);
}

TEST(CardRegistryTest, RegisteringTwiceIsHarmless) {
    registerAllCards();
    size_t count = CardRegistry::instance().names().size();
    registerAllCards();
    EXPECT_EQ(CardRegistry::instance().names().size(), count);
    EXPECT_THROW(CardRegistry::instance().registerCard("Forest", *CardRegistry::instance().find("Forest")),
                 std::runtime_error);
}

TEST(CardRegistryTest, BasicLandsTapForTheirColor) {
    registerAllCards();
    const Card* island = CardRegistry::instance().find("Island");
    ASSERT_NE(island, nullptr);
    ASSERT_EQ(island->abilities.size(), 1u);
    EXPECT_EQ(island->abilities[0].type, AbilityType::MANA);
    EXPECT_EQ(island->abilities[0].producedMana().amount(Color::BLUE), 1);
    EXPECT_TRUE(island->colors.empty());
}

TEST_F(DeckListTest, OversizedQuantityIsSkipped) {
    std::istringstream input(
        "99999999999999999999 Mountain\n"
        "4 Grizzly Bears\n");

    PlayerConfig config;
    ASSERT_NO_THROW(config = parseDeckList(input, "Green"));
    EXPECT_FALSE(config.decklist.contains("Mountain"));
    EXPECT_EQ(config.decklist.at("Grizzly Bears"), 4);
}
