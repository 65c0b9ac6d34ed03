// tests/zones/test_battlefield.cpp
#include "test_helpers.h"

class BattlefieldTest : public GameTest {
protected:
    static Card noncreature(const std::string& name, CardType type) {
        return Card(name, ManaCost::parse("{2}"), CardTypes({type}), {}, {}, {}, {}, {}, "",
                    std::nullopt, std::nullopt);
    }
};

TEST_F(BattlefieldTest, SelectsPermanentsByKindAndController) {
    Permanent* golem = onBattlefield(creature("Golem", "{3}", 3, 3, {}, true), alice);
    Permanent* bears = onBattlefield("Grizzly Bears", alice);
    Permanent* mountain = onBattlefield("Mountain", alice);
    Permanent* aura = onBattlefield(noncreature("Ward", CardType::ENCHANTMENT), alice);
    Permanent* walker = onBattlefield(noncreature("Walker", CardType::PLANESWALKER), alice);
    onBattlefield(noncreature("Other Ward", CardType::ENCHANTMENT), bob);
    Battlefield* battlefield = game->zones->battlefield.get();

    EXPECT_EQ(battlefield->creatures(alice->id), (std::vector<Permanent*>{golem, bears}));
    EXPECT_EQ(battlefield->artifacts(alice->id), (std::vector<Permanent*>{golem}));
    EXPECT_EQ(battlefield->lands(alice->id), (std::vector<Permanent*>{mountain}));
    EXPECT_EQ(battlefield->enchantments(alice->id), (std::vector<Permanent*>{aura}));
    EXPECT_EQ(battlefield->planeswalkers(alice->id), (std::vector<Permanent*>{walker}));
    EXPECT_EQ(battlefield->enchantments(bob->id).size(), 1u);
    EXPECT_TRUE(battlefield->planeswalkers(bob->id).empty());
    EXPECT_EQ(battlefield->permanentsOf(alice->id).size(), 5u);
}

TEST_F(BattlefieldTest, CardTypePredicates) {
    CardTypes enchantment({CardType::ENCHANTMENT});
    CardTypes planeswalker({CardType::PLANESWALKER});
    CardTypes instant({CardType::INSTANT});

    EXPECT_TRUE(enchantment.isEnchantment());
    EXPECT_TRUE(enchantment.isPermanent());
    EXPECT_FALSE(enchantment.isPlaneswalker());
    EXPECT_TRUE(planeswalker.isPlaneswalker());
    EXPECT_TRUE(planeswalker.isPermanent());
    EXPECT_FALSE(instant.isEnchantment());
    EXPECT_FALSE(instant.isPermanent());
}
