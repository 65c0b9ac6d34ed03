// tests/zones/test_stack.cpp
#include "test_helpers.h"

class StackTest : public GameTest {};

TEST_F(StackTest, PopOnEmptyStackThrows) {
    EXPECT_TRUE(game->zones->stack->empty());
    EXPECT_EQ(game->zones->stack->top(), nullptr);
    EXPECT_EQ(game->zones->stack->peek(), nullptr);
    EXPECT_THROW(game->zones->stack->pop(), std::logic_error);
}

TEST_F(StackTest, SpellCardMovesToStackZone) {
    mainStep();
    Card* bolt = inHand("Lightning Bolt", alice);
    addMana(alice, "R");

    StackObject* object = game->spells->castSpell(bolt, alice, {Target::player(bob->id)});

    EXPECT_EQ(game->zones->stack->size(), 1u);
    EXPECT_EQ(game->zones->stack->top(), object);
    EXPECT_EQ(game->zones->stack->peek(), object);
    EXPECT_EQ(bolt->current_zone, game->zones->stack.get());
    EXPECT_FALSE(game->zones->hand->contains(bolt, alice->id));
    EXPECT_EQ(game->zones->stack->find(object->id), object);
}

TEST_F(StackTest, ResolvesLastInFirstOut) {
    mainStep();
    Card* first = inHand("Lightning Bolt", alice);
    Card* second = inHand("Lightning Bolt", alice);
    Card* third = inHand("Lightning Bolt", alice);
    addMana(alice, "RRR");

    game->spells->castSpell(first, alice, {Target::player(bob->id)});
    game->spells->castSpell(second, alice, {Target::player(bob->id)});
    game->spells->castSpell(third, alice, {Target::player(bob->id)});
    ASSERT_EQ(game->zones->stack->size(), 3u);

    std::vector<Card*> resolved;
    while (!game->zones->stack->empty()) {
        resolved.push_back(game->zones->stack->top()->card);
        game->spells->resolveTop();
    }

    EXPECT_EQ(resolved, (std::vector<Card*>{third, second, first}));
    EXPECT_EQ(bob->life, 11);
    EXPECT_TRUE(inGraveyard(first));
    EXPECT_TRUE(inGraveyard(third));
}
