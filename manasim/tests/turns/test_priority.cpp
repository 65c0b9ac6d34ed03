// tests/turns/test_priority.cpp
#include "test_helpers.h"
#include "agents/action.h"
#include "rules/errors.h"

#include <algorithm>

class PriorityTest : public GameTest {};

TEST_F(PriorityTest, ActivePlayerReceivesPriorityFirst) {
    mainStep();
    EXPECT_TRUE(game->priority_system->hasPriority(alice));
    EXPECT_FALSE(game->priority_system->hasPriority(bob));
    EXPECT_EQ(game->priority_system->playerWithPriority(), alice);
}

TEST_F(PriorityTest, PassingWithoutPriorityThrows) {
    mainStep();
    EXPECT_THROW(game->priority_system->passPriority(bob), std::logic_error);
}

TEST_F(PriorityTest, AllPassOnEmptyStackEndsStep) {
    mainStep();
    game->priority_system->passPriority(alice);
    EXPECT_TRUE(game->priority_system->hasPriority(bob));
    EXPECT_FALSE(game->priority_system->isComplete());

    game->priority_system->passPriority(bob);
    EXPECT_TRUE(game->priority_system->isComplete());
    EXPECT_FALSE(game->priority_system->hasPriority(alice));
}

TEST_F(PriorityTest, AllPassResolvesTopAndReturnsPriorityToActivePlayer) {
    mainStep();
    Card* bolt = inHand("Lightning Bolt", alice);
    addMana(alice, "R");
    game->spells->castSpell(bolt, alice, {Target::player(bob->id)});

    game->priority_system->passPriority(alice);
    game->priority_system->passPriority(bob);

    EXPECT_TRUE(game->zones->stack->empty());
    EXPECT_EQ(bob->life, 17);
    EXPECT_FALSE(game->priority_system->isComplete());
    EXPECT_TRUE(game->priority_system->hasPriority(alice));
}

TEST_F(PriorityTest, CasterReceivesPriorityAfterCasting) {
    mainStep();
    Card* bolt = inHand("Lightning Bolt", bob);
    addMana(bob, "R");

    game->priority_system->passPriority(alice);
    game->spells->castSpell(bolt, bob, {Target::player(alice->id)});

    EXPECT_TRUE(game->priority_system->hasPriority(bob));
    // Alice passed before the cast; the chain starts over.
    game->priority_system->passPriority(bob);
    EXPECT_TRUE(game->priority_system->hasPriority(alice));
    EXPECT_FALSE(game->zones->stack->empty());
}

TEST_F(PriorityTest, OffersLandsSpellsAndPassInOrder) {
    mainStep();
    inHand("Mountain", alice);
    inHand("Gray Ogre", alice);
    inHand("Hill Giant", alice);
    for (int i = 0; i < 3; i++) {
        onBattlefield("Mountain", alice);
    }

    std::vector<std::unique_ptr<Action>> actions = game->priority_system->availablePriorityActions(alice);

    // Hill Giant costs four; only three lands are out.
    ASSERT_EQ(actions.size(), 3u);
    EXPECT_NE(dynamic_cast<PlayLand*>(actions[0].get()), nullptr);
    auto* cast = dynamic_cast<CastSpell*>(actions[1].get());
    ASSERT_NE(cast, nullptr);
    EXPECT_EQ(cast->card->name, "Gray Ogre");
    EXPECT_NE(dynamic_cast<PassPriority*>(actions[2].get()), nullptr);
}

TEST_F(PriorityTest, NonActivePlayerOnlyGetsInstants) {
    mainStep();
    game->priority_system->passPriority(alice);
    inHand("Grizzly Bears", bob);
    inHand("Forest", bob);
    inHand("Giant Growth", bob);
    onBattlefield("Forest", bob);
    onBattlefield("Forest", bob);
    onBattlefield("Grizzly Bears", bob);

    std::vector<std::unique_ptr<Action>> actions = game->priority_system->availablePriorityActions(bob);

    ASSERT_EQ(actions.size(), 2u);
    auto* cast = dynamic_cast<CastSpell*>(actions[0].get());
    ASSERT_NE(cast, nullptr);
    EXPECT_EQ(cast->card->name, "Giant Growth");
    EXPECT_NE(dynamic_cast<PassPriority*>(actions[1].get()), nullptr);
}

TEST_F(PriorityTest, CastSpellActionTapsLandsForMana) {
    mainStep();
    Card* ogre = inHand("Gray Ogre", alice);
    std::vector<Permanent*> lands;
    for (int i = 0; i < 4; i++) {
        lands.push_back(onBattlefield("Mountain", alice));
    }

    CastSpell action(ogre, alice, game.get());
    action.execute();

    EXPECT_EQ(game->zones->stack->size(), 1u);
    int tapped = std::count_if(lands.begin(), lands.end(), [](Permanent* land) { return land->tapped; });
    EXPECT_EQ(tapped, 3);
    EXPECT_EQ(alice->mana_pool.total(), 0);
}

TEST_F(PriorityTest, RejectedCastLeavesLandsUntapped) {
    mainStep();
    Card* bolt = inHand("Lightning Bolt", alice);
    Permanent* mountain = onBattlefield("Mountain", alice);

    CastSpell bad_target(bolt, alice, game.get(), {Target::permanent(9999)});
    EXPECT_THROW(bad_target.execute(), InvalidTargetError);
    EXPECT_FALSE(mountain->tapped);
    EXPECT_EQ(alice->mana_pool.total(), 0);

    game->priority_system->passPriority(alice);
    CastSpell out_of_turn(bolt, alice, game.get(), {Target::player(bob->id)});
    EXPECT_THROW(out_of_turn.execute(), IllegalTimingError);
    EXPECT_FALSE(mountain->tapped);
    EXPECT_TRUE(game->zones->hand->contains(bolt, alice->id));
}

TEST_F(PriorityTest, RejectedActivationLeavesLandsUntapped) {
    mainStep();
    Permanent* dragon = onBattlefield("Shivan Dragon", alice);
    Permanent* mountain = onBattlefield("Mountain", alice);
    const Ability* firebreathing = &dragon->card->abilities.front();

    game->priority_system->passPriority(alice);
    ActivateAbility action(dragon, firebreathing, alice, game.get());
    EXPECT_THROW(action.execute(), IllegalTimingError);
    EXPECT_FALSE(mountain->tapped);
    EXPECT_EQ(alice->mana_pool.total(), 0);
    EXPECT_EQ(dragon->power(), 5);
}
