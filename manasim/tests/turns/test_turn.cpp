// tests/turns/test_turn.cpp
#include "test_helpers.h"
#include "turns/turn.h"
#include "agents/action.h"

class TurnTest : public GameTest {
protected:
    // Ticks until the given step starts, letting the agents act on the way.
    // Returns whatever the first tick of that step produced.
    std::unique_ptr<ActionSpace> tickUntil(StepKind step) {
        for (int i = 0; i < 1000; i++) {
            std::unique_ptr<ActionSpace> action_space = game->turn_system->tick();
            if (game->current_step == step) {
                return action_space;
            }
            if (action_space) {
                action_space->player->agent->selectAction(action_space.get())->execute();
            }
        }
        ADD_FAILURE() << "never reached step " << toString(step);
        return nullptr;
    }
};

TEST_F(TurnTest, FirstPlayerSkipsFirstDraw) {
    tickUntil(StepKind::PRECOMBAT_MAIN);
    EXPECT_EQ(game->turn_system->global_turn_count, 1);
    EXPECT_EQ(game->zones->hand->numCards(alice->id), 0u);
}

TEST_F(TurnTest, SecondPlayerDrawsOnFirstTurn) {
    tickUntil(StepKind::CLEANUP);
    tickUntil(StepKind::PRECOMBAT_MAIN);
    EXPECT_EQ(game->activePlayer(), bob);
    EXPECT_EQ(game->turn_system->global_turn_count, 2);
    // Drawn card was a Forest, played by the agent at the first chance.
    EXPECT_EQ(game->zones->hand->numCards(bob->id) + game->zones->battlefield->lands(bob->id).size(), 1u);
}

TEST_F(TurnTest, UntapStepUntapsAndClearsSummoningSickness) {
    Permanent* bears = onBattlefield(creature("Bears", "{G}", 2, 2), alice, true);
    bears->tap();

    tickUntil(StepKind::UPKEEP);

    EXPECT_FALSE(bears->tapped);
    EXPECT_FALSE(bears->summoning_sick);
}

TEST_F(TurnTest, CleanupDiscardsAndEndsTurnEffects) {
    for (int i = 0; i < 9; i++) {
        inHand("Gray Ogre", alice);
    }
    Permanent* bears = onBattlefield(creature("Bears", "{G}", 2, 2), bob);
    bears->power_modifier = 3;
    bears->takeDamage(1);

    tickUntil(StepKind::CLEANUP);

    EXPECT_EQ(game->zones->hand->numCards(alice->id), 7u);
    EXPECT_EQ(game->zones->graveyard->numCards(alice->id), 2u);
    EXPECT_EQ(bears->power(), 2);
    EXPECT_EQ(bears->damage, 0);
}

TEST_F(TurnTest, ManaPoolsEmptyBetweenSteps) {
    tickUntil(StepKind::UPKEEP);
    addMana(alice, "RR");
    tickUntil(StepKind::DRAW);
    EXPECT_EQ(alice->mana_pool.total(), 0);
}

TEST_F(TurnTest, AgentAttacksWithEligibleCreatures) {
    onBattlefield(creature("Bears", "{G}", 2, 2), alice);

    tickUntil(StepKind::POSTCOMBAT_MAIN);

    EXPECT_EQ(bob->life, 18);
}

TEST_F(TurnTest, AgentMakesFavorableBlocks) {
    Permanent* attacker = onBattlefield(creature("Bears", "{G}", 2, 2), alice);
    Card* attacker_card = attacker->card;
    onBattlefield(creature("Wall", "{W}", 0, 4), bob);

    tickUntil(StepKind::COMBAT_DAMAGE);
    ASSERT_TRUE(attacker->blocked);
    tickUntil(StepKind::POSTCOMBAT_MAIN);

    EXPECT_EQ(bob->life, 20);
    EXPECT_FALSE(inGraveyard(attacker_card));
    EXPECT_FALSE(attacker->attacking.has_value());
}

TEST_F(TurnTest, GoadedCreatureMustAttack) {
    Permanent* bears = onBattlefield(creature("Bears", "{G}", 2, 2), alice);
    bears->goaded = true;

    std::unique_ptr<ActionSpace> action_space = tickUntil(StepKind::DECLARE_ATTACKERS);

    ASSERT_NE(action_space, nullptr);
    EXPECT_EQ(action_space->action_type, ActionType::DECLARE_ATTACKER);
    EXPECT_EQ(action_space->actions.size(), 1u);
}
