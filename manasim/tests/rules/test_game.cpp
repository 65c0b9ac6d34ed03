// tests/rules/test_game.cpp
#include "test_helpers.h"
#include "rules/errors.h"

namespace {

PlayerConfig redDeck() {
    return PlayerConfig("Red", {{"Mountain", 16}, {"Gray Ogre", 8}, {"Hill Giant", 8}, {"Lightning Bolt", 8}});
}

PlayerConfig greenDeck() {
    return PlayerConfig("Green", {{"Forest", 16}, {"Llanowar Elves", 8}, {"Grizzly Bears", 8}, {"Giant Growth", 8}});
}

GameResult playGame(unsigned int seed, int max_turns = 100) {
    registerAllCards();
    GameConfig config;
    config.seed = seed;
    config.max_turns = max_turns;
    Game game(config);
    game.addPlayer(redDeck());
    game.addPlayer(greenDeck());
    return game.start();
}

} // namespace

TEST(GameSetupTest, AddPlayerRejectsUnknownCards) {
    registerAllCards();
    Game game;
    EXPECT_THROW(game.addPlayer(PlayerConfig("Bad", {{"Black Lotus Deluxe", 1}})), std::invalid_argument);
    EXPECT_TRUE(game.players.empty());
}

TEST(GameSetupTest, AtMostTwoPlayers) {
    registerAllCards();
    Game game;
    game.addPlayer(redDeck());
    EXPECT_THROW(game.start(), std::invalid_argument);
    game.addPlayer(greenDeck());
    EXPECT_THROW(game.addPlayer(redDeck()), std::invalid_argument);
}

TEST(GameSetupTest, LibrariesAreBuiltFromDecklists) {
    registerAllCards();
    Game game;
    Player* red = game.addPlayer(redDeck());
    Player* green = game.addPlayer(greenDeck());

    EXPECT_EQ(game.zones->library->numCards(red->id), 40u);
    EXPECT_EQ(game.zones->library->numCards(green->id), 40u);
    EXPECT_EQ(game.cards.size(), 80u);
    EXPECT_TRUE(red->isOpponent(green->id));
    EXPECT_TRUE(green->isOpponent(red->id));
}

TEST(GameSetupTest, SameNamedDecksAreToldApartByPlayerId) {
    registerAllCards();
    GameConfig config;
    config.shuffle_libraries = false;
    Game game(config);
    Player* first = game.addPlayer(PlayerConfig("deck", {{"Mountain", 5}}));
    Player* second = game.addPlayer(PlayerConfig("deck", {{"Forest", 5}}));
    EXPECT_EQ(first->id, 0);
    EXPECT_EQ(second->id, 1);

    second->life = 0;
    game.state_based_actions->check();
    ASSERT_TRUE(game.result.hasWinner());
    EXPECT_EQ(*game.result.winner_id, first->id);
    EXPECT_EQ(*game.result.loser_id, second->id);
}

TEST(GamePlayTest, FullGameEndsWithAWinner) {
    GameResult result = playGame(7);
    ASSERT_TRUE(result.hasWinner());
    EXPECT_FALSE(result.budget_exhausted);
    EXPECT_NE(*result.winner_id, *result.loser_id);
    EXPECT_GT(result.turns, 1);
}

TEST(GamePlayTest, SameSeedPlaysTheSameGame) {
    GameResult first = playGame(42);
    GameResult second = playGame(42);
    EXPECT_EQ(first.winner_id, second.winner_id);
    EXPECT_EQ(first.turns, second.turns);
}

TEST(GamePlayTest, TurnBudgetEndsGameWithoutWinner) {
    GameResult result = playGame(3, 2);
    EXPECT_TRUE(result.budget_exhausted);
    EXPECT_FALSE(result.hasWinner());
    EXPECT_EQ(result.turns, 2);
}

class LandPlayTest : public GameTest {};

TEST_F(LandPlayTest, OneLandPerTurnDuringOwnMainStep) {
    Card* first = inHand("Mountain", alice);
    Card* second = inHand("Mountain", alice);

    game->enterStep(StepKind::UPKEEP);
    EXPECT_THROW(game->playLand(alice, first), IllegalTimingError);

    // Land drops are counted per turn.
    game->turn_system->startNextTurn();
    mainStep();
    game->playLand(alice, first);
    EXPECT_EQ(game->zones->battlefield->lands(alice->id).size(), 1u);
    EXPECT_THROW(game->playLand(alice, second), IllegalTimingError);
    EXPECT_THROW(game->playLand(bob, second), std::invalid_argument);
}
