// game.h
#pragma once

#include <vector>
#include <memory>
#include <map>
#include <optional>
#include <random>
#include <string>

#include "rules/player.h"
#include "rules/mana.h"
#include "rules/card.h"
#include "zones/zone.h"
#include "zones/stack.h"
#include "zones/battlefield.h"
#include "turns/turn.h"
#include "turns/priority.h"

class SpellCastingEngine;
class StateBasedActionChecker;

struct Zones {
public:
    std::unique_ptr<Graveyard> graveyard;
    std::unique_ptr<Hand> hand;
    std::unique_ptr<Library> library;
    std::unique_ptr<Battlefield> battlefield;
    std::unique_ptr<Stack> stack;
    std::unique_ptr<Exile> exile;

    Zones(Game* game);
};

struct GameConfig {
    int starting_life = 20;
    int opening_hand_size = 7;
    int max_hand_size = 7;
    // Budgets. Exceeding either ends the game without a winner.
    int max_turns = 100;
    int max_actions = 20000;
    unsigned int seed = 0;
    bool shuffle_libraries = true;
};

struct GameResult {
    std::optional<int> winner_id;
    std::optional<std::string> winner_name;
    std::optional<int> loser_id;
    std::optional<std::string> loser_name;
    int turns = 0;
    bool budget_exhausted = false;

    bool hasWinner() const { return winner_id.has_value(); }
    std::string toString() const;
};

class Game {
public:
    GameConfig config;
    std::vector<std::unique_ptr<Player>> players;
    // Every card in the game, by card id.
    std::map<int, std::unique_ptr<Card>> cards;

    std::unique_ptr<Zones> zones;
    std::unique_ptr<TurnSystem> turn_system;
    std::unique_ptr<SpellCastingEngine> spells;
    std::unique_ptr<StateBasedActionChecker> state_based_actions;
    // Priority window of the current step.
    std::unique_ptr<PrioritySystem> priority_system;
    StepKind current_step = StepKind::UNTAP;

    std::mt19937 rng;
    GameResult result;
    int actions_taken = 0;

    Game(const GameConfig& config = GameConfig());
    ~Game();

    // Throws std::invalid_argument for a third player or a card missing from the registry.
    Player* addPlayer(const PlayerConfig& player_config);
    // Shuffles, draws opening hands and plays until someone loses or a budget runs out.
    GameResult start();
    GameResult play();
    bool isGameOver() const;
    void enterStep(StepKind step);

    // Copies a registered card into this game.
    Card* createCard(const std::string& name, int owner_id);
    Card* addCard(const Card& prototype, int owner_id);
    int nextPermanentId();
    int nextStackObjectId();

    // Lookups
    Player* player(int player_id);
    Card* card(int card_id);
    Permanent* permanent(int permanent_id);
    std::vector<Card*> cardsInHand(Player* player);
    Player* activePlayer();
    Player* nonActivePlayer();
    std::vector<Player*> priorityOrder();

    bool isActivePlayer(const Player* player) const;
    bool isMainStep() const;
    bool canPlayLand(Player* player) const;
    bool canCastSorceries(Player* player) const;

    // Turn-based actions
    void untapAllPermanents(Player* player);
    void markPermanentsNotSummoningSick(Player* player);
    void drawCards(Player* player, int amount);
    void discardToHandSize(Player* player);
    void endTurnEffects();
    void clearManaPools();
    void loseGame(Player* player);

    // Special actions
    void playLand(Player* player, Card* card);

private:
    int next_card_id = 0;
    int next_permanent_id = 0;
    int next_stack_object_id = 0;
};
