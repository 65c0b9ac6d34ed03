// game.cpp

#include "game.h"

#include "rules/errors.h"
#include "rules/spell_casting.h"
#include "rules/state_based_actions.h"
#include "cardsets/card_registry.h"
#include "agents/action.h"

#include <algorithm>
#include <stdexcept>
#include <spdlog/spdlog.h>

Zones::Zones(Game* game)
    : graveyard(std::make_unique<Graveyard>(game)),
      hand(std::make_unique<Hand>(game)),
      library(std::make_unique<Library>(game)),
      battlefield(std::make_unique<Battlefield>(game)),
      stack(std::make_unique<Stack>(game)),
      exile(std::make_unique<Exile>(game))
{}

std::string GameResult::toString() const {
    if (budget_exhausted) {
        return fmt::format("No winner after {} turns (budget exhausted)", turns);
    }
    if (!hasWinner() && loser_id) {
        return fmt::format("Draw after {} turns, every player lost", turns);
    }
    if (!hasWinner()) {
        return fmt::format("No winner after {} turns", turns);
    }
    return fmt::format("{} beats {} in {} turns", *winner_name, loser_name.value_or("?"), turns);
}

Game::Game(const GameConfig& config)
    : config(config),
      zones(std::make_unique<Zones>(this)),
      turn_system(std::make_unique<TurnSystem>(this)),
      spells(std::make_unique<SpellCastingEngine>(this)),
      state_based_actions(std::make_unique<StateBasedActionChecker>(this)),
      rng(config.seed) {}

Game::~Game() = default;

Player* Game::addPlayer(const PlayerConfig& player_config) {
    if (players.size() >= 2) {
        throw std::invalid_argument("Game supports exactly 2 players.");
    }
    const CardRegistry& registry = CardRegistry::instance();
    for (const auto& [card_name, quantity] : player_config.decklist) {
        if (!registry.contains(card_name)) {
            throw std::invalid_argument("Unknown card in decklist: " + card_name);
        }
    }

    int player_id = players.size();
    players.push_back(std::make_unique<Player>(player_id, player_config, config.starting_life));
    Player* new_player = players.back().get();

    for (const auto& [card_name, quantity] : player_config.decklist) {
        for (int i = 0; i < quantity; i++) {
            zones->library->move(createCard(card_name, player_id));
        }
    }

    if (players.size() == 2) {
        players[0]->opponent_ids = {players[1]->id};
        players[1]->opponent_ids = {players[0]->id};
    }

    spdlog::info("{} joins with {} cards", new_player->name, player_config.deckSize());
    return new_player;
}

GameResult Game::start() {
    if (players.size() != 2) {
        throw std::invalid_argument("Game must start with 2 players.");
    }

    for (const std::unique_ptr<Player>& player : players) {
        if (config.shuffle_libraries) {
            zones->library->shuffle(player->id, rng);
        }
        drawCards(player.get(), std::min<int>(config.opening_hand_size, zones->library->numCards(player->id)));
    }

    return play();
}

GameResult Game::play() {
    while (!isGameOver()) {
        if (turn_system->global_turn_count > config.max_turns || actions_taken >= config.max_actions) {
            spdlog::info("Budget exhausted after {} turns and {} actions", turn_system->global_turn_count, actions_taken);
            result.budget_exhausted = true;
            break;
        }

        std::unique_ptr<ActionSpace> action_space = turn_system->tick();
        if (action_space == nullptr) {
            continue;
        }

        Player* acting_player = action_space->player;
        Action* selected_action = acting_player->agent->selectAction(action_space.get());
        actions_taken++;
        try {
            selected_action->execute();
        } catch (const RulesError& e) {
            spdlog::warn("{}: {}", acting_player->name, e.what());
            // Passing keeps the game moving after a failed action.
            if (action_space->action_type == ActionType::PRIORITY && priority_system
                && priority_system->hasPriority(acting_player)) {
                priority_system->passPriority(acting_player);
            }
        }
    }

    result.turns = std::min(turn_system->global_turn_count, config.max_turns);
    spdlog::info("Game over: {}", result.toString());
    return result;
}

bool Game::isGameOver() const {
    return std::any_of(players.begin(), players.end(),
                       [](const std::unique_ptr<Player>& player) { return player->lost; });
}

void Game::enterStep(StepKind step) {
    current_step = step;
    priority_system = std::make_unique<PrioritySystem>(this);
}

Card* Game::createCard(const std::string& name, int owner_id) {
    const Card* prototype = CardRegistry::instance().find(name);
    if (prototype == nullptr) {
        throw std::invalid_argument("Card not found in registry: " + name);
    }
    return addCard(*prototype, owner_id);
}

Card* Game::addCard(const Card& prototype, int owner_id) {
    auto card = std::make_unique<Card>(prototype);
    card->id = next_card_id++;
    card->owner_id = owner_id;
    card->current_zone = nullptr;
    Card* raw_card = card.get();
    cards.emplace(raw_card->id, std::move(card));
    return raw_card;
}

int Game::nextPermanentId() {
    return next_permanent_id++;
}

int Game::nextStackObjectId() {
    return next_stack_object_id++;
}

Player* Game::player(int player_id) {
    auto it = std::find_if(players.begin(), players.end(),
                           [&](const std::unique_ptr<Player>& player) { return player->id == player_id; });
    return it == players.end() ? nullptr : it->get();
}

Card* Game::card(int card_id) {
    auto it = cards.find(card_id);
    return it == cards.end() ? nullptr : it->second.get();
}

Permanent* Game::permanent(int permanent_id) {
    return zones->battlefield->find(permanent_id);
}

std::vector<Card*> Game::cardsInHand(Player* player) {
    return zones->hand->cardsOf(player->id);
}

Player* Game::activePlayer() {
    return turn_system->activePlayer();
}

Player* Game::nonActivePlayer() {
    return turn_system->nonActivePlayer();
}

std::vector<Player*> Game::priorityOrder() {
    return turn_system->priorityOrder();
}

bool Game::isActivePlayer(const Player* player) const {
    return player->id == turn_system->activePlayer()->id;
}

bool Game::isMainStep() const {
    return current_step == StepKind::PRECOMBAT_MAIN || current_step == StepKind::POSTCOMBAT_MAIN;
}

bool Game::canPlayLand(Player* player) const {
    return canCastSorceries(player) && turn_system->landsPlayed() < 1;
}

bool Game::canCastSorceries(Player* player) const {
    return isActivePlayer(player)
        && isMainStep()
        && zones->stack->empty()
        && priority_system != nullptr
        && priority_system->hasPriority(player);
}

// Turn-based actions

void Game::untapAllPermanents(Player* player) {
    zones->battlefield->forEach([&](Permanent* permanent) {
        permanent->untap();
    }, player->id);
}

void Game::markPermanentsNotSummoningSick(Player* player) {
    zones->battlefield->forEach([&](Permanent* permanent) {
        permanent->summoning_sick = false;
    }, player->id);
}

void Game::drawCards(Player* player, int amount) {
    for (int i = 0; i < amount; ++i) {
        Card* card = zones->library->top(player->id);
        if (card == nullptr) {
            spdlog::info("{} cannot draw from an empty library", player->name);
            player->drew_from_empty_library = true;
            break;
        }
        zones->hand->move(card);
    }
}

void Game::discardToHandSize(Player* player) {
    while (zones->hand->numCards(player->id) > static_cast<size_t>(config.max_hand_size)) {
        Card* card = zones->hand->cardsOf(player->id).back();
        spdlog::info("{} discards {}", player->name, card->toString());
        zones->graveyard->move(card);
    }
}

void Game::endTurnEffects() {
    zones->battlefield->forEach([&](Permanent* permanent) {
        permanent->endTurn();
    });
}

void Game::clearManaPools() {
    for (const std::unique_ptr<Player>& player : players) {
        player->mana_pool.clear();
    }
}

void Game::loseGame(Player* player) {
    if (player->lost) {
        return;
    }
    player->lost = true;
    spdlog::info("{} has lost the game", player->name);
    if (!result.loser_id) {
        result.loser_id = player->id;
        result.loser_name = player->name;
    }

    // Only a player who has not lost can win. Everyone losing at once is a draw.
    std::vector<Player*> remaining;
    for (const std::unique_ptr<Player>& other : players) {
        if (!other->lost) {
            remaining.push_back(other.get());
        }
    }
    if (remaining.size() == 1) {
        result.winner_id = remaining.front()->id;
        result.winner_name = remaining.front()->name;
    } else {
        result.winner_id.reset();
        result.winner_name.reset();
    }
}

// Special actions

void Game::playLand(Player* player, Card* card) {
    if (!card->types.isLand()) {
        throw std::invalid_argument("Only land cards can be played.");
    }
    if (!zones->hand->contains(card, player->id)) {
        throw std::invalid_argument(fmt::format("{} is not in {}'s hand", card->toString(), player->name));
    }
    if (!canPlayLand(player)) {
        throw IllegalTimingError(fmt::format("{} cannot play a land now", player->name));
    }
    turn_system->landPlayed();
    spdlog::info("{} plays a land {}", player->name, card->toString());
    zones->battlefield->enter(card);
}
