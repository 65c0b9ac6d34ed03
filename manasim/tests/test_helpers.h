// tests/test_helpers.h
#pragma once

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "rules/game.h"
#include "rules/spell_casting.h"
#include "rules/state_based_actions.h"
#include "cardsets/card_registry.h"

// Two players with small land decks, no shuffling, and nothing drawn yet.
// Tests arrange the board by hand.
class GameTest : public ::testing::Test {
protected:
    std::unique_ptr<Game> game;
    Player* alice = nullptr;
    Player* bob = nullptr;

    void SetUp() override {
        registerAllCards();
        GameConfig config;
        config.shuffle_libraries = false;
        game = std::make_unique<Game>(config);
        alice = game->addPlayer(PlayerConfig("Alice", {{"Mountain", 10}}));
        bob = game->addPlayer(PlayerConfig("Bob", {{"Forest", 10}}));
    }

    // Alice's precombat main step, Alice holding priority.
    void mainStep() {
        game->enterStep(StepKind::PRECOMBAT_MAIN);
    }

    Card* inHand(const std::string& name, Player* owner) {
        Card* card = game->createCard(name, owner->id);
        game->zones->hand->move(card);
        return card;
    }

    Permanent* onBattlefield(const std::string& name, Player* owner, bool summoning_sick = false) {
        return onBattlefield(*CardRegistry::instance().find(name), owner, summoning_sick);
    }

    Permanent* onBattlefield(const Card& prototype, Player* owner, bool summoning_sick = false) {
        Card* card = game->addCard(prototype, owner->id);
        Permanent* permanent = game->zones->battlefield->enter(card);
        permanent->summoning_sick = summoning_sick;
        return permanent;
    }

    static Card creature(const std::string& name, const std::string& mana_cost, int power, int toughness,
                         const std::vector<std::string>& keywords = {}, bool artifact = false) {
        std::set<CardType> types = {CardType::CREATURE};
        if (artifact) {
            types.insert(CardType::ARTIFACT);
        }
        return Card(name, ManaCost::parse(mana_cost), CardTypes(types), {}, {}, keywords, {}, {}, "", power, toughness);
    }

    void addMana(Player* player, const std::string& mana) {
        player->mana_pool.add(Mana::parse(mana));
    }

    bool inGraveyard(const Card* card) {
        return game->zones->graveyard->contains(card, card->owner_id);
    }
};
