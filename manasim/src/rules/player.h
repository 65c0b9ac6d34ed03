#pragma once

#include <string>
#include <memory>
#include <map>
#include <vector>

#include "rules/mana.h"

class Agent;

class PlayerConfig
{
public:
    std::string name;
    std::map<std::string, int> decklist;

    PlayerConfig() = default;
    PlayerConfig(const std::string &name, const std::map<std::string, int> &cardQuantities) : name(name), decklist(cardQuantities) {}

    int deckSize() const;
};

class Player
{
public:
    int id;
    std::string name;
    int life = 20;
    bool lost = false;
    // Set by a draw from an empty library; checked by state-based actions.
    bool drew_from_empty_library = false;

    Mana mana_pool;
    // Non-owning, for targeting only.
    std::vector<int> opponent_ids;
    std::unique_ptr<Agent> agent;

    Player(int id, const PlayerConfig &config, int starting_life);
    ~Player();

    void takeDamage(int damage);
    void gainLife(int amount);
    bool isOpponent(int player_id) const;

    std::string toString() const;
};
