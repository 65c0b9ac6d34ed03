// player.cpp
#include "player.h"

#include "agents/action.h"

#include <algorithm>
#include <numeric>

int PlayerConfig::deckSize() const {
    return std::accumulate(decklist.begin(), decklist.end(), 0,
        [](int sum, const auto& entry) { return sum + entry.second; });
}

Player::Player(int id, const PlayerConfig &config, int starting_life)
    : id(id), name(config.name), life(starting_life), agent(std::make_unique<Agent>(this)) {}

Player::~Player() = default;

void Player::takeDamage(int damage) {
    life -= damage;
}

void Player::gainLife(int amount) {
    life += amount;
}

bool Player::isOpponent(int player_id) const {
    return std::find(opponent_ids.begin(), opponent_ids.end(), player_id) != opponent_ids.end();
}

std::string Player::toString() const {
    return name + " (Player " + std::to_string(id) + " - Life: " + std::to_string(life) + ")";
}
