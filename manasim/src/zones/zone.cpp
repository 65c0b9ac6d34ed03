// zone.cpp
#include "zone.h"
#include "rules/game.h"

#include <cassert>
#include <algorithm>

#include <spdlog/fmt/fmt.h>

Zone::Zone(Game* game) : game(game) {}

void Zone::move(Card* card) {
    if (card->current_zone) {
        Zone* previous_zone = card->current_zone;
        if (previous_zone == this) {
            throw std::logic_error(fmt::format("Card {} is already in this zone {}", card->toString(), name()));
        }
        previous_zone->remove(card);
        assert(!previous_zone->contains(card, card->owner_id));
    }
    card->current_zone = this;
    cards[card->owner_id].push_back(card);
    assert(contains(card, card->owner_id));
}

void Zone::remove(Card* card) {
    if (card->current_zone == this) {
        card->current_zone = nullptr;
        std::vector<Card*>& player_cards = cards[card->owner_id];
        player_cards.erase(std::remove(player_cards.begin(), player_cards.end(), card), player_cards.end());
        assert(!contains(card, card->owner_id));
    } else {
        throw std::invalid_argument(fmt::format("Card {} is not in this zone {}.", card->toString(), name()));
    }
}

bool Zone::contains(const Card* card, int player_id) const {
    auto it = cards.find(player_id);
    if (it == cards.end()) {
        return false;
    }
    const std::vector<Card*>& player_cards = it->second;
    return std::any_of(player_cards.begin(), player_cards.end(),
                       [&card](const Card* c) { return *c == card; });
}

size_t Zone::numCards(int player_id) const {
    auto it = cards.find(player_id);
    return it == cards.end() ? 0 : it->second.size();
}

const std::vector<Card*>& Zone::cardsOf(int player_id) {
    return cards[player_id];
}

void Library::shuffle(int player_id, std::mt19937& rng) {
    std::shuffle(cards[player_id].begin(), cards[player_id].end(), rng);
}

Card* Library::top(int player_id) {
    std::vector<Card*>& player_cards = cards[player_id];
    return player_cards.empty() ? nullptr : player_cards.back();
}

Library::Library(Game* game) : Zone(game) {}
Graveyard::Graveyard(Game* game) : Zone(game) {}
Hand::Hand(Game* game) : Zone(game) {}
Exile::Exile(Game* game) : Zone(game) {}
