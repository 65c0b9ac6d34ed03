#pragma once

#include <vector>
#include <map>
#include <memory>
#include <random>

// Forward Declarations
class Card;
class Game;

// Cards in a zone, per owning player id.
class Zone {
public:
    Game* game;
    std::map<int, std::vector<Card*>> cards;

    Zone(Game* game);
    virtual ~Zone() = default;

    virtual void move(Card* card);
    virtual void remove(Card* card);
    size_t numCards(int player_id) const;
    bool contains(const Card* card, int player_id) const;
    const std::vector<Card*>& cardsOf(int player_id);
    virtual const char* name() const = 0;
};

// Top of the library is the back of the vector.
class Library : public Zone {
public:
    Library(Game* game);
    void shuffle(int player_id, std::mt19937& rng);
    Card* top(int player_id);
    const char* name() const override { return "library"; }
};

class Graveyard : public Zone {
public:
    Graveyard(Game* game);
    const char* name() const override { return "graveyard"; }
};

class Hand : public Zone {
public:
    Hand(Game* game);
    const char* name() const override { return "hand"; }
};

class Exile : public Zone {
public:
    Exile(Game* game);
    const char* name() const override { return "exile"; }
};
