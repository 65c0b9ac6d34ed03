// card_registry.h
#pragma once

#include <string>
#include <map>
#include <memory>
#include <vector>

#include "rules/card.h"

// Prototypes of every known card. Read-only once registerAllCards() has run,
// so games on different threads can share it.
class CardRegistry {
public:
    static CardRegistry& instance();

    void registerCard(const std::string& name, const Card& card);
    // nullptr when the card is unknown.
    const Card* find(const std::string& name) const;
    bool contains(const std::string& name) const;
    // Throws std::runtime_error when the card is unknown.
    std::unique_ptr<Card> instantiate(const std::string& name) const;
    std::vector<std::string> names() const;

    // Deleting copy constructor and assignment operator to enforce singleton
    CardRegistry(const CardRegistry&) = delete;
    CardRegistry& operator=(const CardRegistry&) = delete;

private:
    CardRegistry() = default; // Private constructor
    std::map<std::string, std::unique_ptr<Card>> card_map;
};

// Safe to call more than once.
void registerAllCards();
