// card_registry.cpp
#include "cardsets/card_registry.h"
#include "cardsets/alpha/alpha.h"
#include "cardsets/basics/basic_lands.h"

#include <mutex>
#include <stdexcept>

#include <spdlog/spdlog.h>

CardRegistry& CardRegistry::instance() {
    static CardRegistry registry;
    return registry;
}

void CardRegistry::registerCard(const std::string& name, const Card& card) {
    if (card_map.find(name) != card_map.end()) {
        throw std::runtime_error(fmt::format("Card already registered: {}", name));
    }
    card_map.insert({name, std::make_unique<Card>(card)});
}

const Card* CardRegistry::find(const std::string& name) const {
    auto it = card_map.find(name);
    return it == card_map.end() ? nullptr : it->second.get();
}

bool CardRegistry::contains(const std::string& name) const {
    return card_map.contains(name);
}

std::unique_ptr<Card> CardRegistry::instantiate(const std::string& name) const {
    const Card* prototype = find(name);
    if (prototype == nullptr) {
        throw std::runtime_error("Card not found in registry: " + name);
    }
    return std::make_unique<Card>(*prototype);
}

std::vector<std::string> CardRegistry::names() const {
    std::vector<std::string> result;
    for (const auto& [name, card] : card_map) {
        result.push_back(name);
    }
    return result;
}

void registerAllCards() {
    static std::once_flag registered;
    std::call_once(registered, [] {
        registerBasicLands();
        registerAlpha();
        spdlog::debug("Registered {} cards", CardRegistry::instance().names().size());
    });
}
