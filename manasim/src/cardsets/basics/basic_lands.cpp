// basic_lands.cpp
#include "basic_lands.h"
#include "cardsets/card_registry.h"

Card createBasicLandCard(const std::string& name, Color color) {
    std::string symbol;
    switch (color) {
        case Color::WHITE: symbol = "W"; break;
        case Color::BLUE: symbol = "U"; break;
        case Color::BLACK: symbol = "B"; break;
        case Color::RED: symbol = "R"; break;
        case Color::GREEN: symbol = "G"; break;
        default:
            throw std::invalid_argument("Basic lands produce colored mana, not " + toString(color));
    }

    return Card(name,
                std::nullopt,
                CardTypes({CardType::LAND}),
                {"Basic"},
                {name},
                {},
                {Ability::tapForMana(symbol)},
                {},
                "{T}: Add {" + symbol + "}.",
                std::nullopt,
                std::nullopt);
}

Card basicPlains() {
    return createBasicLandCard("Plains", Color::WHITE);
}

Card basicIsland() {
    return createBasicLandCard("Island", Color::BLUE);
}

Card basicMountain() {
    return createBasicLandCard("Mountain", Color::RED);
}

Card basicForest() {
    return createBasicLandCard("Forest", Color::GREEN);
}

Card basicSwamp() {
    return createBasicLandCard("Swamp", Color::BLACK);
}

void registerBasicLands() {
    CardRegistry& registry = CardRegistry::instance();
    registry.registerCard("Plains", basicPlains());
    registry.registerCard("Island", basicIsland());
    registry.registerCard("Mountain", basicMountain());
    registry.registerCard("Forest", basicForest());
    registry.registerCard("Swamp", basicSwamp());
}
