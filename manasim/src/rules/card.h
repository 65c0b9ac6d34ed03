#pragma once

#include <optional>
#include <string>
#include <vector>
#include <set>

#include "rules/mana.h"
#include "rules/keywords.h"
#include "rules/ability.h"

class Zone;

enum class CardType {
    CREATURE,
    INSTANT,
    SORCERY,
    PLANESWALKER,
    LAND,
    ENCHANTMENT,
    ARTIFACT,
    KINDRED,
    BATTLE
};

class CardTypes {
public:
    std::set<CardType> types;
    CardTypes() = default;
    CardTypes(const std::set<CardType>& types);
    bool isCastable() const;
    bool isPermanent() const;
    bool isInstant() const;
    bool isCreature() const;
    bool isLand() const;
    bool isPlaneswalker() const;
    bool isEnchantment() const;
    bool isArtifact() const;
};

class Card {
public:
    // Assigned by the game that owns this card; -1 for registry prototypes.
    int id = -1;

    std::string name;
    std::optional<ManaCost> mana_cost;
    Colors colors;
    CardTypes types;
    std::vector<std::string> supertypes;
    std::vector<std::string> subtypes;
    std::vector<std::string> keyword_list;
    Keywords keywords;
    std::vector<Ability> abilities;
    // What an instant or sorcery does when it resolves.
    std::vector<Effect> spell_effects;
    std::string text_box;
    std::optional<int> power;
    std::optional<int> toughness;
    int owner_id = -1;
    Zone* current_zone = nullptr;

    Card(const std::string& name,
         std::optional<ManaCost> mana_cost,
         const CardTypes& types,
         const std::vector<std::string>& supertypes,
         const std::vector<std::string>& subtypes,
         const std::vector<std::string>& keyword_list,
         const std::vector<Ability>& abilities,
         const std::vector<Effect>& spell_effects,
         const std::string& text_box,
         std::optional<int> power,
         std::optional<int> toughness);

    bool hasKeyword(Keyword keyword) const;
    // Instants and flash permanents.
    bool hasInstantTiming() const;
    std::string toString() const;
    bool operator==(const Card* other) const;
};
