// card.cpp
#include "card.h"

CardTypes::CardTypes(const std::set<CardType>& types) : types(types) {}

bool CardTypes::isPermanent() const {
    return types.count(CardType::CREATURE) ||
           types.count(CardType::LAND) ||
           types.count(CardType::ARTIFACT) ||
           types.count(CardType::ENCHANTMENT) ||
           types.count(CardType::PLANESWALKER) ||
           types.count(CardType::BATTLE);
}

bool CardTypes::isCastable() const {
    return !isLand() && !types.empty();
}

bool CardTypes::isInstant() const {
    return types.contains(CardType::INSTANT);
}

bool CardTypes::isCreature() const {
    return types.contains(CardType::CREATURE);
}

bool CardTypes::isLand() const {
    return types.contains(CardType::LAND);
}

bool CardTypes::isPlaneswalker() const {
    return types.contains(CardType::PLANESWALKER);
}

bool CardTypes::isEnchantment() const {
    return types.contains(CardType::ENCHANTMENT);
}

bool CardTypes::isArtifact() const {
    return types.contains(CardType::ARTIFACT);
}


Card::Card(const std::string& name,
           std::optional<ManaCost> mana_cost,
           const CardTypes& types,
           const std::vector<std::string>& supertypes,
           const std::vector<std::string>& subtypes,
           const std::vector<std::string>& keyword_list,
           const std::vector<Ability>& abilities,
           const std::vector<Effect>& spell_effects,
           const std::string& text_box,
           std::optional<int> power,
           std::optional<int> toughness)
    : name(name),
      mana_cost(mana_cost),
      types(types),
      supertypes(supertypes),
      subtypes(subtypes),
      keyword_list(keyword_list),
      keywords(Keywords::parse(keyword_list)),
      abilities(abilities),
      spell_effects(spell_effects),
      text_box(text_box),
      power(power),
      toughness(toughness) {

    if (mana_cost.has_value()) {
        colors = mana_cost->colors();
    }
}

bool Card::hasKeyword(Keyword keyword) const {
    return keywords.has(keyword);
}

bool Card::hasInstantTiming() const {
    return types.isInstant() || (types.isPermanent() && hasKeyword(Keyword::FLASH));
}

bool Card::operator==(const Card* other) const {
    return this->id == other->id;
}

std::string Card::toString() const {
    return "{name: " + name + ", id: " + std::to_string(id) + "}";
}
