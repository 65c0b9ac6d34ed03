// battlefield.cpp
#include "battlefield.h"
#include "rules/game.h"
#include "rules/card.h"
#include "rules/errors.h"
#include "rules/spell_casting.h"

#include <algorithm>
#include <spdlog/spdlog.h>


Battlefield::Battlefield(Game* game)
    : Zone(game) {}

void Battlefield::move(Card* card) {
    enter(card);
}

Permanent* Battlefield::enter(Card* card) {
    if (!card->types.isPermanent()) {
        throw std::invalid_argument("Card is not a permanent: " + card->toString());
    }
    spdlog::info("{} enters battlefield", card->toString());
    Zone::move(card);
    int permanent_id = game->nextPermanentId();
    auto [it, inserted] = permanents.emplace(permanent_id, std::make_unique<Permanent>(permanent_id, card));
    return it->second.get();
}

void Battlefield::remove(Card* card) {
    Zone::remove(card);
    for (auto it = permanents.begin(); it != permanents.end(); ++it) {
        if (it->second->card == card) {
            permanents.erase(it);
            break;
        }
    }
}

bool Battlefield::destroy(Permanent* permanent) {
    if (permanent->hasKeyword(Keyword::INDESTRUCTIBLE)) {
        spdlog::info("{} is indestructible and survives", permanent->card->toString());
        return false;
    }
    spdlog::info("{} is destroyed", permanent->card->toString());
    permanent->clearCombatState();
    // Moving the card erases the permanent through remove().
    game->zones->graveyard->move(permanent->card);
    return true;
}

Permanent* Battlefield::find(int permanent_id) {
    auto it = permanents.find(permanent_id);
    return it == permanents.end() ? nullptr : it->second.get();
}

const Permanent* Battlefield::find(int permanent_id) const {
    auto it = permanents.find(permanent_id);
    return it == permanents.end() ? nullptr : it->second.get();
}

Permanent* Battlefield::find(const Card* card) {
    for (const auto& [id, permanent] : permanents) {
        if (permanent->card == card) {
            return permanent.get();
        }
    }
    return nullptr;
}

void Battlefield::forEach(std::function<void(Permanent*)> func) {
    for (const auto& [id, permanent] : permanents) {
        func(permanent.get());
    }
}

void Battlefield::forEach(std::function<void(Permanent*)> func, int player_id) {
    for (const auto& [id, permanent] : permanents) {
        if (permanent->controller_id == player_id) {
            func(permanent.get());
        }
    }
}

std::vector<Permanent*> Battlefield::select(int player_id, std::function<bool(const Permanent*)> predicate) {
    std::vector<Permanent*> selected;
    for (const auto& [id, permanent] : permanents) {
        if (permanent->controller_id == player_id && predicate(permanent.get())) {
            selected.push_back(permanent.get());
        }
    }
    return selected;
}

std::vector<Permanent*> Battlefield::permanentsOf(int player_id) {
    return select(player_id, [](const Permanent*) { return true; });
}

std::vector<Permanent*> Battlefield::creatures(int player_id) {
    return select(player_id, [](const Permanent* p) { return p->card->types.isCreature(); });
}

std::vector<Permanent*> Battlefield::lands(int player_id) {
    return select(player_id, [](const Permanent* p) { return p->card->types.isLand(); });
}

std::vector<Permanent*> Battlefield::artifacts(int player_id) {
    return select(player_id, [](const Permanent* p) { return p->card->types.isArtifact(); });
}

std::vector<Permanent*> Battlefield::enchantments(int player_id) {
    return select(player_id, [](const Permanent* p) { return p->card->types.isEnchantment(); });
}

std::vector<Permanent*> Battlefield::planeswalkers(int player_id) {
    return select(player_id, [](const Permanent* p) { return p->card->types.isPlaneswalker(); });
}

std::vector<Permanent*> Battlefield::attackers(int player_id) {
    return select(player_id, [](const Permanent* p) { return p->attacking.has_value(); });
}

std::vector<Permanent*> Battlefield::eligibleAttackers(int player_id) {
    return select(player_id, [](const Permanent* p) { return p->canAttack(); });
}

std::vector<Permanent*> Battlefield::eligibleBlockers(int player_id) {
    return select(player_id, [](const Permanent* p) { return p->canBlock(); });
}

Mana Battlefield::producibleMana(int player_id) const {
    Mana total_mana;
    for (const auto& [id, permanent] : permanents) {
        if (permanent->controller_id == player_id) {
            total_mana.add(permanent->producibleMana());
        }
    }
    return total_mana;
}

void Battlefield::produceMana(const ManaCost& mana_cost, int player_id) {
    Player* player = game->player(player_id);

    Mana reachable = player->mana_pool;
    reachable.add(producibleMana(player_id));
    if (!reachable.canPay(mana_cost)) {
        throw InsufficientManaError(fmt::format("{} cannot produce {}", player->name, mana_cost.toString()));
    }

    auto activateSource = [&](std::function<bool(const Mana&)> wanted) {
        for (Permanent* permanent : permanentsOf(player_id)) {
            const Ability* ability = permanent->availableManaAbility();
            if (ability && wanted(ability->producedMana())) {
                game->spells->activateAbility(permanent, *ability, player);
                return true;
            }
        }
        return false;
    };

    // Colored requirements first, so generic costs don't tap the only source of a color.
    for (const auto& [color, required] : mana_cost.cost) {
        while (player->mana_pool.amount(color) < required) {
            if (!activateSource([color](const Mana& mana) { return mana.amount(color) > 0; })) {
                break;
            }
        }
    }

    while (!player->mana_pool.canPay(mana_cost)) {
        if (!activateSource([](const Mana& mana) { return mana.total() > 0; })) {
            break;
        }
    }

    if (!player->mana_pool.canPay(mana_cost)) {
        throw InsufficientManaError("Did not generate enough mana to pay for mana cost.");
    }
}

Permanent::Permanent(int id, Card* card) :
      id(id),
      card(card),
      controller_id(card->owner_id) {

    summoning_sick = card->types.isCreature();
    base_power = card->power.value_or(0);
    base_toughness = card->toughness.value_or(0);
}

int Permanent::power() const {
    return base_power + power_modifier;
}

int Permanent::toughness() const {
    return base_toughness + toughness_modifier;
}

bool Permanent::hasKeyword(Keyword keyword) const {
    return card->hasKeyword(keyword);
}

const Keywords& Permanent::keywords() const {
    return card->keywords;
}

const Colors& Permanent::colors() const {
    return card->colors;
}

bool Permanent::isCreature() const {
    return card->types.isCreature();
}

bool Permanent::isLand() const {
    return card->types.isLand();
}

bool Permanent::isArtifact() const {
    return card->types.isArtifact();
}

bool Permanent::canPayTapCost(const Ability& ability) const {
    if (tapped) {
        return false;
    }
    if (ability.type == AbilityType::MANA) {
        return true;
    }
    return !(isCreature() && summoning_sick && !hasKeyword(Keyword::HASTE));
}

bool Permanent::canAttack() const {
    return isCreature()
        && !tapped
        && (!summoning_sick || hasKeyword(Keyword::HASTE))
        && !hasKeyword(Keyword::DEFENDER);
}

bool Permanent::canBlock() const {
    return isCreature() && !tapped;
}

void Permanent::untap() {
    tapped = false;
}

void Permanent::tap() {
    if (tapped) {
        throw std::logic_error(fmt::format("{} is already tapped", card->toString()));
    }
    spdlog::debug("Tapping {}", card->toString());
    tapped = true;
}

void Permanent::takeDamage(int amount, bool from_deathtouch) {
    if (amount <= 0) {
        return;
    }
    damage += amount;
    if (from_deathtouch) {
        deathtouch_damage = true;
    }
}

bool Permanent::hasLethalDamage() const {
    return isCreature() && (damage >= toughness() || (deathtouch_damage && damage > 0));
}

void Permanent::clearDamage() {
    damage = 0;
    deathtouch_damage = false;
}

void Permanent::attack(int defending_player_id) {
    attacking = defending_player_id;
    if (!hasKeyword(Keyword::VIGILANCE)) {
        tap();
    }
}

void Permanent::clearCombatState() {
    attacking.reset();
    blocking.reset();
    blocked_by.clear();
    blocked = false;
}

void Permanent::endTurn() {
    power_modifier = 0;
    toughness_modifier = 0;
    clearDamage();
}

const Ability* Permanent::availableManaAbility() const {
    for (const Ability& ability : card->abilities) {
        if (ability.type != AbilityType::MANA || !ability.cost.mana.isZero()) {
            continue;
        }
        if (!ability.cost.tap || canPayTapCost(ability)) {
            return &ability;
        }
    }
    return nullptr;
}

Mana Permanent::producibleMana() const {
    const Ability* ability = availableManaAbility();
    return ability ? ability->producedMana() : Mana();
}

std::string Permanent::toString() const {
    return fmt::format("{} [{}] {}/{}", card->name, id, power(), toughness());
}

bool Permanent::operator==(const Permanent& other) const {
    return this->id == other.id;
}
