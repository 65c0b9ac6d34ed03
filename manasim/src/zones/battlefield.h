#pragma once 

#include <vector>
#include <map>
#include <memory>
#include <optional>
#include <functional>

#include "zones/zone.h"
#include "rules/mana.h"
#include "rules/keywords.h"

// Forward declarations
class Ability;
class Permanent;

class Battlefield : public Zone {
public:
    // Arena of permanents, indexed by permanent id.
    std::map<int, std::unique_ptr<Permanent>> permanents;

    Battlefield(Game* game);

    virtual void move(Card* card) override;
    virtual void remove(Card* card) override;
    const char* name() const override { return "battlefield"; }

    Permanent* enter(Card* card);
    // Moves the permanent to its owner's graveyard. Indestructible permanents survive.
    bool destroy(Permanent* permanent);

    Permanent* find(int permanent_id);
    const Permanent* find(int permanent_id) const;
    Permanent* find(const Card* card);

    void forEach(std::function<void(Permanent*)> func);
    void forEach(std::function<void(Permanent*)> func, int player_id);

    std::vector<Permanent*> permanentsOf(int player_id);
    std::vector<Permanent*> creatures(int player_id);
    std::vector<Permanent*> lands(int player_id);
    std::vector<Permanent*> artifacts(int player_id);
    std::vector<Permanent*> enchantments(int player_id);
    std::vector<Permanent*> planeswalkers(int player_id);

    std::vector<Permanent*> attackers(int player_id);
    std::vector<Permanent*> eligibleAttackers(int player_id);
    std::vector<Permanent*> eligibleBlockers(int player_id);

    Mana producibleMana(int player_id) const;
    // Activates mana abilities until the player's pool can pay the cost.
    void produceMana(const ManaCost& mana_cost, int player_id);

private:
    std::vector<Permanent*> select(int player_id, std::function<bool(const Permanent*)> predicate);
};

class Permanent {
public:
    int id;
    Card* card;
    int controller_id;

    bool tapped = false;
    bool summoning_sick = false;
    int damage = 0;
    bool deathtouch_damage = false;
    int base_power = 0;
    int base_toughness = 0;
    // Until end of turn.
    int power_modifier = 0;
    int toughness_modifier = 0;
    bool goaded = false;

    // Combat state, by id.
    std::optional<int> attacking;
    std::optional<int> blocking;
    std::vector<int> blocked_by;
    bool blocked = false;

    Permanent(int id, Card* card);

    int power() const;
    int toughness() const;
    bool hasKeyword(Keyword keyword) const;
    const Keywords& keywords() const;
    const Colors& colors() const;
    bool isCreature() const;
    bool isLand() const;
    bool isArtifact() const;

    bool canPayTapCost(const Ability& ability) const;
    bool canAttack() const;
    bool canBlock() const;
    void untap();
    void tap();
    void takeDamage(int amount, bool from_deathtouch = false);
    bool hasLethalDamage() const;
    void clearDamage();
    void attack(int defending_player_id);
    void clearCombatState();
    void endTurn();

    // First mana ability that could be activated right now.
    const Ability* availableManaAbility() const;
    Mana producibleMana() const;

    std::string toString() const;
    bool operator==(const Permanent& other) const;
};
