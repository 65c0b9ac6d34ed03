#pragma once

#include <string>
#include <vector>

#include "rules/mana.h"

enum class AbilityType {
    ACTIVATED,
    TRIGGERED,
    STATIC,
    MANA
};

enum class TimingRestriction {
    // No priority needed. Mana abilities.
    ANY_TIME,
    INSTANT_SPEED,
    SORCERY_SPEED
};

enum class TriggerCondition {
    NONE,
    ENTERS_THE_BATTLEFIELD
};

enum class EffectType {
    DEAL_DAMAGE,
    GAIN_LIFE,
    LOSE_LIFE,
    DRAW_CARDS,
    ADD_MANA,
    PUMP_CREATURE,
    DESTROY_PERMANENT,
    COUNTER_SPELL,
    RETURN_TO_HAND,
    TAP_PERMANENT,
    UNTAP_PERMANENT,
    GOAD
};

enum class EffectDuration {
    INSTANT,
    UNTIL_END_OF_TURN,
    PERMANENT
};

enum class TargetKind {
    // Untargeted: the effect applies to its controller, or to its source permanent.
    NONE,
    // Creature or player.
    ANY,
    CREATURE,
    PLAYER,
    OPPONENT,
    PERMANENT,
    SPELL
};

class TargetSpec {
public:
    TargetKind kind = TargetKind::NONE;
    bool non_artifact = false;
    Colors excluded_colors;

    TargetSpec() = default;
    TargetSpec(TargetKind kind) : kind(kind) {}

    bool required() const { return kind != TargetKind::NONE; }
};

// A chosen target: a player, a permanent or an object on the stack, by id.
class Target {
public:
    enum class Type {
        PLAYER,
        PERMANENT,
        STACK_OBJECT
    };

    Type type;
    int id;

    static Target player(int player_id) { return Target{Type::PLAYER, player_id}; }
    static Target permanent(int permanent_id) { return Target{Type::PERMANENT, permanent_id}; }
    static Target stackObject(int stack_object_id) { return Target{Type::STACK_OBJECT, stack_object_id}; }

    bool operator==(const Target& other) const { return type == other.type && id == other.id; }
    std::string toString() const;
};

class Effect {
public:
    EffectType type;
    int amount = 0;
    int power = 0;
    int toughness = 0;
    Mana mana;
    EffectDuration duration = EffectDuration::INSTANT;
    TargetSpec target;

    static Effect dealDamage(int amount, TargetSpec target = TargetKind::ANY);
    static Effect gainLife(int amount, TargetSpec target = TargetKind::NONE);
    static Effect loseLife(int amount, TargetSpec target = TargetKind::OPPONENT);
    static Effect drawCards(int amount, TargetSpec target = TargetKind::NONE);
    static Effect addMana(const Mana& mana);
    static Effect pump(int power, int toughness, TargetSpec target = TargetKind::CREATURE,
                       EffectDuration duration = EffectDuration::UNTIL_END_OF_TURN);
    static Effect destroy(TargetSpec target = TargetKind::CREATURE);
    static Effect counterSpell();
    static Effect returnToHand(TargetSpec target = TargetKind::PERMANENT);
    static Effect tap(TargetSpec target = TargetKind::PERMANENT);
    static Effect untap(TargetSpec target = TargetKind::PERMANENT);
    static Effect goad(TargetSpec target = TargetKind::CREATURE);

    // True when applying this effect hurts whoever it lands on.
    bool isHarmful() const;
    std::string toString() const;
};

class AbilityCost {
public:
    ManaCost mana;
    bool tap = false;

    bool isFree() const { return !tap && mana.isZero(); }
};

class Ability {
public:
    std::string name;
    AbilityType type = AbilityType::ACTIVATED;
    AbilityCost cost;
    TimingRestriction timing = TimingRestriction::INSTANT_SPEED;
    TriggerCondition trigger = TriggerCondition::NONE;
    std::vector<Effect> effects;

    static Ability tapForMana(const std::string& mana_str);
    static Ability activated(const std::string& name, const AbilityCost& cost, const std::vector<Effect>& effects,
                             TimingRestriction timing = TimingRestriction::INSTANT_SPEED);
    static Ability triggered(const std::string& name, TriggerCondition trigger, const std::vector<Effect>& effects);

    bool usesStack() const { return type != AbilityType::MANA; }
    Mana producedMana() const;
};

