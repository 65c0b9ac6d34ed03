// ability.cpp
#include "ability.h"

#include <spdlog/fmt/fmt.h>

std::string Target::toString() const {
    switch (type) {
        case Type::PLAYER:       return fmt::format("player {}", id);
        case Type::PERMANENT:    return fmt::format("permanent {}", id);
        case Type::STACK_OBJECT: return fmt::format("stack object {}", id);
    }
    return "?";
}

Effect Effect::dealDamage(int amount, TargetSpec target) {
    Effect effect{EffectType::DEAL_DAMAGE};
    effect.amount = amount;
    effect.target = target;
    return effect;
}

Effect Effect::gainLife(int amount, TargetSpec target) {
    Effect effect{EffectType::GAIN_LIFE};
    effect.amount = amount;
    effect.target = target;
    return effect;
}

Effect Effect::loseLife(int amount, TargetSpec target) {
    Effect effect{EffectType::LOSE_LIFE};
    effect.amount = amount;
    effect.target = target;
    return effect;
}

Effect Effect::drawCards(int amount, TargetSpec target) {
    Effect effect{EffectType::DRAW_CARDS};
    effect.amount = amount;
    effect.target = target;
    return effect;
}

Effect Effect::addMana(const Mana& mana) {
    Effect effect{EffectType::ADD_MANA};
    effect.mana = mana;
    return effect;
}

Effect Effect::pump(int power, int toughness, TargetSpec target, EffectDuration duration) {
    Effect effect{EffectType::PUMP_CREATURE};
    effect.power = power;
    effect.toughness = toughness;
    effect.target = target;
    effect.duration = duration;
    return effect;
}

Effect Effect::destroy(TargetSpec target) {
    Effect effect{EffectType::DESTROY_PERMANENT};
    effect.target = target;
    return effect;
}

Effect Effect::counterSpell() {
    Effect effect{EffectType::COUNTER_SPELL};
    effect.target = TargetKind::SPELL;
    return effect;
}

Effect Effect::returnToHand(TargetSpec target) {
    Effect effect{EffectType::RETURN_TO_HAND};
    effect.target = target;
    return effect;
}

Effect Effect::tap(TargetSpec target) {
    Effect effect{EffectType::TAP_PERMANENT};
    effect.target = target;
    return effect;
}

Effect Effect::untap(TargetSpec target) {
    Effect effect{EffectType::UNTAP_PERMANENT};
    effect.target = target;
    return effect;
}

Effect Effect::goad(TargetSpec target) {
    Effect effect{EffectType::GOAD};
    effect.target = target;
    effect.duration = EffectDuration::PERMANENT;
    return effect;
}

bool Effect::isHarmful() const {
    switch (type) {
        case EffectType::DEAL_DAMAGE:
        case EffectType::LOSE_LIFE:
        case EffectType::DESTROY_PERMANENT:
        case EffectType::COUNTER_SPELL:
        case EffectType::RETURN_TO_HAND:
        case EffectType::TAP_PERMANENT:
        case EffectType::GOAD:
            return true;
        case EffectType::GAIN_LIFE:
        case EffectType::DRAW_CARDS:
        case EffectType::ADD_MANA:
        case EffectType::UNTAP_PERMANENT:
            return false;
        case EffectType::PUMP_CREATURE:
            return power + toughness < 0;
    }
    return false;
}

std::string Effect::toString() const {
    switch (type) {
        case EffectType::DEAL_DAMAGE:       return fmt::format("deal {} damage", amount);
        case EffectType::GAIN_LIFE:         return fmt::format("gain {} life", amount);
        case EffectType::LOSE_LIFE:         return fmt::format("lose {} life", amount);
        case EffectType::DRAW_CARDS:        return fmt::format("draw {}", amount);
        case EffectType::ADD_MANA:          return fmt::format("add {}", mana.toString());
        case EffectType::PUMP_CREATURE:     return fmt::format("{:+}/{:+}", power, toughness);
        case EffectType::DESTROY_PERMANENT: return "destroy";
        case EffectType::COUNTER_SPELL:     return "counter";
        case EffectType::RETURN_TO_HAND:    return "return to hand";
        case EffectType::TAP_PERMANENT:     return "tap";
        case EffectType::UNTAP_PERMANENT:   return "untap";
        case EffectType::GOAD:              return "goad";
    }
    return "?";
}

Ability Ability::tapForMana(const std::string& mana_str) {
    Ability ability;
    ability.name = "{T}: Add " + mana_str;
    ability.type = AbilityType::MANA;
    ability.cost.tap = true;
    ability.timing = TimingRestriction::ANY_TIME;
    ability.effects.push_back(Effect::addMana(Mana::parse(mana_str)));
    return ability;
}

Ability Ability::activated(const std::string& name, const AbilityCost& cost, const std::vector<Effect>& effects,
                           TimingRestriction timing) {
    Ability ability;
    ability.name = name;
    ability.type = AbilityType::ACTIVATED;
    ability.cost = cost;
    ability.timing = timing;
    ability.effects = effects;
    return ability;
}

Ability Ability::triggered(const std::string& name, TriggerCondition trigger, const std::vector<Effect>& effects) {
    Ability ability;
    ability.name = name;
    ability.type = AbilityType::TRIGGERED;
    ability.trigger = trigger;
    ability.effects = effects;
    return ability;
}

Mana Ability::producedMana() const {
    Mana produced;
    for (const Effect& effect : effects) {
        if (effect.type == EffectType::ADD_MANA) {
            produced.add(effect.mana);
        }
    }
    return produced;
}
